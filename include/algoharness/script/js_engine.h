#pragma once

#include "algoharness/script/script_error.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

struct JSRuntime;
struct JSContext;

namespace algoharness {
namespace script {

struct EngineLimits {
    std::size_t maxStackBytes = 1024 * 1024;
    std::size_t memoryLimitBytes = 256 * 1024 * 1024;
};

/**
 * @brief One QuickJS runtime with a single context.
 *
 * An engine must be used from the thread that created it. When a stop flag
 * is given, the QuickJS interrupt handler polls it and a running script is
 * aborted with Interrupted once it is set. Exceptions thrown by script code
 * surface as ScriptError carrying the error as the engine renders it
 * (`TypeError: x is not a function`); an exhausted stack is reported as
 * `RangeError: Maximum call stack size exceeded`.
 *
 * Scripts get a `console` whose methods write to the debug log.
 */
class JsEngine {
public:
    /// Name under which submitted source is compiled; errors refer to it
    static constexpr const char* kSourceName = "submission.js";

    explicit JsEngine(EngineLimits limits = EngineLimits(),
                      const std::atomic<bool>* stopFlag = nullptr);
    ~JsEngine();

    JsEngine(const JsEngine&) = delete;
    JsEngine& operator=(const JsEngine&) = delete;

    /**
     * @brief Compiles the source as a global script without running it.
     * @throws SyntaxError with the line and column the engine reports
     */
    void compile(const std::string& source);

    /**
     * @brief Runs the source as a global script, then the pending jobs.
     * @throws ScriptError, Interrupted
     */
    void evaluate(const std::string& source);

    /**
     * @brief Calls the global binding `name`, `const` and `let` bindings included.
     *
     * A returned promise or thenable is settled by running pending jobs.
     * The result is converted through JSON: undefined becomes null and the
     * non-finite numbers become the strings "Infinity", "-Infinity" and "NaN".
     *
     * @throws ScriptError when the binding is missing or not a function, the
     *         call throws, the promise rejects or never settles, or the result
     *         has no JSON form
     * @throws Interrupted
     */
    nlohmann::ordered_json call(const std::string& name,
                                const std::vector<nlohmann::ordered_json>& arguments);

private:
    [[noreturn]] void throwPendingException();
    void runPendingJobs();
    void installConsole();

    JSRuntime* runtime_ = nullptr;
    JSContext* context_ = nullptr;
    const std::atomic<bool>* stopFlag_;
};

} // namespace script
} // namespace algoharness
