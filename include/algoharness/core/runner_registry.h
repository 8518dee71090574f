#pragma once

#include "algoharness/core/runner_config.h"
#include "algoharness/core/test_runner.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace algoharness {
namespace core {

/**
 * @brief Factory type for creating test runner instances
 */
using RunnerFactory = std::function<std::unique_ptr<TestRunner>()>;

class UnsupportedLanguageError : public std::runtime_error {
public:
    explicit UnsupportedLanguageError(const std::string& language)
        : std::runtime_error("Unsupported language: " + language) {}
};

enum class RuntimeStatus : uint8_t {
    Ready,        // submissions really run
    Simulated,    // answers come from reference solvers
    NotSupported
};

std::string toString(RuntimeStatus status);

struct LanguageCapabilities {
    bool canExecute = false;
    RuntimeStatus runtimeStatus = RuntimeStatus::NotSupported;
    std::string description;
};

/**
 * @brief Maps language identifiers to test runner factories.
 *
 * Identifiers are normalized (trimmed, lower-cased) on every call, so
 * "JavaScript " and "javascript" name the same entry. All operations are
 * thread-safe.
 *
 * The process-wide instance returned by getInstance() starts with the
 * built-in languages: javascript/js and typescript/ts run natively, the
 * rest (python/py, java, cpp/c++, go, rust/rs, ruby/rb, c#/csharp/cs) are
 * simulated.
 */
class RunnerRegistry {
public:
    /**
     * @brief Get the process-wide registry
     *
     * @return RunnerRegistry& Shared instance
     */
    static RunnerRegistry& getInstance();

    /**
     * @brief Construct a standalone registry
     *
     * @param withBuiltins Register the built-in languages
     */
    explicit RunnerRegistry(bool withBuiltins = true);

    RunnerRegistry(const RunnerRegistry&) = delete;
    RunnerRegistry& operator=(const RunnerRegistry&) = delete;
    RunnerRegistry(RunnerRegistry&&) = delete;
    RunnerRegistry& operator=(RunnerRegistry&&) = delete;

    /**
     * @brief Create a runner for a language
     *
     * @param language Language identifier, any case
     * @return std::unique_ptr<TestRunner> Fresh runner instance
     * @throws UnsupportedLanguageError if nothing is registered for it
     */
    std::unique_ptr<TestRunner> createRunner(const std::string& language) const;

    bool isSupported(const std::string& language) const;

    /// Registered identifiers, sorted.
    std::vector<std::string> listSupported() const;

    /**
     * @brief Register a factory, replacing any existing entry
     *
     * @param language Language identifier
     * @param factory Factory creating runner instances
     * @param description Shown by getLanguageCapabilities()
     * @throws std::invalid_argument for a blank identifier or an empty factory
     */
    void registerLanguage(const std::string& language, RunnerFactory factory,
                          const std::string& description = "");

    /// @return true if an entry was removed
    bool unregisterLanguage(const std::string& language);

    /// True only for the languages the embedded script engine evaluates.
    static bool isNativeCapable(const std::string& language);

    LanguageCapabilities getLanguageCapabilities(const std::string& language) const;

    std::vector<std::string> listExecutable() const;
    std::vector<std::string> listSimulated() const;

    /**
     * @brief Config handed to runners created by the built-in factories
     */
    void setDefaultConfig(RunnerConfig config);
    RunnerConfig getDefaultConfig() const;

    static std::string normalize(const std::string& language);

private:
    struct RunnerInfo {
        RunnerFactory factory;
        std::string description;
    };

    void registerBuiltinLanguages();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunnerInfo> registry_;
    RunnerConfig defaultConfig_;
};

/**
 * @brief Creates a runner through the process-wide registry.
 *
 * @throws UnsupportedLanguageError
 */
std::unique_ptr<TestRunner> createTestRunner(const std::string& language);

} // namespace core
} // namespace algoharness
