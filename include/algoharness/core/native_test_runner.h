#pragma once

#include "algoharness/core/test_runner.h"
#include "algoharness/script/dialect.h"
#include "algoharness/script/js_engine.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace algoharness {
namespace core {

/**
 * @brief The callable a submission defines, as found by locateCallable().
 */
struct CallableInfo {
    std::string name;
    std::vector<std::string> parameterNames;  // empty when the shape gives none
};

/**
 * @brief Finds the function the harness should call.
 *
 * Top-level declaration shapes in JavaScript source are tried in order:
 * `function NAME`, a `const`/`let`/`var` bound to a function or arrow,
 * `NAME = (...) =>`, and finally any plain `const`/`let`/`var NAME`. A
 * destructured parameter has an empty name.
 */
std::optional<CallableInfo> locateCallable(const std::string& javaScript);

/**
 * @brief Orders the test input into call arguments.
 *
 * When every declared parameter name appears in the input, values follow
 * the parameter order. Otherwise they follow the input's insertion order.
 */
std::vector<Value> mapArguments(const Value& input, const std::vector<std::string>& parameterNames);

/**
 * @brief Runs JavaScript and TypeScript submissions in-process on the
 * embedded script engine.
 *
 * TypeScript is stripped of its types first. Each test case gets a fresh
 * QuickJS engine on a worker thread. The top-level
 * evaluation is bounded by RunnerConfig::timeout and the call itself by
 * RunnerConfig::maxExecutionTime; on expiry the worker is interrupted
 * through its stop flag and joined before the result is reported.
 */
class NativeTestRunner : public TestRunner {
public:
    explicit NativeTestRunner(script::Dialect dialect = script::Dialect::JavaScript,
                              RunnerConfig config = RunnerConfig());

    std::string getLanguageName() const override;
    bool canExecute() const override { return true; }

    script::Dialect getDialect() const { return dialect_; }

protected:
    ValidationResult validateCode(const std::string& code) override;
    std::unique_ptr<ExecutionContext> prepareContext(const std::string& code) override;
    TestResult executeTestCase(ExecutionContext& context, const TestCase& testCase) override;
    void cleanupContext(ExecutionContext& context) override;

private:
    script::EngineLimits engineLimits() const;

    script::Dialect dialect_;
};

} // namespace core
} // namespace algoharness
