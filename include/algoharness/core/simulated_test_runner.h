#pragma once

#include "algoharness/core/test_runner.h"
#include <functional>
#include <string>
#include <vector>

namespace algoharness {
namespace core {

/**
 * @brief Pattern a submission must contain to pass simulated validation.
 */
struct SyntaxCheck {
    std::function<bool(const std::string&)> matches;
    std::string message;
};

/// `keyword`, at least one whitespace character, then a word character.
/// Linear in the code size.
bool containsKeywordThenName(const std::string& code, const std::string& keyword);

/// A word, whitespace, a second word and a parenthesized list, as in
/// `int solve(int n)`. Linear in the code size.
bool containsDeclarationWithParameters(const std::string& code);

/**
 * @brief Heuristic checks for a language, keyed by its display name
 * ("Python", "C++", ...). Unknown languages get none.
 */
std::vector<SyntaxCheck> syntaxChecksFor(const std::string& language);

/**
 * @brief Answers test cases analytically for languages with no runtime.
 *
 * The submitted code is linted with a few per-language patterns but never
 * executed. Each case is classified into a ProblemFamily and solved by the
 * built-in reference solver; results are memoized per run by the canonical
 * form of the input. Inputs that match no family are handled according to
 * RunnerConfig::unmatchedShape.
 */
class SimulatedTestRunner : public TestRunner {
public:
    explicit SimulatedTestRunner(std::string language, RunnerConfig config = RunnerConfig());

    std::string getLanguageName() const override { return language_; }
    bool canExecute() const override { return false; }

protected:
    ValidationResult validateCode(const std::string& code) override;
    std::unique_ptr<ExecutionContext> prepareContext(const std::string& code) override;
    TestResult executeTestCase(ExecutionContext& context, const TestCase& testCase) override;
    void cleanupContext(ExecutionContext& context) override;

private:
    std::string language_;
    std::vector<SyntaxCheck> checks_;
};

} // namespace core
} // namespace algoharness
