#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "algoharness/core/runner_registry.h"
#include "algoharness/core/test_model.h"
#include <chrono>

using namespace algoharness;
using namespace algoharness::core;
using ::testing::ElementsAre;

// Drives submissions through the registry the way the command-line tool does.
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        RunnerConfig config;
        config.timeout = std::chrono::milliseconds(2000);
        config.maxExecutionTime = std::chrono::milliseconds(2000);
        registry.setDefaultConfig(config);
    }

    std::vector<TestCase> catalog(const char* json) {
        auto cases = loadTestCases(Value::parse(json));
        EXPECT_TRUE(cases) << cases.error();
        return cases ? cases.value() : std::vector<TestCase>();
    }

    static std::vector<bool> outcomes(const std::vector<TestResult>& results) {
        std::vector<bool> passed;
        for (const auto& result : results) {
            passed.push_back(result.passed);
        }
        return passed;
    }

    RunnerRegistry registry;
};

TEST_F(EndToEndTest, JavaScriptUniquePaths) {
    auto runner = registry.createRunner("javascript");
    auto results = runner->runTests(R"(
function uniquePaths(m, n) {
    const dp = Array.from({ length: m }, () => Array(n).fill(1));
    for (let i = 1; i < m; i++)
        for (let j = 1; j < n; j++)
            dp[i][j] = dp[i - 1][j] + dp[i][j - 1];
    return dp[m - 1][n - 1];
}
)", catalog(R"([
        {"input": {"m": 3, "n": 7}, "expected": 28, "description": "3 x 7"},
        {"input": {"m": 3, "n": 2}, "expected": 3, "description": "3 x 2"},
        {"input": {"m": 7, "n": 3}, "expected": 27, "description": "deliberately wrong"}
    ])"));

    ASSERT_EQ(results.size(), 3u);
    EXPECT_THAT(outcomes(results), ElementsAre(true, true, false));
    EXPECT_EQ(results[0].actual, 28);
    EXPECT_EQ(results[2].actual, 28);
    EXPECT_EQ(results[2].description, "deliberately wrong");

    TestSummary summary = summarize(results);
    EXPECT_EQ(summary.passed, 2u);
    EXPECT_EQ(summary.failed, 1u);
}

TEST_F(EndToEndTest, TypeScriptLongestIncreasingSubsequence) {
    auto runner = registry.createRunner("TS");
    auto results = runner->runTests(R"(
const lengthOfLIS = (nums: number[]): number => {
    const tails: number[] = [];
    for (const x of nums) {
        let lo = 0, hi = tails.length;
        while (lo < hi) {
            const mid = (lo + hi) >> 1;
            if (tails[mid] < x) lo = mid + 1; else hi = mid;
        }
        tails[lo] = x;
    }
    return tails.length;
};
)", catalog(R"([
        {"input": {"nums": [10, 9, 2, 5, 3, 7, 101, 18]}, "expected": 4},
        {"input": {"nums": []}, "expected": 0}
    ])"));
    EXPECT_THAT(outcomes(results), ElementsAre(true, true));
}

TEST_F(EndToEndTest, PythonCoinChangeIsSimulated) {
    auto runner = registry.createRunner("python");
    EXPECT_FALSE(runner->canExecute());
    auto results = runner->runTests("def coinChange(coins, amount):\n    pass\n", catalog(R"([
        {"input": {"coins": [1, 2, 5], "amount": 11}, "expected": 3},
        {"input": {"coins": [2], "amount": 3}, "expected": -1},
        {"input": {"coins": [1], "amount": 0}, "expected": 0}
    ])"));
    EXPECT_THAT(outcomes(results), ElementsAre(true, true, true));
    EXPECT_EQ(results[0].actual, 3);
}

TEST_F(EndToEndTest, InfiniteLoopIsCutOff) {
    RunnerConfig config = registry.getDefaultConfig();
    config.maxExecutionTime = std::chrono::milliseconds(50);
    registry.setDefaultConfig(config);

    auto runner = registry.createRunner("js");
    const auto start = std::chrono::steady_clock::now();
    auto results = runner->runTests("function hang(n) { while (true) {} }", catalog(R"([
        {"input": {"n": 1}, "expected": 1},
        {"input": {"n": 2}, "expected": 2}
    ])"));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_FALSE(result.passed);
        EXPECT_EQ(result.error.value_or(""), "Execution timed out after 50ms");
    }
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(EndToEndTest, ResultsMatchCasesOneToOneInOrder) {
    auto cases = catalog(R"([
        {"input": {"n": 1}, "expected": 1, "description": "a"},
        {"input": {"n": 2}, "expected": 99, "description": "b"},
        {"input": {"n": -1}, "expected": 0, "description": "c"},
        {"input": {"n": 4}, "expected": 4, "description": "d"}
    ])");
    auto runner = registry.createRunner("javascript");
    auto results = runner->runTests(
        "function id(n) { if (n < 0) throw new Error('negative'); return n; }", cases);

    ASSERT_EQ(results.size(), cases.size());
    for (std::size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(results[i].description, cases[i].description);
        EXPECT_EQ(results[i].expected, cases[i].expected);
    }
    EXPECT_THAT(outcomes(results), ElementsAre(true, false, false, true));
    EXPECT_EQ(results[2].error.value_or(""), "Error: negative");
}

TEST_F(EndToEndTest, InvalidSubmissionShortCircuits) {
    auto cases = catalog(R"([
        {"input": {"n": 1}, "expected": 1},
        {"input": {"n": 2}, "expected": 2}
    ])");
    auto runner = registry.createRunner("javascript");
    auto results = runner->runTests("function f(n) { return require('child_process'); }", cases);
    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_FALSE(result.passed);
        EXPECT_TRUE(result.actual.is_null());
        EXPECT_EQ(result.error.value_or(""), "Potentially unsafe code detected: require(");
    }
}

TEST_F(EndToEndTest, RegistryScenario) {
    EXPECT_TRUE(registry.getLanguageCapabilities("JavaScript").canExecute);
    EXPECT_EQ(registry.getLanguageCapabilities("rust").runtimeStatus, RuntimeStatus::Simulated);
    EXPECT_THROW(registry.createRunner("haskell"), UnsupportedLanguageError);

    auto go = registry.createRunner("go");
    auto results = go->runTests("func uniquePaths(m int, n int) int { return 0 }",
                                catalog(R"([{"input": {"m": 3, "n": 7}, "expected": 28}])"));
    EXPECT_THAT(outcomes(results), ElementsAre(true));

    auto rejected = go->runTests("package main", catalog(R"([{"input": {"m": 3, "n": 7}, "expected": 28}])"));
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].error.value_or(""), "Invalid Go syntax: Must contain a function definition (func)");
}

TEST_F(EndToEndTest, ResultsSerializeForReports) {
    auto runner = registry.createRunner("js");
    auto results = runner->runTests("const f = (n) => n * 2;",
                                    catalog(R"([{"input": {"n": 2}, "expected": 4, "description": "double"}])"));
    Value report;
    report["summary"] = summarize(results);
    report["results"] = results;
    EXPECT_EQ(report["summary"]["total"], 1);
    EXPECT_EQ(report["results"][0]["passed"], true);
    EXPECT_EQ(report["results"][0]["description"], "double");
    EXPECT_TRUE(report["results"][0].contains("executionTimeMs"));
}
