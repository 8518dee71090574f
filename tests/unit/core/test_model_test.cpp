#include <gtest/gtest.h>
#include "algoharness/core/test_model.h"

using namespace algoharness;
using namespace algoharness::core;

TEST(TestModelTest, LoadsCatalogCases) {
    auto cases = loadTestCases(Value::parse(R"([
        {"input": {"m": 3, "n": 7}, "expected": 28, "description": "3x7 grid"},
        {"input": {"n": 2}, "expected": 2}
    ])"));
    ASSERT_TRUE(cases) << cases.error();
    ASSERT_EQ(cases.value().size(), 2u);

    const TestCase& first = cases.value()[0];
    EXPECT_EQ(first.input["m"], 3);
    EXPECT_EQ(first.expected, 28);
    EXPECT_EQ(first.description, "3x7 grid");
    EXPECT_TRUE(cases.value()[1].description.empty());
}

TEST(TestModelTest, InputKeepsInsertionOrder) {
    auto cases = loadTestCases(Value::parse(R"([{"input": {"n": 7, "m": 3}, "expected": 28}])"));
    ASSERT_TRUE(cases);
    auto it = cases.value()[0].input.begin();
    EXPECT_EQ(it.key(), "n");
    ++it;
    EXPECT_EQ(it.key(), "m");
}

TEST(TestModelTest, MissingExpectedIsNull) {
    auto cases = loadTestCases(Value::parse(R"([{"input": {}}])"));
    ASSERT_TRUE(cases);
    EXPECT_TRUE(cases.value()[0].expected.is_null());
}

TEST(TestModelTest, RejectsMalformedCatalogs) {
    auto notArray = loadTestCases(Value::parse(R"({"input": {}})"));
    ASSERT_FALSE(notArray);
    EXPECT_EQ(notArray.error(), "test cases must be a JSON array");

    auto badInput = loadTestCases(Value::parse(R"([{"input": {}}, {"input": [1, 2]}])"));
    ASSERT_FALSE(badInput);
    EXPECT_NE(badInput.error().find("invalid test case #1"), std::string::npos);

    auto missingInput = loadTestCases(Value::parse(R"([{"expected": 1}])"));
    EXPECT_FALSE(missingInput);
}

TEST(TestModelTest, FailedResultCarriesCaseData) {
    TestCase testCase;
    testCase.input = Value::parse(R"({"n": 3})");
    testCase.expected = 3;
    testCase.description = "three stairs";

    TestResult result = makeFailedResult(testCase, "boom");
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.expected, 3);
    EXPECT_TRUE(result.actual.is_null());
    EXPECT_EQ(result.description, "three stairs");
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "boom");
    EXPECT_FALSE(result.executionTime.has_value());
}

TEST(TestModelTest, SummaryCountsAndTimes) {
    std::vector<TestResult> results(3);
    results[0].passed = true;
    results[0].executionTime = Milliseconds(1.5);
    results[1].passed = false;
    results[1].executionTime = Milliseconds(2.0);
    results[2].passed = true;

    TestSummary summary = summarize(results);
    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(summary.passed, 2u);
    EXPECT_EQ(summary.failed, 1u);
    EXPECT_DOUBLE_EQ(summary.totalTime.count(), 3.5);
    EXPECT_FALSE(summary.allPassed());
    EXPECT_FALSE(summarize({}).allPassed());
}

TEST(TestModelTest, ResultSerialization) {
    TestResult result;
    result.passed = true;
    result.expected = 6;
    result.actual = 6;
    result.description = "d";
    Value j = result;
    EXPECT_EQ(j.dump(), R"({"passed":true,"expected":6,"actual":6,"description":"d"})");

    result.executionTime = Milliseconds(0.5);
    result.error = "e";
    j = result;
    EXPECT_EQ(j["executionTimeMs"], 0.5);
    EXPECT_EQ(j["error"], "e");
}
