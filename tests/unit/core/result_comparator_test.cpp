#include <gtest/gtest.h>
#include "algoharness/core/result_comparator.h"

using namespace algoharness;
using namespace algoharness::core;

TEST(ResultComparatorTest, NullOnlyEqualsNull) {
    EXPECT_TRUE(compareResults(Value(), Value()));
    EXPECT_FALSE(compareResults(Value(), Value(0)));
    EXPECT_FALSE(compareResults(Value(false), Value()));
    EXPECT_FALSE(compareResults(Value(), Value::array()));
}

TEST(ResultComparatorTest, NumbersUseAbsoluteTolerance) {
    EXPECT_TRUE(compareResults(Value(0.3), Value(0.1 + 0.2)));
    EXPECT_TRUE(compareResults(Value(28), Value(28.0)));
    EXPECT_FALSE(compareResults(Value(1.0), Value(1.0 + 1e-6)));
    EXPECT_FALSE(compareResults(Value(3), Value(-3)));
}

TEST(ResultComparatorTest, NumberDoesNotEqualItsStringOrBoolean) {
    EXPECT_FALSE(compareResults(Value(1), Value("1")));
    EXPECT_FALSE(compareResults(Value(1), Value(true)));
    EXPECT_FALSE(compareResults(Value(0), Value(false)));
}

TEST(ResultComparatorTest, ArraysCompareElementwise) {
    EXPECT_TRUE(compareResults(Value::parse("[1, 2, 3]"), Value::parse("[1.0, 2.0, 3.0]")));
    EXPECT_TRUE(compareResults(Value::parse("[[0.1], [0.2]]"),
                               Value::parse("[[0.1000000000001], [0.2]]")));
    EXPECT_FALSE(compareResults(Value::parse("[1, 2]"), Value::parse("[1, 2, 3]")));
    EXPECT_FALSE(compareResults(Value::parse("[1, 2]"), Value::parse("[2, 1]")));
    EXPECT_TRUE(compareResults(Value::array(), Value::array()));
}

TEST(ResultComparatorTest, ObjectsCompareByCanonicalForm) {
    EXPECT_TRUE(compareResults(Value::parse(R"({"a": 1, "b": [1, 2]})"),
                               Value::parse(R"({"b": [1, 2], "a": 1})")));
    EXPECT_FALSE(compareResults(Value::parse(R"({"a": 1})"), Value::parse(R"({"a": 2})")));
}

TEST(ResultComparatorTest, IntegralFloatsInsideObjectsMatchIntegers) {
    EXPECT_TRUE(compareResults(Value::parse(R"({"a": 1})"), Value::parse(R"({"a": 1.0})")));
    EXPECT_TRUE(compareResults(Value::parse(R"({"path": [0, 2.0], "cost": {"total": 7.0}})"),
                               Value::parse(R"({"cost": {"total": 7}, "path": [0.0, 2]})")));
    EXPECT_FALSE(compareResults(Value::parse(R"({"a": 1.5})"), Value::parse(R"({"a": 1})")));
}

TEST(ResultComparatorTest, StringsAndBooleans) {
    EXPECT_TRUE(compareResults(Value("abc"), Value("abc")));
    EXPECT_FALSE(compareResults(Value("abc"), Value("abd")));
    EXPECT_TRUE(compareResults(Value(true), Value(true)));
    EXPECT_FALSE(compareResults(Value(true), Value(false)));
}

TEST(ResultComparatorTest, RelationIsSymmetric) {
    const std::vector<Value> samples = {
        Value(), Value(1), Value(1.0000000001), Value("1"), Value(true),
        Value::parse("[1, 2]"), Value::parse(R"({"x": 1})"), Value::array(),
    };
    for (const auto& a : samples) {
        for (const auto& b : samples) {
            EXPECT_EQ(compareResults(a, b), compareResults(b, a))
                << a.dump() << " vs " << b.dump();
        }
    }
}
