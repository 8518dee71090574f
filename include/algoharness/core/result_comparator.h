#pragma once

#include "algoharness/core/test_model.h"

namespace algoharness {
namespace core {

/// Absolute tolerance for numeric comparison.
constexpr double kNumericTolerance = 1e-9;

/**
 * @brief Deep equality between an expected and an actual value.
 *
 * - null vs null is equal, null vs anything else is not
 * - two numbers are equal when |expected - actual| < kNumericTolerance
 * - two arrays are equal when they have the same length and every pair of
 *   elements compares equal, in order
 * - anything else is compared by canonical (sorted-key) serialization
 *
 * The relation is symmetric.
 */
bool compareResults(const Value& expected, const Value& actual);

} // namespace core
} // namespace algoharness
