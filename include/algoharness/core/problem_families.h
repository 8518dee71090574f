#pragma once

#include "algoharness/core/test_model.h"
#include <cstdint>
#include <string>
#include <vector>

namespace algoharness {
namespace core {

/**
 * @brief Input shapes the simulated runner knows how to answer.
 */
enum class ProblemFamily : uint8_t {
    UniquePaths,                   // { m, n }
    CoinChange,                    // { coins, amount }
    Knapsack,                      // { weights, values, W | capacity }
    MinPathSum,                    // { grid }
    LongestIncreasingSubsequence,  // a single array-valued field
    ClimbingStairs,                // { n }
    Unknown
};

std::string toString(ProblemFamily family);

/**
 * @brief Classifies a test input by its field names and value kinds.
 *
 * Families are tried in declaration order; the first match wins.
 */
ProblemFamily classifyInput(const Value& input);

/**
 * @brief Computes the reference answer for a classified input.
 *
 * @throws std::invalid_argument if a field has the wrong kind or range
 * @throws std::overflow_error if the answer does not fit a 64-bit integer
 */
Value solveProblem(ProblemFamily family, const Value& input);

// Reference solvers

/// Lattice paths through an m x n grid moving only right or down.
int64_t uniquePaths(int64_t m, int64_t n);

/// Fewest coins summing to amount, -1 when impossible.
int64_t coinChange(const std::vector<int64_t>& coins, int64_t amount);

/// Best total value of a 0/1 selection whose weight stays within capacity.
double knapsack(const std::vector<int64_t>& weights, const std::vector<double>& values,
                int64_t capacity);

/// Cheapest top-left to bottom-right path moving only right or down.
double minPathSum(const std::vector<std::vector<double>>& grid);

/// Length of the longest strictly increasing subsequence.
std::size_t longestIncreasingSubsequence(const std::vector<double>& nums);

/// Distinct ways to climb n steps taking one or two at a time.
int64_t climbingStairs(int64_t n);

} // namespace core
} // namespace algoharness
