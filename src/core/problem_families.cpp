#include "algoharness/core/problem_families.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace algoharness {
namespace core {

namespace {

// Largest amount / capacity a solver allocates a table for.
constexpr int64_t kMaxTableSize = 10'000'000;

int64_t integerField(const Value& value, const std::string& field) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
            return static_cast<int64_t>(d);
        }
    }
    throw std::invalid_argument(field + " must be an integer");
}

double numberField(const Value& value, const std::string& field) {
    if (!value.is_number()) {
        throw std::invalid_argument(field + " must be a number");
    }
    return value.get<double>();
}

template <typename T, typename Convert>
std::vector<T> arrayField(const Value& value, const std::string& field, Convert convert) {
    if (!value.is_array()) {
        throw std::invalid_argument(field + " must be an array");
    }
    std::vector<T> out;
    out.reserve(value.size());
    for (const auto& element : value) {
        out.push_back(convert(element, field + " element"));
    }
    return out;
}

// Integral results are reported as integers, matching what a real
// submission would return.
Value numberValue(double d) {
    if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
        return Value(static_cast<int64_t>(d));
    }
    return Value(d);
}

bool hasNumber(const Value& input, const char* key) {
    return input.contains(key) && input.at(key).is_number();
}

bool hasArray(const Value& input, const char* key) {
    return input.contains(key) && input.at(key).is_array();
}

} // namespace

std::string toString(ProblemFamily family) {
    switch (family) {
        case ProblemFamily::UniquePaths: return "UniquePaths";
        case ProblemFamily::CoinChange: return "CoinChange";
        case ProblemFamily::Knapsack: return "Knapsack";
        case ProblemFamily::MinPathSum: return "MinPathSum";
        case ProblemFamily::LongestIncreasingSubsequence: return "LongestIncreasingSubsequence";
        case ProblemFamily::ClimbingStairs: return "ClimbingStairs";
        default: return "Unknown";
    }
}

ProblemFamily classifyInput(const Value& input) {
    if (!input.is_object()) {
        return ProblemFamily::Unknown;
    }
    if (hasNumber(input, "m") && hasNumber(input, "n")) {
        return ProblemFamily::UniquePaths;
    }
    if (hasArray(input, "coins") && hasNumber(input, "amount")) {
        return ProblemFamily::CoinChange;
    }
    if (hasArray(input, "weights") && hasArray(input, "values") &&
        (hasNumber(input, "W") || hasNumber(input, "capacity"))) {
        return ProblemFamily::Knapsack;
    }
    if (hasArray(input, "grid") &&
        std::all_of(input.at("grid").begin(), input.at("grid").end(),
                    [](const Value& row) { return row.is_array(); })) {
        return ProblemFamily::MinPathSum;
    }
    if (input.size() == 1 && input.begin().value().is_array()) {
        return ProblemFamily::LongestIncreasingSubsequence;
    }
    if (input.size() == 1 && hasNumber(input, "n")) {
        return ProblemFamily::ClimbingStairs;
    }
    return ProblemFamily::Unknown;
}

Value solveProblem(ProblemFamily family, const Value& input) {
    switch (family) {
        case ProblemFamily::UniquePaths:
            return Value(uniquePaths(integerField(input.at("m"), "m"), integerField(input.at("n"), "n")));

        case ProblemFamily::CoinChange:
            return Value(coinChange(arrayField<int64_t>(input.at("coins"), "coins", integerField),
                                    integerField(input.at("amount"), "amount")));

        case ProblemFamily::Knapsack: {
            const char* capacityKey = hasNumber(input, "W") ? "W" : "capacity";
            return numberValue(knapsack(arrayField<int64_t>(input.at("weights"), "weights", integerField),
                                        arrayField<double>(input.at("values"), "values", numberField),
                                        integerField(input.at(capacityKey), capacityKey)));
        }

        case ProblemFamily::MinPathSum: {
            std::vector<std::vector<double>> grid;
            for (const auto& row : input.at("grid")) {
                grid.push_back(arrayField<double>(row, "grid row", numberField));
            }
            return numberValue(minPathSum(grid));
        }

        case ProblemFamily::LongestIncreasingSubsequence: {
            const auto field = input.begin();
            return Value(static_cast<int64_t>(longestIncreasingSubsequence(
                arrayField<double>(field.value(), field.key(), numberField))));
        }

        case ProblemFamily::ClimbingStairs:
            return Value(climbingStairs(integerField(input.at("n"), "n")));

        default:
            throw std::invalid_argument("unrecognized input shape");
    }
}

int64_t uniquePaths(int64_t m, int64_t n) {
    if (m < 0 || n < 0) {
        throw std::invalid_argument("grid dimensions must not be negative");
    }
    if (m == 0 || n == 0) {
        return 0;
    }
    // C(m + n - 2, k) with k = min(m, n) - 1; every partial product is itself
    // a binomial coefficient, so the division is exact.
    const uint64_t k = static_cast<uint64_t>(std::min(m, n) - 1);
    // m - 1 and n - 1 each fit in int64_t, so their sum fits in uint64_t
    const uint64_t total = static_cast<uint64_t>(m - 1) + static_cast<uint64_t>(n - 1);
    uint64_t result = 1;
    for (uint64_t i = 1; i <= k; ++i) {
        const uint64_t factor = total - k + i;
        if (result > std::numeric_limits<uint64_t>::max() / factor) {
            throw std::overflow_error("path count exceeds the 64-bit range");
        }
        result = result * factor / i;
    }
    if (result > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::overflow_error("path count exceeds the 64-bit range");
    }
    return static_cast<int64_t>(result);
}

int64_t coinChange(const std::vector<int64_t>& coins, int64_t amount) {
    if (amount < 0) {
        throw std::invalid_argument("amount must not be negative");
    }
    if (amount > kMaxTableSize) {
        throw std::invalid_argument("amount is too large");
    }
    constexpr int64_t kUnreachable = std::numeric_limits<int64_t>::max();
    std::vector<int64_t> best(static_cast<std::size_t>(amount) + 1, kUnreachable);
    best[0] = 0;
    for (int64_t value = 1; value <= amount; ++value) {
        for (int64_t coin : coins) {
            if (coin <= 0 || coin > value) {
                continue;
            }
            int64_t previous = best[static_cast<std::size_t>(value - coin)];
            if (previous != kUnreachable) {
                best[static_cast<std::size_t>(value)] =
                    std::min(best[static_cast<std::size_t>(value)], previous + 1);
            }
        }
    }
    int64_t answer = best[static_cast<std::size_t>(amount)];
    return answer == kUnreachable ? -1 : answer;
}

double knapsack(const std::vector<int64_t>& weights, const std::vector<double>& values,
                int64_t capacity) {
    if (weights.size() != values.size()) {
        throw std::invalid_argument("weights and values must have the same length");
    }
    if (capacity < 0) {
        throw std::invalid_argument("capacity must not be negative");
    }
    if (capacity > kMaxTableSize) {
        throw std::invalid_argument("capacity is too large");
    }
    std::vector<double> best(static_cast<std::size_t>(capacity) + 1, 0.0);
    for (std::size_t item = 0; item < weights.size(); ++item) {
        const int64_t weight = weights[item];
        if (weight < 0) {
            throw std::invalid_argument("weights must not be negative");
        }
        // Walk capacities downwards so each item is taken at most once
        for (int64_t w = capacity; w >= weight; --w) {
            best[static_cast<std::size_t>(w)] = std::max(
                best[static_cast<std::size_t>(w)], best[static_cast<std::size_t>(w - weight)] + values[item]);
        }
    }
    return best[static_cast<std::size_t>(capacity)];
}

double minPathSum(const std::vector<std::vector<double>>& grid) {
    if (grid.empty() || grid.front().empty()) {
        return 0.0;
    }
    const std::size_t columns = grid.front().size();
    std::vector<double> cost(columns, 0.0);
    for (std::size_t r = 0; r < grid.size(); ++r) {
        if (grid[r].size() != columns) {
            throw std::invalid_argument("grid rows must have the same length");
        }
        for (std::size_t c = 0; c < columns; ++c) {
            if (r == 0 && c == 0) {
                cost[c] = grid[r][c];
            } else if (r == 0) {
                cost[c] = cost[c - 1] + grid[r][c];
            } else if (c == 0) {
                cost[c] = cost[c] + grid[r][c];
            } else {
                cost[c] = std::min(cost[c], cost[c - 1]) + grid[r][c];
            }
        }
    }
    return cost.back();
}

std::size_t longestIncreasingSubsequence(const std::vector<double>& nums) {
    // tails[k] is the smallest tail of an increasing run of length k + 1
    std::vector<double> tails;
    for (double value : nums) {
        auto it = std::lower_bound(tails.begin(), tails.end(), value);
        if (it == tails.end()) {
            tails.push_back(value);
        } else {
            *it = value;
        }
    }
    return tails.size();
}

int64_t climbingStairs(int64_t n) {
    if (n < 0) {
        throw std::invalid_argument("step count must not be negative");
    }
    int64_t previous = 1;
    int64_t current = 1;
    for (int64_t step = 2; step <= n; ++step) {
        if (current > std::numeric_limits<int64_t>::max() - previous) {
            throw std::overflow_error("way count exceeds the 64-bit range");
        }
        int64_t next = previous + current;
        previous = current;
        current = next;
    }
    return current;
}

} // namespace core
} // namespace algoharness
