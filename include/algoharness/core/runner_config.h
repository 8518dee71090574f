#pragma once

#include "algoharness/utils/result.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace algoharness {
namespace core {

/**
 * @brief What the simulated runner reports for an input shape it cannot
 * classify.
 */
enum class UnmatchedShapePolicy : uint8_t {
    EchoExpected,  // report the case's own expected value (always passes)
    FailClosed     // report a failed result
};

/**
 * @brief Limits and behavior switches for a test runner.
 */
struct RunnerConfig {
    std::chrono::milliseconds timeout{5000};            // Script setup (top-level evaluation)
    std::chrono::milliseconds maxExecutionTime{1000};   // Each call of the submitted function
    std::chrono::milliseconds simulatedLatency{0};      // Cosmetic delay per simulated case
    UnmatchedShapePolicy unmatchedShape{UnmatchedShapePolicy::EchoExpected};
    std::size_t maxCodeBytes{64 * 1024};                // Larger submissions fail validation
    std::size_t maxStackBytes{1024 * 1024};             // Script engine stack, bounds recursion
    std::size_t memoryLimitBytes{256 * 1024 * 1024};    // Script engine heap per test case

    /**
     * @brief Builds a config from JSON, starting from the defaults.
     *
     * Recognized keys: timeoutMs, maxExecutionTimeMs, simulatedLatencyMs,
     * unmatchedShape ("echo-expected" | "fail-closed"), maxCodeBytes,
     * maxStackBytes, memoryLimitBytes. Unknown keys are ignored.
     */
    static Result<RunnerConfig> fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;
};

} // namespace core
} // namespace algoharness
