#include "algoharness/core/runner_config.h"

namespace algoharness {
namespace core {

namespace {

Result<std::chrono::milliseconds> readMillis(const nlohmann::json& j, const char* key,
                                             std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        return utils::makeError(std::string(key) + " must be an integer number of milliseconds");
    }
    auto count = value.get<std::int64_t>();
    if (count < 0) {
        return utils::makeError(std::string(key) + " must not be negative");
    }
    return std::chrono::milliseconds(count);
}

Result<std::size_t> readSize(const nlohmann::json& j, const char* key, std::size_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) {
        return utils::makeError(std::string(key) + " must be a positive integer");
    }
    return static_cast<std::size_t>(value.get<std::int64_t>());
}

} // namespace

Result<RunnerConfig> RunnerConfig::fromJson(const nlohmann::json& j) {
    RunnerConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        return utils::makeError("runner config must be a JSON object");
    }

    auto timeout = readMillis(j, "timeoutMs", config.timeout);
    if (!timeout) return utils::makeError(timeout.error());
    config.timeout = timeout.value();

    auto maxExecutionTime = readMillis(j, "maxExecutionTimeMs", config.maxExecutionTime);
    if (!maxExecutionTime) return utils::makeError(maxExecutionTime.error());
    config.maxExecutionTime = maxExecutionTime.value();

    auto latency = readMillis(j, "simulatedLatencyMs", config.simulatedLatency);
    if (!latency) return utils::makeError(latency.error());
    config.simulatedLatency = latency.value();

    if (j.contains("unmatchedShape")) {
        const auto& policy = j.at("unmatchedShape");
        if (policy == "echo-expected") {
            config.unmatchedShape = UnmatchedShapePolicy::EchoExpected;
        } else if (policy == "fail-closed") {
            config.unmatchedShape = UnmatchedShapePolicy::FailClosed;
        } else {
            return utils::makeError("unmatchedShape must be \"echo-expected\" or \"fail-closed\"");
        }
    }

    auto codeBytes = readSize(j, "maxCodeBytes", config.maxCodeBytes);
    if (!codeBytes) return utils::makeError(codeBytes.error());
    config.maxCodeBytes = codeBytes.value();

    auto stackBytes = readSize(j, "maxStackBytes", config.maxStackBytes);
    if (!stackBytes) return utils::makeError(stackBytes.error());
    config.maxStackBytes = stackBytes.value();

    auto memoryBytes = readSize(j, "memoryLimitBytes", config.memoryLimitBytes);
    if (!memoryBytes) return utils::makeError(memoryBytes.error());
    config.memoryLimitBytes = memoryBytes.value();

    return config;
}

nlohmann::json RunnerConfig::toJson() const {
    return nlohmann::json{
        {"timeoutMs", timeout.count()},
        {"maxExecutionTimeMs", maxExecutionTime.count()},
        {"simulatedLatencyMs", simulatedLatency.count()},
        {"unmatchedShape", unmatchedShape == UnmatchedShapePolicy::EchoExpected
                               ? "echo-expected" : "fail-closed"},
        {"maxCodeBytes", maxCodeBytes},
        {"maxStackBytes", maxStackBytes},
        {"memoryLimitBytes", memoryLimitBytes}
    };
}

} // namespace core
} // namespace algoharness
