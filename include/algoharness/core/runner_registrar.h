#pragma once

#include "algoharness/core/runner_registry.h"
#include <string>
#include <type_traits>
#include <utility>

namespace algoharness {
namespace core {

/**
 * @brief Scoped registration of a runner type.
 *
 * The factory builds T from the given constructor arguments followed by
 * the registry's default config as it is when the runner is created, so
 * RunnerRegistry::setDefaultConfig() also reaches registered runners.
 * The entry is removed again when the registrar is destroyed. Usage:
 *
 *   static RunnerRegistrar<SimulatedTestRunner> kotlin("kotlin", "Simulated Kotlin", "Kotlin");
 *
 * @tparam T Runner class type (must inherit from TestRunner and take a
 *           RunnerConfig as its last constructor argument)
 */
template<typename T>
class RunnerRegistrar {
    static_assert(std::is_base_of<TestRunner, T>::value,
        "Runner must inherit from TestRunner");

public:
    template<typename... Args>
    RunnerRegistrar(RunnerRegistry& registry, const std::string& language,
                    const std::string& description, Args... args)
        : registry_(registry)
        , language_(language) {
        static_assert(std::is_constructible<T, Args..., RunnerConfig>::value,
            "Runner must be constructible from the arguments and a RunnerConfig");
        RunnerRegistry* target = &registry_;
        registry_.registerLanguage(
            language_,
            [target, args...]() -> std::unique_ptr<TestRunner> {
                return std::make_unique<T>(args..., target->getDefaultConfig());
            },
            description
        );
    }

    template<typename... Args>
    explicit RunnerRegistrar(const std::string& language, const std::string& description = "",
                             Args... args)
        : RunnerRegistrar(RunnerRegistry::getInstance(), language, description, std::move(args)...) {}

    ~RunnerRegistrar() {
        registry_.unregisterLanguage(language_);
    }

    RunnerRegistrar(const RunnerRegistrar&) = delete;
    RunnerRegistrar& operator=(const RunnerRegistrar&) = delete;

    const std::string& getLanguage() const { return language_; }

private:
    RunnerRegistry& registry_;
    std::string language_;
};

} // namespace core
} // namespace algoharness
