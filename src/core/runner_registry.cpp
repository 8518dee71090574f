#include "algoharness/core/runner_registry.h"
#include "algoharness/core/native_test_runner.h"
#include "algoharness/core/simulated_test_runner.h"
#include "algoharness/utils/logging.hpp"
#include <algorithm>
#include <cctype>

namespace algoharness {
namespace core {

namespace {

const char* const kNativeDescription = "Fully executable in-process";
const char* const kSimulatedDescription = "Simulated execution with realistic results";

bool isNativeName(const std::string& normalized) {
    return normalized == "javascript" || normalized == "js" ||
           normalized == "typescript" || normalized == "ts";
}

} // namespace

std::string toString(RuntimeStatus status) {
    switch (status) {
        case RuntimeStatus::Ready: return "ready";
        case RuntimeStatus::Simulated: return "simulated";
        default: return "not_supported";
    }
}

RunnerRegistry& RunnerRegistry::getInstance() {
    static RunnerRegistry instance;
    return instance;
}

RunnerRegistry::RunnerRegistry(bool withBuiltins) {
    if (withBuiltins) {
        registerBuiltinLanguages();
    }
}

void RunnerRegistry::registerBuiltinLanguages() {
    auto native = [this](script::Dialect dialect) {
        return [this, dialect]() -> std::unique_ptr<TestRunner> {
            return std::make_unique<NativeTestRunner>(dialect, getDefaultConfig());
        };
    };
    auto simulated = [this](const std::string& language) {
        return [this, language]() -> std::unique_ptr<TestRunner> {
            return std::make_unique<SimulatedTestRunner>(language, getDefaultConfig());
        };
    };

    for (const char* alias : {"javascript", "js"}) {
        registerLanguage(alias, native(script::Dialect::JavaScript), kNativeDescription);
    }
    for (const char* alias : {"typescript", "ts"}) {
        registerLanguage(alias, native(script::Dialect::TypeScript), kNativeDescription);
    }

    const std::vector<std::pair<std::string, std::vector<std::string>>> simulatedLanguages = {
        {"Python", {"python", "py"}},
        {"Java", {"java"}},
        {"C++", {"cpp", "c++"}},
        {"Go", {"go"}},
        {"Rust", {"rust", "rs"}},
        {"Ruby", {"ruby", "rb"}},
        {"C#", {"c#", "csharp", "cs"}},
    };
    for (const auto& entry : simulatedLanguages) {
        for (const auto& alias : entry.second) {
            registerLanguage(alias, simulated(entry.first), kSimulatedDescription);
        }
    }
}

std::string RunnerRegistry::normalize(const std::string& language) {
    const char* whitespace = " \t\r\n\f\v";
    std::size_t first = language.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    std::size_t last = language.find_last_not_of(whitespace);
    std::string normalized = language.substr(first, last - first + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::unique_ptr<TestRunner> RunnerRegistry::createRunner(const std::string& language) const {
    RunnerFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registry_.find(normalize(language));
        if (it == registry_.end()) {
            throw UnsupportedLanguageError(language);
        }
        factory = it->second.factory;
    }

    // Factories may call back into the registry, so run them unlocked
    auto runner = factory();
    if (!runner) {
        throw std::runtime_error("Runner factory for " + language + " returned no runner");
    }
    AHLOG_DEBUG("Created " << runner->getLanguageName() << " runner for '" << language << "'"
                << (runner->canExecute() ? "" : " (simulated)"));
    return runner;
}

bool RunnerRegistry::isSupported(const std::string& language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(normalize(language)) != registry_.end();
}

std::vector<std::string> RunnerRegistry::listSupported() const {
    std::vector<std::string> languages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        languages.reserve(registry_.size());
        for (const auto& entry : registry_) {
            languages.push_back(entry.first);
        }
    }
    std::sort(languages.begin(), languages.end());
    return languages;
}

void RunnerRegistry::registerLanguage(const std::string& language, RunnerFactory factory,
                                      const std::string& description) {
    const std::string key = normalize(language);
    if (key.empty()) {
        throw std::invalid_argument("Language identifier must not be blank");
    }
    if (!factory) {
        throw std::invalid_argument("Runner factory for " + key + " is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (registry_.count(key) > 0) {
        AHLOG_DEBUG("Replacing runner factory for '" << key << "'");
    }
    registry_[key] = RunnerInfo{std::move(factory), description};
}

bool RunnerRegistry::unregisterLanguage(const std::string& language) {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.erase(normalize(language)) > 0;
}

bool RunnerRegistry::isNativeCapable(const std::string& language) {
    return isNativeName(normalize(language));
}

LanguageCapabilities RunnerRegistry::getLanguageCapabilities(const std::string& language) const {
    const std::string key = normalize(language);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = registry_.find(key);
    if (it == registry_.end()) {
        return LanguageCapabilities{false, RuntimeStatus::NotSupported, "Language not supported"};
    }

    LanguageCapabilities capabilities;
    capabilities.canExecute = isNativeName(key);
    capabilities.runtimeStatus = capabilities.canExecute ? RuntimeStatus::Ready : RuntimeStatus::Simulated;
    capabilities.description = !it->second.description.empty()
        ? it->second.description
        : (capabilities.canExecute ? kNativeDescription : kSimulatedDescription);
    return capabilities;
}

std::vector<std::string> RunnerRegistry::listExecutable() const {
    std::vector<std::string> languages = listSupported();
    languages.erase(std::remove_if(languages.begin(), languages.end(),
                                   [](const std::string& language) { return !isNativeName(language); }),
                    languages.end());
    return languages;
}

std::vector<std::string> RunnerRegistry::listSimulated() const {
    std::vector<std::string> languages = listSupported();
    languages.erase(std::remove_if(languages.begin(), languages.end(), isNativeName),
                    languages.end());
    return languages;
}

void RunnerRegistry::setDefaultConfig(RunnerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultConfig_ = std::move(config);
}

RunnerConfig RunnerRegistry::getDefaultConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return defaultConfig_;
}

std::unique_ptr<TestRunner> createTestRunner(const std::string& language) {
    return RunnerRegistry::getInstance().createRunner(language);
}

} // namespace core
} // namespace algoharness
