#include "algoharness/core/runner_registry.h"
#include "algoharness/core/test_model.h"
#include "algoharness/utils/logging.hpp"
#include "algoharness/utils/serialization.h"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace algoharness;
using namespace algoharness::core;

namespace {

constexpr int kExitAllPassed = 0;
constexpr int kExitFailures = 1;
constexpr int kExitUsage = 2;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <submission.json> [--json] [--log-level LEVEL]\n"
              << "\n"
              << "submission.json: {\"language\": \"...\", \"code\": \"...\",\n"
              << "                  \"testCases\": [{\"input\": {...}, \"expected\": ..., \"description\": \"...\"}],\n"
              << "                  \"config\": {\"timeoutMs\": 5000, \"maxExecutionTimeMs\": 1000, ...}}\n";
}

void printReport(const std::string& language, const std::vector<TestResult>& results) {
    std::cout << "Language: " << language << "\n";
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        std::cout << (result.passed ? "[PASS] " : "[FAIL] ") << "#" << (i + 1);
        if (!result.description.empty()) {
            std::cout << " " << result.description;
        }
        if (result.executionTime) {
            std::cout << std::fixed << std::setprecision(2) << " (" << result.executionTime->count() << " ms)";
        }
        std::cout << "\n";
        if (!result.passed) {
            std::cout << "       expected: " << utils::describeValue(result.expected) << "\n"
                      << "       actual:   " << utils::describeValue(result.actual) << "\n";
            if (result.error) {
                std::cout << "       error:    " << *result.error << "\n";
            }
        }
    }

    const TestSummary summary = summarize(results);
    std::cout << summary.passed << "/" << summary.total << " passed in " << std::fixed
              << std::setprecision(2) << summary.totalTime.count() << " ms\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string path;
    bool jsonOutput = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            jsonOutput = true;
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            int level = utils::parseLogLevel(argv[++i]);
            if (level < 0) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return kExitUsage;
            }
            utils::setLogLevel(level);
        } else if (path.empty() && argv[i][0] != '-') {
            path = argv[i];
        } else {
            printUsage(argv[0]);
            return kExitUsage;
        }
    }
    if (path.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    std::ifstream file(path);
    if (!file) {
        std::cerr << "Cannot open " << path << "\n";
        return kExitUsage;
    }
    const auto document = nlohmann::ordered_json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        std::cerr << path << " is not a JSON object\n";
        return kExitUsage;
    }
    if (!document.contains("language") || !document.at("language").is_string() ||
        !document.contains("code") || !document.at("code").is_string()) {
        std::cerr << path << " needs string fields \"language\" and \"code\"\n";
        return kExitUsage;
    }

    auto testCases = loadTestCases(document.value("testCases", nlohmann::ordered_json::array()));
    if (!testCases) {
        std::cerr << "Invalid test cases: " << testCases.error() << "\n";
        return kExitUsage;
    }

    auto config = RunnerConfig::fromJson(
        nlohmann::json::parse(document.value("config", nlohmann::ordered_json()).dump()));
    if (!config) {
        std::cerr << "Invalid config: " << config.error() << "\n";
        return kExitUsage;
    }

    const std::string language = document.at("language").get<std::string>();
    auto& registry = RunnerRegistry::getInstance();
    registry.setDefaultConfig(config.value());

    std::vector<TestResult> results;
    try {
        auto runner = registry.createRunner(language);
        results = runner->runTests(document.at("code").get<std::string>(), testCases.value());
    } catch (const UnsupportedLanguageError& e) {
        std::cerr << e.what() << "\n"
                  << "Supported languages:";
        for (const auto& supported : registry.listSupported()) {
            std::cerr << " " << supported;
        }
        std::cerr << "\n";
        return kExitUsage;
    } catch (const PreparationError& e) {
        std::cerr << "Preparation failed: " << e.what() << "\n";
        return kExitUsage;
    }

    if (jsonOutput) {
        nlohmann::ordered_json report;
        report["language"] = language;
        report["capabilities"] = {
            {"canExecute", registry.getLanguageCapabilities(language).canExecute},
            {"runtimeStatus", toString(registry.getLanguageCapabilities(language).runtimeStatus)},
        };
        report["summary"] = summarize(results);
        report["results"] = results;
        std::cout << report.dump(2) << "\n";
    } else {
        printReport(language, results);
    }

    return summarize(results).allPassed() || results.empty() ? kExitAllPassed : kExitFailures;
}
