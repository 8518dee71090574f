#include "algoharness/utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace algoharness {
namespace utils {

namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

std::ostream* logStream = nullptr;

int initialLevel() {
    if (const char* env = std::getenv("ALGOHARNESS_LOG_LEVEL")) {
        int level = parseLogLevel(env);
        if (level >= 0) {
            return level;
        }
    }
    return AHLOG_LEVEL_WARN;
}

std::atomic<int>& currentLevel() {
    static std::atomic<int> level{initialLevel()};
    return level;
}

} // namespace

void setLogLevel(int level) {
    currentLevel().store(std::clamp(level, AHLOG_LEVEL_DEBUG, AHLOG_LEVEL_OFF));
}

int getLogLevel() {
    return currentLevel().load();
}

bool isLogEnabled(int level) {
    return level >= currentLevel().load();
}

int parseLogLevel(const std::string& name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "debug") return AHLOG_LEVEL_DEBUG;
    if (lowered == "info") return AHLOG_LEVEL_INFO;
    if (lowered == "warn" || lowered == "warning") return AHLOG_LEVEL_WARN;
    if (lowered == "error") return AHLOG_LEVEL_ERROR;
    if (lowered == "off" || lowered == "none") return AHLOG_LEVEL_OFF;
    return -1;
}

void setLogStream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(logMutex());
    logStream = stream;
}

void writeLog(const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex());
    std::ostream& out = logStream ? *logStream : std::cerr;
    out << "[algoharness][" << tag << "] " << message << std::endl;
}

} // namespace utils
} // namespace algoharness
