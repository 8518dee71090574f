#ifndef ALGOHARNESS_UTILS_LOGGING_HPP
#define ALGOHARNESS_UTILS_LOGGING_HPP

#include <iostream>
#include <sstream>
#include <string>

// Stream-style logging macros:
//   AHLOG_WARN("Unrecognized input shape " << key);
// Messages below the current level are not formatted at all.
#define AHLOG_LEVEL_DEBUG 0
#define AHLOG_LEVEL_INFO  1
#define AHLOG_LEVEL_WARN  2
#define AHLOG_LEVEL_ERROR 3
#define AHLOG_LEVEL_OFF   4

#define AHLOG(level, tag, message) \
    do { \
        if (::algoharness::utils::isLogEnabled(level)) { \
            std::ostringstream ahlog_stream_; \
            ahlog_stream_ << message; \
            ::algoharness::utils::writeLog(tag, ahlog_stream_.str()); \
        } \
    } while (false)

#define AHLOG_DEBUG(message) AHLOG(AHLOG_LEVEL_DEBUG, "DEBUG", message)
#define AHLOG_INFO(message)  AHLOG(AHLOG_LEVEL_INFO, "INFO", message)
#define AHLOG_WARN(message)  AHLOG(AHLOG_LEVEL_WARN, "WARN", message)
#define AHLOG_ERROR(message) AHLOG(AHLOG_LEVEL_ERROR, "ERROR", message)

namespace algoharness {
namespace utils {

// Default level is AHLOG_LEVEL_WARN. The ALGOHARNESS_LOG_LEVEL environment
// variable ("debug", "info", "warn", "error", "off") overrides it on first use.
void setLogLevel(int level);
int getLogLevel();
bool isLogEnabled(int level);

// Parses a level name; returns -1 for an unknown name.
int parseLogLevel(const std::string& name);

// Redirects output, mainly for tests. Passing nullptr restores std::cerr.
void setLogStream(std::ostream* stream);

void writeLog(const char* tag, const std::string& message);

} // namespace utils
} // namespace algoharness

#endif // ALGOHARNESS_UTILS_LOGGING_HPP
