#ifndef ALGOHARNESS_UTILS_SERIALIZATION_H
#define ALGOHARNESS_UTILS_SERIALIZATION_H

#include <string>
#include <nlohmann/json.hpp>

namespace algoharness {
namespace utils {

/**
 * @brief Converts an insertion-ordered JSON value into one whose object keys
 * are sorted, recursively.
 *
 * Two mappings holding the same entries in different insertion order convert
 * to equal values.
 */
nlohmann::json toCanonical(const nlohmann::ordered_json& value);

/**
 * @brief Compact serialization of the canonical form.
 *
 * Used as a stable cache key and as the fallback structural comparison.
 * Invalid UTF-8 in strings is replaced rather than reported.
 */
std::string canonicalDump(const nlohmann::ordered_json& value);

/**
 * @brief Short single-line rendering for logs and CLI output.
 *
 * Strings longer than maxLength are cut and suffixed with "...".
 */
std::string describeValue(const nlohmann::ordered_json& value, std::size_t maxLength = 80);

} // namespace utils
} // namespace algoharness

#endif // ALGOHARNESS_UTILS_SERIALIZATION_H
