#include "algoharness/core/result_comparator.h"
#include "algoharness/utils/serialization.h"
#include <cmath>

namespace algoharness {
namespace core {

namespace {

bool compareArrays(const Value& expected, const Value& actual) {
    if (expected.size() != actual.size()) {
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (!compareResults(expected[i], actual[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

bool compareResults(const Value& expected, const Value& actual) {
    if (expected.is_null() && actual.is_null()) return true;
    if (expected.is_null() || actual.is_null()) return false;

    if (expected.is_number() && actual.is_number()) {
        return std::fabs(expected.get<double>() - actual.get<double>()) < kNumericTolerance;
    }

    if (expected.is_array() && actual.is_array()) {
        return compareArrays(expected, actual);
    }

    return utils::canonicalDump(expected) == utils::canonicalDump(actual);
}

} // namespace core
} // namespace algoharness
