#include "algoharness/utils/serialization.h"
#include <cmath>

namespace algoharness {
namespace utils {

nlohmann::json toCanonical(const nlohmann::ordered_json& value) {
    switch (value.type()) {
        case nlohmann::ordered_json::value_t::object: {
            nlohmann::json out = nlohmann::json::object();
            for (const auto& [key, member] : value.items()) {
                out[key] = toCanonical(member);
            }
            return out;
        }
        case nlohmann::ordered_json::value_t::array: {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& element : value) {
                out.push_back(toCanonical(element));
            }
            return out;
        }
        case nlohmann::ordered_json::value_t::null:
            return nullptr;
        case nlohmann::ordered_json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::ordered_json::value_t::number_integer:
            return value.get<std::int64_t>();
        case nlohmann::ordered_json::value_t::number_unsigned:
            return value.get<std::uint64_t>();
        case nlohmann::ordered_json::value_t::number_float: {
            // 1.0 and 1 are the same script number and must serialize alike
            const double d = value.get<double>();
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9007199254740992.0) {
                return static_cast<std::int64_t>(d);
            }
            return d;
        }
        case nlohmann::ordered_json::value_t::string:
            return value.get<std::string>();
        default:
            // binary and discarded values never come out of the harness
            return nullptr;
    }
}

std::string canonicalDump(const nlohmann::ordered_json& value) {
    return toCanonical(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string describeValue(const nlohmann::ordered_json& value, std::size_t maxLength) {
    std::string text = value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    if (text.size() > maxLength && maxLength > 3) {
        text.resize(maxLength - 3);
        text += "...";
    }
    return text;
}

} // namespace utils
} // namespace algoharness
