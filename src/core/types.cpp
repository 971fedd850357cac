/// @file src/core/types.cpp
/// @brief String rendering for shared value types.

#include "zonal/types.hpp"

#include <fmt/format.h>

#include <type_traits>

namespace zonal {

const char* to_string(ZoneType t) noexcept {
    switch (t) {
        case ZoneType::Bullish: return "bullish";
        case ZoneType::Bearish: return "bearish";
        case ZoneType::Neutral: return "neutral";
    }
    return "unknown";
}

std::string to_string(const RuleValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return fmt::format("{}", x);
        }
    }, v);
}

std::string to_string(const ParamMap& params) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) out += ", ";
        out += fmt::format("{}={}", key, to_string(value));
        first = false;
    }
    out += "}";
    return out;
}

std::string to_string(const std::optional<double>& v) {
    return v ? fmt::format("{:.4f}", *v) : std::string("null");
}

}  // namespace zonal
