#pragma once

/// @file include/zonal/types.hpp
/// @brief Shared value types used across detection, strategies and features.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace zonal {

// ─── OHLCV ────────────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct OHLCV {
    double timestamp;  ///< Bar index or Unix epoch seconds
    double open;       ///< Opening price
    double high;       ///< High price
    double low;        ///< Low price
    double close;      ///< Closing price
    double volume;     ///< Traded volume
};

// ─── ZoneType ─────────────────────────────────────────────────────────────────

/// Regime a zone was detected in.
enum class ZoneType {
    Bullish,  ///< Signal above zero / above upper band / line1 above line2
    Bearish,  ///< Signal below zero / below lower band / line1 below line2
    Neutral,  ///< Inside the threshold band (ThresholdBand only)
};

/// Convert ZoneType to its lower-case name.
[[nodiscard]] const char* to_string(ZoneType t) noexcept;

// ─── Parameters ───────────────────────────────────────────────────────────────

/// A single detection rule or strategy parameter value.
using RuleValue = std::variant<bool, std::int64_t, double, std::string>;

/// Ordered name → value map (detection rules, strategy parameters).
using ParamMap = std::map<std::string, RuleValue>;

/// Render a RuleValue for logs and to_string().
[[nodiscard]] std::string to_string(const RuleValue& v);

/// Render a ParamMap as `{key=value, ...}`.
[[nodiscard]] std::string to_string(const ParamMap& params);

/// Render an optional double, `null` when empty.
[[nodiscard]] std::string to_string(const std::optional<double>& v);

}  // namespace zonal
