/// @file src/strategies/metrics.cpp
/// @brief String rendering for the metric records.

#include "zonal/metrics.hpp"

#include <fmt/format.h>

#include <utility>

namespace zonal {

const char* to_string(DivergenceType t) noexcept {
    switch (t) {
        case DivergenceType::Bullish: return "bullish";
        case DivergenceType::Bearish: return "bearish";
        case DivergenceType::None:    return "none";
    }
    return "unknown";
}

const char* to_string(DivergenceDirection d) noexcept {
    switch (d) {
        case DivergenceDirection::Bullish: return "bullish";
        case DivergenceDirection::Bearish: return "bearish";
        case DivergenceDirection::Mixed:   return "mixed";
        case DivergenceDirection::None:    return "none";
    }
    return "unknown";
}

const char* to_string(AtrTrend t) noexcept {
    switch (t) {
        case AtrTrend::Increasing: return "increasing";
        case AtrTrend::Decreasing: return "decreasing";
        case AtrTrend::Stable:     return "stable";
    }
    return "unknown";
}

ShapeMetrics ShapeMetrics::neutral(ParamMap params) {
    ShapeMetrics m;
    m.strategy_params = std::move(params);
    return m;
}

std::string ShapeMetrics::to_string() const {
    return fmt::format("ShapeMetrics{{skewness={:.4f}, kurtosis={:.4f}, smoothness={}, params={}}}",
                       skewness, kurtosis, zonal::to_string(smoothness),
                       zonal::to_string(strategy_params));
}

std::string DivergenceMetrics::to_string() const {
    return fmt::format(
        "DivergenceMetrics{{count={}, bullish={}, bearish={}, dominant={}, "
        "avg_strength={:.4f}, direction={}, params={}}}",
        divergence_count, bullish_count, bearish_count,
        zonal::to_string(dominant_type), avg_strength,
        zonal::to_string(direction), zonal::to_string(strategy_params));
}

std::string VolumeMetrics::to_string() const {
    return fmt::format(
        "VolumeMetrics{{ratio={}, entry_change={}, corr={}, avg_volume={:.2f}, params={}}}",
        zonal::to_string(zone_volume_ratio), zonal::to_string(entry_volume_change),
        zonal::to_string(volume_indicator_corr), avg_zone_volume,
        zonal::to_string(strategy_params));
}

std::string VolatilityMetrics::to_string() const {
    return fmt::format(
        "VolatilityMetrics{{avg_atr={:.4f}{}, normalized_range={:.4f}, change={:.4f}, "
        "trend={}, params={}}}",
        avg_atr, atr_estimated ? " (estimated)" : "", atr_normalized_range, atr_change,
        zonal::to_string(atr_trend), zonal::to_string(strategy_params));
}

std::string SwingMetrics::to_string() const {
    return fmt::format(
        "SwingMetrics{{swings={}, rallies={}, drops={}, avg_rally={:.2f}%, avg_drop={:.2f}%, "
        "ratio={:.3f}, symmetry={:.3f}, params={}}}",
        num_swings, rally_count, drop_count, avg_rally_pct, avg_drop_pct,
        rally_to_drop_ratio, duration_symmetry, zonal::to_string(strategy_params));
}

}  // namespace zonal
