/// @file src/detection/detector.cpp
/// @brief Strategy names, DetectorConfig validation and variant dispatch.

#include "zonal/detection.hpp"
#include "zonal/errors.hpp"

#include <fmt/format.h>

#include <type_traits>
#include <utility>

namespace zonal {

const char* to_string(DetectionStrategy s) noexcept {
    switch (s) {
        case DetectionStrategy::ZeroCrossing:  return "zero_crossing";
        case DetectionStrategy::ThresholdBand: return "threshold_band";
        case DetectionStrategy::LineCrossing:  return "line_crossing";
    }
    return "unknown";
}

DetectionStrategy parse_detection_strategy(std::string_view name) {
    if (name == "zero_crossing")  return DetectionStrategy::ZeroCrossing;
    if (name == "threshold_band") return DetectionStrategy::ThresholdBand;
    if (name == "line_crossing")  return DetectionStrategy::LineCrossing;
    throw ConfigurationError(fmt::format(
        "unknown detection strategy '{}'. Expected one of: "
        "zero_crossing, threshold_band, line_crossing", name));
}

const char* to_string(BoundaryPolicy p) noexcept {
    switch (p) {
        case BoundaryPolicy::ApplyMinLength: return "apply_min_length";
        case BoundaryPolicy::Keep:           return "keep";
        case BoundaryPolicy::Drop:           return "drop";
    }
    return "unknown";
}

// ─── make_detector ────────────────────────────────────────────────────────────

ZoneDetector make_detector(const DetectorConfig& config) {
    ZoneFilter filter{
        .min_zone_length = config.min_zone_length.value_or(constants::DEFAULT_MIN_ZONE_LENGTH),
        .boundary_policy = config.boundary_policy,
        .zone_types      = config.zone_types,
    };

    switch (config.strategy) {
        case DetectionStrategy::ZeroCrossing:
            return ZeroCrossingDetector(config.indicator_col, config.smooth_window,
                                        std::move(filter));

        case DetectionStrategy::ThresholdBand:
            if (!config.upper_threshold || !config.lower_threshold) {
                throw ConfigurationError(
                    "threshold_band requires upper_threshold and lower_threshold");
            }
            return ThresholdBandDetector(config.indicator_col,
                                         *config.upper_threshold,
                                         *config.lower_threshold,
                                         config.emit_neutral,
                                         std::move(filter));

        case DetectionStrategy::LineCrossing:
            if (!config.line2_col) {
                throw ConfigurationError("line_crossing requires line2_col");
            }
            return LineCrossingDetector(config.line1_col.value_or(config.indicator_col),
                                        *config.line2_col,
                                        std::move(filter));
    }
    throw ConfigurationError("unknown detection strategy");
}

std::vector<Zone> detect_zones(const ZoneDetector& detector,
                               std::shared_ptr<const SampleTable> table) {
    return std::visit([&](const auto& d) { return d.detect(std::move(table)); }, detector);
}

std::vector<Zone> detect_zones(const DetectorConfig& config,
                               std::shared_ptr<const SampleTable> table) {
    return detect_zones(make_detector(config), std::move(table));
}

DetectionStrategy strategy_of(const ZoneDetector& detector) noexcept {
    return std::visit([](const auto& d) {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, ZeroCrossingDetector>) {
            return DetectionStrategy::ZeroCrossing;
        } else if constexpr (std::is_same_v<T, ThresholdBandDetector>) {
            return DetectionStrategy::ThresholdBand;
        } else {
            return DetectionStrategy::LineCrossing;
        }
    }, detector);
}

}  // namespace zonal
