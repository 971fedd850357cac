/// @file src/detection/threshold_band.cpp
/// @brief ThresholdBandDetector: regime from an upper and a lower band.

#include "regime_scanner.hpp"

#include "zonal/errors.hpp"
#include "zonal/logging.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace zonal {

ThresholdBandDetector::ThresholdBandDetector(std::string indicator_col,
                                             double upper_threshold,
                                             double lower_threshold,
                                             bool emit_neutral,
                                             ZoneFilter filter)
    : indicator_col_(std::move(indicator_col))
    , upper_(upper_threshold)
    , lower_(lower_threshold)
    , emit_neutral_(emit_neutral)
    , filter_(std::move(filter)) {
    if (indicator_col_.empty()) {
        throw ConfigurationError("threshold_band: indicator_col must not be empty");
    }
    if (!std::isfinite(upper_) || !std::isfinite(lower_)) {
        throw ConfigurationError("threshold_band: thresholds must be finite");
    }
    if (upper_ <= lower_) {
        throw ConfigurationError(fmt::format(
            "threshold_band: upper_threshold ({}) must be greater than lower_threshold ({})",
            upper_, lower_));
    }
    detection::validate_filter(filter_);
}

std::vector<Zone> ThresholdBandDetector::detect(std::shared_ptr<const SampleTable> table) const {
    const char* name = to_string(DetectionStrategy::ThresholdBand);
    detection::validate_input(table, {indicator_col_}, name);

    const auto values = table->column(indicator_col_);
    std::vector<detection::Regime> regimes(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double v = values[i];
        if (std::isnan(v)) continue;
        if (v > upper_) {
            regimes[i] = ZoneType::Bullish;
        } else if (v < lower_) {
            regimes[i] = ZoneType::Bearish;
        } else {
            regimes[i] = ZoneType::Neutral;
        }
    }

    auto rules = detection::base_rules(filter_);
    rules["upper_threshold"] = upper_;
    rules["lower_threshold"] = lower_;
    rules["emit_neutral"]    = emit_neutral_;
    auto context = std::make_shared<const IndicatorContext>(IndicatorContext{
        .detection_indicator = indicator_col_,
        .detection_strategy  = std::string(name),
        .signal_line         = std::nullopt,
        .detection_rules     = std::move(rules),
    });

    auto zones = detection::build_zones(detection::segment_regimes(regimes),
                                        emit_neutral_, table,
                                        std::move(context), filter_);
    log::get()->info("{} on '{}' ({}, {}): {} zone(s) over {} rows",
                     name, indicator_col_, lower_, upper_, zones.size(), table->size());
    return zones;
}

}  // namespace zonal
