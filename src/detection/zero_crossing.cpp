/// @file src/detection/zero_crossing.cpp
/// @brief ZeroCrossingDetector: regime from the sign of one column.

#include "regime_scanner.hpp"
#include "../stats/moments.hpp"

#include "zonal/errors.hpp"
#include "zonal/logging.hpp"

#include <cmath>
#include <utility>

namespace zonal {

ZeroCrossingDetector::ZeroCrossingDetector(std::string indicator_col,
                                           std::optional<std::size_t> smooth_window,
                                           ZoneFilter filter)
    : indicator_col_(std::move(indicator_col))
    , smooth_window_(smooth_window)
    , filter_(std::move(filter)) {
    if (indicator_col_.empty()) {
        throw ConfigurationError("zero_crossing: indicator_col must not be empty");
    }
    if (smooth_window_ && *smooth_window_ < 2) {
        throw ConfigurationError("zero_crossing: smooth_window must be at least 2");
    }
    detection::validate_filter(filter_);
}

std::vector<Zone> ZeroCrossingDetector::detect(std::shared_ptr<const SampleTable> table) const {
    const char* name = to_string(DetectionStrategy::ZeroCrossing);
    detection::validate_input(table, {indicator_col_}, name);

    auto values = table->column(indicator_col_);
    std::vector<double> smoothed;
    if (smooth_window_) {
        smoothed = stats::rolling_mean(values, *smooth_window_);
        values   = smoothed;
    }

    // Zero belongs to the bullish regime.
    std::vector<detection::Regime> regimes(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) continue;
        regimes[i] = values[i] >= 0.0 ? ZoneType::Bullish : ZoneType::Bearish;
    }

    auto rules = detection::base_rules(filter_);
    if (smooth_window_) {
        rules["smooth_window"] = static_cast<std::int64_t>(*smooth_window_);
    }
    auto context = std::make_shared<const IndicatorContext>(IndicatorContext{
        .detection_indicator = indicator_col_,
        .detection_strategy  = std::string(name),
        .signal_line         = std::nullopt,
        .detection_rules     = std::move(rules),
    });

    auto zones = detection::build_zones(detection::segment_regimes(regimes),
                                        /*emit_neutral=*/false, table,
                                        std::move(context), filter_);
    log::get()->info("{} on '{}': {} zone(s) over {} rows",
                     name, indicator_col_, zones.size(), table->size());
    return zones;
}

}  // namespace zonal
