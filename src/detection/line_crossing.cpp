/// @file src/detection/line_crossing.cpp
/// @brief LineCrossingDetector: regime from the sign of line1 - line2.

#include "regime_scanner.hpp"

#include "zonal/errors.hpp"
#include "zonal/logging.hpp"

#include <cmath>
#include <utility>

namespace zonal {

LineCrossingDetector::LineCrossingDetector(std::string line1_col,
                                           std::string line2_col,
                                           ZoneFilter filter)
    : line1_col_(std::move(line1_col))
    , line2_col_(std::move(line2_col))
    , filter_(std::move(filter)) {
    if (line1_col_.empty() || line2_col_.empty()) {
        throw ConfigurationError("line_crossing: line1_col and line2_col are required");
    }
    if (line1_col_ == line2_col_) {
        throw ConfigurationError("line_crossing: line1_col and line2_col must differ");
    }
    detection::validate_filter(filter_);
}

std::vector<Zone> LineCrossingDetector::detect(std::shared_ptr<const SampleTable> table) const {
    const char* name = to_string(DetectionStrategy::LineCrossing);
    detection::validate_input(table, {line1_col_, line2_col_}, name);

    const auto line1 = table->column(line1_col_);
    const auto line2 = table->column(line2_col_);
    std::vector<detection::Regime> regimes(line1.size());
    for (std::size_t i = 0; i < line1.size(); ++i) {
        const double d = line1[i] - line2[i];
        if (std::isnan(d)) continue;
        regimes[i] = d >= 0.0 ? ZoneType::Bullish : ZoneType::Bearish;
    }

    auto context = std::make_shared<const IndicatorContext>(IndicatorContext{
        .detection_indicator = line1_col_,
        .detection_strategy  = std::string(name),
        .signal_line         = line2_col_,
        .detection_rules     = detection::base_rules(filter_),
    });

    auto zones = detection::build_zones(detection::segment_regimes(regimes),
                                        /*emit_neutral=*/false, table,
                                        std::move(context), filter_);
    log::get()->info("{} on '{}' vs '{}': {} zone(s) over {} rows",
                     name, line1_col_, line2_col_, zones.size(), table->size());
    return zones;
}

}  // namespace zonal
