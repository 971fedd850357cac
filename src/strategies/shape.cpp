/// @file src/strategies/shape.cpp
/// @brief ShapeStrategy implementation.

#include "zonal/shape.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "../stats/moments.hpp"

#include <utility>
#include <vector>

namespace zonal {

namespace {

/// Skewness and Pearson kurtosis of `values`.
///
/// # Throws
/// `ComputationError` when the variance is zero to working precision.
std::pair<double, double> skew_and_kurtosis(const std::vector<double>& values,
                                            bool bias_correction) {
    const auto skew = stats::skewness(values, bias_correction);
    const auto kurt = stats::kurtosis(values, bias_correction);
    if (!skew || !kurt) {
        throw ComputationError("zero variance");
    }
    return {*skew, *kurt};
}

}  // namespace

ShapeMetrics ShapeStrategy::calculate(const TableSlice& zone_data,
                                      const std::string& indicator_col) const {
    // Throws DataError listing the available columns.
    const auto raw = zone_data.column(indicator_col);

    ParamMap params{
        {"indicator_col",        indicator_col},
        {"calculate_smoothness", config_.calculate_smoothness},
        {"bias_correction",      config_.bias_correction},
    };

    const auto values = stats::finite_values(raw);
    if (values.size() < constants::SHAPE_MIN_SAMPLES) {
        log::get()->debug("shape: {} usable value(s) of '{}', returning neutral record",
                          values.size(), indicator_col);
        return ShapeMetrics::neutral(std::move(params));
    }

    std::pair<double, double> moments;
    try {
        moments = skew_and_kurtosis(values, config_.bias_correction);
    } catch (const ComputationError& e) {
        log::get()->debug("shape: '{}': {}, returning neutral record", indicator_col, e.what());
        return ShapeMetrics::neutral(std::move(params));
    }

    ShapeMetrics m;
    m.skewness = moments.first;
    m.kurtosis = moments.second;
    if (config_.calculate_smoothness) {
        m.smoothness = stats::stddev(stats::diff(values), 1);
    }
    m.strategy_params = std::move(params);
    return m;
}

}  // namespace zonal
