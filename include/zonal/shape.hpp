#pragma once

/// @file include/zonal/shape.hpp
/// @brief ShapeStrategy: distribution shape of an indicator inside a zone.
///
/// # Module: Shape Strategy
///
/// ## Responsibility
/// Skewness, Pearson kurtosis and smoothness (sample std of the first
/// differences) of one explicitly named column within a zone.
///
/// ## Guarantees
/// - Fewer than `SHAPE_MIN_SAMPLES` non-missing values, or a constant
///   series, yield the neutral record (skewness 0, kurtosis 3, no smoothness)
/// - Stateless after construction; `calculate` is const and thread-safe
///
/// ## NOT Responsible For
/// - Choosing the column. A missing column is a `DataError`.

#include "zonal/metrics.hpp"
#include "zonal/table.hpp"

#include <string>

namespace zonal {

struct ShapeConfig {
    bool calculate_smoothness = true;
    bool bias_correction      = false;  ///< Adjusted G1 / corrected kurtosis
};

class ShapeStrategy {
public:
    explicit ShapeStrategy(ShapeConfig config = {}) noexcept : config_(config) {}

    /// Shape of `indicator_col` over `zone_data`.
    ///
    /// # Throws
    /// `DataError` naming the column and listing the available ones when
    /// `indicator_col` is absent.
    [[nodiscard]] ShapeMetrics calculate(const TableSlice& zone_data,
                                         const std::string& indicator_col) const;

    [[nodiscard]] const ShapeConfig& config() const noexcept { return config_; }

private:
    ShapeConfig config_;
};

}  // namespace zonal
