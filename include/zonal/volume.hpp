#pragma once

/// @file include/zonal/volume.hpp
/// @brief VolumeStrategy: zone volume against its baseline and indicator.
///
/// # Module: Volume Strategy
///
/// ## Responsibility
/// - `avg_zone_volume`: mean of the zone's non-missing volumes (0 when none)
/// - `zone_volume_ratio`: avg_zone_volume / baseline
/// - `entry_volume_change`: volume at the first zone sample / baseline - 1
/// - `volume_indicator_corr`: Pearson r of volume and the indicator over
///   samples where both are present
///
/// The baseline is the caller-supplied value, or else the mean volume of up
/// to `baseline_window` rows preceding the zone in its table.
///
/// ## Guarantees
/// - Only a missing `volume` column raises (`DataError`); every optional
///   metric degrades to `nullopt` instead
/// - Stateless after construction; `calculate_volume` is const

#include "zonal/constants.hpp"
#include "zonal/metrics.hpp"
#include "zonal/table.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace zonal {

struct VolumeConfig {
    std::size_t baseline_window         = constants::DEFAULT_BASELINE_WINDOW;
    std::size_t correlation_min_periods = constants::DEFAULT_CORRELATION_MIN_PERIODS;
};

class VolumeStrategy {
public:
    explicit VolumeStrategy(VolumeConfig config = {}) noexcept : config_(config) {}

    /// # Arguments
    /// * `zone_data`       - Zone slice with a `volume` column
    /// * `baseline_volume` - Reference volume; derived from preceding rows
    ///                       when absent. Non-positive values count as absent.
    /// * `indicator_col`   - Column to correlate with volume, if any
    ///
    /// # Throws
    /// `DataError` if `volume` is missing.
    [[nodiscard]] VolumeMetrics
    calculate_volume(const TableSlice& zone_data,
                     std::optional<double> baseline_volume = std::nullopt,
                     const std::optional<std::string>& indicator_col = std::nullopt) const;

    /// Mean non-missing volume of up to `baseline_window` rows before the
    /// zone, `nullopt` if there are none or the mean is not positive.
    [[nodiscard]] std::optional<double> derive_baseline(const TableSlice& zone_data) const;

    [[nodiscard]] const VolumeConfig& config() const noexcept { return config_; }

private:
    VolumeConfig config_;
};

}  // namespace zonal
