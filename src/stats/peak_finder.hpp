#pragma once

/// @file src/stats/peak_finder.hpp
/// @brief Local-maximum detection with distance and prominence filters.
///
/// # Module: Peak Finder
///
/// ## Responsibility
/// Locate peaks in a finite 1-D series in three passes:
///   1. Local maxima, where a flat plateau counts once at its midpoint
///      (rounded down), optionally limited to those at least `min_height`
///   2. Distance filter: peaks are visited from highest to lowest and every
///      lower peak closer than `min_distance` to a kept one is dropped
///   3. Prominence filter: keep peaks whose topographic prominence is at
///      least `min_prominence`
///
/// Troughs are found by running the finder on the negated series
/// (`find_troughs`).
///
/// ## NOT Responsible For
/// - Missing values: callers compact the series first and map indices back

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace zonal::stats {

struct PeakOptions {
    std::size_t min_distance   = 1;    ///< Samples; values below 1 act as 1
    double      min_prominence = 0.0;  ///< Absolute units of the series
    std::optional<double> min_height;  ///< Unset = no height filter
};

/// Ascending indices of the peaks of `x`. The first and last sample are
/// never peaks.
[[nodiscard]] std::vector<std::size_t> find_peaks(std::span<const double> x,
                                                  const PeakOptions& options);

/// Ascending indices of the troughs of `x`.
[[nodiscard]] std::vector<std::size_t> find_troughs(std::span<const double> x,
                                                    const PeakOptions& options);

/// Topographic prominence of the sample at `peak`: its height above the
/// higher of the two lowest points reached before meeting higher ground on
/// either side (or the series edge).
[[nodiscard]] double peak_prominence(std::span<const double> x, std::size_t peak) noexcept;

}  // namespace zonal::stats
