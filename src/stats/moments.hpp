#pragma once

/// @file src/stats/moments.hpp
/// @brief Internal descriptive statistics over contiguous double data.
///
/// # Module: Moments
///
/// ## Responsibility
/// Mean, standard deviation, skewness, Pearson kurtosis, correlation,
/// differencing, rolling means and quantiles, computed with Eigen over
/// `Eigen::Map` views of the caller's data.
///
/// ## Guarantees
/// - Functions that take `values` expect finite input; use `finite_values()`
///   or `pairwise_complete()` first when the source may contain NaN
/// - A degenerate result (too few samples, zero variance) is `nullopt`
/// - All functions are `noexcept` except those that allocate their result

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace zonal::stats {

/// Copy of `values` with NaN and infinite entries removed.
[[nodiscard]] std::vector<double> finite_values(std::span<const double> values);

/// Indices and values of the finite entries of `values`.
struct CompactSeries {
    std::vector<double>      values;
    std::vector<std::size_t> index;  ///< Original position of each value
};

[[nodiscard]] CompactSeries compact(std::span<const double> values);

/// Rows where both `x` and `y` are finite. Inputs must be equally long.
[[nodiscard]] std::pair<std::vector<double>, std::vector<double>>
pairwise_complete(std::span<const double> x, std::span<const double> y);

/// Arithmetic mean. `nullopt` if empty.
[[nodiscard]] std::optional<double> mean(std::span<const double> values) noexcept;

/// Standard deviation with `ddof` delta degrees of freedom (0 = population,
/// 1 = sample).
///
/// # Returns
/// `nullopt` if `values.size() <= ddof`.
[[nodiscard]] std::optional<double> stddev(std::span<const double> values,
                                           std::size_t ddof) noexcept;

/// Sample skewness.
///
/// With `bias_correction == false` this is the population moment ratio
/// g1 = m3 / m2^1.5. With `true` it is the adjusted Fisher–Pearson
/// coefficient G1 = g1 * sqrt(n(n-1)) / (n-2).
///
/// # Returns
/// `nullopt` if fewer than 3 values or the variance is zero.
[[nodiscard]] std::optional<double> skewness(std::span<const double> values,
                                             bool bias_correction) noexcept;

/// Pearson kurtosis (3 for a normal distribution).
///
/// With `bias_correction == false` this is m4 / m2^2. With `true` the excess
/// kurtosis is bias-corrected, `((n+1) g2 + 6)(n-1) / ((n-2)(n-3))`, and 3 is
/// added back; the correction needs at least 4 values and is skipped below.
///
/// # Returns
/// `nullopt` if fewer than 3 values or the variance is zero.
[[nodiscard]] std::optional<double> kurtosis(std::span<const double> values,
                                             bool bias_correction) noexcept;

/// Pearson correlation of two equally long finite series.
///
/// # Returns
/// `nullopt` if fewer than `min_periods` values, lengths differ, or either
/// series has zero variance.
[[nodiscard]] std::optional<double> pearson(std::span<const double> x,
                                            std::span<const double> y,
                                            std::size_t min_periods) noexcept;

/// First differences `x[i+1] - x[i]`; empty when fewer than 2 values.
[[nodiscard]] std::vector<double> diff(std::span<const double> values);

/// Trailing rolling mean. The first `window - 1` outputs, and any output whose
/// window holds a NaN, are NaN.
[[nodiscard]] std::vector<double> rolling_mean(std::span<const double> values,
                                               std::size_t window);

/// Linear-interpolation quantile of an ascending-sorted series, `q` in [0, 1].
/// `nullopt` if empty.
[[nodiscard]] std::optional<double> quantile_sorted(std::span<const double> sorted,
                                                    double q) noexcept;

}  // namespace zonal::stats
