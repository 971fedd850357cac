#pragma once

/// @file include/zonal/volatility.hpp
/// @brief VolatilityStrategy: ATR level and direction inside a zone.
///
/// # Module: Volatility Strategy
///
/// ## Responsibility
/// - `avg_atr`: mean of the zone's ATR column, or of the true range
///   `max(high - low, |high - prev close|, |low - prev close|)` when the
///   table has no ATR column
/// - `atr_normalized_range`: price range of the zone in ATR units
/// - `atr_change` / `atr_trend`: last ATR against the first. The estimate
///   compares the means of the first and last `trend_window` true ranges.
///
/// ## Guarantees
/// - Missing `high`, `low` or `close`, or fewer than
///   `VOLATILITY_MIN_SAMPLES` rows, raise `DataError`
/// - Stateless after construction; `calculate_volatility` is const

#include "zonal/constants.hpp"
#include "zonal/metrics.hpp"
#include "zonal/table.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace zonal {

struct VolatilityConfig {
    std::string atr_col         = "atr";
    double      trend_threshold = constants::DEFAULT_ATR_TREND_THRESHOLD;
    std::size_t trend_window    = constants::DEFAULT_ATR_TREND_WINDOW;
};

class VolatilityStrategy {
public:
    /// # Throws
    /// `ConfigurationError` if `trend_threshold` is negative or not finite,
    /// or `trend_window` is 0.
    explicit VolatilityStrategy(VolatilityConfig config = {});

    /// # Throws
    /// `DataError` if a price column is missing or the zone is too short.
    [[nodiscard]] VolatilityMetrics calculate_volatility(const TableSlice& zone_data) const;

    [[nodiscard]] const VolatilityConfig& config() const noexcept { return config_; }

private:
    VolatilityConfig config_;
};

/// True range per row. The first row has no previous close and uses
/// `high - low`; rows with a missing price are NaN.
[[nodiscard]] std::vector<double> true_range(std::span<const double> high,
                                             std::span<const double> low,
                                             std::span<const double> close);

}  // namespace zonal
