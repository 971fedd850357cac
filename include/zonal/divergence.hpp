#pragma once

/// @file include/zonal/divergence.hpp
/// @brief DivergenceStrategy: price vs indicator extrema disagreement.
///
/// # Module: Divergence Strategy
///
/// ## Responsibility
/// Find regular divergences between price and one indicator inside a zone:
///   - Bullish: price makes a lower low while the indicator makes a higher low
///   - Bearish: price makes a higher high while the indicator makes a lower high
///
/// ## Algorithm
/// 1. Peaks of `high` and troughs of `low`, with a minimum spacing of
///    `min_peak_distance` samples and a prominence of at least
///    `prominence_factor` × (population std of the series)
/// 2. Peaks and troughs of the indicator, same method
/// 3. Each price extremum is paired with the nearest indicator extremum of
///    the same kind within `max_match_distance` (ties → lower index);
///    unpaired price extrema are discarded
/// 4. Consecutive paired extrema are compared. Strength is
///    |Δindicator / indicator_prev| and must reach `min_divergence_strength`
/// 5. Counts, majority type and mean strength are aggregated
///
/// ## Guarantees
/// - Fewer than `2 × min_peak_distance` samples → empty record, no error
/// - The optional signal line is recorded in `strategy_params` only; it is
///   never used to find extrema
/// - Stateless after construction; `calculate_divergence` is const

#include "zonal/constants.hpp"
#include "zonal/metrics.hpp"
#include "zonal/table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace zonal {

struct DivergenceConfig {
    std::size_t min_peak_distance       = constants::DEFAULT_MIN_PEAK_DISTANCE;
    double      prominence_factor       = constants::DEFAULT_PROMINENCE_FACTOR;
    std::size_t max_match_distance      = constants::DEFAULT_MAX_MATCH_DISTANCE;
    double      min_divergence_strength = constants::DEFAULT_MIN_DIVERGENCE_STRENGTH;
};

/// One detected divergence, in zone-relative indices.
struct DivergenceEvent {
    DivergenceType type;
    std::size_t    price_prev;      ///< Earlier price extremum
    std::size_t    price_cur;       ///< Later price extremum
    std::size_t    indicator_prev;  ///< Indicator extremum paired with price_prev
    std::size_t    indicator_cur;   ///< Indicator extremum paired with price_cur
    double         strength;
};

class DivergenceStrategy {
public:
    /// # Throws
    /// `ConfigurationError` if `min_peak_distance < 1` or either factor is
    /// negative or non-finite.
    explicit DivergenceStrategy(DivergenceConfig config = {});

    /// Divergence summary of `zone_data` against `indicator_col`.
    ///
    /// # Arguments
    /// * `zone_data`          - Zone slice with `close`, `high`, `low`
    /// * `indicator_col`      - Indicator to compare against price
    /// * `indicator_line_col` - Optional signal line, recorded only
    ///
    /// # Throws
    /// `DataError` listing every missing required column.
    [[nodiscard]] DivergenceMetrics
    calculate_divergence(const TableSlice& zone_data,
                         const std::string& indicator_col,
                         const std::optional<std::string>& indicator_line_col = std::nullopt) const;

    /// The individual divergences behind `calculate_divergence`, in the
    /// order found (bearish first, then bullish; each by time).
    ///
    /// # Throws
    /// `DataError` listing every missing required column.
    [[nodiscard]] std::vector<DivergenceEvent>
    find_divergences(const TableSlice& zone_data, const std::string& indicator_col) const;

    [[nodiscard]] const DivergenceConfig& config() const noexcept { return config_; }

private:
    void require_columns(const TableSlice& zone_data,
                         const std::string& indicator_col,
                         const std::optional<std::string>& indicator_line_col) const;

    [[nodiscard]] std::vector<DivergenceEvent>
    scan(const TableSlice& zone_data, const std::string& indicator_col) const;

    [[nodiscard]] ParamMap params(const std::string& indicator_col,
                                  const std::optional<std::string>& indicator_line_col) const;

    DivergenceConfig config_;
};

}  // namespace zonal
