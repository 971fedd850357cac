#pragma once

/// @file include/zonal/swing.hpp
/// @brief SwingStrategy: rallies and drops between price pivots.
///
/// # Module: Swing Strategy
///
/// ## Responsibility
/// Find N-bar pivots inside a zone (a pivot high is strictly above the
/// `left_bars` highs before it and the `right_bars` highs after it; a pivot
/// low is strictly below the neighbouring lows), order them by row, and
/// classify every move between consecutive pivots as a rally or a drop.
/// Moves smaller than `min_amplitude` (a fraction) are ignored.
///
/// ## Guarantees
/// - Missing `high`, `low` or `close` raise `DataError`
/// - A zone too short for one pivot, or with fewer than two pivots, yields
///   the all-zero record
/// - Stateless after construction; `calculate_swings` is const

#include "zonal/constants.hpp"
#include "zonal/metrics.hpp"
#include "zonal/table.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace zonal {

struct SwingConfig {
    std::size_t left_bars     = constants::DEFAULT_PIVOT_LEFT_BARS;
    std::size_t right_bars    = constants::DEFAULT_PIVOT_RIGHT_BARS;
    double      min_amplitude = constants::DEFAULT_MIN_SWING_AMPLITUDE;
};

/// A pivot: row within the zone, price, and whether it is a high.
struct Pivot {
    std::size_t index;
    double      price;
    bool        is_high;

    bool operator==(const Pivot&) const = default;
};

class SwingStrategy {
public:
    /// # Throws
    /// `ConfigurationError` if either bar count is 0 or `min_amplitude` is
    /// negative or not finite.
    explicit SwingStrategy(SwingConfig config = {});

    /// # Throws
    /// `DataError` if `high`, `low` or `close` is missing.
    [[nodiscard]] SwingMetrics calculate_swings(const TableSlice& zone_data) const;

    /// Pivot highs of `high` and pivot lows of `low`, ordered by index. A
    /// row that is both comes out high first.
    [[nodiscard]] std::vector<Pivot> find_pivots(std::span<const double> high,
                                                 std::span<const double> low) const;

    [[nodiscard]] const SwingConfig& config() const noexcept { return config_; }

private:
    SwingConfig config_;
};

}  // namespace zonal
