/// @file src/strategies/swing.cpp
/// @brief SwingStrategy implementation.

#include "zonal/swing.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "../stats/moments.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace zonal {

namespace {

struct Move {
    double amplitude_pct;
    double bars;
};

double mean_of(const std::vector<double>& v) {
    return stats::mean(v).value_or(0.0);
}

double max_of(const std::vector<double>& v) {
    return v.empty() ? 0.0 : *std::max_element(v.begin(), v.end());
}

/// True if `x[i]` beats every neighbour within the window. `beats` is
/// strict, so NaN neighbours and NaN centres never qualify.
template <typename Beats>
bool is_pivot(std::span<const double> x, std::size_t i,
              std::size_t left, std::size_t right, Beats beats) {
    for (std::size_t j = 1; j <= left; ++j) {
        if (!beats(x[i], x[i - j])) return false;
    }
    for (std::size_t j = 1; j <= right; ++j) {
        if (!beats(x[i], x[i + j])) return false;
    }
    return true;
}

}  // namespace

SwingStrategy::SwingStrategy(SwingConfig config) : config_(config) {
    if (config_.left_bars == 0 || config_.right_bars == 0) {
        throw ConfigurationError("swing: left_bars and right_bars must be at least 1");
    }
    if (!std::isfinite(config_.min_amplitude) || config_.min_amplitude < 0.0) {
        throw ConfigurationError("swing: min_amplitude must be finite and >= 0");
    }
}

std::vector<Pivot> SwingStrategy::find_pivots(std::span<const double> high,
                                              std::span<const double> low) const {
    std::vector<Pivot> pivots;
    const std::size_t n = std::min(high.size(), low.size());
    if (n < config_.left_bars + config_.right_bars + 1) {
        return pivots;
    }
    for (std::size_t i = config_.left_bars; i + config_.right_bars < n; ++i) {
        if (is_pivot(high, i, config_.left_bars, config_.right_bars, std::greater<>{})) {
            pivots.push_back({.index = i, .price = high[i], .is_high = true});
        }
        if (is_pivot(low, i, config_.left_bars, config_.right_bars, std::less<>{})) {
            pivots.push_back({.index = i, .price = low[i], .is_high = false});
        }
    }
    return pivots;
}

SwingMetrics SwingStrategy::calculate_swings(const TableSlice& zone_data) const {
    std::vector<std::string> missing;
    for (const char* col : {"high", "low", "close"}) {
        if (!zone_data.has_column(col)) missing.emplace_back(col);
    }
    if (!missing.empty()) {
        throw DataError(fmt::format("swing: missing column(s) [{}]. Available: [{}]",
                                    fmt::join(missing, ", "),
                                    zone_data.table().describe_columns()));
    }

    SwingMetrics m;
    m.strategy_params = ParamMap{
        {"left_bars",     static_cast<std::int64_t>(config_.left_bars)},
        {"right_bars",    static_cast<std::int64_t>(config_.right_bars)},
        {"min_amplitude", config_.min_amplitude},
    };

    const auto pivots = find_pivots(zone_data.column("high"), zone_data.column("low"));
    if (pivots.size() < 2) {
        log::get()->debug("swing: {} pivot(s) in {} row(s), no moves",
                          pivots.size(), zone_data.size());
        return m;
    }

    std::vector<Move> rallies, drops;
    for (std::size_t k = 1; k < pivots.size(); ++k) {
        const auto& prev = pivots[k - 1];
        const auto& cur  = pivots[k];
        if (cur.index <= prev.index || prev.price == 0.0) {
            continue;
        }
        const double change_pct = (cur.price / prev.price - 1.0) * 100.0;
        if (std::abs(change_pct) < config_.min_amplitude * 100.0) {
            continue;
        }
        const Move move{std::abs(change_pct), static_cast<double>(cur.index - prev.index)};
        (change_pct > 0.0 ? rallies : drops).push_back(move);
    }

    const auto field = [](const std::vector<Move>& moves, auto get) {
        std::vector<double> out;
        out.reserve(moves.size());
        for (const auto& mv : moves) out.push_back(get(mv));
        return out;
    };
    const auto amp   = [](const Move& mv) { return mv.amplitude_pct; };
    const auto bars  = [](const Move& mv) { return mv.bars; };
    const auto speed = [](const Move& mv) { return mv.amplitude_pct / mv.bars; };

    m.rally_count = static_cast<int>(rallies.size());
    m.drop_count  = static_cast<int>(drops.size());
    m.num_swings  = std::min(m.rally_count, m.drop_count);

    m.avg_rally_pct      = mean_of(field(rallies, amp));
    m.avg_drop_pct       = mean_of(field(drops, amp));
    m.max_rally_pct      = max_of(field(rallies, amp));
    m.max_drop_pct       = max_of(field(drops, amp));
    m.avg_rally_duration = mean_of(field(rallies, bars));
    m.avg_drop_duration  = mean_of(field(drops, bars));
    m.avg_rally_speed    = mean_of(field(rallies, speed));
    m.avg_drop_speed     = mean_of(field(drops, speed));

    m.rally_to_drop_ratio = m.avg_drop_pct > 0.0 ? m.avg_rally_pct / m.avg_drop_pct : 0.0;
    m.duration_symmetry   =
        m.avg_drop_duration > 0.0 ? m.avg_rally_duration / m.avg_drop_duration : 0.0;
    return m;
}

}  // namespace zonal
