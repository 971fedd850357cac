/// @file src/strategies/divergence.cpp
/// @brief DivergenceStrategy: extrema pairing and regular divergence scan.

#include "zonal/divergence.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "../stats/moments.hpp"
#include "../stats/peak_finder.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <cstdlib>
#include <utility>

namespace zonal {

namespace {

/// A price extremum and the indicator extremum paired with it.
struct MatchedExtremum {
    std::size_t price;
    std::size_t indicator;
};

/// Peaks (or troughs) of a series that may contain NaN, as indices into the
/// original series.
std::vector<std::size_t> extrema(std::span<const double> series,
                                 bool troughs,
                                 const DivergenceConfig& cfg) {
    const auto clean = stats::compact(series);
    const double sd  = stats::stddev(clean.values, 0).value_or(0.0);

    const stats::PeakOptions opts{
        .min_distance   = cfg.min_peak_distance,
        .min_prominence = cfg.prominence_factor * sd,
        .min_height     = std::nullopt,
    };
    const auto found = troughs ? stats::find_troughs(clean.values, opts)
                               : stats::find_peaks(clean.values, opts);

    std::vector<std::size_t> out;
    out.reserve(found.size());
    for (std::size_t k : found) {
        out.push_back(clean.index[k]);
    }
    return out;
}

/// Pair every price extremum with the nearest indicator extremum within
/// `max_distance`. Both inputs are ascending, so the first minimum found is
/// the lower index on a tie.
std::vector<MatchedExtremum> match(const std::vector<std::size_t>& price,
                                   const std::vector<std::size_t>& indicator,
                                   std::size_t max_distance) {
    std::vector<MatchedExtremum> out;
    for (std::size_t p : price) {
        std::optional<std::size_t> best;
        std::size_t best_dist = 0;
        for (std::size_t q : indicator) {
            const std::size_t dist = p > q ? p - q : q - p;
            if (dist <= max_distance && (!best || dist < best_dist)) {
                best      = q;
                best_dist = dist;
            }
        }
        if (best) {
            out.push_back({.price = p, .indicator = *best});
        }
    }
    return out;
}

}  // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

DivergenceStrategy::DivergenceStrategy(DivergenceConfig config) : config_(config) {
    if (config_.min_peak_distance < 1) {
        throw ConfigurationError("divergence: min_peak_distance must be at least 1");
    }
    if (!std::isfinite(config_.prominence_factor) || config_.prominence_factor < 0.0) {
        throw ConfigurationError("divergence: prominence_factor must be a non-negative number");
    }
    if (!std::isfinite(config_.min_divergence_strength)
        || config_.min_divergence_strength < 0.0) {
        throw ConfigurationError(
            "divergence: min_divergence_strength must be a non-negative number");
    }
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

void DivergenceStrategy::require_columns(
    const TableSlice& zone_data,
    const std::string& indicator_col,
    const std::optional<std::string>& indicator_line_col) const {
    std::vector<std::string> required{"close", "high", "low", indicator_col};
    if (indicator_line_col) {
        required.push_back(*indicator_line_col);
    }

    std::vector<std::string> missing;
    for (const auto& col : required) {
        if (!zone_data.has_column(col)) missing.push_back(col);
    }
    if (!missing.empty()) {
        throw DataError(fmt::format(
            "divergence: missing column(s) [{}]. Available: [{}]",
            fmt::join(missing, ", "), zone_data.table().describe_columns()));
    }
}

ParamMap DivergenceStrategy::params(const std::string& indicator_col,
                                    const std::optional<std::string>& indicator_line_col) const {
    ParamMap p{
        {"min_peak_distance",       static_cast<std::int64_t>(config_.min_peak_distance)},
        {"prominence_factor",       config_.prominence_factor},
        {"max_match_distance",      static_cast<std::int64_t>(config_.max_match_distance)},
        {"min_divergence_strength", config_.min_divergence_strength},
        {"indicator_col",           indicator_col},
    };
    if (indicator_line_col) {
        p["indicator_line_col"] = *indicator_line_col;
    }
    return p;
}

std::vector<DivergenceEvent>
DivergenceStrategy::scan(const TableSlice& zone_data, const std::string& indicator_col) const {
    const auto high = zone_data.column("high");
    const auto low  = zone_data.column("low");
    const auto ind  = zone_data.column(indicator_col);

    std::vector<DivergenceEvent> events;

    const auto compare = [&](std::span<const double> price,
                             const std::vector<MatchedExtremum>& pairs,
                             DivergenceType type) {
        for (std::size_t k = 0; k + 1 < pairs.size(); ++k) {
            const auto& a = pairs[k];
            const auto& b = pairs[k + 1];
            const double price_delta = price[b.price] - price[a.price];
            const double ind_prev    = ind[a.indicator];
            const double ind_delta   = ind[b.indicator] - ind_prev;

            const bool diverges = type == DivergenceType::Bearish
                ? (price_delta > 0.0 && ind_delta < 0.0)
                : (price_delta < 0.0 && ind_delta > 0.0);
            if (!diverges) {
                continue;
            }
            if (std::abs(ind_prev) <= constants::FLOAT_EPSILON) {
                log::get()->debug("divergence: skipping pair at {}..{}, indicator is zero",
                                  a.price, b.price);
                continue;
            }
            const double strength = std::abs(ind_delta / ind_prev);
            if (strength < config_.min_divergence_strength) {
                continue;
            }
            events.push_back(DivergenceEvent{
                .type           = type,
                .price_prev     = a.price,
                .price_cur      = b.price,
                .indicator_prev = a.indicator,
                .indicator_cur  = b.indicator,
                .strength       = strength,
            });
        }
    };

    // Bearish: higher high in price, lower high in the indicator.
    compare(high,
            match(extrema(high, false, config_), extrema(ind, false, config_),
                  config_.max_match_distance),
            DivergenceType::Bearish);

    // Bullish: lower low in price, higher low in the indicator.
    compare(low,
            match(extrema(low, true, config_), extrema(ind, true, config_),
                  config_.max_match_distance),
            DivergenceType::Bullish);

    return events;
}

// ─── Public API ───────────────────────────────────────────────────────────────

std::vector<DivergenceEvent>
DivergenceStrategy::find_divergences(const TableSlice& zone_data,
                                     const std::string& indicator_col) const {
    require_columns(zone_data, indicator_col, std::nullopt);
    if (zone_data.size() < 2 * config_.min_peak_distance) {
        return {};
    }
    return scan(zone_data, indicator_col);
}

DivergenceMetrics DivergenceStrategy::calculate_divergence(
    const TableSlice& zone_data,
    const std::string& indicator_col,
    const std::optional<std::string>& indicator_line_col) const {
    require_columns(zone_data, indicator_col, indicator_line_col);

    DivergenceMetrics m;
    m.strategy_params = params(indicator_col, indicator_line_col);

    if (zone_data.size() < 2 * config_.min_peak_distance) {
        log::get()->debug("divergence: {} sample(s) is too short for '{}'",
                          zone_data.size(), indicator_col);
        return m;
    }

    const auto events = scan(zone_data, indicator_col);
    double strength_sum = 0.0;
    for (const auto& e : events) {
        if (e.type == DivergenceType::Bullish) {
            ++m.bullish_count;
        } else {
            ++m.bearish_count;
        }
        strength_sum += e.strength;
    }
    m.divergence_count = m.bullish_count + m.bearish_count;
    if (m.divergence_count == 0) {
        return m;
    }
    m.avg_strength = strength_sum / static_cast<double>(m.divergence_count);

    if (m.bullish_count > m.bearish_count) {
        m.dominant_type = DivergenceType::Bullish;
        m.direction     = DivergenceDirection::Bullish;
    } else if (m.bearish_count > m.bullish_count) {
        m.dominant_type = DivergenceType::Bearish;
        m.direction     = DivergenceDirection::Bearish;
    } else {
        m.dominant_type = DivergenceType::None;
        m.direction     = DivergenceDirection::Mixed;
    }
    return m;
}

}  // namespace zonal
