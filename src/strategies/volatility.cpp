/// @file src/strategies/volatility.cpp
/// @brief VolatilityStrategy implementation.

#include "zonal/volatility.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "../stats/moments.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zonal {

namespace {

/// First and last finite values of `x`.
std::optional<std::pair<double, double>> ends(std::span<const double> x) noexcept {
    const auto first = std::find_if(x.begin(), x.end(), [](double v) { return std::isfinite(v); });
    if (first == x.end()) {
        return std::nullopt;
    }
    const auto last = std::find_if(x.rbegin(), x.rend(), [](double v) { return std::isfinite(v); });
    return std::pair{*first, *last};
}

double relative_change(double start, double end) noexcept {
    return start > 0.0 ? end / start - 1.0 : 0.0;
}

}  // namespace

std::vector<double> true_range(std::span<const double> high,
                               std::span<const double> low,
                               std::span<const double> close) {
    std::vector<double> tr(high.size(), std::numeric_limits<double>::quiet_NaN());
    for (std::size_t i = 0; i < high.size(); ++i) {
        double r = high[i] - low[i];
        if (!std::isfinite(r)) {
            continue;  // high or low missing
        }
        if (i > 0 && std::isfinite(close[i - 1])) {
            r = std::max({r, std::abs(high[i] - close[i - 1]), std::abs(low[i] - close[i - 1])});
        }
        tr[i] = r;
    }
    return tr;
}

VolatilityStrategy::VolatilityStrategy(VolatilityConfig config) : config_(std::move(config)) {
    if (!std::isfinite(config_.trend_threshold) || config_.trend_threshold < 0.0) {
        throw ConfigurationError("volatility: trend_threshold must be finite and >= 0");
    }
    if (config_.trend_window == 0) {
        throw ConfigurationError("volatility: trend_window must be at least 1");
    }
}

VolatilityMetrics VolatilityStrategy::calculate_volatility(const TableSlice& zone_data) const {
    std::vector<std::string> missing;
    for (const char* col : {"high", "low", "close"}) {
        if (!zone_data.has_column(col)) missing.emplace_back(col);
    }
    if (!missing.empty()) {
        throw DataError(fmt::format("volatility: missing column(s) [{}]. Available: [{}]",
                                    fmt::join(missing, ", "),
                                    zone_data.table().describe_columns()));
    }
    if (zone_data.size() < constants::VOLATILITY_MIN_SAMPLES) {
        throw DataError(fmt::format("volatility: zone has {} row(s), need at least {}",
                                    zone_data.size(), constants::VOLATILITY_MIN_SAMPLES));
    }

    const auto high  = zone_data.column("high");
    const auto low   = zone_data.column("low");
    const auto close = zone_data.column("close");

    VolatilityMetrics m;
    m.strategy_params = ParamMap{
        {"atr_col",         config_.atr_col},
        {"trend_threshold", config_.trend_threshold},
        {"trend_window",    static_cast<std::int64_t>(config_.trend_window)},
    };

    double start = 0.0;
    double end   = 0.0;
    if (const auto atr = zone_data.find_column(config_.atr_col)) {
        m.avg_atr = stats::mean(stats::finite_values(*atr)).value_or(0.0);
        if (const auto e = ends(*atr)) {
            start = e->first;
            end   = e->second;
        }
    } else {
        log::get()->debug("volatility: no '{}' column, estimating from true range",
                          config_.atr_col);
        m.atr_estimated = true;
        const auto tr = stats::finite_values(true_range(high, low, close));
        m.avg_atr = stats::mean(tr).value_or(0.0);
        if (!tr.empty()) {
            const std::size_t w = std::min(config_.trend_window, tr.size());
            const std::span<const double> all(tr);
            start = *stats::mean(all.first(w));
            end   = *stats::mean(all.last(w));
        }
    }

    const auto hi = stats::finite_values(high);
    const auto lo = stats::finite_values(low);
    if (!hi.empty() && !lo.empty() && m.avg_atr > 0.0) {
        const double range = *std::max_element(hi.begin(), hi.end()) -
                             *std::min_element(lo.begin(), lo.end());
        m.atr_normalized_range = range / m.avg_atr;
    }

    m.atr_change = relative_change(start, end);
    if (m.atr_change > config_.trend_threshold) {
        m.atr_trend = AtrTrend::Increasing;
    } else if (m.atr_change < -config_.trend_threshold) {
        m.atr_trend = AtrTrend::Decreasing;
    }
    return m;
}

}  // namespace zonal
