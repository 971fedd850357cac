/// @file src/strategies/volume.cpp
/// @brief VolumeStrategy implementation.

#include "zonal/volume.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "../stats/moments.hpp"

#include <fmt/format.h>

#include <cmath>

namespace zonal {

std::optional<double> VolumeStrategy::derive_baseline(const TableSlice& zone_data) const {
    const auto before = zone_data.preceding(config_.baseline_window);
    if (!before) {
        return std::nullopt;
    }
    const auto col = before->find_column("volume");
    if (!col) {
        return std::nullopt;
    }
    const auto baseline = stats::mean(stats::finite_values(*col));
    if (!baseline || !(*baseline > 0.0)) {
        return std::nullopt;
    }
    return baseline;
}

VolumeMetrics VolumeStrategy::calculate_volume(const TableSlice& zone_data,
                                               std::optional<double> baseline_volume,
                                               const std::optional<std::string>& indicator_col) const {
    const auto volume_col = zone_data.find_column("volume");
    if (!volume_col) {
        throw DataError(fmt::format("volume: column 'volume' not found. Available: [{}]",
                                    zone_data.table().describe_columns()));
    }
    const auto volume = *volume_col;

    VolumeMetrics m;
    m.strategy_params = ParamMap{
        {"baseline_window",         static_cast<std::int64_t>(config_.baseline_window)},
        {"correlation_min_periods", static_cast<std::int64_t>(config_.correlation_min_periods)},
    };
    if (indicator_col) {
        m.strategy_params["indicator_col"] = *indicator_col;
    }

    m.avg_zone_volume = stats::mean(stats::finite_values(volume)).value_or(0.0);

    // ─── Baseline-relative metrics ────────────────────────────────────────────
    if (baseline_volume && !(std::isfinite(*baseline_volume) && *baseline_volume > 0.0)) {
        log::get()->debug("volume: ignoring unusable baseline {}", *baseline_volume);
        baseline_volume.reset();
    }
    if (!baseline_volume) {
        baseline_volume = derive_baseline(zone_data);
    }
    if (baseline_volume) {
        m.strategy_params["baseline_volume"] = *baseline_volume;
        m.zone_volume_ratio = m.avg_zone_volume / *baseline_volume;
        if (!volume.empty() && std::isfinite(volume.front())) {
            m.entry_volume_change = volume.front() / *baseline_volume - 1.0;
        }
    }

    // ─── Volume / indicator correlation ───────────────────────────────────────
    if (indicator_col) {
        const auto ind = zone_data.find_column(*indicator_col);
        if (!ind) {
            log::get()->debug("volume: indicator '{}' not in zone data, no correlation",
                              *indicator_col);
        } else {
            const auto [v, x] = stats::pairwise_complete(volume, *ind);
            m.volume_indicator_corr = stats::pearson(v, x, config_.correlation_min_periods);
            if (!m.volume_indicator_corr) {
                log::get()->debug("volume: correlation with '{}' undefined ({} paired sample(s))",
                                  *indicator_col, v.size());
            }
        }
    }

    return m;
}

}  // namespace zonal
