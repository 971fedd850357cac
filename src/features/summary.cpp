/// @file src/features/summary.cpp
/// @brief DistributionStats and ZoneSummary.

#include "zonal/summary.hpp"
#include "zonal/features.hpp"
#include "../stats/moments.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace zonal {

DistributionStats DistributionStats::of(std::span<const double> values) {
    auto sorted = stats::finite_values(values);
    DistributionStats s;
    if (sorted.empty()) {
        return s;
    }
    std::sort(sorted.begin(), sorted.end());

    s.count   = sorted.size();
    s.mean    = stats::mean(sorted).value_or(0.0);
    s.std_dev = stats::stddev(sorted, 1).value_or(0.0);
    s.min     = sorted.front();
    s.max     = sorted.back();
    s.median  = stats::quantile_sorted(sorted, 0.50).value_or(0.0);
    s.q25     = stats::quantile_sorted(sorted, 0.25).value_or(0.0);
    s.q75     = stats::quantile_sorted(sorted, 0.75).value_or(0.0);
    return s;
}

std::string DistributionStats::to_string() const {
    return fmt::format("n={} mean={:.4f} median={:.4f} std={:.4f} min={:.4f} max={:.4f} "
                       "q25={:.4f} q75={:.4f}",
                       count, mean, median, std_dev, min, max, q25, q75);
}

std::size_t ZoneSummary::count(ZoneType t) const noexcept {
    const auto it = count_by_type.find(t);
    return it == count_by_type.end() ? 0 : it->second;
}

std::string ZoneSummary::to_string() const {
    std::string out = fmt::format("ZoneSummary: {} zone(s)\n", total_zones);
    for (const auto& [type, n] : count_by_type) {
        out += fmt::format("  {:<8} {:>5}  duration {}\n",
                           zonal::to_string(type), n, duration_by_type.at(type).to_string());
    }
    out += fmt::format("  duration     {}\n", duration.to_string());
    out += fmt::format("  price_return {}\n", price_return.to_string());
    return out;
}

ZoneSummary summarize(std::span<const Zone> zones) {
    ZoneSummary s;
    s.total_zones = zones.size();

    std::vector<double> durations;
    std::vector<double> returns;
    std::map<ZoneType, std::vector<double>> durations_by_type;
    durations.reserve(zones.size());

    for (const auto& z : zones) {
        const double d = static_cast<double>(z.duration());
        durations.push_back(d);
        durations_by_type[z.type()].push_back(d);
        ++s.count_by_type[z.type()];

        const ZoneFeatures* f = z.features();
        if (f && f->price && f->price->price_return) {
            returns.push_back(*f->price->price_return);
        }
    }

    s.duration     = DistributionStats::of(durations);
    s.price_return = DistributionStats::of(returns);
    for (const auto& [type, values] : durations_by_type) {
        s.duration_by_type[type] = DistributionStats::of(values);
    }
    return s;
}

}  // namespace zonal
