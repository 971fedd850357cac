#pragma once

/// @file include/zonal/summary.hpp
/// @brief Run-level aggregates over the zones of one series.

#include "zonal/types.hpp"
#include "zonal/zone.hpp"

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace zonal {

// ─── DistributionStats ────────────────────────────────────────────────────────

/// Descriptive statistics of a sample. All fields are 0 when `count == 0`;
/// `std_dev` is 0 when `count < 2`.
struct DistributionStats {
    std::size_t count   = 0;
    double      mean    = 0.0;
    double      median  = 0.0;
    double      std_dev = 0.0;  ///< Sample (n - 1) standard deviation
    double      min     = 0.0;
    double      max     = 0.0;
    double      q25     = 0.0;  ///< Linear-interpolation quantiles
    double      q75     = 0.0;

    /// Statistics of the finite entries of `values`.
    [[nodiscard]] static DistributionStats of(std::span<const double> values);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const DistributionStats&) const = default;
};

// ─── ZoneSummary ──────────────────────────────────────────────────────────────

struct ZoneSummary {
    std::size_t                             total_zones = 0;
    std::map<ZoneType, std::size_t>         count_by_type;
    DistributionStats                       duration;
    DistributionStats                       price_return;  ///< From zones with features
    std::map<ZoneType, DistributionStats>   duration_by_type;

    [[nodiscard]] std::size_t count(ZoneType t) const noexcept;

    [[nodiscard]] std::string to_string() const;
};

/// Aggregate `zones`. Zones without features do not contribute to
/// `price_return`.
[[nodiscard]] ZoneSummary summarize(std::span<const Zone> zones);

}  // namespace zonal
