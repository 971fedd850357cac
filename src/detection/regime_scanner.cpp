/// @file src/detection/regime_scanner.cpp
/// @brief Regime segmentation, input validation and zone materialization.

#include "regime_scanner.hpp"

#include "zonal/errors.hpp"
#include "zonal/logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace zonal::detection {

// ─── segment_regimes ──────────────────────────────────────────────────────────

std::vector<Segment> segment_regimes(std::span<const Regime> regimes) {
    std::vector<Segment> segments;
    const std::size_t n = regimes.size();

    std::optional<Segment> open;
    for (std::size_t i = 0; i < n; ++i) {
        if (!regimes[i]) {
            continue;  // missing: the open segment (if any) spans it
        }
        if (!open) {
            open = Segment{.type = *regimes[i], .start = i, .end = i};
            continue;
        }
        if (*regimes[i] != open->type) {
            open->end = i - 1;
            segments.push_back(*open);
            open = Segment{.type = *regimes[i], .start = i, .end = i};
        }
    }
    if (open) {
        open->end = n - 1;
        segments.push_back(*open);
    }
    return segments;
}

// ─── Validation ───────────────────────────────────────────────────────────────

void validate_input(const std::shared_ptr<const SampleTable>& table,
                    std::initializer_list<std::string> columns,
                    const char* strategy) {
    if (!table || table->empty()) {
        throw DataError(fmt::format("{}: cannot detect zones on an empty table", strategy));
    }

    std::vector<std::string> missing;
    for (const auto& col : columns) {
        if (!table->has_column(col)) missing.push_back(col);
    }
    if (!missing.empty()) {
        throw ConfigurationError(fmt::format(
            "{}: missing required column(s) [{}]. Available: [{}]",
            strategy, fmt::join(missing, ", "), table->describe_columns()));
    }

    const auto ts = table->timestamps();
    const auto bad = std::find_if(ts.begin(), ts.end(), [](double t) { return !std::isfinite(t); });
    if (bad != ts.end()) {
        throw DataError(fmt::format("{}: timestamp at row {} is not finite",
                                    strategy, static_cast<std::size_t>(bad - ts.begin())));
    }
    if (!table->is_time_ordered()) {
        throw DataError(fmt::format("{}: timestamps are not in ascending order", strategy));
    }
}

void validate_filter(const ZoneFilter& filter) {
    if (filter.min_zone_length < 1) {
        throw ConfigurationError("min_zone_length must be at least 1");
    }
}

// ─── build_zones ──────────────────────────────────────────────────────────────

std::vector<Zone> build_zones(const std::vector<Segment>& segments,
                              bool emit_neutral,
                              const std::shared_ptr<const SampleTable>& table,
                              std::shared_ptr<const IndicatorContext> context,
                              const ZoneFilter& filter) {
    const auto wanted = [&](ZoneType t) {
        if (t == ZoneType::Neutral && !emit_neutral) return false;
        return filter.zone_types.empty()
            || std::find(filter.zone_types.begin(), filter.zone_types.end(), t)
                   != filter.zone_types.end();
    };

    std::vector<Zone> zones;
    zones.reserve(segments.size());
    std::size_t short_dropped = 0;

    for (std::size_t k = 0; k < segments.size(); ++k) {
        const Segment& seg = segments[k];
        const bool at_edge = (k == 0 || k + 1 == segments.size());
        const bool long_enough = seg.length() >= filter.min_zone_length;

        bool keep = long_enough;
        if (at_edge) {
            switch (filter.boundary_policy) {
                case BoundaryPolicy::ApplyMinLength: keep = long_enough; break;
                case BoundaryPolicy::Keep:           keep = true;        break;
                case BoundaryPolicy::Drop:           keep = false;       break;
            }
        }
        if (!keep) {
            ++short_dropped;
            continue;
        }
        if (!wanted(seg.type)) {
            continue;
        }

        zones.emplace_back(static_cast<int>(zones.size()),
                           seg.type,
                           TableSlice(table, seg.start, seg.end),
                           context);
    }

    log::get()->debug("{} segment(s), {} dropped by length/boundary policy, {} zone(s) kept",
                      segments.size(), short_dropped, zones.size());
    return zones;
}

ParamMap base_rules(const ZoneFilter& filter) {
    ParamMap rules;
    rules["min_zone_length"] = static_cast<std::int64_t>(filter.min_zone_length);
    rules["boundary_policy"] = std::string(to_string(filter.boundary_policy));
    return rules;
}

}  // namespace zonal::detection
