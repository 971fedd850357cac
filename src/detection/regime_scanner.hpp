#pragma once

/// @file src/detection/regime_scanner.hpp
/// @brief Shared single-pass segmentation used by every detector.
///
/// Detectors reduce their input to one optional regime per sample; the
/// scanner turns that sequence into zones, applying the missing-value rule,
/// the minimum-length and boundary policies and the type filter.

#include "zonal/detection.hpp"

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace zonal::detection {

/// Regime of one sample; `nullopt` for a missing value.
using Regime = std::optional<ZoneType>;

/// A contiguous run of one regime, inclusive indices.
struct Segment {
    ZoneType    type;
    std::size_t start;
    std::size_t end;

    [[nodiscard]] std::size_t length() const noexcept { return end - start + 1; }
};

/// Split `regimes` into segments.
///
/// A segment starts at the first classified sample and extends through any
/// missing samples until the sample before the next classified sample of a
/// different regime. The last segment extends to the end of the series.
[[nodiscard]] std::vector<Segment> segment_regimes(std::span<const Regime> regimes);

/// Check the table is usable and that every column in `columns` exists.
///
/// # Throws
/// - `DataError` if the table is null or empty
/// - `ConfigurationError` naming the missing column(s)
/// - `DataError` if timestamps decrease
void validate_input(const std::shared_ptr<const SampleTable>& table,
                    std::initializer_list<std::string> columns,
                    const char* strategy);

/// Validate the fields of `filter` shared by every detector.
///
/// # Throws
/// `ConfigurationError` if `min_zone_length < 1`.
void validate_filter(const ZoneFilter& filter);

/// Apply `filter` to `segments` and materialize the surviving ones as zones.
///
/// # Arguments
/// * `segments`     - Output of `segment_regimes`
/// * `emit_neutral` - Whether neutral segments become zones
/// * `table`        - Source table, shared by every zone slice
/// * `context`      - Context shared by every zone
/// * `filter`       - Minimum length, boundary policy, type filter
[[nodiscard]] std::vector<Zone> build_zones(const std::vector<Segment>& segments,
                                            bool emit_neutral,
                                            const std::shared_ptr<const SampleTable>& table,
                                            std::shared_ptr<const IndicatorContext> context,
                                            const ZoneFilter& filter);

/// Rules recorded for every strategy: min length and boundary policy.
[[nodiscard]] ParamMap base_rules(const ZoneFilter& filter);

}  // namespace zonal::detection
