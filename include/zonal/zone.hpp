#pragma once

/// @file include/zonal/zone.hpp
/// @brief IndicatorContext and Zone: the self-describing zone record.
///
/// # Module: Zone Record
///
/// ## Responsibility
/// Carry one detected zone: its span, its read-only data slice, and the
/// context describing which indicator column(s) and which detection strategy
/// produced it. Downstream code reads the indicator identity from the
/// context and never from column-name patterns.
///
/// ## Guarantees
/// - `start_idx <= end_idx` and `start_time <= end_time`
/// - `data()` is bound to `[start_idx, end_idx]` and is never mutated
/// - The context is always present; unset fields are `nullopt`
/// - `features` is written once, by the feature extractor
///
/// ## NOT Responsible For
/// - Computing features (see zonal/features.hpp)

#include "zonal/table.hpp"
#include "zonal/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace zonal {

struct ZoneFeatures;

// ─── IndicatorContext ─────────────────────────────────────────────────────────

/// Which columns and which strategy produced a zone.
///
/// Built once per detection run and shared by every zone of that run.
struct IndicatorContext {
    std::optional<std::string> detection_indicator;  ///< Column the regime was read from
    std::optional<std::string> detection_strategy;   ///< e.g. "zero_crossing"
    std::optional<std::string> signal_line;          ///< Second line (LineCrossing)
    ParamMap                   detection_rules;      ///< Thresholds, min length, ...

    [[nodiscard]] std::string to_string() const;
};

// ─── Zone ─────────────────────────────────────────────────────────────────────

class Zone {
public:
    /// Build a zone over `data`. Span indices and times are taken from the
    /// slice.
    ///
    /// # Throws
    /// `DataError` if `context` is null.
    Zone(int id,
         ZoneType type,
         TableSlice data,
         std::shared_ptr<const IndicatorContext> context);

    [[nodiscard]] int         id() const noexcept { return id_; }
    [[nodiscard]] ZoneType    type() const noexcept { return type_; }
    [[nodiscard]] std::size_t start_idx() const noexcept { return data_.start_index(); }
    [[nodiscard]] std::size_t end_idx() const noexcept { return data_.end_index(); }
    [[nodiscard]] double      start_time() const noexcept { return data_.timestamps().front(); }
    [[nodiscard]] double      end_time() const noexcept { return data_.timestamps().back(); }

    /// Number of samples in the zone: `end_idx - start_idx + 1`.
    [[nodiscard]] std::size_t duration() const noexcept { return data_.size(); }

    [[nodiscard]] const TableSlice& data() const noexcept { return data_; }

    [[nodiscard]] const IndicatorContext& indicator_context() const noexcept {
        return *context_;
    }

    /// Column the zone was detected on, `nullopt` when unknown.
    [[nodiscard]] const std::optional<std::string>& primary_indicator_column() const noexcept {
        return context_->detection_indicator;
    }

    /// Second line of a line-crossing detection, `nullopt` when unknown.
    [[nodiscard]] const std::optional<std::string>& signal_line_column() const noexcept {
        return context_->signal_line;
    }

    /// Feature bag, `nullptr` until extraction has run for this zone.
    [[nodiscard]] const ZoneFeatures* features() const noexcept { return features_.get(); }
    [[nodiscard]] bool has_features() const noexcept { return features_ != nullptr; }

    /// Store the extracted features. Features are written once per zone.
    ///
    /// # Throws
    /// `std::logic_error` if the zone already has features.
    void set_features(ZoneFeatures features);

    [[nodiscard]] std::string to_string() const;

private:
    int                                     id_;
    ZoneType                                type_;
    TableSlice                              data_;
    std::shared_ptr<const IndicatorContext> context_;
    std::shared_ptr<const ZoneFeatures>     features_;
};

}  // namespace zonal
