#pragma once

/// @file include/zonal/resolver.hpp
/// @brief Generic fallback choice of an indicator column.
///
/// # Module: Column Resolver
///
/// ## Responsibility
/// Pick a usable indicator column when a zone's context does not name one
/// (or names one the zone's data lacks). The rule is structural only:
/// drop the fixed set of price, time, auxiliary and index columns
/// (case-insensitive) and return the first remaining column in table order.
///
/// ## NOT Responsible For
/// - Recognising particular indicators. The resolver never looks at name
///   prefixes or substrings.

#include "zonal/table.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace zonal {

class ColumnResolver {
public:
    /// First non-structural name in `columns`, `nullopt` if none remains.
    [[nodiscard]] static std::optional<std::string>
    resolve(std::span<const std::string> columns);

    /// First non-structural column of the slice's table.
    [[nodiscard]] static std::optional<std::string> resolve(const TableSlice& data);

    /// True for names in the exclusion set:
    /// open, high, low, close, volume, time, timestamp, date, datetime,
    /// atr, true_range, tr, index, id, zone_id.
    [[nodiscard]] static bool is_structural(std::string_view name) noexcept;
};

}  // namespace zonal
