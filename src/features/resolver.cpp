/// @file src/features/resolver.cpp
/// @brief ColumnResolver: structural exclusion, first remaining column.

#include "zonal/resolver.hpp"
#include "zonal/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace zonal {

namespace {

constexpr std::array<std::string_view, 15> STRUCTURAL_COLUMNS = {
    // price
    "open", "high", "low", "close", "volume",
    // time
    "time", "timestamp", "date", "datetime",
    // auxiliary
    "atr", "true_range", "tr",
    // index-like
    "index", "id", "zone_id",
};

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

bool ColumnResolver::is_structural(std::string_view name) noexcept {
    return std::any_of(STRUCTURAL_COLUMNS.begin(), STRUCTURAL_COLUMNS.end(),
                       [&](std::string_view s) { return iequals(s, name); });
}

std::optional<std::string> ColumnResolver::resolve(std::span<const std::string> columns) {
    const auto it = std::find_if(columns.begin(), columns.end(),
                                 [](const std::string& c) { return !is_structural(c); });
    if (it == columns.end()) {
        log::get()->debug("column resolver: no candidate among {} column(s)", columns.size());
        return std::nullopt;
    }
    log::get()->debug("column resolver: selected '{}'", *it);
    return *it;
}

std::optional<std::string> ColumnResolver::resolve(const TableSlice& data) {
    return resolve(std::span<const std::string>(data.column_names()));
}

}  // namespace zonal
