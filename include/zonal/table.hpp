#pragma once

/// @file include/zonal/table.hpp
/// @brief SampleTable and TableSlice: the in-memory sample table.
///
/// # Module: Sample Table
///
/// ## Responsibility
/// Hold an ordered batch of samples: one timestamp per row plus any number of
/// named `double` columns (OHLCV and externally computed indicators).
/// Missing values are `NaN`. Column order is the insertion order and is
/// stable; the column resolver relies on it.
///
/// `TableSlice` is a read-only view over an inclusive row range. It shares
/// ownership of its table so a zone's data stays valid after detection
/// returns.
///
/// ## Guarantees
/// - Every column has exactly `size()` values
/// - Column names are unique
/// - Slices never copy column data
///
/// ## NOT Responsible For
/// - Loading data from disk or network
/// - Computing indicators

#include "zonal/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace zonal {

// ─── SampleTable ──────────────────────────────────────────────────────────────

class SampleTable {
public:
    /// Construct an empty-column table over the given row timestamps.
    explicit SampleTable(std::vector<double> timestamps);

    /// Build a table holding `open, high, low, close, volume` (in that order).
    [[nodiscard]] static SampleTable from_bars(std::span<const OHLCV> bars);

    /// Append a named column.
    ///
    /// # Throws
    /// `DataError` if the name is empty, already present, or `values.size()`
    /// differs from the row count.
    void add_column(std::string name, std::vector<double> values);

    [[nodiscard]] std::size_t size() const noexcept { return timestamps_.size(); }
    [[nodiscard]] bool empty() const noexcept { return timestamps_.empty(); }

    [[nodiscard]] std::span<const double> timestamps() const noexcept {
        return timestamps_;
    }

    /// Column names in insertion order.
    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept {
        return names_;
    }

    [[nodiscard]] bool has_column(const std::string& name) const noexcept;

    /// Full column by name.
    ///
    /// # Throws
    /// `DataError` naming the missing column and listing the available ones.
    [[nodiscard]] std::span<const double> column(const std::string& name) const;

    /// Full column by name, `nullopt` when absent.
    [[nodiscard]] std::optional<std::span<const double>>
    find_column(const std::string& name) const noexcept;

    /// True if every timestamp is finite and they are non-decreasing.
    [[nodiscard]] bool is_time_ordered() const noexcept;

    /// Comma-separated column list, used in error messages.
    [[nodiscard]] std::string describe_columns() const;

private:
    std::vector<double>                          timestamps_;
    std::vector<std::string>                     names_;
    std::vector<std::vector<double>>             columns_;
    std::unordered_map<std::string, std::size_t> index_;
};

// ─── TableSlice ───────────────────────────────────────────────────────────────

/// Read-only view over rows `[start, start + length)` of a SampleTable.
class TableSlice {
public:
    /// View over the inclusive row range `[start_idx, end_idx]`.
    ///
    /// # Throws
    /// `DataError` if `table` is null, `start_idx > end_idx`, or `end_idx` is
    /// outside the table.
    TableSlice(std::shared_ptr<const SampleTable> table,
               std::size_t start_idx,
               std::size_t end_idx);

    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    /// First row of the view in parent-table coordinates.
    [[nodiscard]] std::size_t start_index() const noexcept { return start_; }
    /// Last row of the view in parent-table coordinates. Undefined if empty.
    [[nodiscard]] std::size_t end_index() const noexcept { return start_ + length_ - 1; }

    [[nodiscard]] std::span<const double> timestamps() const noexcept;

    [[nodiscard]] const std::vector<std::string>& column_names() const noexcept {
        return table_->column_names();
    }

    [[nodiscard]] bool has_column(const std::string& name) const noexcept {
        return table_->has_column(name);
    }

    /// Column values restricted to this view.
    ///
    /// # Throws
    /// `DataError` if the column does not exist.
    [[nodiscard]] std::span<const double> column(const std::string& name) const;

    [[nodiscard]] std::optional<std::span<const double>>
    find_column(const std::string& name) const noexcept;

    /// Up to `n` rows immediately preceding this view, `nullopt` when the
    /// view starts at row 0 or `n == 0`.
    [[nodiscard]] std::optional<TableSlice> preceding(std::size_t n) const;

    [[nodiscard]] const SampleTable& table() const noexcept { return *table_; }

private:
    TableSlice(std::shared_ptr<const SampleTable> table,
               std::size_t start, std::size_t length, bool /*unchecked*/) noexcept;

    std::shared_ptr<const SampleTable> table_;
    std::size_t                        start_;
    std::size_t                        length_;
};

}  // namespace zonal
