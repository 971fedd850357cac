/// @file src/core/table.cpp
/// @brief SampleTable storage and TableSlice views.

#include "zonal/table.hpp"
#include "zonal/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace zonal {

// ─── SampleTable ──────────────────────────────────────────────────────────────

SampleTable::SampleTable(std::vector<double> timestamps)
    : timestamps_(std::move(timestamps)) {}

SampleTable SampleTable::from_bars(std::span<const OHLCV> bars) {
    std::vector<double> ts, open, high, low, close, volume;
    ts.reserve(bars.size());
    open.reserve(bars.size());
    high.reserve(bars.size());
    low.reserve(bars.size());
    close.reserve(bars.size());
    volume.reserve(bars.size());

    for (const auto& b : bars) {
        ts.push_back(b.timestamp);
        open.push_back(b.open);
        high.push_back(b.high);
        low.push_back(b.low);
        close.push_back(b.close);
        volume.push_back(b.volume);
    }

    SampleTable table(std::move(ts));
    table.add_column("open",   std::move(open));
    table.add_column("high",   std::move(high));
    table.add_column("low",    std::move(low));
    table.add_column("close",  std::move(close));
    table.add_column("volume", std::move(volume));
    return table;
}

void SampleTable::add_column(std::string name, std::vector<double> values) {
    if (name.empty()) {
        throw DataError("column name must not be empty");
    }
    if (index_.contains(name)) {
        throw DataError(fmt::format("duplicate column '{}'", name));
    }
    if (values.size() != timestamps_.size()) {
        throw DataError(fmt::format(
            "column '{}' has {} values, table has {} rows",
            name, values.size(), timestamps_.size()));
    }
    index_.emplace(name, columns_.size());
    names_.push_back(std::move(name));
    columns_.push_back(std::move(values));
}

bool SampleTable::has_column(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::span<const double> SampleTable::column(const std::string& name) const {
    auto col = find_column(name);
    if (!col) {
        throw DataError(fmt::format(
            "column '{}' not found. Available: [{}]", name, describe_columns()));
    }
    return *col;
}

std::optional<std::span<const double>>
SampleTable::find_column(const std::string& name) const noexcept {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return std::span<const double>(columns_[it->second]);
}

bool SampleTable::is_time_ordered() const noexcept {
    // NaN compares false both ways, so std::is_sorted would step over it.
    for (std::size_t i = 0; i < timestamps_.size(); ++i) {
        if (!std::isfinite(timestamps_[i])) return false;
        if (i > 0 && timestamps_[i] < timestamps_[i - 1]) return false;
    }
    return true;
}

std::string SampleTable::describe_columns() const {
    return fmt::format("{}", fmt::join(names_, ", "));
}

// ─── TableSlice ───────────────────────────────────────────────────────────────

TableSlice::TableSlice(std::shared_ptr<const SampleTable> table,
                       std::size_t start_idx,
                       std::size_t end_idx)
    : table_(std::move(table)), start_(start_idx), length_(0) {
    if (!table_) {
        throw DataError("slice requires a table");
    }
    if (start_idx > end_idx || end_idx >= table_->size()) {
        throw DataError(fmt::format(
            "invalid slice [{}, {}] over a table of {} rows",
            start_idx, end_idx, table_->size()));
    }
    length_ = end_idx - start_idx + 1;
}

TableSlice::TableSlice(std::shared_ptr<const SampleTable> table,
                       std::size_t start, std::size_t length, bool) noexcept
    : table_(std::move(table)), start_(start), length_(length) {}

std::span<const double> TableSlice::timestamps() const noexcept {
    return table_->timestamps().subspan(start_, length_);
}

std::span<const double> TableSlice::column(const std::string& name) const {
    return table_->column(name).subspan(start_, length_);
}

std::optional<std::span<const double>>
TableSlice::find_column(const std::string& name) const noexcept {
    auto col = table_->find_column(name);
    if (!col) {
        return std::nullopt;
    }
    return col->subspan(start_, length_);
}

std::optional<TableSlice> TableSlice::preceding(std::size_t n) const {
    if (n == 0 || start_ == 0) {
        return std::nullopt;
    }
    const std::size_t count = std::min(n, start_);
    return TableSlice(table_, start_ - count, count, true);
}

}  // namespace zonal
