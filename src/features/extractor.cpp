/// @file src/features/extractor.cpp
/// @brief ZoneFeatureExtractor: column choice, failure isolation, workers.

#include "zonal/features.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"
#include "zonal/resolver.hpp"
#include "../stats/moments.hpp"
#include "../stats/peak_finder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <future>
#include <thread>
#include <utility>

namespace zonal {

namespace {

/// Run `fn` and return its result, or `nullopt` if it throws. The failure is
/// logged at debug level with the zone id and the strategy name.
template <typename Fn>
auto isolated(const char* what, int zone_id, Fn&& fn)
    -> std::optional<decltype(fn())> {
    try {
        return fn();
    } catch (const Error& e) {
        log::get()->debug("zone {}: {} unavailable: {}", zone_id, what, e.what());
    } catch (const std::exception& e) {
        log::get()->debug("zone {}: {} failed: {}", zone_id, what, e.what());
    }
    return std::nullopt;
}

std::optional<double> ratio_minus_one(double num, double den) noexcept {
    if (!std::isfinite(num) || !std::isfinite(den) || den == 0.0) {
        return std::nullopt;
    }
    return num / den - 1.0;
}

/// Index of the first max (or min) finite value, `nullopt` if none.
std::optional<std::size_t> arg_extreme(std::span<const double> x, bool want_max) noexcept {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i])) continue;
        if (!best || (want_max ? x[i] > x[*best] : x[i] < x[*best])) {
            best = i;
        }
    }
    return best;
}

}  // namespace

// ─── describe_prices ──────────────────────────────────────────────────────────

PriceDescriptors describe_prices(const TableSlice& zone_data,
                                 ZoneType type,
                                 const std::optional<std::string>& indicator_col) {
    const auto close = zone_data.column("close");
    const auto high  = zone_data.column("high");
    const auto low   = zone_data.column("low");
    if (close.empty()) {
        throw DataError("price descriptors: empty zone");
    }

    PriceDescriptors d;
    d.start_price  = close.front();
    d.end_price    = close.back();
    d.price_return = ratio_minus_one(d.end_price, d.start_price);

    const auto hi_idx = arg_extreme(high, true);
    const auto lo_idx = arg_extreme(low, false);
    if (hi_idx && lo_idx) {
        d.price_range_pct = ratio_minus_one(high[*hi_idx], low[*lo_idx]);
    }

    const double n = static_cast<double>(zone_data.size());
    if (type == ZoneType::Bullish && hi_idx) {
        d.drawdown_from_peak = ratio_minus_one(d.end_price, high[*hi_idx]);
        d.peak_time_ratio    = static_cast<double>(*hi_idx) / n;
    } else if (type == ZoneType::Bearish && lo_idx) {
        d.rally_from_trough = ratio_minus_one(d.end_price, low[*lo_idx]);
        d.trough_time_ratio = static_cast<double>(*lo_idx) / n;
    }

    // Swing counts: local maxima of high above its mean, minima of low below.
    const auto clean_high = stats::compact(high);
    const auto clean_low  = stats::compact(low);
    if (const auto mh = stats::mean(clean_high.values)) {
        d.num_peaks = stats::find_peaks(clean_high.values, {.min_height = *mh}).size();
    }
    if (const auto ml = stats::mean(clean_low.values)) {
        d.num_troughs = stats::find_troughs(clean_low.values, {.min_height = -*ml}).size();
    }

    if (indicator_col) {
        if (const auto ind = zone_data.find_column(*indicator_col)) {
            const auto values = stats::finite_values(*ind);
            if (!values.empty()) {
                const auto [mn, mx] = std::minmax_element(values.begin(), values.end());
                d.indicator_amplitude = *mx - *mn;
            }
            const auto slopes = stats::finite_values(stats::diff(*ind));
            if (!slopes.empty()) {
                double steepest = 0.0;
                for (double s : slopes) steepest = std::max(steepest, std::abs(s));
                d.indicator_slope = steepest;
            }
            if (zone_data.size() >= 3) {
                const auto [c, x] = stats::pairwise_complete(close, *ind);
                d.price_indicator_corr = stats::pearson(c, x, 3);
            }
        }
    }
    return d;
}

// ─── describe_indicator ───────────────────────────────────────────────────────

IndicatorStats describe_indicator(const TableSlice& zone_data, const std::string& column) {
    const auto values = stats::finite_values(zone_data.column(column));
    if (values.empty()) {
        throw ComputationError(fmt::format("indicator '{}': no finite values in zone", column));
    }
    const auto [mn, mx] = std::minmax_element(values.begin(), values.end());
    return IndicatorStats{
        .column  = column,
        .max     = *mx,
        .min     = *mn,
        .mean    = stats::mean(values).value_or(0.0),
        .std_dev = stats::stddev(values, 1),
    };
}

// ─── ZoneFeatures ─────────────────────────────────────────────────────────────

std::string ZoneFeatures::to_string() const {
    return fmt::format(
        "ZoneFeatures{{id={}, type={}, duration={}, indicator={}{}, "
        "return={}, shape={}, divergence={}, volume={}, volatility={}, swing={}{}}}",
        zone_id, zonal::to_string(type), duration,
        indicator_column.value_or("none"), used_fallback ? " (fallback)" : "",
        price ? zonal::to_string(price->price_return) : std::string("null"),
        shape ? shape->to_string() : std::string("null"),
        divergence ? divergence->to_string() : std::string("null"),
        volume ? volume->to_string() : std::string("null"),
        volatility ? volatility->to_string() : std::string("null"),
        swing ? swing->to_string() : std::string("null"),
        timed_out ? ", timed_out" : "");
}

// ─── ZoneFeatureExtractor ─────────────────────────────────────────────────────

ZoneFeatureExtractor::ZoneFeatureExtractor(ExtractorConfig config)
    : config_(std::move(config))
    , shape_(config_.shape)
    , divergence_(config_.divergence)
    , volume_(config_.volume)
    , volatility_(config_.volatility)
    , swing_(config_.swing) {
    if (config_.zone_timeout.count() < 0) {
        throw ConfigurationError("zone_timeout must not be negative");
    }
}

ZoneFeatures ZoneFeatureExtractor::extract(const Zone& zone) const {
    std::optional<Clock::time_point> deadline;
    if (config_.zone_timeout.count() > 0) {
        deadline = Clock::now() + config_.zone_timeout;
    }
    return extract_until(zone, deadline);
}

ZoneFeatures ZoneFeatureExtractor::extract_until(
    const Zone& zone, std::optional<Clock::time_point> deadline) const {
    const TableSlice& data = zone.data();

    ZoneFeatures f;
    f.zone_id  = zone.id();
    f.type     = zone.type();
    f.duration = zone.duration();

    // ─── Column choice ────────────────────────────────────────────────────────
    const auto& primary = zone.primary_indicator_column();
    if (primary && data.has_column(*primary)) {
        f.indicator_column = primary;
        const auto& signal = zone.signal_line_column();
        if (signal && data.has_column(*signal)) {
            f.signal_line = signal;
        }
    } else {
        f.indicator_column = ColumnResolver::resolve(data);
        f.used_fallback    = f.indicator_column.has_value();
        log::get()->debug("zone {}: no usable context column, fallback {}",
                          f.zone_id, f.indicator_column.value_or("none"));
    }

    const auto expired = [&] { return deadline && Clock::now() >= *deadline; };
    const auto time_out = [&] {
        log::get()->debug("zone {}: extraction exceeded its deadline", f.zone_id);
        ZoneFeatures timed;
        timed.zone_id          = f.zone_id;
        timed.type             = f.type;
        timed.duration         = f.duration;
        timed.indicator_column = f.indicator_column;
        timed.used_fallback    = f.used_fallback;
        timed.signal_line      = f.signal_line;
        timed.timed_out        = true;
        return timed;
    };

    // ─── Strategies ───────────────────────────────────────────────────────────
    f.price = isolated("price descriptors", f.zone_id, [&] {
        return describe_prices(data, f.type, f.indicator_column);
    });
    if (f.indicator_column) {
        f.indicator = isolated("indicator summary", f.zone_id, [&] {
            return describe_indicator(data, *f.indicator_column);
        });
    }

    if (expired()) return time_out();
    if (config_.enable_shape && f.indicator_column) {
        f.shape = isolated("shape", f.zone_id, [&] {
            return shape_.calculate(data, *f.indicator_column);
        });
    }

    if (expired()) return time_out();
    if (config_.enable_divergence && f.indicator_column) {
        f.divergence = isolated("divergence", f.zone_id, [&] {
            return divergence_.calculate_divergence(data, *f.indicator_column, f.signal_line);
        });
    }

    if (expired()) return time_out();
    if (config_.enable_volume) {
        f.volume = isolated("volume", f.zone_id, [&] {
            return volume_.calculate_volume(data, std::nullopt, f.indicator_column);
        });
    }

    if (expired()) return time_out();
    if (config_.enable_volatility) {
        f.volatility = isolated("volatility", f.zone_id, [&] {
            return volatility_.calculate_volatility(data);
        });
    }

    if (expired()) return time_out();
    if (config_.enable_swing) {
        f.swing = isolated("swing", f.zone_id, [&] {
            return swing_.calculate_swings(data);
        });
    }

    if (expired()) return time_out();
    return f;
}

std::size_t ZoneFeatureExtractor::worker_count(std::size_t zone_count) const noexcept {
    std::size_t workers = config_.max_workers;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::max<std::size_t>(1, std::min(workers, zone_count));
}

std::size_t ZoneFeatureExtractor::extract_all(std::vector<Zone>& zones,
                                              std::stop_token stop) const {
    if (zones.empty()) {
        return 0;
    }

    std::atomic<std::size_t> cursor{0};
    std::atomic<std::size_t> done{0};

    // Each worker claims the next undispatched zone; the claimed zone is
    // touched by that worker only.
    const auto worker = [&] {
        while (!stop.stop_requested()) {
            const std::size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= zones.size()) {
                return;
            }
            if (zones[i].has_features()) {
                continue;
            }
            zones[i].set_features(extract(zones[i]));
            done.fetch_add(1, std::memory_order_relaxed);
        }
    };

    const std::size_t n_workers = worker_count(zones.size());
    std::vector<std::future<void>> workers;
    workers.reserve(n_workers);
    for (std::size_t w = 0; w < n_workers; ++w) {
        workers.push_back(std::async(std::launch::async, worker));
    }
    for (auto& w : workers) {
        w.get();
    }

    const std::size_t processed = done.load();
    if (processed < zones.size()) {
        log::get()->info("feature extraction stopped after {} of {} zone(s)",
                         processed, zones.size());
    } else {
        log::get()->debug("extracted features for {} zone(s) on {} worker(s)",
                          processed, n_workers);
    }
    return processed;
}

}  // namespace zonal
