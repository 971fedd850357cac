/// @file src/stats/moments.cpp
/// @brief Eigen-backed descriptive statistics.

#include "moments.hpp"

#include "zonal/constants.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>

namespace zonal::stats {

namespace {

using ConstVecMap = Eigen::Map<const Eigen::VectorXd>;

ConstVecMap as_vector(std::span<const double> values) noexcept {
    return ConstVecMap(values.data(), static_cast<Eigen::Index>(values.size()));
}

/// Central moments m2, m3, m4 (population normalisation).
struct CentralMoments {
    double mean;
    double m2;
    double m3;
    double m4;
};

CentralMoments central_moments(std::span<const double> values) noexcept {
    const auto v  = as_vector(values);
    const double mu = v.mean();
    // Lazy expressions: evaluated inside each reduction, no temporaries.
    const auto d  = v.array() - mu;
    const auto d2 = d.square();
    return CentralMoments{
        .mean = mu,
        .m2   = d2.mean(),
        .m3   = (d2 * d).mean(),
        .m4   = d2.square().mean(),
    };
}

bool degenerate(double m2, double mu) noexcept {
    return m2 <= constants::VARIANCE_EPSILON * (1.0 + mu * mu);
}

}  // namespace

// ─── Cleaning ─────────────────────────────────────────────────────────────────

std::vector<double> finite_values(std::span<const double> values) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double v : values) {
        if (std::isfinite(v)) out.push_back(v);
    }
    return out;
}

CompactSeries compact(std::span<const double> values) {
    CompactSeries out;
    out.values.reserve(values.size());
    out.index.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (std::isfinite(values[i])) {
            out.values.push_back(values[i]);
            out.index.push_back(i);
        }
    }
    return out;
}

std::pair<std::vector<double>, std::vector<double>>
pairwise_complete(std::span<const double> x, std::span<const double> y) {
    std::vector<double> xs, ys;
    const std::size_t n = std::min(x.size(), y.size());
    xs.reserve(n);
    ys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (std::isfinite(x[i]) && std::isfinite(y[i])) {
            xs.push_back(x[i]);
            ys.push_back(y[i]);
        }
    }
    return {std::move(xs), std::move(ys)};
}

// ─── Moments ──────────────────────────────────────────────────────────────────

std::optional<double> mean(std::span<const double> values) noexcept {
    if (values.empty()) {
        return std::nullopt;
    }
    return as_vector(values).mean();
}

std::optional<double> stddev(std::span<const double> values, std::size_t ddof) noexcept {
    if (values.size() <= ddof) {
        return std::nullopt;
    }
    const auto v = as_vector(values);
    const double ss = (v.array() - v.mean()).square().sum();
    return std::sqrt(ss / static_cast<double>(values.size() - ddof));
}

std::optional<double> skewness(std::span<const double> values,
                               bool bias_correction) noexcept {
    if (values.size() < 3) {
        return std::nullopt;
    }
    const auto m = central_moments(values);
    if (degenerate(m.m2, m.mean)) {
        return std::nullopt;
    }

    const double g1 = m.m3 / std::pow(m.m2, 1.5);
    if (!bias_correction) {
        return g1;
    }
    const double n = static_cast<double>(values.size());
    return g1 * std::sqrt(n * (n - 1.0)) / (n - 2.0);
}

std::optional<double> kurtosis(std::span<const double> values,
                               bool bias_correction) noexcept {
    if (values.size() < 3) {
        return std::nullopt;
    }
    const auto m = central_moments(values);
    if (degenerate(m.m2, m.mean)) {
        return std::nullopt;
    }

    const double pearson_k = m.m4 / (m.m2 * m.m2);
    if (!bias_correction || values.size() < 4) {
        return pearson_k;
    }
    const double n  = static_cast<double>(values.size());
    const double g2 = pearson_k - 3.0;
    const double excess = ((n + 1.0) * g2 + 6.0) * (n - 1.0) / ((n - 2.0) * (n - 3.0));
    return excess + 3.0;
}

// ─── Correlation ──────────────────────────────────────────────────────────────

std::optional<double> pearson(std::span<const double> x,
                              std::span<const double> y,
                              std::size_t min_periods) noexcept {
    if (x.size() != y.size() || x.size() < std::max<std::size_t>(min_periods, 2)) {
        return std::nullopt;
    }
    const auto vx = as_vector(x);
    const auto vy = as_vector(y);
    const auto dx = vx.array() - vx.mean();
    const auto dy = vy.array() - vy.mean();

    const double sxx = dx.square().sum();
    const double syy = dy.square().sum();
    const double n   = static_cast<double>(x.size());
    if (degenerate(sxx / n, vx.mean()) || degenerate(syy / n, vy.mean())) {
        return std::nullopt;
    }

    const double r = (dx * dy).sum() / std::sqrt(sxx * syy);
    if (!std::isfinite(r)) {
        return std::nullopt;
    }
    // Rounding can push |r| a hair past 1.
    return std::clamp(r, -1.0, 1.0);
}

// ─── Transforms ───────────────────────────────────────────────────────────────

std::vector<double> diff(std::span<const double> values) {
    if (values.size() < 2) {
        return {};
    }
    const auto v = as_vector(values);
    const Eigen::Index n = v.size();
    std::vector<double> out(static_cast<std::size_t>(n - 1));
    Eigen::Map<Eigen::VectorXd>(out.data(), n - 1) = v.tail(n - 1) - v.head(n - 1);
    return out;
}

std::vector<double> rolling_mean(std::span<const double> values, std::size_t window) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> out(values.size(), nan);
    if (window == 0) {
        return out;
    }
    for (std::size_t i = window - 1; i < values.size(); ++i) {
        const auto w = values.subspan(i + 1 - window, window);
        bool complete = true;
        for (double v : w) {
            if (!std::isfinite(v)) {
                complete = false;
                break;
            }
        }
        if (complete) {
            out[i] = as_vector(w).mean();
        }
    }
    return out;
}

std::optional<double> quantile_sorted(std::span<const double> sorted, double q) noexcept {
    if (sorted.empty()) {
        return std::nullopt;
    }
    q = std::clamp(q, 0.0, 1.0);
    const double pos  = q * static_cast<double>(sorted.size() - 1);
    const auto   lo   = static_cast<std::size_t>(std::floor(pos));
    const auto   hi   = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

}  // namespace zonal::stats
