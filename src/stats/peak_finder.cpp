/// @file src/stats/peak_finder.cpp
/// @brief Plateau-aware local maxima, distance and prominence filtering.

#include "peak_finder.hpp"

#include <algorithm>
#include <numeric>

namespace zonal::stats {

namespace {

std::vector<std::size_t> local_maxima(std::span<const double> x) {
    std::vector<std::size_t> peaks;
    const std::size_t n = x.size();
    if (n < 3) {
        return peaks;
    }

    const std::size_t i_max = n - 1;
    std::size_t i = 1;
    while (i < i_max) {
        if (x[i - 1] < x[i]) {
            std::size_t ahead = i + 1;
            while (ahead < i_max && x[ahead] == x[i]) {
                ++ahead;
            }
            if (x[ahead] < x[i]) {
                // Plateau [i, ahead - 1] → midpoint.
                peaks.push_back((i + ahead - 1) / 2);
                i = ahead;
            }
        }
        ++i;
    }
    return peaks;
}

std::vector<std::size_t> select_by_distance(std::span<const double> x,
                                            const std::vector<std::size_t>& peaks,
                                            std::size_t distance) {
    if (distance <= 1 || peaks.size() < 2) {
        return peaks;
    }

    const std::size_t count = peaks.size();
    std::vector<std::size_t> order(count);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return x[peaks[a]] < x[peaks[b]];
    });

    std::vector<bool> keep(count, true);
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const std::size_t j = *it;
        if (!keep[j]) {
            continue;
        }
        for (std::size_t k = j; k-- > 0 && peaks[j] - peaks[k] < distance;) {
            keep[k] = false;
        }
        for (std::size_t k = j + 1; k < count && peaks[k] - peaks[j] < distance; ++k) {
            keep[k] = false;
        }
    }

    std::vector<std::size_t> kept;
    kept.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        if (keep[k]) kept.push_back(peaks[k]);
    }
    return kept;
}

}  // namespace

double peak_prominence(std::span<const double> x, std::size_t peak) noexcept {
    const double height = x[peak];

    double left_min = height;
    for (std::size_t i = peak + 1; i-- > 0 && x[i] <= height;) {
        left_min = std::min(left_min, x[i]);
    }

    double right_min = height;
    for (std::size_t i = peak; i < x.size() && x[i] <= height; ++i) {
        right_min = std::min(right_min, x[i]);
    }

    return height - std::max(left_min, right_min);
}

std::vector<std::size_t> find_peaks(std::span<const double> x, const PeakOptions& options) {
    auto maxima = local_maxima(x);
    if (options.min_height) {
        std::erase_if(maxima, [&](std::size_t p) { return x[p] < *options.min_height; });
    }
    auto peaks = select_by_distance(x, maxima, options.min_distance);

    if (options.min_prominence > 0.0) {
        std::erase_if(peaks, [&](std::size_t p) {
            return peak_prominence(x, p) < options.min_prominence;
        });
    }
    return peaks;
}

std::vector<std::size_t> find_troughs(std::span<const double> x, const PeakOptions& options) {
    std::vector<double> negated(x.size());
    std::transform(x.begin(), x.end(), negated.begin(), [](double v) { return -v; });
    return find_peaks(negated, options);
}

}  // namespace zonal::stats
