/// @file tests/stats/test_peak_finder.cpp
/// @brief Tests for plateau-aware peak finding with distance/prominence filters.

#include "stats/peak_finder.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace zonal::stats;

using Indices = std::vector<std::size_t>;

TEST(PeakFinder, SimpleLocalMaxima) {
    const std::vector<double> x{0, 1, 0, 2, 0, 3, 0};
    EXPECT_EQ(find_peaks(x, {}), (Indices{1, 3, 5}));
}

TEST(PeakFinder, EdgesAreNeverPeaks) {
    const std::vector<double> x{5, 1, 0, 1, 5};
    EXPECT_TRUE(find_peaks(x, {}).empty());
}

TEST(PeakFinder, PlateauReportsMidpoint) {
    // Plateau over [2, 5] → midpoint (2 + 5) / 2 = 3.
    const std::vector<double> x{0, 1, 4, 4, 4, 4, 1, 0};
    EXPECT_EQ(find_peaks(x, {}), (Indices{3}));
}

TEST(PeakFinder, PlateauThatRisesAgainIsNotAPeak) {
    const std::vector<double> x{0, 2, 2, 3, 0};
    EXPECT_EQ(find_peaks(x, {}), (Indices{3}));
}

TEST(PeakFinder, DistanceKeepsHigherPeak) {
    const std::vector<double> x{0, 1, 0, 5, 0, 2, 0, 0, 0, 0, 3, 0};
    const PeakOptions opts{.min_distance = 3};
    // 3 (height 5) suppresses 1 and 5; 10 is 7 away and survives.
    EXPECT_EQ(find_peaks(x, opts), (Indices{3, 10}));
}

TEST(PeakFinder, ProminenceFiltersRipples) {
    // Big peak at 2, ripple at 5 rising only 0.2 above its surroundings.
    const std::vector<double> x{0, 5, 10, 5, 1, 1.2, 1, 0};
    EXPECT_NEAR(peak_prominence(x, 5), 0.2, 1e-12);
    EXPECT_NEAR(peak_prominence(x, 2), 10.0, 1e-12);

    const PeakOptions opts{.min_prominence = 1.0};
    EXPECT_EQ(find_peaks(x, opts), (Indices{2}));
}

TEST(PeakFinder, MinHeight) {
    const std::vector<double> x{0, 1, 0, 3, 0, 2, 0};
    const PeakOptions opts{.min_height = 1.5};
    EXPECT_EQ(find_peaks(x, opts), (Indices{3, 5}));
}

TEST(PeakFinder, TroughsAreNegatedPeaks) {
    const std::vector<double> x{5, 3, 5, 1, 5, 4, 5};
    EXPECT_EQ(find_troughs(x, {}), (Indices{1, 3, 5}));
    EXPECT_EQ(find_troughs(x, {.min_prominence = 1.5}), (Indices{1, 3}));
}

TEST(PeakFinder, ShortSeriesHaveNoPeaks) {
    EXPECT_TRUE(find_peaks(std::vector<double>{}, {}).empty());
    EXPECT_TRUE(find_peaks(std::vector<double>{1, 2}, {}).empty());
}
