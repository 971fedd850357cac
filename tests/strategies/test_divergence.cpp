/// @file tests/strategies/test_divergence.cpp
/// @brief Tests for DivergenceStrategy on hand-built swing patterns.

#include "zonal/divergence.hpp"
#include "zonal/errors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace zonal;

/// One V-shaped swing: `price` at `center`, half-way values either side.
struct Swing {
    std::size_t center;
    double      price;
    double      indicator;
};

/// Build a table of `n` rows where `high` carries the `peaks` swings and
/// `low` carries the `troughs` swings, with `osc` following both.
static TableSlice swing_slice(std::size_t n,
                              const std::vector<Swing>& peaks,
                              const std::vector<Swing>& troughs) {
    constexpr double HIGH_BASE = 112.0;
    constexpr double LOW_BASE  = 108.0;

    std::vector<double> ts(n), high(n, HIGH_BASE), low(n, LOW_BASE), osc(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) ts[i] = static_cast<double>(i);

    const auto place = [&](std::vector<double>& price, double base, const Swing& s) {
        price[s.center]     = s.price;
        price[s.center - 1] = price[s.center + 1] = (base + s.price) / 2.0;
        osc[s.center]       = s.indicator;
        osc[s.center - 1]   = osc[s.center + 1] = s.indicator / 2.0;
    };
    for (const auto& s : peaks)   place(high, HIGH_BASE, s);
    for (const auto& s : troughs) place(low, LOW_BASE, s);

    std::vector<double> close(n);
    for (std::size_t i = 0; i < n; ++i) close[i] = (high[i] + low[i]) / 2.0;

    auto t = std::make_shared<SampleTable>(ts);
    t->add_column("high", high);
    t->add_column("low", low);
    t->add_column("close", close);
    t->add_column("osc", osc);
    t->add_column("osc_signal", std::vector<double>(n, 0.0));
    return TableSlice(t, 0, n - 1);
}

// ─── Detection ────────────────────────────────────────────────────────────────

TEST(Divergence, LowerLowWithHigherIndicatorLowIsBullish) {
    // Lows 100 → 95 → 90; indicator lows -2 → -3 → -1.
    // Only the second pair diverges: strength |(-1 - -3) / -3| = 2/3.
    const auto slice = swing_slice(45, {}, {{10, 100, -2}, {22, 95, -3}, {34, 90, -1}});
    const auto m = DivergenceStrategy().calculate_divergence(slice, "osc");

    EXPECT_EQ(m.divergence_count, 1u);
    EXPECT_EQ(m.bullish_count, 1u);
    EXPECT_EQ(m.bearish_count, 0u);
    EXPECT_EQ(m.dominant_type, DivergenceType::Bullish);
    EXPECT_EQ(m.direction, DivergenceDirection::Bullish);
    EXPECT_NEAR(m.avg_strength, 2.0 / 3.0, 1e-12);
}

TEST(Divergence, HigherHighWithLowerIndicatorHighIsBearish) {
    const auto slice = swing_slice(45, {{10, 120, 2}, {22, 125, 3}, {34, 130, 1}}, {});
    const auto events = DivergenceStrategy().find_divergences(slice, "osc");

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, DivergenceType::Bearish);
    EXPECT_EQ(events[0].price_prev, 22u);
    EXPECT_EQ(events[0].price_cur, 34u);
    EXPECT_EQ(events[0].indicator_prev, 22u);
    EXPECT_EQ(events[0].indicator_cur, 34u);
    EXPECT_NEAR(events[0].strength, 2.0 / 3.0, 1e-12);
}

TEST(Divergence, EqualCountsAreMixed) {
    const auto slice = swing_slice(70,
                                   {{10, 120, 2}, {22, 125, 3}, {34, 130, 1}},
                                   {{40, 100, -2}, {52, 95, -3}, {64, 90, -1}});
    const auto m = DivergenceStrategy().calculate_divergence(slice, "osc");

    EXPECT_EQ(m.divergence_count, 2u);
    EXPECT_EQ(m.bullish_count, 1u);
    EXPECT_EQ(m.bearish_count, 1u);
    EXPECT_EQ(m.dominant_type, DivergenceType::None);
    EXPECT_EQ(m.direction, DivergenceDirection::Mixed);
    EXPECT_NEAR(m.avg_strength, 2.0 / 3.0, 1e-12);
}

TEST(Divergence, ConfirmingSwingsAreNotDivergence) {
    // Price and indicator make lower lows together.
    const auto slice = swing_slice(45, {}, {{10, 100, -1}, {22, 95, -2}, {34, 90, -3}});
    const auto m = DivergenceStrategy().calculate_divergence(slice, "osc");
    EXPECT_EQ(m.divergence_count, 0u);
    EXPECT_EQ(m.dominant_type, DivergenceType::None);
    EXPECT_EQ(m.direction, DivergenceDirection::None);
    EXPECT_DOUBLE_EQ(m.avg_strength, 0.0);
}

TEST(Divergence, StrengthThresholdFiltersWeakPairs) {
    const auto slice = swing_slice(45, {}, {{10, 100, -2}, {22, 95, -3}, {34, 90, -1}});
    const auto m = DivergenceStrategy({.min_divergence_strength = 0.9})
                       .calculate_divergence(slice, "osc");
    EXPECT_EQ(m.divergence_count, 0u);
}

TEST(Divergence, MatchDistanceLimitsPairing) {
    // With a zero window only exact-index indicator extrema pair up, which
    // still holds for aligned swings.
    const auto slice = swing_slice(45, {}, {{10, 100, -2}, {22, 95, -3}, {34, 90, -1}});
    const auto m = DivergenceStrategy({.max_match_distance = 0})
                       .calculate_divergence(slice, "osc");
    EXPECT_EQ(m.bullish_count, 1u);
}

// ─── Edge cases ───────────────────────────────────────────────────────────────

TEST(Divergence, ShortZoneIsEmptyRecordWithParams) {
    const auto slice = swing_slice(9, {}, {});
    const auto m = DivergenceStrategy().calculate_divergence(slice, "osc", std::string("osc_signal"));
    EXPECT_EQ(m.divergence_count, 0u);
    EXPECT_EQ(m.direction, DivergenceDirection::None);
    EXPECT_EQ(std::get<std::string>(m.strategy_params.at("indicator_col")), "osc");
    EXPECT_EQ(std::get<std::string>(m.strategy_params.at("indicator_line_col")), "osc_signal");
    EXPECT_EQ(std::get<std::int64_t>(m.strategy_params.at("min_peak_distance")), 5);
}

TEST(Divergence, MissingColumnsAreListed) {
    const auto slice = swing_slice(20, {}, {});
    try {
        (void)DivergenceStrategy().calculate_divergence(slice, "rsi", std::string("rsi_signal"));
        FAIL() << "expected DataError";
    } catch (const DataError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("rsi, rsi_signal"), std::string::npos);
    }
}

TEST(Divergence, InvalidConfig) {
    EXPECT_THROW(DivergenceStrategy({.min_peak_distance = 0}), ConfigurationError);
    EXPECT_THROW(DivergenceStrategy({.prominence_factor = -1.0}), ConfigurationError);
    EXPECT_THROW(DivergenceStrategy({.min_divergence_strength = -0.1}), ConfigurationError);
}
