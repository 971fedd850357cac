/// @file tests/strategies/test_volatility.cpp
/// @brief Tests for VolatilityStrategy and true_range.

#include "zonal/volatility.hpp"
#include "zonal/errors.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace zonal;

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

static std::shared_ptr<const SampleTable>
price_table(const std::vector<double>& high,
            const std::vector<double>& low,
            const std::vector<double>& close,
            const std::optional<std::vector<double>>& atr = std::nullopt) {
    std::vector<double> ts(high.size());
    for (std::size_t i = 0; i < ts.size(); ++i) ts[i] = static_cast<double>(i);
    auto t = std::make_shared<SampleTable>(ts);
    t->add_column("high", high);
    t->add_column("low", low);
    t->add_column("close", close);
    if (atr) t->add_column("atr", *atr);
    return t;
}

static TableSlice whole(const std::shared_ptr<const SampleTable>& t) {
    return TableSlice(t, 0, t->size() - 1);
}

// ─── true_range ───────────────────────────────────────────────────────────────

TEST(TrueRange, UsesPreviousClose) {
    const std::vector<double> high{10, 15, 12}, low{8, 11, 9}, close{9, 14, 10};
    const auto tr = true_range(high, low, close);
    ASSERT_EQ(tr.size(), 3u);
    EXPECT_DOUBLE_EQ(tr[0], 2.0);  // no previous close
    EXPECT_DOUBLE_EQ(tr[1], 6.0);  // gap up from 9
    EXPECT_DOUBLE_EQ(tr[2], 5.0);  // low 9 against close 14
}

TEST(TrueRange, MissingPricesGiveNaN) {
    const std::vector<double> high{10, NaN, 12}, low{8, 9, 9}, close{9, NaN, 10};
    const auto tr = true_range(high, low, close);
    EXPECT_DOUBLE_EQ(tr[0], 2.0);
    EXPECT_TRUE(std::isnan(tr[1]));
    EXPECT_DOUBLE_EQ(tr[2], 3.0);  // previous close unknown
}

// ─── ATR column ───────────────────────────────────────────────────────────────

TEST(Volatility, AtrColumnIncreasing) {
    const auto t = price_table({11, 12, 13, 12, 14}, {9, 10, 11, 10, 12},
                               {10, 11, 12, 11, 13}, std::vector<double>{1, 1, 1, 2, 2});
    const auto m = VolatilityStrategy().calculate_volatility(whole(t));

    EXPECT_FALSE(m.atr_estimated);
    EXPECT_DOUBLE_EQ(m.avg_atr, 1.4);
    EXPECT_DOUBLE_EQ(m.atr_normalized_range, 5.0 / 1.4);
    EXPECT_DOUBLE_EQ(m.atr_change, 1.0);
    EXPECT_EQ(m.atr_trend, AtrTrend::Increasing);
    EXPECT_EQ(std::get<std::string>(m.strategy_params.at("atr_col")), "atr");
}

TEST(Volatility, AtrColumnDecreasingAndStable) {
    const std::vector<double> high{11, 12, 13, 12, 14}, low{9, 10, 11, 10, 12},
        close{10, 11, 12, 11, 13};

    const auto down = VolatilityStrategy().calculate_volatility(
        whole(price_table(high, low, close, std::vector<double>{2, 2, 2, 1, 1})));
    EXPECT_DOUBLE_EQ(down.atr_change, -0.5);
    EXPECT_EQ(down.atr_trend, AtrTrend::Decreasing);

    const auto flat = VolatilityStrategy().calculate_volatility(
        whole(price_table(high, low, close, std::vector<double>{1, 1.1, 1, 1, 1.05})));
    EXPECT_NEAR(flat.atr_change, 0.05, 1e-12);
    EXPECT_EQ(flat.atr_trend, AtrTrend::Stable);
}

TEST(Volatility, AtrEndsSkipMissingValues) {
    const auto t = price_table({11, 12, 13, 12, 14}, {9, 10, 11, 10, 12},
                               {10, 11, 12, 11, 13}, std::vector<double>{NaN, 2, 2, 1, NaN});
    const auto m = VolatilityStrategy().calculate_volatility(whole(t));
    EXPECT_DOUBLE_EQ(m.avg_atr, 5.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.atr_change, -0.5);
    EXPECT_EQ(m.atr_trend, AtrTrend::Decreasing);
}

// ─── Estimated ATR ────────────────────────────────────────────────────────────

TEST(Volatility, EstimatesFromTrueRangeWithoutAtrColumn) {
    // low fixed at 10, bar ranges {1,1,1,2,2,2}, close at mid-bar.
    const std::vector<double> r{1, 1, 1, 2, 2, 2};
    std::vector<double> high, low, close;
    for (double x : r) {
        high.push_back(10 + x);
        low.push_back(10);
        close.push_back(10 + x / 2);
    }
    const VolatilityStrategy vol({.trend_window = 2});
    const auto m = vol.calculate_volatility(whole(price_table(high, low, close)));

    EXPECT_TRUE(m.atr_estimated);
    EXPECT_DOUBLE_EQ(m.avg_atr, 1.5);
    EXPECT_DOUBLE_EQ(m.atr_normalized_range, 2.0 / 1.5);
    EXPECT_DOUBLE_EQ(m.atr_change, 1.0);
    EXPECT_EQ(m.atr_trend, AtrTrend::Increasing);
}

TEST(Volatility, OtherAtrColumnName) {
    const auto t = price_table({11, 12, 13}, {9, 10, 11}, {10, 11, 12},
                               std::vector<double>{5, 5, 5});
    const auto m = VolatilityStrategy({.atr_col = "atr_14"}).calculate_volatility(whole(t));
    EXPECT_TRUE(m.atr_estimated);
    EXPECT_DOUBLE_EQ(m.avg_atr, 2.0);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(Volatility, TooShortIsDataError) {
    const auto t = price_table({11, 12}, {9, 10}, {10, 11});
    EXPECT_THROW((void)VolatilityStrategy().calculate_volatility(whole(t)), DataError);
}

TEST(Volatility, MissingPriceColumnIsDataError) {
    auto t = std::make_shared<SampleTable>(std::vector<double>{0, 1, 2});
    t->add_column("low", {9, 10, 11});
    t->add_column("close", {10, 11, 12});
    try {
        (void)VolatilityStrategy().calculate_volatility(whole(t));
        FAIL() << "expected DataError";
    } catch (const DataError& e) {
        EXPECT_NE(std::string(e.what()).find("high"), std::string::npos);
    }
}

TEST(Volatility, RejectsBadConfig) {
    EXPECT_THROW(VolatilityStrategy({.trend_threshold = -0.1}), ConfigurationError);
    EXPECT_THROW(VolatilityStrategy({.trend_threshold = NaN}), ConfigurationError);
    EXPECT_THROW(VolatilityStrategy({.trend_window = 0}), ConfigurationError);
}
