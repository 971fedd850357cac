/// @file tests/detection/test_line_crossing.cpp
/// @brief Tests for LineCrossingDetector.

#include "zonal/detection.hpp"
#include "zonal/errors.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace zonal;

static std::shared_ptr<const SampleTable> macd_table(const std::vector<double>& macd,
                                                     const std::vector<double>& signal) {
    std::vector<double> ts(macd.size());
    for (std::size_t i = 0; i < ts.size(); ++i) ts[i] = static_cast<double>(i);
    auto t = std::make_shared<SampleTable>(ts);
    t->add_column("close", std::vector<double>(macd.size(), 100.0));
    t->add_column("macd", macd);
    t->add_column("macd_signal", signal);
    return t;
}

TEST(LineCrossing, ZonesFollowSignOfDifference) {
    const std::vector<double> macd  {1, 2, 3, 2, 0, -1, -2, -1, 1, 2};
    const std::vector<double> signal{0, 1, 2, 2, 1,  0, -1, -1, 0, 0};
    // diff:                         1, 1, 1, 0,-1, -1, -1,  0, 1, 2
    const auto zones = LineCrossingDetector("macd", "macd_signal").detect(macd_table(macd, signal));

    ASSERT_EQ(zones.size(), 3u);
    EXPECT_EQ(zones[0].type(), ZoneType::Bullish);
    EXPECT_EQ(zones[0].end_idx(), 3u);  // equal lines count as bullish
    EXPECT_EQ(zones[1].type(), ZoneType::Bearish);
    EXPECT_EQ(zones[1].start_idx(), 4u);
    EXPECT_EQ(zones[1].end_idx(), 6u);
    EXPECT_EQ(zones[2].type(), ZoneType::Bullish);
    EXPECT_EQ(zones[2].start_idx(), 7u);
}

TEST(LineCrossing, ContextCarriesSignalLine) {
    const std::vector<double> macd  {1, 1, -1, -1};
    const std::vector<double> signal{0, 0, 0, 0};
    const auto zones = LineCrossingDetector("macd", "macd_signal").detect(macd_table(macd, signal));
    ASSERT_EQ(zones.size(), 2u);

    EXPECT_EQ(zones[0].primary_indicator_column(), "macd");
    EXPECT_EQ(zones[0].signal_line_column(), "macd_signal");
    EXPECT_EQ(zones[0].indicator_context().detection_strategy, "line_crossing");
    EXPECT_EQ(std::get<std::string>(
                  zones[0].indicator_context().detection_rules.at("boundary_policy")),
              "apply_min_length");
}

TEST(LineCrossing, NaNInEitherLineIsMissing) {
    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> macd  {1, 1, NaN, 1, -1, -1};
    const std::vector<double> signal{0, 0, 0, NaN, 0, 0};
    const auto zones = LineCrossingDetector("macd", "macd_signal").detect(macd_table(macd, signal));
    ASSERT_EQ(zones.size(), 2u);
    EXPECT_EQ(zones[0].end_idx(), 3u);
    EXPECT_EQ(zones[1].start_idx(), 4u);
}

TEST(LineCrossing, InvalidColumnPair) {
    EXPECT_THROW(LineCrossingDetector("macd", "macd"), ConfigurationError);
    EXPECT_THROW(LineCrossingDetector("", "macd_signal"), ConfigurationError);
    EXPECT_THROW(LineCrossingDetector("macd", ""), ConfigurationError);
}

TEST(LineCrossing, MissingColumnsAreListed) {
    const auto t = macd_table({1, -1}, {0, 0});
    try {
        (void)LineCrossingDetector("fast", "slow").detect(t);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("fast, slow"), std::string::npos);
        EXPECT_NE(msg.find("macd_signal"), std::string::npos);
    }
}
