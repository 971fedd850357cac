/// @file tests/detection/test_detector_config.cpp
/// @brief Tests for DetectorConfig validation and variant dispatch.

#include "zonal/detection.hpp"
#include "zonal/errors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <variant>
#include <vector>

using namespace zonal;

TEST(DetectorConfig, StrategyNamesRoundTrip) {
    for (auto s : {DetectionStrategy::ZeroCrossing,
                   DetectionStrategy::ThresholdBand,
                   DetectionStrategy::LineCrossing}) {
        EXPECT_EQ(parse_detection_strategy(to_string(s)), s);
    }
    EXPECT_THROW((void)parse_detection_strategy("divergence"), ConfigurationError);
}

TEST(DetectorConfig, BuildsZeroCrossingByDefault) {
    DetectorConfig cfg;
    cfg.indicator_col = "osc";
    const auto det = make_detector(cfg);
    ASSERT_TRUE(std::holds_alternative<ZeroCrossingDetector>(det));
    EXPECT_EQ(strategy_of(det), DetectionStrategy::ZeroCrossing);
    EXPECT_EQ(std::get<ZeroCrossingDetector>(det).filter().min_zone_length,
              constants::DEFAULT_MIN_ZONE_LENGTH);
}

TEST(DetectorConfig, ThresholdBandNeedsBothThresholds) {
    DetectorConfig cfg{.strategy = DetectionStrategy::ThresholdBand, .indicator_col = "rsi"};
    cfg.upper_threshold = 70.0;
    EXPECT_THROW((void)make_detector(cfg), ConfigurationError);

    cfg.lower_threshold = 30.0;
    const auto det = make_detector(cfg);
    ASSERT_TRUE(std::holds_alternative<ThresholdBandDetector>(det));
    EXPECT_DOUBLE_EQ(std::get<ThresholdBandDetector>(det).upper_threshold(), 70.0);
}

TEST(DetectorConfig, LineCrossingDefaultsLine1ToIndicator) {
    DetectorConfig cfg{.strategy = DetectionStrategy::LineCrossing, .indicator_col = "macd"};
    EXPECT_THROW((void)make_detector(cfg), ConfigurationError);

    cfg.line2_col = "macd_signal";
    const auto det = make_detector(cfg);
    ASSERT_TRUE(std::holds_alternative<LineCrossingDetector>(det));
    EXPECT_EQ(std::get<LineCrossingDetector>(det).line1_col(), "macd");
    EXPECT_EQ(std::get<LineCrossingDetector>(det).line2_col(), "macd_signal");
}

TEST(DetectorConfig, FilterFieldsArePassedThrough) {
    DetectorConfig cfg;
    cfg.indicator_col   = "osc";
    cfg.min_zone_length = 5;
    cfg.boundary_policy = BoundaryPolicy::Drop;
    cfg.zone_types      = {ZoneType::Bullish};
    const auto det = make_detector(cfg);
    const auto& f = std::get<ZeroCrossingDetector>(det).filter();
    EXPECT_EQ(f.min_zone_length, 5u);
    EXPECT_EQ(f.boundary_policy, BoundaryPolicy::Drop);
    EXPECT_EQ(f.zone_types, (std::vector<ZoneType>{ZoneType::Bullish}));
}

TEST(DetectorConfig, InvalidMinLength) {
    DetectorConfig cfg;
    cfg.indicator_col   = "osc";
    cfg.min_zone_length = 0;
    EXPECT_THROW((void)make_detector(cfg), ConfigurationError);
}

TEST(DetectorConfig, DetectZonesDispatches) {
    auto t = std::make_shared<SampleTable>(std::vector<double>{0, 1, 2, 3, 4, 5});
    t->add_column("osc", {1, 1, 1, -1, -1, -1});

    DetectorConfig cfg;
    cfg.indicator_col = "osc";
    const auto zones = detect_zones(make_detector(cfg), t);
    ASSERT_EQ(zones.size(), 2u);
    EXPECT_EQ(zones[1].type(), ZoneType::Bearish);
}

TEST(DetectorConfig, DetectZonesFromConfig) {
    auto t = std::make_shared<SampleTable>(std::vector<double>{0, 1, 2, 3, 4, 5});
    t->add_column("rsi", {50, 75, 80, 50, 20, 25});

    DetectorConfig cfg;
    cfg.strategy        = DetectionStrategy::ThresholdBand;
    cfg.indicator_col   = "rsi";
    cfg.upper_threshold = 70.0;
    cfg.lower_threshold = 30.0;
    const auto zones = detect_zones(cfg, t);
    ASSERT_EQ(zones.size(), 2u);
    EXPECT_EQ(zones[0].type(), ZoneType::Bullish);
    EXPECT_EQ(zones[0].start_idx(), 1u);
    EXPECT_EQ(zones[1].type(), ZoneType::Bearish);
    EXPECT_EQ(zones[1].end_idx(), 5u);

    cfg.upper_threshold.reset();
    EXPECT_THROW((void)detect_zones(cfg, t), ConfigurationError);
}
