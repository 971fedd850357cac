/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end tests for the full zonal pipeline.
///
/// These tests exercise the complete path:
///   OHLCV + indicator columns → ZoneDetector → ZoneFeatureExtractor →
///   ZoneSummary, for one series (`run`) and for batches (`run_batch`).

#include "zonal/analyzer.hpp"
#include "zonal/errors.hpp"
#include "analyzer/batch.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <numbers>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

using namespace zonal;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

/// `n` bars of a trending cycle with `cycles` full oscillations. The table
/// carries OHLCV plus `osc` (a leading oscillator), `rsi` (0..100) and
/// `macd` / `macd_signal`.
std::shared_ptr<const SampleTable> make_series(std::size_t n,
                                               double cycles,
                                               double drift = 0.02) {
    std::vector<OHLCV> bars;
    bars.reserve(n);
    std::vector<double> osc(n), rsi(n), macd(n), signal(n);

    for (std::size_t i = 0; i < n; ++i) {
        const double x  = static_cast<double>(i);
        const double ph = 2.0 * std::numbers::pi * cycles * x / static_cast<double>(n);
        const double px = 100.0 + drift * x + 4.0 * std::sin(ph - 0.25);
        bars.push_back(OHLCV{
            .timestamp = 1'600'000'000.0 + 3600.0 * x,
            .open      = px - 0.1,
            .high      = px + 0.6 + 0.2 * std::sin(1.3 * x),
            .low       = px - 0.6 - 0.2 * std::cos(1.7 * x),
            .close     = px,
            .volume    = 5'000.0 + 1'500.0 * std::cos(ph) + 300.0 * std::sin(0.9 * x),
        });
        osc[i]    = std::sin(ph) + 0.08 * std::sin(4.3 * x);
        rsi[i]    = 50.0 + 35.0 * std::sin(ph);
        macd[i]   = std::sin(ph);
        signal[i] = 0.8 * std::sin(ph - 0.15);
    }

    auto t = std::make_shared<SampleTable>(SampleTable::from_bars(bars));
    t->add_column("osc", osc);
    t->add_column("rsi", rsi);
    t->add_column("macd", macd);
    t->add_column("macd_signal", signal);
    return t;
}

AnalyzerConfig zero_crossing_config() {
    AnalyzerConfig cfg;
    cfg.detector.strategy      = DetectionStrategy::ZeroCrossing;
    cfg.detector.indicator_col = "osc";
    cfg.extractor.max_workers  = 2;
    return cfg;
}

}  // namespace

// ─── Single series ────────────────────────────────────────────────────────────

TEST(Pipeline, ZeroCrossingEndToEnd) {
    const auto table = make_series(600, 6.0);
    const auto result = ZoneAnalyzer(zero_crossing_config()).run(table);

    ASSERT_GE(result.zones.size(), 8u);
    EXPECT_EQ(result.summary.total_zones, result.zones.size());
    EXPECT_EQ(result.summary.count(ZoneType::Bullish) + result.summary.count(ZoneType::Bearish),
              result.zones.size());

    for (std::size_t k = 0; k < result.zones.size(); ++k) {
        const auto& z = result.zones[k];
        EXPECT_EQ(z.id(), static_cast<int>(k));
        ASSERT_TRUE(z.has_features()) << "zone " << k;

        const auto& f = *z.features();
        EXPECT_EQ(f.zone_id, z.id());
        EXPECT_EQ(f.indicator_column, "osc");
        EXPECT_FALSE(f.used_fallback);
        EXPECT_TRUE(f.price.has_value());
        EXPECT_TRUE(f.shape.has_value());
        EXPECT_TRUE(f.divergence.has_value());
        EXPECT_TRUE(f.volume.has_value());
        if (k > 0) {
            EXPECT_GT(z.start_idx(), result.zones[k - 1].end_idx());
        }
    }
    EXPECT_EQ(result.summary.price_return.count, result.zones.size());
}

TEST(Pipeline, BullishZonesLeadRisingPrice) {
    // The oscillator leads close by a quarter radian, so most bullish zones
    // should end above where they started.
    const auto result = ZoneAnalyzer(zero_crossing_config()).run(make_series(600, 6.0, 0.0));

    int bullish = 0;
    int rising  = 0;
    for (const auto& z : result.zones) {
        if (z.type() != ZoneType::Bullish) continue;
        ++bullish;
        if (*z.features()->price->price_return > 0.0) ++rising;
    }
    ASSERT_GT(bullish, 0);
    EXPECT_GE(rising * 2, bullish);
}

TEST(Pipeline, ThresholdBandEndToEnd) {
    AnalyzerConfig cfg;
    cfg.detector.strategy        = DetectionStrategy::ThresholdBand;
    cfg.detector.indicator_col   = "rsi";
    cfg.detector.upper_threshold = 70.0;
    cfg.detector.lower_threshold = 30.0;

    const auto result = ZoneAnalyzer(cfg).run(make_series(500, 5.0));
    ASSERT_FALSE(result.zones.empty());
    for (const auto& z : result.zones) {
        const auto rsi = z.data().column("rsi");
        for (double v : rsi) {
            if (z.type() == ZoneType::Bullish) EXPECT_GT(v, 70.0);
            if (z.type() == ZoneType::Bearish) EXPECT_LT(v, 30.0);
        }
        EXPECT_EQ(z.features()->indicator_column, "rsi");
    }
}

TEST(Pipeline, LineCrossingForwardsSignalLine) {
    AnalyzerConfig cfg;
    cfg.detector.strategy      = DetectionStrategy::LineCrossing;
    cfg.detector.indicator_col = "macd";
    cfg.detector.line2_col     = "macd_signal";

    const auto result = ZoneAnalyzer(cfg).run(make_series(400, 4.0));
    ASSERT_FALSE(result.zones.empty());
    for (const auto& z : result.zones) {
        EXPECT_EQ(z.primary_indicator_column(), "macd");
        EXPECT_EQ(z.features()->signal_line, "macd_signal");
    }
}

TEST(Pipeline, FeaturesCanBeSkipped) {
    auto cfg = zero_crossing_config();
    cfg.extract_features = false;
    const auto result = ZoneAnalyzer(cfg).run(make_series(300, 3.0));
    ASSERT_FALSE(result.zones.empty());
    for (const auto& z : result.zones) EXPECT_FALSE(z.has_features());
    EXPECT_EQ(result.summary.price_return.count, 0u);
}

TEST(Pipeline, RunIsDeterministic) {
    const auto table = make_series(400, 4.0);
    const ZoneAnalyzer analyzer(zero_crossing_config());
    const auto a = analyzer.run(table);
    const auto b = analyzer.run(table);

    ASSERT_EQ(a.zones.size(), b.zones.size());
    for (std::size_t k = 0; k < a.zones.size(); ++k) {
        EXPECT_EQ(a.zones[k].start_idx(), b.zones[k].start_idx());
        EXPECT_EQ(*a.zones[k].features(), *b.zones[k].features());
    }
}

TEST(Pipeline, DetectionErrorsPropagateFromRun) {
    AnalyzerConfig cfg = zero_crossing_config();
    cfg.detector.indicator_col = "stoch";
    EXPECT_THROW((void)ZoneAnalyzer(cfg).run(make_series(50, 1.0)), ConfigurationError);
}

TEST(Pipeline, InvalidConfigFailsAtConstruction) {
    AnalyzerConfig cfg;
    cfg.detector.strategy      = DetectionStrategy::ThresholdBand;
    cfg.detector.indicator_col = "rsi";
    EXPECT_THROW(ZoneAnalyzer{cfg}, ConfigurationError);
}

// ─── Batches ──────────────────────────────────────────────────────────────────

TEST(Pipeline, BatchCapturesErrorsPerSeries) {
    auto broken = std::make_shared<SampleTable>(std::vector<double>{0, 1, 2});
    broken->add_column("close", {1, 2, 3});  // no `osc`

    const std::vector<std::shared_ptr<const SampleTable>> tables{
        make_series(300, 3.0),
        broken,
        make_series(200, 2.0),
    };

    auto cfg = zero_crossing_config();
    cfg.max_parallel_series = 3;
    const auto results = ZoneAnalyzer(cfg).run_batch(tables);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_FALSE(results[1].ok());
    ASSERT_TRUE(results[1].error.has_value());
    EXPECT_NE(results[1].error->find("osc"), std::string::npos);
    EXPECT_TRUE(results[2].ok());
    EXPECT_FALSE(results[0].analysis->zones.empty());
}

TEST(Pipeline, BatchCaptureRecordsNonLibraryFailures) {
    BatchResult failed;
    batch::capture(failed, []() -> ZoneAnalysis {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "no thread");
    });
    EXPECT_FALSE(failed.ok());
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_NE(failed.error->find("no thread"), std::string::npos);

    BatchResult data_error;
    batch::capture(data_error, []() -> ZoneAnalysis { throw DataError("empty table"); });
    EXPECT_EQ(data_error.error.value_or(""), "empty table");

    BatchResult fine;
    batch::capture(fine, [] { return ZoneAnalysis{}; });
    EXPECT_TRUE(fine.ok());
    EXPECT_FALSE(fine.error.has_value());
}

TEST(Pipeline, BatchMatchesIndividualRuns) {
    const std::vector<std::shared_ptr<const SampleTable>> tables{
        make_series(300, 3.0), make_series(250, 5.0), make_series(400, 2.0),
    };
    const ZoneAnalyzer analyzer(zero_crossing_config());
    const auto batch = analyzer.run_batch(tables);

    for (std::size_t s = 0; s < tables.size(); ++s) {
        ASSERT_TRUE(batch[s].ok());
        const auto single = analyzer.run(tables[s]);
        ASSERT_EQ(batch[s].analysis->zones.size(), single.zones.size());
        for (std::size_t k = 0; k < single.zones.size(); ++k) {
            EXPECT_EQ(*batch[s].analysis->zones[k].features(), *single.zones[k].features());
        }
    }
}

TEST(Pipeline, StoppedBatchLeavesSeriesUnstarted) {
    const std::vector<std::shared_ptr<const SampleTable>> tables{
        make_series(100, 1.0), make_series(100, 1.0),
    };
    std::stop_source source;
    source.request_stop();

    const auto results = ZoneAnalyzer(zero_crossing_config()).run_batch(tables, source.get_token());
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        EXPECT_FALSE(r.analysis.has_value());
        EXPECT_FALSE(r.error.has_value());
    }
}
