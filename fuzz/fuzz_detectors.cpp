/**
 * @file  fuzz_detectors.cpp
 * @brief libFuzzer target for zone detection and feature extraction
 *
 * Build:
 *   cmake -DZONAL_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_detectors
 *
 * Run for 60 seconds:
 *   ./fuzz_detectors -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Detection either throws zonal::Error or returns zones that are
 *      sorted, disjoint, numbered 0..k-1 and inside the table.
 *   3. Feature extraction never throws; every bag mirrors its zone's id,
 *      type and duration.
 *   4. Every present correlation lies in [-1, 1].
 *
 * Fuzzer strategy:
 *   Byte 0 selects the detector and its boundary policy, byte 1 the minimum
 *   zone length. The rest is reinterpreted as raw IEEE-754 doubles, so NaN,
 *   ±inf, denormals and huge magnitudes all reach the detectors. Doubles are
 *   dealt round-robin to osc, signal, close and volume; high/low are derived
 *   from close.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "zonal/detection.hpp"
#include "zonal/errors.hpp"
#include "zonal/features.hpp"

using namespace zonal;

namespace {

constexpr std::size_t HEADER  = 2;
constexpr std::size_t COLUMNS = 4;

bool in_unit_range(const std::optional<double>& r) {
    return !r || (*r >= -1.0 && *r <= 1.0);
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < HEADER + COLUMNS * sizeof(double)) {
        return 0;
    }

    const uint8_t selector = data[0];
    const std::size_t min_len = 1 + data[1] % 8;

    const std::size_t rows = (size - HEADER) / (COLUMNS * sizeof(double));
    std::vector<double> ts(rows), osc(rows), signal(rows), close(rows), volume(rows),
        high(rows), low(rows);
    const uint8_t* p = data + HEADER;
    for (std::size_t i = 0; i < rows; ++i) {
        std::memcpy(&osc[i], p, sizeof(double));    p += sizeof(double);
        std::memcpy(&signal[i], p, sizeof(double)); p += sizeof(double);
        std::memcpy(&close[i], p, sizeof(double));  p += sizeof(double);
        std::memcpy(&volume[i], p, sizeof(double)); p += sizeof(double);
        ts[i]   = static_cast<double>(i);
        high[i] = close[i] + 1.0;
        low[i]  = close[i] - 1.0;
    }

    auto table = std::make_shared<SampleTable>(ts);
    table->add_column("high", high);
    table->add_column("low", low);
    table->add_column("close", close);
    table->add_column("volume", volume);
    table->add_column("osc", osc);
    table->add_column("signal", signal);

    const ZoneFilter filter{
        .min_zone_length = min_len,
        .boundary_policy = static_cast<BoundaryPolicy>((selector >> 2) % 3),
        .zone_types      = {},
    };

    std::vector<Zone> zones;
    try {
        switch (selector % 3) {
            case 0:
                zones = ZeroCrossingDetector("osc", std::nullopt, filter).detect(table);
                break;
            case 1:
                zones = ThresholdBandDetector("osc", 1.0, -1.0, (selector & 0x80) != 0, filter)
                            .detect(table);
                break;
            default:
                zones = LineCrossingDetector("osc", "signal", filter).detect(table);
                break;
        }
    } catch (const Error&) {
        return 0;
    }

    // Invariant 2: structure
    for (std::size_t k = 0; k < zones.size(); ++k) {
        assert(zones[k].id() == static_cast<int>(k));
        assert(zones[k].start_idx() <= zones[k].end_idx());
        assert(zones[k].end_idx() < rows);
        if (k > 0) {
            assert(zones[k].start_idx() > zones[k - 1].end_idx());
        }
    }

    // Invariants 3 and 4: extraction is total
    ExtractorConfig cfg;
    cfg.max_workers = 1;
    const ZoneFeatureExtractor extractor(cfg);
    for (const auto& z : zones) {
        const auto f = extractor.extract(z);
        assert(f.zone_id == z.id());
        assert(f.type == z.type());
        assert(f.duration == z.duration());
        if (f.volume) {
            assert(in_unit_range(f.volume->volume_indicator_corr));
        }
        if (f.price) {
            assert(in_unit_range(f.price->price_indicator_corr));
        }
    }

    return 0;
}
