#pragma once

/// @file src/analyzer/batch.hpp
/// @brief Per-series failure capture used by ZoneAnalyzer::run_batch.

#include "zonal/analyzer.hpp"
#include "zonal/errors.hpp"
#include "zonal/logging.hpp"

#include <exception>

namespace zonal::batch {

/// Run one series and store its analysis or its error in `out`, so one
/// failed series never discards the rest of a batch.
template <typename Fn>
void capture(BatchResult& out, Fn&& run_series) {
    try {
        out.analysis = run_series();
    } catch (const Error& e) {
        out.error = e.what();
    } catch (const std::exception& e) {
        log::get()->error("series failed outside the analysis pipeline: {}", e.what());
        out.error = e.what();
    }
}

}  // namespace zonal::batch
