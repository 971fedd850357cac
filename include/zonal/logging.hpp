#pragma once

/// @file include/zonal/logging.hpp
/// @brief Library logger.
///
/// All library code logs through one spdlog logger named "zonal", writing to
/// stderr. The initial level comes from the `ZONAL_LOG_LEVEL` environment
/// variable (trace, debug, info, warn, error, off) and defaults to `warn`.

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace zonal::log {

/// The shared library logger. Created on first use; thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Change the library log level at runtime.
void set_level(spdlog::level::level_enum level);

/// Parse a level name; unknown names map to `warn`.
[[nodiscard]] spdlog::level::level_enum parse_level(std::string_view name) noexcept;

}  // namespace zonal::log
