/// @file src/core/logging.cpp
/// @brief Lazily created stderr logger shared by the whole library.

#include "zonal/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace zonal::log {

namespace {

constexpr const char* LOGGER_NAME = "zonal";

std::shared_ptr<spdlog::logger> make_logger() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    const char* env = std::getenv("ZONAL_LOG_LEVEL");
    logger->set_level(env ? parse_level(env) : spdlog::level::warn);
    return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> get() {
    // Function-local static: initialisation is thread-safe.
    static std::shared_ptr<spdlog::logger> logger = make_logger();
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

spdlog::level::level_enum parse_level(std::string_view name) noexcept {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn")  return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return spdlog::level::warn;
}

}  // namespace zonal::log
