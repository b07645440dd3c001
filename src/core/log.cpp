/// @file src/core/log.cpp
/// @brief Process-wide log level and the stderr sink.

#include "mlbedge/log.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>

namespace mlbedge::log {

namespace {

std::atomic<Level> g_level{Level::Warn};

}  // namespace

void set_level(Level l) noexcept { g_level.store(l, std::memory_order_relaxed); }

Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return Level::Debug;
    if (name == "info")  return Level::Info;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off")   return Level::Off;
    return std::nullopt;
}

std::string_view to_string(Level l) noexcept {
    switch (l) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "unknown";
}

namespace detail {

void write(Level l, std::string_view message) {
    fmt::print(stderr, "[mlbedge] [{}] {}\n", to_string(l), message);
}

}  // namespace detail

}  // namespace mlbedge::log
