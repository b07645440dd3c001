#pragma once

/// @file include/mlbedge/log.hpp
/// @brief Minimal leveled logger writing {fmt}-formatted lines to stderr.
///
/// The level is process-wide and is set once by the entry point.  Numeric
/// core components never log; orchestration code (adapter, backtest engine,
/// data loader, CLI) does.

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace mlbedge::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Off };

/// Set the minimum level that is written.  Defaults to `Level::Warn`.
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

/// Parse "debug" / "info" / "warn" / "error" / "off".
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(Level level) noexcept;

[[nodiscard]] inline bool enabled(Level l) noexcept {
    return l != Level::Off && l >= level();
}

namespace detail {
void write(Level level, std::string_view message);
}  // namespace detail

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug))
        detail::write(Level::Debug, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info))
        detail::write(Level::Info, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn))
        detail::write(Level::Warn, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Error))
        detail::write(Level::Error, fmt::format(f, std::forward<Args>(args)...));
}

}  // namespace mlbedge::log
