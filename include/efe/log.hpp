#pragma once

/// @file include/efe/log.hpp
/// @brief Minimal levelled logging on top of {fmt}.
///
/// Lines go to stderr as `[2026-10-18 12:00:00.123] [info] message`.
/// Formatting is checked at compile time through `fmt::format_string`.
/// Logging never throws and output from concurrent callers is not interleaved.

#include <fmt/format.h>

#include <exception>
#include <optional>
#include <string_view>
#include <utility>

namespace efe::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Set the global threshold (default Info).
void set_level(Level lvl) noexcept;

[[nodiscard]] Level level() noexcept;

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(Level lvl) noexcept;

[[nodiscard]] inline bool enabled(Level lvl) noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

namespace detail {
/// Write one pre-formatted line. Never throws.
void write(Level lvl, std::string_view message) noexcept;

template <typename... Args>
void emit(Level lvl, fmt::format_string<Args...> f, Args&&... args) noexcept {
    if (!enabled(lvl)) {
        return;
    }
    try {
        write(lvl, fmt::format(f, std::forward<Args>(args)...));
    } catch (const std::exception& e) {
        write(Level::Error, e.what());
    }
}
} // namespace detail

template <typename... Args>
void debug(fmt::format_string<Args...> f, Args&&... args) noexcept {
    detail::emit(Level::Debug, f, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> f, Args&&... args) noexcept {
    detail::emit(Level::Info, f, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> f, Args&&... args) noexcept {
    detail::emit(Level::Warn, f, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> f, Args&&... args) noexcept {
    detail::emit(Level::Error, f, std::forward<Args>(args)...);
}

} // namespace efe::log
