/// @file src/core/log.cpp
/// @brief stderr sink for efe::log.

#include "efe/log.hpp"

#include <fmt/chrono.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <mutex>
#include <string>

namespace efe::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex       g_write_mutex;

} // namespace

void set_level(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level() noexcept {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

std::optional<Level> parse_level(std::string_view name) noexcept {
    std::string lowered(name.size(), '\0');
    std::transform(name.begin(), name.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug")                      return Level::Debug;
    if (lowered == "info")                       return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error")                      return Level::Error;
    if (lowered == "off" || lowered == "none")   return Level::Off;
    return std::nullopt;
}

std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "info";
}

namespace detail {

void write(Level lvl, std::string_view message) noexcept {
    try {
        const auto now = std::chrono::system_clock::now();
        const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch()) % 1000;
        const std::time_t tt = std::chrono::system_clock::to_time_t(now);

        std::lock_guard<std::mutex> lock(g_write_mutex);
        fmt::print(stderr, "[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] {}\n",
                   fmt::localtime(tt), static_cast<int>(ms.count()),
                   to_string(lvl), message);
    } catch (const std::exception& e) {
        std::fputs("[log] sink failure: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

} // namespace detail

} // namespace efe::log
