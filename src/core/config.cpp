/// @file src/core/config.cpp
/// @brief Environment and CLI layering for ServiceConfig.

#include "efe/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace efe {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Int>
std::optional<Int> parse_integer(std::string_view text) noexcept {
    Int value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

bool set_port(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto port = parse_port(v);
    if (!port) {
        log::error("config: {} must be a port in 1..65535, got '{}'", source, v);
        return false;
    }
    cfg.port = *port;
    return true;
}

bool set_capacity(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto cap = parse_positive_size(v);
    if (!cap) {
        log::error("config: {} must be a positive integer, got '{}'", source, v);
        return false;
    }
    cfg.cache_capacity = *cap;
    return true;
}

bool set_max_body(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto bytes = parse_positive_size(v);
    if (!bytes) {
        log::error("config: {} must be a positive integer, got '{}'", source, v);
        return false;
    }
    cfg.max_body_bytes = *bytes;
    return true;
}

bool set_idle_timeout(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto seconds = parse_positive_size(v);
    if (!seconds) {
        log::error("config: {} must be a positive number of seconds, got '{}'",
                   source, v);
        return false;
    }
    cfg.idle_timeout_s = *seconds;
    return true;
}

bool set_strict(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto flag = parse_bool(v);
    if (!flag) {
        log::error("config: {} must be a boolean, got '{}'", source, v);
        return false;
    }
    cfg.reject_unimplemented = *flag;
    return true;
}

bool set_log_level(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    auto lvl = log::parse_level(v);
    if (!lvl) {
        log::error("config: {} must be one of debug, info, warn, error, off; got '{}'",
                   source, v);
        return false;
    }
    cfg.log_level = *lvl;
    return true;
}

bool set_host(ServiceConfig& cfg, std::string_view source, std::string_view v) {
    if (v.empty()) {
        log::error("config: {} must not be empty", source);
        return false;
    }
    cfg.host = std::string(v);
    return true;
}

} // namespace

// ─── Parsers ──────────────────────────────────────────────────────────────────

std::optional<std::uint16_t> parse_port(std::string_view text) noexcept {
    auto value = parse_integer<unsigned long>(text);
    if (!value || *value == 0 || *value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*value);
}

std::optional<std::size_t> parse_positive_size(std::string_view text) noexcept {
    auto value = parse_integer<std::size_t>(text);
    if (!value || *value == 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_bool(std::string_view text) noexcept {
    try {
        const std::string v = lowercase(text);
        if (v == "1" || v == "true" || v == "yes" || v == "on")  return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    } catch (const std::exception&) {
        // allocation failure: treat as unparseable
    }
    return std::nullopt;
}

// ─── Layering ─────────────────────────────────────────────────────────────────

EnvLookup process_env() {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

bool apply_env_overrides(ServiceConfig& cfg, const EnvLookup& env) {
    using Setter = bool (*)(ServiceConfig&, std::string_view, std::string_view);
    struct EnvBinding {
        const char* name;
        Setter      apply;
    };

    static constexpr EnvBinding BINDINGS[] = {
        {"EFE_HOST",                 &set_host},
        {"EFE_PORT",                 &set_port},
        {"EFE_CACHE_CAPACITY",       &set_capacity},
        {"EFE_MAX_BODY_BYTES",       &set_max_body},
        {"EFE_IDLE_TIMEOUT_S",       &set_idle_timeout},
        {"EFE_REJECT_UNIMPLEMENTED", &set_strict},
        {"EFE_LOG_LEVEL",            &set_log_level},
    };

    for (const auto& binding : BINDINGS) {
        auto value = env(binding.name);
        if (!value) {
            continue;
        }
        if (!binding.apply(cfg, binding.name, *value)) {
            return false;
        }
    }
    return true;
}

bool is_switch_flag(std::string_view flag) noexcept {
    return flag == "--strict";
}

bool apply_cli_flag(ServiceConfig& cfg, std::string_view flag, std::string_view value) {
    if (flag == "--host")           return set_host(cfg, flag, value);
    if (flag == "--port")           return set_port(cfg, flag, value);
    if (flag == "--cache-capacity") return set_capacity(cfg, flag, value);
    if (flag == "--log-level")      return set_log_level(cfg, flag, value);
    if (flag == "--strict") {
        cfg.reject_unimplemented = true;
        return true;
    }

    log::error("config: unknown option '{}'", flag);
    return false;
}

} // namespace efe
