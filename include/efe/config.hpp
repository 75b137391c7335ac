#pragma once

/// @file include/efe/config.hpp
/// @brief Service configuration: struct defaults, environment, CLI flags.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Hold every tunable of the `efe` service in one plain struct and layer
/// overrides on top of the defaults, lowest precedence first:
///   1. `ServiceConfig{}` defaults
///   2. `EFE_*` environment variables (`apply_env_overrides`)
///   3. command-line flags (`apply_cli_flag`)
///
/// ## Guarantees
/// - Invalid values never reach the service: an override that does not parse
///   or is out of range makes the apply step return `false` and logs why
/// - No exceptions

#include "efe/constants.hpp"
#include "efe/log.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace efe {

struct ServiceConfig {
    /// Listen address for `--serve`.
    std::string host = "0.0.0.0";

    /// Listen port. Must be non-zero.
    std::uint16_t port = constants::DEFAULT_PORT;

    /// Maximum number of memoized results. Must be non-zero.
    std::size_t cache_capacity = constants::MAX_CACHE_ENTRIES;

    /// Requests with a larger body are answered with 413.
    std::size_t max_body_bytes = constants::DEFAULT_MAX_BODY_BYTES;

    /// Idle keep-alive connections are closed after this many seconds.
    std::size_t idle_timeout_s = constants::DEFAULT_IDLE_TIMEOUT_S;

    /// If true, stub calculation types are reported as 501 instead of
    /// a 200 result tagged `implemented: false`.
    bool reject_unimplemented = false;

    log::Level log_level = log::Level::Info;
};

/// Environment lookup, injectable for tests. Returns `nullopt` if unset.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// Lookup backed by `std::getenv`.
[[nodiscard]] EnvLookup process_env();

/// Apply `EFE_*` variables to `cfg`. Returns false on the first invalid value.
[[nodiscard]] bool apply_env_overrides(ServiceConfig& cfg, const EnvLookup& env);

/// Apply one `--flag value` pair (or the bare `--strict` flag, with an empty
/// value). Returns false for an unknown flag or an invalid value.
[[nodiscard]] bool apply_cli_flag(ServiceConfig& cfg, std::string_view flag,
                                  std::string_view value);

/// True for flags that take no value.
[[nodiscard]] bool is_switch_flag(std::string_view flag) noexcept;

// ─── Parsers ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::optional<std::uint16_t> parse_port(std::string_view text) noexcept;
[[nodiscard]] std::optional<std::size_t>   parse_positive_size(std::string_view text) noexcept;
[[nodiscard]] std::optional<bool>          parse_bool(std::string_view text) noexcept;

} // namespace efe
