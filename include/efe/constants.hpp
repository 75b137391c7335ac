#pragma once

#include <cstddef>

/// @file include/efe/constants.hpp
/// @brief Physical constants and service-wide defaults for the EFE core.

namespace efe::constants {

// ─── Physical Constants (SI) ──────────────────────────────────────────────────

/// Gravitational constant G (m³ kg⁻¹ s⁻²).
static constexpr double G = 6.67430e-11;

/// Speed of light c (m/s).
static constexpr double C = 299792458.0;

/// Planck constant h (J·s).
static constexpr double PLANCK = 6.62607015e-34;

/// Boltzmann constant k_B (J/K).
static constexpr double BOLTZMANN = 1.380649e-23;

/// Cosmological constant Λ (m⁻²).
static constexpr double COSMOLOGICAL_CONSTANT = 1.1056e-52;

static constexpr double PI = 3.14159265358979323846;

// ─── Solver Defaults ──────────────────────────────────────────────────────────

/// Polar angle used when a request omits `theta` (equatorial plane).
static constexpr double DEFAULT_THETA = PI / 2.0;

/// Hubble parameter (km/s/Mpc) reported when FLRW inputs omit it.
static constexpr double DEFAULT_HUBBLE_PARAMETER = 70.0;

// ─── Cache ────────────────────────────────────────────────────────────────────

/// Maximum number of memoized results held at once (FIFO eviction above this).
static constexpr std::size_t MAX_CACHE_ENTRIES = 100;

// ─── Transport ────────────────────────────────────────────────────────────────

/// `Cache-Control: max-age` attached to successful responses (seconds).
static constexpr int RESPONSE_MAX_AGE_SECONDS = 3600;

/// Largest accepted request body.
static constexpr std::size_t DEFAULT_MAX_BODY_BYTES = 1u << 20;

static constexpr int DEFAULT_PORT = 8000;

/// Keep-alive connections with no traffic for this long are closed.
static constexpr std::size_t DEFAULT_IDLE_TIMEOUT_S = 60;

} // namespace efe::constants
