#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions, concepts, and build information for Homestead
 *
 * Re-exports Janus types for dual-backend (numeric/symbolic) compatibility.
 * The simulation engine is templated on a Scalar satisfying HomesteadScalar,
 * so the same recurrence runs with double or with casadi::MX.
 */

#include <concepts>
#include <cstdint>
#include <stdexcept>
#include <string>

// Re-export Janus types and concepts
#include <janus/core/JanusConcepts.hpp>
#include <janus/core/JanusTypes.hpp>

namespace homestead {

// =============================================================================
// Build Mode Detection
// =============================================================================

#ifdef HOMESTEAD_DEBUG
constexpr bool kDebugMode = true;
#else
constexpr bool kDebugMode = false;
#endif

// =============================================================================
// Janus Type Re-exports
// =============================================================================

using janus::NumericScalar;
using janus::SymbolicScalar;

using janus::as_mx;
using janus::sym;

// =============================================================================
// Scalar Concepts
// =============================================================================

using janus::JanusScalar;

/**
 * @brief Scalar types accepted by the simulation engine
 *
 * Identical to JanusScalar: double for numeric runs, casadi::MX for
 * symbolic tracing.
 */
template <typename T>
concept HomesteadScalar = JanusScalar<T>;

// =============================================================================
// Calendar Constants
// =============================================================================

/// Simulation steps per year (the engine advances one month per step)
inline constexpr int kMonthsPerYear = 12;

// =============================================================================
// Version Information
// =============================================================================

#define HOMESTEAD_VERSION_MAJOR 0
#define HOMESTEAD_VERSION_MINOR 2
#define HOMESTEAD_VERSION_PATCH 0

#define HOMESTEAD_STRINGIFY(x) #x
#define HOMESTEAD_VERSION_STR(major, minor, patch)                                                 \
    HOMESTEAD_STRINGIFY(major) "." HOMESTEAD_STRINGIFY(minor) "." HOMESTEAD_STRINGIFY(patch)

constexpr int VersionMajor() { return HOMESTEAD_VERSION_MAJOR; }
constexpr int VersionMinor() { return HOMESTEAD_VERSION_MINOR; }
constexpr int VersionPatch() { return HOMESTEAD_VERSION_PATCH; }

/// Version string (derived from components)
constexpr const char *Version() {
    return HOMESTEAD_VERSION_STR(HOMESTEAD_VERSION_MAJOR, HOMESTEAD_VERSION_MINOR,
                                 HOMESTEAD_VERSION_PATCH);
}

// =============================================================================
// Naming Utilities
// =============================================================================

/**
 * @brief Build a full path from scenario and component name
 *
 * Returns "scenario.name" if scenario is non-empty, otherwise just "name".
 */
inline std::string MakeFullPath(const std::string &scenario, const std::string &name) {
    if (scenario.empty())
        return name;
    return scenario + "." + name;
}

} // namespace homestead

// =============================================================================
// Debug Assertion Macros
// =============================================================================

#ifdef HOMESTEAD_DEBUG

/**
 * @brief Assert a condition in debug builds, throw if false
 *
 * In release builds, this macro compiles to nothing.
 */
#define HOMESTEAD_ASSERT(cond, msg)                                                                \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error(std::string("HOMESTEAD_ASSERT failed: ") + (msg));            \
        }                                                                                          \
    } while (0)

#else // Release builds

#define HOMESTEAD_ASSERT(cond, msg) ((void)0)

#endif // HOMESTEAD_DEBUG
