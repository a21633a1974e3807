/**
 * @file homestead_c.cpp
 * @brief Homestead C API implementation
 *
 * Wraps Simulate() and the scenario loader in a C-compatible interface.
 */

#include "homestead.h"
#include "homestead_c_guard.hpp"

#include <homestead/io/ResultJson.hpp>
#include <homestead/io/ScenarioLoader.hpp>
#include <homestead/sim/Simulate.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <string>

// Thread-local storage for the last error message
static thread_local std::string g_last_error;

// =============================================================================
// Helper Functions
// =============================================================================

/// Simulate and hand back a malloc'd JSON copy
static HomesteadError EmitScenario(const homestead::io::Scenario &scenario, char **out_json) {
    auto result = homestead::Simulate(scenario.params, scenario.name);
    std::string json_str = homestead::io::ResultToJson(result, scenario.name).dump(2);

    char *buffer = static_cast<char *>(std::malloc(json_str.size() + 1));
    if (!buffer) {
        g_last_error = "Failed to allocate memory for JSON";
        return HOMESTEAD_ERROR_ALLOCATION;
    }
    std::memcpy(buffer, json_str.c_str(), json_str.size() + 1);
    *out_json = buffer;
    g_last_error.clear();
    return HOMESTEAD_OK;
}

extern "C" {

// =============================================================================
// Simulation
// =============================================================================

HOMESTEAD_API HomesteadError homestead_simulate_file(const char *scenario_path, char **out_json) {
    if (!out_json) {
        g_last_error = "out_json is NULL";
        return HOMESTEAD_ERROR_NULL_ARGUMENT;
    }
    *out_json = nullptr;
    if (!scenario_path) {
        g_last_error = "scenario_path is NULL";
        return HOMESTEAD_ERROR_NULL_ARGUMENT;
    }

    return homestead::capi::GuardedCall(g_last_error, [&] {
        return EmitScenario(homestead::io::ScenarioLoader::Load(scenario_path), out_json);
    });
}

HOMESTEAD_API HomesteadError homestead_simulate_yaml(const char *yaml_content, char **out_json) {
    if (!out_json) {
        g_last_error = "out_json is NULL";
        return HOMESTEAD_ERROR_NULL_ARGUMENT;
    }
    *out_json = nullptr;
    if (!yaml_content) {
        g_last_error = "yaml_content is NULL";
        return HOMESTEAD_ERROR_NULL_ARGUMENT;
    }

    return homestead::capi::GuardedCall(g_last_error, [&] {
        return EmitScenario(homestead::io::ScenarioLoader::Parse(yaml_content), out_json);
    });
}

HOMESTEAD_API HomesteadError homestead_simulate_default(char **out_json) {
    if (!out_json) {
        g_last_error = "out_json is NULL";
        return HOMESTEAD_ERROR_NULL_ARGUMENT;
    }
    *out_json = nullptr;

    return homestead::capi::GuardedCall(g_last_error, [&] {
        return EmitScenario(homestead::io::Scenario{}, out_json);
    });
}

// =============================================================================
// Error Handling
// =============================================================================

HOMESTEAD_API const char *homestead_get_last_error(void) { return g_last_error.c_str(); }

HOMESTEAD_API const char *homestead_error_name(HomesteadError error) {
    switch (error) {
    case HOMESTEAD_OK:
        return "HOMESTEAD_OK";
    case HOMESTEAD_ERROR_NULL_ARGUMENT:
        return "HOMESTEAD_ERROR_NULL_ARGUMENT";
    case HOMESTEAD_ERROR_CONFIG_LOAD:
        return "HOMESTEAD_ERROR_CONFIG_LOAD";
    case HOMESTEAD_ERROR_INVALID_PARAMETERS:
        return "HOMESTEAD_ERROR_INVALID_PARAMETERS";
    case HOMESTEAD_ERROR_IO:
        return "HOMESTEAD_ERROR_IO";
    case HOMESTEAD_ERROR_ALLOCATION:
        return "HOMESTEAD_ERROR_ALLOCATION";
    case HOMESTEAD_ERROR_UNKNOWN:
    default:
        return "HOMESTEAD_ERROR_UNKNOWN";
    }
}

// =============================================================================
// Memory Management
// =============================================================================

HOMESTEAD_API void homestead_free_string(char *str) { std::free(str); }

// =============================================================================
// Version
// =============================================================================

HOMESTEAD_API const char *homestead_version(void) { return homestead::Version(); }

HOMESTEAD_API void homestead_version_components(int *major, int *minor, int *patch) {
    if (major) {
        *major = HOMESTEAD_VERSION_MAJOR;
    }
    if (minor) {
        *minor = HOMESTEAD_VERSION_MINOR;
    }
    if (patch) {
        *patch = HOMESTEAD_VERSION_PATCH;
    }
}

} // extern "C"
