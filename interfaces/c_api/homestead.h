/**
 * @file homestead.h
 * @brief Homestead C API - rent-vs-buy simulation over FFI
 *
 * Design Notes:
 * - The API is stateless: each call loads, simulates and returns JSON
 * - Calls may run concurrently on different threads
 * - All functions return HomesteadError codes (0 = success)
 * - Last error message retrievable via homestead_get_last_error() (per thread)
 * - Returned JSON strings are owned by the caller; free with homestead_free_string()
 */

#ifndef HOMESTEAD_H
#define HOMESTEAD_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Platform-specific export macros
 * ===========================================================================*/

#if defined(_WIN32) || defined(__CYGWIN__)
#ifdef HOMESTEAD_C_BUILDING_DLL
#define HOMESTEAD_API __declspec(dllexport)
#else
#define HOMESTEAD_API __declspec(dllimport)
#endif
#else
#define HOMESTEAD_API __attribute__((visibility("default")))
#endif

/* =============================================================================
 * Types
 * ===========================================================================*/

/** @brief Error codes returned by all API functions */
typedef enum HomesteadError {
    HOMESTEAD_OK = 0,                       /**< Success */
    HOMESTEAD_ERROR_NULL_ARGUMENT = -1,     /**< NULL path or output pointer */
    HOMESTEAD_ERROR_CONFIG_LOAD = -2,       /**< Scenario YAML could not be parsed */
    HOMESTEAD_ERROR_INVALID_PARAMETERS = -3, /**< Parameters failed validation */
    HOMESTEAD_ERROR_IO = -4,                /**< Scenario file could not be read */
    HOMESTEAD_ERROR_ALLOCATION = -5,        /**< Memory allocation failed */
    HOMESTEAD_ERROR_UNKNOWN = -99           /**< Unknown error */
} HomesteadError;

/* =============================================================================
 * Simulation
 * ===========================================================================*/

/**
 * @brief Simulate the scenario in a YAML file
 *
 * On success *out_json receives a pretty-printed result document
 * (params, months, buy_net_worth, rent_net_worth, net_advantage_buy,
 * verdict, details). On failure *out_json is set to NULL.
 *
 * @param scenario_path Path to scenario YAML
 * @param out_json Output: JSON string (caller must free)
 * @return HOMESTEAD_OK on success, error code on failure
 */
HOMESTEAD_API HomesteadError homestead_simulate_file(const char *scenario_path, char **out_json);

/**
 * @brief Simulate a scenario given as YAML text
 *
 * @param yaml_content Scenario YAML document
 * @param out_json Output: JSON string (caller must free)
 * @return HOMESTEAD_OK on success, error code on failure
 */
HOMESTEAD_API HomesteadError homestead_simulate_yaml(const char *yaml_content, char **out_json);

/**
 * @brief Simulate the built-in default scenario
 *
 * @param out_json Output: JSON string (caller must free)
 * @return HOMESTEAD_OK on success, error code on failure
 */
HOMESTEAD_API HomesteadError homestead_simulate_default(char **out_json);

/* =============================================================================
 * Error Handling
 * ===========================================================================*/

/**
 * @brief Get last error message on the calling thread
 *
 * @return Error message string, or empty string if the last call succeeded
 */
HOMESTEAD_API const char *homestead_get_last_error(void);

/**
 * @brief Get error code name as string (e.g., "HOMESTEAD_OK")
 */
HOMESTEAD_API const char *homestead_error_name(HomesteadError error);

/* =============================================================================
 * Memory Management
 * ===========================================================================*/

/**
 * @brief Free a string returned by this API (safe to pass NULL)
 */
HOMESTEAD_API void homestead_free_string(char *str);

/* =============================================================================
 * Version Information
 * ===========================================================================*/

/** @brief Version string (e.g., "0.2.0") */
HOMESTEAD_API const char *homestead_version(void);

HOMESTEAD_API void homestead_version_components(int *major, int *minor, int *patch);

#ifdef __cplusplus
}
#endif

#endif /* HOMESTEAD_H */
