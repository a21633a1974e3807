#pragma once

/**
 * @file homestead_c_guard.hpp
 * @brief Exception-to-error-code translation for the C API
 *
 * Every extern "C" entry point runs its body through GuardedCall so that no
 * exception reaches a C caller.
 */

#include "homestead.h"

#include <homestead/core/Error.hpp>

#include <exception>
#include <new>
#include <string>

namespace homestead::capi {

/// Map an exception to its error code and record the message
inline HomesteadError TranslateException(const std::exception &e, std::string &last_error) {
    last_error = e.what();

    if (dynamic_cast<const ParameterError *>(&e)) {
        return HOMESTEAD_ERROR_INVALID_PARAMETERS;
    }
    if (dynamic_cast<const ConfigError *>(&e)) {
        return HOMESTEAD_ERROR_CONFIG_LOAD;
    }
    if (dynamic_cast<const IOError *>(&e)) {
        return HOMESTEAD_ERROR_IO;
    }
    if (dynamic_cast<const std::bad_alloc *>(&e)) {
        return HOMESTEAD_ERROR_ALLOCATION;
    }
    return HOMESTEAD_ERROR_UNKNOWN;
}

/**
 * @brief Run an entry point body, converting anything thrown to an error code
 *
 * @param last_error Receives the message of a caught exception
 * @param body Callable returning HomesteadError
 */
template <typename Body>
HomesteadError GuardedCall(std::string &last_error, Body &&body) noexcept {
    try {
        return body();
    } catch (const std::exception &e) {
        return TranslateException(e, last_error);
    } catch (...) {
        last_error = "Unknown error";
        return HOMESTEAD_ERROR_UNKNOWN;
    }
}

} // namespace homestead::capi
