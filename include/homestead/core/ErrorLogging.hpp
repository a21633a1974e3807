#pragma once

/**
 * @file ErrorLogging.hpp
 * @brief Integration between Error types and LogService
 *
 * Include this header to log an error to the global LogService before it
 * propagates. Bridges Error.hpp and LogService.hpp.
 */

#include <homestead/core/Error.hpp>
#include <homestead/io/LogService.hpp>

#include <string>
#include <utility>

namespace homestead {

inline LogLevel SeverityToLogLevel(Severity severity) {
    switch (severity) {
    case Severity::INFO:
        return LogLevel::Info;
    case Severity::WARNING:
        return LogLevel::Warning;
    case Severity::ERROR:
        return LogLevel::Error;
    case Severity::FATAL:
        return LogLevel::Fatal;
    }
    return LogLevel::Error;
}

/**
 * @brief Log an error to the global LogService
 *
 * The error category becomes the component of the log context when no
 * component is given.
 */
inline void LogError(const Error &error, int month = kNoMonth, const std::string &component = "") {
    LogContext ctx = LogContextManager::GetContext();
    ctx.component = component.empty() ? error.category() : component;
    GetLogService().Log(SeverityToLogLevel(error.severity()), month, error.what(), ctx);
}

/**
 * @brief Throw an error after logging it
 *
 * Usage:
 * @code
 * ThrowAndLog(ParameterError::FromViolations(violations), kNoMonth, "Validate");
 * @endcode
 */
template <typename E>
[[noreturn]] void ThrowAndLog(E &&error, int month = kNoMonth, const std::string &component = "") {
    LogError(error, month, component);
    throw std::forward<E>(error);
}

} // namespace homestead

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error after logging it to global LogService
 */
#define HOMESTEAD_THROW_LOG(error) ::homestead::ThrowAndLog((error), ::homestead::kNoMonth, "")

/**
 * @brief Throw an error with context, logging before throw
 */
#define HOMESTEAD_THROW_LOG_CTX(error, month, component)                                           \
    ::homestead::ThrowAndLog((error), (month), (component))

// NOLINTEND(cppcoreguidelines-macro-usage)
