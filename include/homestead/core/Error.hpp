#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Homestead
 *
 * Provides a flattened exception hierarchy. Each category carries contextual
 * information rather than spawning many subclasses.
 */

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace homestead {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning
    ERROR,   ///< Error (operation aborted)
    FATAL    ///< Fatal (programming error)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Homestead exceptions
 *
 * All Homestead exceptions carry:
 * - A severity level (defaults to ERROR)
 * - A category string for logging context
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[homestead] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Parameter Errors
// =============================================================================

/**
 * @brief Parameter validation failure categories
 */
enum class ParameterErrorKind {
    NonPositive, ///< Size, price, rent, horizon or term <= 0
    NonFinite,   ///< NaN or infinite input
    OutOfRange,  ///< Rate <= -1, or fraction outside [0, 1]
    Multiple     ///< Several violations reported together
};

/**
 * @brief One failed input check, as reported by SimulationParameters::Validate()
 */
struct ParameterViolation {
    ParameterErrorKind kind;
    std::string field;
    std::string detail; ///< e.g. "must be > 0, got -1.000000"

    [[nodiscard]] std::string Message() const { return field + " " + detail; }

    static ParameterViolation NonPositive(const std::string &field, double value) {
        return {ParameterErrorKind::NonPositive, field,
                "must be > 0, got " + std::to_string(value)};
    }

    static ParameterViolation NonPositive(const std::string &field, int value) {
        return {ParameterErrorKind::NonPositive, field,
                "must be > 0, got " + std::to_string(value)};
    }

    static ParameterViolation NonFinite(const std::string &field) {
        return {ParameterErrorKind::NonFinite, field, "must be finite"};
    }

    static ParameterViolation OutOfRange(const std::string &field, const std::string &range,
                                         double value) {
        return {ParameterErrorKind::OutOfRange, field,
                "must be in " + range + ", got " + std::to_string(value)};
    }

    static ParameterViolation OutOfRange(const std::string &field, const std::string &range,
                                         int value) {
        return {ParameterErrorKind::OutOfRange, field,
                "must be in " + range + ", got " + std::to_string(value)};
    }
};

/**
 * @brief Invalid simulation parameters, raised before any computation
 */
class ParameterError : public Error {
  public:
    ParameterError(ParameterErrorKind kind, const std::string &field,
                   const std::string &detail = "")
        : Error(FormatMessage(kind, field, detail), Severity::ERROR, "parameter"), kind_(kind),
          field_(field) {}

    [[nodiscard]] ParameterErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string &field() const { return field_; }

    /**
     * @brief Build the error for a non-empty violation list
     *
     * A single violation keeps its own kind and field. Several are joined
     * under ParameterErrorKind::Multiple.
     */
    static ParameterError FromViolations(const std::vector<ParameterViolation> &violations) {
        if (violations.size() == 1) {
            const auto &v = violations.front();
            return {v.kind, v.field, v.detail};
        }
        std::string joined;
        for (std::size_t i = 0; i < violations.size(); ++i) {
            if (i > 0) {
                joined += "; ";
            }
            joined += violations[i].Message();
        }
        return {ParameterErrorKind::Multiple, "parameters", joined};
    }

  private:
    static std::string FormatMessage(ParameterErrorKind kind, const std::string &field,
                                     const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case ParameterErrorKind::NonPositive:
            prefix = "Non-positive parameter";
            break;
        case ParameterErrorKind::NonFinite:
            prefix = "Non-finite parameter";
            break;
        case ParameterErrorKind::OutOfRange:
            prefix = "Parameter out of range";
            break;
        case ParameterErrorKind::Multiple:
            prefix = "Invalid parameters";
            break;
        }
        std::string msg = prefix + ": '" + field + "'";
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        return msg;
    }

    ParameterErrorKind kind_;
    std::string field_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &message, const std::string &file, int line = -1,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace homestead
