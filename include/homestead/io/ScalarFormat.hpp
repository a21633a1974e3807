#pragma once

/**
 * @file ScalarFormat.hpp
 * @brief Scalar formatting for log messages emitted from templated engine code
 *
 * The monthly loop logs balances for both numeric and symbolic Scalars.
 * Numeric values print as money-style fixed point; symbolic expressions
 * print as their constant value when they fold to one, otherwise as a
 * placeholder (a 360-step MX graph is not worth printing).
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/io/Console.hpp>

#include <string>

namespace homestead::io {

template <typename Scalar> struct ScalarFormatter;

/**
 * @brief Specialization for double (numeric mode)
 */
template <> struct ScalarFormatter<double> {
    static std::string format(const double &value, int precision = 2) {
        return Console::FormatNumber(value, precision);
    }

    static constexpr bool is_numeric() { return true; }
};

/**
 * @brief Specialization for SymbolicScalar (symbolic mode)
 */
template <> struct ScalarFormatter<SymbolicScalar> {
    static std::string format(const SymbolicScalar &value, int precision = 2) {
        if (value.is_constant()) {
            return Console::FormatNumber(static_cast<double>(casadi::DM(value)), precision);
        }
        return "<symbolic>";
    }

    static constexpr bool is_numeric() { return false; }
};

/**
 * @brief Format a scalar value (auto-dispatch)
 */
template <typename Scalar> inline std::string FormatScalar(const Scalar &value, int precision = 2) {
    return ScalarFormatter<Scalar>::format(value, precision);
}

} // namespace homestead::io
