#pragma once

/**
 * @file Annuity.hpp
 * @brief Level-payment annuity and compounding helpers
 *
 * Shared by the parameter normalizer (effective monthly rates) and the
 * closed-form estimate (nominal monthly rates). All functions are dual-mode:
 * branches go through janus::where so symbolic Scalars trace cleanly.
 */

#include <homestead/core/CoreTypes.hpp>

#include <janus/janus.hpp>

namespace homestead {

/**
 * @brief Monthly growth factor equivalent to an annual rate
 *
 * (1 + annual)^(1/12). Undefined for annual <= -1 (rejected by
 * SimulationParameters::Validate).
 */
template <typename Scalar> Scalar MonthlyGrowthFactor(const Scalar &annual_rate) {
    return janus::pow(Scalar{1.0} + annual_rate, Scalar{1.0 / kMonthsPerYear});
}

/**
 * @brief Effective monthly rate equivalent to an annual rate: (1 + annual)^(1/12) - 1
 */
template <typename Scalar> Scalar EffectiveMonthlyRate(const Scalar &annual_rate) {
    return MonthlyGrowthFactor(annual_rate) - Scalar{1.0};
}

/**
 * @brief Level payment that fully repays `principal` after `periods` payments
 *
 * P = r L (1+r)^n / ((1+r)^n - 1), falling back to straight-line L / n
 * when the periodic rate is exactly zero.
 */
template <typename Scalar>
Scalar AnnuityPayment(const Scalar &principal, const Scalar &periodic_rate, int periods) {
    const Scalar n{static_cast<double>(periods)};
    const Scalar growth = janus::pow(Scalar{1.0} + periodic_rate, n);
    const Scalar amortizing = periodic_rate * principal * growth / (growth - Scalar{1.0});
    const Scalar straight_line = principal / n;
    return janus::where(periodic_rate == Scalar{0.0}, straight_line, amortizing);
}

/**
 * @brief Future value of `periods` end-of-period deposits of `payment`
 *
 * FV = P ((1+r)^n - 1) / r, or P n at a zero rate.
 */
template <typename Scalar>
Scalar AnnuityFutureValue(const Scalar &payment, const Scalar &periodic_rate, int periods) {
    const Scalar n{static_cast<double>(periods)};
    const Scalar growth = janus::pow(Scalar{1.0} + periodic_rate, n);
    const Scalar compounded = payment * (growth - Scalar{1.0}) / periodic_rate;
    return janus::where(periodic_rate == Scalar{0.0}, payment * n, compounded);
}

/**
 * @brief Remaining balance after `paid` level payments on an amortizing loan
 *
 * B_k = L (1+r)^k - P ((1+r)^k - 1) / r. Used to cross-check the loop's
 * month-by-month balance.
 */
template <typename Scalar>
Scalar AmortizedBalance(const Scalar &principal, const Scalar &periodic_rate,
                        const Scalar &payment, int paid) {
    const Scalar k{static_cast<double>(paid)};
    const Scalar growth = janus::pow(Scalar{1.0} + periodic_rate, k);
    return principal * growth - AnnuityFutureValue(payment, periodic_rate, paid);
}

} // namespace homestead
