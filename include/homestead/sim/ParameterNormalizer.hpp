#pragma once

/**
 * @file ParameterNormalizer.hpp
 * @brief Converts annual scenario inputs into monthly engine factors
 *
 * Leaf stage of the engine: no state, no side effects. Input validity is
 * the caller's responsibility (Simulate() validates before normalizing).
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/sim/Annuity.hpp>
#include <homestead/sim/SimulationParameters.hpp>

namespace homestead {

/**
 * @brief Derived quantities and monthly factors for one simulation
 */
template <typename Scalar> struct NormalizedParameters {
    // Derived amounts
    Scalar house_price;
    Scalar monthly_rent;
    Scalar down_payment;
    Scalar loan_principal;
    Scalar buy_closing_cost; ///< One-time, paid at purchase

    // Mortgage
    Scalar mortgage_rate_monthly; ///< r_m = (1 + annual)^(1/12) - 1
    int mortgage_payments = 0;    ///< n = mortgage_years * 12
    Scalar mortgage_payment;      ///< Level monthly payment

    // Monthly factors
    Scalar house_growth_factor;      ///< Property value multiplier per month
    Scalar rent_growth_factor;       ///< Market rent multiplier per month
    Scalar investment_rate_monthly;  ///< Side-investment return per month

    // Passthrough fractions used inside the loop and at settlement
    Scalar gov_levy_pct_of_rent;
    Scalar mgmt_fee_pct_of_value_annual;
    Scalar sell_closing_cost_pct;

    int months = 0; ///< horizon_years * 12
    bool invest_monthly_diffs = true;
};

/**
 * @brief Normalize a parameter set
 */
template <typename Scalar>
NormalizedParameters<Scalar> Normalize(const ParameterSet<Scalar> &p) {
    NormalizedParameters<Scalar> n;

    n.house_price = p.house_size * p.price_per_area;
    n.monthly_rent = p.house_size * p.rent_per_area;
    n.down_payment = n.house_price * p.down_payment_pct;
    n.loan_principal = n.house_price - n.down_payment;
    n.buy_closing_cost = n.house_price * p.buy_closing_cost_pct;

    n.mortgage_rate_monthly = EffectiveMonthlyRate(p.mortgage_rate_annual);
    n.mortgage_payments = p.mortgage_years * kMonthsPerYear;
    n.mortgage_payment =
        AnnuityPayment(n.loan_principal, n.mortgage_rate_monthly, n.mortgage_payments);

    n.house_growth_factor = MonthlyGrowthFactor(p.house_appreciation_annual);
    n.rent_growth_factor = MonthlyGrowthFactor(p.rent_increase_annual);
    n.investment_rate_monthly = EffectiveMonthlyRate(p.investment_return_annual);

    n.gov_levy_pct_of_rent = p.gov_levy_pct_of_rent;
    n.mgmt_fee_pct_of_value_annual = p.mgmt_fee_pct_of_value_annual;
    n.sell_closing_cost_pct = p.sell_closing_cost_pct;

    n.months = p.Months();
    n.invest_monthly_diffs = p.invest_monthly_diffs;
    return n;
}

} // namespace homestead
