#pragma once

/**
 * @file ClosedFormEstimate.hpp
 * @brief Closed-form rent-vs-buy shortcut, kept as a cross-check oracle
 *
 * Uses nominal monthly rates (annual / 12) and constant amounts: the owner
 * pays a level mortgage on the full price plus a holding cost, the renter
 * invests the difference against a constant rent, and the house compounds
 * annually. No closing costs, no levy, no rent growth. The monthly
 * simulation is the canonical model; this estimate exists to check the
 * annuity arithmetic against an independent derivation.
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/sim/Annuity.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace homestead {

struct ClosedFormInputs {
    double house_price = 10'000'000.0;
    double monthly_rent = 30'000.0;
    int years = 30;
    double mortgage_rate_annual = 0.035;
    double house_appreciation_annual = 0.02;
    double investment_yield_annual = 0.07;
    double holding_cost_pct_annual = 0.003; ///< Annual holding cost as a fraction of price

    [[nodiscard]] static ClosedFormInputs Default() { return ClosedFormInputs{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (!(house_price > 0.0)) {
            errors.push_back("house_price must be > 0");
        }
        if (!(monthly_rent > 0.0)) {
            errors.push_back("monthly_rent must be > 0");
        }
        if (years <= 0) {
            errors.push_back("years must be > 0");
        }
        if (!std::isfinite(mortgage_rate_annual) || !std::isfinite(house_appreciation_annual) ||
            !std::isfinite(investment_yield_annual) || !std::isfinite(holding_cost_pct_annual)) {
            errors.push_back("rates must be finite");
        }
        return errors;
    }
};

struct ClosedFormEstimate {
    double price_to_rent_ratio = 0.0;     ///< price / annual rent
    double monthly_payment = 0.0;         ///< Nominal-rate level payment on the full price
    double monthly_investment = 0.0;      ///< payment + holding cost - rent
    double investment_future_value = 0.0; ///< FV of monthly_investment at yield / 12
    double house_future_value = 0.0;      ///< price * (1 + appreciation)^years
    double investment_lead = 0.0;         ///< investment FV - house FV
};

/**
 * @brief Evaluate the closed-form shortcut
 */
inline ClosedFormEstimate EstimateClosedForm(const ClosedFormInputs &in) {
    const int months = in.years * kMonthsPerYear;
    const double months_per_year = static_cast<double>(kMonthsPerYear);

    ClosedFormEstimate out;
    out.price_to_rent_ratio = in.house_price / (in.monthly_rent * months_per_year);
    out.monthly_payment =
        AnnuityPayment(in.house_price, in.mortgage_rate_annual / months_per_year, months);
    out.monthly_investment = out.monthly_payment +
                             in.house_price * in.holding_cost_pct_annual / months_per_year -
                             in.monthly_rent;
    out.investment_future_value = AnnuityFutureValue(
        out.monthly_investment, in.investment_yield_annual / months_per_year, months);
    out.house_future_value =
        in.house_price * std::pow(1.0 + in.house_appreciation_annual, in.years);
    out.investment_lead = out.investment_future_value - out.house_future_value;
    return out;
}

} // namespace homestead
