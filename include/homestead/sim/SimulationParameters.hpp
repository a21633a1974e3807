#pragma once

/**
 * @file SimulationParameters.hpp
 * @brief Household scenario inputs for the rent-vs-buy comparison
 *
 * SimulationParameters is NOT templated - it holds plain doubles exactly as
 * a scenario file or caller supplies them. ParameterSet<Scalar> lifts the
 * continuous fields to the engine's Scalar type so symbolic inputs can be
 * substituted for any of them.
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/core/Error.hpp>

#include <cmath>
#include <string>
#include <vector>

namespace homestead {

/// Longest mortgage term or horizon accepted, in years
inline constexpr int kMaxYears = 1000;

/**
 * @brief Immutable input record for one simulation
 *
 * All rates and fractions are decimal fractions (0.035, not 3.5).
 * mortgage_years and horizon_years are independent clocks: the loop runs
 * for the horizon, the amortization schedule is sized for the term.
 */
struct SimulationParameters {
    // Property
    double house_size = 500.0;             ///< Floor area (sqft)
    double price_per_area = 20'000.0;      ///< Purchase price per unit area
    double rent_per_area = 50.0;           ///< Monthly market rent per unit area

    // Mortgage
    double down_payment_pct = 0.30;        ///< Fraction of price paid upfront
    double mortgage_rate_annual = 0.035;   ///< Effective annual mortgage rate
    int mortgage_years = 30;               ///< Amortization term

    // Market
    double investment_return_annual = 0.07;  ///< Side-investment return
    double house_appreciation_annual = 0.01; ///< Property value growth
    double rent_increase_annual = 0.02;      ///< Market rent growth

    // Recurring and one-time costs
    double gov_levy_pct_of_rent = 0.05;            ///< Levy fraction, applied to monthly rent
    double mgmt_fee_pct_of_value_annual = 0.0015;  ///< Management fee, annual fraction of value
    double buy_closing_cost_pct = 0.05;            ///< Stamp duty + agent + legal on purchase
    double sell_closing_cost_pct = 0.01;           ///< Agent + legal on sale

    // Horizon
    int horizon_years = 30;
    bool invest_monthly_diffs = true; ///< Invest the cheaper side's monthly savings

    /// Hong Kong 500 sqft flat defaults
    [[nodiscard]] static SimulationParameters Default() { return SimulationParameters{}; }

    [[nodiscard]] int Months() const { return horizon_years * kMonthsPerYear; }

    /**
     * @brief Check every input constraint
     * @return One entry per violation; empty when the parameters are usable
     */
    [[nodiscard]] std::vector<ParameterViolation> Validate() const {
        std::vector<ParameterViolation> errors;

        auto require_finite = [&errors](const char *name, double value) {
            if (!std::isfinite(value)) {
                errors.push_back(ParameterViolation::NonFinite(name));
                return false;
            }
            return true;
        };

        auto require_positive = [&](const char *name, double value) {
            if (require_finite(name, value) && value <= 0.0) {
                errors.push_back(ParameterViolation::NonPositive(name, value));
            }
        };

        auto require_years = [&errors](const char *name, int value) {
            if (value <= 0) {
                errors.push_back(ParameterViolation::NonPositive(name, value));
            } else if (value > kMaxYears) {
                errors.push_back(ParameterViolation::OutOfRange(
                    name, "[1, " + std::to_string(kMaxYears) + "]", value));
            }
        };

        // A growth rate at or below -100% has no real monthly root
        auto require_rate = [&](const char *name, double value) {
            if (require_finite(name, value) && value <= -1.0) {
                errors.push_back(ParameterViolation::OutOfRange(name, "(-1, inf)", value));
            }
        };

        auto require_fraction = [&](const char *name, double value) {
            if (require_finite(name, value) && (value < 0.0 || value > 1.0)) {
                errors.push_back(ParameterViolation::OutOfRange(name, "[0, 1]", value));
            }
        };

        require_positive("house_size", house_size);
        require_positive("price_per_area", price_per_area);
        require_positive("rent_per_area", rent_per_area);

        require_years("mortgage_years", mortgage_years);
        require_years("horizon_years", horizon_years);

        require_rate("mortgage_rate_annual", mortgage_rate_annual);
        require_rate("investment_return_annual", investment_return_annual);
        require_rate("house_appreciation_annual", house_appreciation_annual);
        require_rate("rent_increase_annual", rent_increase_annual);

        require_fraction("down_payment_pct", down_payment_pct);
        require_fraction("buy_closing_cost_pct", buy_closing_cost_pct);
        require_fraction("sell_closing_cost_pct", sell_closing_cost_pct);

        require_finite("gov_levy_pct_of_rent", gov_levy_pct_of_rent);
        require_finite("mgmt_fee_pct_of_value_annual", mgmt_fee_pct_of_value_annual);

        return errors;
    }
};

/**
 * @brief SimulationParameters with continuous fields in the engine Scalar
 */
template <typename Scalar> struct ParameterSet {
    Scalar house_size;
    Scalar price_per_area;
    Scalar rent_per_area;
    Scalar down_payment_pct;
    Scalar mortgage_rate_annual;
    Scalar investment_return_annual;
    Scalar house_appreciation_annual;
    Scalar rent_increase_annual;
    Scalar gov_levy_pct_of_rent;
    Scalar mgmt_fee_pct_of_value_annual;
    Scalar buy_closing_cost_pct;
    Scalar sell_closing_cost_pct;

    int mortgage_years = 30;
    int horizon_years = 30;
    bool invest_monthly_diffs = true;

    [[nodiscard]] static ParameterSet FromParameters(const SimulationParameters &p) {
        ParameterSet set;
        set.house_size = Scalar{p.house_size};
        set.price_per_area = Scalar{p.price_per_area};
        set.rent_per_area = Scalar{p.rent_per_area};
        set.down_payment_pct = Scalar{p.down_payment_pct};
        set.mortgage_rate_annual = Scalar{p.mortgage_rate_annual};
        set.investment_return_annual = Scalar{p.investment_return_annual};
        set.house_appreciation_annual = Scalar{p.house_appreciation_annual};
        set.rent_increase_annual = Scalar{p.rent_increase_annual};
        set.gov_levy_pct_of_rent = Scalar{p.gov_levy_pct_of_rent};
        set.mgmt_fee_pct_of_value_annual = Scalar{p.mgmt_fee_pct_of_value_annual};
        set.buy_closing_cost_pct = Scalar{p.buy_closing_cost_pct};
        set.sell_closing_cost_pct = Scalar{p.sell_closing_cost_pct};
        set.mortgage_years = p.mortgage_years;
        set.horizon_years = p.horizon_years;
        set.invest_monthly_diffs = p.invest_monthly_diffs;
        return set;
    }

    [[nodiscard]] int Months() const { return horizon_years * kMonthsPerYear; }
};

} // namespace homestead
