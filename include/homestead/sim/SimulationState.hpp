#pragma once

/**
 * @file SimulationState.hpp
 * @brief Mutable per-month state of the rent-vs-buy engine
 */

#include <homestead/sim/ParameterNormalizer.hpp>

namespace homestead {

/**
 * @brief State advanced once per month by the MonthlyLoop
 *
 * Owned by a single loop invocation; its final values feed settlement.
 */
template <typename Scalar> struct SimulationState {
    Scalar remaining_balance; ///< Outstanding mortgage principal
    Scalar property_value;    ///< Current market value of the home
    Scalar market_rent;       ///< Current monthly market rent

    Scalar owner_side_invest; ///< Owner's savings account
    Scalar renter_invest;     ///< Renter's savings account

    // Diagnostics only, not part of the comparison
    Scalar total_owner_cash_out;
    Scalar total_renter_cash_out;

    int month = 0; ///< Months completed

    /**
     * @brief Opening state at purchase date
     *
     * The renter starts with the cash the buyer spends upfront
     * (down payment + buy closing cost) already invested.
     */
    [[nodiscard]] static SimulationState Initial(const NormalizedParameters<Scalar> &n) {
        SimulationState s;
        s.remaining_balance = n.loan_principal;
        s.property_value = n.house_price;
        s.market_rent = n.monthly_rent;
        s.owner_side_invest = Scalar{0.0};
        s.renter_invest = n.down_payment + n.buy_closing_cost;
        s.total_owner_cash_out = n.down_payment + n.buy_closing_cost;
        s.total_renter_cash_out = Scalar{0.0};
        s.month = 0;
        return s;
    }
};

} // namespace homestead
