#pragma once

/**
 * @file HorizonSettlement.hpp
 * @brief Liquidates the property at the horizon and assembles the result
 */

#include <homestead/sim/ParameterNormalizer.hpp>
#include <homestead/sim/SimulationParameters.hpp>
#include <homestead/sim/SimulationResult.hpp>
#include <homestead/sim/SimulationState.hpp>

#include <janus/janus.hpp>

namespace homestead {

/**
 * @brief Settle the final state into a SimulationResult
 *
 * The owner sells at the final property value, pays the sale closing cost
 * and clears the remaining balance. Realized equity is floored at zero and
 * added at face value (no compounding past the horizon).
 */
template <typename Scalar>
SimulationResult<Scalar> Settle(const ParameterSet<Scalar> &inputs,
                                const NormalizedParameters<Scalar> &n,
                                const SimulationState<Scalar> &final_state) {
    const Scalar sale_proceeds = final_state.property_value;
    const Scalar sale_closing_cost = sale_proceeds * n.sell_closing_cost_pct;
    const Scalar owner_equity = janus::max(
        sale_proceeds - sale_closing_cost - final_state.remaining_balance, Scalar{0.0});

    SimulationResult<Scalar> r;
    r.months = final_state.month;
    r.buy_net_worth = owner_equity + final_state.owner_side_invest;
    r.rent_net_worth = final_state.renter_invest;
    r.net_advantage_buy = r.buy_net_worth - r.rent_net_worth;

    r.params = {
        {"house_price", n.house_price},
        {"monthly_rent", n.monthly_rent},
        {"down_payment_pct", inputs.down_payment_pct},
        {"mortgage_rate_annual", inputs.mortgage_rate_annual},
        {"investment_return_annual", inputs.investment_return_annual},
        {"house_appreciation_annual", inputs.house_appreciation_annual},
        {"rent_increase_annual", inputs.rent_increase_annual},
        {"gov_levy_pct_of_rent", inputs.gov_levy_pct_of_rent},
        {"mgmt_fee_pct_of_value_annual", inputs.mgmt_fee_pct_of_value_annual},
        {"buy_closing_cost_pct", inputs.buy_closing_cost_pct},
        {"sell_closing_cost_pct", inputs.sell_closing_cost_pct},
    };
    r.mortgage_years = inputs.mortgage_years;
    r.horizon_years = inputs.horizon_years;
    r.invest_monthly_diffs = inputs.invest_monthly_diffs;

    r.details = {
        {"remaining_mortgage_balance", final_state.remaining_balance},
        {"property_value_end", final_state.property_value},
        {"monthly_rent_end", final_state.market_rent},
        {"sale_closing_cost", sale_closing_cost},
        {"owner_equity_realized", owner_equity},
        {"owner_side_invest_end", final_state.owner_side_invest},
        {"renter_invest_end", final_state.renter_invest},
        {"total_owner_cash_out", final_state.total_owner_cash_out},
        {"total_renter_cash_out", final_state.total_renter_cash_out},
        {"monthly_mortgage_payment", n.mortgage_payment},
    };
    return r;
}

} // namespace homestead
