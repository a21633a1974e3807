#pragma once

/**
 * @file SimulationResult.hpp
 * @brief Outcome of one rent-vs-buy simulation
 */

#include <homestead/core/CoreTypes.hpp>

#include <concepts>
#include <map>
#include <string>

namespace homestead {

/**
 * @brief Which strategy ends the horizon with more net worth
 */
enum class Outcome : uint8_t {
    Buy,  ///< net_advantage_buy > 0
    Rent, ///< net_advantage_buy < 0
    Tie   ///< exactly equal
};

[[nodiscard]] inline Outcome ClassifyAdvantage(double net_advantage_buy) {
    if (net_advantage_buy > 0.0) {
        return Outcome::Buy;
    }
    if (net_advantage_buy < 0.0) {
        return Outcome::Rent;
    }
    return Outcome::Tie;
}

[[nodiscard]] inline const char *OutcomeName(Outcome outcome) {
    switch (outcome) {
    case Outcome::Buy:
        return "buy";
    case Outcome::Rent:
        return "rent";
    case Outcome::Tie:
        return "tie";
    }
    return "unknown";
}

/**
 * @brief Result record assembled once by HorizonSettlement
 *
 * `params` echoes the derived inputs (house_price and monthly_rent instead
 * of the per-area figures). `details` carries every terminal diagnostic:
 * remaining_mortgage_balance, property_value_end, monthly_rent_end,
 * sale_closing_cost, owner_equity_realized, owner_side_invest_end,
 * renter_invest_end, total_owner_cash_out, total_renter_cash_out,
 * monthly_mortgage_payment.
 */
template <typename Scalar> struct SimulationResult {
    // =========================================================================
    // Echoed inputs
    // =========================================================================

    std::map<std::string, Scalar> params;
    int mortgage_years = 0;
    int horizon_years = 0;
    bool invest_monthly_diffs = true;

    // =========================================================================
    // Comparison
    // =========================================================================

    int months = 0;           ///< Steps simulated (horizon_years * 12)
    Scalar buy_net_worth{};   ///< Realized equity + owner side investments
    Scalar rent_net_worth{};  ///< Renter investments
    Scalar net_advantage_buy{}; ///< buy - rent; positive means buying wins

    // =========================================================================
    // Diagnostics
    // =========================================================================

    std::map<std::string, Scalar> details;

    [[nodiscard]] Outcome Verdict() const
        requires std::same_as<Scalar, double>
    {
        return ClassifyAdvantage(net_advantage_buy);
    }

    /// Look up a detail by name (throws std::out_of_range if absent)
    [[nodiscard]] const Scalar &Detail(const std::string &name) const { return details.at(name); }
};

} // namespace homestead
