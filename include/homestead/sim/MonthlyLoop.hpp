#pragma once

/**
 * @file MonthlyLoop.hpp
 * @brief Month-by-month recurrence of the rent-vs-buy engine
 *
 * Advances mortgage balance, property value, market rent and the two
 * side-investment balances for a fixed number of months. Dual-mode: the
 * data-dependent branch (which side invests the monthly difference) goes
 * through janus::where, and the balance floors through janus::max. The
 * final-payment check compares integer month counts, so it never depends
 * on a Scalar.
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/io/LogService.hpp>
#include <homestead/io/ScalarFormat.hpp>
#include <homestead/sim/ParameterNormalizer.hpp>
#include <homestead/sim/SimulationState.hpp>

#include <janus/janus.hpp>

#include <functional>
#include <string>
#include <utility>

namespace homestead {

/**
 * @brief Cash flows computed during one month
 */
template <typename Scalar> struct MonthlyCashFlow {
    Scalar interest;           ///< Mortgage interest on the opening balance
    Scalar principal;          ///< Principal repaid (floored at 0)
    Scalar management_fee;     ///< Property value * annual fee / 12
    Scalar government_levy;    ///< Market rent * levy fraction (monthly, not / 12)
    Scalar owner_cost;         ///< Payment + fee + levy
    Scalar renter_cost;        ///< Market rent
    Scalar owner_contribution; ///< Deposited to the owner side this month
    Scalar renter_contribution; ///< Deposited to the renter side this month
};

/**
 * @brief Runs the monthly recurrence over the simulation horizon
 *
 * Example usage:
 * @code
 * auto normalized = Normalize(ParameterSet<double>::FromParameters(params));
 * MonthlyLoop<double> loop(normalized);
 * SimulationState<double> final_state = loop.Run();
 * @endcode
 */
template <typename Scalar> class MonthlyLoop {
  public:
    /// Called after every month with the updated state and that month's flows
    using Observer = std::function<void(const SimulationState<Scalar> &,
                                        const MonthlyCashFlow<Scalar> &)>;

    explicit MonthlyLoop(const NormalizedParameters<Scalar> &params) : params_(params) {}

    void SetObserver(Observer observer) { observer_ = std::move(observer); }

    /// Run all months from the opening state
    [[nodiscard]] SimulationState<Scalar> Run() const {
        auto state = SimulationState<Scalar>::Initial(params_);

        // Month entries are collected and handed to the sinks when the loop ends
        LogService::BufferedScope buffered(GetLogService());

        while (state.month < params_.months) {
            auto flow = Step(state);
            if (observer_) {
                observer_(state, flow);
            }
            if (state.month % kMonthsPerYear == 0) {
                LogYearEnd(state);
            }
        }
        return state;
    }

    /**
     * @brief Advance one month
     *
     * Order is fixed: mortgage service, owner costs, renter cost, compounding
     * of balances carried in, differential deposit, cash-out totals, then
     * market growth (so this month's costs use this month's value and rent).
     */
    MonthlyCashFlow<Scalar> Step(SimulationState<Scalar> &state) const {
        const Scalar zero{0.0};
        MonthlyCashFlow<Scalar> flow;

        // 1. Mortgage service
        flow.interest = state.remaining_balance * params_.mortgage_rate_monthly;
        if (state.month + 1 == params_.mortgage_payments) {
            // Departs from a plain floored amortization step: the last
            // scheduled payment retires whatever rounding left behind, so the
            // balance is exactly 0 after n payments. Differs by about 5e-8.
            flow.principal = state.remaining_balance;
            state.remaining_balance = zero;
        } else {
            flow.principal = janus::max(params_.mortgage_payment - flow.interest, zero);
            state.remaining_balance = janus::max(state.remaining_balance - flow.principal, zero);
        }

        // 2. Recurring owner costs
        flow.management_fee = state.property_value * params_.mgmt_fee_pct_of_value_annual /
                              Scalar{static_cast<double>(kMonthsPerYear)};
        flow.government_levy = GovernmentLevy(state.market_rent, params_.gov_levy_pct_of_rent);
        flow.owner_cost = params_.mortgage_payment + flow.management_fee + flow.government_levy;

        // 3. Renter cost
        flow.renter_cost = state.market_rent;

        // 4. Compound the balances carried in from last month
        const Scalar growth = Scalar{1.0} + params_.investment_rate_monthly;
        state.owner_side_invest *= growth;
        state.renter_invest *= growth;

        // 5. Whichever side is cheaper this month invests the difference
        flow.owner_contribution = zero;
        flow.renter_contribution = zero;
        if (params_.invest_monthly_diffs) {
            const Scalar diff = flow.owner_cost - flow.renter_cost;
            flow.renter_contribution = janus::where(diff > zero, diff, zero);
            flow.owner_contribution = janus::where(diff > zero, zero, -diff);
            state.renter_invest += flow.renter_contribution;
            state.owner_side_invest += flow.owner_contribution;
        }

        // 6. Diagnostics
        state.total_renter_cash_out += flow.renter_cost;
        state.total_owner_cash_out += flow.owner_cost;

        // 7. Market update, visible from next month
        state.property_value *= params_.house_growth_factor;
        state.market_rent *= params_.rent_growth_factor;

        ++state.month;
        return flow;
    }

    /**
     * @brief Monthly government levy
     *
     * The levy fraction is quoted per year but applied to the *monthly*
     * market rent every month without dividing by 12, so the owner pays
     * roughly 12x a literal "fraction of annual rent" reading. Kept as-is.
     */
    [[nodiscard]] static Scalar GovernmentLevy(const Scalar &market_rent,
                                               const Scalar &levy_pct_of_rent) {
        return market_rent * levy_pct_of_rent;
    }

    [[nodiscard]] const NormalizedParameters<Scalar> &Params() const { return params_; }

  private:
    NormalizedParameters<Scalar> params_;
    Observer observer_;

    void LogYearEnd(const SimulationState<Scalar> &state) const {
        auto &log = GetLogService();
        if (LogLevel::Debug < log.GetMinLevel()) {
            return;
        }
        log.Debug(state.month - 1,
                  "Year " + std::to_string(state.month / kMonthsPerYear) +
                      ": balance=" + io::FormatScalar(state.remaining_balance) +
                      " property=" + io::FormatScalar(state.property_value) +
                      " rent=" + io::FormatScalar(state.market_rent) +
                      " owner_invest=" + io::FormatScalar(state.owner_side_invest) +
                      " renter_invest=" + io::FormatScalar(state.renter_invest));
    }
};

} // namespace homestead
