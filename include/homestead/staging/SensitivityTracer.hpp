#pragma once

/**
 * @file SensitivityTracer.hpp
 * @brief Symbolic trace of the engine: net advantage and its rate gradient
 *
 * Runs SimulateScalar<SymbolicScalar> with the nine rate assumptions replaced
 * by CasADi symbols, then differentiates the net advantage with respect to
 * each of them. Physical quantities (size, prices, rent) and the integer
 * terms stay at their numeric values.
 *
 * Example usage:
 * @code
 * SensitivityTracer tracer(SimulationParameters::Default());
 * auto report = tracer.Evaluate();
 * double d_adv_d_mortgage_rate = report.gradient.at("mortgage_rate_annual");
 * @endcode
 */

#include <homestead/core/CoreTypes.hpp>
#include <homestead/core/Error.hpp>
#include <homestead/sim/Simulate.hpp>
#include <homestead/sim/SimulationParameters.hpp>

#include <janus/janus.hpp>

#include <array>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace homestead::staging {

/**
 * @brief Net advantage and its partial derivatives at one parameter point
 */
struct SensitivityReport {
    double net_advantage_buy = 0.0;
    std::map<std::string, double> gradient; ///< d(net_advantage_buy) / d(rate)
};

class SensitivityTracer {
  public:
    static constexpr std::size_t kNumRates = 9;

    /// Rates traced symbolically, in Function input order
    static const std::array<const char *, kNumRates> &RateNames() {
        static const std::array<const char *, kNumRates> names = {
            "down_payment_pct",          "mortgage_rate_annual",
            "investment_return_annual",  "house_appreciation_annual",
            "rent_increase_annual",      "gov_levy_pct_of_rent",
            "mgmt_fee_pct_of_value_annual", "buy_closing_cost_pct",
            "sell_closing_cost_pct"};
        return names;
    }

    explicit SensitivityTracer(SimulationParameters base) : base_(std::move(base)) {}

    /**
     * @brief Build the traced function
     *
     * Signature: (9 rates) -> (net_advantage_buy [1x1], gradient [9x1]).
     * Integer terms and the invest_monthly_diffs flag are baked in from the
     * base parameters.
     */
    [[nodiscard]] janus::Function Trace() const {
        std::array<SymbolicScalar, kNumRates> rates;
        for (std::size_t i = 0; i < kNumRates; ++i) {
            rates[i] = janus::sym(RateNames()[i]);
        }

        auto inputs = ParameterSet<SymbolicScalar>::FromParameters(base_);
        inputs.down_payment_pct = rates[0];
        inputs.mortgage_rate_annual = rates[1];
        inputs.investment_return_annual = rates[2];
        inputs.house_appreciation_annual = rates[3];
        inputs.rent_increase_annual = rates[4];
        inputs.gov_levy_pct_of_rent = rates[5];
        inputs.mgmt_fee_pct_of_value_annual = rates[6];
        inputs.buy_closing_cost_pct = rates[7];
        inputs.sell_closing_cost_pct = rates[8];

        auto result = SimulateScalar(inputs, "sensitivity");
        SymbolicScalar advantage = result.net_advantage_buy;

        std::vector<SymbolicScalar> partials;
        partials.reserve(kNumRates);
        for (const auto &rate : rates) {
            partials.push_back(janus::jacobian(advantage, rate));
        }

        std::vector<janus::SymbolicArg> function_inputs(rates.begin(), rates.end());
        std::vector<janus::SymbolicArg> function_outputs = {advantage,
                                                            SymbolicScalar::vertcat(partials)};
        return janus::Function("net_advantage_sensitivity", function_inputs, function_outputs);
    }

    /**
     * @brief Trace and evaluate at the base parameters
     * @throws ParameterError if the base parameters are invalid
     */
    [[nodiscard]] SensitivityReport Evaluate() const {
        auto violations = base_.Validate();
        if (!violations.empty()) {
            throw ParameterError::FromViolations(violations);
        }

        auto fn = Trace();
        auto res = fn(base_.down_payment_pct, base_.mortgage_rate_annual,
                      base_.investment_return_annual, base_.house_appreciation_annual,
                      base_.rent_increase_annual, base_.gov_levy_pct_of_rent,
                      base_.mgmt_fee_pct_of_value_annual, base_.buy_closing_cost_pct,
                      base_.sell_closing_cost_pct);

        SensitivityReport report;
        report.net_advantage_buy = res[0](0, 0);
        for (std::size_t i = 0; i < kNumRates; ++i) {
            report.gradient[RateNames()[i]] = res[1](static_cast<Eigen::Index>(i), 0);
        }
        return report;
    }

    [[nodiscard]] const SimulationParameters &Base() const { return base_; }

  private:
    SimulationParameters base_;
};

} // namespace homestead::staging
