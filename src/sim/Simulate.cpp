/**
 * @file Simulate.cpp
 * @brief Validated numeric entry point of the engine
 */

#include <homestead/core/ErrorLogging.hpp>
#include <homestead/sim/Simulate.hpp>

namespace homestead {

// Explicit template instantiation for the numeric backend
template SimulationResult<double> SimulateScalar<double>(const ParameterSet<double> &,
                                                         const std::string &);

SimulationResult<double> Simulate(const SimulationParameters &params,
                                  const std::string &scenario) {
    LogContextManager::ScopedContext ctx(scenario, "Simulate");

    auto violations = params.Validate();
    if (!violations.empty()) {
        HOMESTEAD_THROW_LOG_CTX(ParameterError::FromViolations(violations), kNoMonth, "Validate");
    }

    auto &log = GetLogService();
    log.Info(kNoMonth, "Simulating " + std::to_string(params.Months()) + " months (" +
                           std::to_string(params.horizon_years) + "y horizon, " +
                           std::to_string(params.mortgage_years) + "y mortgage)");

    auto result = SimulateScalar(ParameterSet<double>::FromParameters(params), scenario);

    log.Debug(kNoMonth, "Monthly mortgage payment: " +
                            Console::FormatNumber(result.Detail("monthly_mortgage_payment")));
    log.Event(result.months - 1,
              "Horizon settled: buy=" + Console::FormatCurrency(result.buy_net_worth) +
                  " rent=" + Console::FormatCurrency(result.rent_net_worth) +
                  " verdict=" + OutcomeName(result.Verdict()));
    return result;
}

} // namespace homestead
