#pragma once

/**
 * @file Simulate.hpp
 * @brief Entry points of the rent-vs-buy engine
 *
 * Data flows strictly Normalize -> MonthlyLoop -> Settle. Each stage runs
 * under its own log context so entries read "scenario.MonthlyLoop" etc.
 */

#include <homestead/io/LogService.hpp>
#include <homestead/sim/HorizonSettlement.hpp>
#include <homestead/sim/MonthlyLoop.hpp>
#include <homestead/sim/ParameterNormalizer.hpp>
#include <homestead/sim/SimulationParameters.hpp>
#include <homestead/sim/SimulationResult.hpp>

#include <string>

namespace homestead {

/**
 * @brief Run the engine on an already-lifted parameter set
 *
 * Performs no validation: callers either come through Simulate() or build
 * the set themselves (the sensitivity tracer substitutes symbols).
 */
template <typename Scalar>
SimulationResult<Scalar> SimulateScalar(const ParameterSet<Scalar> &inputs,
                                        const std::string &scenario = "") {
    NormalizedParameters<Scalar> normalized;
    {
        LogContextManager::ScopedContext ctx(scenario, "Normalizer");
        normalized = Normalize(inputs);
    }

    SimulationState<Scalar> final_state;
    {
        LogContextManager::ScopedContext ctx(scenario, "MonthlyLoop");
        MonthlyLoop<Scalar> loop(normalized);
        final_state = loop.Run();
    }
    HOMESTEAD_ASSERT(final_state.month == normalized.months, "monthly loop stopped early");

    LogContextManager::ScopedContext ctx(scenario, "Settlement");
    return Settle(inputs, normalized, final_state);
}

/**
 * @brief Simulate buying vs renting for one household
 *
 * Validates the parameters, then runs the numeric engine. Pure: identical
 * inputs give bit-identical results.
 *
 * @param params Scenario inputs
 * @param scenario Name used as log context (optional)
 * @throws ParameterError if any input constraint is violated; nothing is simulated
 */
SimulationResult<double> Simulate(const SimulationParameters &params,
                                  const std::string &scenario = "");

extern template SimulationResult<double> SimulateScalar<double>(const ParameterSet<double> &,
                                                                const std::string &);

} // namespace homestead
