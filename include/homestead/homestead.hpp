#pragma once

/**
 * @file homestead.hpp
 * @brief Umbrella header for the Homestead rent-vs-buy simulator
 *
 * Include this header to get access to all Homestead public APIs.
 */

// Core
#include <homestead/core/CoreTypes.hpp>
#include <homestead/core/Error.hpp>
#include <homestead/core/ErrorLogging.hpp>

// Simulation
#include <homestead/sim/Annuity.hpp>
#include <homestead/sim/ClosedFormEstimate.hpp>
#include <homestead/sim/HorizonSettlement.hpp>
#include <homestead/sim/MonthlyLoop.hpp>
#include <homestead/sim/ParameterNormalizer.hpp>
#include <homestead/sim/Simulate.hpp>
#include <homestead/sim/SimulationParameters.hpp>
#include <homestead/sim/SimulationResult.hpp>
#include <homestead/sim/SimulationState.hpp>

// Symbolic
#include <homestead/staging/SensitivityTracer.hpp>

// I/O
#include <homestead/io/Console.hpp>
#include <homestead/io/LogService.hpp>
#include <homestead/io/ResultJson.hpp>
#include <homestead/io/ScalarFormat.hpp>
#include <homestead/io/ScenarioLoader.hpp>
#include <homestead/io/report/AsciiTable.hpp>
#include <homestead/io/report/Banner.hpp>
#include <homestead/io/report/ComparisonReport.hpp>
