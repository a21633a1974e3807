#pragma once

/**
 * @file ResultJson.hpp
 * @brief JSON export of numeric simulation results
 */

#include <homestead/sim/SimulationResult.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace homestead::io {

/**
 * @brief Convert a result to JSON
 *
 * Layout: { scenario, params{...}, mortgage_years, horizon_years,
 * invest_monthly_diffs, months, buy_net_worth, rent_net_worth,
 * net_advantage_buy, verdict, details{...} }
 */
inline nlohmann::json ResultToJson(const SimulationResult<double> &result,
                                   const std::string &scenario = "") {
    nlohmann::json j;
    if (!scenario.empty()) {
        j["scenario"] = scenario;
    }

    j["params"] = nlohmann::json::object();
    for (const auto &[name, value] : result.params) {
        j["params"][name] = value;
    }
    j["mortgage_years"] = result.mortgage_years;
    j["horizon_years"] = result.horizon_years;
    j["invest_monthly_diffs"] = result.invest_monthly_diffs;

    j["months"] = result.months;
    j["buy_net_worth"] = result.buy_net_worth;
    j["rent_net_worth"] = result.rent_net_worth;
    j["net_advantage_buy"] = result.net_advantage_buy;
    j["verdict"] = OutcomeName(result.Verdict());

    j["details"] = nlohmann::json::object();
    for (const auto &[name, value] : result.details) {
        j["details"][name] = value;
    }
    return j;
}

} // namespace homestead::io
