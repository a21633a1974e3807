#pragma once

/**
 * @file ScenarioLoader.hpp
 * @brief Loads a rent-vs-buy scenario from YAML
 *
 * Uses Vulcan's YAML infrastructure for:
 * - !include directive resolution
 * - ${VAR} environment variable expansion
 * - Type-safe value extraction
 *
 * Every key is optional; missing keys keep SimulationParameters::Default().
 *
 * @code
 * scenario:
 *   name: hong_kong_500sqft
 * property:
 *   size: 500
 *   price_per_area: 20000
 *   rent_per_area: 50
 * mortgage:
 *   down_payment_pct: 0.30
 *   rate_annual: 0.035
 *   years: 30
 * market:
 *   investment_return_annual: 0.07
 *   house_appreciation_annual: 0.01
 *   rent_increase_annual: 0.02
 * costs:
 *   gov_levy_pct_of_rent: 0.05
 *   mgmt_fee_pct_of_value_annual: 0.0015
 *   buy_closing_cost_pct: 0.05
 *   sell_closing_cost_pct: 0.01
 * horizon:
 *   years: 30
 *   invest_monthly_diffs: true
 * logging:
 *   level: info
 *   quiet: false
 * @endcode
 */

#include <homestead/core/Error.hpp>
#include <homestead/io/LogService.hpp>
#include <homestead/sim/SimulationParameters.hpp>

#include <vulcan/io/YamlEnv.hpp>
#include <vulcan/io/YamlNode.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <string>

namespace homestead::io {

/**
 * @brief A named parameter set plus its logging preferences
 */
struct Scenario {
    std::string name = "default";
    std::string description;
    std::string source_file; ///< "<string>" when parsed from memory
    SimulationParameters params = SimulationParameters::Default();
    LogConfig logging = LogConfig::Default();
};

class ScenarioLoader {
  public:
    /**
     * @brief Load a scenario from file
     *
     * @param path Path to scenario YAML file
     * @throws IOError if the file does not exist
     * @throws ConfigError on parsing errors or undefined environment variables
     */
    static Scenario Load(const std::string &path) {
        if (!std::filesystem::exists(path)) {
            throw IOError("read", path, "file not found");
        }
        try {
            auto root = vulcan::io::YamlEnv::LoadWithIncludesAndEnv(path);
            return ParseRoot(root, path);
        } catch (const vulcan::io::EnvVarError &e) {
            // EnvVarError derives from YamlError, must catch first
            throw ConfigError("Undefined environment variable: " + e.var_name(), path, -1,
                              "Set the variable or use ${" + e.var_name() + ":default}");
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what(), path);
        } catch (const YAML::Exception &e) {
            // Conversion failures (e.g. text where a number is expected)
            throw ConfigError(e.what(), path, e.mark.line >= 0 ? e.mark.line + 1 : -1);
        }
    }

    /**
     * @brief Parse a scenario from a YAML string (for testing)
     */
    static Scenario Parse(const std::string &yaml_content) {
        try {
            auto root = vulcan::io::YamlNode::Parse(yaml_content);
            return ParseRoot(root, "<string>");
        } catch (const vulcan::io::YamlError &e) {
            throw ConfigError(e.what(), "<string>");
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.what(), "<string>", e.mark.line >= 0 ? e.mark.line + 1 : -1);
        }
    }

  private:
    static Scenario ParseRoot(const vulcan::io::YamlNode &root, const std::string &source_path) {
        Scenario scenario;
        scenario.source_file = source_path;

        if (root.Has("scenario")) {
            const auto node = root["scenario"];
            scenario.name = node.Get<std::string>("name", scenario.name);
            scenario.description = node.Get<std::string>("description", scenario.description);
        }
        if (root.Has("property")) {
            ParseProperty(scenario.params, root["property"]);
        }
        if (root.Has("mortgage")) {
            ParseMortgage(scenario.params, root["mortgage"]);
        }
        if (root.Has("market")) {
            ParseMarket(scenario.params, root["market"]);
        }
        if (root.Has("costs")) {
            ParseCosts(scenario.params, root["costs"]);
        }
        if (root.Has("horizon")) {
            ParseHorizon(scenario.params, root["horizon"]);
        }
        if (root.Has("logging")) {
            ParseLogging(scenario.logging, root["logging"], source_path);
        }
        return scenario;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseProperty(SimulationParameters &p, const vulcan::io::YamlNode &node) {
        p.house_size = node.Get<double>("size", p.house_size);
        p.price_per_area = node.Get<double>("price_per_area", p.price_per_area);
        p.rent_per_area = node.Get<double>("rent_per_area", p.rent_per_area);
    }

    static void ParseMortgage(SimulationParameters &p, const vulcan::io::YamlNode &node) {
        p.down_payment_pct = node.Get<double>("down_payment_pct", p.down_payment_pct);
        p.mortgage_rate_annual = node.Get<double>("rate_annual", p.mortgage_rate_annual);
        p.mortgage_years = node.Get<int>("years", p.mortgage_years);
    }

    static void ParseMarket(SimulationParameters &p, const vulcan::io::YamlNode &node) {
        p.investment_return_annual =
            node.Get<double>("investment_return_annual", p.investment_return_annual);
        p.house_appreciation_annual =
            node.Get<double>("house_appreciation_annual", p.house_appreciation_annual);
        p.rent_increase_annual = node.Get<double>("rent_increase_annual", p.rent_increase_annual);
    }

    static void ParseCosts(SimulationParameters &p, const vulcan::io::YamlNode &node) {
        p.gov_levy_pct_of_rent = node.Get<double>("gov_levy_pct_of_rent", p.gov_levy_pct_of_rent);
        p.mgmt_fee_pct_of_value_annual =
            node.Get<double>("mgmt_fee_pct_of_value_annual", p.mgmt_fee_pct_of_value_annual);
        p.buy_closing_cost_pct = node.Get<double>("buy_closing_cost_pct", p.buy_closing_cost_pct);
        p.sell_closing_cost_pct =
            node.Get<double>("sell_closing_cost_pct", p.sell_closing_cost_pct);
    }

    static void ParseHorizon(SimulationParameters &p, const vulcan::io::YamlNode &node) {
        p.horizon_years = node.Get<int>("years", p.horizon_years);
        p.invest_monthly_diffs = node.Get<bool>("invest_monthly_diffs", p.invest_monthly_diffs);
    }

    static void ParseLogging(LogConfig &cfg, const vulcan::io::YamlNode &node,
                             const std::string &source_path) {
        if (node.Has("level")) {
            auto name = node.Require<std::string>("level");
            auto level = ParseLogLevel(name);
            if (!level) {
                throw ConfigError("Unknown logging level '" + name + "'", source_path, -1,
                                  "Use one of: trace, debug, info, event, warning, error, fatal");
            }
            cfg.console_level = *level;
        }
        cfg.quiet_mode = node.Get<bool>("quiet", cfg.quiet_mode);
    }
};

} // namespace homestead::io
