/**
 * @file test_scenario_loader.cpp
 * @brief Unit tests for ScenarioLoader YAML parsing
 */

#include <gtest/gtest.h>
#include <homestead/io/ScenarioLoader.hpp>
#include <homestead/sim/Simulate.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

namespace homestead::io {
namespace {

class TempYamlFile {
  public:
    explicit TempYamlFile(const std::string &content) {
        path_ = "/tmp/homestead_loader_test_" + std::to_string(std::rand()) + ".yaml";
        std::ofstream out(path_);
        out << content;
    }

    ~TempYamlFile() { std::remove(path_.c_str()); }

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

// =============================================================================
// Parse Tests (from string)
// =============================================================================

TEST(ScenarioLoaderTest, EmptySectionsKeepDefaults) {
    auto s = ScenarioLoader::Parse("scenario:\n  name: bare\n");
    EXPECT_EQ(s.name, "bare");
    EXPECT_EQ(s.source_file, "<string>");
    EXPECT_DOUBLE_EQ(s.params.house_size, 500.0);
    EXPECT_DOUBLE_EQ(s.params.mortgage_rate_annual, 0.035);
    EXPECT_EQ(s.params.horizon_years, 30);
    EXPECT_EQ(s.logging.console_level, LogLevel::Info);
}

TEST(ScenarioLoaderTest, ParsesEverySection) {
    const char *yaml = R"(
scenario:
  name: "small flat"
  description: "Cheaper flat, shorter horizon"
property:
  size: 350
  price_per_area: 18000
  rent_per_area: 45
mortgage:
  down_payment_pct: 0.2
  rate_annual: 0.04
  years: 25
market:
  investment_return_annual: 0.05
  house_appreciation_annual: 0.015
  rent_increase_annual: 0.025
costs:
  gov_levy_pct_of_rent: 0.03
  mgmt_fee_pct_of_value_annual: 0.002
  buy_closing_cost_pct: 0.04
  sell_closing_cost_pct: 0.015
horizon:
  years: 20
  invest_monthly_diffs: false
logging:
  level: debug
  quiet: true
)";
    auto s = ScenarioLoader::Parse(yaml);
    EXPECT_EQ(s.name, "small flat");
    EXPECT_EQ(s.description, "Cheaper flat, shorter horizon");

    const auto &p = s.params;
    EXPECT_DOUBLE_EQ(p.house_size, 350.0);
    EXPECT_DOUBLE_EQ(p.price_per_area, 18000.0);
    EXPECT_DOUBLE_EQ(p.rent_per_area, 45.0);
    EXPECT_DOUBLE_EQ(p.down_payment_pct, 0.2);
    EXPECT_DOUBLE_EQ(p.mortgage_rate_annual, 0.04);
    EXPECT_EQ(p.mortgage_years, 25);
    EXPECT_DOUBLE_EQ(p.investment_return_annual, 0.05);
    EXPECT_DOUBLE_EQ(p.house_appreciation_annual, 0.015);
    EXPECT_DOUBLE_EQ(p.rent_increase_annual, 0.025);
    EXPECT_DOUBLE_EQ(p.gov_levy_pct_of_rent, 0.03);
    EXPECT_DOUBLE_EQ(p.mgmt_fee_pct_of_value_annual, 0.002);
    EXPECT_DOUBLE_EQ(p.buy_closing_cost_pct, 0.04);
    EXPECT_DOUBLE_EQ(p.sell_closing_cost_pct, 0.015);
    EXPECT_EQ(p.horizon_years, 20);
    EXPECT_FALSE(p.invest_monthly_diffs);

    EXPECT_EQ(s.logging.console_level, LogLevel::Debug);
    EXPECT_TRUE(s.logging.quiet_mode);
    EXPECT_EQ(s.logging.EffectiveLevel(), LogLevel::Error);
}

TEST(ScenarioLoaderTest, PartialSectionKeepsOtherFields) {
    auto s = ScenarioLoader::Parse("mortgage:\n  rate_annual: 0.0\n");
    EXPECT_DOUBLE_EQ(s.params.mortgage_rate_annual, 0.0);
    EXPECT_DOUBLE_EQ(s.params.down_payment_pct, 0.30);
    EXPECT_EQ(s.params.mortgage_years, 30);
}

TEST(ScenarioLoaderTest, UnknownLogLevelIsConfigError) {
    try {
        (void)ScenarioLoader::Parse("logging:\n  level: loud\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("loud"), std::string::npos);
        EXPECT_FALSE(e.hint().empty());
    }
}

TEST(ScenarioLoaderTest, WrongValueTypeIsConfigError) {
    EXPECT_THROW((void)ScenarioLoader::Parse("property:\n  size: large\n"), ConfigError);
}

TEST(ScenarioLoaderTest, MalformedYamlIsConfigError) {
    EXPECT_THROW((void)ScenarioLoader::Parse("property: [unclosed\n"), ConfigError);
}

TEST(ScenarioLoaderTest, LoaderDoesNotValidateRanges) {
    // Range checks belong to Simulate(), which reports every violation at once
    auto s = ScenarioLoader::Parse("property:\n  size: -10\n");
    EXPECT_DOUBLE_EQ(s.params.house_size, -10.0);
    EXPECT_THROW((void)Simulate(s.params), ParameterError);
}

// =============================================================================
// Load Tests (from file)
// =============================================================================

TEST(ScenarioLoaderTest, MissingFileIsIOError) {
    try {
        (void)ScenarioLoader::Load("/nonexistent/homestead/scenario.yaml");
        FAIL() << "expected IOError";
    } catch (const IOError &e) {
        EXPECT_EQ(e.path(), "/nonexistent/homestead/scenario.yaml");
    }
}

TEST(ScenarioLoaderTest, LoadsFromFile) {
    TempYamlFile file("scenario:\n  name: from_file\nhorizon:\n  years: 12\n");
    auto s = ScenarioLoader::Load(file.path());
    EXPECT_EQ(s.name, "from_file");
    EXPECT_EQ(s.source_file, file.path());
    EXPECT_EQ(s.params.horizon_years, 12);
}

TEST(ScenarioLoaderTest, ExpandsEnvironmentVariables) {
    ::setenv("HOMESTEAD_TEST_RATE", "0.05", 1);
    TempYamlFile file("mortgage:\n  rate_annual: ${HOMESTEAD_TEST_RATE}\n"
                      "market:\n  investment_return_annual: ${HOMESTEAD_TEST_UNSET_RETURN:0.06}\n");
    auto s = ScenarioLoader::Load(file.path());
    EXPECT_DOUBLE_EQ(s.params.mortgage_rate_annual, 0.05);
    EXPECT_DOUBLE_EQ(s.params.investment_return_annual, 0.06);
    ::unsetenv("HOMESTEAD_TEST_RATE");
}

TEST(ScenarioLoaderTest, UndefinedEnvironmentVariableIsConfigError) {
    ::unsetenv("HOMESTEAD_TEST_NEVER_SET");
    TempYamlFile file("mortgage:\n  rate_annual: ${HOMESTEAD_TEST_NEVER_SET}\n");
    try {
        (void)ScenarioLoader::Load(file.path());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("HOMESTEAD_TEST_NEVER_SET"), std::string::npos);
        EXPECT_EQ(e.file(), file.path());
    }
}

TEST(ScenarioLoaderTest, BundledHongKongScenarioMatchesDefaults) {
    auto s = ScenarioLoader::Load(std::string(HOMESTEAD_SOURCE_DIR) +
                                  "/examples/scenarios/hong_kong.yaml");
    EXPECT_EQ(s.name, "hong_kong_500sqft");

    auto from_file = Simulate(s.params);
    auto from_defaults = Simulate(SimulationParameters::Default());
    EXPECT_EQ(from_file.net_advantage_buy, from_defaults.net_advantage_buy);
}

} // namespace
} // namespace homestead::io
