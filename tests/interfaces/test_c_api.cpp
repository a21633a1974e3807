/**
 * @file test_c_api.cpp
 * @brief Tests for the Homestead C API
 */

#include <gtest/gtest.h>
#include <homestead.h>
#include <homestead_c_guard.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

// =============================================================================
// Temporary File Helper
// =============================================================================

class TempYamlFile {
  public:
    explicit TempYamlFile(const std::string &content) {
        path_ = "/tmp/homestead_c_api_test_" + std::to_string(std::rand()) + ".yaml";
        std::ofstream out(path_);
        out << content;
    }

    ~TempYamlFile() { std::remove(path_.c_str()); }

    [[nodiscard]] const char *path() const { return path_.c_str(); }

  private:
    std::string path_;
};

/// Owns a string returned by the API
class ApiString {
  public:
    ~ApiString() { homestead_free_string(ptr_); }
    char **out() { return &ptr_; }
    [[nodiscard]] const char *get() const { return ptr_; }

  private:
    char *ptr_ = nullptr;
};

const char *kShortScenario = R"(
scenario:
  name: c_api_short
horizon:
  years: 5
)";

// =============================================================================
// Simulation
// =============================================================================

TEST(CApiTest, SimulateDefault) {
    ApiString json;
    ASSERT_EQ(homestead_simulate_default(json.out()), HOMESTEAD_OK);
    ASSERT_NE(json.get(), nullptr);
    EXPECT_STREQ(homestead_get_last_error(), "");

    auto j = nlohmann::json::parse(json.get());
    EXPECT_EQ(j["months"], 360);
    EXPECT_EQ(j["verdict"], "rent");
    EXPECT_NEAR(j["net_advantage_buy"].get<double>(), -17'010'527.208618414, 1e-3);
    EXPECT_TRUE(j.contains("params"));
    EXPECT_TRUE(j.contains("details"));
}

TEST(CApiTest, SimulateFile) {
    TempYamlFile file(kShortScenario);
    ApiString json;
    ASSERT_EQ(homestead_simulate_file(file.path(), json.out()), HOMESTEAD_OK);

    auto j = nlohmann::json::parse(json.get());
    EXPECT_EQ(j["scenario"], "c_api_short");
    EXPECT_EQ(j["months"], 60);
    EXPECT_EQ(j["horizon_years"], 5);
}

TEST(CApiTest, SimulateYaml) {
    ApiString json;
    ASSERT_EQ(homestead_simulate_yaml(kShortScenario, json.out()), HOMESTEAD_OK);
    auto j = nlohmann::json::parse(json.get());
    EXPECT_EQ(j["months"], 60);
}

// =============================================================================
// Errors
// =============================================================================

TEST(CApiTest, NullArguments) {
    ApiString json;
    EXPECT_EQ(homestead_simulate_file(nullptr, json.out()), HOMESTEAD_ERROR_NULL_ARGUMENT);
    EXPECT_EQ(json.get(), nullptr);
    EXPECT_EQ(homestead_simulate_default(nullptr), HOMESTEAD_ERROR_NULL_ARGUMENT);
    EXPECT_STREQ(homestead_get_last_error(), "out_json is NULL");
}

TEST(CApiTest, MissingFileIsIOError) {
    ApiString json;
    EXPECT_EQ(homestead_simulate_file("/nonexistent/scenario.yaml", json.out()),
              HOMESTEAD_ERROR_IO);
    EXPECT_EQ(json.get(), nullptr);
    EXPECT_NE(std::string(homestead_get_last_error()).find("/nonexistent/scenario.yaml"),
              std::string::npos);
}

TEST(CApiTest, InvalidParameters) {
    ApiString json;
    EXPECT_EQ(homestead_simulate_yaml("property:\n  size: 0\n", json.out()),
              HOMESTEAD_ERROR_INVALID_PARAMETERS);
    EXPECT_NE(std::string(homestead_get_last_error()).find("house_size"), std::string::npos);
}

TEST(CApiTest, BadConfig) {
    ApiString json;
    EXPECT_EQ(homestead_simulate_yaml("logging:\n  level: loud\n", json.out()),
              HOMESTEAD_ERROR_CONFIG_LOAD);
}

TEST(CApiTest, SuccessClearsLastError) {
    ApiString bad;
    ApiString good;
    (void)homestead_simulate_yaml("property:\n  size: 0\n", bad.out());
    EXPECT_STRNE(homestead_get_last_error(), "");
    ASSERT_EQ(homestead_simulate_default(good.out()), HOMESTEAD_OK);
    EXPECT_STREQ(homestead_get_last_error(), "");
}

TEST(CApiTest, ErrorNames) {
    EXPECT_STREQ(homestead_error_name(HOMESTEAD_OK), "HOMESTEAD_OK");
    EXPECT_STREQ(homestead_error_name(HOMESTEAD_ERROR_INVALID_PARAMETERS),
                 "HOMESTEAD_ERROR_INVALID_PARAMETERS");
    EXPECT_STREQ(homestead_error_name(static_cast<HomesteadError>(-42)),
                 "HOMESTEAD_ERROR_UNKNOWN");
}

// =============================================================================
// Version
// =============================================================================

TEST(CApiTest, Version) {
    EXPECT_STREQ(homestead_version(), "0.2.0");
    int major = -1;
    int minor = -1;
    int patch = -1;
    homestead_version_components(&major, &minor, &patch);
    EXPECT_EQ(major, 0);
    EXPECT_EQ(minor, 2);
    EXPECT_EQ(patch, 0);
    homestead_version_components(nullptr, nullptr, nullptr);
}

// =============================================================================
// Exception Guard
// =============================================================================

TEST(CApiGuardTest, NonStandardExceptionBecomesUnknown) {
    std::string last_error;
    auto code = homestead::capi::GuardedCall(last_error, []() -> HomesteadError { throw 42; });
    EXPECT_EQ(code, HOMESTEAD_ERROR_UNKNOWN);
    EXPECT_EQ(last_error, "Unknown error");
}

TEST(CApiGuardTest, TranslatesHomesteadErrors) {
    std::string last_error;
    auto code = homestead::capi::GuardedCall(last_error, []() -> HomesteadError {
        throw homestead::IOError("read", "/nope.yaml", "file not found");
    });
    EXPECT_EQ(code, HOMESTEAD_ERROR_IO);
    EXPECT_NE(last_error.find("/nope.yaml"), std::string::npos);

    code = homestead::capi::GuardedCall(last_error, []() -> HomesteadError {
        throw homestead::ConfigError("bad level");
    });
    EXPECT_EQ(code, HOMESTEAD_ERROR_CONFIG_LOAD);
}

TEST(CApiGuardTest, OtherStandardExceptionsAreUnknown) {
    std::string last_error;
    auto code = homestead::capi::GuardedCall(
        last_error, []() -> HomesteadError { throw std::logic_error("broken invariant"); });
    EXPECT_EQ(code, HOMESTEAD_ERROR_UNKNOWN);
    EXPECT_EQ(last_error, "broken invariant");
}

TEST(CApiGuardTest, PassesThroughReturnCode) {
    std::string last_error = "stale";
    auto code = homestead::capi::GuardedCall(last_error, [] { return HOMESTEAD_OK; });
    EXPECT_EQ(code, HOMESTEAD_OK);
    EXPECT_EQ(last_error, "stale");
}

} // namespace
