#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "humidor/core/engine_config.h"

namespace humidor {
namespace {

class ScopedEnvVar {
public:
    ScopedEnvVar(std::string key, const char* value)
        : key_(std::move(key)) {
        const char* previous = std::getenv(key_.c_str());
        if (previous != nullptr) {
            had_previous_ = true;
            previous_value_ = previous;
        }
        if (value == nullptr) {
            unsetenv(key_.c_str());
        } else {
            setenv(key_.c_str(), value, 1);
        }
    }

    ~ScopedEnvVar() {
        if (had_previous_) {
            setenv(key_.c_str(), previous_value_.c_str(), 1);
            return;
        }
        unsetenv(key_.c_str());
    }

private:
    std::string key_;
    bool had_previous_{false};
    std::string previous_value_;
};

std::filesystem::path WriteTempConfig(const std::string& body) {
    const auto token = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    const auto path = std::filesystem::temp_directory_path() /
                      ("humidor_engine_config_loader_test_" + token + ".yaml");
    std::ofstream out(path);
    out << body;
    return path;
}

}  // namespace

TEST(EngineConfigLoaderTest, ResolveEnvVarsReplacesExistingEnvVar) {
    const ScopedEnvVar env("HUMIDOR_TEST_ENV_KEY", "resolved-value");
    EXPECT_EQ(EngineConfigLoader::ResolveEnvVars("prefix-${HUMIDOR_TEST_ENV_KEY}-suffix"),
              "prefix-resolved-value-suffix");
}

TEST(EngineConfigLoaderTest, ResolveEnvVarsLeavesUnknownVarEmpty) {
    const ScopedEnvVar env("HUMIDOR_TEST_UNKNOWN_KEY", nullptr);
    EXPECT_EQ(EngineConfigLoader::ResolveEnvVars("left-${HUMIDOR_TEST_UNKNOWN_KEY}-right"),
              "left--right");
    EXPECT_EQ(EngineConfigLoader::ResolveEnvVars("open-${NEVER_CLOSED"), "open-${NEVER_CLOSED");
}

TEST(EngineConfigLoaderTest, LoadsAllFieldsWithCommentsAndQuotes) {
    const ScopedEnvVar data_dir_override("HUMIDOR_DATA_DIR", nullptr);
    const ScopedEnvVar home("HUMIDOR_TEST_HOME", "/srv/humidor");
    const auto path = WriteTempConfig(
        "humidor:\n"
        "  data_dir: \"${HUMIDOR_TEST_HOME}/data\"  # where json lives\n"
        "  default_tax_rate: 7.25\n"
        "  log_level: WARN\n"
        "  log_sink: stdout\n"
        "  inventory_file: 'lots.json'\n"
        "  autosave: no\n");

    EngineConfig config;
    std::string error;
    ASSERT_TRUE(EngineConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.data_dir, "/srv/humidor/data");
    EXPECT_DOUBLE_EQ(config.default_tax_rate, 0.0725);
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.log_sink, "stdout");
    EXPECT_EQ(config.inventory_file, "lots.json");
    EXPECT_EQ(config.ledger_file, "transaction_ledger.json");
    EXPECT_FALSE(config.autosave);
    std::filesystem::remove(path);
}

TEST(EngineConfigLoaderTest, DataDirEnvironmentOverridesFile) {
    const ScopedEnvVar data_dir_override("HUMIDOR_DATA_DIR", "/tmp/override");
    const auto path = WriteTempConfig("humidor:\n  data_dir: /var/lib/humidor\n");

    EngineConfig config;
    std::string error;
    ASSERT_TRUE(EngineConfigLoader::LoadFromYaml(path.string(), &config, &error)) << error;
    EXPECT_EQ(config.data_dir, "/tmp/override");
    std::filesystem::remove(path);
}

TEST(EngineConfigLoaderTest, RejectsInvalidValues) {
    const ScopedEnvVar data_dir_override("HUMIDOR_DATA_DIR", nullptr);
    EngineConfig config;
    config.data_dir = "untouched";
    std::string error;

    auto path = WriteTempConfig("humidor:\n  default_tax_rate: lots\n");
    EXPECT_FALSE(EngineConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_EQ(error, "invalid default_tax_rate: lots");
    std::filesystem::remove(path);

    path = WriteTempConfig("humidor:\n  log_level: verbose\n");
    EXPECT_FALSE(EngineConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_EQ(error, "invalid log_level: verbose");
    std::filesystem::remove(path);

    path = WriteTempConfig("humidor:\n  autosave: sometimes\n");
    EXPECT_FALSE(EngineConfigLoader::LoadFromYaml(path.string(), &config, &error));
    EXPECT_EQ(error, "invalid bool value for autosave");
    std::filesystem::remove(path);

    EXPECT_EQ(config.data_dir, "untouched");
}

TEST(EngineConfigLoaderTest, MissingFileReportsPath) {
    EngineConfig config;
    std::string error;
    EXPECT_FALSE(
        EngineConfigLoader::LoadFromYaml("/nonexistent/humidor.yaml", &config, &error));
    EXPECT_EQ(error, "unable to open config: /nonexistent/humidor.yaml");
}

TEST(EngineConfigLoaderTest, EnvironmentWithoutConfigPathUsesDefaults) {
    const ScopedEnvVar config_path("HUMIDOR_CONFIG_PATH", nullptr);
    const ScopedEnvVar data_dir_override("HUMIDOR_DATA_DIR", "/tmp/humidor_env");

    EngineConfig config;
    config.default_tax_rate = 0.5;
    std::string error;
    ASSERT_TRUE(EngineConfigLoader::LoadFromEnvironment(&config, &error)) << error;
    EXPECT_EQ(config.data_dir, "/tmp/humidor_env");
    EXPECT_DOUBLE_EQ(config.default_tax_rate, 0.086);
    EXPECT_TRUE(config.autosave);
}

TEST(EngineConfigLoaderTest, EnvironmentConfigPathIsLoaded) {
    const ScopedEnvVar data_dir_override("HUMIDOR_DATA_DIR", nullptr);
    const auto path = WriteTempConfig("humidor:\n  default_tax_rate: 0.05\n");
    const ScopedEnvVar config_path("HUMIDOR_CONFIG_PATH", path.c_str());

    EngineConfig config;
    std::string error;
    ASSERT_TRUE(EngineConfigLoader::LoadFromEnvironment(&config, &error)) << error;
    EXPECT_DOUBLE_EQ(config.default_tax_rate, 0.05);
    std::filesystem::remove(path);
}

}  // namespace humidor
