/**
 * @file test_config.cpp
 * @brief Config defaults, JSON loading and environment overrides.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "util/logger.hpp"

using json = nlohmann::json;
using codebox::config::Config;
using codebox::config::ConfigError;

namespace fs = std::filesystem;

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : ENV_VARS) {
            unsetenv(name);
        }
    }
    void TearDown() override { SetUp(); }

    static constexpr const char* ENV_VARS[] = {
        "CODEBOX_CONFIG", "CODEBOX_IMAGE", "CODEBOX_TIMEOUT", "CODEBOX_MEMORY_LIMIT",
        "CODEBOX_NETWORK_DISABLED", "CODEBOX_LOG_LEVEL"
    };
};

TEST(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.container.image, "codebox-lean:latest");
    EXPECT_EQ(cfg.container.memory_limit, "256m");
    EXPECT_EQ(cfg.container.timeout.count(), 30);
    EXPECT_TRUE(cfg.container.network_disabled);
    EXPECT_EQ(cfg.container.cpu_quota_us(), 50000);
    EXPECT_EQ(cfg.toolchain.command, (std::vector<std::string>{"lean", "--run"}));
    EXPECT_EQ(cfg.validation.allowed_namespaces.size(), 4u);
    EXPECT_FALSE(cfg.protocol.diagnostics_as_errors);
}

TEST(ConfigTest, PartialJsonKeepsDefaults) {
    auto cfg = Config::from_json({
        {"container", {{"image", "python:3.12-slim"}, {"timeout", 5}, {"poll_interval_ms", 50}}},
        {"toolchain", {{"command", {"python3"}}, {"script_extension", ".py"}}},
        {"validation", {{"allowed_namespaces", json::array()}}},
        {"protocol", {{"diagnostics_as_errors", true}}},
        {"unknown_key", 1}
    });

    EXPECT_EQ(cfg.container.image, "python:3.12-slim");
    EXPECT_EQ(cfg.container.timeout.count(), 5);
    EXPECT_EQ(cfg.container.poll_interval.count(), 50);
    EXPECT_EQ(cfg.container.memory_limit, "256m");
    EXPECT_EQ(cfg.toolchain.command, std::vector<std::string>{"python3"});
    EXPECT_EQ(cfg.toolchain.script_extension, ".py");
    EXPECT_TRUE(cfg.validation.allowed_namespaces.empty());
    EXPECT_EQ(cfg.validation.blocked_namespaces.size(), 2u);
    EXPECT_TRUE(cfg.protocol.diagnostics_as_errors);
}

TEST(ConfigTest, ToJsonRoundTripsThroughFromJson) {
    Config original;
    original.container.memory_limit = "1g";
    original.container.read_only = true;
    Config copy = Config::from_json(original.to_json());
    EXPECT_EQ(copy.to_json(), original.to_json());
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(Config::from_json(json::array()), ConfigError);
    EXPECT_THROW(Config::from_json({{"container", {{"memory_limit", "lots"}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"container", {{"timeout", 0}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"container", {{"timeout", "ten"}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"container", {{"cpu_limit", -1.0}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"toolchain", {{"command", json::array()}}}}), ConfigError);
    EXPECT_THROW(Config::from_json({{"validation", {{"disallowed_operations", {"("}}}}}), ConfigError);
}

TEST(ConfigTest, LoadFileErrors) {
    EXPECT_THROW(Config::load_file("/nonexistent/codebox.json"), ConfigError);

    fs::path path = fs::temp_directory_path() / "codebox_test_bad_config.json";
    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    EXPECT_THROW(Config::load_file(path.string()), ConfigError);
    fs::remove(path);
}

TEST_F(ConfigEnvTest, ExplicitPathThenEnvironment) {
    fs::path path = fs::temp_directory_path() / "codebox_test_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"container": {"image": "from-file", "timeout": 12}, "log_level": "debug"})";
    }

    auto cfg = Config::load(path.string());
    EXPECT_EQ(cfg.container.image, "from-file");
    EXPECT_EQ(cfg.container.timeout.count(), 12);
    EXPECT_EQ(cfg.log_level, "debug");

    setenv("CODEBOX_IMAGE", "from-env", 1);
    setenv("CODEBOX_TIMEOUT", "99", 1);
    setenv("CODEBOX_MEMORY_LIMIT", "512m", 1);
    setenv("CODEBOX_NETWORK_DISABLED", "false", 1);
    cfg = Config::load(path.string());
    EXPECT_EQ(cfg.container.image, "from-env");
    EXPECT_EQ(cfg.container.timeout.count(), 99);
    EXPECT_EQ(cfg.container.memory_limit, "512m");
    EXPECT_FALSE(cfg.container.network_disabled);

    fs::remove(path);
}

TEST_F(ConfigEnvTest, ConfigPathFromEnvironment) {
    fs::path path = fs::temp_directory_path() / "codebox_test_env_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"container": {"memory_limit": "128m"}})";
    }
    setenv("CODEBOX_CONFIG", path.c_str(), 1);

    EXPECT_EQ(Config::load().container.memory_limit, "128m");
    fs::remove(path);
}

TEST_F(ConfigEnvTest, InvalidEnvironmentOverridesThrow) {
    Config cfg;
    setenv("CODEBOX_TIMEOUT", "soon", 1);
    EXPECT_THROW(cfg.apply_env(), ConfigError);
    unsetenv("CODEBOX_TIMEOUT");

    setenv("CODEBOX_NETWORK_DISABLED", "maybe", 1);
    EXPECT_THROW(cfg.apply_env(), ConfigError);
    unsetenv("CODEBOX_NETWORK_DISABLED");

    setenv("CODEBOX_MEMORY_LIMIT", "12 parsecs", 1);
    EXPECT_THROW(cfg.apply_env(), ConfigError);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(codebox::util::parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(codebox::util::parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(codebox::util::parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(codebox::util::parse_log_level("chatty"), spdlog::level::info);
}

TEST(LoggerTest, InitAndAdjustLevel) {
    codebox::util::init_logger(spdlog::level::warn);
    EXPECT_EQ(spdlog::default_logger()->name(), "codebox");
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

    codebox::util::set_log_level(spdlog::level::debug);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);

    // Re-initialising reuses the registered logger
    codebox::util::init_logger(spdlog::level::info);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
}
