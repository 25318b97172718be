#include "runtime/EngineConfig.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace WCE;

class EngineConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("WCE_MAX_FLOW_NODES");
        unsetenv("SPDLOG_LEVEL");
        if (!configPath.empty()) {
            std::filesystem::remove(configPath);
        }
    }

    std::string writeConfig(const std::string &content) {
        configPath = (std::filesystem::temp_directory_path() / "wce_engine_config_test.json").string();
        std::ofstream file(configPath);
        file << content;
        return configPath;
    }

    std::string configPath;
};

TEST_F(EngineConfigTest, Defaults) {
    EngineConfig config;
    EXPECT_EQ(config.maxFlowNodes, 500u);
    EXPECT_TRUE(config.requiredHandlerTypes.empty());
    EXPECT_EQ(config.logLevel, LogLevel::Info);
    EXPECT_FALSE(config.logToFile);
}

TEST_F(EngineConfigTest, FromJson) {
    auto config = EngineConfig::fromJson({{"maxFlowNodes", 25},
                                          {"requiredHandlerTypes", {"http_request", "create_record"}},
                                          {"logLevel", "debug"},
                                          {"logDir", "/tmp/wce-logs"}});

    EXPECT_EQ(config.maxFlowNodes, 25u);
    EXPECT_TRUE(config.isHandlerRequired("http_request"));
    EXPECT_FALSE(config.isHandlerRequired("script"));
    EXPECT_EQ(config.logLevel, LogLevel::Debug);
    EXPECT_EQ(config.logDir, "/tmp/wce-logs");
    EXPECT_TRUE(config.logToFile);
}

TEST_F(EngineConfigTest, FromJsonRejectsBadValues) {
    EXPECT_THROW(EngineConfig::fromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson({{"maxFlowNodes", 0}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson({{"maxFlowNodes", -3}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson({{"requiredHandlerTypes", "http_request"}}), std::invalid_argument);
    EXPECT_THROW(EngineConfig::fromJson({{"requiredHandlerTypes", {1, 2}}}), std::invalid_argument);
}

TEST_F(EngineConfigTest, FromFile) {
    auto path = writeConfig(R"({"maxFlowNodes": 42, "logToFile": false, "logDir": "/tmp/x"})");

    auto config = EngineConfig::fromFile(path);

    EXPECT_EQ(config.maxFlowNodes, 42u);
    EXPECT_FALSE(config.logToFile);
}

TEST_F(EngineConfigTest, FromFileReportsErrors) {
    EXPECT_THROW(EngineConfig::fromFile("/nonexistent/wce.json"), std::runtime_error);

    auto path = writeConfig("{not json");
    EXPECT_THROW(EngineConfig::fromFile(path), std::runtime_error);
}

TEST_F(EngineConfigTest, EnvironmentOverrides) {
    setenv("WCE_MAX_FLOW_NODES", "64", 1);
    setenv("SPDLOG_LEVEL", "warn", 1);

    EngineConfig config;
    config.applyEnvironment();

    EXPECT_EQ(config.maxFlowNodes, 64u);
    EXPECT_EQ(config.logLevel, LogLevel::Warn);
}

TEST_F(EngineConfigTest, InvalidEnvironmentValueIsIgnored) {
    setenv("WCE_MAX_FLOW_NODES", "lots", 1);

    EngineConfig config;
    config.applyEnvironment();

    EXPECT_EQ(config.maxFlowNodes, 500u);
}

TEST_F(EngineConfigTest, NonIntegralOrOversizedNodeLimitIsIgnored) {
    for (const char *value : {"2.5", "1e30", "0", "-3", "inf"}) {
        setenv("WCE_MAX_FLOW_NODES", value, 1);

        EngineConfig config;
        config.applyEnvironment();

        EXPECT_EQ(config.maxFlowNodes, 500u) << value;
    }

    setenv("WCE_MAX_FLOW_NODES", "1e3", 1);
    EngineConfig config;
    config.applyEnvironment();
    EXPECT_EQ(config.maxFlowNodes, 1000u);
}
