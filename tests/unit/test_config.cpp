#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace streamingcore::utils;
using streamingcore::buffer::BufferStrategy;
using streamingcore::network::NetworkQuality;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        configPath = ::testing::TempDir() + "streamingcore_config_test.json";
    }

    void TearDown() override {
        std::remove(configPath.c_str());
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(configPath);
        file << content;
    }

    std::string configPath;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = Config::load("nonexistent.json");

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getMemoryThresholds(), streamingcore::memory::MemoryThresholds::defaults());
    EXPECT_EQ(config.getNetworkMonitoringIntervalMs(), 1000);
    EXPECT_EQ(config.getNetworkHistorySize(), 60u);
    EXPECT_EQ(config.getCeilingPolicy(), streamingcore::buffer::NetworkCeilingPolicy::defaults());
}

TEST_F(ConfigTest, LoadsFullFile) {
    writeConfig(R"({
        "logLevel": "DEBUG",
        "memory": { "warningAvailableMB": 256, "criticalAvailableMB": 128.5, "pollingIntervalMs": 500 },
        "network": {
            "monitoringIntervalMs": 250,
            "historySize": 30,
            "ceilings": { "good": "aggressive", "moderate": "balanced" }
        }
    })");

    auto config = Config::load(configPath);

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_DOUBLE_EQ(config.getMemoryThresholds().warningAvailableMB, 256.0);
    EXPECT_DOUBLE_EQ(config.getMemoryThresholds().criticalAvailableMB, 128.5);
    EXPECT_EQ(config.getMemoryThresholds().pollingInterval, std::chrono::milliseconds(500));
    EXPECT_EQ(config.getNetworkMonitoringIntervalMs(), 250);
    EXPECT_EQ(config.getNetworkHistorySize(), 30u);
    EXPECT_EQ(config.getCeilingPolicy().ceilingFor(NetworkQuality::GOOD), BufferStrategy::AGGRESSIVE);
    EXPECT_EQ(config.getCeilingPolicy().ceilingFor(NetworkQuality::FAIR), BufferStrategy::BALANCED);
    EXPECT_EQ(config.getCeilingPolicy().ceilingFor(NetworkQuality::POOR), BufferStrategy::MINIMAL);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    auto config = Config::fromJson(R"({ "memory": { "pollingIntervalMs": 750 } })");

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_DOUBLE_EQ(config.getMemoryThresholds().warningAvailableMB, 100.0);
    EXPECT_DOUBLE_EQ(config.getMemoryThresholds().criticalAvailableMB, 50.0);
    EXPECT_EQ(config.getMemoryThresholds().pollingInterval, std::chrono::milliseconds(750));
    EXPECT_EQ(config.getNetworkHistorySize(), 60u);
}

TEST_F(ConfigTest, EmptyObjectIsDefaults) {
    auto config = Config::fromJson("{}");
    EXPECT_EQ(config.getMemoryThresholds(), streamingcore::memory::MemoryThresholds::defaults());
}

TEST_F(ConfigTest, MalformedJsonThrows) {
    writeConfig("{ \"logLevel\": ");
    EXPECT_THROW(Config::load(configPath), ConfigurationException);
    EXPECT_THROW(Config::fromJson("[1, 2, 3]"), ConfigurationException);
}

TEST_F(ConfigTest, WrongTypesThrow) {
    EXPECT_THROW(Config::fromJson(R"({ "logLevel": 3 })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "memory": 100 })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "memory": { "warningAvailableMB": "lots" } })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "memory": { "pollingIntervalMs": 1.5 } })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "network": { "ceilings": { "good": 2 } } })"), ConfigurationException);
}

TEST_F(ConfigTest, UnknownNamesThrow) {
    EXPECT_THROW(Config::fromJson(R"({ "logLevel": "VERBOSE" })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "network": { "ceilings": { "stellar": "minimal" } } })"),
                 ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "network": { "ceilings": { "good": "turbo" } } })"),
                 ConfigurationException);
}

TEST_F(ConfigTest, NonPositiveIntervalsThrow) {
    EXPECT_THROW(Config::fromJson(R"({ "memory": { "pollingIntervalMs": 0 } })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "network": { "monitoringIntervalMs": -5 } })"), ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "network": { "historySize": 0 } })"), ConfigurationException);
}

TEST_F(ConfigTest, CriticalMustBeBelowWarning) {
    EXPECT_THROW(Config::fromJson(R"({ "memory": { "warningAvailableMB": 50, "criticalAvailableMB": 50 } })"),
                 ConfigurationException);
    EXPECT_THROW(Config::fromJson(R"({ "memory": { "criticalAvailableMB": 150 } })"), ConfigurationException);
}

TEST_F(ConfigTest, ErrorCarriesConfigurationCategory) {
    try {
        Config::fromJson(R"({ "network": { "ceilings": { "good": "turbo" } } })");
        FAIL() << "Expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        EXPECT_EQ(e.getErrorInfo().category, ErrorCategory::CONFIGURATION);
        EXPECT_NE(std::string(e.what()).find("turbo"), std::string::npos);
    }
}

TEST_F(ConfigTest, SerializedConfigLoadsBack) {
    auto original = Config::fromJson(R"({
        "logLevel": "WARN",
        "memory": { "warningAvailableMB": 300, "criticalAvailableMB": 120 },
        "network": { "ceilings": { "fair": "minimal" } }
    })");

    auto reloaded = Config::fromJson(original.toJson());

    EXPECT_EQ(reloaded.getLogLevel(), "WARN");
    EXPECT_EQ(reloaded.getMemoryThresholds(), original.getMemoryThresholds());
    EXPECT_EQ(reloaded.getCeilingPolicy(), original.getCeilingPolicy());
}
