#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace shareflow {
namespace {

using json = nlohmann::json;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("PORT");
        if (!Path_.empty()) {
            std::remove(Path_.c_str());
        }
    }

    std::string WriteFile(const std::string& contents) {
        Path_ = ::testing::TempDir() + "shareflow_config_test.json";
        std::ofstream file(Path_);
        file << contents;
        return Path_;
    }

    std::string Path_;
};

TEST_F(ConfigTest, Defaults) {
    RelayConfig config;
    EXPECT_EQ(config.port, 3001);
    EXPECT_EQ(config.bindAddress, "0.0.0.0");
    EXPECT_EQ(config.maxViewers, 10);
    EXPECT_EQ(config.sweepInterval, std::chrono::hours(1));
    EXPECT_EQ(config.roomIdleTimeout, std::chrono::hours(12));
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_FALSE(config.enableTls);
}

TEST_F(ConfigTest, ParsesKnownFields) {
    auto config = ParseConfig({
        {"port", 8080},
        {"bindAddress", "127.0.0.1"},
        {"maxViewers", 4},
        {"sweepIntervalSeconds", 60},
        {"roomIdleHours", 2},
        {"logLevel", "debug"},
    });

    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.bindAddress, "127.0.0.1");
    EXPECT_EQ(config.maxViewers, 4);
    EXPECT_EQ(config.sweepInterval, std::chrono::seconds(60));
    EXPECT_EQ(config.roomIdleTimeout, std::chrono::hours(2));
    EXPECT_EQ(config.logLevel, "debug");
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
    auto config = ParseConfig({
        {"port", 70000},
        {"maxViewers", 50},
        {"sweepIntervalSeconds", -1},
        {"logLevel", "chatty"},
        {"bindAddress", 12},
    });

    RelayConfig defaults;
    EXPECT_EQ(config.port, defaults.port);
    EXPECT_EQ(config.maxViewers, defaults.maxViewers);
    EXPECT_EQ(config.sweepInterval, defaults.sweepInterval);
    EXPECT_EQ(config.logLevel, defaults.logLevel);
    EXPECT_EQ(config.bindAddress, defaults.bindAddress);
}

TEST_F(ConfigTest, TlsNeedsCertificateAndKey) {
    EXPECT_THROW(ParseConfig({{"enableTls", true}}), ConfigError);
    EXPECT_THROW(ParseConfig({{"enableTls", true}, {"certificatePemFile", "cert.pem"}}), ConfigError);

    auto config = ParseConfig({
        {"enableTls", true},
        {"certificatePemFile", "cert.pem"},
        {"keyPemFile", "key.pem"},
    });
    EXPECT_TRUE(config.enableTls);
}

TEST_F(ConfigTest, RejectsNonObject) {
    EXPECT_THROW(ParseConfig(json::array()), ConfigError);
}

TEST_F(ConfigTest, LoadsFromFile) {
    auto config = LoadConfig(WriteFile(R"({"port": 9000, "maxViewers": 2})"));
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.maxViewers, 2);
}

TEST_F(ConfigTest, LoadFailures) {
    EXPECT_THROW(LoadConfig("/nonexistent/shareflow.json"), ConfigError);
    EXPECT_THROW(LoadConfig(WriteFile("{ not json")), ConfigError);
}

TEST_F(ConfigTest, PortEnvironmentOverride) {
    RelayConfig config;
    setenv("PORT", "4100", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.port, 4100);

    setenv("PORT", "abc", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.port, 4100);

    setenv("PORT", "99999", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.port, 4100);
}

TEST_F(ConfigTest, RoundTripsThroughJson) {
    RelayConfig config;
    config.port = 5000;
    config.logLevel = "warning";

    auto parsed = ParseConfig(ToJson(config));
    EXPECT_EQ(parsed.port, 5000);
    EXPECT_EQ(parsed.logLevel, "warning");
}

TEST_F(ConfigTest, LogLevels) {
    EXPECT_EQ(ParseLogLevel("none"), rtc::LogLevel::None);
    EXPECT_EQ(ParseLogLevel("verbose"), rtc::LogLevel::Verbose);
    EXPECT_EQ(ParseLogLevel("warning"), rtc::LogLevel::Warning);
    EXPECT_THROW(ParseLogLevel("loud"), ConfigError);
}

} // namespace
} // namespace shareflow
