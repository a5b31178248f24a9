// MediaRelay - WebRTC SFU Signaling Server
// Tests for Configuration Manager
//
// Tests cover:
// - Defaults applied when no configuration file is present
// - JSON configuration files, partial and nested
// - Environment variable overrides for containerized deployments
// - Validation with the offending field reported

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "mediarelay/core/config_manager.hpp"
#include "mediarelay/core/json.hpp"

namespace mediarelay {
namespace core {
namespace test {

// =============================================================================
// Test Fixtures
// =============================================================================

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() /
                   ("mediarelay_config_test_" + std::to_string(getpid()));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);

        for (const auto& name : setEnvVars_) {
            unsetenv(name.c_str());
        }
    }

    void setEnvVar(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        setEnvVars_.push_back(name);
    }

    std::string writeFile(const std::string& filename, const std::string& content) {
        auto path = testDir_ / filename;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path testDir_;
    std::vector<std::string> setEnvVars_;
};

// =============================================================================
// Default Configuration Tests
// =============================================================================

TEST_F(ConfigManagerTest, DefaultConfigurationIsValid) {
    ConfigManager manager;

    auto result = manager.loadDefaults();
    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(manager.validate().isSuccess());

    const auto config = manager.getConfig();

    EXPECT_EQ(config.server.port, 3001);
    EXPECT_EQ(config.server.bindAddress, "0.0.0.0");
    EXPECT_EQ(config.server.maxConnections, 1000u);
    EXPECT_EQ(config.server.workerThreads, 4u);

    EXPECT_EQ(config.logging.level, LogLevelConfig::Info);
    EXPECT_FALSE(config.logging.json);

    EXPECT_EQ(config.engine.rtcMinPort, 40000);
    EXPECT_EQ(config.engine.rtcMaxPort, 49999);
    EXPECT_TRUE(config.engine.announcedIp.empty());

    EXPECT_EQ(config.recording.encoderPath, "ffmpeg");
    EXPECT_EQ(config.recording.segmentSeconds, 2u);
    EXPECT_EQ(config.recording.playlistSize, 5u);
    EXPECT_EQ(config.recording.readinessTimeoutMs, 10000u);
    EXPECT_EQ(config.recording.fileCheckDelayMs, 5000u);

    EXPECT_EQ(config.playback.pathPrefix, "/api/hls");
}

TEST_F(ConfigManagerTest, DefaultOutputRootIsUnderWorkingDirectory) {
    ConfigManager manager;

    auto expected = (std::filesystem::current_path() / "public" / "hls").string();
    EXPECT_EQ(manager.getConfig().recording.outputRoot, expected);
}

// =============================================================================
// JSON Configuration Parsing Tests
// =============================================================================

TEST_F(ConfigManagerTest, LoadValidJsonConfiguration) {
    auto path = writeFile("config.json", R"({
        "server": {
            "port": 8080,
            "bindAddress": "127.0.0.1",
            "maxConnections": 50,
            "workerThreads": 2
        },
        "logging": { "level": "debug", "json": true },
        "engine": {
            "announcedIp": "203.0.113.7",
            "rtcMinPort": 41000,
            "rtcMaxPort": 41999
        },
        "recording": {
            "outputRoot": "/var/lib/mediarelay/hls",
            "encoderPath": "/usr/bin/ffmpeg",
            "segmentSeconds": 4
        },
        "playback": { "pathPrefix": "/hls" }
    })");

    ConfigManager manager;
    auto result = manager.loadFromFile(path);
    ASSERT_TRUE(result.isSuccess()) << result.error().message;

    const auto config = manager.getConfig();
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.bindAddress, "127.0.0.1");
    EXPECT_EQ(config.server.maxConnections, 50u);
    EXPECT_EQ(config.server.workerThreads, 2u);
    EXPECT_EQ(config.logging.level, LogLevelConfig::Debug);
    EXPECT_TRUE(config.logging.json);
    EXPECT_EQ(config.engine.announcedIp, "203.0.113.7");
    EXPECT_EQ(config.engine.rtcMinPort, 41000);
    EXPECT_EQ(config.recording.outputRoot, "/var/lib/mediarelay/hls");
    EXPECT_EQ(config.recording.encoderPath, "/usr/bin/ffmpeg");
    EXPECT_EQ(config.recording.segmentSeconds, 4u);
    EXPECT_EQ(config.playback.pathPrefix, "/hls");
}

TEST_F(ConfigManagerTest, LoadPartialJsonConfigurationUsesDefaultsForMissing) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"server": {"port": 4000}})");
    ASSERT_TRUE(result.isSuccess());

    const auto config = manager.getConfig();
    EXPECT_EQ(config.server.port, 4000);
    EXPECT_EQ(config.server.maxConnections, 1000u);
    EXPECT_EQ(config.recording.encoderRtpPortMin, 50000);
}

TEST_F(ConfigManagerTest, MissingFileReportsFileNotFound) {
    ConfigManager manager;
    auto result = manager.loadFromFile((testDir_ / "absent.json").string());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::FileNotFound);
}

TEST_F(ConfigManagerTest, MalformedJsonReportsParseError) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"server": {"port": })");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
}

TEST_F(ConfigManagerTest, NonObjectRootIsRejected) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString("[1, 2]");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ParseError);
}

TEST_F(ConfigManagerTest, WrongTypeNamesTheField) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"server": {"port": "3001"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ConfigError::Code::ValidationError);
    EXPECT_EQ(result.error().field, "server.port");
}

TEST_F(ConfigManagerTest, FailedDocumentLeavesPreviousValues) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromJsonString(R"({"server": {"port": 4000}})").isSuccess());

    auto result = manager.loadFromJsonString(
        R"({"server": {"port": 5000, "bindAddress": 7}})");
    ASSERT_TRUE(result.isError());

    EXPECT_EQ(manager.getConfig().server.port, 4000);
}

TEST_F(ConfigManagerTest, UnknownLogLevelIsRejected) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"logging": {"level": "verbose"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "logging.level");
}

// =============================================================================
// Environment Variable Override Tests
// =============================================================================

TEST_F(ConfigManagerTest, EnvironmentVariableOverridesPort) {
    setEnvVar("MEDIARELAY_PORT", "9000");

    ConfigManager manager;
    manager.applyEnvironmentOverrides();

    EXPECT_EQ(manager.getConfig().server.port, 9000);
}

TEST_F(ConfigManagerTest, InvalidEnvironmentPortIsIgnored) {
    setEnvVar("MEDIARELAY_PORT", "70000");

    std::vector<std::string> logged;
    ConfigManager manager;
    manager.setLogCallback([&](const std::string& message) { logged.push_back(message); });
    manager.applyEnvironmentOverrides();

    EXPECT_EQ(manager.getConfig().server.port, 3001);
    ASSERT_FALSE(logged.empty());
    EXPECT_NE(logged.back().find("Invalid MEDIARELAY_PORT"), std::string::npos);
}

TEST_F(ConfigManagerTest, EnvironmentVariablesOverrideFileConfig) {
    auto path = writeFile("config.json", R"({
        "server": { "port": 8080 },
        "recording": { "outputRoot": "/from/file" }
    })");
    setEnvVar("MEDIARELAY_PORT", "8081");
    setEnvVar("MEDIARELAY_HLS_ROOT", "/from/env");

    ConfigManager manager;
    ASSERT_TRUE(manager.loadFromFile(path).isSuccess());
    manager.applyEnvironmentOverrides();

    const auto config = manager.getConfig();
    EXPECT_EQ(config.server.port, 8081);
    EXPECT_EQ(config.recording.outputRoot, "/from/env");
}

TEST_F(ConfigManagerTest, MultipleEnvironmentVariableOverrides) {
    setEnvVar("MEDIARELAY_BIND_ADDRESS", "127.0.0.1");
    setEnvVar("MEDIARELAY_LOG_LEVEL", "error");
    setEnvVar("MEDIARELAY_LOG_JSON", "true");
    setEnvVar("MEDIARELAY_ANNOUNCED_IP", "198.51.100.2");
    setEnvVar("MEDIARELAY_ENCODER_PATH", "/opt/ffmpeg/bin/ffmpeg");
    setEnvVar("MEDIARELAY_WORKER_THREADS", "8");

    ConfigManager manager;
    manager.applyEnvironmentOverrides();

    const auto config = manager.getConfig();
    EXPECT_EQ(config.server.bindAddress, "127.0.0.1");
    EXPECT_EQ(config.logging.level, LogLevelConfig::Error);
    EXPECT_TRUE(config.logging.json);
    EXPECT_EQ(config.engine.announcedIp, "198.51.100.2");
    EXPECT_EQ(config.recording.encoderPath, "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.server.workerThreads, 8u);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST_F(ConfigManagerTest, ValidateRejectsZeroPort) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"server": {"port": 0}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "server.port");
}

TEST_F(ConfigManagerTest, ValidateRejectsInvertedRtcPortRange) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(
        R"({"engine": {"rtcMinPort": 45000, "rtcMaxPort": 44000}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "engine.rtcMinPort");
}

TEST_F(ConfigManagerTest, ValidateRequiresOneTransportProtocol) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(
        R"({"engine": {"enableUdp": false, "enableTcp": false}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "engine.enableUdp");
}

TEST_F(ConfigManagerTest, ValidateRejectsInvertedEncoderPortRange) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(
        R"({"recording": {"encoderRtpPortMin": 51000, "encoderRtpPortMax": 50000}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "recording.encoderRtpPortMin");
}

TEST_F(ConfigManagerTest, ValidateRejectsPollLongerThanTimeout) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(
        R"({"recording": {"readinessTimeoutMs": 100, "readinessPollMs": 500}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "recording.readinessPollMs");
}

TEST_F(ConfigManagerTest, ValidateRejectsRelativePlaybackPrefix) {
    ConfigManager manager;
    auto result = manager.loadFromJsonString(R"({"playback": {"pathPrefix": "api/hls"}})");

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().field, "playback.pathPrefix");
}

// =============================================================================
// Effective Configuration Logging
// =============================================================================

TEST_F(ConfigManagerTest, LogsEffectiveConfiguration) {
    std::vector<std::string> logged;
    ConfigManager manager;
    manager.setLogCallback([&](const std::string& message) { logged.push_back(message); });

    ASSERT_TRUE(manager.loadDefaults().isSuccess());

    bool sawPort = false;
    for (const auto& line : logged) {
        if (line.find("server.port: 3001") != std::string::npos) {
            sawPort = true;
        }
    }
    EXPECT_TRUE(sawPort);
}

TEST_F(ConfigManagerTest, DumpConfigIsValidJson) {
    ConfigManager manager;
    auto parsed = JsonValue::parse(manager.dumpConfig());
    ASSERT_TRUE(parsed.isSuccess());

    EXPECT_EQ(parsed.value()["playback"]["pathPrefix"].getString(), "/api/hls");
    EXPECT_EQ(parsed.value()["recording"]["encoderRtpPortMin"].getInt(), 50000);
    EXPECT_EQ(parsed.value()["server"]["port"].getInt(), 3001);
}

} // namespace test
} // namespace core
} // namespace mediarelay
