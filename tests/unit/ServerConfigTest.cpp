#include <gtest/gtest.h>
#include "server/ServerConfig.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace VoiceGuard::Server;

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "voiceguard_config_tests";
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::string writeFile(const std::string& name, const std::string& contents) {
        std::string path = (testDir / name).string();
        std::ofstream out(path);
        out << contents;
        return path;
    }

    std::filesystem::path testDir;
};

TEST_F(ServerConfigTest, DefaultsAreValid) {
    ServerConfig config;
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.path, "/ws");
    EXPECT_EQ(config.ioThreads, 1);
    EXPECT_TRUE(config.staticRoot.empty());
    EXPECT_EQ(config.analyzer.minSamples, 100);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ServerConfigTest, ApplyJsonOverridesKnownKeys) {
    ServerConfig config;
    config.applyJson(R"({
        "host": "127.0.0.1",
        "port": 9001,
        "path": "/stream",
        "io_threads": 4,
        "static_root": "/srv/dashboard",
        "quiet": true,
        "unknown_key": "ignored",
        "analyzer": {"min_samples": 400, "rms_weight": 5.0, "seed": 99}
    })");

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9001);
    EXPECT_EQ(config.path, "/stream");
    EXPECT_EQ(config.ioThreads, 4);
    EXPECT_EQ(config.staticRoot, "/srv/dashboard");
    EXPECT_TRUE(config.quiet);
    EXPECT_EQ(config.analyzer.minSamples, 400);
    EXPECT_DOUBLE_EQ(config.analyzer.rmsWeight, 5.0);
    EXPECT_DOUBLE_EQ(config.analyzer.zcrWeight, 2.0);
    ASSERT_TRUE(config.analyzer.randomSeed.has_value());
    EXPECT_EQ(*config.analyzer.randomSeed, 99u);
}

TEST_F(ServerConfigTest, ApplyJsonRejectsBadDocuments) {
    ServerConfig config;
    EXPECT_THROW(config.applyJson("not json"), std::invalid_argument);
    EXPECT_THROW(config.applyJson("[1, 2]"), std::invalid_argument);
    EXPECT_THROW(config.applyJson(R"({"port": "eight thousand"})"), std::invalid_argument);
    EXPECT_THROW(config.applyJson(R"({"port": 70000})"), std::invalid_argument);
    EXPECT_THROW(config.applyJson(R"({"port": -1})"), std::invalid_argument);
}

TEST_F(ServerConfigTest, ValidateRejectsUnusableValues) {
    ServerConfig config;
    config.path = "ws";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ServerConfig();
    config.ioThreads = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ServerConfig();
    config.host.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = ServerConfig();
    config.analyzer.labelThreshold = 1.5;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST_F(ServerConfigTest, LoadFromFile) {
    std::string path = writeFile("server.json", R"({"port": 0, "path": "/ws"})");
    ServerConfig config = ServerConfig::loadFromFile(path);
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.host, "0.0.0.0");
}

TEST_F(ServerConfigTest, LoadFromMissingFileThrows) {
    EXPECT_THROW(ServerConfig::loadFromFile((testDir / "absent.json").string()),
                 std::runtime_error);
}

TEST_F(ServerConfigTest, ToJsonRoundTripsThroughApply) {
    ServerConfig original;
    original.port = 8123;
    original.analyzer.randomSeed = 5;

    ServerConfig copy;
    copy.applyJson(original.toJson());
    EXPECT_EQ(copy.port, 8123);
    ASSERT_TRUE(copy.analyzer.randomSeed.has_value());
    EXPECT_EQ(*copy.analyzer.randomSeed, 5u);
}

TEST_F(ServerConfigTest, FlagsOverrideConfigFile) {
    std::string path = writeFile("flags.json", R"({"port": 9000, "path": "/voice"})");
    const char* argv[] = {"voiceguard_server", "--port", "7000", "--config", path.c_str()};

    ServerConfig config = ServerConfig::fromArgs(5, argv);
    EXPECT_EQ(config.port, 7000);
    EXPECT_EQ(config.path, "/voice");
}

TEST_F(ServerConfigTest, FromArgsAppliesEveryFlag) {
    const char* argv[] = {"voiceguard_server", "--host", "127.0.0.1", "--port", "0",
                          "--path", "/audio", "--static-root", "web", "--threads", "4",
                          "--seed", "42", "--quiet"};

    ServerConfig config = ServerConfig::fromArgs(14, argv);
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.path, "/audio");
    EXPECT_EQ(config.staticRoot, "web");
    EXPECT_EQ(config.ioThreads, 4);
    ASSERT_TRUE(config.analyzer.randomSeed.has_value());
    EXPECT_EQ(*config.analyzer.randomSeed, 42u);
    EXPECT_TRUE(config.quiet);
}

TEST_F(ServerConfigTest, FromArgsRejectsOutOfRangeNumbers) {
    const char* threadsWrap[] = {"voiceguard_server", "--threads", "4294967297"};
    EXPECT_THROW(ServerConfig::fromArgs(3, threadsWrap), std::invalid_argument);

    const char* threadsZero[] = {"voiceguard_server", "--threads", "0"};
    EXPECT_THROW(ServerConfig::fromArgs(3, threadsZero), std::invalid_argument);

    const char* portHigh[] = {"voiceguard_server", "--port", "70000"};
    EXPECT_THROW(ServerConfig::fromArgs(3, portHigh), std::invalid_argument);

    const char* seedNegative[] = {"voiceguard_server", "--seed", "-1"};
    EXPECT_THROW(ServerConfig::fromArgs(3, seedNegative), std::invalid_argument);

    const char* notNumber[] = {"voiceguard_server", "--port", "80x"};
    EXPECT_THROW(ServerConfig::fromArgs(3, notNumber), std::invalid_argument);
}

TEST_F(ServerConfigTest, FromArgsRejectsUnknownAndIncompleteFlags) {
    const char* unknown[] = {"voiceguard_server", "--bogus", "1"};
    EXPECT_THROW(ServerConfig::fromArgs(3, unknown), std::invalid_argument);

    const char* missingValue[] = {"voiceguard_server", "--port"};
    EXPECT_THROW(ServerConfig::fromArgs(2, missingValue), std::invalid_argument);

    const char* missingConfig[] = {"voiceguard_server", "--config"};
    EXPECT_THROW(ServerConfig::fromArgs(2, missingConfig), std::invalid_argument);

    const char* badPath[] = {"voiceguard_server", "--path", "ws"};
    EXPECT_THROW(ServerConfig::fromArgs(3, badPath), std::invalid_argument);
}

TEST_F(ServerConfigTest, FromArgsWithoutFlagsGivesDefaults) {
    const char* argv[] = {"voiceguard_server"};
    ServerConfig config = ServerConfig::fromArgs(1, argv);
    EXPECT_EQ(config.port, 8000);
    EXPECT_FALSE(config.analyzer.randomSeed.has_value());
}
