#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"

namespace fs = std::filesystem;

TEST(ConfigTest, DefaultsMatchBridgeConstants) {
    Config cfg = Config::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.bridge.logCapacity, 100u);
    EXPECT_EQ(cfg.bridge.responseLines, 10u);
    EXPECT_EQ(cfg.bridge.settleDelayMs, 500);
    EXPECT_EQ(cfg.bridge.stopGraceMs, 2000);
    EXPECT_EQ(cfg.bridge.defaultLogLines, 20);
    EXPECT_TRUE(cfg.bridge.clearPresenceOnStart);
    EXPECT_EQ(cfg.patterns.size(), 2u);
    ASSERT_EQ(cfg.server.executableNames.size(), 3u);
    EXPECT_EQ(cfg.server.executableNames[0], "bedrock_server");
    EXPECT_FALSE(cfg.server.autoStart);
}

TEST(ConfigTest, OverridesFromJson) {
    auto j = nlohmann::json::parse(R"({
        "server": {"path": "/srv/bedrock", "auto_start": true, "executable_names": ["bds"]},
        "bridge": {"log_capacity": 50, "settle_delay_ms": 250, "clear_presence_on_start": false},
        "patterns": [
            {"kind": "join", "pattern": "(\\w+) joined"},
            {"kind": "leave", "pattern": "(\\d+) (\\w+) left", "group": 2}
        ],
        "logging": {"file": "", "debug": true}
    })");
    Config cfg = Config::fromJson(j);

    EXPECT_EQ(cfg.server.path, "/srv/bedrock");
    EXPECT_TRUE(cfg.server.autoStart);
    EXPECT_EQ(cfg.server.executableNames, std::vector<std::string>{"bds"});
    EXPECT_EQ(cfg.bridge.logCapacity, 50u);
    EXPECT_EQ(cfg.bridge.settleDelayMs, 250);
    EXPECT_EQ(cfg.bridge.stopGraceMs, 2000);
    EXPECT_FALSE(cfg.bridge.clearPresenceOnStart);
    ASSERT_EQ(cfg.patterns.size(), 2u);
    EXPECT_EQ(cfg.patterns[0].kind, PresenceKind::Join);
    EXPECT_EQ(cfg.patterns[0].pattern, "(\\w+) joined");
    EXPECT_EQ(cfg.patterns[0].captureIndex, 1u);
    EXPECT_EQ(cfg.patterns[1].kind, PresenceKind::Leave);
    EXPECT_EQ(cfg.patterns[1].captureIndex, 2u);
    EXPECT_TRUE(cfg.logging.file.empty());
    EXPECT_TRUE(cfg.logging.debug);
}

TEST(ConfigTest, RejectsBadValues) {
    using nlohmann::json;
    EXPECT_THROW(Config::fromJson(json::parse(R"json({"patterns": [{"kind": "kick", "pattern": "(x)"}]})json")),
                 std::runtime_error);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"patterns": [{"kind": "join"}]})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"bridge": {"log_capacity": 0}})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"bridge": {"settle_delay_ms": "soon"}})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"bridge": {"stop_grace_ms": -5}})")), std::runtime_error);
    EXPECT_THROW(Config::fromJson(json::array()), std::runtime_error);
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("bedrock_bridge_config_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path p = testDir / name;
        std::ofstream f(p);
        f << content;
        return p;
    }

    fs::path testDir;
};

TEST_F(ConfigFileTest, LoadsFile) {
    auto path = writeFile("bridge.json", R"({"server": {"path": "/opt/bds"}, "bridge": {"response_lines": 5}})");
    Config cfg = Config::load(path.string());
    EXPECT_EQ(cfg.server.path, "/opt/bds");
    EXPECT_EQ(cfg.bridge.responseLines, 5u);
}

TEST_F(ConfigFileTest, MissingFileThrows) {
    EXPECT_THROW(Config::load((testDir / "nope.json").string()), std::runtime_error);
}

TEST_F(ConfigFileTest, MalformedJsonThrows) {
    auto path = writeFile("broken.json", "{\"server\": ");
    EXPECT_THROW(Config::load(path.string()), std::runtime_error);
}
