#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <regex>
#include <string>
#include <vector>
#include "FakeBedrockServer.h"
#include "server/BedrockServerManager.h"
#include "utils/Logger.h"

namespace {
bool anyLineContains(const std::vector<std::string>& lines, const std::string& needle) {
    return std::any_of(lines.begin(), lines.end(),
                       [&](const std::string& l) { return l.find(needle) != std::string::npos; });
}
} // namespace

class BedrockServerManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
    }

    void TearDown() override {
        Logger::getInstance().setConsoleEnabled(true);
    }

    static Config configFor(const fs::path& path) {
        Config cfg;
        cfg.server.path = path.u8string();
        cfg.bridge.settleDelayMs = 150;
        cfg.bridge.stopGraceMs = 1000;
        return cfg;
    }

    static bool logsContain(const BedrockServerManager& manager, const std::string& needle) {
        return anyLineContains(manager.recentLogs(0), needle);
    }
};

TEST_F(BedrockServerManagerTest, SendWhileStoppedReportsNotRunning) {
    BedrockServerManager manager(configFor("/nonexistent/bedrock"));

    CommandResult result = manager.sendCommand("say hi");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), BridgeError::NotRunning);
    EXPECT_EQ(result.text(), "Error: Server is not running");

    auto logs = manager.recentLogs(10);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0], BedrockServerManager::NO_LOGS_PLACEHOLDER);
}

TEST_F(BedrockServerManagerTest, FreshManagerStatus) {
    BedrockServerManager manager(configFor("/nonexistent/bedrock"));
    ServerStatus status = manager.status();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.playerCount, 0u);
    EXPECT_FALSE(status.pid.has_value());

    auto j = status.toJson();
    EXPECT_EQ(j["running"], false);
    EXPECT_TRUE(j["pid"].is_null());
    EXPECT_TRUE(j["player_list"].empty());
}

TEST_F(BedrockServerManagerTest, MissingExecutableFailsStart) {
    FakeBedrockServer fake("missing", FakeBedrockServer::ECHO_SCRIPT, "not_the_server");
    BedrockServerManager manager(configFor(fake.dir));

    EXPECT_FALSE(manager.start());
    EXPECT_EQ(manager.lastStartError(), BridgeError::ExecutableNotFound);
    EXPECT_FALSE(manager.isRunning());
}

TEST_F(BedrockServerManagerTest, NonExecutableFileFailsSpawn) {
    FakeBedrockServer fake("noexec", FakeBedrockServer::ECHO_SCRIPT, "bedrock_server", false);
    BedrockServerManager manager(configFor(fake.dir));

    EXPECT_FALSE(manager.start());
    EXPECT_EQ(manager.lastStartError(), BridgeError::SpawnFailure);
    EXPECT_FALSE(manager.isRunning());
}

TEST_F(BedrockServerManagerTest, FindsAlternateExecutableName) {
    FakeBedrockServer fake("altname", FakeBedrockServer::ECHO_SCRIPT, "bedrock_server.exe");
    BedrockServerManager manager(configFor(fake.dir));

    auto exe = manager.findExecutable();
    ASSERT_TRUE(exe.has_value());
    EXPECT_EQ(exe->filename().string(), "bedrock_server.exe");
}

TEST_F(BedrockServerManagerTest, StartIsIdempotent) {
    FakeBedrockServer fake("idempotent");
    BedrockServerManager manager(configFor(fake.dir));

    ASSERT_TRUE(manager.start());
    auto first = manager.status();
    ASSERT_TRUE(first.pid.has_value());

    EXPECT_TRUE(manager.start());
    auto second = manager.status();
    EXPECT_EQ(first.pid, second.pid);

    manager.stop();
}

TEST_F(BedrockServerManagerTest, AcceptsPathToExecutable) {
    FakeBedrockServer fake("direct");
    BedrockServerManager manager(configFor(fake.exePath));

    EXPECT_EQ(manager.workingDirectory().string(), fake.dir.string());
    ASSERT_TRUE(manager.start());
    EXPECT_TRUE(waitUntil([&] { return logsContain(manager, "Server started."); }));
    manager.stop();
}

TEST_F(BedrockServerManagerTest, CommandResponseContainsServerOutput) {
    FakeBedrockServer fake("command");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(waitUntil([&] { return logsContain(manager, "Server started."); }));

    CommandResult result = manager.sendCommand("say hello");
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_EQ(result.snapshot().command, "say hello");
    EXPECT_NE(result.text().find("ran: say hello"), std::string::npos) << result.text();
    EXPECT_GE(result.snapshot().linesSinceRequest, 1u);
    EXPECT_LE(result.snapshot().logsObserved.size(), 10u);

    manager.stop();
}

TEST_F(BedrockServerManagerTest, TracksPresenceFromOutput) {
    FakeBedrockServer fake("presence");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());

    manager.sendCommand("join Alice");
    manager.sendCommand("join Bob");
    manager.sendCommand("join Alice");
    manager.sendCommand("leave Alice");

    ASSERT_TRUE(waitUntil([&] { return manager.status().players == std::vector<std::string>{"Bob"}; }));
    ServerStatus status = manager.status();
    EXPECT_EQ(status.playerCount, status.players.size());
    EXPECT_TRUE(status.running);

    manager.stop();
}

TEST_F(BedrockServerManagerTest, MergesStderrIntoLog) {
    FakeBedrockServer fake("stderr");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());

    manager.sendCommand("warn");
    EXPECT_TRUE(waitUntil([&] { return logsContain(manager, "[WARN] warning on stderr"); }));

    manager.stop();
}

TEST_F(BedrockServerManagerTest, GracefulStop) {
    FakeBedrockServer fake("graceful");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());

    manager.stop();
    EXPECT_FALSE(manager.isRunning());
    EXPECT_FALSE(manager.status().pid.has_value());
    EXPECT_TRUE(logsContain(manager, "Quit correctly"));

    // Stopping again is harmless
    manager.stop();
    EXPECT_FALSE(manager.isRunning());
}

TEST_F(BedrockServerManagerTest, ForcesStubbornServerDown) {
    FakeBedrockServer fake("stubborn", FakeBedrockServer::STUBBORN_SCRIPT);
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(waitUntil([&] { return logsContain(manager, "Server started."); }));

    manager.stop();
    EXPECT_FALSE(manager.isRunning());
    EXPECT_TRUE(logsContain(manager, "ignored: stop"));

    CommandResult result = manager.sendCommand("say still there?");
    EXPECT_EQ(result.error(), BridgeError::NotRunning);
}

TEST_F(BedrockServerManagerTest, CrashIsObserved) {
    FakeBedrockServer fake("crash");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());

    manager.sendCommand("crash");
    ASSERT_TRUE(waitUntil([&] { return !manager.isRunning(); }));
    EXPECT_FALSE(manager.status().pid.has_value());
    EXPECT_TRUE(logsContain(manager, "[ERROR] crashing"));

    CommandResult result = manager.sendCommand("say anyone?");
    EXPECT_EQ(result.error(), BridgeError::NotRunning);
    EXPECT_EQ(result.text(), BedrockServerManager::NOT_RUNNING_MESSAGE);
}

TEST_F(BedrockServerManagerTest, CrashObservedWhileHelperHoldsOutput) {
    FakeBedrockServer fake("helper_crash", FakeBedrockServer::LINGERING_HELPER_SCRIPT);
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(waitUntil([&] { return logsContain(manager, "Server started."); }));

    manager.sendCommand("crash");
    ASSERT_TRUE(waitUntil([&] { return !manager.isRunning(); }, std::chrono::milliseconds(3000)));
    EXPECT_TRUE(logsContain(manager, "[ERROR] crashing"));

    CommandResult result = manager.sendCommand("say anyone?");
    EXPECT_EQ(result.error(), BridgeError::NotRunning);
    EXPECT_EQ(result.text(), BedrockServerManager::NOT_RUNNING_MESSAGE);
}

TEST_F(BedrockServerManagerTest, StopIsBoundedWhileHelperHoldsOutput) {
    FakeBedrockServer fake("helper_stop", FakeBedrockServer::LINGERING_HELPER_SCRIPT);
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());
    ASSERT_TRUE(waitUntil([&] { return logsContain(manager, "Server started."); }));

    auto begin = std::chrono::steady_clock::now();
    manager.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 4000);
    EXPECT_FALSE(manager.isRunning());
    EXPECT_TRUE(logsContain(manager, "Quit correctly"));
}

TEST_F(BedrockServerManagerTest, RestartClearsPresenceKeepsLogs) {
    FakeBedrockServer fake("restart");
    BedrockServerManager manager(configFor(fake.dir));
    ASSERT_TRUE(manager.start());
    manager.sendCommand("join Steve");
    ASSERT_TRUE(waitUntil([&] { return manager.status().playerCount == 1; }));
    manager.stop();

    // Presence is stale but still visible between runs
    EXPECT_EQ(manager.status().playerCount, 1u);

    ASSERT_TRUE(manager.start());
    EXPECT_EQ(manager.status().playerCount, 0u);
    EXPECT_TRUE(logsContain(manager, "Player connected: Steve"));
    manager.stop();
}

TEST_F(BedrockServerManagerTest, RecentLogsLimitsAndBuffersAtCapacity) {
    BedrockServerManager manager(configFor("/nonexistent/bedrock"));
    for (int i = 0; i < 150; ++i) {
        manager.ingestLine("line " + std::to_string(i));
    }

    auto all = manager.recentLogs(0);
    ASSERT_EQ(all.size(), 100u);
    EXPECT_NE(all.front().find("] line 50"), std::string::npos);
    EXPECT_NE(all.back().find("] line 149"), std::string::npos);

    auto last5 = manager.recentLogs(5);
    ASSERT_EQ(last5.size(), 5u);
    EXPECT_NE(last5.front().find("] line 145"), std::string::npos);

    EXPECT_EQ(manager.recentLogs(500).size(), 100u);
}

TEST_F(BedrockServerManagerTest, IngestTrimsAndKeepsBlankLines) {
    BedrockServerManager manager(configFor("/nonexistent/bedrock"));
    manager.ingestLine("   ");
    manager.ingestLine("");
    manager.ingestLine("Player connected: Alex, xuid: 1\r");

    auto logs = manager.recentLogs(0);
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_TRUE(std::regex_match(logs[0], std::regex(R"(\[\d{2}:\d{2}:\d{2}\] )"))) << logs[0];
    EXPECT_EQ(logs[1].substr(11), "");
    EXPECT_EQ(logs[2].substr(11), "Player connected: Alex, xuid: 1");
    EXPECT_EQ(manager.status().players, std::vector<std::string>{"Alex"});
}

TEST_F(BedrockServerManagerTest, CustomPatternsDrivePresence) {
    Config cfg = configFor("/nonexistent/bedrock");
    cfg.patterns = {
        {PresenceKind::Join, R"(^(\w+) joined the game$)", 1},
        {PresenceKind::Leave, R"(^(\w+) left the game$)", 1}
    };
    BedrockServerManager manager(cfg);

    manager.ingestLine("Player connected: Alice, xuid: 1");
    manager.ingestLine("Notch joined the game");
    EXPECT_EQ(manager.status().players, std::vector<std::string>{"Notch"});
}
