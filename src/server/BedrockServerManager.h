#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "server/ChildProcess.h"
#include "server/CommandResult.h"
#include "server/LineClassifier.h"
#include "server/LogBuffer.h"
#include "server/PresenceSet.h"

struct ServerStatus {
    bool running = false;
    size_t playerCount = 0;
    std::vector<std::string> players;
    std::optional<int> pid;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"running", running},
            {"player_count", playerCount},
            {"player_list", players}
        };
        j["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json(nullptr);
        return j;
    }
};

/**
 * @brief Supervises one Bedrock Dedicated Server process.
 *
 * Owns the child, a reader thread that ingests its console output into the
 * log buffer and presence set, and the command pipe. All shared state sits
 * behind stateMtx; the reader thread is the only writer and the only one
 * that may observe the child going away on its own.
 */
class BedrockServerManager {
public:
    explicit BedrockServerManager(const Config& config);
    ~BedrockServerManager();

    BedrockServerManager(const BedrockServerManager&) = delete;
    BedrockServerManager& operator=(const BedrockServerManager&) = delete;

    /**
     * @brief Spawn the server unless it already runs.
     * @return true when the server is running afterwards. On false,
     *         lastStartError() tells why.
     */
    bool start();

    /**
     * @brief Ask the server to stop, force it after the grace period.
     * running is false afterwards in every case.
     */
    void stop();

    /**
     * @brief Write one console command and report what the server logged
     * during the settle delay.
     */
    CommandResult sendCommand(const std::string& command);

    ServerStatus status() const;

    /**
     * @brief Last n formatted log lines (all of them when n is 0 or exceeds
     * the buffer), or a single placeholder line when nothing was logged yet.
     */
    std::vector<std::string> recentLogs(size_t n) const;

    bool isRunning() const;
    BridgeError lastStartError() const;

    std::filesystem::path workingDirectory() const;
    std::optional<std::filesystem::path> findExecutable() const;

    // Store and classify one raw console line, blank ones included. Called by
    // the reader thread.
    void ingestLine(const std::string& raw);

    static constexpr const char* NOT_RUNNING_MESSAGE = "Error: Server is not running";
    static constexpr const char* NO_ACTIVITY_PLACEHOLDER = "No recent activity";
    static constexpr const char* NO_LOGS_PLACEHOLDER = "No logs available";

private:
    Config::Server serverCfg;
    Config::Bridge bridgeCfg;
    LineClassifier classifier;

    mutable std::mutex stateMtx;
    LogBuffer logBuffer;
    PresenceSet presence;
    bool running = false;
    std::shared_ptr<ChildProcess> process;
    BridgeError startError = BridgeError::None;

    std::mutex writeMtx;     // serializes writes to the child's stdin
    std::mutex lifecycleMtx; // serializes start/stop
    std::thread readerThread;

    void ingestLoop(std::shared_ptr<ChildProcess> proc);
    void setStartError(BridgeError error);
};
