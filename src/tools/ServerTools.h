#pragma once
#include "ITool.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class BedrockServerManager;
class ToolRegistry;
struct Config;

// Argument access for tool implementations
namespace ToolArgs {
    struct ArgumentError : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Required single-line string argument.
     * @throws ArgumentError when missing, not a string, or containing a line
     *         break (which would smuggle a second console command).
     */
    std::string requireString(const nlohmann::json& args, const std::string& key);
    std::optional<std::string> optionalString(const nlohmann::json& args, const std::string& key);

    /**
     * @brief Required numeric argument rendered for the console: integers as
     * integers, other values in shortest decimal form ("2.5", "10.0").
     */
    std::string requireNumber(const nlohmann::json& args, const std::string& key);
    std::optional<std::string> optionalNumber(const nlohmann::json& args, const std::string& key);

    // Numeric argument rounded to the nearest integer.
    long long requireInteger(const nlohmann::json& args, const std::string& key);

    std::string formatNumber(const nlohmann::json& value);
}

/**
 * @brief Base of all tools that talk to the Bedrock server.
 *
 * execute() turns ArgumentError into {"error": ...}; subclasses implement run().
 */
class ServerTool : public ITool {
public:
    explicit ServerTool(BedrockServerManager& manager) : manager(manager) {}

    nlohmann::json execute(const nlohmann::json& args) override;

protected:
    virtual nlohmann::json run(const nlohmann::json& args) = 0;

    // Send one command, answer "<summary>\n\nServer response:\n<logs>"
    nlohmann::json sendAndReport(const std::string& command, const std::string& summary);

    static nlohmann::json textResult(const std::string& text, bool isError = false);

    BedrockServerManager& manager;
};

class SendCommandTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "send-command"; }
    std::string getDescription() const override { return "Send a command to the Minecraft Bedrock server"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class ServerStatusTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "get-server-status"; }
    std::string getDescription() const override { return "Get the current status of the Minecraft server"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class ListPlayersTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "list-players"; }
    std::string getDescription() const override { return "List players currently online"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class ServerLogsTool : public ServerTool {
public:
    ServerLogsTool(BedrockServerManager& manager, int defaultLines)
        : ServerTool(manager), defaultLines(defaultLines) {}
    std::string getName() const override { return "get-server-logs"; }
    std::string getDescription() const override { return "Get recent server logs"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
private:
    int defaultLines;
};

class StartServerTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "start-server"; }
    std::string getDescription() const override { return "Start the Bedrock server if it is not running"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class StopServerTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "stop-server"; }
    std::string getDescription() const override { return "Stop the Bedrock server gracefully"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class TeleportPlayerTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "teleport-player"; }
    std::string getDescription() const override { return "Teleport a player to specific coordinates"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class GiveItemTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "give-item"; }
    std::string getDescription() const override { return "Give an item to a player"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class SetTimeTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "set-time"; }
    std::string getDescription() const override { return "Set the time of day in the world"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class SetWeatherTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "set-weather"; }
    std::string getDescription() const override { return "Change the weather in the world"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class SetBlockTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "setblock"; }
    std::string getDescription() const override { return "Place a single block at specific coordinates"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class FillTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "fill"; }
    std::string getDescription() const override { return "Fill a rectangular area with blocks"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class CloneTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "clone"; }
    std::string getDescription() const override { return "Copy blocks from one area to another"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class StructureSaveTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "structure-save"; }
    std::string getDescription() const override { return "Save a structure template from the world"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class StructureLoadTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "structure-load"; }
    std::string getDescription() const override { return "Load and place a saved structure template"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class SummonTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "summon"; }
    std::string getDescription() const override { return "Spawn entities (mobs, items, etc.) at specific coordinates"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

class ParticleTool : public ServerTool {
public:
    using ServerTool::ServerTool;
    std::string getName() const override { return "particle"; }
    std::string getDescription() const override { return "Create particle effects at specific locations"; }
    nlohmann::json getSchema() const override;
protected:
    nlohmann::json run(const nlohmann::json& args) override;
};

/**
 * @brief Builds simple structures out of fill/setblock commands.
 *
 * Supported types: house, tower, wall, platform, pyramid. Commands are sent
 * one after another with a short pause; only the last response is reported.
 */
class SimpleBuildingTool : public ServerTool {
public:
    SimpleBuildingTool(BedrockServerManager& manager, int stepDelayMs)
        : ServerTool(manager), stepDelayMs(stepDelayMs) {}
    std::string getName() const override { return "create-simple-building"; }
    std::string getDescription() const override {
        return "Create common building structures like houses, towers, or walls";
    }
    nlohmann::json getSchema() const override;

    // Bedrock world limits
    static constexpr long long MAX_HORIZONTAL = 30000000;
    static constexpr long long MIN_Y = -64;
    static constexpr long long MAX_Y = 320;
    static constexpr long long MAX_SIZE = 256;

    /**
     * @brief Commands for one structure; empty for an unknown structure type.
     * @throws ToolArgs::ArgumentError when the origin lies outside the world
     *         or size is not in 1..MAX_SIZE.
     */
    static std::vector<std::string> planCommands(const std::string& structureType, long long x, long long y,
                                                 long long z, long long size, const std::string& material);

protected:
    nlohmann::json run(const nlohmann::json& args) override;

private:
    int stepDelayMs;
};

// Registers every Bedrock tool, in the order tools/list reports them.
void registerServerTools(ToolRegistry& registry, BedrockServerManager& manager, const Config& config);
