#include "tools/ServerTools.h"
#include "tools/ToolRegistry.h"
#include "server/BedrockServerManager.h"
#include "utils/Logger.h"
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>
#include <sstream>
#include <thread>

namespace {
nlohmann::json stringProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json numberProp(const std::string& description) {
    return {{"type", "number"}, {"description", description}};
}

nlohmann::json objectSchema(const nlohmann::json& properties, const std::vector<std::string>& required) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

std::string point(const std::string& x, const std::string& y, const std::string& z) {
    return "(" + x + ", " + y + ", " + z + ")";
}

std::string tightPoint(const std::string& x, const std::string& y, const std::string& z) {
    return "(" + x + "," + y + "," + z + ")";
}

struct Box {
    std::string x1, y1, z1, x2, y2, z2;
};

Box readBox(const nlohmann::json& args) {
    return {ToolArgs::requireNumber(args, "x1"), ToolArgs::requireNumber(args, "y1"),
            ToolArgs::requireNumber(args, "z1"), ToolArgs::requireNumber(args, "x2"),
            ToolArgs::requireNumber(args, "y2"), ToolArgs::requireNumber(args, "z2")};
}

std::string boxCoords(const Box& b) {
    return b.x1 + " " + b.y1 + " " + b.z1 + " " + b.x2 + " " + b.y2 + " " + b.z2;
}

nlohmann::json boxProps() {
    return {
        {"x1", numberProp("First corner X coordinate")},
        {"y1", numberProp("First corner Y coordinate")},
        {"z1", numberProp("First corner Z coordinate")},
        {"x2", numberProp("Second corner X coordinate")},
        {"y2", numberProp("Second corner Y coordinate")},
        {"z2", numberProp("Second corner Z coordinate")}
    };
}

nlohmann::json pointProps() {
    return {
        {"x", numberProp("X coordinate")},
        {"y", numberProp("Y coordinate")},
        {"z", numberProp("Z coordinate")}
    };
}
} // namespace

namespace ToolArgs {
std::string requireString(const nlohmann::json& args, const std::string& key) {
    auto value = optionalString(args, key);
    if (!value) {
        throw ArgumentError("Missing required argument: " + key);
    }
    return *value;
}

std::optional<std::string> optionalString(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_string()) {
        throw ArgumentError("Argument '" + key + "' must be a string");
    }
    std::string value = args[key].get<std::string>();
    if (value.find_first_of("\r\n") != std::string::npos) {
        throw ArgumentError("Argument '" + key + "' must be a single line");
    }
    return value;
}

std::string requireNumber(const nlohmann::json& args, const std::string& key) {
    auto value = optionalNumber(args, key);
    if (!value) {
        throw ArgumentError("Missing required argument: " + key);
    }
    return *value;
}

std::optional<std::string> optionalNumber(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return std::nullopt;
    if (!args[key].is_number()) {
        throw ArgumentError("Argument '" + key + "' must be a number");
    }
    return formatNumber(args[key]);
}

long long requireInteger(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        throw ArgumentError("Missing required argument: " + key);
    }
    const auto& v = args[key];
    if (!v.is_number()) {
        throw ArgumentError("Argument '" + key + "' must be a number");
    }
    if (v.is_number_unsigned()) {
        auto u = v.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
            throw ArgumentError("Argument '" + key + "' is out of range");
        }
        return static_cast<long long>(u);
    }
    if (v.is_number_integer()) return v.get<long long>();

    // Beyond 2^53 doubles are no longer exact integers
    double d = v.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > 9007199254740992.0) {
        throw ArgumentError("Argument '" + key + "' is out of range");
    }
    return std::llround(d);
}

std::string formatNumber(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return std::to_string(value.get<unsigned long long>());
    if (value.is_number_integer()) return std::to_string(value.get<long long>());

    double d = value.get<double>();
    if (!std::isfinite(d)) {
        throw ArgumentError("Numeric argument must be finite");
    }
    // Shortest representation that reads back to the same double
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string out = buf;
    if (out.find_first_of(".e") == std::string::npos) {
        out += ".0";
    }
    return out;
}
} // namespace ToolArgs

nlohmann::json ServerTool::execute(const nlohmann::json& args) {
    try {
        return run(args.is_null() ? nlohmann::json::object() : args);
    } catch (const ToolArgs::ArgumentError& e) {
        return {{"error", e.what()}};
    }
}

nlohmann::json ServerTool::textResult(const std::string& text, bool isError) {
    return {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", isError}
    };
}

nlohmann::json ServerTool::sendAndReport(const std::string& command, const std::string& summary) {
    CommandResult result = manager.sendCommand(command);
    auto response = textResult(summary + "\n\nServer response:\n" + result.text(), !result.ok());
    if (result.ok()) {
        response["_meta"] = {
            {"command", command},
            {"lines_since_request", result.snapshot().linesSinceRequest}
        };
    }
    return response;
}

// send-command

nlohmann::json SendCommandTool::getSchema() const {
    return objectSchema({{"command", stringProp("The Minecraft command to send (without leading slash)")}},
                        {"command"});
}

nlohmann::json SendCommandTool::run(const nlohmann::json& args) {
    std::string command = ToolArgs::requireString(args, "command");
    return sendAndReport(command, "Command sent: " + command);
}

// get-server-status

nlohmann::json ServerStatusTool::getSchema() const {
    return objectSchema(nlohmann::json::object(), {});
}

nlohmann::json ServerStatusTool::run(const nlohmann::json&) {
    ServerStatus status = manager.status();
    std::ostringstream oss;
    oss << "Server Status:\n"
        << "- Running: " << (status.running ? "true" : "false") << "\n"
        << "- Players Online: " << status.playerCount << "\n"
        << "- Process ID: " << (status.pid ? std::to_string(*status.pid) : "none") << "\n\n"
        << "Players: ";
    if (status.players.empty()) {
        oss << "None";
    } else {
        for (size_t i = 0; i < status.players.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << status.players[i];
        }
    }
    auto result = textResult(oss.str());
    result["_meta"] = status.toJson();
    return result;
}

// list-players

nlohmann::json ListPlayersTool::getSchema() const {
    return objectSchema(nlohmann::json::object(), {});
}

nlohmann::json ListPlayersTool::run(const nlohmann::json&) {
    ServerStatus status = manager.status();
    if (status.players.empty()) {
        return textResult("No players currently online");
    }
    std::string text = "Players online (" + std::to_string(status.players.size()) + "):";
    for (const auto& player : status.players) {
        text += "\n- " + player;
    }
    return textResult(text);
}

// get-server-logs

nlohmann::json ServerLogsTool::getSchema() const {
    return objectSchema({{"lines", numberProp("Number of recent log lines to retrieve")}}, {});
}

nlohmann::json ServerLogsTool::run(const nlohmann::json& args) {
    long long lines = defaultLines;
    if (args.contains("lines") && !args["lines"].is_null()) {
        lines = ToolArgs::requireInteger(args, "lines");
        if (lines < 0) {
            throw ToolArgs::ArgumentError("Argument 'lines' must not be negative");
        }
    }
    auto logs = manager.recentLogs(static_cast<size_t>(lines));
    std::string text = "Recent server logs (" + std::to_string(logs.size()) + " lines):\n";
    for (const auto& line : logs) {
        text += "\n" + line;
    }
    return textResult(text);
}

// start-server / stop-server

nlohmann::json StartServerTool::getSchema() const {
    return objectSchema(nlohmann::json::object(), {});
}

nlohmann::json StartServerTool::run(const nlohmann::json&) {
    if (manager.start()) {
        auto status = manager.status();
        return textResult("Server running (pid " + (status.pid ? std::to_string(*status.pid) : "none") + ")");
    }
    switch (manager.lastStartError()) {
        case BridgeError::ExecutableNotFound:
            return textResult("Error: Bedrock server executable not found in " +
                              manager.workingDirectory().u8string(), true);
        case BridgeError::SpawnFailure:
            return textResult("Error: Failed to start server process", true);
        default:
            return textResult("Error: Server could not be started", true);
    }
}

nlohmann::json StopServerTool::getSchema() const {
    return objectSchema(nlohmann::json::object(), {});
}

nlohmann::json StopServerTool::run(const nlohmann::json&) {
    bool wasRunning = manager.isRunning();
    manager.stop();
    return textResult(wasRunning ? "Server stopped" : "Server was not running");
}

// teleport-player

nlohmann::json TeleportPlayerTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["player"] = stringProp("Player name to teleport");
    return objectSchema(props, {"player", "x", "y", "z"});
}

nlohmann::json TeleportPlayerTool::run(const nlohmann::json& args) {
    std::string player = ToolArgs::requireString(args, "player");
    std::string x = ToolArgs::requireNumber(args, "x");
    std::string y = ToolArgs::requireNumber(args, "y");
    std::string z = ToolArgs::requireNumber(args, "z");
    return sendAndReport("tp " + player + " " + x + " " + y + " " + z,
                         "Teleported " + player + " to " + point(x, y, z));
}

// give-item

nlohmann::json GiveItemTool::getSchema() const {
    return objectSchema({
        {"player", stringProp("Player name to give item to")},
        {"item", stringProp("Item ID (e.g., 'diamond_sword', 'stone', 'apple')")},
        {"amount", numberProp("Amount of items to give")}
    }, {"player", "item"});
}

nlohmann::json GiveItemTool::run(const nlohmann::json& args) {
    std::string player = ToolArgs::requireString(args, "player");
    std::string item = ToolArgs::requireString(args, "item");
    std::string amount = ToolArgs::optionalNumber(args, "amount").value_or("1");
    return sendAndReport("give " + player + " " + item + " " + amount,
                         "Gave " + amount + " " + item + " to " + player);
}

// set-time

nlohmann::json SetTimeTool::getSchema() const {
    return objectSchema({{"time", stringProp("Time to set ('day', 'night', 'noon', 'midnight', or tick value)")}},
                        {"time"});
}

nlohmann::json SetTimeTool::run(const nlohmann::json& args) {
    std::string time = args.contains("time") && args["time"].is_number()
        ? ToolArgs::requireNumber(args, "time")
        : ToolArgs::requireString(args, "time");
    return sendAndReport("time set " + time, "Set time to " + time);
}

// set-weather

nlohmann::json SetWeatherTool::getSchema() const {
    return objectSchema({
        {"weather", stringProp("Weather type ('clear', 'rain', 'thunder')")},
        {"duration", numberProp("Duration in seconds (optional)")}
    }, {"weather"});
}

nlohmann::json SetWeatherTool::run(const nlohmann::json& args) {
    std::string weather = ToolArgs::requireString(args, "weather");
    auto duration = ToolArgs::optionalNumber(args, "duration");
    std::string command = "weather " + weather;
    // zero means "no duration", as an omitted argument does
    if (duration && *duration != "0" && *duration != "0.0") {
        command += " " + *duration;
    }
    return sendAndReport(command, "Set weather to " + weather);
}

// setblock

nlohmann::json SetBlockTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["block"] = stringProp("Block type (e.g., 'stone', 'oak_planks', 'glass', 'dirt')");
    return objectSchema(props, {"x", "y", "z", "block"});
}

nlohmann::json SetBlockTool::run(const nlohmann::json& args) {
    std::string x = ToolArgs::requireNumber(args, "x");
    std::string y = ToolArgs::requireNumber(args, "y");
    std::string z = ToolArgs::requireNumber(args, "z");
    std::string block = ToolArgs::requireString(args, "block");
    return sendAndReport("setblock " + x + " " + y + " " + z + " " + block,
                         "Placed " + block + " at " + point(x, y, z));
}

// fill

nlohmann::json FillTool::getSchema() const {
    nlohmann::json props = boxProps();
    props["block"] = stringProp("Block type to fill with (e.g., 'stone', 'air', 'water')");
    props["fill_mode"] = stringProp("Fill mode ('replace', 'destroy', 'keep', 'outline', 'hollow')");
    return objectSchema(props, {"x1", "y1", "z1", "x2", "y2", "z2", "block"});
}

nlohmann::json FillTool::run(const nlohmann::json& args) {
    Box box = readBox(args);
    std::string block = ToolArgs::requireString(args, "block");
    std::string mode = ToolArgs::optionalString(args, "fill_mode").value_or("replace");
    return sendAndReport("fill " + boxCoords(box) + " " + block + " " + mode,
                         "Filled area from " + tightPoint(box.x1, box.y1, box.z1) + " to " +
                         tightPoint(box.x2, box.y2, box.z2) + " with " + block);
}

// clone

nlohmann::json CloneTool::getSchema() const {
    return objectSchema({
        {"x1", numberProp("Source area first corner X")},
        {"y1", numberProp("Source area first corner Y")},
        {"z1", numberProp("Source area first corner Z")},
        {"x2", numberProp("Source area second corner X")},
        {"y2", numberProp("Source area second corner Y")},
        {"z2", numberProp("Source area second corner Z")},
        {"dest_x", numberProp("Destination X coordinate")},
        {"dest_y", numberProp("Destination Y coordinate")},
        {"dest_z", numberProp("Destination Z coordinate")}
    }, {"x1", "y1", "z1", "x2", "y2", "z2", "dest_x", "dest_y", "dest_z"});
}

nlohmann::json CloneTool::run(const nlohmann::json& args) {
    Box box = readBox(args);
    std::string dx = ToolArgs::requireNumber(args, "dest_x");
    std::string dy = ToolArgs::requireNumber(args, "dest_y");
    std::string dz = ToolArgs::requireNumber(args, "dest_z");
    return sendAndReport("clone " + boxCoords(box) + " " + dx + " " + dy + " " + dz,
                         "Cloned area from " + tightPoint(box.x1, box.y1, box.z1) + "-" +
                         tightPoint(box.x2, box.y2, box.z2) + " to " + tightPoint(dx, dy, dz));
}

// structure-save / structure-load

nlohmann::json StructureSaveTool::getSchema() const {
    nlohmann::json props = boxProps();
    props["name"] = stringProp("Name for the structure template");
    return objectSchema(props, {"name", "x1", "y1", "z1", "x2", "y2", "z2"});
}

nlohmann::json StructureSaveTool::run(const nlohmann::json& args) {
    std::string name = ToolArgs::requireString(args, "name");
    Box box = readBox(args);
    return sendAndReport("structure save " + name + " " + boxCoords(box),
                         "Saved structure '" + name + "' from " + tightPoint(box.x1, box.y1, box.z1) + " to " +
                         tightPoint(box.x2, box.y2, box.z2));
}

nlohmann::json StructureLoadTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["name"] = stringProp("Name of the structure template to load");
    props["x"] = numberProp("X coordinate to place structure");
    props["y"] = numberProp("Y coordinate to place structure");
    props["z"] = numberProp("Z coordinate to place structure");
    return objectSchema(props, {"name", "x", "y", "z"});
}

nlohmann::json StructureLoadTool::run(const nlohmann::json& args) {
    std::string name = ToolArgs::requireString(args, "name");
    std::string x = ToolArgs::requireNumber(args, "x");
    std::string y = ToolArgs::requireNumber(args, "y");
    std::string z = ToolArgs::requireNumber(args, "z");
    return sendAndReport("structure load " + name + " " + x + " " + y + " " + z,
                         "Loaded structure '" + name + "' at " + point(x, y, z));
}

// summon / particle

nlohmann::json SummonTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["entity"] = stringProp("Entity type (e.g., 'cow', 'zombie', 'armor_stand', 'item')");
    return objectSchema(props, {"entity", "x", "y", "z"});
}

nlohmann::json SummonTool::run(const nlohmann::json& args) {
    std::string entity = ToolArgs::requireString(args, "entity");
    std::string x = ToolArgs::requireNumber(args, "x");
    std::string y = ToolArgs::requireNumber(args, "y");
    std::string z = ToolArgs::requireNumber(args, "z");
    return sendAndReport("summon " + entity + " " + x + " " + y + " " + z,
                         "Summoned " + entity + " at " + point(x, y, z));
}

nlohmann::json ParticleTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["particle_type"] = stringProp("Particle type (e.g., 'flame', 'smoke', 'heart', 'explosion')");
    return objectSchema(props, {"particle_type", "x", "y", "z"});
}

nlohmann::json ParticleTool::run(const nlohmann::json& args) {
    std::string type = ToolArgs::requireString(args, "particle_type");
    std::string x = ToolArgs::requireNumber(args, "x");
    std::string y = ToolArgs::requireNumber(args, "y");
    std::string z = ToolArgs::requireNumber(args, "z");
    return sendAndReport("particle " + type + " " + x + " " + y + " " + z,
                         "Created " + type + " particles at " + point(x, y, z));
}

// create-simple-building

nlohmann::json SimpleBuildingTool::getSchema() const {
    nlohmann::json props = pointProps();
    props["structure_type"] = stringProp("Type of structure ('house', 'tower', 'wall', 'platform', 'pyramid')");
    props["size"] = numberProp("Size parameter (width/height depending on structure)");
    props["material"] = stringProp("Primary building material (e.g., 'stone', 'oak_planks', 'cobblestone')");
    return objectSchema(props, {"structure_type", "x", "y", "z", "size"});
}

std::vector<std::string> SimpleBuildingTool::planCommands(const std::string& structureType, long long x,
                                                          long long y, long long z, long long size,
                                                          const std::string& material) {
    if (x < -MAX_HORIZONTAL || x > MAX_HORIZONTAL || z < -MAX_HORIZONTAL || z > MAX_HORIZONTAL) {
        throw ToolArgs::ArgumentError("Coordinates x and z must be within +/-" + std::to_string(MAX_HORIZONTAL));
    }
    if (y < MIN_Y || y > MAX_Y) {
        throw ToolArgs::ArgumentError("Coordinate y must be between " + std::to_string(MIN_Y) + " and " +
                                      std::to_string(MAX_Y));
    }
    if (size < 1 || size > MAX_SIZE) {
        throw ToolArgs::ArgumentError("Argument 'size' must be between 1 and " + std::to_string(MAX_SIZE));
    }

    auto n = [](long long v) { return std::to_string(v); };
    auto fill = [&](long long x1, long long y1, long long z1, long long x2, long long y2, long long z2) {
        return "fill " + n(x1) + " " + n(y1) + " " + n(z1) + " " + n(x2) + " " + n(y2) + " " + n(z2) + " " +
               material;
    };

    std::vector<std::string> commands;
    if (structureType == "house") {
        commands.push_back(fill(x - size, y, z - size, x + size, y, z + size));
        commands.push_back(fill(x - size, y + 1, z - size, x + size, y + 5, z + size) + " hollow");
        commands.push_back("setblock " + n(x) + " " + n(y + 1) + " " + n(z - size) + " air");
        commands.push_back(fill(x - size, y + 6, z - size, x + size, y + 6, z + size));
    } else if (structureType == "tower") {
        commands.push_back(fill(x - size, y, z - size, x + size, y + 20, z + size) + " hollow");
    } else if (structureType == "wall") {
        commands.push_back(fill(x, y, z - size, x, y + 5, z + size));
    } else if (structureType == "platform") {
        commands.push_back(fill(x - size, y, z - size, x + size, y, z + size));
    } else if (structureType == "pyramid") {
        for (long long i = 0; i < size; ++i) {
            long long layer = size - i;
            commands.push_back(fill(x - layer, y + i, z - layer, x + layer, y + i, z + layer));
        }
    }
    return commands;
}

nlohmann::json SimpleBuildingTool::run(const nlohmann::json& args) {
    std::string type = ToolArgs::requireString(args, "structure_type");
    long long x = ToolArgs::requireInteger(args, "x");
    long long y = ToolArgs::requireInteger(args, "y");
    long long z = ToolArgs::requireInteger(args, "z");
    long long size = ToolArgs::requireInteger(args, "size");
    std::string material = ToolArgs::optionalString(args, "material").value_or("stone");

    auto commands = planCommands(type, x, y, z, size, material);
    std::string finalResult = "No commands executed";
    bool failed = false;
    for (const auto& command : commands) {
        CommandResult result = manager.sendCommand(command);
        finalResult = result.text();
        if (!result.ok()) {
            Logger::getInstance().warn("Building aborted at '" + command + "': " + result.message());
            failed = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(stepDelayMs));
    }

    return textResult("Built " + type + " at " + point(std::to_string(x), std::to_string(y), std::to_string(z)) +
                      " with size " + std::to_string(size) + " using " + material + "\n\nExecuted " +
                      std::to_string(commands.size()) + " commands\n\nFinal result:\n" + finalResult,
                      failed);
}

void registerServerTools(ToolRegistry& registry, BedrockServerManager& manager, const Config& config) {
    registry.registerTool(std::make_unique<SendCommandTool>(manager));
    registry.registerTool(std::make_unique<ServerStatusTool>(manager));
    registry.registerTool(std::make_unique<ListPlayersTool>(manager));
    registry.registerTool(std::make_unique<ServerLogsTool>(manager, config.bridge.defaultLogLines));
    registry.registerTool(std::make_unique<StartServerTool>(manager));
    registry.registerTool(std::make_unique<StopServerTool>(manager));
    registry.registerTool(std::make_unique<TeleportPlayerTool>(manager));
    registry.registerTool(std::make_unique<GiveItemTool>(manager));
    registry.registerTool(std::make_unique<SetTimeTool>(manager));
    registry.registerTool(std::make_unique<SetWeatherTool>(manager));
    registry.registerTool(std::make_unique<SetBlockTool>(manager));
    registry.registerTool(std::make_unique<FillTool>(manager));
    registry.registerTool(std::make_unique<CloneTool>(manager));
    registry.registerTool(std::make_unique<StructureSaveTool>(manager));
    registry.registerTool(std::make_unique<StructureLoadTool>(manager));
    registry.registerTool(std::make_unique<SummonTool>(manager));
    registry.registerTool(std::make_unique<ParticleTool>(manager));
    registry.registerTool(std::make_unique<SimpleBuildingTool>(manager, config.bridge.buildStepDelayMs));
}
