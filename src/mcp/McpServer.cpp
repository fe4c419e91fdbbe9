#include "mcp/McpServer.h"
#include "utils/Logger.h"
#include <iostream>
#include <stdexcept>

namespace {
// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;

struct InvalidParams : std::runtime_error {
    using std::runtime_error::runtime_error;
};
} // namespace

McpServer::McpServer(ToolRegistry& registry, std::string name, std::string version)
    : registry(registry), serverName(std::move(name)), serverVersion(std::move(version)) {}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

nlohmann::json McpServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        nlohmann::json id = message.is_object() && message.contains("id") ? message["id"] : nlohmann::json(nullptr);
        return makeError(id, INVALID_REQUEST, "Invalid Request");
    }

    std::string method = message["method"].get<std::string>();
    bool isNotification = !message.contains("id");
    nlohmann::json id = isNotification ? nlohmann::json(nullptr) : message["id"];
    nlohmann::json params = message.value("params", nlohmann::json::object());
    if (params.is_null()) params = nlohmann::json::object();

    if (isNotification) {
        Logger::getInstance().debug("Notification: " + method);
        return nullptr;
    }

    Logger::getInstance().debug("Request: " + method);
    try {
        if (method == "initialize") return makeResult(id, handleInitialize(params));
        if (method == "ping") return makeResult(id, nlohmann::json::object());
        if (method == "tools/list") return makeResult(id, handleToolsList());
        if (method == "tools/call") return makeResult(id, handleToolsCall(params));
        if (method == "resources/list") return makeResult(id, {{"resources", nlohmann::json::array()}});
        if (method == "prompts/list") return makeResult(id, {{"prompts", nlohmann::json::array()}});
    } catch (const InvalidParams& e) {
        return makeError(id, INVALID_PARAMS, e.what());
    }

    return makeError(id, METHOD_NOT_FOUND, "Method not found: " + method);
}

nlohmann::json McpServer::handleInitialize(const nlohmann::json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        Logger::getInstance().info("Client connected: " + params["clientInfo"].value("name", std::string("unknown")));
    }
    return {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", serverName}, {"version", serverVersion}}}
    };
}

nlohmann::json McpServer::handleToolsList() {
    auto schemas = registry.listToolSchemas();
    Logger::getInstance().debug("Listing " + std::to_string(schemas.size()) + " tools");
    return {{"tools", schemas}};
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw InvalidParams("tools/call requires a tool name");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) arguments = nlohmann::json::object();
    if (!arguments.is_object()) {
        throw InvalidParams("tools/call arguments must be an object");
    }

    Logger::getInstance().info("Tool call: " + name + " " + arguments.dump());
    nlohmann::json result = registry.executeTool(name, arguments);

    // Tool-level failures are results with isError, not protocol errors
    if (result.contains("error")) {
        std::string text = result["error"].is_string() ? result["error"].get<std::string>() : result["error"].dump();
        return {
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", "Error executing " + name + ": " + text}}})},
            {"isError", true}
        };
    }
    return result;
}

std::string McpServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) return "";

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn(std::string("Failed to parse incoming JSON: ") + e.what());
        return makeError(nullptr, PARSE_ERROR, "Parse error").dump();
    }

    nlohmann::json response = handleMessage(message);
    if (response.is_null()) return "";
    return response.dump();
}

void McpServer::run(std::istream& in, std::ostream& out) {
    Logger::getInstance().info("MCP server " + serverName + " " + serverVersion + " waiting for messages on stdin");
    std::string line;
    while (std::getline(in, line)) {
        std::string reply = handleLine(line);
        if (reply.empty()) continue;
        out << reply << "\n";
        out.flush();
    }
    Logger::getInstance().info("EOF on stdin, shutting down");
}
