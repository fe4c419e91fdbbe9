#pragma once
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "tools/ToolRegistry.h"

/**
 * @brief MCP server side of JSON-RPC 2.0 over newline-delimited stdio.
 *
 * Supports initialize, ping, tools/list, tools/call, resources/list and
 * prompts/list. Notifications never get a reply.
 */
class McpServer {
public:
    static constexpr const char* PROTOCOL_VERSION = "2024-11-05";

    McpServer(ToolRegistry& registry, std::string name, std::string version);

    /**
     * @brief Handle one decoded message.
     * @return the response object, or null for notifications.
     */
    nlohmann::json handleMessage(const nlohmann::json& message);

    /**
     * @brief Handle one raw line, including JSON parse errors.
     * @return serialized response, or an empty string when nothing is due.
     */
    std::string handleLine(const std::string& line);

    // Serve until the input stream ends.
    void run(std::istream& in, std::ostream& out);

private:
    ToolRegistry& registry;
    std::string serverName;
    std::string serverVersion;

    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsList();
    nlohmann::json handleToolsCall(const nlohmann::json& params);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
};
