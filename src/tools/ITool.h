#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Interface of a tool exposed over MCP.
 *
 * Tools are thin: they validate arguments, build one or more console
 * commands and hand them to the server manager. They hold no state of
 * their own beyond the references they are constructed with.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name as listed by tools/list
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to the client
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool.
     * @param args arguments object from tools/call
     * @return MCP tool result:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ],
     *   "isError": false
     * }
     *
     * Invalid arguments are reported as:
     * {
     *   "error": "..."
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};
