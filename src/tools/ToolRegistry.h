#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Owns every tool and dispatches calls to them by name.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool. A tool with the same name is replaced.
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @return the tool, or nullptr if no tool has that name
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool descriptors in registration order, in tools/list format:
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief Run a tool.
     *
     * Unknown tools yield {"error": "Tool not found: xxx"}; exceptions thrown
     * by the tool yield {"error": "Tool execution failed: ..."}.
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
    std::vector<std::string> order;
};
