#include <iostream>
#include <string>
#include <memory>
#include "core/CommandLine.h"
#include "core/ConfigManager.h"
#include "mcp/McpServer.h"
#include "server/BedrockServerManager.h"
#include "tools/ServerTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

#ifndef BEDROCK_BRIDGE_VERSION
#define BEDROCK_BRIDGE_VERSION "1.0.0"
#endif

int main(int argc, char* argv[]) {
    CommandLineOptions opts;
    try {
        opts = parseCommandLine(argc, argv);
    } catch (const CommandLineError& e) {
        std::cerr << e.what() << "\n\n" << usageText();
        return 1;
    }
    if (opts.showHelp) {
        std::cerr << usageText();
        return 0;
    }
    const std::string& configPath = opts.configPath;

    Config cfg;
    if (!configPath.empty()) {
        try {
            cfg = Config::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }
    if (!opts.serverPath.empty()) cfg.server.path = opts.serverPath;
    if (opts.autoStart) cfg.server.autoStart = true;
    if (opts.debug) cfg.logging.debug = true;

    if (cfg.server.path.empty()) {
        std::cerr << "--server-path is required (or server.path in the config file)\n\n" << usageText();
        return 1;
    }

    Logger::getInstance().setLogFile(cfg.logging.file);
    Logger::getInstance().setDebugEnabled(cfg.logging.debug);
    if (!configPath.empty()) {
        Logger::getInstance().info("Loaded configuration from: " + configPath);
    }

    std::unique_ptr<BedrockServerManager> manager;
    try {
        manager = std::make_unique<BedrockServerManager>(cfg);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Invalid configuration: ") + e.what());
        return 1;
    }

    ToolRegistry registry;
    registerServerTools(registry, *manager, cfg);
    Logger::getInstance().info("Registered " + std::to_string(registry.getToolCount()) + " tools");

    if (cfg.server.autoStart) {
        Logger::getInstance().info("Starting Bedrock server...");
        if (!manager->start()) {
            Logger::getInstance().error("Failed to start Bedrock server");
            return 1;
        }
    }

    McpServer server(registry, "minecraft-bedrock", BEDROCK_BRIDGE_VERSION);
    server.run(std::cin, std::cout);

    if (manager->isRunning()) {
        Logger::getInstance().info("Stopping Bedrock server before exit");
    }
    manager->stop();
    return 0;
}
