#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "server/LineClassifier.h"

struct Config {
    struct Server {
        std::string path;
        std::vector<std::string> executableNames{"bedrock_server", "bedrock_server.exe", "BedrockServer.exe"};
        bool autoStart = false;
    } server;

    struct Bridge {
        size_t logCapacity = 100;
        size_t responseLines = 10;
        int settleDelayMs = 500;
        int stopGraceMs = 2000;
        int defaultLogLines = 20;
        bool clearPresenceOnStart = true;
        int buildStepDelayMs = 100; // pause between commands of a building plan
    } bridge;

    PatternTable patterns = LineClassifier::defaultTable();

    struct Logging {
        std::string file = "bedrock-bridge.log";
        bool debug = false;
    } logging;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    // Every key is optional; missing ones keep their defaults.
    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        try {
            if (j.contains("server")) {
                const auto& s = j.at("server");
                cfg.server.path = s.value("path", cfg.server.path);
                cfg.server.autoStart = s.value("auto_start", cfg.server.autoStart);
                if (s.contains("executable_names")) {
                    cfg.server.executableNames = s["executable_names"].get<std::vector<std::string>>();
                }
            }

            if (j.contains("bridge")) {
                const auto& b = j.at("bridge");
                cfg.bridge.logCapacity = b.value("log_capacity", cfg.bridge.logCapacity);
                cfg.bridge.responseLines = b.value("response_lines", cfg.bridge.responseLines);
                cfg.bridge.settleDelayMs = b.value("settle_delay_ms", cfg.bridge.settleDelayMs);
                cfg.bridge.stopGraceMs = b.value("stop_grace_ms", cfg.bridge.stopGraceMs);
                cfg.bridge.defaultLogLines = b.value("default_log_lines", cfg.bridge.defaultLogLines);
                cfg.bridge.clearPresenceOnStart = b.value("clear_presence_on_start", cfg.bridge.clearPresenceOnStart);
                cfg.bridge.buildStepDelayMs = b.value("build_step_delay_ms", cfg.bridge.buildStepDelayMs);
            }

            if (j.contains("patterns")) {
                cfg.patterns.clear();
                for (const auto& item : j["patterns"]) {
                    std::string kindName = item.value("kind", "");
                    auto kind = LineClassifier::parseKind(kindName);
                    if (!kind) {
                        throw std::runtime_error("Unknown pattern kind '" + kindName + "' (expected join or leave)");
                    }
                    PatternRule rule;
                    rule.kind = *kind;
                    rule.pattern = item.at("pattern").get<std::string>();
                    rule.captureIndex = item.value("group", static_cast<size_t>(1));
                    cfg.patterns.push_back(std::move(rule));
                }
            }

            if (j.contains("logging")) {
                const auto& l = j.at("logging");
                cfg.logging.file = l.value("file", cfg.logging.file);
                cfg.logging.debug = l.value("debug", cfg.logging.debug);
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config: ") + e.what());
        }

        if (cfg.bridge.logCapacity == 0) {
            throw std::runtime_error("bridge.log_capacity must be positive");
        }
        if (cfg.bridge.settleDelayMs < 0 || cfg.bridge.stopGraceMs < 0 || cfg.bridge.buildStepDelayMs < 0) {
            throw std::runtime_error("bridge delays must not be negative");
        }
        return cfg;
    }
};
