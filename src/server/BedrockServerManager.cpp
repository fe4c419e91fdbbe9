#include "server/BedrockServerManager.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace fs = std::filesystem;

namespace {
std::string trimRight(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(0, end);
}
} // namespace

BedrockServerManager::BedrockServerManager(const Config& config)
    : serverCfg(config.server),
      bridgeCfg(config.bridge),
      classifier(config.patterns),
      logBuffer(config.bridge.logCapacity) {}

BedrockServerManager::~BedrockServerManager() {
    stop();
}

fs::path BedrockServerManager::workingDirectory() const {
    fs::path base = fs::u8path(serverCfg.path);
    if (base.empty()) return fs::path(".");
    std::error_code ec;
    if (fs::is_directory(base, ec)) return base;
    fs::path parent = base.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}

std::optional<fs::path> BedrockServerManager::findExecutable() const {
    std::error_code ec;
    fs::path base = fs::u8path(serverCfg.path);
    if (!base.empty() && fs::is_regular_file(base, ec)) {
        return fs::absolute(base, ec);
    }

    fs::path dir = workingDirectory();
    for (const auto& name : serverCfg.executableNames) {
        fs::path candidate = dir / name;
        if (fs::is_regular_file(candidate, ec)) {
            return fs::absolute(candidate, ec);
        }
    }
    return std::nullopt;
}

bool BedrockServerManager::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx);
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (running) return true;
    }

    // A previous reader may have finished on its own after a crash
    if (readerThread.joinable()) readerThread.join();

    fs::path cwd = workingDirectory();
    auto executable = findExecutable();
    if (!executable) {
        Logger::getInstance().error("Bedrock server executable not found in " + cwd.u8string());
        setStartError(BridgeError::ExecutableNotFound);
        return false;
    }

    auto proc = std::make_shared<ChildProcess>();
    std::string error;
    if (!proc->spawn(executable->u8string(), cwd.u8string(), error)) {
        Logger::getInstance().error("Failed to start server: " + error);
        setStartError(BridgeError::SpawnFailure);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (bridgeCfg.clearPresenceOnStart) {
            presence.clear();
        }
        process = proc;
        running = true;
        startError = BridgeError::None;
    }
    readerThread = std::thread(&BedrockServerManager::ingestLoop, this, proc);

    Logger::getInstance().success("Bedrock server started (pid " + std::to_string(proc->pid()) + ")");
    return true;
}

void BedrockServerManager::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx);
    std::shared_ptr<ChildProcess> proc;
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        proc = process;
    }

    if (proc) {
        auto result = sendCommand("stop");
        if (!result.ok()) {
            Logger::getInstance().debug("stop command not delivered: " + result.message());
        }

        if (!proc->waitForExit(std::chrono::milliseconds(bridgeCfg.stopGraceMs))) {
            Logger::getInstance().warn("Server did not exit within " + std::to_string(bridgeCfg.stopGraceMs) +
                                       " ms, terminating");
            proc->terminate();
            if (!proc->waitForExit(std::chrono::milliseconds(1000))) {
                proc->kill();
                proc->waitForExit(std::chrono::milliseconds(1000));
            }
        }
    }

    if (readerThread.joinable()) readerThread.join();

    {
        std::lock_guard<std::mutex> lock(stateMtx);
        running = false;
        process.reset();
    }
    if (proc) {
        Logger::getInstance().info("Bedrock server stopped");
    }
}

CommandResult BedrockServerManager::sendCommand(const std::string& command) {
    std::shared_ptr<ChildProcess> proc;
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (!running || !process) {
            return CommandResult::failure(BridgeError::NotRunning, NOT_RUNNING_MESSAGE);
        }
        proc = process;
    }

    try {
        CommandSnapshot snapshot;
        snapshot.command = command;
        snapshot.requestedAt = std::chrono::system_clock::now();

        size_t seqBefore = 0;
        {
            std::lock_guard<std::mutex> writeLock(writeMtx);
            {
                std::lock_guard<std::mutex> lock(stateMtx);
                seqBefore = logBuffer.totalAppended();
            }
            std::string error;
            if (!proc->writeLine(command, error)) {
                Logger::getInstance().error("Error sending command '" + command + "': " + error);
                return CommandResult::failure(BridgeError::WriteFailure, "Error sending command: " + error);
            }
        }
        Logger::getInstance().debug("Sent command: " + command);

        std::this_thread::sleep_for(std::chrono::milliseconds(bridgeCfg.settleDelayMs));

        {
            std::lock_guard<std::mutex> lock(stateMtx);
            snapshot.logsObserved = logBuffer.tail(bridgeCfg.responseLines);
            size_t since = logBuffer.totalAppended() - seqBefore;
            snapshot.linesSinceRequest = std::min(since, snapshot.logsObserved.size());
        }
        if (snapshot.logsObserved.empty()) {
            snapshot.logsObserved.push_back(NO_ACTIVITY_PLACEHOLDER);
        }
        return CommandResult::success(std::move(snapshot));
    } catch (const std::exception& e) {
        return CommandResult::failure(BridgeError::WriteFailure, std::string("Error sending command: ") + e.what());
    }
}

ServerStatus BedrockServerManager::status() const {
    std::lock_guard<std::mutex> lock(stateMtx);
    ServerStatus s;
    s.running = running;
    s.players = presence.list();
    s.playerCount = s.players.size();
    if (running && process) {
        s.pid = process->pid();
    }
    return s;
}

std::vector<std::string> BedrockServerManager::recentLogs(size_t n) const {
    std::lock_guard<std::mutex> lock(stateMtx);
    if (logBuffer.empty()) {
        return {NO_LOGS_PLACEHOLDER};
    }
    return logBuffer.tail(n == 0 ? logBuffer.size() : n);
}

bool BedrockServerManager::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMtx);
    return running;
}

BridgeError BedrockServerManager::lastStartError() const {
    std::lock_guard<std::mutex> lock(stateMtx);
    return startError;
}

void BedrockServerManager::setStartError(BridgeError error) {
    std::lock_guard<std::mutex> lock(stateMtx);
    startError = error;
}

void BedrockServerManager::ingestLine(const std::string& raw) {
    std::string line = trimRight(raw);

    std::time_t now = std::time(nullptr);
    std::optional<PresenceEvent> event;
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        logBuffer.append(line, now);
        if (!line.empty()) {
            event = classifier.classify(line);
        }
        if (event && !LineClassifier::apply(*event, presence)) {
            event.reset();
        }
    }

    if (event) {
        Logger::getInstance().info(std::string("Player ") + LineClassifier::kindName(event->kind) + ": " +
                                   event->player);
    }
}

void BedrockServerManager::ingestLoop(std::shared_ptr<ChildProcess> proc) {
    std::string line;
    while (proc->readLine(line)) {
        ingestLine(line);
    }

    proc->closeOutput();
    {
        std::lock_guard<std::mutex> writeLock(writeMtx);
        proc->closeInput();
    }
    bool exited = proc->waitForExit(std::chrono::milliseconds(200));

    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (process == proc) {
            running = false;
            process.reset();
        }
    }

    if (exited) {
        Logger::getInstance().info("Server output closed, process exited with status " +
                                   std::to_string(proc->exitStatus()));
    } else {
        Logger::getInstance().warn("Server output closed but the process is still alive; it will be killed");
    }
}
