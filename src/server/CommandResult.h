#pragma once
#include <chrono>
#include <string>
#include <vector>

enum class BridgeError {
    None,
    NotRunning,
    ExecutableNotFound,
    SpawnFailure,
    WriteFailure
};

/**
 * @brief What the server logged around the time a command was written.
 *
 * The console has no response framing, so this is telemetry: the last
 * lines in the buffer after the settle delay. linesSinceRequest tells how
 * many of them (at most) arrived after the command was written.
 */
struct CommandSnapshot {
    std::string command;
    std::chrono::system_clock::time_point requestedAt;
    std::vector<std::string> logsObserved;
    size_t linesSinceRequest = 0;

    std::string text() const {
        std::string out;
        for (size_t i = 0; i < logsObserved.size(); ++i) {
            if (i > 0) out += "\n";
            out += logsObserved[i];
        }
        return out;
    }
};

class CommandResult {
public:
    static CommandResult success(CommandSnapshot snapshot) {
        CommandResult r;
        r.snap = std::move(snapshot);
        return r;
    }

    static CommandResult failure(BridgeError error, std::string message) {
        CommandResult r;
        r.err = error;
        r.msg = std::move(message);
        return r;
    }

    bool ok() const { return err == BridgeError::None; }
    BridgeError error() const { return err; }
    const std::string& message() const { return msg; }
    const CommandSnapshot& snapshot() const { return snap; }

    // Display text: the error message, or the observed log lines.
    std::string text() const { return ok() ? snap.text() : msg; }

private:
    CommandResult() = default;
    BridgeError err = BridgeError::None;
    std::string msg;
    CommandSnapshot snap;
};
