#pragma once
#include <chrono>
#include <mutex>
#include <string>
#ifndef _WIN32
#include <sys/types.h>
#endif

/**
 * @brief A spawned child with a writable stdin pipe and one readable pipe
 * carrying both its stdout and stderr.
 *
 * readLine() belongs to a single reader thread. writeLine() callers must
 * serialize among themselves. Reaping is safe from any thread.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Start executable with workingDir as its current directory.
     * @param error receives a description when false is returned; exec
     *        failures inside the child are reported back here as well.
     */
    bool spawn(const std::string& executable, const std::string& workingDir, std::string& error);

    // Writes line + '\n' directly to the pipe.
    bool writeLine(const std::string& line, std::string& error);

    /**
     * @brief Blocking read of the next line, without its '\n'.
     * @return false at end of stream, or once the child has exited and its
     *         output is drained, even if descendants keep the pipe open.
     */
    bool readLine(std::string& line);

    // Non-blocking. When the child has exited, kills what is left of its
    // process group and reaps it.
    bool hasExited();
    bool waitForExit(std::chrono::milliseconds timeout);

    // Both signal the whole process group.
    void terminate();
    void kill();

    void closeInput();
    // Only the reader thread may close the output side.
    void closeOutput();

    int pid() const;
    int exitStatus() const { return status; }

private:
#ifndef _WIN32
    pid_t childPid = -1;
#endif
    int readFd = -1;
    int writeFd = -1;
    std::string pending;

    std::mutex reapMtx;
    bool reaped = false;
    int status = 0;

    void signal(int sig);
    bool takePending(std::string& line);
};
