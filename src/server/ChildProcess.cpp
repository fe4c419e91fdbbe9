#include "server/ChildProcess.h"
#include <cerrno>
#include <cstring>
#include <thread>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#endif

namespace {
#ifndef _WIN32
constexpr int POLL_INTERVAL_MS = 100;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void closePipe(int fds[2]) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) return false;
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Writing to a child that already died must surface as EPIPE, not kill us.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}
#endif
} // namespace

ChildProcess::~ChildProcess() {
#ifndef _WIN32
    closeInput();
    closeFd(readFd);
    if (childPid > 0 && !hasExited()) {
        kill();
        waitForExit(std::chrono::milliseconds(1000));
    }
#endif
}

#ifndef _WIN32
bool ChildProcess::spawn(const std::string& executable, const std::string& workingDir, std::string& error) {
    if (childPid > 0) {
        error = "process already spawned";
        return false;
    }
    ignoreSigpipe();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (!makePipe(inPipe) || !makePipe(outPipe) || !makePipe(errPipe)) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        closePipe(inPipe);
        closePipe(outPipe);
        closePipe(errPipe);
        return false;
    }

    pid_t pid = fork();
    if (pid == 0) {
        // Own process group, so helpers the server starts can be signalled with it
        setpgid(0, 0);

        // dup2 clears FD_CLOEXEC on the copies, everything else closes on exec
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(outPipe[1], STDERR_FILENO);

        int childErr = 0;
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            childErr = errno;
        } else {
            execl(executable.c_str(), executable.c_str(), static_cast<char*>(nullptr));
            childErr = errno;
        }
        ssize_t ignored = write(errPipe[1], &childErr, sizeof(childErr));
        (void)ignored;
        _exit(127);
    }

    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        closePipe(inPipe);
        closePipe(outPipe);
        closePipe(errPipe);
        return false;
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    // EOF here means exec succeeded
    int childErr = 0;
    ssize_t n = 0;
    do {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int st = 0;
        waitpid(pid, &st, 0);
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        error = "cannot execute " + executable + ": " + std::strerror(childErr);
        return false;
    }

    childPid = pid;
    writeFd = inPipe[1];
    readFd = outPipe[0];
    pending.clear();
    {
        std::lock_guard<std::mutex> lock(reapMtx);
        reaped = false;
        status = 0;
    }
    return true;
}

bool ChildProcess::writeLine(const std::string& line, std::string& error) {
    if (writeFd < 0) {
        error = "input pipe is closed";
        return false;
    }
    std::string full = line + "\n";
    const char* data = full.c_str();
    size_t total = 0;
    while (total < full.size()) {
        ssize_t n = write(writeFd, data + total, full.size() - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::strerror(errno);
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

bool ChildProcess::readLine(std::string& line) {
    if (readFd < 0) return false;
    char temp[4096];
    // Descendants may hold the pipe open after the server is gone, so EOF
    // alone cannot end the run. Once the server has exited, one quiet poll
    // interval drains what it wrote last.
    bool serverGone = false;
    while (true) {
        auto newline = pending.find('\n');
        if (newline != std::string::npos) {
            line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            return true;
        }

        pollfd pfd{readFd, POLLIN, 0};
        int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (ready < 0 && errno == EINTR) continue;
        if (ready == 0) {
            if (serverGone) return takePending(line);
            serverGone = hasExited();
            continue;
        }

        ssize_t n = ready > 0 ? read(readFd, temp, sizeof(temp)) : -1;
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return takePending(line);
        pending.append(temp, temp + n);
    }
}

bool ChildProcess::takePending(std::string& line) {
    if (pending.empty()) return false;
    line.swap(pending);
    pending.clear();
    return true;
}

bool ChildProcess::hasExited() {
    std::lock_guard<std::mutex> lock(reapMtx);
    if (childPid <= 0 || reaped) return true;

    // Look without reaping: the zombie keeps the group id reserved while the
    // rest of the group is killed.
    siginfo_t info{};
    if (waitid(P_PID, childPid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        if (errno == ECHILD) {
            reaped = true;
            return true;
        }
        return false;
    }
    if (info.si_pid != childPid) return false;

    ::kill(-childPid, SIGKILL);
    int st = 0;
    while (waitpid(childPid, &st, 0) < 0 && errno == EINTR) {
    }
    reaped = true;
    status = WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
    return true;
}

bool ChildProcess::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!hasExited()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

void ChildProcess::signal(int sig) {
    std::lock_guard<std::mutex> lock(reapMtx);
    if (childPid > 0 && !reaped) {
        ::kill(-childPid, sig);
    }
}

void ChildProcess::terminate() {
    signal(SIGTERM);
}

void ChildProcess::kill() {
    signal(SIGKILL);
}

void ChildProcess::closeInput() {
    closeFd(writeFd);
}

void ChildProcess::closeOutput() {
    closeFd(readFd);
}

int ChildProcess::pid() const {
    return static_cast<int>(childPid);
}

#else
// Windows: not implemented (CreateProcess with redirected handles would go here)
bool ChildProcess::spawn(const std::string&, const std::string&, std::string& error) {
    error = "spawning the server is not supported on Windows yet";
    return false;
}
bool ChildProcess::writeLine(const std::string&, std::string& error) {
    error = "not supported on Windows";
    return false;
}
bool ChildProcess::readLine(std::string&) { return false; }
bool ChildProcess::takePending(std::string&) { return false; }
bool ChildProcess::hasExited() { return true; }
bool ChildProcess::waitForExit(std::chrono::milliseconds) { return true; }
void ChildProcess::signal(int) {}
void ChildProcess::terminate() {}
void ChildProcess::kill() {}
void ChildProcess::closeInput() {}
void ChildProcess::closeOutput() {}
int ChildProcess::pid() const { return -1; }
#endif
