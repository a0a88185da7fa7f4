/*
 * process_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-01

Description: fork/exec implementation of the bridge transport

**************************************************/

#include "process_bridge.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace helium::transport {

using dispatch::DispatchErrorCode;

namespace {

/// Owns one end of a pipe
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;

    auto open(int flags) -> bool {
        std::array<int, 2> fds{};
        if (::pipe2(fds.data(), flags) != 0) {
            return false;
        }
        read.reset(fds[0]);
        write.reset(fds[1]);
        return true;
    }
};

void killGroupAndReap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

auto exitCodeOf(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

auto reap(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exitCodeOf(status);
}

/// Polls for the child's exit until the deadline; nullopt means it is
/// still running
auto reapBefore(pid_t pid, std::chrono::steady_clock::time_point deadline)
    -> std::optional<int> {
    constexpr auto POLL_INTERVAL = std::chrono::milliseconds(5);
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return exitCodeOf(status);
        }
        if (done < 0 && errno != EINTR) {
            return -1;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(POLL_INTERVAL,
                                                          deadline - now));
    }
}

auto isExecutableFile(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) &&
           ::access(path.c_str(), X_OK) == 0;
}

auto expandHome(const std::string& path) -> std::string {
    if (path.empty() || path.front() != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

auto searchPathVariable(const std::string& name) -> std::optional<std::string> {
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return std::nullopt;
    }
    std::istringstream stream(pathEnv);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (isExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

}  // namespace

ProcessBridge::ProcessBridge(std::string executable)
    : executable_(std::move(executable)) {}

auto ProcessBridge::run(const std::vector<std::string>& args,
                        std::chrono::milliseconds timeout)
    -> dispatch::DispatchResult<ProcessOutput> {
    Pipe outPipe;
    Pipe errPipe;
    Pipe execPipe;
    if (!outPipe.open(O_CLOEXEC) || !errPipe.open(O_CLOEXEC) ||
        !execPipe.open(O_CLOEXEC)) {
        return dispatch::failure<ProcessOutput>(
            DispatchErrorCode::TransportUnavailable,
            "Failed to create pipes: " + std::string(std::strerror(errno)));
    }

    // argv must be ready before fork; the child may only make
    // async-signal-safe calls
    std::vector<std::string> storage;
    storage.reserve(args.size() + 1);
    storage.push_back(executable_);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();

    if (pid < 0) {
        return dispatch::failure<ProcessOutput>(
            DispatchErrorCode::TransportUnavailable,
            "Fork failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        // Child process: own process group so a timeout kills descendants
        ::setpgid(0, 0);
        ::dup2(outPipe.write.get(), STDOUT_FILENO);
        ::dup2(errPipe.write.get(), STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }

        ::execvp(argv[0], argv.data());

        int err = errno;
        [[maybe_unused]] auto written =
            ::write(execPipe.write.get(), &err, sizeof(err));
        ::_exit(127);
    }

    // Parent process
    ::setpgid(pid, pid);
    outPipe.write.reset();
    errPipe.write.reset();
    execPipe.write.reset();

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.read.get(), &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        reap(pid);
        spdlog::debug("Failed to exec bridge '{}': {}", executable_,
                      std::strerror(execErrno));
        return dispatch::failure<ProcessOutput>(
            DispatchErrorCode::TransportUnavailable,
            "Failed to execute '" + executable_ +
                "': " + std::strerror(execErrno));
    }

    ProcessOutput output;
    auto deadline = start + timeout;
    std::array<pollfd, 2> fds{{{outPipe.read.get(), POLLIN, 0},
                               {errPipe.read.get(), POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&output.stdOut, &output.stdErr};
    std::array<char, 4096> buffer{};
    int openStreams = 2;

    while (openStreams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            killGroupAndReap(pid);
            spdlog::warn("Bridge command timed out after {}ms, process {} killed",
                         timeout.count(), pid);
            return dispatch::failure<ProcessOutput>(
                DispatchErrorCode::CommandTimeout,
                "Command timed out after " + std::to_string(timeout.count()) +
                    "ms");
        }

        int ready = ::poll(fds.data(), fds.size(),
                           static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            killGroupAndReap(pid);
            return dispatch::failure<ProcessOutput>(
                DispatchErrorCode::TransportUnavailable,
                "poll failed: " + std::string(std::strerror(errno)));
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            auto bytes = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (bytes > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(bytes));
            } else if (bytes == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --openStreams;
            }
        }
    }

    // Streams can close long before the process exits
    auto exitCode = reapBefore(pid, deadline);
    if (!exitCode) {
        killGroupAndReap(pid);
        spdlog::warn("Bridge command timed out after {}ms, process {} killed",
                     timeout.count(), pid);
        return dispatch::failure<ProcessOutput>(
            DispatchErrorCode::CommandTimeout,
            "Command timed out after " + std::to_string(timeout.count()) +
                "ms");
    }
    output.exitCode = *exitCode;
    output.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return output;
}

auto locateBridge(const config::TransportConfig& config)
    -> std::optional<std::string> {
    const auto& configured = config.bridgePath;
    if (!configured.empty()) {
        if (configured.find('/') != std::string::npos) {
            auto expanded = expandHome(configured);
            if (isExecutableFile(expanded)) {
                return expanded;
            }
        } else if (auto found = searchPathVariable(configured)) {
            return found;
        }
    }

    for (const auto& candidate : config.searchPaths) {
        auto expanded = expandHome(candidate);
        if (isExecutableFile(expanded)) {
            return expanded;
        }
    }

    spdlog::warn("Bridge executable '{}' not found", configured);
    return std::nullopt;
}

}  // namespace helium::transport
