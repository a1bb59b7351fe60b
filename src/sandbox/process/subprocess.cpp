/*
 * subprocess.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>

namespace jailchain::sandbox::process {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kDrainGrace = std::chrono::milliseconds(500);

void ignoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        ::sigaction(SIGPIPE, &action, nullptr);
    });
}

/**
 * @brief Owning file descriptor
 */
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    Fd read;
    Fd write;
};

auto makePipe() -> std::optional<Pipe> {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::nullopt;
    }
    return Pipe{Fd(fds[0]), Fd(fds[1])};
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void killGroup(pid_t pid, bool reaped) {
    ::kill(-pid, SIGKILL);
    if (!reaped) {
        ::kill(pid, SIGKILL);
    }
}

[[noreturn]] void childFail(int errorFd) {
    int err = errno;
    [[maybe_unused]] auto n = ::write(errorFd, &err, sizeof(err));
    ::_exit(127);
}

/**
 * @brief Child side of the fork; only async-signal-safe calls
 */
[[noreturn]] void runChild(const SpawnOptions& options, char* const* argv,
                           char* const* envp, int stdinFd, int stdoutFd,
                           int stderrFd, int errorFd) {
    ::setpgid(0, 0);

    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGPIPE, &action, nullptr);
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
    sigset_t mask;
    sigemptyset(&mask);
    ::sigprocmask(SIG_SETMASK, &mask, nullptr);

    if (::dup2(stdinFd, STDIN_FILENO) < 0 ||
        ::dup2(stdoutFd, STDOUT_FILENO) < 0 ||
        ::dup2(stderrFd, STDERR_FILENO) < 0) {
        childFail(errorFd);
    }

    if (!options.workingDirectory.empty() &&
        ::chdir(options.workingDirectory.c_str()) != 0) {
        childFail(errorFd);
    }

    for (const auto& limit : options.limits) {
        struct rlimit rl {};
        rl.rlim_cur = limit.soft;
        rl.rlim_max = limit.hard;
        if (::setrlimit(limit.resource, &rl) != 0) {
            childFail(errorFd);
        }
    }

    if (envp != nullptr) {
        ::execvpe(argv[0], argv, envp);
    } else {
        ::execvp(argv[0], argv);
    }
    childFail(errorFd);
}

}  // namespace

auto runProcess(const SpawnOptions& options, std::stop_token stopToken)
    -> Result<ProcessOutput> {
    if (options.argv.empty() || options.argv.front().empty()) {
        spdlog::error("runProcess called without a program");
        return std::unexpected(SpawnError::InvalidArguments);
    }

    ignoreSigpipeOnce();

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    if (options.env) {
        envp.reserve(options.env->size() + 1);
        for (const auto& entry : *options.env) {
            envp.push_back(const_cast<char*>(entry.c_str()));
        }
        envp.push_back(nullptr);
    }

    auto stdinPipe = makePipe();
    auto stdoutPipe = makePipe();
    auto stderrPipe = makePipe();
    auto errorPipe = makePipe();
    if (!stdinPipe || !stdoutPipe || !stderrPipe || !errorPipe) {
        spdlog::error("Failed to create pipes for '{}': {}",
                      options.argv.front(), std::strerror(errno));
        return std::unexpected(SpawnError::PipeFailed);
    }

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        spdlog::error("Failed to fork for '{}': {}", options.argv.front(),
                      std::strerror(errno));
        return std::unexpected(SpawnError::ForkFailed);
    }

    if (pid == 0) {
        runChild(options, argv.data(), options.env ? envp.data() : nullptr,
                 stdinPipe->read.get(), stdoutPipe->write.get(),
                 stderrPipe->write.get(), errorPipe->write.get());
    }

    ::setpgid(pid, pid);

    stdinPipe->read.reset();
    stdoutPipe->write.reset();
    stderrPipe->write.reset();
    errorPipe->write.reset();

    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(errorPipe->read.get(), &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        spdlog::debug("Failed to start '{}': {}", options.argv.front(),
                      std::strerror(childErrno));
        return std::unexpected(SpawnError::ExecFailed);
    }

    Fd stdinWrite = std::move(stdinPipe->write);
    Fd stdoutRead = std::move(stdoutPipe->read);
    Fd stderrRead = std::move(stderrPipe->read);
    setNonBlocking(stdoutRead.get());
    setNonBlocking(stderrRead.get());

    const std::string& payload = options.stdinData;
    std::size_t written = 0;
    if (payload.empty()) {
        stdinWrite.reset();
    } else {
        setNonBlocking(stdinWrite.get());
    }

    ProcessOutput output;
    const bool hasDeadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;

    bool reaped = false;
    bool killed = false;
    int status = 0;
    std::chrono::steady_clock::time_point settledAt{};

    auto append = [&](std::string& target, const char* data,
                      std::size_t count) {
        std::size_t room = options.maxOutputBytes > target.size()
                               ? options.maxOutputBytes - target.size()
                               : 0;
        if (count > room) {
            output.truncated = true;
            count = room;
        }
        target.append(data, count);
    };

    auto drain = [&](Fd& fd, std::string& target) {
        std::array<char, 4096> buffer{};
        while (fd) {
            ssize_t got = ::read(fd.get(), buffer.data(), buffer.size());
            if (got > 0) {
                append(target, buffer.data(), static_cast<std::size_t>(got));
                continue;
            }
            if (got < 0 && errno == EINTR) {
                continue;
            }
            if (got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                return;
            }
            fd.reset();
        }
    };

    while (true) {
        auto now = std::chrono::steady_clock::now();

        if (!killed && !reaped) {
            if (stopToken.stop_requested()) {
                spdlog::debug("Cancelling '{}' (pid {})", options.argv.front(),
                              pid);
                output.cancelled = true;
            } else if (hasDeadline && now >= deadline) {
                spdlog::debug("'{}' (pid {}) exceeded {} ms",
                              options.argv.front(), pid,
                              options.timeout.count());
                output.timedOut = true;
            }
            if (output.cancelled || output.timedOut) {
                killGroup(pid, reaped);
                killed = true;
                settledAt = now;
            }
        }

        if (!reaped) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                reaped = true;
                if (!killed) {
                    settledAt = now;
                }
            } else if (r < 0 && errno != EINTR) {
                spdlog::warn("waitpid for '{}' failed: {}",
                             options.argv.front(), std::strerror(errno));
                reaped = true;
                status = -1;
                settledAt = now;
            }
        }

        if (reaped && !stdoutRead && !stderrRead) {
            break;
        }
        if ((reaped || killed) && now - settledAt > kDrainGrace) {
            // Descendants still hold the pipes open
            killGroup(pid, reaped);
            break;
        }

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (stdoutRead) {
            fds[count++] = {stdoutRead.get(), POLLIN, 0};
        }
        if (stderrRead) {
            fds[count++] = {stderrRead.get(), POLLIN, 0};
        }
        if (stdinWrite) {
            fds[count++] = {stdinWrite.get(), POLLOUT, 0};
        }

        if (count == 0) {
            std::this_thread::sleep_for(kPollSlice);
            continue;
        }

        int ready = ::poll(fds.data(), count,
                           static_cast<int>(kPollSlice.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("poll on '{}' failed: {}", options.argv.front(),
                         std::strerror(errno));
            killGroup(pid, reaped);
            killed = true;
            settledAt = std::chrono::steady_clock::now();
            stdoutRead.reset();
            stderrRead.reset();
            stdinWrite.reset();
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            if (stdoutRead && fds[i].fd == stdoutRead.get()) {
                drain(stdoutRead, output.stdoutText);
            } else if (stderrRead && fds[i].fd == stderrRead.get()) {
                drain(stderrRead, output.stderrText);
            } else if (stdinWrite && fds[i].fd == stdinWrite.get()) {
                if ((fds[i].revents & (POLLERR | POLLHUP)) != 0) {
                    stdinWrite.reset();
                    continue;
                }
                ssize_t put = ::write(stdinWrite.get(), payload.data() + written,
                                      payload.size() - written);
                if (put > 0) {
                    written += static_cast<std::size_t>(put);
                } else if (put < 0 && errno != EAGAIN && errno != EINTR) {
                    stdinWrite.reset();
                }
                if (written >= payload.size()) {
                    stdinWrite.reset();
                }
            }
        }
    }

    if (!reaped) {
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                status = -1;
                break;
            }
        }
        reaped = true;
    }
    killGroup(pid, reaped);

    if (status != -1) {
        if (WIFEXITED(status)) {
            output.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            output.termSignal = WTERMSIG(status);
            output.exitCode = 128 + output.termSignal;
        }
    }

    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::debug("'{}' finished: exit={} signal={} timedOut={} cancelled={} "
                  "in {} ms",
                  options.argv.front(), output.exitCode, output.termSignal,
                  output.timedOut, output.cancelled, output.elapsed.count());
    return output;
}

auto findExecutable(std::string_view name)
    -> std::optional<std::filesystem::path> {
    namespace fs = std::filesystem;

    if (name.empty()) {
        return std::nullopt;
    }

    auto usable = [](const fs::path& candidate) {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string_view::npos) {
        fs::path candidate{std::string(name)};
        if (usable(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }

    const char* envPath = std::getenv("PATH");
    std::string_view path =
        envPath != nullptr ? envPath : "/usr/local/bin:/usr/bin:/bin";

    while (true) {
        auto sep = path.find(':');
        auto dir = path.substr(0, sep);
        fs::path candidate = dir.empty() ? fs::path(".") : fs::path(dir);
        candidate /= std::string(name);
        if (usable(candidate)) {
            return candidate;
        }
        if (sep == std::string_view::npos) {
            break;
        }
        path.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

}  // namespace jailchain::sandbox::process
