/**
 * @file process_utils.cpp
 * @brief Implementation of bounded child process execution
 *
 * **Launch Sequence**:
 * ```
 * parent: pipes (O_CLOEXEC) → fork
 * child:  setpgid → dup2 stdio → setrlimit → unshare(net) → chdir → execvp
 *         (each failed step writes a ChildReport to the report pipe)
 * parent: read reports until EOF (exec closes the pipe) → poll loop
 * ```
 *
 * **Poll Loop**:
 * - Drains stdout/stderr, feeds stdin through a socketpair (MSG_NOSIGNAL,
 *   so a child that closes stdin cannot raise SIGPIPE in the host)
 * - Reaps the child with WNOHANG every tick (50ms)
 * - Deadline or cancellation: SIGTERM to the group, SIGKILL after grace
 * - After the leader is reaped: SIGKILL to the group, short drain window
 *
 * The child only calls async-signal-safe functions between fork and exec;
 * every string it needs is prepared by the parent beforehand.
 *
 * @date 2025
 */

#include "warden/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace warden {
namespace utils {

namespace {

constexpr auto kPollTick = std::chrono::milliseconds(50);
constexpr auto kDrainWindow = std::chrono::milliseconds(100);
constexpr std::size_t kReadChunk = 8192;

// Setup stages reported by the child before exec
constexpr char kStageRlimit = 'R';
constexpr char kStageNetwork = 'N';
constexpr char kStageWorkingDir = 'C';
constexpr char kStageExec = 'E';

struct ChildReport {
    char stage;
    int error;
};

/**
 * @brief Owning file descriptor
 */
class ScopedFd {
public:
    ScopedFd() = default;
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { Reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    ScopedFd(ScopedFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ScopedFd& operator=(ScopedFd&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

/**
 * @brief Everything the child needs, prepared before fork
 */
struct ChildSetup {
    std::vector<char*> argv;
    std::vector<char*> envp;
    const char* working_dir{nullptr};
    std::optional<std::uint64_t> memory_limit;
    bool isolate_network{false};
    bool privileged{false};
    std::string uid_map;
    std::string gid_map;
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int report_fd{-1};
};

void WriteReport(int fd, char stage, int error) {
    ChildReport report{stage, error};
    ssize_t written = ::write(fd, &report, sizeof(report));
    (void)written;
}

bool WriteProcFile(const char* path, const std::string& content) {
    int fd = ::open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    ssize_t written = ::write(fd, content.data(), content.size());
    ::close(fd);
    return written == static_cast<ssize_t>(content.size());
}

bool EnterPrivateNetwork(const ChildSetup& setup) {
    if (setup.privileged && ::unshare(CLONE_NEWNET) == 0) {
        return true;
    }
    if (::unshare(CLONE_NEWUSER | CLONE_NEWNET) != 0) {
        return false;
    }
    // Identity maps keep file ownership checks working inside the namespace
    WriteProcFile("/proc/self/setgroups", "deny");
    return WriteProcFile("/proc/self/uid_map", setup.uid_map) &&
           WriteProcFile("/proc/self/gid_map", setup.gid_map);
}

[[noreturn]] void RunChild(const ChildSetup& setup) {
    ::setpgid(0, 0);

    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    ::dup2(setup.stdin_fd, STDIN_FILENO);
    ::dup2(setup.stdout_fd, STDOUT_FILENO);
    ::dup2(setup.stderr_fd, STDERR_FILENO);

    if (setup.memory_limit) {
        struct rlimit limit;
        limit.rlim_cur = static_cast<rlim_t>(*setup.memory_limit);
        limit.rlim_max = static_cast<rlim_t>(*setup.memory_limit);
        if (::setrlimit(RLIMIT_AS, &limit) != 0) {
            WriteReport(setup.report_fd, kStageRlimit, errno);
        }
    }

    if (setup.isolate_network && !EnterPrivateNetwork(setup)) {
        WriteReport(setup.report_fd, kStageNetwork, errno);
    }

    if (setup.working_dir != nullptr && ::chdir(setup.working_dir) != 0) {
        WriteReport(setup.report_fd, kStageWorkingDir, errno);
        ::_exit(126);
    }

    environ = const_cast<char**>(setup.envp.data());
    ::execvp(setup.argv[0], setup.argv.data());

    WriteReport(setup.report_fd, kStageExec, errno);
    ::_exit(127);
}

std::vector<std::string> BuildEnvironment(const ProcessOptions& options) {
    std::map<std::string, std::string> merged;

    if (options.inherit_env && environ != nullptr) {
        for (char** entry = environ; *entry != nullptr; ++entry) {
            std::string pair(*entry);
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) continue;
            merged[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }

    for (const auto& [key, value] : options.env) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::vector<ChildReport> ReadReports(int fd) {
    std::vector<ChildReport> reports;
    ChildReport report;
    std::size_t filled = 0;
    auto* raw = reinterpret_cast<char*>(&report);

    while (true) {
        ssize_t n = ::read(fd, raw + filled, sizeof(report) - filled);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;  // exec succeeded or child exited

        filled += static_cast<std::size_t>(n);
        if (filled == sizeof(report)) {
            reports.push_back(report);
            filled = 0;
        }
    }
    return reports;
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void AppendCapped(std::string& buffer, const char* data, std::size_t length,
                  std::size_t max_bytes, bool& truncated) {
    if (max_bytes == 0) {
        buffer.append(data, length);
        return;
    }
    if (buffer.size() >= max_bytes) {
        truncated = true;
        return;
    }
    std::size_t room = max_bytes - buffer.size();
    if (length > room) {
        truncated = true;
        length = room;
    }
    buffer.append(data, length);
}

// Returns false once the stream hit EOF or failed
bool DrainFd(ScopedFd& fd, std::string& buffer, std::size_t max_bytes, bool& truncated) {
    char chunk[kReadChunk];
    while (true) {
        ssize_t n = ::read(fd.Get(), chunk, sizeof(chunk));
        if (n > 0) {
            AppendCapped(buffer, chunk, static_cast<std::size_t>(n), max_bytes, truncated);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        fd.Reset();
        return false;
    }
}

int DecodeExitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::string StageDescription(char stage) {
    switch (stage) {
        case kStageRlimit:     return "memory limit";
        case kStageNetwork:    return "network isolation";
        case kStageWorkingDir: return "working directory";
        case kStageExec:       return "exec";
        default:               return "setup";
    }
}

} // anonymous namespace

bool ProcessUtils::IsPrivileged() {
    return ::geteuid() == 0;
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

Result<ProcessResult> ProcessUtils::Run(const ProcessOptions& options) {
    if (options.argv.empty() || options.argv.front().empty()) {
        return Result<ProcessResult>::Failure(ErrorKind::INVALID_REQUEST,
                                              "Command array is empty");
    }

    // Everything below is prepared before fork; the child must not allocate
    std::vector<std::string> env_strings = BuildEnvironment(options);
    std::string working_dir = options.working_dir ? options.working_dir->string() : "";

    ChildSetup setup;
    for (const auto& arg : options.argv) {
        setup.argv.push_back(const_cast<char*>(arg.c_str()));
    }
    setup.argv.push_back(nullptr);
    for (auto& entry : env_strings) {
        setup.envp.push_back(entry.data());
    }
    setup.envp.push_back(nullptr);
    setup.working_dir = options.working_dir ? working_dir.c_str() : nullptr;
    setup.memory_limit = options.memory_limit_bytes;
    setup.isolate_network = options.isolate_network;
    setup.privileged = IsPrivileged();
    setup.uid_map = std::to_string(::geteuid()) + " " + std::to_string(::geteuid()) + " 1";
    setup.gid_map = std::to_string(::getegid()) + " " + std::to_string(::getegid()) + " 1";

    int out_pipe[2];
    int err_pipe[2];
    int report_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
            std::string("pipe failed: ") + std::strerror(errno));
    }
    ScopedFd out_read(out_pipe[0]);
    ScopedFd out_write(out_pipe[1]);

    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
            std::string("pipe failed: ") + std::strerror(errno));
    }
    ScopedFd err_read(err_pipe[0]);
    ScopedFd err_write(err_pipe[1]);

    if (::pipe2(report_pipe, O_CLOEXEC) != 0) {
        return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
            std::string("pipe failed: ") + std::strerror(errno));
    }
    ScopedFd report_read(report_pipe[0]);
    ScopedFd report_write(report_pipe[1]);

    ScopedFd stdin_parent;
    ScopedFd stdin_child;
    if (options.stdin_data) {
        int pair[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, pair) != 0) {
            return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
                std::string("socketpair failed: ") + std::strerror(errno));
        }
        stdin_parent.Reset(pair[0]);
        stdin_child.Reset(pair[1]);
        ::shutdown(stdin_parent.Get(), SHUT_RD);
    } else {
        stdin_child.Reset(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (!stdin_child.IsOpen()) {
            return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
                std::string("open /dev/null failed: ") + std::strerror(errno));
        }
    }

    setup.stdin_fd = stdin_child.Get();
    setup.stdout_fd = out_write.Get();
    setup.stderr_fd = err_write.Get();
    setup.report_fd = report_write.Get();

    auto start_time = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        return Result<ProcessResult>::Failure(ErrorKind::EXECUTION_FAILED,
            std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        RunChild(setup);
    }

    // Parent: also set the group here to close the race with an early kill
    ::setpgid(pid, pid);

    stdin_child.Reset();
    out_write.Reset();
    err_write.Reset();
    report_write.Reset();

    ProcessResult result;
    result.network_isolated = options.isolate_network;
    result.memory_limited = options.memory_limit_bytes.has_value();

    for (const auto& report : ReadReports(report_read.Get())) {
        switch (report.stage) {
            case kStageNetwork:
                result.network_isolated = false;
                spdlog::debug("Child could not enter a private network namespace: {}",
                              std::strerror(report.error));
                break;
            case kStageRlimit:
                result.memory_limited = false;
                spdlog::debug("Child could not apply memory limit: {}",
                              std::strerror(report.error));
                break;
            case kStageWorkingDir:
            case kStageExec: {
                int status = 0;
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                ::kill(-pid, SIGKILL);

                ErrorKind kind = report.stage == kStageWorkingDir
                    ? ErrorKind::INVALID_REQUEST
                    : ErrorKind::EXECUTION_FAILED;
                std::string subject = report.stage == kStageWorkingDir
                    ? working_dir
                    : options.argv.front();
                return Result<ProcessResult>::Failure(kind,
                    StageDescription(report.stage) + " failed for '" + subject + "': " +
                    std::strerror(report.error));
            }
            default:
                break;
        }
    }

    SetNonBlocking(out_read.Get());
    SetNonBlocking(err_read.Get());

    const std::string& stdin_data = options.stdin_data ? *options.stdin_data : std::string();
    std::size_t stdin_offset = 0;
    if (stdin_parent.IsOpen()) {
        SetNonBlocking(stdin_parent.Get());
        if (stdin_data.empty()) {
            stdin_parent.Reset();
        }
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout.count() > 0) {
        deadline = start_time + options.timeout;
    }

    bool exited = false;
    int status = 0;
    bool terminating = false;
    bool killed = false;
    std::chrono::steady_clock::time_point kill_at{};
    std::chrono::steady_clock::time_point drain_until{};

    while (true) {
        auto now = std::chrono::steady_clock::now();

        if (exited && ((!out_read.IsOpen() && !err_read.IsOpen()) || now >= drain_until)) {
            break;
        }

        std::vector<pollfd> fds;
        if (out_read.IsOpen()) fds.push_back({out_read.Get(), POLLIN, 0});
        if (err_read.IsOpen()) fds.push_back({err_read.Get(), POLLIN, 0});
        if (stdin_parent.IsOpen()) fds.push_back({stdin_parent.Get(), POLLOUT, 0});

        auto wait = kPollTick;
        if (deadline && !terminating && *deadline > now) {
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now));
        }
        int wait_ms = static_cast<int>(std::max<std::chrono::milliseconds::rep>(wait.count(), 1));

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        } else {
            int ready = ::poll(fds.data(), fds.size(), wait_ms);
            if (ready < 0 && errno != EINTR) {
                spdlog::warn("poll failed: {}", std::strerror(errno));
            }

            for (const auto& entry : fds) {
                if (entry.revents == 0) continue;

                if (out_read.IsOpen() && entry.fd == out_read.Get()) {
                    DrainFd(out_read, result.stdout_output, options.max_output_bytes,
                            result.output_truncated);
                } else if (err_read.IsOpen() && entry.fd == err_read.Get()) {
                    DrainFd(err_read, result.stderr_output, options.max_output_bytes,
                            result.output_truncated);
                } else if (stdin_parent.IsOpen() && entry.fd == stdin_parent.Get()) {
                    if (entry.revents & (POLLERR | POLLHUP)) {
                        stdin_parent.Reset();
                        continue;
                    }
                    ssize_t n = ::send(stdin_parent.Get(), stdin_data.data() + stdin_offset,
                                       stdin_data.size() - stdin_offset, MSG_NOSIGNAL);
                    if (n > 0) {
                        stdin_offset += static_cast<std::size_t>(n);
                    } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        stdin_parent.Reset();  // child closed stdin
                    }
                    if (stdin_parent.IsOpen() && stdin_offset >= stdin_data.size()) {
                        stdin_parent.Reset();  // EOF for the child
                    }
                }
            }
        }

        now = std::chrono::steady_clock::now();

        if (!exited) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
                // Nothing in the group may outlive the call
                ::kill(-pid, SIGKILL);
                drain_until = now + kDrainWindow;
                continue;
            }
        }

        if (!exited && !terminating) {
            bool expired = deadline && now >= *deadline;
            bool cancelled = options.cancel.IsCancelled();
            if (expired || cancelled) {
                result.timed_out = expired;
                result.cancelled = !expired && cancelled;
                spdlog::debug("Terminating process group {} ({})", pid,
                              expired ? "timeout" : "cancelled");
                ::kill(-pid, SIGTERM);
                terminating = true;
                kill_at = now + options.kill_grace;
            }
        } else if (!exited && terminating && !killed && now >= kill_at) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    }

    result.exit_code = result.timed_out ? kTimeoutExitCode : DecodeExitStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return Result<ProcessResult>::Success(std::move(result));
}

} // namespace utils
} // namespace warden
