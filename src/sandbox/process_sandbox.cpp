/**
 * @file process_sandbox.cpp
 * @brief ProcessSandbox implementation: fork/exec under rlimits with capped capture.
 */

#include "sandbox/process_sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

namespace sandbox_orchestrator {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTruncationMarker = "\n[output truncated]";
constexpr const char* kInputFile = "input.json";
constexpr rlim_t kMaxFileBytes = 16ULL * 1024 * 1024;
constexpr int kPollIntervalMs = 20;

/// Owns a file descriptor and closes it on destruction.
class FdGuard {
public:
    explicit FdGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

void append_limited(std::string& dst, const char* src, ssize_t n,
                    size_t limit, bool& truncated) {
    if (n <= 0) return;
    const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<size_t>(n)) truncated = true;
}

/// Read everything currently available; closes the descriptor at EOF.
void pump(FdGuard& fd, std::string& dst, size_t limit, bool& truncated) {
    std::array<char, 4096> buf{};
    while (fd.is_open()) {
        ssize_t n = ::read(fd.get(), buf.data(), buf.size());
        if (n > 0) {
            append_limited(dst, buf.data(), n, limit, truncated);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        fd.reset();
    }
}

Error errno_error(ErrorCode code, const std::string& what) {
    return Error{code, what + ": " + std::strerror(errno)};
}

bool apply_limit(int resource, rlim_t value) {
    struct rlimit rl{};
    rl.rlim_cur = value;
    rl.rlim_max = value;
    return ::setrlimit(resource, &rl) == 0;
}

bool write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return static_cast<bool>(out);
}

}  // namespace

// ─────────────────────────────────────────────
// ProcessSandbox
// ─────────────────────────────────────────────

ProcessSandbox::ProcessSandbox(InstanceId id, SandboxConfig config, const fs::path& root_dir)
    : id_(std::move(id))
    , config_(std::move(config))
    , work_dir_(root_dir / id_) {}

ProcessSandbox::~ProcessSandbox() {
    terminate();
    std::error_code ec;
    fs::remove_all(work_dir_, ec);
}

Result<void> ProcessSandbox::initialize() {
    if (terminated_.load()) {
        return Error{ErrorCode::PoolInitFailure, "Sandbox instance " + id_ + " has been terminated"};
    }
    if (::access(config_.interpreter.c_str(), X_OK) != 0) {
        return errno_error(ErrorCode::PoolInitFailure,
                           "Interpreter " + config_.interpreter + " is not executable");
    }

    std::error_code ec;
    fs::create_directories(work_dir_, ec);
    if (ec) {
        return Error{ErrorCode::PoolInitFailure,
                     "Failed to create " + work_dir_.string() + ": " + ec.message()};
    }
    return reset();
}

Result<void> ProcessSandbox::reset() {
    if (terminated_.load()) {
        return Error{ErrorCode::Internal, "Sandbox instance " + id_ + " has been terminated"};
    }

    std::error_code ec;
    std::vector<fs::path> entries;
    for (auto it = fs::directory_iterator(work_dir_, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return Error{ErrorCode::Internal,
                     "Failed to list " + work_dir_.string() + ": " + ec.message()};
    }

    for (const auto& entry : entries) {
        fs::remove_all(entry, ec);
        if (ec) {
            return Error{ErrorCode::Internal,
                         "Failed to remove " + entry.string() + ": " + ec.message()};
        }
    }
    return Result<void>{};
}

void ProcessSandbox::terminate() noexcept {
    terminated_.store(true);
    std::lock_guard lock(pid_mutex_);
    if (child_pid_ > 0) {
        ::kill(-child_pid_, SIGKILL);
    }
}

Result<void> ProcessSandbox::stage(const SandboxRequest& request) {
    if (!write_file(work_dir_ / config_.entry_file, request.code)) {
        return Error{ErrorCode::Internal, "Failed to stage agent code in " + work_dir_.string()};
    }
    if (!write_file(work_dir_ / kInputFile, request.input)) {
        return Error{ErrorCode::Internal, "Failed to stage input in " + work_dir_.string()};
    }
    return Result<void>{};
}

Result<SandboxOutcome> ProcessSandbox::run(const SandboxRequest& request, std::stop_token stop) {
    if (terminated_.load()) {
        return Error{ErrorCode::Internal, "Sandbox instance " + id_ + " has been terminated"};
    }
    if (request.code.size() > config_.max_code_bytes) {
        return Error{ErrorCode::ExecutionFailed,
                     "Agent code exceeds " + std::to_string(config_.max_code_bytes) + " bytes"};
    }
    if (request.input.size() > config_.max_input_bytes) {
        return Error{ErrorCode::ExecutionFailed,
                     "Input exceeds " + std::to_string(config_.max_input_bytes) + " bytes"};
    }
    if (auto staged = stage(request); !staged) {
        return staged.error();
    }

    FdGuard input_fd(::open((work_dir_ / kInputFile).c_str(), O_RDONLY | O_CLOEXEC));
    if (!input_fd.is_open()) return errno_error(ErrorCode::Internal, "open input");

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) return errno_error(ErrorCode::Internal, "pipe");
    FdGuard out_read(out_pipe[0]);
    FdGuard out_write(out_pipe[1]);

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) return errno_error(ErrorCode::Internal, "pipe");
    FdGuard err_read(err_pipe[0]);
    FdGuard err_write(err_pipe[1]);

    // Everything the child touches is prepared before fork
    std::vector<std::string> args;
    args.push_back(config_.interpreter);
    args.insert(args.end(), config_.interpreter_args.begin(), config_.interpreter_args.end());
    args.push_back(config_.entry_file);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "HOME=" + work_dir_.string(),
        "LANG=C.UTF-8",
        "SANDBOX_EXECUTION_ID=" + request.execution_id,
    };
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    const std::string cwd = work_dir_.string();
    const rlim_t memory_bytes = static_cast<rlim_t>(config_.memory_limit_mb) * 1024 * 1024;
    const rlim_t cpu_seconds = static_cast<rlim_t>((request.timeout.count() + 999) / 1000 + 1);
    const rlim_t open_files = config_.max_open_files;
    const bool isolate_network = config_.isolate_network;
    const int stdin_fd = input_fd.get();
    const int stdout_fd = out_write.get();
    const int stderr_fd = err_write.get();

    const auto started = std::chrono::steady_clock::now();

    std::unique_lock pid_lock(pid_mutex_);
    pid_t pid = ::fork();
    if (pid < 0) {
        return errno_error(ErrorCode::Internal, "fork");
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (::dup2(stdin_fd, STDIN_FILENO) < 0
            || ::dup2(stdout_fd, STDOUT_FILENO) < 0
            || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
            ::_exit(126);
        }

        if (isolate_network && ::unshare(CLONE_NEWNET) != 0) {
            static constexpr char kWarning[] = "sandbox: network isolation unavailable\n";
            [[maybe_unused]] ssize_t written = ::write(STDERR_FILENO, kWarning, sizeof(kWarning) - 1);
        }

        if (::chdir(cwd.c_str()) != 0) ::_exit(126);
        if (memory_bytes > 0 && !apply_limit(RLIMIT_AS, memory_bytes)) ::_exit(126);
        if (open_files > 0 && !apply_limit(RLIMIT_NOFILE, open_files)) ::_exit(126);
        if (!apply_limit(RLIMIT_CPU, cpu_seconds)) ::_exit(126);
        if (!apply_limit(RLIMIT_FSIZE, kMaxFileBytes)) ::_exit(126);

        ::execve(argv[0], argv.data(), envp.data());
        ::_exit(127);
    }

    // Both sides set the group so an early kill(-pid) cannot miss the child
    ::setpgid(pid, pid);
    child_pid_ = pid;
    const bool terminated_early = terminated_.load();
    pid_lock.unlock();
    if (terminated_early) ::kill(-pid, SIGKILL);

    input_fd.reset();
    out_write.reset();
    err_write.reset();
    ::fcntl(out_read.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_read.get(), F_SETFL, O_NONBLOCK);

    SandboxOutcome outcome;
    const size_t limit = config_.max_output_bytes;
    const auto grace = std::chrono::milliseconds(config_.cancel_grace_ms);
    const auto hard_deadline = started + request.timeout + grace;
    std::optional<SteadyTime> stop_sent_at;

    while (true) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_read.is_open()) fds[count++] = pollfd{out_read.get(), POLLIN, 0};
        if (err_read.is_open()) fds[count++] = pollfd{err_read.get(), POLLIN, 0};
        if (count == 0 || (::poll(fds.data(), count, kPollIntervalMs) < 0 && errno != EINTR)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(kPollIntervalMs));
        }

        pump(out_read, outcome.stdout_text, limit, outcome.stdout_truncated);
        pump(err_read, outcome.stderr_text, limit, outcome.stderr_truncated);

        // Observe the exit without reaping so the process group stays valid
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0
            && info.si_pid == pid) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (stop.stop_requested() && !stop_sent_at) {
            outcome.stop_requested = true;
            stop_sent_at = now;
            ::kill(-pid, SIGTERM);
        } else if (stop_sent_at && !outcome.forced_kill && now - *stop_sent_at >= grace) {
            outcome.forced_kill = true;
            ::kill(-pid, SIGKILL);
        }
        if (!outcome.terminated && now >= hard_deadline) {
            outcome.terminated = true;
            ::kill(-pid, SIGKILL);
        }
    }

    // Group members that outlived the leader go with it
    ::kill(-pid, SIGKILL);

    int status = 0;
    struct rusage usage{};
    pid_t reaped = -1;
    do {
        reaped = ::wait4(pid, &status, 0, &usage);
    } while (reaped < 0 && errno == EINTR);

    {
        std::lock_guard lock(pid_mutex_);
        child_pid_ = -1;
    }

    pump(out_read, outcome.stdout_text, limit, outcome.stdout_truncated);
    pump(err_read, outcome.stderr_text, limit, outcome.stderr_truncated);

    if (terminated_.load()) outcome.terminated = true;
    if (reaped == pid) {
        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.term_signal = WTERMSIG(status);
            outcome.exit_code = 128 + outcome.term_signal;
        }
        if (usage.ru_maxrss > 0) {
            outcome.peak_memory_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
        }
    } else {
        outcome.exit_code = -1;
    }

    if (outcome.stdout_truncated) outcome.stdout_text += kTruncationMarker;
    if (outcome.stderr_truncated) outcome.stderr_text += kTruncationMarker;

    outcome.duration = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - started);
    return outcome;
}

// ─────────────────────────────────────────────
// ProcessSandboxFactory
// ─────────────────────────────────────────────

ProcessSandboxFactory::ProcessSandboxFactory(SandboxConfig config, fs::path root_dir)
    : config_(std::move(config)), root_dir_(std::move(root_dir)) {}

std::unique_ptr<ISandboxInstance> ProcessSandboxFactory::create(InstanceId id) {
    return std::make_unique<ProcessSandbox>(std::move(id), config_, root_dir_);
}

}  // namespace sandbox_orchestrator
