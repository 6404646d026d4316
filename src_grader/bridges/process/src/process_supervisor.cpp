#include "grader_harness/process_supervisor.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "grader_harness/error_codes.hpp"

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::chrono::milliseconds kReapPoll{20};
constexpr std::size_t kReadChunk = 4096;

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

int to_poll_timeout(std::chrono::milliseconds ms) {
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(ms.count(), 0));
}

grader::harness::ErrorCode missing_code(grader::harness::ProcessRole role) {
    return role == grader::harness::ProcessRole::Client ? grader::harness::ErrorCode::ClientExeMissing
                                                        : grader::harness::ErrorCode::ServerExeMissing;
}

}  // namespace

namespace grader::harness {

std::string_view to_string(ProcessRole role) noexcept {
    return role == ProcessRole::Client ? "client" : "server";
}

std::string_view to_string(OutputWait outcome) noexcept {
    switch (outcome) {
        case OutputWait::Produced:
            return "produced";
        case OutputWait::Exited:
            return "exited";
        case OutputWait::TimedOut:
            return "timed-out";
    }
    return "timed-out";
}

struct ProcessSupervisor::Handle {
    ProcessRole role{ProcessRole::Client};
    pid_t pid{-1};
    int stdin_fd{-1};
    std::vector<std::thread> pumps;
    std::atomic<bool> stopping{false};

    mutable std::mutex mutex;
    std::string output;
    bool reaped{false};
    int exit_code{0};
};

ProcessSupervisor::ProcessSupervisor(CaptureStore& store, Config config)
    : store_(store), config_(std::move(config)) {
    ignore_sigpipe_once();
}

ProcessSupervisor::~ProcessSupervisor() {
    try {
        stop_all();
    } catch (const std::exception& ex) {
        logger_.error(std::string{"[Process] Cleanup failed: "} + ex.what());
    }
}

void ProcessSupervisor::set_log_callback(Logger::LogCallback callback) {
    logger_.set_callback(std::move(callback));
}

std::unique_ptr<ProcessSupervisor::Handle>& ProcessSupervisor::slot(ProcessRole role) {
    return role == ProcessRole::Client ? client_ : server_;
}

const std::unique_ptr<ProcessSupervisor::Handle>& ProcessSupervisor::slot(ProcessRole role) const {
    return role == ProcessRole::Client ? client_ : server_;
}

const std::filesystem::path& ProcessSupervisor::executable(ProcessRole role) const {
    return role == ProcessRole::Client ? client_path_ : server_path_;
}

void ProcessSupervisor::init(std::filesystem::path client_path, std::filesystem::path server_path) {
    stop_all();
    client_path_ = std::move(client_path);
    server_path_ = std::move(server_path);
}

void ProcessSupervisor::start(ProcessRole role) {
    auto& handle_slot = slot(role);
    if (handle_slot && is_running(role)) {
        logger_.info("[Process] " + std::string{to_string(role)} + " already running (pid " +
                     std::to_string(handle_slot->pid) + ")");
        return;
    }
    if (handle_slot) {
        stop(role);
    }

    const auto& path = executable(role);
    const auto label = std::string{to_string(role)};
    if (path.empty()) {
        throw ProcessError(missing_code(role), label + " executable not configured");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ProcessError(missing_code(role), label + " executable not found: " + path.string());
    }
    if (::access(path.c_str(), X_OK) != 0) {
        throw ProcessError(missing_code(role), label + " executable is not executable: " + path.string());
    }

    // argv is fully built before fork so the child only calls async-signal-safe functions.
    const auto& extra = role == ProcessRole::Client ? config_.client_args : config_.server_args;
    std::vector<std::string> arguments;
    arguments.push_back(path.string());
    arguments.insert(arguments.end(), extra.begin(), extra.end());
    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);
    const std::string work_dir = config_.working_directory.string();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const auto message = errno_text("pipe2 failed for " + label);
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw ProcessError(ErrorCode::Unknown, message);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const auto message = errno_text("fork failed for " + label);
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw ProcessError(ErrorCode::Unknown, message);
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (!work_dir.empty() && ::chdir(work_dir.c_str()) != 0) {
            ::_exit(126);
        }
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    auto handle = std::make_unique<Handle>();
    handle->role = role;
    handle->pid = pid;
    handle->stdin_fd = in_pipe[1];

    Handle& ref = *handle;
    const int out_fd = out_pipe[0];
    const int err_fd = err_pipe[0];
    handle->pumps.emplace_back([this, &ref, out_fd] { pump(ref, out_fd); });
    handle->pumps.emplace_back([this, &ref, err_fd] { pump(ref, err_fd); });
    handle_slot = std::move(handle);

    logger_.info("[Process] Started " + label + " " + path.string() + " (pid " + std::to_string(pid) + ")");
}

void ProcessSupervisor::publish(Handle& handle, std::string_view text) {
    if (text.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(handle.mutex);
        handle.output.append(text);
    }
    const auto cursor = store_.cursor();
    const auto scope = handle.role == ProcessRole::Client ? CaptureScope::Clients : CaptureScope::Servers;
    store_.append(scope, cursor.question_code, cursor.stage, text);
}

void ProcessSupervisor::pump(Handle& handle, int fd) {
    std::string pending;
    auto last_flush = Clock::now();
    char buffer[kReadChunk];

    auto flush = [&](std::size_t count) {
        publish(handle, std::string_view{pending}.substr(0, count));
        pending.erase(0, count);
        last_flush = Clock::now();
    };

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    std::optional<Clock::time_point> stop_seen;
    while (true) {
        if (handle.stopping.load()) {
            // Orphaned grandchildren may keep the pipe open; bound the drain.
            if (!stop_seen) {
                stop_seen = Clock::now();
            } else if (Clock::now() - *stop_seen > config_.kill_grace) {
                break;
            }
        }

        auto wait = config_.output_poll;
        if (!pending.empty()) {
            const auto idle_left = config_.idle_flush -
                                   std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_flush);
            wait = std::min(wait, idle_left);
        }

        const int rc = ::poll(&pfd, 1, to_poll_timeout(wait));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            if (!pending.empty() && Clock::now() - last_flush >= config_.idle_flush) {
                flush(pending.size());
            }
            if (handle.stopping.load()) {
                break;
            }
            continue;
        }

        const auto n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));
        const auto newline = pending.rfind('\n');
        if (newline != std::string::npos) {
            flush(newline + 1);
        }
    }

    flush(pending.size());
    ::close(fd);
}

bool ProcessSupervisor::refresh_state(Handle& handle) {
    std::lock_guard<std::mutex> lock(handle.mutex);
    if (handle.reaped) {
        return false;
    }
    int status = 0;
    const pid_t rc = ::waitpid(handle.pid, &status, WNOHANG);
    if (rc == 0) {
        return true;
    }
    handle.reaped = true;
    if (rc == handle.pid) {
        handle.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    } else {
        handle.exit_code = -1;
    }
    return false;
}

bool ProcessSupervisor::is_running(ProcessRole role) {
    auto& handle = slot(role);
    return handle && refresh_state(*handle);
}

std::optional<int> ProcessSupervisor::exit_status(ProcessRole role) {
    auto& handle = slot(role);
    if (!handle || refresh_state(*handle)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(handle->mutex);
    return handle->exit_code;
}

std::size_t ProcessSupervisor::output_size(ProcessRole role) const {
    const auto& handle = slot(role);
    if (!handle) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(handle->mutex);
    return handle->output.size();
}

std::string ProcessSupervisor::output(ProcessRole role) const {
    const auto& handle = slot(role);
    if (!handle) {
        return {};
    }
    std::lock_guard<std::mutex> lock(handle->mutex);
    return handle->output;
}

bool ProcessSupervisor::send_input(ProcessRole role, std::string_view text) {
    auto& handle = slot(role);
    if (!handle || !refresh_state(*handle) || handle->stdin_fd < 0) {
        logger_.warn("[ClientInput] Cannot send input - " + std::string{to_string(role)} + " not running");
        return false;
    }

    std::string line{text};
    line.push_back('\n');
    std::size_t written = 0;
    while (written < line.size()) {
        const auto n = ::write(handle->stdin_fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.warn(errno_text("[ClientInput] Write to " + std::string{to_string(role)} + " failed"));
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    logger_.debug("[ClientInput] Sent " + std::to_string(line.size()) + " bytes to " + std::string{to_string(role)});
    return true;
}

OutputWait ProcessSupervisor::wait_for_output(ProcessRole role,
                                              std::size_t baseline,
                                              std::chrono::milliseconds timeout,
                                              const CancellationToken& token) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (output_size(role) > baseline) {
            return OutputWait::Produced;
        }
        if (!is_running(role)) {
            // Let the pumps drain what the process wrote right before exiting.
            token.sleep_for(config_.idle_flush + config_.output_poll);
            return output_size(role) > baseline ? OutputWait::Produced : OutputWait::Exited;
        }
        if (Clock::now() >= deadline || token.is_cancelled()) {
            return OutputWait::TimedOut;
        }
        token.sleep_for(config_.output_poll);
    }
}

StopReport ProcessSupervisor::stop(ProcessRole role) {
    StopReport report;
    auto& handle_slot = slot(role);
    if (!handle_slot) {
        return report;
    }

    std::unique_ptr<Handle> handle = std::move(handle_slot);
    const auto label = std::string{to_string(role)};
    int signal_errno = 0;

    struct Disposer {
        Handle& handle;
        ~Disposer() {
            handle.stopping.store(true);
            close_fd(handle.stdin_fd);
            for (auto& pump : handle.pumps) {
                if (pump.joinable()) {
                    pump.join();
                }
            }
        }
    } disposer{*handle};

    report.was_running = refresh_state(*handle);
    if (report.was_running) {
        if (::kill(-handle->pid, SIGTERM) != 0 && ::kill(handle->pid, SIGTERM) != 0 && errno != ESRCH) {
            signal_errno = errno;
        }

        const auto deadline = Clock::now() + config_.kill_grace;
        while (refresh_state(*handle) && Clock::now() < deadline) {
            std::this_thread::sleep_for(kReapPoll);
        }

        if (refresh_state(*handle)) {
            report.escalated = true;
            logger_.warn("[Process] " + label + " ignored SIGTERM, sending SIGKILL");
            if (::kill(-handle->pid, SIGKILL) != 0 && ::kill(handle->pid, SIGKILL) != 0 && errno != ESRCH) {
                signal_errno = errno;
            }
            std::lock_guard<std::mutex> lock(handle->mutex);
            int status = 0;
            if (!handle->reaped && ::waitpid(handle->pid, &status, 0) == handle->pid) {
                handle->reaped = true;
                handle->exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
            }
        }
    } else {
        // Leftover children of an exited process may still hold the pipes open.
        ::kill(-handle->pid, SIGKILL);
    }

    logger_.info("[Process] Stopped " + label + (report.escalated ? " (forced)" : ""));

    if (signal_errno != 0) {
        errno = signal_errno;
        throw ProcessError(ErrorCode::KillAllFailed, errno_text("Unable to signal " + label));
    }
    return report;
}

void ProcessSupervisor::stop_all() {
    std::string failures;
    for (auto role : {ProcessRole::Client, ProcessRole::Server}) {
        try {
            stop(role);
        } catch (const ProcessError& ex) {
            if (!failures.empty()) {
                failures += "; ";
            }
            failures += ex.what();
        }
    }
    if (!failures.empty()) {
        throw ProcessError(ErrorCode::KillAllFailed, failures);
    }
}

}  // namespace grader::harness
