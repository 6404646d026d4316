#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "grader_harness/cancellation.hpp"
#include "grader_harness/capture_store.hpp"
#include "grader_harness/log.hpp"

namespace grader::harness {

enum class ProcessRole {
    Client,
    Server,
};

[[nodiscard]] std::string_view to_string(ProcessRole role) noexcept;

/// Outcome of waiting for an interactive process to react.
enum class OutputWait {
    Produced,
    Exited,
    TimedOut,
};

[[nodiscard]] std::string_view to_string(OutputWait outcome) noexcept;

struct StopReport {
    bool was_running{false};
    /// True when the cooperative signal was ignored and SIGKILL was needed.
    bool escalated{false};
};

/**
 * \brief Owns exactly one client and one server process.
 *
 * Each child runs in its own process group with stdin, stdout and stderr
 * redirected to pipes. One pump thread per output stream publishes text into
 * the local buffer and into the CaptureStore under the store's current
 * cursor, flushing on a line terminator or after `idle_flush` without one so
 * that unterminated prompts are still observed.
 *
 * Stopping sends SIGTERM to the group, waits `kill_grace`, then escalates to
 * SIGKILL. Handles are always discarded by stop(), even when it throws.
 */
class ProcessSupervisor {
public:
    struct Config {
        std::chrono::milliseconds idle_flush{100};
        std::chrono::milliseconds kill_grace{1000};
        std::chrono::milliseconds output_poll{25};
        std::vector<std::string> client_args{};
        std::vector<std::string> server_args{};
        /// Empty keeps the harness working directory.
        std::filesystem::path working_directory{};
    };

    ProcessSupervisor(CaptureStore& store, Config config);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void set_log_callback(Logger::LogCallback callback);
    void set_log_level(LogLevel level) noexcept { logger_.set_min_level(level); }

    /// Stops and discards previous processes, then records the executables.
    void init(std::filesystem::path client_path, std::filesystem::path server_path);

    /// Throws ProcessError (ClientExeMissing / ServerExeMissing) for an unusable path.
    void start(ProcessRole role);
    void start_client() { start(ProcessRole::Client); }
    void start_server() { start(ProcessRole::Server); }

    /**
     * Writes \p text plus a newline to the process stdin. Returns false and
     * logs a diagnostic when the process is not running.
     */
    bool send_input(ProcessRole role, std::string_view text);

    [[nodiscard]] bool is_running(ProcessRole role);
    [[nodiscard]] std::optional<int> exit_status(ProcessRole role);

    [[nodiscard]] std::size_t output_size(ProcessRole role) const;
    [[nodiscard]] std::string output(ProcessRole role) const;

    /// Polls the buffer length against \p baseline until it grows, the process exits or \p timeout elapses.
    OutputWait wait_for_output(ProcessRole role,
                               std::size_t baseline,
                               std::chrono::milliseconds timeout,
                               const CancellationToken& token);

    StopReport stop(ProcessRole role);

    /// Stops client then server. Throws ProcessError (KillAllFailed) if either could not be signalled.
    void stop_all();

    [[nodiscard]] const std::filesystem::path& executable(ProcessRole role) const;

private:
    struct Handle;

    std::unique_ptr<Handle>& slot(ProcessRole role);
    const std::unique_ptr<Handle>& slot(ProcessRole role) const;

    void pump(Handle& handle, int fd);
    void publish(Handle& handle, std::string_view text);
    bool refresh_state(Handle& handle);

    CaptureStore& store_;
    Config config_;
    Logger logger_;

    std::filesystem::path client_path_;
    std::filesystem::path server_path_;
    std::unique_ptr<Handle> client_;
    std::unique_ptr<Handle> server_;
};

}  // namespace grader::harness
