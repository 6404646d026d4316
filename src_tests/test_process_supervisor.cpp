/**
 * @file test_process_supervisor.cpp
 * @brief Tests for child process lifecycle, stdio pumping and forced stop
 *
 * Covers:
 *  - Missing or non-executable paths rejected with role-specific codes
 *  - Unterminated prompts published after the idle flush
 *  - Input round trip and capture under the store cursor
 *  - Exit status of a finished process, stderr capture, extra arguments
 *  - SIGTERM ignored: escalation to SIGKILL, then reported as not running
 *
 * The children are small /bin/sh scripts written to a temporary directory.
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/process_supervisor.hpp"

using grader::harness::CancellationToken;
using grader::harness::CaptureScope;
using grader::harness::CaptureStore;
using grader::harness::ErrorCode;
using grader::harness::OutputWait;
using grader::harness::ProcessError;
using grader::harness::ProcessRole;
using grader::harness::ProcessSupervisor;

namespace {

using namespace std::chrono_literals;

std::filesystem::path scripts_dir() {
    const auto dir = std::filesystem::temp_directory_path() / "grader_process_tests";
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path write_script(const std::string& name, const std::string& body, bool executable = true) {
    const auto path = scripts_dir() / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    auto perms = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
    if (executable) {
        perms |= std::filesystem::perms::owner_exec;
    }
    std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace);
    return path;
}

ProcessSupervisor::Config fast_config() {
    ProcessSupervisor::Config config;
    config.idle_flush = 50ms;
    config.kill_grace = 300ms;
    config.output_poll = 10ms;
    return config;
}

ErrorCode start_error(ProcessSupervisor& supervisor, ProcessRole role) {
    try {
        supervisor.start(role);
    } catch (const ProcessError& ex) {
        return ex.code();
    }
    return ErrorCode::None;
}

bool wait_until_exited(ProcessSupervisor& supervisor, ProcessRole role) {
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (supervisor.is_running(role)) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

}  // namespace

TEST_CASE("Unusable executables are rejected per role", "[process][start]") {
    CaptureStore store;
    ProcessSupervisor supervisor(store, fast_config());
    const auto not_executable = write_script("plain.sh", "echo hi", false);

    supervisor.init("", "/no/such/server");
    REQUIRE(start_error(supervisor, ProcessRole::Client) == ErrorCode::ClientExeMissing);
    REQUIRE(start_error(supervisor, ProcessRole::Server) == ErrorCode::ServerExeMissing);

    supervisor.init(not_executable, not_executable);
    REQUIRE(start_error(supervisor, ProcessRole::Server) == ErrorCode::ServerExeMissing);
    REQUIRE_FALSE(supervisor.is_running(ProcessRole::Server));
}

TEST_CASE("Unterminated prompt is observed before any input", "[process][prompt]") {
    CaptureStore store;
    store.set_cursor("Q1", "1");
    ProcessSupervisor supervisor(store, fast_config());
    const auto client = write_script("prompt.sh", "printf 'Name: '\nread name\necho \"Hello $name\"");

    supervisor.init(client, "");
    supervisor.start_client();
    const CancellationToken token;

    REQUIRE(supervisor.wait_for_output(ProcessRole::Client, 0, 3000ms, token) == OutputWait::Produced);
    REQUIRE(supervisor.output(ProcessRole::Client) == "Name: ");

    const auto baseline = supervisor.output_size(ProcessRole::Client);
    REQUIRE(supervisor.send_input(ProcessRole::Client, "Ann"));
    REQUIRE(supervisor.wait_for_output(ProcessRole::Client, baseline, 3000ms, token) == OutputWait::Produced);

    REQUIRE(wait_until_exited(supervisor, ProcessRole::Client));
    // Exit drains the pumps; the store sees the same bytes as the buffer.
    std::this_thread::sleep_for(100ms);
    REQUIRE(supervisor.output(ProcessRole::Client) == "Name: Hello Ann\n");
    REQUIRE(store.try_get(CaptureScope::Clients, "Q1", "1") == std::optional<std::string>{"Name: Hello Ann\n"});
    REQUIRE_FALSE(store.try_get(CaptureScope::Servers, "Q1", "1").has_value());
}

TEST_CASE("Finished process reports its exit status", "[process][exit]") {
    CaptureStore store;
    ProcessSupervisor supervisor(store, fast_config());
    const auto client = write_script("exit3.sh", "echo done\necho oops 1>&2\nexit 3");

    supervisor.init(client, "");
    supervisor.start_client();

    REQUIRE(wait_until_exited(supervisor, ProcessRole::Client));
    std::this_thread::sleep_for(100ms);
    REQUIRE(supervisor.exit_status(ProcessRole::Client) == std::optional<int>{3});
    REQUIRE_FALSE(supervisor.send_input(ProcessRole::Client, "late"));

    const CancellationToken token;
    REQUIRE(supervisor.wait_for_output(ProcessRole::Client, supervisor.output_size(ProcessRole::Client), 200ms,
                                       token) == OutputWait::Exited);
    const auto output = supervisor.output(ProcessRole::Client);
    REQUIRE(output.find("done") != std::string::npos);
    REQUIRE(output.find("oops") != std::string::npos);

    const auto report = supervisor.stop(ProcessRole::Client);
    REQUIRE_FALSE(report.was_running);
    REQUIRE_FALSE(report.escalated);
}

TEST_CASE("Configured arguments reach the child", "[process][args]") {
    CaptureStore store;
    auto config = fast_config();
    config.server_args = {"alpha", "beta"};
    ProcessSupervisor supervisor(store, config);
    const auto server = write_script("args.sh", "echo \"args=$1,$2\"");

    supervisor.init("", server);
    supervisor.start_server();
    const CancellationToken token;
    REQUIRE(supervisor.wait_for_output(ProcessRole::Server, 0, 3000ms, token) == OutputWait::Produced);
    REQUIRE(wait_until_exited(supervisor, ProcessRole::Server));
    std::this_thread::sleep_for(100ms);
    REQUIRE(supervisor.output(ProcessRole::Server) == "args=alpha,beta\n");
}

TEST_CASE("Waiting on a silent process times out", "[process][wait]") {
    CaptureStore store;
    ProcessSupervisor supervisor(store, fast_config());
    const auto client = write_script("silent.sh", "read line");

    supervisor.init(client, "");
    supervisor.start_client();
    const CancellationToken token;
    REQUIRE(supervisor.wait_for_output(ProcessRole::Client, 0, 150ms, token) == OutputWait::TimedOut);

    const auto report = supervisor.stop(ProcessRole::Client);
    REQUIRE(report.was_running);
    REQUIRE_FALSE(report.escalated);
    REQUIRE_FALSE(supervisor.is_running(ProcessRole::Client));
}

TEST_CASE("Process ignoring SIGTERM is force-killed", "[process][stop][escalate]") {
    CaptureStore store;
    ProcessSupervisor supervisor(store, fast_config());
    const auto server = write_script("stubborn.sh", "trap '' TERM\necho ready\nwhile true; do sleep 0.05; done");

    supervisor.init("", server);
    supervisor.start_server();
    const CancellationToken token;
    REQUIRE(supervisor.wait_for_output(ProcessRole::Server, 0, 3000ms, token) == OutputWait::Produced);
    REQUIRE(supervisor.is_running(ProcessRole::Server));

    const auto started = std::chrono::steady_clock::now();
    const auto report = supervisor.stop(ProcessRole::Server);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(report.was_running);
    REQUIRE(report.escalated);
    REQUIRE(elapsed >= 300ms);
    REQUIRE_FALSE(supervisor.is_running(ProcessRole::Server));
    REQUIRE_FALSE(supervisor.exit_status(ProcessRole::Server).has_value());
}

TEST_CASE("stop_all on idle supervisor is a no-op", "[process][stop]") {
    CaptureStore store;
    ProcessSupervisor supervisor(store, fast_config());
    REQUIRE_NOTHROW(supervisor.stop_all());
    REQUIRE(supervisor.stop(ProcessRole::Client).was_running == false);
}
