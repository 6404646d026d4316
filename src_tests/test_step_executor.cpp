/**
 * @file test_step_executor.cpp
 * @brief Tests for single-step execution against real child processes and sockets
 *
 * Covers:
 *  - WAIT / WAIT_FOR_OUTPUT timing and cancellation (StepTimeout)
 *  - CLIENT_START success, run-to-completion and crash classification
 *  - SERVER_START without readiness answer, KILL_ALL, ENABLE_PROXY
 *  - HTTP_REQUEST status, body substring and capture under the client scope
 *  - Assertions routed to the right capture, skipped by grading toggles
 *  - No exception ever escapes execute()
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <variant>

#include "grader_harness/step_executor.hpp"
#include "local_server.hpp"

using grader::harness::Action;
using grader::harness::CancellationToken;
using grader::harness::CaptureReference;
using grader::harness::CaptureScope;
using grader::harness::CaptureStore;
using grader::harness::ComparisonEngine;
using grader::harness::ErrorCode;
using grader::harness::GradingConfig;
using grader::harness::GradingMode;
using grader::harness::HttpMetadata;
using grader::harness::ProcessRole;
using grader::harness::ProcessSupervisor;
using grader::harness::ProxyInterceptor;
using grader::harness::Step;
using grader::harness::StepExecutor;
using grader::harness::testing::LocalServer;

namespace http = grader::harness::http;
namespace testing = grader::harness::testing;

namespace {

using namespace std::chrono_literals;

std::filesystem::path write_script(const std::string& name, const std::string& body) {
    const auto dir = std::filesystem::temp_directory_path() / "grader_executor_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                     std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

StepExecutor::Config fast_executor() {
    StepExecutor::Config config;
    config.readiness_timeout = 200ms;
    config.readiness_poll = 20ms;
    config.startup_grace = 0ms;
    config.client_startup_grace = 300ms;
    config.input_output_wait = 300ms;
    config.default_wait = 10ms;
    config.http_timeout = 3000ms;
    return config;
}

struct Rig {
    explicit Rig(StepExecutor::Config executor_config = fast_executor())
        : supervisor(store, supervisor_config()),
          proxy(store, proxy_config()),
          engine(store, ComparisonEngine::Config{}),
          executor(store, supervisor, proxy, engine, std::move(executor_config)) {}

    static ProcessSupervisor::Config supervisor_config() {
        ProcessSupervisor::Config config;
        config.idle_flush = 50ms;
        config.kill_grace = 300ms;
        config.output_poll = 10ms;
        return config;
    }

    static ProxyInterceptor::Config proxy_config() {
        ProxyInterceptor::Config config;
        config.public_port = 0;
        config.real_port = testing::unused_port();
        config.accept_poll = 20ms;
        config.stop_grace = 500ms;
        return config;
    }

    CaptureStore store;
    ProcessSupervisor supervisor;
    ProxyInterceptor proxy;
    ComparisonEngine engine;
    StepExecutor executor;
};

Step make_step(const std::string& id, Action action, const std::string& stage = "1") {
    Step step;
    step.id = id;
    step.question_code = "Q1";
    step.stage = stage;
    step.action = action;
    return step;
}

LocalServer::Handler book_lookup() {
    return [](int fd) {
        http::HttpRequest request;
        try {
            if (!testing::read_http_request(fd, request)) {
                return;
            }
        } catch (const grader::harness::NetworkError&) {
            return;
        }
        http::HttpResponse response;
        response.status_code = request.path == "/books/2" ? 200 : 404;
        response.set_content_type("text/plain");
        response.body = response.status_code == 200 ? "Title: Neuromancer" : "missing";
        testing::send_text(fd, http::build_response(response));
    };
}

}  // namespace

TEST_CASE("WAIT sleeps for the given milliseconds or the default", "[executor][wait]") {
    Rig rig;
    const CancellationToken token;

    auto step = make_step("W-1", Action::Wait);
    step.value = "30";
    const auto result = rig.executor.execute(step, token);
    REQUIRE(result.passed);
    REQUIRE(result.code == ErrorCode::Ok);
    REQUIRE(result.duration_ms >= 25.0);
    REQUIRE(result.message == "Waited 30ms");

    step.value = "soon";
    REQUIRE(rig.executor.execute(step, token).message == "Waited 10ms");
}

TEST_CASE("Cancelled or expired tokens yield StepTimeout", "[executor][timeout]") {
    Rig rig;

    const CancellationToken cancelled;
    cancelled.cancel();
    const auto before = rig.executor.execute(make_step("W-1", Action::Wait), cancelled);
    REQUIRE_FALSE(before.passed);
    REQUIRE(before.code == ErrorCode::StepTimeout);

    auto long_wait = make_step("W-2", Action::Wait);
    long_wait.value = "5000";
    const auto during = rig.executor.execute(long_wait, CancellationToken::with_timeout(50ms));
    REQUIRE_FALSE(during.passed);
    REQUIRE(during.code == ErrorCode::StepTimeout);
    REQUIRE(during.duration_ms < 2000.0);
}

TEST_CASE("Client start classifies its early fate", "[executor][client]") {
    Rig rig;
    const CancellationToken token;

    rig.supervisor.init(write_script("interactive.sh", "echo ready\nread line\necho \"got $line\""), "");
    auto started = rig.executor.execute(make_step("C-START-1", Action::ClientStart), token);
    REQUIRE(started.passed);
    REQUIRE(rig.supervisor.is_running(ProcessRole::Client));

    auto input = make_step("C-IN-1", Action::ClientInput);
    input.value = "abc";
    const auto sent = rig.executor.execute(input, token);
    REQUIRE(sent.passed);
    REQUIRE(sent.message.rfind("Sent input: abc", 0) == 0);
    REQUIRE(rig.executor.execute(make_step("C-CLOSE-1", Action::ClientClose), token).passed);

    rig.supervisor.init(write_script("one_shot.sh", "echo finished"), "");
    const auto one_shot = rig.executor.execute(make_step("C-START-2", Action::ClientStart), token);
    REQUIRE(one_shot.passed);
    REQUIRE(one_shot.message.find("exit code 0") != std::string::npos);

    rig.supervisor.init(write_script("crash.sh", "echo boom\nexit 4"), "");
    const auto crashed = rig.executor.execute(make_step("C-START-3", Action::ClientStart), token);
    REQUIRE_FALSE(crashed.passed);
    REQUIRE(crashed.code == ErrorCode::ProcessCrashed);

    rig.supervisor.init("/no/such/client", "");
    const auto missing = rig.executor.execute(make_step("C-START-4", Action::ClientStart), token);
    REQUIRE_FALSE(missing.passed);
    REQUIRE(missing.code == ErrorCode::ClientExeMissing);
}

TEST_CASE("Input to a client that is not running fails", "[executor][client][input]") {
    Rig rig;
    auto input = make_step("C-IN-1", Action::ClientInput);
    input.value = "1";
    const auto result = rig.executor.execute(input, CancellationToken{});
    REQUIRE_FALSE(result.passed);
    REQUIRE(result.code == ErrorCode::ProcessNotRunning);
}

TEST_CASE("WAIT_FOR_OUTPUT reports timeouts", "[executor][wait_for_output]") {
    Rig rig;
    const CancellationToken token;
    rig.supervisor.init(write_script("quiet.sh", "read line"), "");
    REQUIRE(rig.executor.execute(make_step("C-START-1", Action::ClientStart), token).passed);

    auto wait = make_step("C-WAIT-1", Action::WaitForOutput);
    wait.target = "client";
    wait.value = "100";
    const auto result = rig.executor.execute(wait, token);
    REQUIRE_FALSE(result.passed);
    REQUIRE(result.code == ErrorCode::Timeout);

    REQUIRE(rig.executor.execute(make_step("K-1", Action::KillAll), token).passed);
    REQUIRE_FALSE(rig.supervisor.is_running(ProcessRole::Client));
}

TEST_CASE("Live server without readiness answer still starts", "[executor][server]") {
    Rig rig;
    const CancellationToken token;
    rig.supervisor.init("", write_script("banner.sh", "echo listening\nwhile true; do sleep 0.05; done"));

    const auto result = rig.executor.execute(make_step("S-START-1", Action::ServerStart), token);
    REQUIRE(result.passed);
    REQUIRE(result.message.find("readiness probe did not answer") != std::string::npos);
    REQUIRE(rig.supervisor.is_running(ProcessRole::Server));

    const auto proxied = rig.executor.execute(make_step("P-1", Action::EnableProxy), token);
    REQUIRE(proxied.passed);
    REQUIRE(rig.proxy.running());

    REQUIRE(rig.executor.execute(make_step("K-1", Action::KillAll), token).passed);
    REQUIRE_FALSE(rig.proxy.running());
    REQUIRE_FALSE(rig.supervisor.is_running(ProcessRole::Server));

    rig.supervisor.init("", write_script("dies.sh", "exit 2"));
    const auto crashed = rig.executor.execute(make_step("S-START-2", Action::ServerStart), token);
    REQUIRE_FALSE(crashed.passed);
    REQUIRE(crashed.code == ErrorCode::ProcessCrashed);
}

TEST_CASE("HTTP_REQUEST checks status and body and captures the answer", "[executor][http]") {
    LocalServer server(book_lookup());
    Rig rig;
    const CancellationToken token;
    const auto base = "http://127.0.0.1:" + std::to_string(server.port());

    auto request = make_step("H-1", Action::HttpRequest);
    request.value = "GET|" + base + "/books/2|200|neuromancer";
    const auto ok = rig.executor.execute(request, token);
    REQUIRE(ok.passed);
    REQUIRE(rig.store.try_get(CaptureScope::Clients, "Q1", "1") == std::optional<std::string>{"Title: Neuromancer"});

    request.value = "GET|" + base + "/books/3";
    const auto not_found = rig.executor.execute(request, token);
    REQUIRE_FALSE(not_found.passed);
    REQUIRE(not_found.code == ErrorCode::HttpNonSuccess);

    request.value = "GET|" + base + "/books/3|404";
    REQUIRE(rig.executor.execute(request, token).passed);

    request.value = "GET|" + base + "/books/2|200|Dune";
    const auto wrong_body = rig.executor.execute(request, token);
    REQUIRE_FALSE(wrong_body.passed);
    REQUIRE(wrong_body.code == ErrorCode::TextMismatch);

    request.value = "GET";
    const auto malformed = rig.executor.execute(request, token);
    REQUIRE_FALSE(malformed.passed);
    REQUIRE(malformed.code == ErrorCode::HttpRequestInvalid);
}

TEST_CASE("Console assertions read the capture of their stage", "[executor][assert][console]") {
    Rig rig;
    const CancellationToken token;
    rig.store.append(CaptureScope::Clients, "Q1", "2", "Welcome\nBook: Dune\n");

    auto check = make_step("OC-OUT-1", Action::CompareText, "2");
    check.target = "Book: Dune";
    const auto pass = rig.executor.execute(check, token);
    REQUIRE(pass.passed);
    REQUIRE(pass.code == ErrorCode::Ok);

    check.target = "Book: Neuromancer";
    const auto fail = rig.executor.execute(check, token);
    REQUIRE_FALSE(fail.passed);
    REQUIRE(fail.code == ErrorCode::TextMismatch);
    REQUIRE(fail.diff_index.has_value());

    auto server_row = make_step("OS-OUT-1", Action::CompareText, "2");
    server_row.target = "Started";
    const auto missing = rig.executor.execute(server_row, token);
    REQUIRE_FALSE(missing.passed);
    REQUIRE(missing.code == ErrorCode::ActualCaptureMissing);
}

TEST_CASE("HTTP field assertions use the intercepted metadata", "[executor][assert][http]") {
    auto config = fast_executor();
    config.grading.validate_byte_size = true;
    Rig rig(config);
    const CancellationToken token;
    rig.store.replace(CaptureScope::ServersResponse, "Q1", "1", R"({"id":7})");
    rig.store.set_metadata("Q1", "1", HttpMetadata{"POST", 201, 8});

    auto method = make_step("OS-METHOD-1", Action::CompareText);
    method.http_method = "post";
    REQUIRE(rig.executor.execute(method, token).passed);
    method.http_method = "GET";
    REQUIRE(rig.executor.execute(method, token).code == ErrorCode::HttpMethodMismatch);

    auto status = make_step("OS-STATUS-1", Action::CompareText);
    status.target = "201 Created";
    REQUIRE(rig.executor.execute(status, token).passed);

    auto size = make_step("OS-SIZE-1", Action::CompareText);
    size.byte_size = "10";
    REQUIRE(rig.executor.execute(size, token).passed);

    auto body = make_step("OS-DATA-1", Action::CompareJson);
    body.target = R"({ "id" : 7 })";
    REQUIRE(rig.executor.execute(body, token).passed);

    auto other_stage = make_step("OS-SIZE-2", Action::CompareText, "9");
    other_stage.byte_size = "10";
    REQUIRE(rig.executor.execute(other_stage, token).code == ErrorCode::ActualCaptureMissing);
}

TEST_CASE("Grading toggles turn assertions into passing skips", "[executor][assert][grading]") {
    auto config = fast_executor();
    config.grading = GradingConfig::preset(GradingMode::Client);
    Rig rig(config);
    const CancellationToken token;

    auto server_row = make_step("OS-OUT-1", Action::CompareText);
    server_row.target = "never captured";
    const auto skipped = rig.executor.execute(server_row, token);
    REQUIRE(skipped.passed);
    REQUIRE(skipped.code == ErrorCode::Skipped);

    auto size = make_step("OC-SIZE-1", Action::CompareText);
    size.byte_size = "100";
    const auto disabled = rig.executor.execute(size, token);
    REQUIRE(disabled.passed);
    REQUIRE(disabled.code == ErrorCode::Skipped);
    REQUIRE(disabled.message.find("BYTE_SIZE") != std::string::npos);
}

TEST_CASE("Actual reference follows the validation kind", "[executor][reference]") {
    Rig rig;

    auto data = make_step("OC-DATA-1", Action::CompareJson, "3");
    auto reference = rig.executor.actual_reference(data);
    REQUIRE(std::get<CaptureReference>(reference).key.scope == CaptureScope::Clients);

    rig.store.replace(CaptureScope::ServersResponse, "Q1", "3", "{}");
    reference = rig.executor.actual_reference(data);
    REQUIRE(std::get<CaptureReference>(reference).key.scope == CaptureScope::ServersResponse);

    auto request = make_step("OS-REQ-1", Action::CompareJson, "3");
    REQUIRE(std::get<CaptureReference>(rig.executor.actual_reference(request)).key.scope ==
            CaptureScope::ServersRequest);

    auto explicit_ref = make_step("OC-OUT-1", Action::CompareText, "3");
    explicit_ref.value = "memory://servers/Q9/1";
    const auto key = std::get<CaptureReference>(rig.executor.actual_reference(explicit_ref)).key;
    REQUIRE(key.scope == CaptureScope::Servers);
    REQUIRE(key.question_code == "Q9");
}
