#include "grader_harness/step_executor.hpp"

#include <algorithm>
#include <utility>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/strings.hpp"
#include "grader_harness/value_reference.hpp"

namespace {

namespace strings = grader::harness::strings;

using Clock = std::chrono::steady_clock;

constexpr std::size_t kCrashPreviewChars = 200;
constexpr std::size_t kBannerPreviewChars = 100;
constexpr std::chrono::milliseconds kProbeAttemptTimeout{500};

std::string preview(const std::string& text, std::size_t limit, bool ellipsis) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + (ellipsis ? "..." : "");
}

std::string role_label(grader::harness::ProcessRole role) {
    return role == grader::harness::ProcessRole::Client ? "Client" : "Server";
}

bool is_rooted_path(std::string_view text) {
    return !text.empty() && (text.front() == '/' || text.find('\\') != std::string_view::npos);
}

}  // namespace

namespace grader::harness {

StepExecutor::StepExecutor(CaptureStore& store,
                           ProcessSupervisor& supervisor,
                           ProxyInterceptor& proxy,
                           const ComparisonEngine& comparator,
                           Config config)
    : store_(store),
      supervisor_(supervisor),
      proxy_(proxy),
      comparator_(comparator),
      config_(std::move(config)) {}

void StepExecutor::set_log_callback(Logger::LogCallback callback) {
    logger_.set_callback(callback);
    http_.set_log_callback(std::move(callback));
}

void StepExecutor::set_log_level(LogLevel level) noexcept {
    logger_.set_min_level(level);
    http_.set_log_level(level);
}

StepResult StepExecutor::execute(const Step& step, const CancellationToken& token) {
    const auto started = Clock::now();
    logger_.info("[Step] Executing: " + std::string{to_string(step.action)} + " (Stage: " + step.stage +
                 ", ID: " + step.id + ")");

    Verdict verdict;
    try {
        token.throw_if_cancelled("Step " + step.id);
        verdict = dispatch(step, token);
    } catch (const HarnessError& ex) {
        verdict = Verdict{false, ex.code(), ex.what()};
    } catch (const std::exception& ex) {
        const auto code = token.is_cancelled() ? ErrorCode::StepTimeout : ErrorCode::Unknown;
        verdict = Verdict{false, code, ex.what()};
    }

    if (verdict.code == ErrorCode::None) {
        verdict.code = verdict.passed ? ErrorCode::Ok : ErrorCode::Unknown;
    }

    StepResult result;
    result.step = step;
    result.passed = verdict.passed;
    result.code = verdict.code;
    result.message = std::move(verdict.message);
    result.diff_index = verdict.diff_index;
    result.expected_excerpt = std::move(verdict.expected_excerpt);
    result.actual_excerpt = std::move(verdict.actual_excerpt);
    result.duration_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    logger_.info("[Step] Result: " + std::string{result.passed ? "PASS" : "FAIL"} + " - " + result.message + " (" +
                 std::to_string(static_cast<long long>(result.duration_ms)) + "ms)");
    return result;
}

StepExecutor::Verdict StepExecutor::dispatch(const Step& step, const CancellationToken& token) {
    switch (step.action) {
        case Action::ServerStart: return start_server(token);
        case Action::ClientStart: return start_client(token);
        case Action::ServerClose: return close_process(ProcessRole::Server);
        case Action::ClientClose: return close_process(ProcessRole::Client);
        case Action::KillAll: return kill_all();
        case Action::ClientInput: return client_input(step, token);
        case Action::Wait: return wait(step, token);
        case Action::WaitForOutput: return wait_for_output(step, token);
        case Action::HttpRequest: return http_request(step, token);
        case Action::EnableProxy: return enable_proxy(step);
        case Action::CompareText:
        case Action::CompareJson:
        case Action::CompareCsv:
        case Action::CompareFile:
            return assertion(step);
    }
    throw ConfigurationError(ErrorCode::UnsupportedAction, "Unsupported action in step " + step.id);
}

bool StepExecutor::server_ready() const {
    const auto& proxy_config = proxy_.config();
    if (config_.protocol == ProxyMode::Tcp) {
        return port_accepts_connections(proxy_config.real_host, proxy_config.real_port);
    }
    // Any HTTP answer on the health path means the server is listening.
    http::HttpCall call;
    call.url = "http://" + proxy_config.real_host + ":" + std::to_string(proxy_config.real_port) +
               config_.health_path;
    call.timeout = kProbeAttemptTimeout;
    return http_.perform(call).transport_ok;
}

StepExecutor::Verdict StepExecutor::start_server(const CancellationToken& token) {
    supervisor_.start_server();

    const auto deadline = Clock::now() + config_.readiness_timeout;
    bool ready = false;
    while (Clock::now() < deadline) {
        if (!supervisor_.is_running(ProcessRole::Server)) {
            break;
        }
        if (server_ready()) {
            ready = true;
            break;
        }
        if (!token.sleep_for(config_.readiness_poll)) {
            token.throw_if_cancelled("Server readiness probe");
        }
    }

    if (!supervisor_.is_running(ProcessRole::Server)) {
        return Verdict{false, ErrorCode::ProcessCrashed,
                       "Server process failed to start or crashed immediately. Output: " +
                           preview(supervisor_.output(ProcessRole::Server), kCrashPreviewChars, false)};
    }
    if (!ready) {
        logger_.warn("[Action] ServerStart: readiness probe never answered within " +
                     std::to_string(config_.readiness_timeout.count()) + "ms; continuing because the process is alive");
    }

    if (!token.sleep_for(config_.startup_grace)) {
        token.throw_if_cancelled("Server startup");
    }
    logger_.info("[Action] ServerStart: Server output: " +
                 preview(supervisor_.output(ProcessRole::Server), kBannerPreviewChars, true));
    return Verdict{true, ErrorCode::Ok,
                   ready ? "Server started and is accepting connections"
                         : "Server started; readiness probe did not answer but the process is running"};
}

StepExecutor::Verdict StepExecutor::start_client(const CancellationToken& token) {
    supervisor_.start_client();

    if (!token.sleep_for(config_.client_startup_grace)) {
        token.throw_if_cancelled("Client startup");
    }

    const auto output = supervisor_.output(ProcessRole::Client);
    if (!supervisor_.is_running(ProcessRole::Client)) {
        const auto status = supervisor_.exit_status(ProcessRole::Client);
        if (status && *status == 0 && !output.empty()) {
            return Verdict{true, ErrorCode::Ok, "Client ran to completion during startup (exit code 0)"};
        }
        return Verdict{false, ErrorCode::ProcessCrashed,
                       "Client process failed to start or crashed immediately. Output: " +
                           preview(output, kCrashPreviewChars, false)};
    }

    logger_.info("[Action] ClientStart: Client output: " + preview(output, kBannerPreviewChars, true));
    return Verdict{true, ErrorCode::Ok, "Client started successfully"};
}

StepExecutor::Verdict StepExecutor::close_process(ProcessRole role) {
    const auto report = supervisor_.stop(role);
    if (!report.was_running) {
        return Verdict{true, ErrorCode::Ok, role_label(role) + " was not running"};
    }
    return Verdict{true, ErrorCode::Ok,
                   role_label(role) + (report.escalated ? " stopped (forced after grace period)" : " stopped")};
}

StepExecutor::Verdict StepExecutor::kill_all() {
    proxy_.stop();
    supervisor_.stop_all();
    return Verdict{true, ErrorCode::Ok, "All processes and the proxy stopped"};
}

StepExecutor::Verdict StepExecutor::client_input(const Step& step, const CancellationToken& token) {
    const auto baseline = supervisor_.output_size(ProcessRole::Client);
    logger_.info("[Action] ClientInput: Sending input to client: " + step.value);
    if (!supervisor_.send_input(ProcessRole::Client, step.value)) {
        return Verdict{false, ErrorCode::ProcessNotRunning, "Client is not running; input '" + step.value +
                                                                "' was not delivered"};
    }

    const auto outcome = supervisor_.wait_for_output(ProcessRole::Client, baseline, config_.input_output_wait, token);
    token.throw_if_cancelled("Client input");
    switch (outcome) {
        case OutputWait::Produced:
            return Verdict{true, ErrorCode::Ok, "Sent input: " + step.value};
        case OutputWait::Exited:
            return Verdict{true, ErrorCode::Ok, "Sent input: " + step.value + " (client exited)"};
        case OutputWait::TimedOut:
            break;
    }
    return Verdict{true, ErrorCode::Ok, "Sent input: " + step.value + " (no new output within " +
                                            std::to_string(config_.input_output_wait.count()) + "ms)"};
}

StepExecutor::Verdict StepExecutor::wait(const Step& step, const CancellationToken& token) {
    const auto parsed = strings::parse_integer(step.value);
    const auto duration = parsed ? std::chrono::milliseconds{*parsed} : config_.default_wait;
    if (!token.sleep_for(duration)) {
        token.throw_if_cancelled("Wait");
    }
    return Verdict{true, ErrorCode::Ok, "Waited " + std::to_string(duration.count()) + "ms"};
}

StepExecutor::Verdict StepExecutor::wait_for_output(const Step& step, const CancellationToken& token) {
    const auto role = strings::iequals(strings::trim_copy(step.target), "server") ? ProcessRole::Server
                                                                                   : ProcessRole::Client;
    const auto parsed = strings::parse_integer(step.value);
    const auto timeout = parsed ? std::chrono::milliseconds{*parsed} : config_.input_output_wait;
    const auto baseline = supervisor_.output_size(role);

    const auto outcome = supervisor_.wait_for_output(role, baseline, timeout, token);
    token.throw_if_cancelled("Wait for output");
    switch (outcome) {
        case OutputWait::Produced:
            return Verdict{true, ErrorCode::Ok, role_label(role) + " produced output"};
        case OutputWait::Exited:
            return Verdict{false, ErrorCode::ProcessNotRunning, role_label(role) + " exited without new output"};
        case OutputWait::TimedOut:
            break;
    }
    return Verdict{false, ErrorCode::Timeout,
                   role_label(role) + " produced no output within " + std::to_string(timeout.count()) + "ms"};
}

StepExecutor::Verdict StepExecutor::http_request(const Step& step, const CancellationToken& token) {
    auto parts = strings::split(step.value, '|');
    for (auto& part : parts) {
        part = strings::trim_copy(part);
    }
    if (parts.size() < 2 || parts[0].empty() || parts[1].empty()) {
        return Verdict{false, ErrorCode::HttpRequestInvalid, "HTTP_REQUEST requires METHOD|URL"};
    }
    // The body substring is everything after the third separator.
    std::string body_needle;
    for (std::size_t i = 3; i < parts.size(); ++i) {
        body_needle += (i > 3 ? "|" : "") + parts[i];
    }

    http::HttpCall call;
    call.method = parts[0];
    call.url = parts[1];
    call.timeout = std::min(config_.http_timeout, token.remaining());
    call.abort_requested = [&token] { return token.is_cancelled(); };

    const auto outcome = http_.perform(call);
    if (!outcome.transport_ok) {
        token.throw_if_cancelled("HTTP request");
        return Verdict{false, ErrorCode::HttpNonSuccess, "HTTP request failed: " + outcome.error};
    }

    const auto status = outcome.response.status_code;
    const auto expected_status = parts.size() >= 3 ? strings::parse_integer(parts[2]) : std::nullopt;
    if (expected_status) {
        if (status != *expected_status) {
            return Verdict{false, ErrorCode::HttpNonSuccess, "HTTP status " + std::to_string(status) +
                                                                 " != expected " + std::to_string(*expected_status)};
        }
    } else if (status < 200 || status >= 300) {
        return Verdict{false, ErrorCode::HttpNonSuccess,
                       "HTTP " + std::to_string(status) + " " + outcome.response.status_message};
    }

    const auto& body = outcome.response.body;
    if (!body_needle.empty() && strings::to_lower_copy(body).find(strings::to_lower_copy(body_needle)) ==
                                    std::string::npos) {
        return Verdict{false, ErrorCode::TextMismatch, "Expected body text not found"};
    }

    const auto stage = step.stage.empty() ? store_.cursor().stage : step.stage;
    store_.replace(CaptureScope::Clients, step.question_code, stage, body);
    return Verdict{true, ErrorCode::Ok, "HTTP " + std::to_string(status) + " " + outcome.response.status_message};
}

StepExecutor::Verdict StepExecutor::enable_proxy(const Step& step) {
    const auto mode = parse_proxy_mode(step.value).value_or(config_.protocol);
    logger_.info("[Action] EnableProxy: Starting proxy (protocol: " + std::string{to_string(mode)} + ")");
    proxy_.start(mode);
    return Verdict{true, ErrorCode::Ok, "Proxy started (" + std::string{to_string(mode)} + " mode) on port " +
                                            std::to_string(proxy_.bound_port())};
}

ValueReference StepExecutor::actual_reference(const Step& step) const {
    const auto value = strings::trim_copy(step.value);
    if (is_capture_uri(value) || is_rooted_path(value)) {
        return make_reference(value);
    }

    const auto stage = step.stage.empty() ? store_.cursor().stage : step.stage;
    std::optional<CaptureScope> scope;
    switch (step.validation_kind()) {
        case ValidationKind::DataResponse:
            // A direct HTTP_REQUEST leaves the body under the client scope instead.
            scope = store_.try_get(CaptureScope::ServersResponse, step.question_code, stage)
                        ? CaptureScope::ServersResponse
                        : CaptureScope::Clients;
            break;
        case ValidationKind::DataRequest:
            scope = CaptureScope::ServersRequest;
            break;
        case ValidationKind::ClientOutput:
            scope = CaptureScope::Clients;
            break;
        case ValidationKind::ServerOutput:
            scope = CaptureScope::Servers;
            break;
        default:
            if (step.is_client_row()) {
                scope = CaptureScope::Clients;
            } else if (step.is_server_row()) {
                scope = CaptureScope::Servers;
            }
            break;
    }

    if (scope) {
        return CaptureReference{make_capture_key(*scope, step.question_code, stage)};
    }
    return make_reference(step.value);
}

StepExecutor::Verdict StepExecutor::assertion(const Step& step) {
    const auto kind = step.validation_kind();
    if (!config_.grading.should_grade(step)) {
        return Verdict{true, ErrorCode::Skipped, "Step skipped by grading mode"};
    }
    if (!config_.grading.is_enabled(kind)) {
        return Verdict{true, ErrorCode::Skipped, "Validation skipped by config: " + std::string{to_string(kind)}};
    }

    const auto stage = step.stage.empty() ? store_.cursor().stage : step.stage;
    const auto metadata = store_.try_get_metadata(step.question_code, stage);

    switch (kind) {
        case ValidationKind::HttpMethod:
            return from_outcome(comparator_.compare_http_method(step.http_method.value_or(step.target),
                                                                metadata ? metadata->method : std::string{}));
        case ValidationKind::StatusCode:
            return from_outcome(comparator_.compare_status_code(step.status_code.value_or(step.target),
                                                                metadata ? metadata->status_code : 0));
        case ValidationKind::ByteSize: {
            const auto expected = step.byte_size.value_or(step.target);
            if (!metadata && !strings::is_blank(expected)) {
                return Verdict{false, ErrorCode::ActualCaptureMissing, "Byte size not captured by the proxy"};
            }
            return from_outcome(comparator_.compare_byte_size(expected, metadata ? metadata->byte_size : 0));
        }
        case ValidationKind::DataType:
            return from_outcome(comparator_.compare_data_type(step.data_type.value_or(step.target),
                                                              actual_reference(step)));
        default:
            break;
    }

    const auto expected = make_reference(step.target);
    const auto actual = actual_reference(step);
    switch (step.action) {
        case Action::CompareJson: return from_outcome(comparator_.compare_json(expected, actual));
        case Action::CompareCsv: return from_outcome(comparator_.compare_csv(expected, actual));
        case Action::CompareFile: return from_outcome(comparator_.compare_file(expected, actual));
        default: return from_outcome(comparator_.compare_text(expected, actual));
    }
}

StepExecutor::Verdict StepExecutor::from_outcome(const ComparisonOutcome& outcome) {
    Verdict verdict{outcome.passed, outcome.code, outcome.message};
    if (outcome.diff_index >= 0) {
        verdict.diff_index = outcome.diff_index;
        verdict.expected_excerpt = outcome.expected_excerpt;
        verdict.actual_excerpt = outcome.actual_excerpt;
    }
    return verdict;
}

}  // namespace grader::harness
