#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "grader_harness/cancellation.hpp"
#include "grader_harness/capture_store.hpp"
#include "grader_harness/comparison_engine.hpp"
#include "grader_harness/grading_config.hpp"
#include "grader_harness/http_client.hpp"
#include "grader_harness/log.hpp"
#include "grader_harness/process_supervisor.hpp"
#include "grader_harness/proxy_interceptor.hpp"
#include "grader_harness/step.hpp"

namespace grader::harness {

/**
 * \brief Runs exactly one Step against the supervisor, the proxy and the comparison engine.
 *
 * Nothing escapes execute(): every HarnessError and std::exception is turned
 * into a failed StepResult carrying the classified code. A cancelled token
 * yields StepTimeout regardless of what the interrupted action was doing.
 */
class StepExecutor {
public:
    struct Config {
        std::chrono::milliseconds readiness_timeout{5000};
        std::chrono::milliseconds readiness_poll{100};
        std::string health_path{"/healthz"};
        /// Pause after a successful server start so the banner reaches the capture.
        std::chrono::milliseconds startup_grace{500};
        /// Pause after a client start before checking that it is still alive.
        std::chrono::milliseconds client_startup_grace{500};
        /// Upper bound for the reaction to CLIENT_INPUT.
        std::chrono::milliseconds input_output_wait{2000};
        std::chrono::milliseconds default_wait{1000};
        std::chrono::milliseconds http_timeout{30000};
        ProxyMode protocol{ProxyMode::Http};
        GradingConfig grading{};
    };

    StepExecutor(CaptureStore& store,
                 ProcessSupervisor& supervisor,
                 ProxyInterceptor& proxy,
                 const ComparisonEngine& comparator,
                 Config config);

    void set_log_callback(Logger::LogCallback callback);
    void set_log_level(LogLevel level) noexcept;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// Suites carry their own protocol; it selects the proxy mode and the readiness probe.
    void set_protocol(ProxyMode protocol) noexcept { config_.protocol = protocol; }

    [[nodiscard]] StepResult execute(const Step& step, const CancellationToken& token);

    /**
     * Actual value reference used by an assertion: `value` when it is a
     * capture URI or a rooted path, otherwise the capture matching the
     * step's validation kind or OC-/OS- prefix for its (question, stage).
     */
    [[nodiscard]] ValueReference actual_reference(const Step& step) const;

private:
    struct Verdict {
        bool passed{false};
        ErrorCode code{ErrorCode::None};
        std::string message;
        std::optional<long long> diff_index;
        std::string expected_excerpt;
        std::string actual_excerpt;
    };

    Verdict dispatch(const Step& step, const CancellationToken& token);

    Verdict start_server(const CancellationToken& token);
    Verdict start_client(const CancellationToken& token);
    Verdict close_process(ProcessRole role);
    Verdict kill_all();
    Verdict client_input(const Step& step, const CancellationToken& token);
    Verdict wait(const Step& step, const CancellationToken& token);
    Verdict wait_for_output(const Step& step, const CancellationToken& token);
    Verdict http_request(const Step& step, const CancellationToken& token);
    Verdict enable_proxy(const Step& step);
    Verdict assertion(const Step& step);

    bool server_ready() const;

    static Verdict from_outcome(const ComparisonOutcome& outcome);

    CaptureStore& store_;
    ProcessSupervisor& supervisor_;
    ProxyInterceptor& proxy_;
    const ComparisonEngine& comparator_;
    Config config_;
    Logger logger_;
    http::HttpClient http_;
};

}  // namespace grader::harness
