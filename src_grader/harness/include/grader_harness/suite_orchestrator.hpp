#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "grader_harness/cancellation.hpp"
#include "grader_harness/capture_store.hpp"
#include "grader_harness/log.hpp"
#include "grader_harness/process_supervisor.hpp"
#include "grader_harness/proxy_interceptor.hpp"
#include "grader_harness/step.hpp"
#include "grader_harness/step_executor.hpp"

namespace grader::harness {

enum class CasePhase {
    Idle,
    Init,
    Running,
    Finalizing,
    Done,
};

[[nodiscard]] std::string_view to_string(CasePhase phase) noexcept;

struct SuiteDefinition {
    std::string name;
    ProxyMode protocol{ProxyMode::Http};
    std::vector<TestCaseDefinition> cases;
    std::filesystem::path source_file;
};

struct SuiteResult {
    std::string suite;
    std::vector<CaseResult> cases;
    double points_awarded{0.0};
    double points_possible{0.0};
    /// True when the suite token stopped the run before every case executed.
    bool cancelled{false};

    [[nodiscard]] std::size_t passed_cases() const;
    [[nodiscard]] bool all_passed() const { return !cancelled && passed_cases() == cases.size(); }
};

/**
 * \brief Drives one test case through Init, Running, Finalizing and Done.
 *
 * Steps run strictly one after another, each under a token linked to the
 * suite token with its own deadline. A settle delay is inserted when the
 * stage label changes between consecutive steps, and before the first
 * assertion that follows an interaction step.
 *
 * Grading is all-or-nothing: the case mark is awarded only when every graded
 * assertion (and every non-assertion step) passed. Assertions of the INPUT
 * stage are recorded but never graded. Finalizing stops the proxy and both
 * processes whatever happened before and never throws.
 */
class SuiteOrchestrator {
public:
    struct Config {
        std::chrono::milliseconds step_timeout{10000};
        std::chrono::milliseconds stage_settle_delay{500};
        std::chrono::milliseconds assertion_settle_delay{1000};
    };

    using PhaseCallback = std::function<void(const std::string& case_name, CasePhase phase)>;

    SuiteOrchestrator(CaptureStore& store,
                      ProcessSupervisor& supervisor,
                      ProxyInterceptor& proxy,
                      StepExecutor& executor,
                      Config config);

    void set_log_callback(Logger::LogCallback callback);
    void set_log_level(LogLevel level) noexcept { logger_.set_min_level(level); }

    /// Invoked on every phase transition, on the orchestrating thread.
    void set_phase_callback(PhaseCallback callback);

    [[nodiscard]] CasePhase phase() const noexcept { return phase_.load(); }

    [[nodiscard]] CaseResult run_case(const TestCaseDefinition& test_case,
                                      const std::filesystem::path& client_path,
                                      const std::filesystem::path& server_path,
                                      const CancellationToken& suite_token);

    /// Runs every case in order; only cancellation of \p suite_token stops early.
    [[nodiscard]] SuiteResult run_suite(const SuiteDefinition& suite,
                                        const std::filesystem::path& client_path,
                                        const std::filesystem::path& server_path,
                                        const CancellationToken& suite_token);

private:
    void enter(const std::string& case_name, CasePhase phase);
    void finalize(const std::string& case_name);
    static void grade(CaseResult& result, double mark, bool complete);

    CaptureStore& store_;
    ProcessSupervisor& supervisor_;
    ProxyInterceptor& proxy_;
    StepExecutor& executor_;
    Config config_;
    Logger logger_;
    PhaseCallback phase_callback_;
    std::atomic<CasePhase> phase_{CasePhase::Idle};
};

}  // namespace grader::harness
