#include "grader_harness/suite_orchestrator.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

#include "grader_harness/error_codes.hpp"

namespace grader::harness {

std::string_view to_string(CasePhase phase) noexcept {
    switch (phase) {
        case CasePhase::Idle: return "IDLE";
        case CasePhase::Init: return "INIT";
        case CasePhase::Running: return "RUNNING";
        case CasePhase::Finalizing: return "FINALIZING";
        case CasePhase::Done: return "DONE";
    }
    return "IDLE";
}

std::size_t SuiteResult::passed_cases() const {
    return static_cast<std::size_t>(
        std::count_if(cases.begin(), cases.end(), [](const CaseResult& result) { return result.all_passed; }));
}

SuiteOrchestrator::SuiteOrchestrator(CaptureStore& store,
                                     ProcessSupervisor& supervisor,
                                     ProxyInterceptor& proxy,
                                     StepExecutor& executor,
                                     Config config)
    : store_(store), supervisor_(supervisor), proxy_(proxy), executor_(executor), config_(config) {}

void SuiteOrchestrator::set_log_callback(Logger::LogCallback callback) {
    logger_.set_callback(std::move(callback));
}

void SuiteOrchestrator::set_phase_callback(PhaseCallback callback) {
    phase_callback_ = std::move(callback);
}

void SuiteOrchestrator::enter(const std::string& case_name, CasePhase phase) {
    phase_.store(phase);
    if (phase_callback_) {
        phase_callback_(case_name, phase);
    }
}

CaseResult SuiteOrchestrator::run_case(const TestCaseDefinition& test_case,
                                       const std::filesystem::path& client_path,
                                       const std::filesystem::path& server_path,
                                       const CancellationToken& suite_token) {
    CaseResult result;
    result.name = test_case.name;
    result.question_code = test_case.question_code;

    enter(test_case.name, CasePhase::Init);
    logger_.info("[TestCase] Starting: " + test_case.name + " (" + std::to_string(test_case.steps.size()) +
                 " step(s), mark " + std::to_string(test_case.mark) + ")");
    try {
        supervisor_.init(client_path, server_path);
    } catch (const HarnessError& ex) {
        logger_.warn(std::string{"[TestCase] Leftover processes could not be stopped: "} + ex.what());
    }

    std::set<std::string> questions{test_case.question_code};
    for (const auto& step : test_case.steps) {
        if (!step.question_code.empty()) {
            questions.insert(step.question_code);
        }
    }
    for (const auto& question : questions) {
        store_.clear_question(question);
    }

    enter(test_case.name, CasePhase::Running);
    std::optional<std::string> previous_stage;
    bool assertion_settle_pending = false;
    bool complete = true;

    for (const auto& step : test_case.steps) {
        if (suite_token.cancel_requested()) {
            logger_.warn("[TestCase] Suite cancelled; skipping remaining steps of " + test_case.name);
            complete = false;
            break;
        }

        if (previous_stage && *previous_stage != step.stage) {
            suite_token.sleep_for(config_.stage_settle_delay);
        }
        previous_stage = step.stage;

        if (is_interaction(step.action)) {
            assertion_settle_pending = true;
        } else if (is_assertion(step.action) && assertion_settle_pending) {
            logger_.info("[TestCase] Settling before assertions so asynchronous output is captured");
            suite_token.sleep_for(config_.assertion_settle_delay);
            assertion_settle_pending = false;
        }

        const auto& question = step.question_code.empty() ? test_case.question_code : step.question_code;
        store_.set_cursor(question, step.stage);

        const auto step_token = suite_token.linked(config_.step_timeout);
        result.steps.push_back(executor_.execute(step, step_token));
    }

    enter(test_case.name, CasePhase::Finalizing);
    finalize(test_case.name);

    grade(result, test_case.mark, complete);
    logger_.info("[TestCase] Completed: " + test_case.name + " -> " + (result.all_passed ? "PASS" : "FAIL") + " (" +
                 std::to_string(result.points_awarded) + "/" + std::to_string(result.points_possible) + ")");
    enter(test_case.name, CasePhase::Done);
    return result;
}

void SuiteOrchestrator::finalize(const std::string& case_name) {
    logger_.info("[TestCase] Cleaning up processes for " + case_name);
    try {
        proxy_.stop();
    } catch (const std::exception& ex) {
        logger_.error(std::string{"[TestCase] Proxy stop failed: "} + ex.what());
    }
    try {
        supervisor_.stop_all();
    } catch (const std::exception& ex) {
        logger_.error(std::string{"[TestCase] Process cleanup failed: "} + ex.what());
    }
}

void SuiteOrchestrator::grade(CaseResult& result, double mark, bool complete) {
    result.points_possible = mark;

    std::size_t graded = 0;
    bool all_passed = complete;
    for (const auto& step_result : result.steps) {
        if (step_result.step.is_graded()) {
            ++graded;
        }
        if (!step_result.passed && (step_result.step.is_graded() || !is_assertion(step_result.step.action))) {
            all_passed = false;
        }
    }

    result.all_passed = all_passed;
    result.points_awarded = all_passed ? mark : 0.0;

    const double share = graded > 0 ? mark / static_cast<double>(graded) : 0.0;
    for (auto& step_result : result.steps) {
        if (!step_result.step.is_graded()) {
            continue;
        }
        step_result.points_possible = share;
        step_result.points_awarded = all_passed ? share : 0.0;
    }
}

SuiteResult SuiteOrchestrator::run_suite(const SuiteDefinition& suite,
                                         const std::filesystem::path& client_path,
                                         const std::filesystem::path& server_path,
                                         const CancellationToken& suite_token) {
    SuiteResult result;
    result.suite = suite.name;
    logger_.info("[Suite] " + suite.name + ": " + std::to_string(suite.cases.size()) + " test case(s), protocol " +
                 std::string{to_string(suite.protocol)});
    executor_.set_protocol(suite.protocol);

    for (const auto& test_case : suite.cases) {
        if (suite_token.cancel_requested()) {
            result.cancelled = true;
            logger_.warn("[Suite] Cancelled before " + test_case.name);
            break;
        }
        auto case_result = run_case(test_case, client_path, server_path, suite_token);
        result.points_awarded += case_result.points_awarded;
        result.points_possible += case_result.points_possible;
        result.cases.push_back(std::move(case_result));
        if (suite_token.cancel_requested()) {
            result.cancelled = true;
        }
    }

    logger_.info("[Suite] Finished: " + std::to_string(result.passed_cases()) + "/" +
                 std::to_string(suite.cases.size()) + " case(s) passed");
    return result;
}

}  // namespace grader::harness
