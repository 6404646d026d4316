/**
 * @file test_suite_orchestrator.cpp
 * @brief Tests for the case lifecycle and all-or-nothing grading
 *
 * Covers:
 *  - Phase order Init, Running, Finalizing, Done and cleanup of processes
 *  - Full mark only when every graded assertion passes
 *  - INPUT-stage assertions recorded without affecting the grade
 *  - Failed non-assertion steps fail the case
 *  - Stale captures of the question dropped at case start
 *  - Settle delays before assertions and between stages
 *  - Suite protocol applied to the executor, cancellation stops the suite
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "grader_harness/suite_orchestrator.hpp"
#include "local_server.hpp"

using grader::harness::Action;
using grader::harness::CancellationToken;
using grader::harness::CasePhase;
using grader::harness::CaptureScope;
using grader::harness::CaptureStore;
using grader::harness::ComparisonEngine;
using grader::harness::ErrorCode;
using grader::harness::ProcessRole;
using grader::harness::ProcessSupervisor;
using grader::harness::ProxyInterceptor;
using grader::harness::ProxyMode;
using grader::harness::Step;
using grader::harness::StepExecutor;
using grader::harness::SuiteDefinition;
using grader::harness::SuiteOrchestrator;
using grader::harness::TestCaseDefinition;

namespace {

using namespace std::chrono_literals;

std::filesystem::path write_script(const std::string& name, const std::string& body) {
    const auto dir = std::filesystem::temp_directory_path() / "grader_orchestrator_tests";
    std::filesystem::create_directories(dir);
    const auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write |
                                     std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);
    return path;
}

std::filesystem::path book_client() {
    return write_script("book_client.sh", "printf 'Book: Dune\\nAuthor: Herbert\\n'\nread choice\n");
}

// Answers well after the input step has stopped waiting for output.
std::filesystem::path slow_answer_client() {
    return write_script("slow_answer_client.sh",
                        "printf 'Choice: '\nread choice\nsleep 0.6\nprintf 'Result: %s\\n' \"$choice\"\nread done\n");
}

struct Rig {
    explicit Rig(SuiteOrchestrator::Config orchestrator_settings = orchestrator_config())
        : supervisor(store, supervisor_config()),
          proxy(store, proxy_config()),
          engine(store, ComparisonEngine::Config{}),
          executor(store, supervisor, proxy, engine, executor_config()),
          orchestrator(store, supervisor, proxy, executor, orchestrator_settings) {}

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
        config.real_port = grader::harness::testing::unused_port();
        config.accept_poll = 20ms;
        config.stop_grace = 500ms;
        return config;
    }

    static StepExecutor::Config executor_config() {
        StepExecutor::Config config;
        config.client_startup_grace = 300ms;
        config.input_output_wait = 200ms;
        config.default_wait = 10ms;
        return config;
    }

    static SuiteOrchestrator::Config orchestrator_config() {
        SuiteOrchestrator::Config config;
        config.step_timeout = 5000ms;
        config.stage_settle_delay = 10ms;
        config.assertion_settle_delay = 50ms;
        return config;
    }

    CaptureStore store;
    ProcessSupervisor supervisor;
    ProxyInterceptor proxy;
    ComparisonEngine engine;
    StepExecutor executor;
    SuiteOrchestrator orchestrator;
};

Step step(const std::string& id, const std::string& stage, Action action, const std::string& target = {}) {
    Step result;
    result.id = id;
    result.question_code = "Q1";
    result.stage = stage;
    result.action = action;
    result.target = target;
    return result;
}

TestCaseDefinition book_case(double mark, std::vector<Step> steps) {
    TestCaseDefinition test_case;
    test_case.name = "TC01";
    test_case.question_code = "Q1";
    test_case.mark = mark;
    test_case.steps = std::move(steps);
    return test_case;
}

}  // namespace

TEST_CASE("Passing case earns the whole mark and cleans up", "[orchestrator][grade]") {
    Rig rig;
    std::vector<CasePhase> phases;
    rig.orchestrator.set_phase_callback([&phases](const std::string&, CasePhase phase) { phases.push_back(phase); });

    const auto test_case = book_case(2.0, {step("C-START-1", "1", Action::ClientStart),
                                           step("OC-OUT-1", "1", Action::CompareText, "Book: Dune"),
                                           step("OC-OUT-2", "1", Action::CompareText, "Author: Herbert")});
    const auto result = rig.orchestrator.run_case(test_case, book_client(), "", CancellationToken{});

    REQUIRE(result.all_passed);
    REQUIRE(result.points_awarded == 2.0);
    REQUIRE(result.points_possible == 2.0);
    REQUIRE(result.steps.size() == 3);
    REQUIRE(result.steps[0].points_possible == 0.0);
    REQUIRE(result.steps[1].points_possible == 1.0);
    REQUIRE(result.steps[2].points_awarded == 1.0);

    REQUIRE(phases == std::vector<CasePhase>{CasePhase::Init, CasePhase::Running, CasePhase::Finalizing,
                                             CasePhase::Done});
    REQUIRE(rig.orchestrator.phase() == CasePhase::Done);
    REQUIRE_FALSE(rig.supervisor.is_running(ProcessRole::Client));
}

TEST_CASE("One failed graded assertion forfeits the whole mark", "[orchestrator][grade]") {
    Rig rig;
    const auto test_case = book_case(2.0, {step("C-START-1", "1", Action::ClientStart),
                                           step("OC-OUT-1", "1", Action::CompareText, "Book: Dune"),
                                           step("OC-OUT-2", "1", Action::CompareText, "Author: Asimov")});
    const auto result = rig.orchestrator.run_case(test_case, book_client(), "", CancellationToken{});

    REQUIRE_FALSE(result.all_passed);
    REQUIRE(result.points_awarded == 0.0);
    REQUIRE(result.points_possible == 2.0);
    REQUIRE(result.steps[1].passed);
    REQUIRE(result.steps[1].points_awarded == 0.0);
    REQUIRE(result.steps[2].code == ErrorCode::TextMismatch);
}

TEST_CASE("INPUT-stage assertions never change the grade", "[orchestrator][grade][input]") {
    Rig rig;
    const auto test_case = book_case(1.0, {step("C-START-1", "INPUT", Action::ClientStart),
                                           step("OC-OUT-0", "INPUT", Action::CompareText, "no such line"),
                                           step("OC-OUT-1", "1", Action::CompareText, "Book: Dune")});
    const auto result = rig.orchestrator.run_case(test_case, book_client(), "", CancellationToken{});

    REQUIRE_FALSE(result.steps[1].passed);
    REQUIRE(result.steps[1].points_possible == 0.0);
    // Stage 1 has no output of its own; the whole question is searched.
    REQUIRE(result.steps[2].passed);
    REQUIRE(result.all_passed);
    REQUIRE(result.points_awarded == 1.0);
}

TEST_CASE("Failed action steps fail the case", "[orchestrator][grade][action]") {
    Rig rig;
    auto input = step("C-IN-1", "1", Action::ClientInput);
    input.value = "1";
    const auto result = rig.orchestrator.run_case(book_case(3.0, {input}), book_client(), "", CancellationToken{});

    REQUIRE(result.steps[0].code == ErrorCode::ProcessNotRunning);
    REQUIRE_FALSE(result.all_passed);
    REQUIRE(result.points_awarded == 0.0);
}

TEST_CASE("Captures of earlier runs are dropped at case start", "[orchestrator][captures]") {
    Rig rig;
    rig.store.append(CaptureScope::Clients, "Q1", "1", "Book: Dune\n");
    rig.store.append(CaptureScope::Clients, "Q2", "1", "kept");

    const auto result = rig.orchestrator.run_case(
        book_case(1.0, {step("OC-OUT-1", "1", Action::CompareText, "Book: Dune")}), book_client(), "",
        CancellationToken{});

    REQUIRE_FALSE(result.all_passed);
    REQUIRE(result.steps[0].code == ErrorCode::ActualCaptureMissing);
    REQUIRE(rig.store.try_get(CaptureScope::Clients, "Q2", "1") == std::optional<std::string>{"kept"});
}

TEST_CASE("Assertions after input wait for late output", "[orchestrator][settle]") {
    auto input = step("C-IN-1", "1", Action::ClientInput);
    input.value = "42";
    const auto test_case = book_case(1.0, {step("C-START-1", "1", Action::ClientStart), input,
                                           step("OC-OUT-1", "1", Action::CompareText, "Result: 42")});

    SECTION("settle delay covers the late answer") {
        auto settings = Rig::orchestrator_config();
        settings.assertion_settle_delay = 1500ms;
        Rig rig(settings);
        const auto result = rig.orchestrator.run_case(test_case, slow_answer_client(), "", CancellationToken{});
        REQUIRE(result.steps[1].passed);
        REQUIRE(result.steps[2].passed);
        REQUIRE(result.all_passed);
    }

    SECTION("without a settle delay the answer is missed") {
        auto settings = Rig::orchestrator_config();
        settings.assertion_settle_delay = 0ms;
        Rig rig(settings);
        const auto result = rig.orchestrator.run_case(test_case, slow_answer_client(), "", CancellationToken{});
        REQUIRE(result.steps[1].passed);
        REQUIRE_FALSE(result.steps[2].passed);
        REQUIRE_FALSE(result.all_passed);
    }
}

TEST_CASE("Stage changes add the stage settle delay", "[orchestrator][settle]") {
    auto settings = Rig::orchestrator_config();
    settings.stage_settle_delay = 300ms;
    Rig rig(settings);

    auto first = step("W-1", "1", Action::Wait);
    first.value = "0";
    auto same_stage = step("W-2", "1", Action::Wait);
    same_stage.value = "0";
    auto next_stage = step("W-3", "2", Action::Wait);
    next_stage.value = "0";

    auto started = std::chrono::steady_clock::now();
    auto result = rig.orchestrator.run_case(book_case(1.0, {first, same_stage}), book_client(), "",
                                            CancellationToken{});
    REQUIRE(result.all_passed);
    REQUIRE(std::chrono::steady_clock::now() - started < 300ms);

    started = std::chrono::steady_clock::now();
    result = rig.orchestrator.run_case(book_case(1.0, {first, next_stage}), book_client(), "", CancellationToken{});
    REQUIRE(result.all_passed);
    REQUIRE(std::chrono::steady_clock::now() - started >= 300ms);
}

TEST_CASE("Suite applies its protocol and totals the cases", "[orchestrator][suite]") {
    Rig rig;
    SuiteDefinition suite;
    suite.name = "waits";
    suite.protocol = ProxyMode::Tcp;
    for (const auto* name : {"A", "B"}) {
        auto test_case = book_case(1.5, {step("W-1", "1", Action::Wait)});
        test_case.name = name;
        suite.cases.push_back(test_case);
    }

    const auto result = rig.orchestrator.run_suite(suite, book_client(), "", CancellationToken{});
    REQUIRE(rig.executor.config().protocol == ProxyMode::Tcp);
    REQUIRE(result.suite == "waits");
    REQUIRE(result.cases.size() == 2);
    REQUIRE(result.passed_cases() == 2);
    REQUIRE(result.points_awarded == 3.0);
    REQUIRE(result.points_possible == 3.0);
    REQUIRE(result.all_passed());
    REQUIRE_FALSE(result.cancelled);
}

TEST_CASE("Cancellation stops the suite", "[orchestrator][suite][cancel]") {
    Rig rig;
    SuiteDefinition suite;
    suite.name = "cancelled";
    for (const auto* name : {"A", "B"}) {
        auto test_case = book_case(1.0, {step("W-1", "1", Action::Wait)});
        test_case.name = name;
        suite.cases.push_back(test_case);
    }

    SECTION("before the first case") {
        const CancellationToken token;
        token.cancel();
        const auto result = rig.orchestrator.run_suite(suite, book_client(), "", token);
        REQUIRE(result.cancelled);
        REQUIRE(result.cases.empty());
        REQUIRE_FALSE(result.all_passed());
    }

    SECTION("while the first case runs") {
        const CancellationToken token;
        rig.orchestrator.set_phase_callback([&token](const std::string&, CasePhase phase) {
            if (phase == CasePhase::Running) {
                token.cancel();
            }
        });
        const auto result = rig.orchestrator.run_suite(suite, book_client(), "", token);
        REQUIRE(result.cancelled);
        REQUIRE(result.cases.size() == 1);
        REQUIRE(result.cases[0].steps.empty());
        REQUIRE_FALSE(result.cases[0].all_passed);
        REQUIRE(result.points_awarded == 0.0);
    }
}
