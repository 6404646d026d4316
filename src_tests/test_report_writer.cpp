/**
 * @file test_report_writer.cpp
 * @brief Tests for the JSON summary and the HTML report
 *
 * Covers:
 *  - PASS / FAIL / SKIP step status
 *  - Summary layout, totals and per-code counts
 *  - Diff details only for steps that carry a difference
 *  - HTML escaping of captured text, parent directory creation
 */

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "grader_harness/report_writer.hpp"

using grader::harness::Action;
using grader::harness::CaseResult;
using grader::harness::ErrorCode;
using grader::harness::ReportWriter;
using grader::harness::StepResult;
using grader::harness::SuiteResult;

namespace {

StepResult make_result(const std::string& id, Action action, bool passed, ErrorCode code) {
    StepResult result;
    result.step.id = id;
    result.step.question_code = "Q1";
    result.step.stage = "1";
    result.step.action = action;
    result.passed = passed;
    result.code = code;
    result.message = passed ? "ok" : "Text mismatch in client output";
    result.duration_ms = 12.5;
    return result;
}

std::vector<SuiteResult> sample_results() {
    auto start = make_result("C-START-1", Action::ClientStart, true, ErrorCode::Ok);
    auto skipped = make_result("OS-OUT-1", Action::CompareText, true, ErrorCode::Skipped);
    auto mismatch = make_result("OC-OUT-1", Action::CompareText, false, ErrorCode::TextMismatch);
    mismatch.diff_index = 6;
    mismatch.expected_excerpt = "book: <dune>";
    mismatch.actual_excerpt = "book: neuromancer";
    mismatch.points_possible = 1.0;

    CaseResult failing;
    failing.name = "TC01";
    failing.question_code = "Q1";
    failing.points_possible = 1.0;
    failing.steps = {start, skipped, mismatch};

    CaseResult passing;
    passing.name = "TC02";
    passing.question_code = "Q2";
    passing.all_passed = true;
    passing.points_awarded = 2.0;
    passing.points_possible = 2.0;
    passing.steps = {start};

    SuiteResult suite;
    suite.suite = "books_http";
    suite.cases = {failing, passing};
    suite.points_awarded = 2.0;
    suite.points_possible = 3.0;
    return {suite};
}

std::string read_all(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

std::filesystem::path output_dir() {
    const auto dir = std::filesystem::temp_directory_path() / "grader_report_tests";
    std::filesystem::remove_all(dir);
    return dir;
}

}  // namespace

TEST_CASE("Step status distinguishes skips from passes", "[report][status]") {
    REQUIRE(grader::harness::step_status(make_result("a", Action::Wait, true, ErrorCode::Ok)) == "PASS");
    REQUIRE(grader::harness::step_status(make_result("a", Action::CompareText, true, ErrorCode::Skipped)) ==
            "SKIP");
    REQUIRE(grader::harness::step_status(make_result("a", Action::CompareText, false, ErrorCode::Skipped)) ==
            "FAIL");
}

TEST_CASE("Summary JSON carries suites, cases, steps and totals", "[report][json]") {
    const auto path = output_dir() / "nested" / "summary.json";
    ReportWriter{}.write_summary(path, sample_results());
    REQUIRE(std::filesystem::exists(path));

    const auto summary = nlohmann::json::parse(read_all(path));
    const auto& suite = summary.at("suites").at(0);
    REQUIRE(suite.at("suite") == "books_http");
    REQUIRE(suite.at("cancelled") == false);
    REQUIRE(suite.at("points_possible") == 3.0);

    const auto& failing = suite.at("cases").at(0);
    REQUIRE(failing.at("status") == "FAIL");
    REQUIRE(failing.at("steps").size() == 3);

    const auto& start = failing.at("steps").at(0);
    REQUIRE(start.at("action") == "CLIENT_START");
    REQUIRE(start.at("status") == "PASS");
    REQUIRE_FALSE(start.contains("diff_index"));

    REQUIRE(failing.at("steps").at(1).at("status") == "SKIP");

    const auto& mismatch = failing.at("steps").at(2);
    REQUIRE(mismatch.at("code") == "TEXT_MISMATCH");
    REQUIRE(mismatch.at("category") == "Compare");
    REQUIRE(mismatch.at("diff_index") == 6);
    REQUIRE(mismatch.at("expected_excerpt") == "book: <dune>");
    REQUIRE(mismatch.at("points_possible") == 1.0);

    const auto& totals = summary.at("totals");
    REQUIRE(totals.at("cases") == 2);
    REQUIRE(totals.at("passed_cases") == 1);
    REQUIRE(totals.at("failed_cases") == 1);
    REQUIRE(totals.at("points_awarded") == 2.0);
    REQUIRE(totals.at("by_code").at("OK") == 2);
    REQUIRE(totals.at("by_code").at("SKIPPED") == 1);
    REQUIRE(totals.at("by_code").at("TEXT_MISMATCH") == 1);
}

TEST_CASE("HTML report escapes captured text", "[report][html]") {
    const auto path = output_dir() / "report.html";
    ReportWriter{}.write_detailed(path, sample_results());
    const auto html = read_all(path);

    REQUIRE(html.rfind("<!DOCTYPE html>", 0) == 0);
    REQUIRE(html.find("<li>Test cases: 2</li>") != std::string::npos);
    REQUIRE(html.find("<li>Points: 2.00 / 3.00</li>") != std::string::npos);
    REQUIRE(html.find("class=\"status-SKIP\">SKIP<") != std::string::npos);
    REQUIRE(html.find("book: &lt;dune&gt;") != std::string::npos);
    REQUIRE(html.find("<dune>") == std::string::npos);
    REQUIRE(html.find("first difference at 6") != std::string::npos);
}

TEST_CASE("Unwritable destination throws", "[report][io]") {
    const auto dir = output_dir();
    std::filesystem::create_directories(dir / "taken");
    REQUIRE_THROWS_AS(ReportWriter{}.write_summary(dir / "taken", sample_results()), std::runtime_error);
}
