#include "grader_harness/report_writer.hpp"

#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "grader_harness/error_codes.hpp"

namespace {

using nlohmann::json;
using grader::harness::CaseResult;
using grader::harness::StepResult;
using grader::harness::SuiteResult;

json step_to_json(const StepResult& result) {
    json step = {
        {"id", result.step.id},
        {"question", result.step.question_code},
        {"stage", result.step.stage},
        {"action", grader::harness::to_string(result.step.action)},
        {"status", grader::harness::step_status(result)},
        {"passed", result.passed},
        {"code", grader::harness::to_string(result.code)},
        {"category", grader::harness::to_string(grader::harness::category_of(result.code))},
        {"message", result.message},
        {"duration_ms", result.duration_ms},
        {"points_awarded", result.points_awarded},
        {"points_possible", result.points_possible},
    };
    if (result.diff_index) {
        step["diff_index"] = *result.diff_index;
        step["expected_excerpt"] = result.expected_excerpt;
        step["actual_excerpt"] = result.actual_excerpt;
    }
    return step;
}

json case_to_json(const CaseResult& result) {
    json steps = json::array();
    for (const auto& step : result.steps) {
        steps.push_back(step_to_json(step));
    }
    return json{
        {"name", result.name},
        {"question", result.question_code},
        {"status", result.all_passed ? "PASS" : "FAIL"},
        {"points_awarded", result.points_awarded},
        {"points_possible", result.points_possible},
        {"steps", std::move(steps)},
    };
}

json build_summary(const std::vector<SuiteResult>& suites) {
    json summary = {
        {"suites", json::array()},
        {"totals", json::object()},
    };

    std::size_t case_count = 0;
    std::size_t passed_cases = 0;
    double awarded = 0.0;
    double possible = 0.0;
    std::map<std::string, std::size_t> by_code;

    for (const auto& suite : suites) {
        json cases = json::array();
        for (const auto& case_result : suite.cases) {
            cases.push_back(case_to_json(case_result));
            ++case_count;
            if (case_result.all_passed) {
                ++passed_cases;
            }
            for (const auto& step : case_result.steps) {
                ++by_code[std::string{grader::harness::to_string(step.code)}];
            }
        }
        awarded += suite.points_awarded;
        possible += suite.points_possible;

        summary["suites"].push_back(json{
            {"suite", suite.suite},
            {"cancelled", suite.cancelled},
            {"points_awarded", suite.points_awarded},
            {"points_possible", suite.points_possible},
            {"cases", std::move(cases)},
        });
    }

    summary["totals"] = json{
        {"cases", case_count},
        {"passed_cases", passed_cases},
        {"failed_cases", case_count - passed_cases},
        {"points_awarded", awarded},
        {"points_possible", possible},
        {"by_code", by_code},
    };
    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string format_points(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string diff_to_html(const StepResult& result) {
    if (!result.diff_index) {
        return {};
    }
    std::ostringstream oss;
    oss << "<div class=\"diff\">first difference at " << *result.diff_index << "<br/>"
        << "expected: <code>" << escape_html(result.expected_excerpt) << "</code><br/>"
        << "actual: <code>" << escape_html(result.actual_excerpt) << "</code></div>";
    return oss.str();
}

std::string render_html(const std::vector<SuiteResult>& suites) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Grading Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;margin-bottom:2rem;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "code{white-space:pre-wrap;}"
        << ".diff{margin-top:0.5rem;font-size:0.9em;color:#555;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-SKIP{color:#7a7a7a;}"
        << "</style></head><body>";

    oss << "<h1>Grading Report</h1>";

    std::size_t case_count = 0;
    std::size_t passed_cases = 0;
    double awarded = 0.0;
    double possible = 0.0;
    for (const auto& suite : suites) {
        case_count += suite.cases.size();
        passed_cases += suite.passed_cases();
        awarded += suite.points_awarded;
        possible += suite.points_possible;
    }

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Test cases: " << case_count << "</li>";
    oss << "<li>PASS: " << passed_cases << "</li>";
    oss << "<li>FAIL: " << (case_count - passed_cases) << "</li>";
    oss << "<li>Points: " << format_points(awarded) << " / " << format_points(possible) << "</li>";
    oss << "</ul></section>";

    for (const auto& suite : suites) {
        oss << "<section><h2>" << escape_html(suite.suite) << (suite.cancelled ? " (cancelled)" : "") << "</h2>";
        for (const auto& case_result : suite.cases) {
            const std::string case_status = case_result.all_passed ? "PASS" : "FAIL";
            oss << "<h3>" << escape_html(case_result.name) << " <span class=\"status-" << case_status << "\">"
                << case_status << "</span> " << format_points(case_result.points_awarded) << " / "
                << format_points(case_result.points_possible) << "</h3>";

            oss << "<table><thead><tr>"
                << "<th>#</th>"
                << "<th>Step</th>"
                << "<th>Stage</th>"
                << "<th>Action</th>"
                << "<th>Status</th>"
                << "<th>Code</th>"
                << "<th>Message</th>"
                << "<th>Points</th>"
                << "<th>Duration (ms)</th>"
                << "</tr></thead><tbody>";

            for (std::size_t index = 0; index < case_result.steps.size(); ++index) {
                const auto& step = case_result.steps[index];
                const std::string status{grader::harness::step_status(step)};

                oss << "<tr>";
                oss << "<td>" << (index + 1) << "</td>";
                oss << "<td>" << escape_html(step.step.id) << "</td>";
                oss << "<td>" << escape_html(step.step.stage) << "</td>";
                oss << "<td>" << grader::harness::to_string(step.step.action) << "</td>";
                oss << "<td class=\"status-" << status << "\">" << status << "</td>";
                oss << "<td>" << grader::harness::to_string(step.code) << "</td>";
                oss << "<td>" << escape_html(step.message) << diff_to_html(step) << "</td>";
                oss << "<td>" << format_points(step.points_awarded) << " / " << format_points(step.points_possible)
                    << "</td>";
                oss << "<td>" << static_cast<long long>(step.duration_ms) << "</td>";
                oss << "</tr>";
            }
            oss << "</tbody></table>";
        }
        oss << "</section>";
    }

    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace grader::harness {

std::string_view step_status(const StepResult& result) noexcept {
    if (!result.passed) {
        return "FAIL";
    }
    return result.code == ErrorCode::Skipped ? "SKIP" : "PASS";
}

void ReportWriter::write_summary(const std::filesystem::path& destination,
                                 const std::vector<SuiteResult>& suites) const {
    const json summary = build_summary(suites);
    write_file(destination, summary.dump(2));
}

void ReportWriter::write_detailed(const std::filesystem::path& destination,
                                  const std::vector<SuiteResult>& suites) const {
    const auto html = render_html(suites);
    write_file(destination, html);
}

}  // namespace grader::harness
