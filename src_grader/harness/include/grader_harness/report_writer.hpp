#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "grader_harness/suite_orchestrator.hpp"

namespace grader::harness {

/// PASS, FAIL or SKIP (passing steps whose code is Skipped).
[[nodiscard]] std::string_view step_status(const StepResult& result) noexcept;

/**
 * \brief Emits machine-readable and human-friendly grade reports.
 *
 * - write_summary(): JSON document with per-suite, per-case and per-step results plus totals.
 * - write_detailed(): HTML report with one table row per executed step.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    void write_summary(const std::filesystem::path& destination, const std::vector<SuiteResult>& suites) const;

    void write_detailed(const std::filesystem::path& destination, const std::vector<SuiteResult>& suites) const;
};

}  // namespace grader::harness
