#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "capture_store.hpp"
#include "error_codes.hpp"
#include "value_reference.hpp"

namespace grader::harness {

/// Which rung of the ladder decided the verdict.
enum class MatchLevel {
    None,
    Ignored,
    Exact,
    Containment,
    AggressiveExact,
    AggressiveContainment,
};

[[nodiscard]] std::string_view to_string(MatchLevel level) noexcept;

struct ComparisonOutcome {
    bool passed{false};
    ErrorCode code{ErrorCode::None};
    MatchLevel level{MatchLevel::None};
    std::string message;

    /// First diverging index of the normalised strings; -1 when not applicable.
    long long diff_index{-1};
    std::string expected_excerpt;
    std::string actual_excerpt;
};

/// |actual-expected| <= abs_tolerance, or relative difference <= pct_tolerance.
[[nodiscard]] bool within_byte_tolerance(std::size_t expected,
                                         std::size_t actual,
                                         std::size_t abs_tolerance,
                                         double pct_tolerance) noexcept;

/**
 * Maps numeric and phrase forms of an HTTP status onto one representative,
 * e.g. "200", "OK" and "200 OK" all become "200". Unknown phrases come back
 * upper-cased with spaces and underscores removed.
 */
[[nodiscard]] std::string canonical_status(std::string_view status);

/// Broad payload classification: JSON, CSV, TEXT, XML, BINARY or EMPTY.
[[nodiscard]] std::string classify_payload(std::string_view payload);

/**
 * \brief Decides PASS/FAIL for one expected/actual pair.
 *
 * Policy shared by all modes: a blank or unavailable expected value passes as
 * "ignored"; an unavailable actual value with a defined expectation fails.
 *
 * Text mode evaluates four fallbacks in order and stops at the first match:
 *  1. normalised equality
 *  2. normalised containment (console captures only)
 *  3. equality after aggressive stripping
 *  4. containment after aggressive stripping (console captures only)
 * Console captures that are blank for the requested stage fall back to the
 * concatenation of every stage of the question.
 */
class ComparisonEngine {
public:
    struct Config {
        bool case_insensitive{true};
        bool sort_arrays_in_text{false};
        bool json_ignore_array_order{true};
        std::size_t excerpt_context{24};
        std::size_t byte_size_abs_tolerance{10};
        double byte_size_pct_tolerance{0.05};
    };

    ComparisonEngine(const CaptureStore& store, Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] ComparisonOutcome compare_text(const ValueReference& expected,
                                                 const ValueReference& actual) const;

    [[nodiscard]] ComparisonOutcome compare_json(const ValueReference& expected,
                                                 const ValueReference& actual,
                                                 std::optional<bool> ignore_array_order = std::nullopt) const;

    [[nodiscard]] ComparisonOutcome compare_csv(const ValueReference& expected,
                                                const ValueReference& actual) const;

    [[nodiscard]] ComparisonOutcome compare_file(const ValueReference& expected,
                                                 const ValueReference& actual) const;

    [[nodiscard]] ComparisonOutcome compare_http_method(std::string_view expected,
                                                        std::string_view actual) const;

    [[nodiscard]] ComparisonOutcome compare_status_code(std::string_view expected, int actual) const;

    [[nodiscard]] ComparisonOutcome compare_byte_size(std::string_view expected, std::size_t actual) const;

    [[nodiscard]] ComparisonOutcome compare_data_type(std::string_view expected,
                                                      const ValueReference& actual) const;

private:
    struct Sides {
        bool expected_available{false};
        std::string expected;
        bool actual_available{false};
        std::string actual;
    };

    Sides resolve_sides(const ValueReference& expected, const ValueReference& actual, bool console_fallback) const;

    ComparisonOutcome mismatch(ErrorCode code,
                               const std::string& message,
                               const std::string& expected,
                               const std::string& actual) const;

    const CaptureStore& store_;
    Config config_;
};

}  // namespace grader::harness
