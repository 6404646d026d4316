#pragma once

#include <optional>
#include <string_view>

#include "grader_harness/step.hpp"

namespace grader::harness {

enum class GradingMode {
    Default,
    Client,
    Server,
    Console,
    Http,
};

[[nodiscard]] std::string_view to_string(GradingMode mode) noexcept;
[[nodiscard]] std::optional<GradingMode> parse_grading_mode(std::string_view name);

/**
 * \brief Toggles selecting which assertions count.
 *
 * A disabled validation still produces a passing StepResult ("skipped by
 * config") so the report keeps every row.
 */
struct GradingConfig {
    bool grade_client_steps{true};
    bool grade_server_steps{true};
    bool validate_client_output{true};
    bool validate_server_output{true};
    bool validate_data_response{true};
    bool validate_data_request{true};
    bool validate_http_method{true};
    bool validate_status_code{true};
    bool validate_byte_size{false};
    bool validate_data_type{true};

    [[nodiscard]] static GradingConfig preset(GradingMode mode);

    [[nodiscard]] bool is_enabled(ValidationKind kind) const noexcept;

    /// OC- rows follow grade_client_steps, OS- rows grade_server_steps, anything else is graded.
    [[nodiscard]] bool should_grade(const Step& step) const;
};

}  // namespace grader::harness
