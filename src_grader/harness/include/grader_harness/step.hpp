#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "grader_harness/error_codes.hpp"

namespace grader::harness {

/**
 * \brief Closed set of step actions.
 *
 * Lifecycle: ServerStart, ClientStart, ServerClose, ClientClose, KillAll.
 * Interaction: ClientInput, Wait, WaitForOutput.
 * Network: HttpRequest, EnableProxy.
 * Assertion: CompareText, CompareJson, CompareCsv, CompareFile.
 */
enum class Action {
    ServerStart,
    ClientStart,
    ServerClose,
    ClientClose,
    KillAll,
    ClientInput,
    Wait,
    WaitForOutput,
    HttpRequest,
    EnableProxy,
    CompareText,
    CompareJson,
    CompareCsv,
    CompareFile,
};

[[nodiscard]] std::string_view to_string(Action action) noexcept;

/**
 * Accepts the suite keyword spellings, case-insensitively and with or
 * without underscores (`SERVERSTART`, `SERVER_START`, `CLIENT_INPUT`,
 * `TCP_RELAY`, `ASSERT_TEXT`, ...). Throws ConfigurationError
 * (UnsupportedAction) for anything else.
 */
[[nodiscard]] Action parse_action(std::string_view keyword);

[[nodiscard]] bool is_assertion(Action action) noexcept;

/// Steps after which asynchronous side effects may still be in flight.
[[nodiscard]] bool is_interaction(Action action) noexcept;

/// What an assertion step validates; drives default actual values and grading toggles.
enum class ValidationKind {
    None,
    HttpMethod,
    StatusCode,
    DataResponse,
    DataRequest,
    ByteSize,
    ClientOutput,
    ServerOutput,
    DataType,
};

/// Metadata spelling: HTTP_METHOD, STATUS_CODE, DATA_RESPONSE, ...
[[nodiscard]] std::string_view to_string(ValidationKind kind) noexcept;
[[nodiscard]] std::optional<ValidationKind> parse_validation_kind(std::string_view name);

/// Stage label of input rows; their assertions are recorded but never graded.
inline constexpr std::string_view kInputStage = "INPUT";

/// Metadata key naming the validation of an assertion step.
inline constexpr std::string_view kValidationTypeKey = "ValidationType";

struct Step {
    std::string id;
    std::string question_code;
    std::string stage;
    Action action{Action::Wait};
    /// Expected value reference (literal, capture URI or file path).
    std::string target;
    /// Literal payload, or an explicit actual value reference for assertions.
    std::string value;
    std::optional<std::string> http_method;
    std::optional<std::string> status_code;
    std::optional<std::string> byte_size;
    std::optional<std::string> data_type;
    std::map<std::string, std::string> metadata;

    /// From the ValidationType metadata, else from the id infix (-METHOD-, -STATUS-, -SIZE-, -DATA-, -REQ-, -OUT-).
    [[nodiscard]] ValidationKind validation_kind() const;

    [[nodiscard]] bool is_client_row() const;
    [[nodiscard]] bool is_server_row() const;

    /// Assertion outside the INPUT stage.
    [[nodiscard]] bool is_graded() const;
};

struct StepResult {
    Step step;
    bool passed{false};
    std::string message;
    double duration_ms{0.0};
    ErrorCode code{ErrorCode::None};
    std::optional<long long> diff_index;
    std::string expected_excerpt;
    std::string actual_excerpt;
    double points_awarded{0.0};
    double points_possible{0.0};
};

struct TestCaseDefinition {
    std::string name;
    std::string question_code;
    double mark{0.0};
    std::vector<Step> steps;
};

struct CaseResult {
    std::string name;
    std::string question_code;
    bool all_passed{false};
    double points_awarded{0.0};
    double points_possible{0.0};
    std::vector<StepResult> steps;
};

}  // namespace grader::harness
