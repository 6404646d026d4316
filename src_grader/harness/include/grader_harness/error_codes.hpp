#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace grader::harness {

enum class ErrorCategory {
    None,
    Suite,
    Parse,
    Env,
    Process,
    Network,
    IO,
    Compare,
    Timeout,
    Unknown,
};

/**
 * \brief Classified outcome attached to every step result.
 *
 * The textual names (see to_string()) are what ends up in the JSON summary
 * and in the console output, so they are stable identifiers.
 */
enum class ErrorCode {
    None,
    Ok,
    Skipped,

    SuiteLoadFailed,
    HeaderMissing,
    NoTestCases,
    StepParseError,

    UnsupportedAction,
    ConfigInvalid,

    ClientExeMissing,
    ServerExeMissing,
    ProcessCrashed,
    ProcessNotRunning,
    KillAllFailed,
    ServerStartTimeout,
    PortNotListening,
    ProxyStartFailed,

    HttpRequestInvalid,
    HttpNonSuccess,
    TcpRelayError,

    FileNotFound,
    ActualFileMissing,
    ActualCaptureMissing,

    TextMismatch,
    JsonMismatch,
    JsonInvalid,
    CsvMismatch,
    FileMismatch,
    HttpMethodMismatch,
    StatusCodeMismatch,
    ByteSizeMismatch,

    Timeout,
    StepTimeout,

    Unknown,
};

struct ErrorInfo {
    std::string_view title;
    std::string_view description;
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;
[[nodiscard]] std::string_view to_string(ErrorCategory category) noexcept;
[[nodiscard]] ErrorCategory category_of(ErrorCode code) noexcept;
[[nodiscard]] ErrorInfo describe(ErrorCode code) noexcept;

/// Passing codes: None, Ok and Skipped.
[[nodiscard]] bool is_success(ErrorCode code) noexcept;

/**
 * \brief Root of the harness exception hierarchy.
 *
 * Carries the classified code so the step boundary can turn any escaping
 * error into a failed StepResult without guessing.
 */
class HarnessError : public std::runtime_error {
public:
    HarnessError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Missing executable, malformed step, bad configuration value.
class ConfigurationError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Spawn failure, crash, kill failure.
class ProcessError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Listener bind failure, relay error, non-success HTTP where required.
class NetworkError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Content mismatch or unparsable JSON.
class ComparisonError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Step deadline or readiness probe exhausted.
class TimeoutError : public HarnessError {
public:
    using HarnessError::HarnessError;
};

/// Process exit status for an error that aborts a run: 2 for configuration or suite
/// problems, 3 for anything else.
[[nodiscard]] int exit_code_for(const std::exception& error) noexcept;

}  // namespace grader::harness
