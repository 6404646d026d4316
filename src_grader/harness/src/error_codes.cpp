#include "grader_harness/error_codes.hpp"

#include <array>

namespace {

using grader::harness::ErrorCategory;
using grader::harness::ErrorCode;

struct Entry {
    ErrorCode code;
    ErrorCategory category;
    std::string_view name;
    std::string_view title;
    std::string_view description;
};

constexpr std::array kEntries = {
    Entry{ErrorCode::None, ErrorCategory::None, "NONE", "No error", "The step completed without issues."},
    Entry{ErrorCode::Ok, ErrorCategory::None, "OK", "Passed", "The step passed."},
    Entry{ErrorCode::Skipped, ErrorCategory::None, "SKIPPED", "Skipped",
          "The step was skipped by the grading configuration."},

    Entry{ErrorCode::SuiteLoadFailed, ErrorCategory::Suite, "SUITE_LOAD_FAILED", "Suite load failed",
          "The suite definition could not be read."},
    Entry{ErrorCode::HeaderMissing, ErrorCategory::Suite, "HEADER_MISSING", "Suite header missing",
          "The suite file has no header block naming the suite."},
    Entry{ErrorCode::NoTestCases, ErrorCategory::Suite, "NO_TEST_CASES", "No test cases",
          "The suite does not define any test case."},
    Entry{ErrorCode::StepParseError, ErrorCategory::Suite, "STEP_PARSE_ERROR", "Step parse error",
          "A step row is malformed."},

    Entry{ErrorCode::UnsupportedAction, ErrorCategory::Parse, "UNSUPPORTED_ACTION", "Unsupported action",
          "The step action keyword is not recognised."},
    Entry{ErrorCode::ConfigInvalid, ErrorCategory::Parse, "CONFIG_INVALID", "Invalid configuration",
          "A configuration value has the wrong type or range."},

    Entry{ErrorCode::ClientExeMissing, ErrorCategory::Process, "CLIENT_EXE_MISSING", "Client executable missing",
          "The client executable path is empty, missing or not executable."},
    Entry{ErrorCode::ServerExeMissing, ErrorCategory::Process, "SERVER_EXE_MISSING", "Server executable missing",
          "The server executable path is empty, missing or not executable."},
    Entry{ErrorCode::ProcessCrashed, ErrorCategory::Process, "PROCESS_CRASHED", "Process exited",
          "The process under test exited while it was still needed."},
    Entry{ErrorCode::ProcessNotRunning, ErrorCategory::Process, "PROCESS_NOT_RUNNING", "Process not running",
          "The step needs a running process but none is alive."},
    Entry{ErrorCode::KillAllFailed, ErrorCategory::Process, "KILL_ALL_FAILED", "Kill failed",
          "One of the processes could not be terminated."},
    Entry{ErrorCode::ServerStartTimeout, ErrorCategory::Process, "SERVER_START_TIMEOUT", "Server start timeout",
          "The server did not become ready in time."},
    Entry{ErrorCode::PortNotListening, ErrorCategory::Process, "PORT_NOT_LISTENING", "Port not listening",
          "Nothing accepts connections on the expected port."},
    Entry{ErrorCode::ProxyStartFailed, ErrorCategory::Process, "PROXY_START_FAILED", "Proxy start failed",
          "The forwarding listener could not bind its port."},

    Entry{ErrorCode::HttpRequestInvalid, ErrorCategory::Network, "HTTP_REQUEST_INVALID", "Invalid HTTP request",
          "The HTTP request step value is malformed."},
    Entry{ErrorCode::HttpNonSuccess, ErrorCategory::Network, "HTTP_NON_SUCCESS", "Unexpected HTTP status",
          "The HTTP call returned a status other than the required one."},
    Entry{ErrorCode::TcpRelayError, ErrorCategory::Network, "TCP_RELAY_ERROR", "Relay error",
          "The proxy could not reach the real server."},

    Entry{ErrorCode::FileNotFound, ErrorCategory::IO, "FILE_NOT_FOUND", "File not found",
          "A referenced file does not exist."},
    Entry{ErrorCode::ActualFileMissing, ErrorCategory::IO, "ACTUAL_FILE_MISSING", "Actual file missing",
          "The file holding the actual value does not exist."},
    Entry{ErrorCode::ActualCaptureMissing, ErrorCategory::IO, "ACTUAL_CAPTURE_MISSING", "Actual value not captured",
          "An expected value was provided but nothing was captured to compare it with."},

    Entry{ErrorCode::TextMismatch, ErrorCategory::Compare, "TEXT_MISMATCH", "Text mismatch",
          "The captured text does not match the expected text."},
    Entry{ErrorCode::JsonMismatch, ErrorCategory::Compare, "JSON_MISMATCH", "JSON mismatch",
          "The JSON documents differ after canonicalisation."},
    Entry{ErrorCode::JsonInvalid, ErrorCategory::Compare, "JSON_INVALID", "Invalid JSON",
          "One side of a JSON comparison does not parse."},
    Entry{ErrorCode::CsvMismatch, ErrorCategory::Compare, "CSV_MISMATCH", "CSV mismatch",
          "The CSV content differs."},
    Entry{ErrorCode::FileMismatch, ErrorCategory::Compare, "FILE_MISMATCH", "File mismatch",
          "The file content differs."},
    Entry{ErrorCode::HttpMethodMismatch, ErrorCategory::Compare, "HTTP_METHOD_MISMATCH", "HTTP method mismatch",
          "The intercepted request used a different method."},
    Entry{ErrorCode::StatusCodeMismatch, ErrorCategory::Compare, "STATUS_CODE_MISMATCH", "Status code mismatch",
          "The intercepted response carried a different status."},
    Entry{ErrorCode::ByteSizeMismatch, ErrorCategory::Compare, "BYTE_SIZE_MISMATCH", "Byte size mismatch",
          "The payload size is outside the tolerance."},

    Entry{ErrorCode::Timeout, ErrorCategory::Timeout, "TIMEOUT", "Timeout",
          "The awaited output did not appear in time."},
    Entry{ErrorCode::StepTimeout, ErrorCategory::Timeout, "STEP_TIMEOUT", "Step timeout",
          "The step did not finish before its deadline."},

    Entry{ErrorCode::Unknown, ErrorCategory::Unknown, "UNKNOWN", "Unknown error",
          "An unexpected error occurred."},
};

const Entry& lookup(ErrorCode code) noexcept {
    for (const auto& entry : kEntries) {
        if (entry.code == code) {
            return entry;
        }
    }
    return kEntries.back();
}

}  // namespace

namespace grader::harness {

std::string_view to_string(ErrorCode code) noexcept {
    return lookup(code).name;
}

std::string_view to_string(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:
            return "None";
        case ErrorCategory::Suite:
            return "Suite";
        case ErrorCategory::Parse:
            return "Parse";
        case ErrorCategory::Env:
            return "Env";
        case ErrorCategory::Process:
            return "Process";
        case ErrorCategory::Network:
            return "Network";
        case ErrorCategory::IO:
            return "IO";
        case ErrorCategory::Compare:
            return "Compare";
        case ErrorCategory::Timeout:
            return "Timeout";
        case ErrorCategory::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

ErrorCategory category_of(ErrorCode code) noexcept {
    return lookup(code).category;
}

ErrorInfo describe(ErrorCode code) noexcept {
    const auto& entry = lookup(code);
    return ErrorInfo{entry.title, entry.description};
}

bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::None || code == ErrorCode::Ok || code == ErrorCode::Skipped;
}

HarnessError::HarnessError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

int exit_code_for(const std::exception& error) noexcept {
    return dynamic_cast<const ConfigurationError*>(&error) != nullptr ? 2 : 3;
}

}  // namespace grader::harness
