#include "grader_harness/step.hpp"

#include <array>
#include <utility>

#include "grader_harness/strings.hpp"

namespace {

using grader::harness::Action;
using grader::harness::ValidationKind;

namespace strings = grader::harness::strings;

struct ActionSpelling {
    std::string_view keyword;
    Action action;
};

// Keywords are matched after upper-casing and dropping underscores, dashes and spaces.
constexpr std::array<ActionSpelling, 27> kActionSpellings{{
    {"SERVERSTART", Action::ServerStart},
    {"RUNSERVER", Action::ServerStart},
    {"CLIENTSTART", Action::ClientStart},
    {"RUNCLIENT", Action::ClientStart},
    {"SERVERCLOSE", Action::ServerClose},
    {"STOPSERVER", Action::ServerClose},
    {"CLIENTCLOSE", Action::ClientClose},
    {"STOPCLIENT", Action::ClientClose},
    {"KILLALL", Action::KillAll},
    {"CLEANUPKILL", Action::KillAll},
    {"CLIENTINPUT", Action::ClientInput},
    {"SENDINPUT", Action::ClientInput},
    {"WAIT", Action::Wait},
    {"DELAY", Action::Wait},
    {"WAITFOROUTPUT", Action::WaitForOutput},
    {"HTTPREQUEST", Action::HttpRequest},
    {"ENABLEPROXY", Action::EnableProxy},
    {"TCPRELAY", Action::EnableProxy},
    {"COMPARETEXT", Action::CompareText},
    {"ASSERTTEXT", Action::CompareText},
    {"COMPAREJSON", Action::CompareJson},
    {"ASSERTJSON", Action::CompareJson},
    {"COMPARECSV", Action::CompareCsv},
    {"ASSERTCSV", Action::CompareCsv},
    {"COMPAREFILE", Action::CompareFile},
    {"ASSERTFILE", Action::CompareFile},
    {"FILECOMPARE", Action::CompareFile},
}};

std::string squeeze_keyword(std::string_view raw) {
    std::string result;
    for (char ch : strings::to_upper_copy(strings::trim_copy(raw))) {
        if (ch != '_' && ch != '-' && ch != ' ') {
            result.push_back(ch);
        }
    }
    return result;
}

struct KindName {
    ValidationKind kind;
    std::string_view name;
};

constexpr std::array<KindName, 9> kKindNames{{
    {ValidationKind::None, "NONE"},
    {ValidationKind::HttpMethod, "HTTP_METHOD"},
    {ValidationKind::StatusCode, "STATUS_CODE"},
    {ValidationKind::DataResponse, "DATA_RESPONSE"},
    {ValidationKind::DataRequest, "DATA_REQUEST"},
    {ValidationKind::ByteSize, "BYTE_SIZE"},
    {ValidationKind::ClientOutput, "CLIENT_OUTPUT"},
    {ValidationKind::ServerOutput, "SERVER_OUTPUT"},
    {ValidationKind::DataType, "DATA_TYPE"},
}};

bool contains_infix(std::string_view id, std::string_view infix) {
    return strings::to_upper_copy(id).find(infix) != std::string::npos;
}

}  // namespace

namespace grader::harness {

std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::ServerStart: return "SERVER_START";
        case Action::ClientStart: return "CLIENT_START";
        case Action::ServerClose: return "SERVER_CLOSE";
        case Action::ClientClose: return "CLIENT_CLOSE";
        case Action::KillAll: return "KILL_ALL";
        case Action::ClientInput: return "CLIENT_INPUT";
        case Action::Wait: return "WAIT";
        case Action::WaitForOutput: return "WAIT_FOR_OUTPUT";
        case Action::HttpRequest: return "HTTP_REQUEST";
        case Action::EnableProxy: return "ENABLE_PROXY";
        case Action::CompareText: return "COMPARE_TEXT";
        case Action::CompareJson: return "COMPARE_JSON";
        case Action::CompareCsv: return "COMPARE_CSV";
        case Action::CompareFile: return "COMPARE_FILE";
    }
    return "UNKNOWN";
}

Action parse_action(std::string_view keyword) {
    const auto squeezed = squeeze_keyword(keyword);
    for (const auto& spelling : kActionSpellings) {
        if (spelling.keyword == squeezed) {
            return spelling.action;
        }
    }
    throw ConfigurationError(ErrorCode::UnsupportedAction,
                             "Unsupported action keyword '" + std::string{keyword} + "'");
}

bool is_assertion(Action action) noexcept {
    switch (action) {
        case Action::CompareText:
        case Action::CompareJson:
        case Action::CompareCsv:
        case Action::CompareFile:
            return true;
        default:
            return false;
    }
}

bool is_interaction(Action action) noexcept {
    switch (action) {
        case Action::ClientInput:
        case Action::WaitForOutput:
        case Action::HttpRequest:
            return true;
        default:
            return false;
    }
}

std::string_view to_string(ValidationKind kind) noexcept {
    for (const auto& entry : kKindNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "NONE";
}

std::optional<ValidationKind> parse_validation_kind(std::string_view name) {
    const auto upper = strings::to_upper_copy(strings::trim_copy(name));
    for (const auto& entry : kKindNames) {
        if (entry.name == upper) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

ValidationKind Step::validation_kind() const {
    const auto it = metadata.find(std::string{kValidationTypeKey});
    if (it != metadata.end()) {
        if (auto kind = parse_validation_kind(it->second)) {
            return *kind;
        }
    }

    if (contains_infix(id, "-METHOD-")) return ValidationKind::HttpMethod;
    if (contains_infix(id, "-STATUS-")) return ValidationKind::StatusCode;
    if (contains_infix(id, "-SIZE-")) return ValidationKind::ByteSize;
    if (contains_infix(id, "-DATA-")) return ValidationKind::DataResponse;
    if (contains_infix(id, "-REQ-")) return ValidationKind::DataRequest;
    if (contains_infix(id, "-TYPE-")) return ValidationKind::DataType;
    if (contains_infix(id, "-OUT-")) {
        if (is_client_row()) return ValidationKind::ClientOutput;
        if (is_server_row()) return ValidationKind::ServerOutput;
    }
    return ValidationKind::None;
}

bool Step::is_client_row() const {
    return strings::istarts_with(id, "OC-");
}

bool Step::is_server_row() const {
    return strings::istarts_with(id, "OS-");
}

bool Step::is_graded() const {
    return is_assertion(action) && !strings::iequals(strings::trim_copy(stage), kInputStage);
}

}  // namespace grader::harness
