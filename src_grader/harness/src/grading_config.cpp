#include "grader_harness/grading_config.hpp"

#include "grader_harness/strings.hpp"

namespace grader::harness {

std::string_view to_string(GradingMode mode) noexcept {
    switch (mode) {
        case GradingMode::Default: return "DEFAULT";
        case GradingMode::Client: return "CLIENT";
        case GradingMode::Server: return "SERVER";
        case GradingMode::Console: return "CONSOLE";
        case GradingMode::Http: return "HTTP";
    }
    return "DEFAULT";
}

std::optional<GradingMode> parse_grading_mode(std::string_view name) {
    const auto upper = strings::to_upper_copy(strings::trim_copy(name));
    if (upper.empty() || upper == "DEFAULT") return GradingMode::Default;
    if (upper == "CLIENT") return GradingMode::Client;
    if (upper == "SERVER") return GradingMode::Server;
    if (upper == "CONSOLE") return GradingMode::Console;
    if (upper == "HTTP") return GradingMode::Http;
    return std::nullopt;
}

GradingConfig GradingConfig::preset(GradingMode mode) {
    GradingConfig config;
    switch (mode) {
        case GradingMode::Default:
            break;
        case GradingMode::Client:
            config.grade_server_steps = false;
            config.validate_server_output = false;
            config.validate_data_request = false;
            break;
        case GradingMode::Server:
            config.grade_client_steps = false;
            config.validate_client_output = false;
            config.validate_data_response = false;
            config.validate_status_code = false;
            break;
        case GradingMode::Console:
            config.validate_data_response = false;
            config.validate_data_request = false;
            config.validate_http_method = false;
            config.validate_status_code = false;
            config.validate_data_type = false;
            break;
        case GradingMode::Http:
            config.validate_client_output = false;
            config.validate_server_output = false;
            break;
    }
    return config;
}

bool GradingConfig::is_enabled(ValidationKind kind) const noexcept {
    switch (kind) {
        case ValidationKind::None: return true;
        case ValidationKind::HttpMethod: return validate_http_method;
        case ValidationKind::StatusCode: return validate_status_code;
        case ValidationKind::DataResponse: return validate_data_response;
        case ValidationKind::DataRequest: return validate_data_request;
        case ValidationKind::ByteSize: return validate_byte_size;
        case ValidationKind::ClientOutput: return validate_client_output;
        case ValidationKind::ServerOutput: return validate_server_output;
        case ValidationKind::DataType: return validate_data_type;
    }
    return true;
}

bool GradingConfig::should_grade(const Step& step) const {
    if (step.is_client_row()) {
        return grade_client_steps;
    }
    if (step.is_server_row()) {
        return grade_server_steps;
    }
    return true;
}

}  // namespace grader::harness
