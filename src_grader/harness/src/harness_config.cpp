#include "grader_harness/harness_config.hpp"

#include <fstream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/grading_config.hpp"
#include "grader_harness/strings.hpp"

namespace {

using nlohmann::json;
using grader::harness::ConfigurationError;
using grader::harness::ErrorCode;

namespace strings = grader::harness::strings;

[[noreturn]] void invalid(const std::string& section, const std::string& key, const std::string& reason) {
    const auto name = section.empty() ? key : section + "." + key;
    throw ConfigurationError(ErrorCode::ConfigInvalid, "Invalid configuration value '" + name + "': " + reason);
}

const json* find_key(const json& node, const char* key) {
    const auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

template <typename T>
void read_value(const json& node, const std::string& section, const char* key, T& target) {
    const auto* value = find_key(node, key);
    if (!value) {
        return;
    }
    try {
        target = value->get<T>();
    } catch (const json::exception& ex) {
        invalid(section, key, ex.what());
    }
}

void read_bool(const json& node, const std::string& section, const char* key, bool& target) {
    const auto* value = find_key(node, key);
    if (!value) {
        return;
    }
    if (!value->is_boolean()) {
        invalid(section, key, "expected true or false");
    }
    target = value->get<bool>();
}

void read_millis(const json& node, const std::string& section, const char* key, std::chrono::milliseconds& target) {
    const auto* value = find_key(node, key);
    if (!value) {
        return;
    }
    if (!value->is_number_integer() || value->get<long long>() < 0) {
        invalid(section, key, "expected a non-negative integer number of milliseconds");
    }
    target = std::chrono::milliseconds{value->get<long long>()};
}

void read_port(const json& node, const std::string& section, const char* key, std::uint16_t& target) {
    const auto* value = find_key(node, key);
    if (!value) {
        return;
    }
    if (!value->is_number_integer()) {
        invalid(section, key, "expected an integer port");
    }
    const auto port = value->get<long long>();
    if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        invalid(section, key, "port out of range");
    }
    target = static_cast<std::uint16_t>(port);
}

const json& section_of(const json& document, const char* name) {
    static const json kEmpty = json::object();
    const auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        return kEmpty;
    }
    if (!it->is_object()) {
        throw ConfigurationError(ErrorCode::ConfigInvalid,
                                 std::string{"Configuration section '"} + name + "' must be an object");
    }
    return *it;
}

void apply_process(const json& node, grader::harness::ProcessSupervisor::Config& config) {
    const std::string section = "process";
    read_millis(node, section, "idle_flush_ms", config.idle_flush);
    read_millis(node, section, "kill_grace_ms", config.kill_grace);
    read_millis(node, section, "output_poll_ms", config.output_poll);
    read_value(node, section, "client_args", config.client_args);
    read_value(node, section, "server_args", config.server_args);
    std::string working_directory;
    read_value(node, section, "working_directory", working_directory);
    if (!working_directory.empty()) {
        config.working_directory = working_directory;
    }
}

void apply_proxy(const json& node, grader::harness::ProxyInterceptor::Config& config) {
    const std::string section = "proxy";
    read_value(node, section, "bind_host", config.bind_host);
    read_port(node, section, "public_port", config.public_port);
    read_value(node, section, "real_host", config.real_host);
    read_port(node, section, "real_port", config.real_port);
    read_millis(node, section, "upstream_timeout_ms", config.upstream_timeout);
    read_millis(node, section, "stop_grace_ms", config.stop_grace);
    std::string traffic_log_dir;
    read_value(node, section, "traffic_log_dir", traffic_log_dir);
    if (!traffic_log_dir.empty()) {
        config.traffic_log_dir = traffic_log_dir;
    }
}

void apply_comparison(const json& node, grader::harness::ComparisonEngine::Config& config) {
    const std::string section = "comparison";
    read_bool(node, section, "case_insensitive", config.case_insensitive);
    read_bool(node, section, "sort_arrays_in_text", config.sort_arrays_in_text);
    read_bool(node, section, "json_ignore_array_order", config.json_ignore_array_order);
    read_value(node, section, "excerpt_context", config.excerpt_context);
    read_value(node, section, "byte_size_abs_tolerance", config.byte_size_abs_tolerance);
    read_value(node, section, "byte_size_pct_tolerance", config.byte_size_pct_tolerance);
    if (config.byte_size_pct_tolerance < 0.0) {
        invalid(section, "byte_size_pct_tolerance", "must not be negative");
    }
}

void apply_executor(const json& node, grader::harness::StepExecutor::Config& config) {
    const std::string section = "executor";
    read_millis(node, section, "readiness_timeout_ms", config.readiness_timeout);
    read_millis(node, section, "readiness_poll_ms", config.readiness_poll);
    read_value(node, section, "health_path", config.health_path);
    read_millis(node, section, "startup_grace_ms", config.startup_grace);
    read_millis(node, section, "client_startup_grace_ms", config.client_startup_grace);
    read_millis(node, section, "input_output_wait_ms", config.input_output_wait);
    read_millis(node, section, "default_wait_ms", config.default_wait);
    read_millis(node, section, "http_timeout_ms", config.http_timeout);

    std::string protocol;
    read_value(node, section, "protocol", protocol);
    if (!protocol.empty()) {
        const auto mode = grader::harness::parse_proxy_mode(protocol);
        if (!mode) {
            invalid(section, "protocol", "expected HTTP or TCP, got '" + protocol + "'");
        }
        config.protocol = *mode;
    }
}

void apply_orchestrator(const json& node, grader::harness::SuiteOrchestrator::Config& config) {
    const std::string section = "orchestrator";
    read_millis(node, section, "step_timeout_ms", config.step_timeout);
    read_millis(node, section, "stage_settle_delay_ms", config.stage_settle_delay);
    read_millis(node, section, "assertion_settle_delay_ms", config.assertion_settle_delay);
}

void apply_grading(const json& node, grader::harness::GradingConfig& config) {
    const std::string section = "grading";
    std::string mode_name;
    read_value(node, section, "mode", mode_name);
    if (!mode_name.empty()) {
        const auto mode = grader::harness::parse_grading_mode(mode_name);
        if (!mode) {
            invalid(section, "mode", "unknown grading mode '" + mode_name + "'");
        }
        config = grader::harness::GradingConfig::preset(*mode);
    }
    read_bool(node, section, "grade_client_steps", config.grade_client_steps);
    read_bool(node, section, "grade_server_steps", config.grade_server_steps);
    read_bool(node, section, "validate_client_output", config.validate_client_output);
    read_bool(node, section, "validate_server_output", config.validate_server_output);
    read_bool(node, section, "validate_data_response", config.validate_data_response);
    read_bool(node, section, "validate_data_request", config.validate_data_request);
    read_bool(node, section, "validate_http_method", config.validate_http_method);
    read_bool(node, section, "validate_status_code", config.validate_status_code);
    read_bool(node, section, "validate_byte_size", config.validate_byte_size);
    read_bool(node, section, "validate_data_type", config.validate_data_type);
}

grader::harness::LogLevel parse_log_level(const std::string& raw) {
    const auto lowered = strings::to_lower_copy(strings::trim_copy(raw));
    if (lowered == "debug") return grader::harness::LogLevel::Debug;
    if (lowered == "info") return grader::harness::LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return grader::harness::LogLevel::Warn;
    if (lowered == "error") return grader::harness::LogLevel::Error;
    invalid("", "log_level", "expected debug, info, warn or error");
}

}  // namespace

namespace grader::harness {

HarnessConfig parse_config(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigurationError(ErrorCode::ConfigInvalid, "Configuration document must be a JSON object");
    }

    HarnessConfig config;
    apply_process(section_of(document, "process"), config.process);
    apply_proxy(section_of(document, "proxy"), config.proxy);
    apply_comparison(section_of(document, "comparison"), config.comparison);
    apply_executor(section_of(document, "executor"), config.executor);
    apply_orchestrator(section_of(document, "orchestrator"), config.orchestrator);
    apply_grading(section_of(document, "grading"), config.executor.grading);

    std::string log_level;
    read_value(document, "", "log_level", log_level);
    if (!log_level.empty()) {
        config.log_level = parse_log_level(log_level);
    }
    return config;
}

HarnessConfig load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigurationError(ErrorCode::ConfigInvalid, "Unable to open configuration file: " + path.string());
    }

    json document;
    try {
        document = json::parse(input);
    } catch (const json::parse_error& ex) {
        throw ConfigurationError(ErrorCode::ConfigInvalid,
                                 "Malformed configuration file " + path.string() + ": " + ex.what());
    }
    return parse_config(document);
}

}  // namespace grader::harness
