#pragma once

#include <filesystem>

#include <nlohmann/json_fwd.hpp>

#include "grader_harness/comparison_engine.hpp"
#include "grader_harness/log.hpp"
#include "grader_harness/process_supervisor.hpp"
#include "grader_harness/proxy_interceptor.hpp"
#include "grader_harness/step_executor.hpp"
#include "grader_harness/suite_orchestrator.hpp"

namespace grader::harness {

/**
 * \brief Every tunable of a grading run, grouped by component.
 *
 * JSON layout (all keys optional, durations in milliseconds):
 * \code{.json}
 * {
 *   "log_level": "info",
 *   "process":      { "idle_flush_ms": 100, "kill_grace_ms": 1000, "output_poll_ms": 25,
 *                     "client_args": [], "server_args": [], "working_directory": "" },
 *   "proxy":        { "bind_host": "127.0.0.1", "public_port": 5000, "real_host": "127.0.0.1",
 *                     "real_port": 5001, "upstream_timeout_ms": 30000, "stop_grace_ms": 2000,
 *                     "traffic_log_dir": "" },
 *   "comparison":   { "case_insensitive": true, "sort_arrays_in_text": false,
 *                     "json_ignore_array_order": true, "excerpt_context": 24,
 *                     "byte_size_abs_tolerance": 10, "byte_size_pct_tolerance": 0.05 },
 *   "executor":     { "readiness_timeout_ms": 5000, "readiness_poll_ms": 100,
 *                     "health_path": "/healthz", "startup_grace_ms": 500,
 *                     "client_startup_grace_ms": 500, "input_output_wait_ms": 2000,
 *                     "default_wait_ms": 1000, "http_timeout_ms": 30000, "protocol": "HTTP" },
 *   "orchestrator": { "step_timeout_ms": 10000, "stage_settle_delay_ms": 500,
 *                     "assertion_settle_delay_ms": 1000 },
 *   "grading":      { "mode": "DEFAULT", "validate_byte_size": false, ... }
 * }
 * \endcode
 * Unknown keys are ignored. `grading.mode` selects a preset first; the
 * individual toggles then override it.
 */
struct HarnessConfig {
    ProcessSupervisor::Config process{};
    ProxyInterceptor::Config proxy{};
    ComparisonEngine::Config comparison{};
    StepExecutor::Config executor{};
    SuiteOrchestrator::Config orchestrator{};
    LogLevel log_level{LogLevel::Info};
};

/// Throws ConfigurationError (ConfigInvalid) for wrongly typed or out of range values.
[[nodiscard]] HarnessConfig parse_config(const nlohmann::json& document);

/// Reads and parses a JSON file; unreadable or malformed files raise ConfigurationError.
[[nodiscard]] HarnessConfig load_config(const std::filesystem::path& path);

}  // namespace grader::harness
