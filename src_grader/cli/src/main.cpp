#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "grader_harness/cancellation.hpp"
#include "grader_harness/capture_store.hpp"
#include "grader_harness/comparison_engine.hpp"
#include "grader_harness/error_codes.hpp"
#include "grader_harness/grading_config.hpp"
#include "grader_harness/harness_config.hpp"
#include "grader_harness/process_supervisor.hpp"
#include "grader_harness/proxy_interceptor.hpp"
#include "grader_harness/report_writer.hpp"
#include "grader_harness/step_executor.hpp"
#include "grader_harness/suite_loader.hpp"
#include "grader_harness/suite_orchestrator.hpp"

using grader::harness::CancellationToken;
using grader::harness::CaptureStore;
using grader::harness::ComparisonEngine;
using grader::harness::GradingConfig;
using grader::harness::HarnessConfig;
using grader::harness::ProcessSupervisor;
using grader::harness::ProxyInterceptor;
using grader::harness::ReportWriter;
using grader::harness::StepExecutor;
using grader::harness::SuiteDefinition;
using grader::harness::SuiteLoader;
using grader::harness::SuiteOrchestrator;
using grader::harness::SuiteResult;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_interrupt(int) {
    g_interrupted = 1;
}

struct Args {
    std::vector<std::filesystem::path> suite_paths;
    std::filesystem::path client_path{};
    std::filesystem::path server_path{};
    std::filesystem::path output_root{"GradeResults"};
    std::filesystem::path config_path{};
    std::string timeout_seconds{};
    std::string mode{};
    std::string protocol{};
    bool emit_html{true};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Black-box Grading Harness\n"
        << "Usage:\n"
        << "  " << argv0 << " --suite <file-or-dir> [--suite <file-or-dir> ...]\n"
        << "                 [--client <exe>] [--server <exe>] [--out <dir>] [--config <json>]\n"
        << "                 [--timeout <sec>] [--mode <mode>] [--protocol HTTP|TCP] [--ci]\n"
        << "\n"
        << "Options:\n"
        << "  --suite     One or more suite files or directories (line-oriented *.suite).\n"
        << "  --client    Client executable under test.\n"
        << "  --server    Server executable under test.\n"
        << "  --out       Root directory for results (default: GradeResults).\n"
        << "              Each run writes to <out>/GradeResult_<yyyyMMdd_HHmmss>/.\n"
        << "  --config    JSON configuration file; flags below override its values.\n"
        << "  --timeout   Per-step timeout in seconds (default: 10).\n"
        << "  --mode      Grading mode: DEFAULT, CLIENT, SERVER, CONSOLE or HTTP.\n"
        << "  --protocol  Proxy protocol used when a suite does not name one.\n"
        << "  --ci        CI mode: suppress HTML generation (JSON only).\n"
        << "  -h, --help  Show this help message.\n"
        << "\n"
        << "Exit codes: 0 all cases passed, 1 a case failed, 2 configuration or suite error,\n"
        << "            3 internal error.\n"
        << std::endl;
}

[[noreturn]] void usage_error(const std::string& message) {
    throw grader::harness::ConfigurationError(grader::harness::ErrorCode::ConfigInvalid, message);
}

std::string take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        usage_error(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            break;
        } else if (tok == "--suite") {
            args.suite_paths.emplace_back(take_value(argc, argv, i, tok));
        } else if (tok == "--client") {
            args.client_path = take_value(argc, argv, i, tok);
        } else if (tok == "--server") {
            args.server_path = take_value(argc, argv, i, tok);
        } else if (tok == "--out") {
            args.output_root = take_value(argc, argv, i, tok);
        } else if (tok == "--config") {
            args.config_path = take_value(argc, argv, i, tok);
        } else if (tok == "--timeout") {
            args.timeout_seconds = take_value(argc, argv, i, tok);
        } else if (tok == "--mode") {
            args.mode = take_value(argc, argv, i, tok);
        } else if (tok == "--protocol") {
            args.protocol = take_value(argc, argv, i, tok);
        } else if (tok == "--ci") {
            args.emit_html = false;
        } else if (!tok.empty() && tok.front() == '-') {
            usage_error("Unknown option " + std::string{tok});
        } else {
            // Bare arguments are suite paths
            args.suite_paths.emplace_back(std::string(tok));
        }
    }

    if (!args.help && args.suite_paths.empty()) {
        const auto fallback_root = std::filesystem::path("src_grader/resources/suites");
        if (std::filesystem::is_directory(fallback_root)) {
            args.suite_paths.push_back(fallback_root);
        } else {
            throw grader::harness::ConfigurationError(grader::harness::ErrorCode::SuiteLoadFailed,
                                                      "No suites specified and no resources found under " + fallback_root.string());
        }
    }
    return args;
}

HarnessConfig resolve_config(const Args& args) {
    HarnessConfig config = args.config_path.empty() ? HarnessConfig{} : grader::harness::load_config(args.config_path);

    if (!args.timeout_seconds.empty()) {
        std::size_t consumed = 0;
        double seconds = 0.0;
        try {
            seconds = std::stod(args.timeout_seconds, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed != args.timeout_seconds.size() || seconds <= 0.0) {
            usage_error("--timeout expects a positive number of seconds, got '" + args.timeout_seconds +
                                     "'");
        }
        config.orchestrator.step_timeout = std::chrono::milliseconds{static_cast<long long>(seconds * 1000.0)};
    }
    if (!args.mode.empty()) {
        const auto mode = grader::harness::parse_grading_mode(args.mode);
        if (!mode) {
            usage_error("--mode expects DEFAULT, CLIENT, SERVER, CONSOLE or HTTP, got '" + args.mode +
                                     "'");
        }
        config.executor.grading = GradingConfig::preset(*mode);
    }
    if (!args.protocol.empty()) {
        const auto protocol = grader::harness::parse_proxy_mode(args.protocol);
        if (!protocol) {
            usage_error("--protocol expects HTTP or TCP, got '" + args.protocol + "'");
        }
        config.executor.protocol = *protocol;
    }
    return config;
}

std::filesystem::path make_result_dir(const std::filesystem::path& output_root) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream name;
    name << "GradeResult_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    auto result_dir = output_root / name.str();
    std::filesystem::create_directories(result_dir);
    return result_dir;
}

int aggregate_exit_code(const std::vector<SuiteResult>& results) {
    for (const auto& result : results) {
        if (!result.all_passed()) {
            return 1;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        auto config = resolve_config(args);

        SuiteLoader loader;
        std::vector<SuiteDefinition> suites;
        for (const auto& path : args.suite_paths) {
            auto loaded = loader.load_directory(path);
            suites.insert(suites.end(), std::make_move_iterator(loaded.begin()),
                          std::make_move_iterator(loaded.end()));
        }

        const auto result_dir = make_result_dir(args.output_root);
        if (config.proxy.traffic_log_dir.empty()) {
            config.proxy.traffic_log_dir = result_dir / "traffic";
        }

        CaptureStore store;
        ProcessSupervisor supervisor(store, config.process);
        ProxyInterceptor proxy(store, config.proxy);
        ComparisonEngine comparator(store, config.comparison);
        StepExecutor executor(store, supervisor, proxy, comparator, config.executor);
        SuiteOrchestrator orchestrator(store, supervisor, proxy, executor, config.orchestrator);

        supervisor.set_log_level(config.log_level);
        proxy.set_log_level(config.log_level);
        executor.set_log_level(config.log_level);
        orchestrator.set_log_level(config.log_level);

        // Ctrl+C cancels the suite token; the running case still finalizes.
        CancellationToken suite_token;
        std::signal(SIGINT, on_interrupt);
        std::signal(SIGTERM, on_interrupt);
        std::atomic<bool> finished{false};
        std::thread interrupt_watch([&] {
            while (!finished.load()) {
                if (g_interrupted != 0) {
                    std::cerr << "Interrupt received, cancelling remaining steps" << std::endl;
                    suite_token.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{100});
            }
        });

        std::vector<SuiteResult> results;
        try {
            for (const auto& suite : suites) {
                if (suite_token.cancel_requested()) {
                    break;
                }
                results.push_back(orchestrator.run_suite(suite, args.client_path, args.server_path, suite_token));
            }
        } catch (...) {
            finished = true;
            interrupt_watch.join();
            throw;
        }
        finished = true;
        interrupt_watch.join();

        const auto summary_path = result_dir / "summary.json";
        const auto html_path = result_dir / "report.html";
        ReportWriter writer;
        writer.write_summary(summary_path, results);
        if (args.emit_html) {
            writer.write_detailed(html_path, results);
        }

        std::size_t case_count = 0;
        std::size_t passed_cases = 0;
        double awarded = 0.0;
        double possible = 0.0;
        for (const auto& result : results) {
            case_count += result.cases.size();
            passed_cases += result.passed_cases();
            awarded += result.points_awarded;
            possible += result.points_possible;
        }

        std::cout << "Grading Harness\n"
                  << "  Suites: " << results.size() << "  Cases: " << case_count << "\n"
                  << "  PASS: " << passed_cases << "  FAIL: " << (case_count - passed_cases) << "\n"
                  << "  Points: " << awarded << " / " << possible << "\n";
        if (suite_token.cancel_requested()) {
            std::cout << "  (run cancelled)\n";
        }
        std::cout << "Artifacts:\n"
                  << "  JSON: " << summary_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << html_path << "\n";
        }

        if (suite_token.cancel_requested()) {
            return 1;
        }
        return aggregate_exit_code(results);
    } catch (const grader::harness::ConfigurationError& ex) {
        std::cerr << "ERROR [" << grader::harness::to_string(ex.code()) << "]: " << ex.what() << "\n";
        if (ex.code() == grader::harness::ErrorCode::ConfigInvalid) {
            print_usage(argv[0]);
        }
        return grader::harness::exit_code_for(ex);
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return grader::harness::exit_code_for(ex);
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;  // internal error
    }
}
