#include "grader_harness/suite_loader.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/strings.hpp"

namespace {

using grader::harness::ConfigurationError;
using grader::harness::ErrorCode;

namespace strings = grader::harness::strings;

constexpr std::string_view kSuiteExtension = ".suite";
constexpr std::size_t kRequiredColumns = 3;

std::string location(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

[[noreturn]] void fail(ErrorCode code, const std::string& message, const std::filesystem::path& file,
                       std::size_t line_no) {
    throw ConfigurationError(code, message + " at " + location(file, line_no));
}

std::optional<std::string> optional_column(const std::vector<std::string>& columns, std::size_t index) {
    if (index >= columns.size()) {
        return std::nullopt;
    }
    auto trimmed = strings::trim_copy(columns[index]);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

double parse_mark(const std::string& raw, const std::filesystem::path& file, std::size_t line_no) {
    char* end = nullptr;
    const double value = std::strtod(raw.c_str(), &end);
    if (raw.empty() || end != raw.c_str() + raw.size() || value < 0.0) {
        fail(ErrorCode::StepParseError, "Invalid mark '" + raw + "'", file, line_no);
    }
    return value;
}

}  // namespace

namespace grader::harness {

std::vector<std::string> split_step_columns(std::string_view raw) {
    std::vector<std::string> columns(1);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (ch == '\\' && i + 1 < raw.size()) {
            const char next = raw[++i];
            switch (next) {
                case 'n': columns.back().push_back('\n'); break;
                case 't': columns.back().push_back('\t'); break;
                case '|': columns.back().push_back('|'); break;
                case '\\': columns.back().push_back('\\'); break;
                default:
                    columns.back().push_back('\\');
                    columns.back().push_back(next);
                    break;
            }
        } else if (ch == '|') {
            columns.emplace_back();
        } else {
            columns.back().push_back(ch);
        }
    }
    return columns;
}

SuiteDefinition SuiteLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw ConfigurationError(ErrorCode::SuiteLoadFailed, "Suite file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw ConfigurationError(ErrorCode::SuiteLoadFailed, "Suite path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw ConfigurationError(ErrorCode::SuiteLoadFailed, "Unable to open suite file: " + file.string());
    }

    SuiteDefinition suite;
    suite.source_file = file;

    bool in_header = true;
    bool header_seen = false;
    std::optional<TestCaseDefinition> current;
    std::size_t case_line = 0;

    auto push_current = [&](std::size_t line_no) {
        if (!current) {
            return;
        }
        if (current->name.empty()) {
            fail(ErrorCode::StepParseError, "Test case without 'case=' name", file, case_line);
        }
        if (current->steps.empty()) {
            fail(ErrorCode::NoTestCases, "Test case '" + current->name + "' has no steps", file, line_no);
        }
        if (current->question_code.empty()) {
            current->question_code = current->name;
        }
        for (auto& step : current->steps) {
            if (step.question_code.empty()) {
                step.question_code = current->question_code;
            }
        }
        suite.cases.push_back(std::move(*current));
        current.reset();
    };

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = strings::trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            if (in_header) {
                if (!header_seen) {
                    fail(ErrorCode::HeaderMissing, "Suite header (suite=...) missing before first case", file,
                         line_no);
                }
                in_header = false;
            } else {
                push_current(line_no);
            }
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            fail(ErrorCode::StepParseError, "Expected 'key=value' entry", file, line_no);
        }
        const auto key = strings::trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = strings::trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            fail(ErrorCode::StepParseError, "Empty key", file, line_no);
        }

        if (in_header) {
            if (key == "suite") {
                suite.name = std::move(value);
                header_seen = !suite.name.empty();
            } else if (key == "protocol") {
                const auto mode = parse_proxy_mode(value);
                if (!mode) {
                    fail(ErrorCode::HeaderMissing, "Unknown protocol '" + value + "'", file, line_no);
                }
                suite.protocol = *mode;
            } else {
                fail(ErrorCode::HeaderMissing, "Unexpected key '" + key + "' in suite header", file, line_no);
            }
            continue;
        }

        if (!current) {
            current.emplace();
            case_line = line_no;
        }

        if (key == "case") {
            current->name = std::move(value);
        } else if (key == "mark") {
            current->mark = parse_mark(value, file, line_no);
        } else if (key == "question") {
            current->question_code = std::move(value);
        } else if (key == "step") {
            const auto columns = split_step_columns(value);
            if (columns.size() < kRequiredColumns) {
                fail(ErrorCode::StepParseError, "Step needs at least id|stage|action", file, line_no);
            }

            Step step;
            step.id = strings::trim_copy(columns[0]);
            step.stage = strings::trim_copy(columns[1]);
            try {
                step.action = parse_action(columns[2]);
            } catch (const ConfigurationError& ex) {
                fail(ex.code(), ex.what(), file, line_no);
            }
            if (step.id.empty()) {
                step.id = std::string{to_string(step.action)} + "-" + (step.stage.empty() ? "0" : step.stage);
            }
            step.question_code = current->question_code;
            step.target = columns.size() > 3 ? columns[3] : std::string{};
            step.value = columns.size() > 4 ? columns[4] : std::string{};
            step.http_method = optional_column(columns, 5);
            step.status_code = optional_column(columns, 6);
            step.byte_size = optional_column(columns, 7);
            step.data_type = optional_column(columns, 8);
            current->steps.push_back(std::move(step));
        } else if (key.rfind("meta.", 0) == 0) {
            const auto meta_key = key.substr(5);
            if (meta_key.empty()) {
                fail(ErrorCode::StepParseError, "Empty metadata name", file, line_no);
            }
            if (current->steps.empty()) {
                fail(ErrorCode::StepParseError, "Metadata '" + meta_key + "' before any step", file, line_no);
            }
            current->steps.back().metadata[meta_key] = std::move(value);
        } else {
            fail(ErrorCode::StepParseError, "Unknown key '" + key + "'", file, line_no);
        }
    }

    if (in_header && !header_seen) {
        throw ConfigurationError(ErrorCode::HeaderMissing, "Suite header (suite=...) missing in " + file.string());
    }
    push_current(line_no);

    if (suite.cases.empty()) {
        throw ConfigurationError(ErrorCode::NoTestCases, "Suite " + file.string() + " defines no test cases");
    }
    return suite;
}

std::vector<SuiteDefinition> SuiteLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw ConfigurationError(ErrorCode::SuiteLoadFailed, "Suite root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return {load(root)};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == kSuiteExtension) {
            files.emplace_back(entry.path());
        }
    }
    if (files.empty()) {
        throw ConfigurationError(ErrorCode::SuiteLoadFailed, "No *.suite files found under " + root.string());
    }

    std::sort(files.begin(), files.end());

    std::vector<SuiteDefinition> suites;
    suites.reserve(files.size());
    for (const auto& path : files) {
        suites.emplace_back(load(path));
    }
    return suites;
}

}  // namespace grader::harness
