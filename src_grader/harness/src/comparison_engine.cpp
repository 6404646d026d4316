#include "grader_harness/comparison_engine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <variant>

#include "grader_harness/strings.hpp"
#include "grader_harness/text_normalizer.hpp"

namespace {

using grader::harness::CaptureReference;
using grader::harness::CaptureScope;
using grader::harness::ComparisonOutcome;
using grader::harness::ErrorCode;
using grader::harness::MatchLevel;
using grader::harness::ValueReference;

namespace strings = grader::harness::strings;

struct StatusPhrase {
    std::string_view phrase;
    std::string_view code;
};

constexpr std::array kStatusPhrases = {
    StatusPhrase{"OK", "200"},
    StatusPhrase{"CREATED", "201"},
    StatusPhrase{"ACCEPTED", "202"},
    StatusPhrase{"NOCONTENT", "204"},
    StatusPhrase{"MOVEDPERMANENTLY", "301"},
    StatusPhrase{"FOUND", "302"},
    StatusPhrase{"NOTMODIFIED", "304"},
    StatusPhrase{"BADREQUEST", "400"},
    StatusPhrase{"UNAUTHORIZED", "401"},
    StatusPhrase{"FORBIDDEN", "403"},
    StatusPhrase{"NOTFOUND", "404"},
    StatusPhrase{"METHODNOTALLOWED", "405"},
    StatusPhrase{"CONFLICT", "409"},
    StatusPhrase{"UNPROCESSABLEENTITY", "422"},
    StatusPhrase{"INTERNALSERVERERROR", "500"},
    StatusPhrase{"NOTIMPLEMENTED", "501"},
    StatusPhrase{"BADGATEWAY", "502"},
    StatusPhrase{"SERVICEUNAVAILABLE", "503"},
};

std::string output_label(const ValueReference& reference) {
    if (const auto* capture = std::get_if<CaptureReference>(&reference)) {
        if (capture->key.scope == CaptureScope::Clients) {
            return "client output";
        }
        if (capture->key.scope == CaptureScope::Servers) {
            return "server output";
        }
    }
    return "text";
}

ComparisonOutcome passed(MatchLevel level, std::string message) {
    ComparisonOutcome outcome;
    outcome.passed = true;
    outcome.code = level == MatchLevel::Ignored ? ErrorCode::Skipped : ErrorCode::Ok;
    outcome.level = level;
    outcome.message = std::move(message);
    return outcome;
}

ComparisonOutcome ignored(const std::string& what) {
    return passed(MatchLevel::Ignored, "Expected " + what + " not provided (ignored)");
}

ComparisonOutcome failed(ErrorCode code, std::string message) {
    ComparisonOutcome outcome;
    outcome.code = code;
    outcome.message = std::move(message);
    return outcome;
}

bool is_unset(std::string_view text) {
    return strings::is_blank(text) || strings::trim_copy(text) == grader::harness::kMissingPlaceholder;
}

std::optional<double> parse_number(std::string_view raw) {
    const auto trimmed = strings::trim_copy(raw);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double value = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value) || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::string strip_bom(std::string text) {
    constexpr std::string_view kBom = "\xEF\xBB\xBF";
    if (text.compare(0, kBom.size(), kBom) == 0) {
        text.erase(0, kBom.size());
    }
    return text;
}

bool looks_like_csv(std::string_view payload) {
    const auto lines = strings::split(strings::trim_copy(payload), '\n');
    if (lines.size() < 2) {
        return false;
    }
    const auto columns = std::count(lines.front().begin(), lines.front().end(), ',');
    if (columns == 0) {
        return false;
    }
    return std::all_of(lines.begin(), lines.end(), [columns](const std::string& line) {
        return std::count(line.begin(), line.end(), ',') == columns;
    });
}

std::string canonical_data_type(std::string_view raw) {
    auto upper = strings::to_upper_copy(strings::trim_copy(raw));
    if (upper == "STRING" || upper == "PLAIN" || upper == "PLAINTEXT") {
        return "TEXT";
    }
    return upper;
}

}  // namespace

namespace grader::harness {

std::string_view to_string(MatchLevel level) noexcept {
    switch (level) {
        case MatchLevel::None:
            return "none";
        case MatchLevel::Ignored:
            return "ignored";
        case MatchLevel::Exact:
            return "exact";
        case MatchLevel::Containment:
            return "containment";
        case MatchLevel::AggressiveExact:
            return "aggressive-exact";
        case MatchLevel::AggressiveContainment:
            return "aggressive-containment";
    }
    return "none";
}

bool within_byte_tolerance(std::size_t expected,
                           std::size_t actual,
                           std::size_t abs_tolerance,
                           double pct_tolerance) noexcept {
    const auto diff = expected > actual ? expected - actual : actual - expected;
    if (diff <= abs_tolerance) {
        return true;
    }
    if (expected == 0) {
        return false;
    }
    return static_cast<double>(diff) / static_cast<double>(expected) <= pct_tolerance;
}

std::string canonical_status(std::string_view status) {
    const auto trimmed = strings::trim_copy(status);

    std::size_t pos = 0;
    while (pos < trimmed.size()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[pos]))) {
            std::size_t end = pos;
            while (end < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[end]))) {
                ++end;
            }
            if (end - pos == 3) {
                return trimmed.substr(pos, 3);
            }
            pos = end;
        } else {
            ++pos;
        }
    }

    std::string squeezed;
    for (char ch : strings::to_upper_copy(trimmed)) {
        if (ch != ' ' && ch != '_' && ch != '-') {
            squeezed.push_back(ch);
        }
    }
    for (const auto& entry : kStatusPhrases) {
        if (squeezed == entry.phrase) {
            return std::string{entry.code};
        }
    }
    return squeezed;
}

std::string classify_payload(std::string_view payload) {
    if (strings::is_blank(payload)) {
        return "EMPTY";
    }
    const auto trimmed = strings::trim_copy(payload);
    if (trimmed.rfind("<binary ", 0) == 0 && trimmed.size() > 7 &&
        trimmed.compare(trimmed.size() - 7, 7, " bytes>") == 0) {
        return "BINARY";
    }
    if (!is_valid_utf8(payload) || payload.find('\0') != std::string_view::npos) {
        return "BINARY";
    }
    if ((trimmed.front() == '{' || trimmed.front() == '[') && canonical_json(trimmed, false)) {
        return "JSON";
    }
    if (trimmed.front() == '<') {
        return "XML";
    }
    if (looks_like_csv(trimmed)) {
        return "CSV";
    }
    return "TEXT";
}

ComparisonEngine::ComparisonEngine(const CaptureStore& store, Config config)
    : store_(store), config_(config) {}

ComparisonEngine::Sides ComparisonEngine::resolve_sides(const ValueReference& expected,
                                                        const ValueReference& actual,
                                                        bool console_fallback) const {
    Sides sides;
    const auto expected_value = resolve_reference(expected, store_);
    sides.expected_available = expected_value.found && !is_unset(expected_value.text);
    sides.expected = expected_value.text;

    auto actual_value = resolve_reference(actual, store_);
    if (console_fallback && is_console_reference(actual) && strings::is_blank(actual_value.text)) {
        const auto& key = std::get<CaptureReference>(actual).key;
        auto aggregated = store_.collect_stages(key.scope, key.question_code);
        if (!strings::is_blank(aggregated)) {
            actual_value = ResolvedValue{true, std::move(aggregated)};
        }
    }
    sides.actual_available = actual_value.found;
    sides.actual = std::move(actual_value.text);
    return sides;
}

ComparisonOutcome ComparisonEngine::mismatch(ErrorCode code,
                                             const std::string& message,
                                             const std::string& expected,
                                             const std::string& actual) const {
    auto outcome = failed(code, message);
    const auto diff = first_difference(expected, actual, config_.excerpt_context);
    outcome.diff_index = diff.index;
    outcome.expected_excerpt = diff.expected_excerpt;
    outcome.actual_excerpt = diff.actual_excerpt;
    if (diff.index >= 0) {
        outcome.message += ": content differs at position " + std::to_string(diff.index);
    }
    return outcome;
}

ComparisonOutcome ComparisonEngine::compare_text(const ValueReference& expected,
                                                 const ValueReference& actual) const {
    const auto label = output_label(actual);
    const bool console = is_console_reference(actual);

    auto sides = resolve_sides(expected, actual, true);
    if (!sides.expected_available) {
        return ignored(label);
    }
    if (!sides.actual_available || (console && strings::is_blank(sides.actual))) {
        const auto code = std::holds_alternative<FileReference>(actual) ? ErrorCode::ActualFileMissing
                                                                        : ErrorCode::ActualCaptureMissing;
        return failed(code, describe_reference(actual) + " not captured (expected was provided)");
    }

    const NormalizeOptions options{config_.case_insensitive, config_.sort_arrays_in_text};
    const auto exp = normalize_text(sides.expected, options);
    const auto act = normalize_text(sides.actual, options);

    if (exp == act) {
        return passed(MatchLevel::Exact, "Text comparison passed: " + label + " matches exactly");
    }
    if (console && act.find(exp) != std::string::npos) {
        return passed(MatchLevel::Containment,
                      "Text comparison passed: " + label + " contains expected (loose match)");
    }

    const auto exp_loose = strip_aggressive(exp);
    const auto act_loose = strip_aggressive(act);
    if (!exp_loose.empty() && exp_loose == act_loose) {
        return passed(MatchLevel::AggressiveExact,
                      "Text comparison passed: " + label + " matches after aggressive normalization");
    }
    if (console && !exp_loose.empty() && act_loose.find(exp_loose) != std::string::npos) {
        return passed(MatchLevel::AggressiveContainment,
                      "Text comparison passed: " + label + " contains expected after aggressive normalization");
    }

    return mismatch(ErrorCode::TextMismatch, "Text mismatch in " + label, exp, act);
}

ComparisonOutcome ComparisonEngine::compare_json(const ValueReference& expected,
                                                 const ValueReference& actual,
                                                 std::optional<bool> ignore_array_order) const {
    const bool ignore_order = ignore_array_order.value_or(config_.json_ignore_array_order);

    auto sides = resolve_sides(expected, actual, false);
    if (!sides.expected_available) {
        return ignored("JSON");
    }
    if (!sides.actual_available || strings::is_blank(sides.actual)) {
        return failed(ErrorCode::ActualCaptureMissing,
                      "Actual JSON not available from " + describe_reference(actual) +
                          " but expected JSON was defined");
    }

    const auto exp = canonical_json(strings::trim_copy(strip_bom(sides.expected)), ignore_order);
    if (!exp) {
        return failed(ErrorCode::JsonInvalid, "Invalid JSON content for comparison (expected value)");
    }
    const auto act = canonical_json(strings::trim_copy(strip_bom(sides.actual)), ignore_order);
    if (!act) {
        return failed(ErrorCode::JsonInvalid,
                      "Invalid JSON content for comparison (" + describe_reference(actual) + ")");
    }

    if (*exp == *act) {
        return passed(MatchLevel::Exact, "JSON matches expected");
    }
    return mismatch(ErrorCode::JsonMismatch, "JSON differs from expected", *exp, *act);
}

ComparisonOutcome ComparisonEngine::compare_csv(const ValueReference& expected,
                                                const ValueReference& actual) const {
    auto sides = resolve_sides(expected, actual, false);
    if (!sides.expected_available) {
        return ignored("CSV");
    }
    if (!sides.actual_available) {
        return failed(ErrorCode::ActualFileMissing,
                      "Actual CSV from " + describe_reference(actual) + " was not generated but expected CSV was defined");
    }

    const NormalizeOptions options{true, false};
    const auto exp = normalize_text(sides.expected, options);
    const auto act = normalize_text(sides.actual, options);
    if (exp == act) {
        return passed(MatchLevel::Exact, "CSV matches expected");
    }
    return mismatch(ErrorCode::CsvMismatch, "CSV differs", exp, act);
}

ComparisonOutcome ComparisonEngine::compare_file(const ValueReference& expected,
                                                 const ValueReference& actual) const {
    auto sides = resolve_sides(expected, actual, false);
    if (!sides.expected_available) {
        return ignored("file");
    }
    if (!sides.actual_available) {
        return failed(ErrorCode::ActualFileMissing, describe_reference(actual) + " does not exist");
    }

    const NormalizeOptions options{false, false};
    const auto exp = normalize_text(sides.expected, options);
    const auto act = normalize_text(sides.actual, options);
    if (exp == act) {
        return passed(MatchLevel::Exact, "Files match exactly");
    }
    return mismatch(ErrorCode::FileMismatch, "File content differs", exp, act);
}

ComparisonOutcome ComparisonEngine::compare_http_method(std::string_view expected,
                                                        std::string_view actual) const {
    if (is_unset(expected)) {
        return ignored("HTTP method");
    }
    const auto exp = strings::to_upper_copy(strings::trim_copy(expected));
    const auto act = strings::to_upper_copy(strings::trim_copy(actual));
    if (act.empty()) {
        return failed(ErrorCode::ActualCaptureMissing, "No intercepted request to check method " + exp);
    }
    if (exp == act) {
        return passed(MatchLevel::Exact, "HTTP method matches (" + act + ")");
    }
    return failed(ErrorCode::HttpMethodMismatch, "Expected HTTP method " + exp + " but got " + act);
}

ComparisonOutcome ComparisonEngine::compare_status_code(std::string_view expected, int actual) const {
    if (is_unset(expected)) {
        return ignored("status code");
    }
    if (actual <= 0) {
        return failed(ErrorCode::ActualCaptureMissing,
                      "No intercepted response to check status " + strings::trim_copy(expected));
    }
    const auto exp = canonical_status(expected);
    const auto act = canonical_status(std::to_string(actual));
    if (exp == act) {
        return passed(MatchLevel::Exact, "Status code matches (" + act + ")");
    }
    return failed(ErrorCode::StatusCodeMismatch,
                  "Expected status " + strings::trim_copy(expected) + " but got " + act);
}

ComparisonOutcome ComparisonEngine::compare_byte_size(std::string_view expected, std::size_t actual) const {
    if (is_unset(expected)) {
        return ignored("byte size");
    }
    const auto parsed = parse_number(expected);
    if (!parsed) {
        return failed(ErrorCode::ConfigInvalid,
                      "Expected byte size '" + strings::trim_copy(expected) + "' is not a number");
    }
    const auto exp = static_cast<std::size_t>(*parsed);
    if (within_byte_tolerance(exp, actual, config_.byte_size_abs_tolerance, config_.byte_size_pct_tolerance)) {
        return passed(MatchLevel::Exact, "Byte size within tolerance (expected " + std::to_string(exp) +
                                             ", actual " + std::to_string(actual) + ")");
    }
    return failed(ErrorCode::ByteSizeMismatch, "Expected about " + std::to_string(exp) + " bytes but got " +
                                                   std::to_string(actual));
}

ComparisonOutcome ComparisonEngine::compare_data_type(std::string_view expected,
                                                      const ValueReference& actual) const {
    if (is_unset(expected)) {
        return ignored("data type");
    }
    const auto exp = canonical_data_type(expected);
    const auto actual_value = resolve_reference(actual, store_);
    const auto act = actual_value.found ? classify_payload(actual_value.text) : std::string{"EMPTY"};
    if (exp == act) {
        return passed(MatchLevel::Exact, "Payload is " + act);
    }
    return failed(ErrorCode::TextMismatch, "Expected " + exp + " payload but " + describe_reference(actual) +
                                               " looks like " + act);
}

}  // namespace grader::harness
