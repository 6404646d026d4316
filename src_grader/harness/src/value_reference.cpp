#include "grader_harness/value_reference.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "grader_harness/strings.hpp"

namespace {

using grader::harness::CaptureScope;

bool starts_like_json(std::string_view raw) {
    const auto first = raw.find_first_not_of(grader::harness::strings::kWhitespace);
    return first != std::string_view::npos && (raw[first] == '{' || raw[first] == '[');
}

bool looks_like_path(const std::string& text) {
    if (text.find('\\') != std::string::npos) {
        return true;
    }
    if (!text.empty() && text.front() == '/') {
        return true;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(text, ec);
}

std::string_view scope_label(CaptureScope scope) {
    switch (scope) {
        case CaptureScope::Clients:
            return "client output";
        case CaptureScope::Servers:
            return "server output";
        case CaptureScope::ServersRequest:
            return "intercepted request";
        case CaptureScope::ServersResponse:
            return "intercepted response";
    }
    return "capture";
}

}  // namespace

namespace grader::harness {

ValueReference make_reference(std::string_view raw) {
    if (auto key = parse_capture_uri(raw)) {
        return CaptureReference{std::move(*key)};
    }
    if (starts_like_json(raw)) {
        return LiteralValue{std::string{raw}};
    }
    const auto trimmed = strings::trim_copy(raw);
    if (!trimmed.empty() && trimmed != kMissingPlaceholder && looks_like_path(trimmed)) {
        return FileReference{std::filesystem::path{trimmed}};
    }
    return LiteralValue{std::string{raw}};
}

std::string describe_reference(const ValueReference& reference) {
    if (const auto* capture = std::get_if<CaptureReference>(&reference)) {
        std::ostringstream oss;
        oss << scope_label(capture->key.scope) << " of " << capture->key.question_code << " stage "
            << capture->key.stage;
        return oss.str();
    }
    if (const auto* file = std::get_if<FileReference>(&reference)) {
        return "file " + file->path.string();
    }
    return "inline value";
}

bool is_console_reference(const ValueReference& reference) {
    const auto* capture = std::get_if<CaptureReference>(&reference);
    return capture != nullptr && is_console_scope(capture->key.scope);
}

ResolvedValue resolve_reference(const ValueReference& reference, const CaptureStore& store) {
    if (const auto* literal = std::get_if<LiteralValue>(&reference)) {
        if (strings::trim_copy(literal->text) == kMissingPlaceholder) {
            return ResolvedValue{true, {}};
        }
        return ResolvedValue{true, literal->text};
    }
    if (const auto* capture = std::get_if<CaptureReference>(&reference)) {
        auto text = store.try_get(capture->key);
        if (!text) {
            return ResolvedValue{};
        }
        return ResolvedValue{true, std::move(*text)};
    }

    const auto& file = std::get<FileReference>(reference);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file.path, ec)) {
        return ResolvedValue{};
    }
    std::ifstream input(file.path, std::ios::binary);
    if (!input.is_open()) {
        return ResolvedValue{};
    }
    std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    return ResolvedValue{true, std::move(content)};
}

}  // namespace grader::harness
