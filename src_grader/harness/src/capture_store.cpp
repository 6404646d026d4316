#include "grader_harness/capture_store.hpp"

#include <algorithm>
#include <vector>

#include "grader_harness/strings.hpp"

namespace {

using grader::harness::strings::parse_integer;
using grader::harness::strings::trim_copy;

std::string normalized_question(std::string_view question_code) {
    auto trimmed = trim_copy(question_code);
    return trimmed.empty() ? std::string{"Unknown"} : trimmed;
}

std::string normalized_stage(std::string_view stage) {
    auto trimmed = trim_copy(stage);
    return trimmed.empty() ? std::string{"0"} : trimmed;
}

bool stage_less(const std::string& lhs, const std::string& rhs) {
    const auto left = parse_integer(lhs);
    const auto right = parse_integer(rhs);
    if (left && right) {
        return *left < *right;
    }
    if (left.has_value() != right.has_value()) {
        return left.has_value();
    }
    return lhs < rhs;
}

}  // namespace

namespace grader::harness {

std::string_view to_string(CaptureScope scope) noexcept {
    switch (scope) {
        case CaptureScope::Clients:
            return "clients";
        case CaptureScope::Servers:
            return "servers";
        case CaptureScope::ServersRequest:
            return "servers-req";
        case CaptureScope::ServersResponse:
            return "servers-resp";
    }
    return "clients";
}

std::optional<CaptureScope> parse_capture_scope(std::string_view name) {
    const auto lowered = strings::to_lower_copy(strings::trim_copy(name));
    for (auto scope : {CaptureScope::Clients, CaptureScope::Servers, CaptureScope::ServersRequest,
                       CaptureScope::ServersResponse}) {
        if (lowered == to_string(scope)) {
            return scope;
        }
    }
    return std::nullopt;
}

std::string CaptureKey::to_uri() const {
    std::string uri{kCaptureScheme};
    uri.append(to_string(scope));
    uri.push_back('/');
    uri.append(question_code);
    uri.push_back('/');
    uri.append(stage);
    return uri;
}

CaptureKey make_capture_key(CaptureScope scope, std::string_view question_code, std::string_view stage) {
    return CaptureKey{scope, normalized_question(question_code), normalized_stage(stage)};
}

bool is_capture_uri(std::string_view text) {
    return strings::istarts_with(trim_copy(text), kCaptureScheme);
}

std::optional<CaptureKey> parse_capture_uri(std::string_view text) {
    const auto trimmed = trim_copy(text);
    if (!strings::istarts_with(trimmed, kCaptureScheme)) {
        return std::nullopt;
    }
    const auto parts = strings::split(std::string_view{trimmed}.substr(kCaptureScheme.size()), '/');
    if (parts.empty() || parts.size() > 3) {
        return std::nullopt;
    }
    const auto scope = parse_capture_scope(parts[0]);
    if (!scope) {
        return std::nullopt;
    }
    const std::string question = parts.size() > 1 ? parts[1] : std::string{};
    const std::string stage = parts.size() > 2 ? parts[2] : std::string{};
    return make_capture_key(*scope, question, stage);
}

std::shared_ptr<CaptureStore::Entry> CaptureStore::find_entry(const CaptureKey& key) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<CaptureStore::Entry> CaptureStore::get_or_create(const CaptureKey& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = entries_[key];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

void CaptureStore::append(CaptureScope scope,
                          std::string_view question_code,
                          std::string_view stage,
                          std::string_view text) {
    auto entry = get_or_create(make_capture_key(scope, question_code, stage));
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->text.append(text);
}

void CaptureStore::replace(CaptureScope scope,
                           std::string_view question_code,
                           std::string_view stage,
                           std::string_view text) {
    auto entry = get_or_create(make_capture_key(scope, question_code, stage));
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->text.assign(text);
}

std::optional<std::string> CaptureStore::try_get(const CaptureKey& key) const {
    const auto entry = find_entry(make_capture_key(key.scope, key.question_code, key.stage));
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->text;
}

std::optional<std::string> CaptureStore::try_get(CaptureScope scope,
                                                 std::string_view question_code,
                                                 std::string_view stage) const {
    return try_get(make_capture_key(scope, question_code, stage));
}

void CaptureStore::set_metadata(std::string_view question_code,
                                std::string_view stage,
                                HttpMetadata metadata) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    metadata_[{normalized_question(question_code), normalized_stage(stage)}] = std::move(metadata);
}

std::optional<HttpMetadata> CaptureStore::try_get_metadata(std::string_view question_code,
                                                           std::string_view stage) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    const auto it = metadata_.find({normalized_question(question_code), normalized_stage(stage)});
    if (it == metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string CaptureStore::collect_stages(CaptureScope scope, std::string_view question_code) const {
    const auto question = normalized_question(question_code);

    std::vector<std::pair<std::string, std::shared_ptr<Entry>>> matches;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        for (const auto& [key, entry] : entries_) {
            if (key.scope == scope && key.question_code == question) {
                matches.emplace_back(key.stage, entry);
            }
        }
    }
    std::sort(matches.begin(), matches.end(),
              [](const auto& lhs, const auto& rhs) { return stage_less(lhs.first, rhs.first); });

    std::string combined;
    for (const auto& [stage, entry] : matches) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        combined.append(entry->text);
    }
    return combined;
}

void CaptureStore::clear_question(std::string_view question_code) {
    const auto question = normalized_question(question_code);
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::erase_if(entries_, [&](const auto& item) { return item.first.question_code == question; });
    std::erase_if(metadata_, [&](const auto& item) { return item.first.first == question; });
}

void CaptureStore::clear() {
    std::lock_guard<std::mutex> lock(map_mutex_);
    entries_.clear();
    metadata_.clear();
}

void CaptureStore::set_cursor(std::string_view question_code, std::string_view stage) {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    cursor_.question_code = normalized_question(question_code);
    cursor_.stage = normalized_stage(stage);
}

CaptureCursor CaptureStore::cursor() const {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    return cursor_;
}

std::size_t CaptureStore::entry_count() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    return entries_.size();
}

}  // namespace grader::harness
