#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace grader::harness {

/// Reserved scheme of capture references.
inline constexpr std::string_view kCaptureScheme = "memory://";

/**
 * \brief Disjoint namespaces of captured evidence.
 *
 * Console output lives under Clients/Servers, intercepted HTTP payloads under
 * ServersRequest/ServersResponse. A write to one scope is never visible
 * through another.
 */
enum class CaptureScope {
    Clients,
    Servers,
    ServersRequest,
    ServersResponse,
};

/// Wire name used in capture references: clients, servers, servers-req, servers-resp.
[[nodiscard]] std::string_view to_string(CaptureScope scope) noexcept;
[[nodiscard]] std::optional<CaptureScope> parse_capture_scope(std::string_view name);

/// True for the console output scopes.
[[nodiscard]] inline bool is_console_scope(CaptureScope scope) noexcept {
    return scope == CaptureScope::Clients || scope == CaptureScope::Servers;
}

struct CaptureKey {
    CaptureScope scope{CaptureScope::Clients};
    std::string question_code;
    std::string stage;

    /// memory://scope/question/stage
    [[nodiscard]] std::string to_uri() const;

    friend auto operator<=>(const CaptureKey&, const CaptureKey&) = default;
};

/// Builds a key with blank question mapped to "Unknown" and blank stage to "0".
[[nodiscard]] CaptureKey make_capture_key(CaptureScope scope,
                                          std::string_view question_code,
                                          std::string_view stage);

[[nodiscard]] bool is_capture_uri(std::string_view text);
[[nodiscard]] std::optional<CaptureKey> parse_capture_uri(std::string_view text);

struct HttpMetadata {
    std::string method;
    int status_code{0};
    std::size_t byte_size{0};
};

/// Question/stage currently executing; producers publish under it.
struct CaptureCursor {
    std::string question_code{"Unknown"};
    std::string stage{"0"};
};

/**
 * \brief Namespaced in-memory ledger shared by the output pumps, the proxy
 * handlers and the comparison engine.
 *
 * Locking is per key: the store mutex only guards the key maps, every entry
 * carries its own mutex for the text mutation. No cross-key invariant is
 * maintained here.
 */
class CaptureStore {
public:
    CaptureStore() = default;
    CaptureStore(const CaptureStore&) = delete;
    CaptureStore& operator=(const CaptureStore&) = delete;

    void append(CaptureScope scope,
                std::string_view question_code,
                std::string_view stage,
                std::string_view text);

    void replace(CaptureScope scope,
                 std::string_view question_code,
                 std::string_view stage,
                 std::string_view text);

    /// nullopt when nothing was ever written; an empty string when written but empty.
    [[nodiscard]] std::optional<std::string> try_get(const CaptureKey& key) const;
    [[nodiscard]] std::optional<std::string> try_get(CaptureScope scope,
                                                     std::string_view question_code,
                                                     std::string_view stage) const;

    void set_metadata(std::string_view question_code, std::string_view stage, HttpMetadata metadata);
    [[nodiscard]] std::optional<HttpMetadata> try_get_metadata(std::string_view question_code,
                                                               std::string_view stage) const;

    /**
     * Concatenates every stage of one question in stage order. Numeric stages
     * sort numerically and precede the others, which sort lexically.
     */
    [[nodiscard]] std::string collect_stages(CaptureScope scope, std::string_view question_code) const;

    /// Drops every text entry and metadata record of one question.
    void clear_question(std::string_view question_code);
    void clear();

    void set_cursor(std::string_view question_code, std::string_view stage);
    [[nodiscard]] CaptureCursor cursor() const;

    [[nodiscard]] std::size_t entry_count() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        std::string text;
    };

    std::shared_ptr<Entry> find_entry(const CaptureKey& key) const;
    std::shared_ptr<Entry> get_or_create(const CaptureKey& key);

    mutable std::mutex map_mutex_;
    std::map<CaptureKey, std::shared_ptr<Entry>> entries_;
    std::map<std::pair<std::string, std::string>, HttpMetadata> metadata_;

    mutable std::mutex cursor_mutex_;
    CaptureCursor cursor_{};
};

}  // namespace grader::harness
