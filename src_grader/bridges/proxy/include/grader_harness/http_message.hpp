#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace grader::harness::http {

struct HttpRequest {
    std::string method;    // GET, POST, ...
    std::string target;    // raw request target: path plus optional ?query
    std::string path;      // target without the query
    std::string query;     // text after '?', without the '?'
    std::string protocol;  // HTTP/1.1
    std::map<std::string, std::string> headers;
    std::string body;

    /// Case-insensitive header lookup; empty when absent.
    [[nodiscard]] std::string header(std::string_view name) const;
    [[nodiscard]] bool has_header(std::string_view name) const;
};

struct HttpResponse {
    int status_code{200};
    std::string status_message{"OK"};
    std::map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value);
    void set_content_type(const std::string& content_type) { set_header("Content-Type", content_type); }
    [[nodiscard]] std::string header(std::string_view name) const;
};

/// Parses the request line and headers (everything before the blank line).
/// Throws NetworkError (HttpRequestInvalid) when malformed.
[[nodiscard]] HttpRequest parse_request_head(std::string_view head);

/// Body length announced by Content-Length; 0 when absent. Throws on a bad value.
[[nodiscard]] std::size_t content_length(const HttpRequest& request);

[[nodiscard]] bool is_chunked(const HttpRequest& request);

/**
 * Decodes a chunked transfer body. Returns nullopt while the terminating
 * zero-length chunk has not arrived yet; throws NetworkError on bad framing.
 */
[[nodiscard]] std::optional<std::string> decode_chunked(std::string_view raw);

/// Serialises status line, headers (Content-Length recomputed) and body.
[[nodiscard]] std::string build_response(const HttpResponse& response);

[[nodiscard]] HttpResponse build_error_response(int status_code, const std::string& message);

[[nodiscard]] std::string status_message(int status_code);

[[nodiscard]] std::map<std::string, std::string> parse_query_string(std::string_view query);
[[nodiscard]] std::string url_decode(std::string_view encoded);

}  // namespace grader::harness::http
