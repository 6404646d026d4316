#include "grader_harness/http_message.hpp"

#include <cctype>
#include <sstream>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/strings.hpp"

namespace {

using grader::harness::ErrorCode;
using grader::harness::NetworkError;

namespace strings = grader::harness::strings;

// 15 hex digits keep the size well below SIZE_MAX.
constexpr std::size_t kMaxChunkSizeDigits = 15;

[[noreturn]] void invalid(const std::string& message) {
    throw NetworkError(ErrorCode::HttpRequestInvalid, message);
}

int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

template <typename Map>
auto find_header(Map& headers, std::string_view name) {
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        if (strings::iequals(it->first, name)) {
            return it;
        }
    }
    return headers.end();
}

}  // namespace

namespace grader::harness::http {

std::string HttpRequest::header(std::string_view name) const {
    const auto it = find_header(headers, name);
    return it == headers.end() ? std::string{} : it->second;
}

bool HttpRequest::has_header(std::string_view name) const {
    return find_header(headers, name) != headers.end();
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
    headers[name] = value;
}

std::string HttpResponse::header(std::string_view name) const {
    const auto it = find_header(headers, name);
    return it == headers.end() ? std::string{} : it->second;
}

HttpRequest parse_request_head(std::string_view head) {
    HttpRequest request;

    std::size_t line_start = 0;
    bool first = true;
    while (line_start <= head.size()) {
        auto line_end = head.find("\r\n", line_start);
        if (line_end == std::string_view::npos) {
            line_end = head.size();
        }
        const auto line = head.substr(line_start, line_end - line_start);
        line_start = line_end + 2;

        if (first) {
            first = false;
            const auto parts = strings::split(line, ' ');
            if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) {
                invalid("Malformed request line: " + std::string{line});
            }
            request.method = strings::to_upper_copy(parts[0]);
            request.target = parts[1];
            request.protocol = parts[2];
            if (request.protocol.rfind("HTTP/", 0) != 0) {
                invalid("Unsupported protocol: " + request.protocol);
            }
            const auto question = request.target.find('?');
            request.path = request.target.substr(0, question);
            if (question != std::string::npos) {
                request.query = request.target.substr(question + 1);
            }
            continue;
        }

        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            invalid("Malformed header line: " + std::string{line});
        }
        request.headers[strings::trim_copy(line.substr(0, colon))] = strings::trim_copy(line.substr(colon + 1));
    }

    if (first) {
        invalid("Empty request");
    }
    return request;
}

std::size_t content_length(const HttpRequest& request) {
    const auto raw = strings::trim_copy(request.header("Content-Length"));
    if (raw.empty()) {
        return 0;
    }
    const auto value = strings::parse_integer(raw);
    if (!value) {
        invalid("Invalid Content-Length: " + raw);
    }
    return static_cast<std::size_t>(*value);
}

bool is_chunked(const HttpRequest& request) {
    return strings::to_lower_copy(request.header("Transfer-Encoding")).find("chunked") != std::string::npos;
}

std::optional<std::string> decode_chunked(std::string_view raw) {
    std::string body;
    std::size_t pos = 0;
    while (true) {
        const auto line_end = raw.find("\r\n", pos);
        if (line_end == std::string_view::npos) {
            return std::nullopt;
        }
        auto size_text = raw.substr(pos, line_end - pos);
        const auto extension = size_text.find(';');
        if (extension != std::string_view::npos) {
            size_text = size_text.substr(0, extension);
        }
        const auto trimmed = strings::trim_copy(size_text);
        if (trimmed.empty()) {
            invalid("Empty chunk size");
        }
        if (trimmed.size() > kMaxChunkSizeDigits) {
            invalid("Chunk size too large: " + trimmed);
        }
        std::size_t size = 0;
        for (char ch : trimmed) {
            const int digit = hex_digit(ch);
            if (digit < 0) {
                invalid("Invalid chunk size: " + trimmed);
            }
            size = size * 16 + static_cast<std::size_t>(digit);
        }

        pos = line_end + 2;
        if (size == 0) {
            // Trailers end with an empty line.
            return raw.find("\r\n", pos) == std::string_view::npos ? std::nullopt
                                                                   : std::optional<std::string>{body};
        }
        if (pos > raw.size() || size > raw.size() - pos || raw.size() - pos - size < 2) {
            return std::nullopt;
        }
        body.append(raw.substr(pos, size));
        if (raw.substr(pos + size, 2) != "\r\n") {
            invalid("Chunk not terminated by CRLF");
        }
        pos += size + 2;
    }
}

std::string build_response(const HttpResponse& response) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << response.status_code << " "
        << (response.status_message.empty() ? status_message(response.status_code) : response.status_message)
        << "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (strings::iequals(name, "Content-Length") || strings::iequals(name, "Transfer-Encoding") ||
            strings::iequals(name, "Connection")) {
            continue;
        }
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << response.body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "\r\n";
    oss << response.body;
    return oss.str();
}

HttpResponse build_error_response(int status_code, const std::string& message) {
    HttpResponse response;
    response.status_code = status_code;
    response.status_message = status_message(status_code);
    response.set_content_type("text/plain; charset=utf-8");
    response.body = message;
    return response;
}

std::string status_message(int status_code) {
    switch (status_code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::map<std::string, std::string> parse_query_string(std::string_view query) {
    std::map<std::string, std::string> params;
    if (query.empty()) {
        return params;
    }
    for (const auto& pair : strings::split(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params[url_decode(pair)] = "";
        } else {
            params[url_decode(std::string_view{pair}.substr(0, eq))] =
                url_decode(std::string_view{pair}.substr(eq + 1));
        }
    }
    return params;
}

std::string url_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        const char ch = encoded[i];
        if (ch == '%' && i + 2 < encoded.size()) {
            const int hi = hex_digit(encoded[i + 1]);
            const int lo = hex_digit(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        decoded.push_back(ch == '+' ? ' ' : ch);
    }
    return decoded;
}

}  // namespace grader::harness::http
