#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

#include "grader_harness/http_message.hpp"
#include "grader_harness/log.hpp"

namespace grader::harness::http {

struct HttpCall {
    std::string method{"GET"};
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    /// Polled during the transfer; returning true aborts it.
    std::function<bool()> abort_requested;
};

struct HttpOutcome {
    /// False when no HTTP response was obtained (connect failure, timeout, abort).
    bool transport_ok{false};
    std::string error;
    HttpResponse response;
};

/**
 * \brief Blocking HTTP client on libcurl.
 *
 * One easy handle per call so the proxy handlers and the step executor can
 * use a shared instance concurrently. Redirects are not followed: the proxy
 * relays whatever the real server answers.
 */
class HttpClient {
public:
    HttpClient();

    void set_log_callback(Logger::LogCallback callback);
    void set_log_level(LogLevel level) noexcept { logger_.set_min_level(level); }

    [[nodiscard]] HttpOutcome perform(const HttpCall& call) const;

private:
    Logger logger_;
};

}  // namespace grader::harness::http
