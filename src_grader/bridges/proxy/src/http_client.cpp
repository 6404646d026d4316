#include "grader_harness/http_client.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>
#include <utility>

#include "grader_harness/strings.hpp"

namespace {

namespace strings = grader::harness::strings;

struct ResponseSink {
    std::string body;
    std::map<std::string, std::string> headers;
};

// libcurl write callback - accumulates response body
size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<ResponseSink*>(userp)->body.append(contents, total);
    return total;
}

// libcurl header callback - captures response headers of the final response
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    const size_t total = size * nitems;
    auto* sink = static_cast<ResponseSink*>(userp);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) {
        return total;
    }
    if (line.rfind("HTTP/", 0) == 0) {
        // A new status line (e.g. after 100 Continue) starts a fresh header set.
        sink->headers.clear();
        return total;
    }
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        sink->headers[line.substr(0, colon)] = strings::trim_copy(line.substr(colon + 1));
    }
    return total;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* abort = static_cast<const std::function<bool()>*>(clientp);
    return (*abort && (*abort)()) ? 1 : 0;
}

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

struct EasyHandle {
    CURL* curl{curl_easy_init()};
    curl_slist* headers{nullptr};
    ~EasyHandle() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

}  // namespace

namespace grader::harness::http {

HttpClient::HttpClient() {
    global_init_once();
}

void HttpClient::set_log_callback(Logger::LogCallback callback) {
    logger_.set_callback(std::move(callback));
}

HttpOutcome HttpClient::perform(const HttpCall& call) const {
    HttpOutcome outcome;

    EasyHandle handle;
    if (!handle.curl) {
        outcome.error = "libcurl initialization failed";
        logger_.error("[HttpClient] " + outcome.error);
        return outcome;
    }
    CURL* curl = handle.curl;

    ResponseSink sink;
    const auto method = strings::to_upper_copy(call.method.empty() ? std::string{"GET"} : call.method);

    curl_easy_setopt(curl, CURLOPT_URL, call.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(call.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    // Programs under test run locally; ignore http_proxy from the environment.
    curl_easy_setopt(curl, CURLOPT_PROXY, "");

    if (call.abort_requested) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &call.abort_requested);
    }

    if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (method != "GET" || !call.body.empty()) {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (!call.body.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, call.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(call.body.size()));
        }
    }

    // Forward request headers (curl sets Host and Content-Length itself)
    for (const auto& [name, value] : call.headers) {
        if (strings::iequals(name, "Host") || strings::iequals(name, "Content-Length")) {
            continue;
        }
        const auto header = name + ": " + value;
        handle.headers = curl_slist_append(handle.headers, header.c_str());
    }
    handle.headers = curl_slist_append(handle.headers, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.headers);

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        outcome.error = curl_easy_strerror(res);
        logger_.debug("[HttpClient] " + method + " " + call.url + " failed: " + outcome.error);
        return outcome;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    outcome.transport_ok = true;
    outcome.response.status_code = static_cast<int>(http_code);
    outcome.response.status_message = status_message(outcome.response.status_code);
    outcome.response.body = std::move(sink.body);
    for (auto& [name, value] : sink.headers) {
        if (strings::iequals(name, "Transfer-Encoding") || strings::iequals(name, "Content-Length")) {
            continue;
        }
        outcome.response.headers[name] = std::move(value);
    }

    logger_.debug("[HttpClient] " + method + " " + call.url + " -> HTTP " + std::to_string(http_code) + " (" +
                  std::to_string(outcome.response.body.size()) + " bytes)");
    return outcome;
}

}  // namespace grader::harness::http
