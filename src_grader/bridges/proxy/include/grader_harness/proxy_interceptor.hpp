#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "grader_harness/capture_store.hpp"
#include "grader_harness/http_client.hpp"
#include "grader_harness/log.hpp"

namespace grader::harness {

enum class ProxyMode {
    Http,
    Tcp,
};

[[nodiscard]] std::string_view to_string(ProxyMode mode) noexcept;

/// "HTTP" or "TCP", case-insensitive.
[[nodiscard]] std::optional<ProxyMode> parse_proxy_mode(std::string_view name);

/// True when a TCP connection to host:port can be established right now.
[[nodiscard]] bool port_accepts_connections(const std::string& host, std::uint16_t port);

/**
 * \brief Forwarding listener between the public port and the real server.
 *
 * HTTP mode rebuilds each request against the real port, relays the answer
 * unmodified and records the exchange under servers-req / servers-resp plus
 * an HttpMetadata record, all keyed by the store cursor at arrival time.
 * Console output scopes are never written here.
 *
 * TCP mode copies raw bytes in both directions with two loops per
 * connection; client-to-server bytes are appended to servers-req and
 * server-to-client bytes to servers-resp.
 */
class ProxyInterceptor {
public:
    struct Config {
        std::string bind_host{"127.0.0.1"};
        std::uint16_t public_port{5000};
        std::string real_host{"127.0.0.1"};
        std::uint16_t real_port{5001};
        std::chrono::milliseconds upstream_timeout{30000};
        std::chrono::milliseconds stop_grace{2000};
        std::chrono::milliseconds accept_poll{100};
        std::size_t max_request_bytes{16 * 1024 * 1024};
        /// When set, each HTTP exchange is also written to <dir>/<question>/<stage>.txt.
        std::filesystem::path traffic_log_dir{};
    };

    ProxyInterceptor(CaptureStore& store, Config config);
    ~ProxyInterceptor();

    ProxyInterceptor(const ProxyInterceptor&) = delete;
    ProxyInterceptor& operator=(const ProxyInterceptor&) = delete;

    void set_log_callback(Logger::LogCallback callback);
    void set_log_level(LogLevel level) noexcept;

    /**
     * Idempotent for the running mode; switching mode restarts the listener.
     * Throws NetworkError (ProxyStartFailed) when the port cannot be bound.
     */
    void start(ProxyMode mode);

    /// Idempotent. Waits up to stop_grace for handlers after closing everything.
    void stop();

    [[nodiscard]] bool running() const;
    [[nodiscard]] std::optional<ProxyMode> mode() const;

    /// Port actually bound (differs from public_port when configured as 0).
    [[nodiscard]] std::uint16_t bound_port() const noexcept { return bound_port_.load(); }

    /// Completed HTTP exchanges since construction.
    [[nodiscard]] std::size_t exchange_count() const noexcept { return exchanges_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
        std::mutex fd_mutex;
        std::vector<int> fds;
    };

    void accept_loop(int listen_fd);
    void handle_http(int client_fd);
    void handle_tcp(Connection& connection, int client_fd);
    void relay(int from_fd, int to_fd, CaptureScope scope);

    void record_exchange(const CaptureCursor& cursor,
                         const http::HttpRequest& request,
                         const http::HttpResponse& response);

    void reap_finished();
    void register_fd(Connection& connection, int fd);

    CaptureStore& store_;
    Config config_;
    Logger logger_;
    http::HttpClient client_;

    mutable std::mutex state_mutex_;
    std::optional<ProxyMode> mode_;
    int listen_fd_{-1};
    std::thread accept_thread_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint16_t> bound_port_{0};
    std::atomic<std::size_t> exchanges_{0};

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::list<std::unique_ptr<Connection>> connections_;
};

}  // namespace grader::harness
