#include "grader_harness/proxy_interceptor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "grader_harness/error_codes.hpp"
#include "grader_harness/strings.hpp"
#include "grader_harness/text_normalizer.hpp"

namespace {

namespace strings = grader::harness::strings;

using Clock = std::chrono::steady_clock;

constexpr std::size_t kRelayChunk = 8192;
constexpr std::string_view kHeadTerminator = "\r\n\r\n";

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool send_all(int fd, std::string_view data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

int connect_to(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const auto service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &results) != 0) {
        return -1;
    }
    int fd = -1;
    for (auto* info = results; info != nullptr; info = info->ai_next) {
        fd = ::socket(info->ai_family, info->ai_socktype | SOCK_CLOEXEC, info->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (::connect(fd, info->ai_addr, info->ai_addrlen) == 0) {
            break;
        }
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(results);
    return fd;
}

// Strips scheme and authority from an absolute-form request target.
std::string origin_form(const std::string& target) {
    const auto scheme = target.find("://");
    if (scheme == std::string::npos || target.front() == '/') {
        return target.empty() ? std::string{"/"} : target;
    }
    const auto path = target.find('/', scheme + 3);
    return path == std::string::npos ? std::string{"/"} : target.substr(path);
}

bool starts_like_json(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    return first != std::string_view::npos && (text[first] == '{' || text[first] == '[');
}

std::size_t payload_size(const std::string& body) {
    if (starts_like_json(body)) {
        if (auto canonical = grader::harness::canonical_json(body, false)) {
            return canonical->size();
        }
    }
    return body.size();
}

}  // namespace

namespace grader::harness {

std::string_view to_string(ProxyMode mode) noexcept {
    return mode == ProxyMode::Http ? "HTTP" : "TCP";
}

std::optional<ProxyMode> parse_proxy_mode(std::string_view name) {
    const auto upper = strings::to_upper_copy(strings::trim_copy(name));
    if (upper == "HTTP") return ProxyMode::Http;
    if (upper == "TCP") return ProxyMode::Tcp;
    return std::nullopt;
}

bool port_accepts_connections(const std::string& host, std::uint16_t port) {
    const int fd = connect_to(host, port);
    if (fd < 0) {
        return false;
    }
    ::close(fd);
    return true;
}

ProxyInterceptor::ProxyInterceptor(CaptureStore& store, Config config)
    : store_(store), config_(std::move(config)) {}

ProxyInterceptor::~ProxyInterceptor() {
    stop();
}

void ProxyInterceptor::set_log_callback(Logger::LogCallback callback) {
    logger_.set_callback(callback);
    client_.set_log_callback(std::move(callback));
}

void ProxyInterceptor::set_log_level(LogLevel level) noexcept {
    logger_.set_min_level(level);
    client_.set_log_level(level);
}

bool ProxyInterceptor::running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return mode_.has_value();
}

std::optional<ProxyMode> ProxyInterceptor::mode() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return mode_;
}

void ProxyInterceptor::start(ProxyMode mode) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (mode_ && *mode_ == mode) {
            return;
        }
    }
    stop();

    const auto endpoint = config_.bind_host + ":" + std::to_string(config_.public_port);
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw NetworkError(ErrorCode::ProxyStartFailed, errno_text("Cannot create proxy socket"));
    }

    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.public_port);
    if (::inet_pton(AF_INET, config_.bind_host.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        throw NetworkError(ErrorCode::ProxyStartFailed, "Invalid proxy bind address: " + config_.bind_host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        const auto message = errno_text("Cannot bind proxy on " + endpoint);
        ::close(fd);
        throw NetworkError(ErrorCode::ProxyStartFailed, message);
    }
    if (::listen(fd, SOMAXCONN) != 0) {
        const auto message = errno_text("Cannot listen on " + endpoint);
        ::close(fd);
        throw NetworkError(ErrorCode::ProxyStartFailed, message);
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_.store(ntohs(bound.sin_port));
    } else {
        bound_port_.store(config_.public_port);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    stopping_.store(false);
    mode_ = mode;
    listen_fd_ = fd;
    accept_thread_ = std::thread([this, fd] { accept_loop(fd); });

    logger_.info("[Proxy] " + std::string{to_string(mode)} + " proxy listening on " + config_.bind_host + ":" +
                 std::to_string(bound_port_.load()) + " -> " + config_.real_host + ":" +
                 std::to_string(config_.real_port));
}

void ProxyInterceptor::stop() {
    int fd = -1;
    std::thread accept_thread;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!mode_) {
            return;
        }
        stopping_.store(true);
        fd = listen_fd_;
        listen_fd_ = -1;
        accept_thread = std::move(accept_thread_);
        mode_.reset();
    }

    if (accept_thread.joinable()) {
        accept_thread.join();
    }
    if (fd >= 0) {
        ::close(fd);
    }

    std::unique_lock<std::mutex> lock(connections_mutex_);
    for (auto& connection : connections_) {
        std::lock_guard<std::mutex> fd_lock(connection->fd_mutex);
        for (int open_fd : connection->fds) {
            ::shutdown(open_fd, SHUT_RDWR);
        }
    }
    const bool drained = connections_cv_.wait_for(lock, config_.stop_grace, [this] {
        return std::all_of(connections_.begin(), connections_.end(),
                           [](const auto& connection) { return connection->done.load(); });
    });
    if (!drained) {
        logger_.warn("[Proxy] Handlers still busy after " + std::to_string(config_.stop_grace.count()) +
                     "ms grace; waiting for them to unwind");
    }
    auto remaining = std::move(connections_);
    connections_.clear();
    lock.unlock();

    for (auto& connection : remaining) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }

    bound_port_.store(0);
    logger_.info("[Proxy] Stopped");
}

void ProxyInterceptor::reap_finished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if ((*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& connection : finished) {
        if (connection->thread.joinable()) {
            connection->thread.join();
        }
    }
}

void ProxyInterceptor::register_fd(Connection& connection, int fd) {
    std::lock_guard<std::mutex> lock(connection.fd_mutex);
    connection.fds.push_back(fd);
}

void ProxyInterceptor::accept_loop(int listen_fd) {
    ProxyMode mode = ProxyMode::Http;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mode = mode_.value_or(ProxyMode::Http);
    }

    pollfd pfd{};
    pfd.fd = listen_fd;
    pfd.events = POLLIN;

    while (!stopping_.load()) {
        const int rc = ::poll(&pfd, 1, static_cast<int>(config_.accept_poll.count()));
        reap_finished();
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.error(errno_text("[Proxy] poll on listener failed"));
            break;
        }
        if (rc == 0) {
            continue;
        }

        const int client_fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED && !stopping_.load()) {
                logger_.warn(errno_text("[Proxy] accept failed"));
            }
            continue;
        }

        auto connection = std::make_unique<Connection>();
        Connection& ref = *connection;
        register_fd(ref, client_fd);

        std::lock_guard<std::mutex> lock(connections_mutex_);
        ref.thread = std::thread([this, &ref, client_fd, mode] {
            try {
                if (mode == ProxyMode::Http) {
                    handle_http(client_fd);
                } else {
                    handle_tcp(ref, client_fd);
                }
            } catch (const std::exception& ex) {
                logger_.error(std::string{"[Proxy] Connection handler failed: "} + ex.what());
                if (mode == ProxyMode::Http) {
                    send_all(client_fd, http::build_response(http::build_error_response(400, ex.what())));
                }
            }
            {
                std::lock_guard<std::mutex> fd_lock(ref.fd_mutex);
                for (int fd : ref.fds) {
                    ::close(fd);
                }
                ref.fds.clear();
            }
            {
                std::lock_guard<std::mutex> done_lock(connections_mutex_);
                ref.done.store(true);
            }
            connections_cv_.notify_all();
        });
        connections_.push_back(std::move(connection));
    }
}

void ProxyInterceptor::handle_http(int client_fd) {
    const auto cursor = store_.cursor();
    const auto read_deadline = Clock::now() + config_.upstream_timeout;

    std::string buffer;
    char chunk[kRelayChunk];
    auto read_more = [&]() -> bool {
        pollfd pfd{};
        pfd.fd = client_fd;
        pfd.events = POLLIN;
        while (!stopping_.load() && Clock::now() < read_deadline) {
            const int rc = ::poll(&pfd, 1, static_cast<int>(config_.accept_poll.count()));
            if (rc < 0 && errno != EINTR) {
                return false;
            }
            if (rc <= 0) {
                continue;
            }
            const auto n = ::recv(client_fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return false;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
            return buffer.size() <= config_.max_request_bytes;
        }
        return false;
    };

    std::size_t head_end = std::string::npos;
    while ((head_end = buffer.find(kHeadTerminator)) == std::string::npos) {
        if (!read_more()) {
            return;
        }
    }

    http::HttpRequest request;
    try {
        request = http::parse_request_head(std::string_view{buffer}.substr(0, head_end));
        const auto body_start = head_end + kHeadTerminator.size();
        if (http::is_chunked(request)) {
            std::optional<std::string> body;
            while (!(body = http::decode_chunked(std::string_view{buffer}.substr(body_start)))) {
                if (!read_more()) {
                    return;
                }
            }
            request.body = std::move(*body);
        } else {
            const auto length = http::content_length(request);
            while (buffer.size() < body_start + length) {
                if (!read_more()) {
                    return;
                }
            }
            request.body = buffer.substr(body_start, length);
        }
    } catch (const NetworkError& ex) {
        logger_.warn(std::string{"[Proxy] Rejecting malformed request: "} + ex.what());
        send_all(client_fd, http::build_response(http::build_error_response(400, ex.what())));
        return;
    }

    http::HttpCall call;
    call.method = request.method;
    call.url = "http://" + config_.real_host + ":" + std::to_string(config_.real_port) + origin_form(request.target);
    call.body = request.body;
    call.timeout = config_.upstream_timeout;
    call.abort_requested = [this] { return stopping_.load(); };
    for (const auto* name : {"Content-Type", "Accept"}) {
        if (request.has_header(name)) {
            call.headers[name] = request.header(name);
        }
    }

    auto outcome = client_.perform(call);
    http::HttpResponse response;
    if (outcome.transport_ok) {
        response.status_code = outcome.response.status_code;
        response.status_message = outcome.response.status_message;
        response.body = std::move(outcome.response.body);
        const auto content_type = outcome.response.header("Content-Type");
        if (!content_type.empty()) {
            response.set_content_type(content_type);
        }
        record_exchange(cursor, request, response);
    } else {
        logger_.warn("[Proxy] " + request.method + " " + request.target + " forward failed: " + outcome.error);
        response = http::build_error_response(502, "Proxy request failed: " + outcome.error);
    }

    if (!send_all(client_fd, http::build_response(response))) {
        logger_.debug(errno_text("[Proxy] Client went away before the response was sent"));
    }
}

void ProxyInterceptor::record_exchange(const CaptureCursor& cursor,
                                       const http::HttpRequest& request,
                                       const http::HttpResponse& response) {
    const auto response_text = is_valid_utf8(response.body)
                                   ? response.body
                                   : "<binary " + std::to_string(response.body.size()) + " bytes>";

    store_.replace(CaptureScope::ServersRequest, cursor.question_code, cursor.stage, request.body);
    store_.replace(CaptureScope::ServersResponse, cursor.question_code, cursor.stage, response_text);
    store_.set_metadata(cursor.question_code, cursor.stage,
                        HttpMetadata{request.method, response.status_code, payload_size(response.body)});
    exchanges_.fetch_add(1);

    logger_.info("[Proxy] " + request.method + " " + request.target + " -> " +
                 std::to_string(response.status_code) + " (" + std::to_string(response.body.size()) +
                 " bytes) [" + cursor.question_code + " stage " + cursor.stage + "]");

    if (!config_.traffic_log_dir.empty()) {
        const auto folder = config_.traffic_log_dir / cursor.question_code;
        std::error_code ec;
        std::filesystem::create_directories(folder, ec);
        std::ofstream out(folder / (cursor.stage + ".txt"), std::ios::binary);
        if (ec || !out.is_open()) {
            logger_.warn("[Proxy] Cannot write traffic log under " + folder.string());
            return;
        }
        out << "=== REQUEST ===\n"
            << request.method << " " << request.target << "\n"
            << request.body << "\n"
            << "=== RESPONSE ===\n"
            << response.status_code << " " << response.status_message << "\n"
            << response_text << "\n";
    }
}

void ProxyInterceptor::handle_tcp(Connection& connection, int client_fd) {
    const int upstream_fd = connect_to(config_.real_host, config_.real_port);
    if (upstream_fd < 0) {
        logger_.warn("[Proxy] TCP relay cannot reach " + config_.real_host + ":" + std::to_string(config_.real_port));
        return;
    }
    register_fd(connection, upstream_fd);

    std::thread backward([this, upstream_fd, client_fd] {
        relay(upstream_fd, client_fd, CaptureScope::ServersResponse);
        ::shutdown(client_fd, SHUT_RDWR);
        ::shutdown(upstream_fd, SHUT_RDWR);
    });
    relay(client_fd, upstream_fd, CaptureScope::ServersRequest);
    ::shutdown(client_fd, SHUT_RDWR);
    ::shutdown(upstream_fd, SHUT_RDWR);
    backward.join();
}

void ProxyInterceptor::relay(int from_fd, int to_fd, CaptureScope scope) {
    char chunk[kRelayChunk];
    pollfd pfd{};
    pfd.fd = from_fd;
    pfd.events = POLLIN;

    while (!stopping_.load()) {
        const int rc = ::poll(&pfd, 1, static_cast<int>(config_.accept_poll.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            continue;
        }
        const auto n = ::recv(from_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        const std::string_view data{chunk, static_cast<std::size_t>(n)};
        const auto cursor = store_.cursor();
        store_.append(scope, cursor.question_code, cursor.stage, data);
        if (!send_all(to_fd, data)) {
            break;
        }
    }
}

}  // namespace grader::harness
