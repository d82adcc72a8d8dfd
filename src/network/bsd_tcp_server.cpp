/**
 * @file bsd_tcp_server.cpp
 * @brief BSD socket implementation of the network adapter
 */

#include "bsd_tcp_server.h"

#include "iso8583/gateway/integration/logger_adapter.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace iso8583::gateway::network {

namespace {

/** Longest wait for a full send buffer to drain */
constexpr std::chrono::milliseconds SEND_STALL_TIMEOUT{5000};

[[nodiscard]] bool is_would_block_error(int error) {
    return error == EWOULDBLOCK || error == EAGAIN;
}

void close_socket(socket_t sock) {
    if (sock != INVALID_SOCKET_VALUE) {
        ::close(sock);
    }
}

[[nodiscard]] int to_poll_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<std::chrono::milliseconds::rep>(
        timeout.count(), std::numeric_limits<int>::max()));
}

[[nodiscard]] bool set_option(socket_t sock, int level, int name, int value) {
    return ::setsockopt(sock, level, name, &value, sizeof(value)) == 0;
}

/**
 * @brief Build the IPv4 listen address; empty means all interfaces
 */
[[nodiscard]] std::expected<sockaddr_in, network_error> resolve_bind_address(
    const std::string& bind_address, uint16_t port) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);

    if (bind_address.empty()) {
        address.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, bind_address.c_str(), &address.sin_addr) != 1) {
        return std::unexpected(network_error::invalid_config);
    }
    return address;
}

[[nodiscard]] std::string peer_address(const sockaddr_in& peer) {
    char text[INET_ADDRSTRLEN] = {};
    if (::inet_ntop(AF_INET, &peer.sin_addr, text, sizeof(text)) == nullptr) {
        return {};
    }
    return text;
}

}  // namespace

// =============================================================================
// BSD Session Implementation
// =============================================================================

bsd_tcp_session::bsd_tcp_session(socket_t sock, uint64_t session_id,
                                 std::string remote_addr,
                                 uint16_t remote_port)
    : socket_(sock),
      session_id_(session_id),
      remote_addr_(std::move(remote_addr)),
      remote_port_(remote_port) {
    stats_.connected_at = std::chrono::system_clock::now();
    stats_.last_activity = stats_.connected_at;
}

bsd_tcp_session::~bsd_tcp_session() {
    close();
    close_socket(socket_.exchange(INVALID_SOCKET_VALUE));
}

std::expected<std::vector<uint8_t>, network_error>
bsd_tcp_session::receive(size_t max_bytes,
                         std::chrono::milliseconds timeout) {
    if (!is_open_) {
        return std::unexpected(network_error::connection_closed);
    }

    auto ready = wait_for_io(true, timeout);
    if (!ready) {
        return std::unexpected(ready.error());
    }
    if (!*ready) {
        return std::unexpected(network_error::timeout);
    }

    std::vector<uint8_t> buffer(max_bytes);
    ssize_t bytes_received = ::recv(socket_, buffer.data(), max_bytes, 0);

    if (bytes_received < 0) {
        if (is_would_block_error(errno)) {
            return std::unexpected(network_error::would_block);
        }
        is_open_ = false;
        return std::unexpected(network_error::socket_error);
    }

    if (bytes_received == 0) {
        is_open_ = false;
        return std::unexpected(network_error::connection_closed);
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.bytes_received += static_cast<size_t>(bytes_received);
        stats_.last_activity = std::chrono::system_clock::now();
    }

    buffer.resize(static_cast<size_t>(bytes_received));
    return buffer;
}

std::expected<size_t, network_error>
bsd_tcp_session::send(std::span<const uint8_t> data) {
    if (!is_open_) {
        return std::unexpected(network_error::connection_closed);
    }

    auto pending = data;
    while (!pending.empty()) {
        ssize_t sent = ::send(socket_, pending.data(), pending.size(), MSG_NOSIGNAL);
        if (sent > 0) {
            pending = pending.subspan(static_cast<size_t>(sent));
            continue;
        }

        if (sent < 0 && is_would_block_error(errno)) {
            auto writable = wait_for_io(false, SEND_STALL_TIMEOUT);
            if (!writable || !*writable) {
                return std::unexpected(network_error::timeout);
            }
            continue;
        }

        is_open_ = false;
        return std::unexpected(sent == 0 ? network_error::connection_closed
                                         : network_error::socket_error);
    }

    std::lock_guard lock(stats_mutex_);
    stats_.bytes_sent += data.size();
    stats_.last_activity = std::chrono::system_clock::now();
    return data.size();
}

void bsd_tcp_session::close() {
    // shutdown() wakes a poll()/recv() blocked in another thread; the
    // descriptor itself is released by the destructor.
    if (is_open_.exchange(false)) {
        ::shutdown(socket_, SHUT_RDWR);
    }
}

bool bsd_tcp_session::is_open() const noexcept { return is_open_; }

session_stats bsd_tcp_session::get_stats() const noexcept {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

std::string bsd_tcp_session::remote_address() const noexcept {
    return remote_addr_;
}

uint16_t bsd_tcp_session::remote_port() const noexcept { return remote_port_; }

uint64_t bsd_tcp_session::session_id() const noexcept { return session_id_; }

std::expected<bool, network_error>
bsd_tcp_session::wait_for_io(bool for_read,
                             std::chrono::milliseconds timeout) {
    struct pollfd pfd;
    pfd.fd = socket_;
    pfd.events = for_read ? POLLIN : POLLOUT;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, to_poll_timeout(timeout));

    if (result < 0) {
        return std::unexpected(network_error::socket_error);
    }

    if (result == 0) {
        return false;
    }

    // POLLHUP with pending data still reads the data first
    if ((pfd.revents & pfd.events) != 0) {
        return true;
    }

    is_open_ = false;
    return std::unexpected(network_error::connection_closed);
}

// =============================================================================
// BSD Server Implementation
// =============================================================================

bsd_tcp_server::bsd_tcp_server(const server_config& config)
    : config_(config) {}

bsd_tcp_server::~bsd_tcp_server() { stop(); }

std::expected<void, network_error> bsd_tcp_server::start() {
    std::lock_guard lock(state_mutex_);

    if (running_) {
        return std::unexpected(network_error::already_running);
    }

    if (!config_.is_valid()) {
        return std::unexpected(network_error::invalid_config);
    }

    if (auto result = create_server_socket(); !result) {
        return result;
    }

    running_ = true;
    stop_requested_ = false;
    accepted_ = 0;
    accept_thread_ = std::thread([this] { accept_loop(); });

    return {};
}

void bsd_tcp_server::stop() {
    std::lock_guard lock(state_mutex_);
    if (!running_) {
        return;
    }

    stop_requested_ = true;
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    close_socket(server_socket_);
    server_socket_ = INVALID_SOCKET_VALUE;
    running_ = false;
}

bool bsd_tcp_server::is_running() const noexcept { return running_; }

uint16_t bsd_tcp_server::port() const noexcept {
    return running_ ? bound_port_.load() : config_.port;
}

void bsd_tcp_server::on_connection(on_connection_callback callback) {
    connection_callback_ = std::move(callback);
}

size_t bsd_tcp_server::accepted_count() const noexcept { return accepted_; }

std::expected<void, network_error> bsd_tcp_server::create_server_socket() {
    auto address = resolve_bind_address(config_.bind_address, config_.port);
    if (!address) {
        return std::unexpected(address.error());
    }

    socket_t listener = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (listener == INVALID_SOCKET_VALUE) {
        return std::unexpected(network_error::socket_error);
    }

    network_error failure = network_error::socket_error;
    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);

    if (!configure_socket_options(listener, true)) {
        failure = network_error::socket_error;
    } else if (::bind(listener, reinterpret_cast<const sockaddr*>(&*address),
                      sizeof(*address)) < 0 ||
               ::listen(listener, config_.backlog) < 0) {
        failure = network_error::bind_failed;
    } else if (::getsockname(listener, reinterpret_cast<sockaddr*>(&bound),
                             &bound_len) == 0) {
        server_socket_ = listener;
        bound_port_ = ntohs(bound.sin_port);
        return {};
    }

    close_socket(listener);
    return std::unexpected(failure);
}

bool bsd_tcp_server::configure_socket_options(socket_t sock,
                                              bool listener) const {
    if (listener) {
        return !config_.reuse_addr ||
               set_option(sock, SOL_SOCKET, SO_REUSEADDR, 1);
    }

    if (config_.no_delay && !set_option(sock, IPPROTO_TCP, TCP_NODELAY, 1)) {
        return false;
    }
    if (!config_.keep_alive) {
        return true;
    }

#if defined(__linux__)
    return set_option(sock, SOL_SOCKET, SO_KEEPALIVE, 1) &&
           set_option(sock, IPPROTO_TCP, TCP_KEEPIDLE, config_.keep_alive_idle) &&
           set_option(sock, IPPROTO_TCP, TCP_KEEPINTVL,
                      config_.keep_alive_interval) &&
           set_option(sock, IPPROTO_TCP, TCP_KEEPCNT, config_.keep_alive_count);
#elif defined(__APPLE__)
    return set_option(sock, SOL_SOCKET, SO_KEEPALIVE, 1) &&
           set_option(sock, IPPROTO_TCP, TCP_KEEPALIVE, config_.keep_alive_idle);
#else
    return set_option(sock, SOL_SOCKET, SO_KEEPALIVE, 1);
#endif
}

void bsd_tcp_server::accept_loop() {
    auto& logger = integration::get_logger();
    pollfd listener{.fd = server_socket_, .events = POLLIN, .revents = 0};

    while (!stop_requested_) {
        listener.revents = 0;
        int ready =
            ::poll(&listener, 1, to_poll_timeout(config_.accept_poll_interval));
        if (ready == 0 || (ready < 0 && errno == EINTR)) {
            continue;
        }

        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        socket_t client = ready < 0
                              ? INVALID_SOCKET_VALUE
                              : ::accept(server_socket_,
                                         reinterpret_cast<sockaddr*>(&peer),
                                         &peer_len);

        if (client == INVALID_SOCKET_VALUE) {
            if (stop_requested_) {
                break;
            }
            logger.error(std::string("New client rejected by : ") +
                         std::strerror(errno));
            continue;
        }

        if (!configure_socket_options(client, false)) {
            logger.error(std::string("New client rejected by : ") +
                         to_string(network_error::socket_error));
            close_socket(client);
            continue;
        }

        ++accepted_;
        auto session = std::make_unique<bsd_tcp_session>(
            client, next_session_id_++, peer_address(peer),
            ntohs(peer.sin_port));

        if (connection_callback_) {
            connection_callback_(std::move(session));
        }
    }
}

}  // namespace iso8583::gateway::network
