#ifndef ISO8583_GATEWAY_NETWORK_NETWORK_ADAPTER_H
#define ISO8583_GATEWAY_NETWORK_NETWORK_ADAPTER_H

/**
 * @file network_adapter.h
 * @brief Network layer abstraction for the ISO 8583 gateway
 *
 * Abstract session and server interfaces so the dispatch engine does not
 * depend on a particular socket implementation. The BSD socket
 * implementation lives in src/network/bsd_tcp_server.h.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace iso8583::gateway::network {

// =============================================================================
// Error Codes (-980 to -989)
// =============================================================================

/**
 * @brief Transport error codes
 */
enum class network_error : int {
    /** No data before the deadline */
    timeout = -980,

    /** Peer or local side closed the connection */
    connection_closed = -981,

    /** A socket system call failed */
    socket_error = -982,

    /** bind() or listen() failed, usually a port in use */
    bind_failed = -983,

    /** Bad backlog, poll interval or bind address */
    invalid_config = -984,

    /** recv()/send() returned EAGAIN */
    would_block = -985,

    /** Server already started */
    already_running = -986
};

[[nodiscard]] constexpr int to_error_code(network_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Message for a network_error
 */
[[nodiscard]] constexpr const char* to_string(network_error error) noexcept {
    switch (error) {
        case network_error::timeout:
            return "Network operation timed out";
        case network_error::connection_closed:
            return "Connection closed";
        case network_error::socket_error:
            return "Socket call failed";
        case network_error::bind_failed:
            return "Cannot listen on port";
        case network_error::invalid_config:
            return "Invalid listener configuration";
        case network_error::would_block:
            return "Socket would block";
        case network_error::already_running:
            return "Server is already running";
        default:
            return "Unknown network error";
    }
}

// =============================================================================
// Listener Settings
// =============================================================================

/**
 * @brief Listener configuration
 */
struct server_config {
    /** Port to listen on (0 = ephemeral port chosen by the system) */
    uint16_t port = 8583;

    /** IPv4 address to listen on; empty listens on all interfaces */
    std::string bind_address;

    /** listen() backlog */
    int backlog = 128;

    /** SO_KEEPALIVE on accepted connections */
    bool keep_alive = true;

    /** Seconds idle before the first probe */
    int keep_alive_idle = 60;

    /** Seconds between probes */
    int keep_alive_interval = 10;

    /** Unanswered probes before the connection drops */
    int keep_alive_count = 3;

    /** TCP_NODELAY on accepted connections */
    bool no_delay = true;

    /** SO_REUSEADDR on the listener */
    bool reuse_addr = true;

    /** Poll interval of the accept loop while waiting for stop requests */
    std::chrono::milliseconds accept_poll_interval{100};

    [[nodiscard]] bool is_valid() const noexcept {
        return backlog > 0 && accept_poll_interval.count() > 0;
    }
};

/**
 * @brief Per-connection byte counters and timestamps
 */
struct session_stats {
    /** Bytes read so far */
    size_t bytes_received = 0;

    /** Bytes written so far */
    size_t bytes_sent = 0;

    /** Session start time */
    std::chrono::system_clock::time_point connected_at;

    /** Last activity time */
    std::chrono::system_clock::time_point last_activity;
};

// =============================================================================
// Session Interface
// =============================================================================

/**
 * @brief Abstract interface for one accepted TCP connection
 */
class tcp_session {
public:
    virtual ~tcp_session() = default;

    tcp_session(const tcp_session&) = delete;
    tcp_session& operator=(const tcp_session&) = delete;

    /**
     * @brief Receive up to max_bytes within the timeout
     *
     * Returns as soon as some data is available.
     *
     * @param max_bytes Upper bound on the returned chunk
     * @param timeout How long to wait for the first byte
     * @return Received data or error (timeout, connection_closed, ...)
     */
    [[nodiscard]] virtual std::expected<std::vector<uint8_t>, network_error>
    receive(size_t max_bytes, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Send all bytes
     *
     * @return data.size() once everything is written
     */
    [[nodiscard]] virtual std::expected<size_t, network_error>
    send(std::span<const uint8_t> data) = 0;

    /**
     * @brief Shut the connection down
     *
     * Wakes up a receive() blocked in another thread.
     */
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    [[nodiscard]] virtual session_stats get_stats() const noexcept = 0;

    [[nodiscard]] virtual std::string remote_address() const noexcept = 0;

    [[nodiscard]] virtual uint16_t remote_port() const noexcept = 0;

    [[nodiscard]] virtual uint64_t session_id() const noexcept = 0;

protected:
    tcp_session() = default;
};

// =============================================================================
// Server Adapter Interface
// =============================================================================

/**
 * @brief Abstract listener that accepts connections
 */
class tcp_server_adapter {
public:
    /**
     * @brief Called on the accept thread for every accepted connection
     *
     * The callback receives ownership of the session.
     */
    using on_connection_callback =
        std::function<void(std::unique_ptr<tcp_session> session)>;

    virtual ~tcp_server_adapter() = default;

    tcp_server_adapter(const tcp_server_adapter&) = delete;
    tcp_server_adapter& operator=(const tcp_server_adapter&) = delete;
    tcp_server_adapter(tcp_server_adapter&&) = delete;
    tcp_server_adapter& operator=(tcp_server_adapter&&) = delete;

    /**
     * @brief Bind, listen and start the accept thread
     */
    [[nodiscard]] virtual std::expected<void, network_error> start() = 0;

    /**
     * @brief Stop accepting connections
     *
     * Sessions already handed to the callback are not affected.
     */
    virtual void stop() = 0;

    [[nodiscard]] virtual bool is_running() const noexcept = 0;

    /**
     * @brief Listening port (actual port when configured with 0)
     */
    [[nodiscard]] virtual uint16_t port() const noexcept = 0;

    /**
     * @brief Set the callback for new connections; call before start()
     */
    virtual void on_connection(on_connection_callback callback) = 0;

    /**
     * @brief Connections accepted since start()
     */
    [[nodiscard]] virtual size_t accepted_count() const noexcept = 0;

protected:
    tcp_server_adapter() = default;
};

}  // namespace iso8583::gateway::network

#endif  // ISO8583_GATEWAY_NETWORK_NETWORK_ADAPTER_H
