#ifndef ISO8583_GATEWAY_NETWORK_BSD_TCP_SERVER_H
#define ISO8583_GATEWAY_NETWORK_BSD_TCP_SERVER_H

/**
 * @file bsd_tcp_server.h
 * @brief BSD socket implementation of the network adapter (POSIX)
 */

#include "iso8583/gateway/network/network_adapter.h"

#include <atomic>
#include <mutex>
#include <thread>

namespace iso8583::gateway::network {

using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

// =============================================================================
// BSD Socket Session
// =============================================================================

class bsd_tcp_session : public tcp_session {
public:
    /**
     * @param sock Connected socket (owned)
     * @param session_id Unique identifier for this session
     * @param remote_addr Remote peer address
     * @param remote_port Remote peer port
     */
    bsd_tcp_session(socket_t sock, uint64_t session_id,
                    std::string remote_addr, uint16_t remote_port);

    ~bsd_tcp_session() override;

    [[nodiscard]] std::expected<std::vector<uint8_t>, network_error>
    receive(size_t max_bytes, std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::expected<size_t, network_error>
    send(std::span<const uint8_t> data) override;

    void close() override;

    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] session_stats get_stats() const noexcept override;

    [[nodiscard]] std::string remote_address() const noexcept override;

    [[nodiscard]] uint16_t remote_port() const noexcept override;

    [[nodiscard]] uint64_t session_id() const noexcept override;

private:
    /**
     * @brief Wait until the socket is readable/writable
     *
     * @param for_read true = wait for read, false = wait for write
     * @return true if ready, false on timeout
     */
    [[nodiscard]] std::expected<bool, network_error>
    wait_for_io(bool for_read, std::chrono::milliseconds timeout);

    std::atomic<socket_t> socket_;
    uint64_t session_id_;
    std::string remote_addr_;
    uint16_t remote_port_;

    mutable std::mutex stats_mutex_;
    session_stats stats_;

    std::atomic<bool> is_open_{true};
};

// =============================================================================
// BSD Socket Server
// =============================================================================

/**
 * @brief Listener with a dedicated accept thread
 *
 * The accept thread polls the listening socket so that stop() can end it
 * without racing a blocked accept(). A failed accept is logged and the
 * loop keeps running.
 */
class bsd_tcp_server : public tcp_server_adapter {
public:
    explicit bsd_tcp_server(const server_config& config);

    ~bsd_tcp_server() override;

    [[nodiscard]] std::expected<void, network_error> start() override;

    void stop() override;

    [[nodiscard]] bool is_running() const noexcept override;

    [[nodiscard]] uint16_t port() const noexcept override;

    void on_connection(on_connection_callback callback) override;

    [[nodiscard]] size_t accepted_count() const noexcept override;

private:
    [[nodiscard]] std::expected<void, network_error> create_server_socket();

    /**
     * @brief Apply SO_REUSEADDR to a listener, or TCP_NODELAY and
     *        keep-alive settings to an accepted connection
     */
    [[nodiscard]] bool configure_socket_options(socket_t sock,
                                                bool listener) const;

    void accept_loop();

    server_config config_;
    socket_t server_socket_ = INVALID_SOCKET_VALUE;
    std::atomic<uint16_t> bound_port_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::thread accept_thread_;
    on_connection_callback connection_callback_;

    std::atomic<size_t> accepted_{0};
    std::atomic<uint64_t> next_session_id_{1};

    mutable std::mutex state_mutex_;
};

}  // namespace iso8583::gateway::network

#endif  // ISO8583_GATEWAY_NETWORK_BSD_TCP_SERVER_H
