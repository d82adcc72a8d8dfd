#ifndef ISO8583_GATEWAY_ENGINE_ENGINE_TYPES_H
#define ISO8583_GATEWAY_ENGINE_ENGINE_TYPES_H

/**
 * @file engine_types.h
 * @brief Dispatch engine configuration, error codes and statistics
 */

#include "iso8583/gateway/codec/iso_message.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
#include <kcenon/common/interfaces/executor_interface.h>
#endif

namespace iso8583::gateway::engine {

// =============================================================================
// Error Codes (-850 to -869)
// =============================================================================

/**
 * @brief Dispatch engine error codes
 *
 * Allocated range: -850 to -869
 */
enum class engine_error : int {
    /** Engine already running */
    already_running = -850,

    /** Engine not running */
    not_running = -851,

    /** Invalid engine configuration */
    invalid_configuration = -852,

    /** No field schema supplied */
    schema_not_loaded = -853,

    /** Failed to bind or listen on port */
    bind_failed = -854,

    /** Listener socket failure */
    socket_error = -855,

    /** Failed to read a framed request */
    read_failed = -856,

    /** Request could not be decoded */
    decode_failed = -857,

    /** No handler matches the routing key and no default handler is set */
    handler_not_found = -858,

    /** Response could not be encoded */
    encode_failed = -859,

    /** Response is too long to frame */
    frame_too_large = -860,

    /** Failed to write the response */
    write_failed = -861,

    /** Handler threw while building the response */
    handler_failed = -862
};

[[nodiscard]] constexpr int to_error_code(engine_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(engine_error error) noexcept {
    switch (error) {
        case engine_error::already_running:
            return "Engine is already running";
        case engine_error::not_running:
            return "Engine is not running";
        case engine_error::invalid_configuration:
            return "Invalid engine configuration";
        case engine_error::schema_not_loaded:
            return "ISO 8583 field schema not loaded";
        case engine_error::bind_failed:
            return "Failed to bind to port";
        case engine_error::socket_error:
            return "Socket operation failed";
        case engine_error::read_failed:
            return "Failed to read request";
        case engine_error::decode_failed:
            return "ISO 8583 parser error";
        case engine_error::handler_not_found:
            return "Handle not found";
        case engine_error::encode_failed:
            return "ISO 8583 compose error";
        case engine_error::frame_too_large:
            return "Response exceeds frame size";
        case engine_error::write_failed:
            return "Failed to write response";
        case engine_error::handler_failed:
            return "Handler raised an exception";
        default:
            return "Unknown engine error";
    }
}

// =============================================================================
// Handler Types
// =============================================================================

/**
 * @brief Ordered routing key (one entry per configured routing field)
 */
using routing_key = std::vector<std::string>;

/**
 * @brief Message handler; mutates the message in place to form the response
 */
using message_handler = std::function<void(codec::iso_message& message)>;

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Dispatch engine configuration
 */
struct engine_config {
    /** Listening port (0 = ephemeral) */
    uint16_t port = 8583;

    /** Bind address (empty = all interfaces) */
    std::string bind_address;

    /** Idle timeout from accept until the request has been read */
    std::chrono::seconds idle_timeout{30};

    /** Field indices forming the routing key, in order */
    std::vector<int> routing_fields{0};

    /** Listen backlog */
    int backlog = 128;

    /** Enable TCP keep-alive on accepted connections */
    bool keep_alive = true;

    /** Disable Nagle's algorithm */
    bool no_delay = true;

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
    /** Optional executor for connection work (nullptr = one std::thread each) */
    std::shared_ptr<kcenon::common::interfaces::IExecutor> executor;
#endif

    [[nodiscard]] bool is_valid() const noexcept {
        if (idle_timeout.count() <= 0 || backlog <= 0) {
            return false;
        }
        for (int field : routing_fields) {
            if (field < codec::MTI_FIELD || field > codec::MAX_FIELD) {
                return false;
            }
        }
        return true;
    }
};

// =============================================================================
// Statistics
// =============================================================================

struct engine_statistics {
    /** Connections accepted */
    size_t total_connections = 0;

    /** Connections currently being served */
    size_t active_connections = 0;

    /** Complete frames read */
    size_t messages_received = 0;

    /** Responses written */
    size_t responses_sent = 0;

    /** Framed reads that failed (timeout, disconnect, bad header) */
    size_t read_errors = 0;

    /** Requests that failed to parse */
    size_t decode_errors = 0;

    /** Responses that failed to compose or frame */
    size_t encode_errors = 0;

    /** Requests without a matching or default handler */
    size_t unrouted_messages = 0;

    /** Failed response writes */
    size_t write_errors = 0;

    /** Requests whose handler threw */
    size_t handler_errors = 0;

    /** Engine start time */
    std::chrono::system_clock::time_point started_at;

    [[nodiscard]] std::chrono::seconds uptime() const noexcept {
        if (started_at == std::chrono::system_clock::time_point{}) {
            return std::chrono::seconds{0};
        }
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - started_at);
    }
};

}  // namespace iso8583::gateway::engine

#endif  // ISO8583_GATEWAY_ENGINE_ENGINE_TYPES_H
