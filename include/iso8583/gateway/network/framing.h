#ifndef ISO8583_GATEWAY_NETWORK_FRAMING_H
#define ISO8583_GATEWAY_NETWORK_FRAMING_H

/**
 * @file framing.h
 * @brief Length-prefixed message framing
 *
 * Frame Structure:
 *   <LLLL><payload>
 *   - LLLL: payload byte length, 4 zero-padded decimal digits
 *   - payload: the ISO 8583 message
 *
 * The same framing is used for requests and responses.
 */

#include "network_adapter.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace iso8583::gateway::network {

/** Digits in the frame length header */
constexpr size_t FRAME_HEADER_LENGTH = 4;

/** Largest payload expressible by the header */
constexpr size_t FRAME_MAX_PAYLOAD = 9999;

// =============================================================================
// Error Codes (-990 to -999)
// =============================================================================

enum class frame_error : int {
    /** Header is not 4 decimal digits */
    invalid_header = -990,

    /** Payload longer than 9999 bytes */
    payload_too_large = -991,

    /** Deadline expired before the frame was complete */
    timeout = -992,

    /** Peer closed the connection mid-frame */
    connection_closed = -993,

    /** Socket operation failed */
    socket_error = -994
};

[[nodiscard]] constexpr int to_error_code(frame_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(frame_error error) noexcept {
    switch (error) {
        case frame_error::invalid_header:
            return "Frame length header is not numeric";
        case frame_error::payload_too_large:
            return "Frame payload exceeds 9999 bytes";
        case frame_error::timeout:
            return "Idle timeout while reading frame";
        case frame_error::connection_closed:
            return "Connection closed while reading frame";
        case frame_error::socket_error:
            return "Socket error while reading frame";
        default:
            return "Unknown frame error";
    }
}

/**
 * @brief Prefix a payload with its 4-digit length
 *
 * @return Framed bytes or frame_error::payload_too_large
 */
[[nodiscard]] std::expected<std::string, frame_error> frame_message(
    std::string_view payload);

/**
 * @brief Decode a 4-digit length header
 *
 * @param header Exactly FRAME_HEADER_LENGTH characters
 */
[[nodiscard]] std::expected<size_t, frame_error> parse_frame_header(
    std::string_view header);

/**
 * @brief Read one complete frame from a session
 *
 * Blocks until the header and the declared payload have arrived or the
 * deadline passes. Bytes after the frame are not consumed.
 *
 * @param session Connected session
 * @param deadline Absolute deadline for the whole frame
 * @return Payload without header, or error
 */
[[nodiscard]] std::expected<std::string, frame_error> read_framed_message(
    tcp_session& session, std::chrono::steady_clock::time_point deadline);

}  // namespace iso8583::gateway::network

#endif  // ISO8583_GATEWAY_NETWORK_FRAMING_H
