/**
 * @file framing.cpp
 * @brief Length-prefixed message framing implementation
 */

#include "iso8583/gateway/network/framing.h"

namespace iso8583::gateway::network {

namespace {

[[nodiscard]] frame_error to_frame_error(network_error error) noexcept {
    switch (error) {
        case network_error::timeout:
            return frame_error::timeout;
        case network_error::connection_closed:
            return frame_error::connection_closed;
        default:
            return frame_error::socket_error;
    }
}

/**
 * @brief Read exactly count bytes into out
 */
[[nodiscard]] std::expected<void, frame_error> read_exact(
    tcp_session& session, size_t count, std::string& out,
    std::chrono::steady_clock::time_point deadline) {
    while (out.size() < count) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::unexpected(frame_error::timeout);
        }

        auto chunk = session.receive(count - out.size(), remaining);
        if (!chunk) {
            if (chunk.error() == network_error::would_block) {
                continue;
            }
            return std::unexpected(to_frame_error(chunk.error()));
        }
        out.append(chunk->begin(), chunk->end());
    }
    return {};
}

}  // namespace

std::expected<std::string, frame_error> frame_message(
    std::string_view payload) {
    if (payload.size() > FRAME_MAX_PAYLOAD) {
        return std::unexpected(frame_error::payload_too_large);
    }

    std::string header = std::to_string(payload.size());
    std::string framed(FRAME_HEADER_LENGTH - header.size(), '0');
    framed.reserve(FRAME_HEADER_LENGTH + payload.size());
    framed += header;
    framed += payload;
    return framed;
}

std::expected<size_t, frame_error> parse_frame_header(
    std::string_view header) {
    if (header.size() != FRAME_HEADER_LENGTH) {
        return std::unexpected(frame_error::invalid_header);
    }

    size_t length = 0;
    for (char c : header) {
        if (c < '0' || c > '9') {
            return std::unexpected(frame_error::invalid_header);
        }
        length = length * 10 + static_cast<size_t>(c - '0');
    }
    return length;
}

std::expected<std::string, frame_error> read_framed_message(
    tcp_session& session, std::chrono::steady_clock::time_point deadline) {
    std::string header;
    if (auto result = read_exact(session, FRAME_HEADER_LENGTH, header, deadline);
        !result) {
        return std::unexpected(result.error());
    }

    auto length = parse_frame_header(header);
    if (!length) {
        return std::unexpected(length.error());
    }

    std::string payload;
    payload.reserve(*length);
    if (auto result = read_exact(session, *length, payload, deadline);
        !result) {
        return std::unexpected(result.error());
    }
    return payload;
}

}  // namespace iso8583::gateway::network
