/**
 * @file test_helpers.h
 * @brief Common test utilities and helpers for ISO 8583 gateway tests
 *
 * Provides a sample field schema, sample messages, a raw loopback TCP
 * client and polling helpers. Uses Google Test (gtest) and Google Mock
 * (gmock) frameworks.
 */

#ifndef ISO8583_GATEWAY_TEST_HELPERS_H
#define ISO8583_GATEWAY_TEST_HELPERS_H

#include "iso8583/gateway/codec/field_schema.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace iso8583::gateway::test {

// =============================================================================
// Sample Field Schema
// =============================================================================

/**
 * @brief Rules for fields 0-4, 11, 35, 39, 41, 48 and 70
 */
inline std::map<int, codec::field_rule> sample_rules() {
    using codec::length_type;
    std::map<int, codec::field_rule> rules;
    rules[0] = {"n", "Message Type Indicator", length_type::fixed, "fixed", 4};
    rules[1] = {"b", "Bitmap", length_type::fixed, "fixed", 16};
    rules[2] = {"n", "Primary Account Number", length_type::llvar, "llvar", 19};
    rules[3] = {"n", "Processing Code", length_type::fixed, "fixed", 6};
    rules[4] = {"n", "Amount, Transaction", length_type::fixed, "fixed", 12};
    rules[11] = {"n", "System Trace Audit Number", length_type::fixed, "fixed", 6};
    rules[35] = {"z", "Track 2 Data", length_type::llvar, "llvar", 37};
    rules[39] = {"an", "Response Code", length_type::fixed, "fixed", 2};
    rules[41] = {"ans", "Terminal Identification", length_type::fixed, "fixed", 8};
    rules[48] = {"ans", "Additional Data", length_type::lllvar, "lllvar", 999};
    rules[70] = {"n", "Network Management Code", length_type::fixed, "fixed", 3};
    return rules;
}

inline std::shared_ptr<const codec::field_schema> sample_schema() {
    auto schema = codec::field_schema::from_rules(sample_rules());
    EXPECT_TRUE(schema.has_value());
    return std::make_shared<const codec::field_schema>(std::move(*schema));
}

inline constexpr std::string_view SAMPLE_SCHEMA_YAML = R"(
# sample schema
0: {ContentType: n, Label: MTI, LenType: fixed, MaxLen: 4}
1: {ContentType: b, Label: Bitmap, LenType: fixed, MaxLen: 16}
2:
  ContentType: n
  Label: "Primary Account Number"
  LenType: llvar
  MaxLen: 19
3: {ContentType: n, Label: "Processing Code", LenType: fixed, MaxLen: 6}
39: {ContentType: an, Label: "Response Code", LenType: fixed, MaxLen: 2}
)";

// =============================================================================
// Sample Messages
// =============================================================================

namespace iso_samples {

/** Authorization request: PAN and processing code */
constexpr std::string_view AUTH_REQUEST =
    "0200"
    "6000000000000000"
    "164111111111111111"
    "000000";

/** Network management request with a secondary bitmap (field 70) */
constexpr std::string_view ECHO_REQUEST =
    "0800"
    "8020000000000000"
    "0400000000000000"
    "000001"
    "301";

}  // namespace iso_samples

// =============================================================================
// Polling Helpers
// =============================================================================

/**
 * @brief Wait for condition with timeout
 */
template <typename Predicate>
bool wait_for(Predicate condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

// =============================================================================
// Raw Loopback Client
// =============================================================================

/**
 * @brief Blocking TCP client for driving servers under test
 */
class raw_client {
public:
    raw_client() = default;

    ~raw_client() { close(); }

    raw_client(const raw_client&) = delete;
    raw_client& operator=(const raw_client&) = delete;

    bool connect(uint16_t port) {
        sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (sock_ < 0) {
            return false;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        return ::connect(sock_, reinterpret_cast<sockaddr*>(&addr),
                         sizeof(addr)) == 0;
    }

    bool send(std::string_view data) {
        size_t total = 0;
        while (total < data.size()) {
            ssize_t sent = ::send(sock_, data.data() + total,
                                  data.size() - total, MSG_NOSIGNAL);
            if (sent <= 0) {
                return false;
            }
            total += static_cast<size_t>(sent);
        }
        return true;
    }

    /**
     * @brief Read until the peer closes or the timeout expires
     *
     * @return Received bytes, or nullopt on timeout
     */
    std::optional<std::string> read_until_close(
        std::chrono::milliseconds timeout) {
        std::string received;
        auto deadline = std::chrono::steady_clock::now() + timeout;

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }

            pollfd pfd{sock_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready <= 0) {
                return std::nullopt;
            }

            char buffer[4096];
            ssize_t n = ::recv(sock_, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return received;
            }
            received.append(buffer, static_cast<size_t>(n));
        }
    }

    void close() {
        if (sock_ >= 0) {
            ::close(sock_);
            sock_ = -1;
        }
    }

private:
    int sock_ = -1;
};

}  // namespace iso8583::gateway::test

#endif  // ISO8583_GATEWAY_TEST_HELPERS_H
