/**
 * @file bitmap.cpp
 * @brief ISO 8583 presence bitmap implementation
 */

#include "iso8583/gateway/codec/bitmap.h"

namespace iso8583::gateway::codec {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

[[nodiscard]] constexpr size_t byte_index(int field) noexcept {
    return static_cast<size_t>(field - 1) / 8;
}

[[nodiscard]] constexpr uint8_t bit_mask(int field) noexcept {
    return static_cast<uint8_t>(1u << (7 - ((field - 1) % 8)));
}

}  // namespace

bitmap::bitmap() : bytes_(PRIMARY_BITMAP_SIZE, 0) {}

bitmap::bitmap(size_t size_bytes) : bytes_(size_bytes, 0) {}

std::expected<bitmap, iso_error> bitmap::from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::unexpected(iso_error::invalid_bitmap);
    }

    bitmap result(hex.size() / 2);
    for (size_t i = 0; i < result.bytes_.size(); ++i) {
        int high = hex_value(hex[i * 2]);
        int low = hex_value(hex[i * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::unexpected(iso_error::invalid_bitmap);
        }
        result.bytes_[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return result;
}

bool bitmap::test(int field) const noexcept {
    if (field < 1 || byte_index(field) >= bytes_.size()) {
        return false;
    }
    return (bytes_[byte_index(field)] & bit_mask(field)) != 0;
}

bool bitmap::set(int field) noexcept {
    if (field < 1 || byte_index(field) >= bytes_.size()) {
        return false;
    }
    bytes_[byte_index(field)] |= bit_mask(field);
    return true;
}

void bitmap::append(const bitmap& other) {
    bytes_.insert(bytes_.end(), other.bytes_.begin(), other.bytes_.end());
}

std::string bitmap::to_hex() const {
    std::string hex;
    hex.reserve(bytes_.size() * 2);
    for (uint8_t b : bytes_) {
        hex += HEX_DIGITS[b >> 4];
        hex += HEX_DIGITS[b & 0x0F];
    }
    return hex;
}

}  // namespace iso8583::gateway::codec
