#ifndef ISO8583_GATEWAY_CODEC_BITMAP_H
#define ISO8583_GATEWAY_CODEC_BITMAP_H

/**
 * @file bitmap.h
 * @brief ISO 8583 presence bitmap
 *
 * Bit for field i (1-128) lives in byte (i-1)/8 at bit 7-((i-1)%8),
 * counting from the most significant bit. Bit 1 flags a secondary bitmap.
 *
 *   byte 0          byte 1              byte 15
 *   [1 2 3 ... 8]   [9 10 ... 16]  ...  [121 ... 128]
 */

#include "iso_types.h"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace iso8583::gateway::codec {

class bitmap {
public:
    /**
     * @brief Create a cleared primary bitmap (8 bytes)
     */
    bitmap();

    /**
     * @brief Create a cleared bitmap of the given size
     * @param size_bytes Size in bytes (8 or 16 for well-formed messages)
     */
    explicit bitmap(size_t size_bytes);

    /**
     * @brief Decode a hex rendering (upper or lower case)
     * @return Bitmap or iso_error::invalid_bitmap
     */
    [[nodiscard]] static std::expected<bitmap, iso_error> from_hex(
        std::string_view hex);

    /**
     * @brief Check the bit of a field
     *
     * Fields beyond the decoded size read as clear.
     */
    [[nodiscard]] bool test(int field) const noexcept;

    /**
     * @brief Set the bit of a field
     *
     * @return false if the field does not fit the bitmap size
     */
    bool set(int field) noexcept;

    /** Bit 1 is set */
    [[nodiscard]] bool has_secondary() const noexcept {
        return test(BITMAP_FIELD);
    }

    /** Decoded bytes cover fields 65-128 */
    [[nodiscard]] bool covers_secondary() const noexcept {
        return bytes_.size() >= EXTENDED_BITMAP_SIZE;
    }

    /**
     * @brief Append further bytes (secondary bitmap read after the primary)
     */
    void append(const bitmap& other);

    /** Uppercase hex rendering */
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept {
        return bytes_;
    }

private:
    std::vector<uint8_t> bytes_;
};

}  // namespace iso8583::gateway::codec

#endif  // ISO8583_GATEWAY_CODEC_BITMAP_H
