#ifndef ISO8583_GATEWAY_CODEC_ISO_CODEC_H
#define ISO8583_GATEWAY_CODEC_ISO_CODEC_H

/**
 * @file iso_codec.h
 * @brief ISO 8583 message parser and composer
 *
 * Converts between raw ISO 8583 message strings and field maps using a
 * field_schema. No I/O is performed.
 *
 * Secondary bitmap handling:
 *   The bitmap field is read with the width configured for field 1. When
 *   bit 1 is set and that width decodes to fewer than 16 bytes, a second
 *   chunk of the same width is read as the secondary bitmap. Field 1 then
 *   holds the concatenated hex. Bits beyond the decoded bitmap read as clear.
 */

#include "field_schema.h"
#include "iso_types.h"

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace iso8583::gateway::codec {

/**
 * @brief Information about a parsed message
 */
struct parse_details {
    /** Characters consumed by MTI, bitmap and data fields */
    size_t consumed = 0;

    /** Characters after the last field (ignored) */
    size_t trailing = 0;

    /** A secondary bitmap was present */
    bool secondary_bitmap = false;

    /** Number of data fields (2-128) decoded */
    size_t data_field_count = 0;
};

/**
 * @brief Schema-driven ISO 8583 codec
 *
 * @example
 * ```cpp
 * iso_codec codec(schema);
 *
 * auto fields = codec.parse("0200" "6000000000000000" "164111111111111111" "000000");
 * if (fields) {
 *     auto raw = codec.compose(*fields);
 * }
 * ```
 */
class iso_codec {
public:
    explicit iso_codec(std::shared_ptr<const field_schema> schema);

    /**
     * @brief Parse a raw message into field values
     *
     * @param data Raw message (without transport framing)
     * @param details Optional pointer to receive parse details
     * @return Field values (0 = MTI, 1 = bitmap hex) or error
     */
    [[nodiscard]] std::expected<field_map, iso_error> parse(
        std::string_view data, parse_details* details = nullptr) const;

    /**
     * @brief Compose a raw message from field values
     *
     * Field 1 is ignored; the bitmap is derived from the present fields.
     *
     * @param fields Field values, field 0 required
     * @return Raw message or error
     */
    [[nodiscard]] std::expected<std::string, iso_error> compose(
        const field_map& fields) const;

    /**
     * @brief Pad or truncate a fixed-length value
     *
     * Numeric values are left-padded with '0', others right-padded with
     * ' '. Longer values keep their first max_len characters.
     */
    [[nodiscard]] static std::string pad_value(std::string_view value,
                                               const field_rule& rule);

    [[nodiscard]] bool has_schema() const noexcept {
        return schema_ != nullptr;
    }

private:
    std::shared_ptr<const field_schema> schema_;
};

}  // namespace iso8583::gateway::codec

#endif  // ISO8583_GATEWAY_CODEC_ISO_CODEC_H
