#ifndef ISO8583_GATEWAY_CODEC_ISO_TYPES_H
#define ISO8583_GATEWAY_CODEC_ISO_TYPES_H

/**
 * @file iso_types.h
 * @brief ISO 8583 protocol constants and codec error codes
 *
 * ISO 8583 Message Structure:
 *   <MTI><bitmap-hex>[<field_2>][<field_3>]...[<field_128>]
 *   - MTI: Message Type Indicator (field 0), normally 4 digits
 *   - Bitmap: hex rendering of the presence bitmap (field 1)
 *   - Data fields: fixed width, LLVAR (2-digit length) or
 *     LLLVAR (3-digit length), in ascending field order
 */

#include <cstddef>
#include <map>
#include <string>

namespace iso8583::gateway::codec {

// =============================================================================
// ISO 8583 Protocol Constants
// =============================================================================

/** Field index of the Message Type Indicator */
constexpr int MTI_FIELD = 0;

/** Field index of the bitmap */
constexpr int BITMAP_FIELD = 1;

/** First data field index */
constexpr int FIRST_DATA_FIELD = 2;

/** Highest field index covered by the primary bitmap */
constexpr int PRIMARY_BITMAP_LAST_FIELD = 64;

/** Highest supported field index */
constexpr int MAX_FIELD = 128;

/** Primary bitmap size in bytes */
constexpr size_t PRIMARY_BITMAP_SIZE = 8;

/** Primary + secondary bitmap size in bytes */
constexpr size_t EXTENDED_BITMAP_SIZE = 16;

/** Digits in an LLVAR length prefix */
constexpr size_t LLVAR_PREFIX_LENGTH = 2;

/** Digits in an LLLVAR length prefix */
constexpr size_t LLLVAR_PREFIX_LENGTH = 3;

/** Content type tag of numeric fields */
constexpr const char* NUMERIC_CONTENT_TYPE = "n";

/**
 * @brief Decoded field values keyed by field index
 *
 * Ordered so that iteration follows wire order.
 */
using field_map = std::map<int, std::string>;

// =============================================================================
// Error Codes (-800 to -819)
// =============================================================================

/**
 * @brief ISO 8583 codec error codes
 *
 * Allocated range: -800 to -819
 */
enum class iso_error : int {
    /** Field schema has not been loaded */
    schema_not_loaded = -800,

    /** A present field has no schema entry */
    missing_field_config = -801,

    /** Schema declares a length type other than fixed/llvar/lllvar */
    unsupported_length_type = -802,

    /** Bitmap is not valid hexadecimal */
    invalid_bitmap = -803,

    /** Message ended before all declared data was read */
    truncated_message = -804,

    /** LLVAR/LLLVAR length prefix is not decimal */
    invalid_length_prefix = -805,

    /** No fields to compose */
    empty_message = -806,

    /** MTI (field 0) is not set */
    missing_mti = -807,

    /** Variable field value does not fit its length prefix */
    length_overflow = -808
};

/**
 * @brief Convert iso_error to error code integer
 */
[[nodiscard]] constexpr int to_error_code(iso_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable description of codec error
 */
[[nodiscard]] constexpr const char* to_string(iso_error error) noexcept {
    switch (error) {
        case iso_error::schema_not_loaded:
            return "ISO 8583 field schema not loaded";
        case iso_error::missing_field_config:
            return "Field configuration missing";
        case iso_error::unsupported_length_type:
            return "Unsupported length type";
        case iso_error::invalid_bitmap:
            return "Bitmap is not valid hexadecimal";
        case iso_error::truncated_message:
            return "Message is shorter than declared by its fields";
        case iso_error::invalid_length_prefix:
            return "Variable length prefix is not numeric";
        case iso_error::empty_message:
            return "ISO 8583 element is empty";
        case iso_error::missing_mti:
            return "MTI must be present in field 0";
        case iso_error::length_overflow:
            return "Value too long for its length prefix";
        default:
            return "Unknown ISO 8583 error";
    }
}

/**
 * @brief Check if the error was raised while decoding raw input
 */
[[nodiscard]] constexpr bool is_decode_error(iso_error error) noexcept {
    return error == iso_error::invalid_bitmap ||
           error == iso_error::truncated_message ||
           error == iso_error::invalid_length_prefix;
}

/**
 * @brief Check if the error was raised while composing a message
 */
[[nodiscard]] constexpr bool is_encode_error(iso_error error) noexcept {
    return error == iso_error::empty_message ||
           error == iso_error::missing_mti ||
           error == iso_error::length_overflow;
}

}  // namespace iso8583::gateway::codec

#endif  // ISO8583_GATEWAY_CODEC_ISO_TYPES_H
