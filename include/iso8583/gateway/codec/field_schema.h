#ifndef ISO8583_GATEWAY_CODEC_FIELD_SCHEMA_H
#define ISO8583_GATEWAY_CODEC_FIELD_SCHEMA_H

/**
 * @file field_schema.h
 * @brief Field encoding rules for ISO 8583 messages
 *
 * A field_schema maps field indices (0-128) to the rule used to read and
 * write that field. Schemas are immutable once built and are shared between
 * messages and connections through std::shared_ptr<const field_schema>.
 * A null pointer stands for "no schema loaded".
 */

#include "iso_types.h"

#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace iso8583::gateway::codec {

// =============================================================================
// Length Types
// =============================================================================

/**
 * @brief How the length of a field is determined on the wire
 */
enum class length_type {
    /** Exactly max_len characters */
    fixed,

    /** 2-digit decimal length prefix */
    llvar,

    /** 3-digit decimal length prefix */
    lllvar,

    /** Any other value found in the schema document */
    unsupported
};

/**
 * @brief Convert length_type to its schema document spelling
 */
[[nodiscard]] constexpr const char* to_string(length_type type) noexcept {
    switch (type) {
        case length_type::fixed:
            return "fixed";
        case length_type::llvar:
            return "llvar";
        case length_type::lllvar:
            return "lllvar";
        default:
            return "unsupported";
    }
}

/**
 * @brief Parse a LenType value (case-insensitive)
 */
[[nodiscard]] length_type parse_length_type(std::string_view value) noexcept;

// =============================================================================
// Field Rule
// =============================================================================

/**
 * @brief Encoding rule of one field
 */
struct field_rule {
    /** Content type tag ("n" = numeric) */
    std::string content_type;

    /** Human-readable name */
    std::string label;

    /** Length type */
    length_type len_type = length_type::fixed;

    /** LenType as written in the schema document */
    std::string len_type_name = "fixed";

    /** Exact width (fixed) or declared maximum (llvar/lllvar) */
    size_t max_len = 0;

    [[nodiscard]] bool is_numeric() const noexcept {
        return content_type == NUMERIC_CONTENT_TYPE;
    }
};

// =============================================================================
// Schema Error Codes (-820 to -829)
// =============================================================================

/**
 * @brief Schema construction error codes
 *
 * Allocated range: -820 to -829
 */
enum class schema_error : int {
    /** No rules given */
    empty_schema = -820,

    /** Field index outside 0-128 */
    invalid_field_index = -821,

    /** Field 0 (MTI) rule missing */
    missing_mti_rule = -822,

    /** Field 1 (bitmap) rule missing */
    missing_bitmap_rule = -823,

    /** Field 0 or 1 is not fixed length */
    header_not_fixed = -824,

    /** Bitmap width is not 16 hex digits */
    invalid_bitmap_width = -825
};

[[nodiscard]] constexpr int to_error_code(schema_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(schema_error error) noexcept {
    switch (error) {
        case schema_error::empty_schema:
            return "Field schema is empty";
        case schema_error::invalid_field_index:
            return "Field index must be between 0 and 128";
        case schema_error::missing_mti_rule:
            return "MTI configuration (field 0) missing";
        case schema_error::missing_bitmap_rule:
            return "Bitmap configuration (field 1) missing";
        case schema_error::header_not_fixed:
            return "Fields 0 and 1 must use fixed length";
        case schema_error::invalid_bitmap_width:
            return "Bitmap (field 1) must be 16 hex digits";
        default:
            return "Unknown schema error";
    }
}

// =============================================================================
// Field Schema
// =============================================================================

/**
 * @brief Immutable set of field rules
 *
 * @example
 * ```cpp
 * std::map<int, field_rule> rules;
 * rules[0] = {"n", "MTI", length_type::fixed, "fixed", 4};
 * rules[1] = {"b", "Bitmap", length_type::fixed, "fixed", 16};
 * rules[2] = {"n", "PAN", length_type::llvar, "llvar", 19};
 *
 * auto schema = field_schema::from_rules(std::move(rules));
 * if (schema) {
 *     auto shared = std::make_shared<const field_schema>(std::move(*schema));
 * }
 * ```
 */
class field_schema {
public:
    /**
     * @brief Build a schema, enforcing the MTI/bitmap invariants
     *
     * @param rules Rules keyed by field index
     * @return Schema or the first violated invariant
     */
    [[nodiscard]] static std::expected<field_schema, schema_error> from_rules(
        std::map<int, field_rule> rules);

    /**
     * @brief Look up the rule of a field
     * @return Rule or nullptr when the field is not configured
     */
    [[nodiscard]] const field_rule* find(int index) const noexcept;

    [[nodiscard]] bool contains(int index) const noexcept;

    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }

    /** Rule of field 0 */
    [[nodiscard]] const field_rule& mti_rule() const;

    /** Rule of field 1 */
    [[nodiscard]] const field_rule& bitmap_rule() const;

    [[nodiscard]] const std::map<int, field_rule>& rules() const noexcept {
        return rules_;
    }

private:
    explicit field_schema(std::map<int, field_rule> rules);

    std::map<int, field_rule> rules_;
};

}  // namespace iso8583::gateway::codec

#endif  // ISO8583_GATEWAY_CODEC_FIELD_SCHEMA_H
