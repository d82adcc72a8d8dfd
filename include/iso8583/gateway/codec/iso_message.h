#ifndef ISO8583_GATEWAY_CODEC_ISO_MESSAGE_H
#define ISO8583_GATEWAY_CODEC_ISO_MESSAGE_H

/**
 * @file iso_message.h
 * @brief ISO 8583 message data model
 *
 * Holds the field values of one transaction message. Field 0 is the MTI,
 * field 1 the bitmap hex stored by parse(). A message is owned by a single
 * connection worker for one request/response cycle.
 *
 * @example
 * ```cpp
 * iso_message request(schema);
 * if (request.parse(raw)) {
 *     request.set_mti("0210");
 *     request.set_field(39, "00");
 *     auto response = request.compose();
 * }
 * ```
 */

#include "field_schema.h"
#include "iso_codec.h"
#include "iso_types.h"

#include <concepts>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace iso8583::gateway::codec {

class iso_message {
public:
    /**
     * @brief Create an empty message bound to a schema
     *
     * @param schema Field schema (null means no schema loaded)
     */
    explicit iso_message(std::shared_ptr<const field_schema> schema);

    // =========================================================================
    // Parsing / Serialization
    // =========================================================================

    /**
     * @brief Replace the content with a parsed raw message
     *
     * The message is left untouched when parsing fails.
     *
     * @param data Raw message (without framing)
     * @param details Optional pointer to receive parse details
     */
    [[nodiscard]] std::expected<void, iso_error> parse(
        std::string_view data, parse_details* details = nullptr);

    /**
     * @brief Serialize to wire format
     *
     * The bitmap is recomputed from the present fields; field 1 is ignored.
     */
    [[nodiscard]] std::expected<std::string, iso_error> compose() const;

    // =========================================================================
    // Field Access
    // =========================================================================

    /**
     * @brief Get a field value
     * @return Value or empty string if absent
     */
    [[nodiscard]] std::string get_field(int index) const;

    [[nodiscard]] bool has_field(int index) const noexcept;

    /**
     * @brief Set a field value
     *
     * @param index Field index (0-128)
     * @param value New value
     * @return false if the index is out of range
     */
    bool set_field(int index, std::string value);

    bool set_field(int index, const char* value) {
        return set_field(index, std::string(value ? value : ""));
    }

    bool set_field(int index, std::string_view value) {
        return set_field(index, std::string(value));
    }

    /**
     * @brief Set a field from a numeric value (stored as decimal text)
     */
    template <typename T>
        requires std::is_arithmetic_v<T>
    bool set_field(int index, T value) {
        return set_field(index, std::to_string(value));
    }

    /**
     * @brief Remove a field
     * @return true if the field was present
     */
    bool remove_field(int index);

    /** MTI (field 0) */
    [[nodiscard]] std::string mti() const { return get_field(MTI_FIELD); }

    void set_mti(std::string value) { set_field(MTI_FIELD, std::move(value)); }

    /** Drop all fields */
    void clear() noexcept { fields_.clear(); }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] size_t field_count() const noexcept { return fields_.size(); }

    [[nodiscard]] const field_map& fields() const noexcept { return fields_; }

    [[nodiscard]] const std::shared_ptr<const field_schema>& schema()
        const noexcept {
        return schema_;
    }

    /**
     * @brief Render one "[NNN][value]" line per field, ascending by index
     */
    [[nodiscard]] std::string pretty_print() const;

private:
    std::shared_ptr<const field_schema> schema_;
    field_map fields_;
};

}  // namespace iso8583::gateway::codec

#endif  // ISO8583_GATEWAY_CODEC_ISO_MESSAGE_H
