/**
 * @file iso_codec.cpp
 * @brief ISO 8583 parser and composer implementation
 */

#include "iso8583/gateway/codec/iso_codec.h"
#include "iso8583/gateway/codec/bitmap.h"

#include <algorithm>

namespace iso8583::gateway::codec {

namespace {

/**
 * @brief Left-to-right reader over the raw message
 */
class cursor {
public:
    explicit cursor(std::string_view data) : data_(data) {}

    [[nodiscard]] std::expected<std::string_view, iso_error> take(size_t n) {
        if (n > data_.size() - pos_) {
            return std::unexpected(iso_error::truncated_message);
        }
        auto chunk = data_.substr(pos_, n);
        pos_ += n;
        return chunk;
    }

    [[nodiscard]] std::expected<size_t, iso_error> take_length(size_t digits) {
        auto prefix = take(digits);
        if (!prefix) {
            return std::unexpected(prefix.error());
        }

        size_t length = 0;
        for (char c : *prefix) {
            if (c < '0' || c > '9') {
                return std::unexpected(iso_error::invalid_length_prefix);
            }
            length = length * 10 + static_cast<size_t>(c - '0');
        }
        return length;
    }

    [[nodiscard]] size_t position() const noexcept { return pos_; }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

private:
    std::string_view data_;
    size_t pos_ = 0;
};

[[nodiscard]] std::expected<std::string, iso_error> read_field(
    cursor& in, const field_rule& rule) {
    size_t length = 0;
    switch (rule.len_type) {
        case length_type::fixed:
            length = rule.max_len;
            break;
        case length_type::llvar:
        case length_type::lllvar: {
            auto declared = in.take_length(rule.len_type == length_type::llvar
                                               ? LLVAR_PREFIX_LENGTH
                                               : LLLVAR_PREFIX_LENGTH);
            if (!declared) {
                return std::unexpected(declared.error());
            }
            length = *declared;
            break;
        }
        default:
            return std::unexpected(iso_error::unsupported_length_type);
    }

    auto value = in.take(length);
    if (!value) {
        return std::unexpected(value.error());
    }
    return std::string(*value);
}

[[nodiscard]] std::string length_prefix(size_t length, size_t digits) {
    std::string prefix = std::to_string(length);
    if (prefix.size() < digits) {
        prefix.insert(0, digits - prefix.size(), '0');
    }
    return prefix;
}

[[nodiscard]] std::expected<void, iso_error> write_field(
    std::string& out, const std::string& value, const field_rule& rule) {
    switch (rule.len_type) {
        case length_type::fixed:
            out += iso_codec::pad_value(value, rule);
            return {};
        case length_type::llvar:
            if (value.size() > 99) {
                return std::unexpected(iso_error::length_overflow);
            }
            out += length_prefix(value.size(), LLVAR_PREFIX_LENGTH);
            out += value;
            return {};
        case length_type::lllvar:
            if (value.size() > 999) {
                return std::unexpected(iso_error::length_overflow);
            }
            out += length_prefix(value.size(), LLLVAR_PREFIX_LENGTH);
            out += value;
            return {};
        default:
            return std::unexpected(iso_error::unsupported_length_type);
    }
}

}  // namespace

iso_codec::iso_codec(std::shared_ptr<const field_schema> schema)
    : schema_(std::move(schema)) {}

std::string iso_codec::pad_value(std::string_view value,
                                 const field_rule& rule) {
    if (value.size() >= rule.max_len) {
        return std::string(value.substr(0, rule.max_len));
    }

    std::string padding(rule.max_len - value.size(),
                        rule.is_numeric() ? '0' : ' ');
    if (rule.is_numeric()) {
        return padding + std::string(value);
    }
    return std::string(value) + padding;
}

std::expected<field_map, iso_error> iso_codec::parse(
    std::string_view data, parse_details* details) const {
    if (!schema_) {
        return std::unexpected(iso_error::schema_not_loaded);
    }

    cursor in(data);
    field_map fields;

    auto mti = in.take(schema_->mti_rule().max_len);
    if (!mti) {
        return std::unexpected(mti.error());
    }
    fields[MTI_FIELD] = std::string(*mti);

    const size_t bitmap_width = schema_->bitmap_rule().max_len;
    auto primary_hex = in.take(bitmap_width);
    if (!primary_hex) {
        return std::unexpected(primary_hex.error());
    }

    auto present = bitmap::from_hex(*primary_hex);
    if (!present) {
        return std::unexpected(present.error());
    }
    std::string bitmap_hex(*primary_hex);

    const bool secondary = present->has_secondary();
    if (secondary) {
        auto secondary_hex = in.take(bitmap_width);
        if (!secondary_hex) {
            return std::unexpected(secondary_hex.error());
        }
        auto extension = bitmap::from_hex(*secondary_hex);
        if (!extension) {
            return std::unexpected(extension.error());
        }
        present->append(*extension);
        bitmap_hex += *secondary_hex;
    }
    fields[BITMAP_FIELD] = std::move(bitmap_hex);

    size_t data_fields = 0;
    for (int i = FIRST_DATA_FIELD; i <= MAX_FIELD; ++i) {
        if (!present->test(i)) {
            continue;
        }

        const field_rule* rule = schema_->find(i);
        if (!rule) {
            return std::unexpected(iso_error::missing_field_config);
        }

        auto value = read_field(in, *rule);
        if (!value) {
            return std::unexpected(value.error());
        }
        fields[i] = std::move(*value);
        ++data_fields;
    }

    if (details) {
        details->consumed = in.position();
        details->trailing = in.remaining();
        details->secondary_bitmap = secondary;
        details->data_field_count = data_fields;
    }

    return fields;
}

std::expected<std::string, iso_error> iso_codec::compose(
    const field_map& fields) const {
    if (!schema_) {
        return std::unexpected(iso_error::schema_not_loaded);
    }
    if (fields.empty()) {
        return std::unexpected(iso_error::empty_message);
    }

    auto mti = fields.find(MTI_FIELD);
    if (mti == fields.end()) {
        return std::unexpected(iso_error::missing_mti);
    }

    const int highest = fields.rbegin()->first;
    const bool extended = highest > PRIMARY_BITMAP_LAST_FIELD;

    bitmap present(extended ? EXTENDED_BITMAP_SIZE : PRIMARY_BITMAP_SIZE);
    if (extended) {
        present.set(BITMAP_FIELD);
    }
    for (const auto& [index, value] : fields) {
        if (index >= FIRST_DATA_FIELD) {
            present.set(index);
        }
    }

    std::string out = mti->second;
    out += present.to_hex();

    for (auto it = fields.lower_bound(FIRST_DATA_FIELD);
         it != fields.end() && it->first <= MAX_FIELD; ++it) {
        const field_rule* rule = schema_->find(it->first);
        if (!rule) {
            return std::unexpected(iso_error::missing_field_config);
        }

        auto written = write_field(out, it->second, *rule);
        if (!written) {
            return std::unexpected(written.error());
        }
    }

    return out;
}

}  // namespace iso8583::gateway::codec
