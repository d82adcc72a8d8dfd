/**
 * @file field_schema.cpp
 * @brief Field schema construction and lookup
 */

#include "iso8583/gateway/codec/field_schema.h"

#include <cctype>

namespace iso8583::gateway::codec {

namespace {

[[nodiscard]] bool equals_ignore_case(std::string_view lhs,
                                      std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

length_type parse_length_type(std::string_view value) noexcept {
    if (equals_ignore_case(value, "fixed")) return length_type::fixed;
    if (equals_ignore_case(value, "llvar")) return length_type::llvar;
    if (equals_ignore_case(value, "lllvar")) return length_type::lllvar;
    return length_type::unsupported;
}

field_schema::field_schema(std::map<int, field_rule> rules)
    : rules_(std::move(rules)) {}

std::expected<field_schema, schema_error> field_schema::from_rules(
    std::map<int, field_rule> rules) {
    if (rules.empty()) {
        return std::unexpected(schema_error::empty_schema);
    }

    for (const auto& [index, rule] : rules) {
        if (index < MTI_FIELD || index > MAX_FIELD) {
            return std::unexpected(schema_error::invalid_field_index);
        }
    }

    auto mti = rules.find(MTI_FIELD);
    if (mti == rules.end()) {
        return std::unexpected(schema_error::missing_mti_rule);
    }

    auto bitmap = rules.find(BITMAP_FIELD);
    if (bitmap == rules.end()) {
        return std::unexpected(schema_error::missing_bitmap_rule);
    }

    if (mti->second.len_type != length_type::fixed ||
        bitmap->second.len_type != length_type::fixed) {
        return std::unexpected(schema_error::header_not_fixed);
    }

    // One 64-bit bitmap per chunk; the secondary chunk is read on demand
    if (bitmap->second.max_len != PRIMARY_BITMAP_SIZE * 2) {
        return std::unexpected(schema_error::invalid_bitmap_width);
    }

    return field_schema(std::move(rules));
}

const field_rule* field_schema::find(int index) const noexcept {
    auto it = rules_.find(index);
    return it != rules_.end() ? &it->second : nullptr;
}

bool field_schema::contains(int index) const noexcept {
    return rules_.contains(index);
}

const field_rule& field_schema::mti_rule() const {
    return rules_.at(MTI_FIELD);
}

const field_rule& field_schema::bitmap_rule() const {
    return rules_.at(BITMAP_FIELD);
}

}  // namespace iso8583::gateway::codec
