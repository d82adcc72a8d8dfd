/**
 * @file iso_message.cpp
 * @brief ISO 8583 message implementation
 */

#include "iso8583/gateway/codec/iso_message.h"

namespace iso8583::gateway::codec {

iso_message::iso_message(std::shared_ptr<const field_schema> schema)
    : schema_(std::move(schema)) {}

std::expected<void, iso_error> iso_message::parse(std::string_view data,
                                                  parse_details* details) {
    auto parsed = iso_codec(schema_).parse(data, details);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    fields_ = std::move(*parsed);
    return {};
}

std::expected<std::string, iso_error> iso_message::compose() const {
    return iso_codec(schema_).compose(fields_);
}

std::string iso_message::get_field(int index) const {
    auto it = fields_.find(index);
    return it != fields_.end() ? it->second : std::string{};
}

bool iso_message::has_field(int index) const noexcept {
    return fields_.contains(index);
}

bool iso_message::set_field(int index, std::string value) {
    if (index < MTI_FIELD || index > MAX_FIELD) {
        return false;
    }
    fields_[index] = std::move(value);
    return true;
}

bool iso_message::remove_field(int index) {
    return fields_.erase(index) > 0;
}

std::string iso_message::pretty_print() const {
    std::string out;
    for (const auto& [index, value] : fields_) {
        std::string number = std::to_string(index);
        if (number.size() < 3) {
            number.insert(0, 3 - number.size(), '0');
        }
        out += '[';
        out += number;
        out += "][";
        out += value;
        out += "]\n";
    }
    return out;
}

}  // namespace iso8583::gateway::codec
