/**
 * @file config_loader.cpp
 * @brief Implementation of configuration and field schema loading
 *
 * Uses small built-in parsers for the YAML and JSON subsets the gateway
 * documents need. Both parsers flatten documents into dotted key paths
 * ("server.port", "routing.fields.0", "2.MaxLen").
 */

#include "iso8583/gateway/config/config_loader.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace iso8583::gateway::config {

namespace {

using flat_map = std::map<std::string, std::string>;

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] config_load_error make_error(config_error code,
                                           std::string message) {
    return config_load_error{.code = code,
                             .message = std::move(message),
                             .file_path = std::nullopt,
                             .line_number = std::nullopt,
                             .validation_errors = {}};
}

/**
 * @brief Read entire file contents
 */
[[nodiscard]] std::expected<std::string, config_load_error> read_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        auto error = make_error(config_error::file_not_found,
                                "Configuration file not found: " + path.string());
        error.file_path = path;
        return std::unexpected(error);
    }

    std::ifstream file(path);
    if (!file) {
        auto error = make_error(config_error::io_error,
                                "Failed to open file: " + path.string());
        error.file_path = path;
        return std::unexpected(error);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        auto error = make_error(config_error::io_error,
                                "Error reading file: " + path.string());
        error.file_path = path;
        return std::unexpected(error);
    }

    return buffer.str();
}

enum class document_format { yaml, json };

/**
 * @brief Determine file format from extension
 */
[[nodiscard]] std::expected<document_format, config_load_error> detect_format(
    const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".yaml" || ext == ".yml") {
        return document_format::yaml;
    }
    if (ext == ".json") {
        return document_format::json;
    }

    auto error = make_error(
        config_error::invalid_format,
        "Unknown configuration file format: " + ext +
            ". Use .yaml, .yml, or .json");
    error.file_path = path;
    return std::unexpected(error);
}

[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

/**
 * @brief Remove quotes from string value
 */
[[nodiscard]] std::string unquote(std::string_view str) {
    if (str.length() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return std::string(str.substr(1, str.length() - 2));
        }
    }
    return std::string(str);
}

[[nodiscard]] std::string to_lower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

[[nodiscard]] std::optional<bool> parse_bool(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<int64_t> parse_int(std::string_view str) {
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse duration value (e.g., "30", "30s", "5m", "1h")
 */
[[nodiscard]] std::optional<std::chrono::seconds> parse_duration(
    std::string_view str) {
    if (str.empty()) return std::nullopt;

    if (auto val = parse_int(str)) {
        return std::chrono::seconds(*val);
    }

    char unit = static_cast<char>(
        std::tolower(static_cast<unsigned char>(str.back())));
    auto value = parse_int(str.substr(0, str.size() - 1));
    if (!value) return std::nullopt;

    switch (unit) {
        case 's':
            return std::chrono::seconds(*value);
        case 'm':
            return std::chrono::seconds(*value * 60);
        case 'h':
            return std::chrono::seconds(*value * 3600);
        default:
            return std::nullopt;
    }
}

[[nodiscard]] std::string join_path(const std::string& prefix,
                                    std::string_view key) {
    if (prefix.empty()) {
        return std::string(key);
    }
    return prefix + "." + std::string(key);
}

/**
 * @brief Find the key/value separator of "key: value", outside quotes
 */
[[nodiscard]] size_t find_key_colon(std::string_view text) {
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ':' &&
                   (i + 1 == text.size() || text[i + 1] == ' ' ||
                    text[i + 1] == '\t' || text[i + 1] == '{' ||
                    text[i + 1] == '[' || text[i + 1] == '"')) {
            return i;
        }
    }
    return std::string_view::npos;
}

// =============================================================================
// Simple YAML Parser (subset)
// =============================================================================

/**
 * @brief Parser for the YAML subset used by gateway documents
 *
 * Supports block mappings, block sequences of scalars, flow mappings
 * ({a: 1, b: 2}), flow sequences ([1, 2]), quoted scalars and comments.
 * Anchors, multi-line scalars and multiple documents are not supported.
 */
class simple_yaml_parser {
public:
    struct parse_result {
        flat_map flat_values;
        size_t error_line = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        std::vector<std::pair<int, std::string>> path_stack;
        std::map<std::string, size_t> sequence_counters;
        size_t line_number = 0;

        std::istringstream stream{std::string{content}};
        std::string line;

        auto fail = [&](std::string message) {
            result.success = false;
            result.error_line = line_number;
            result.error_message = std::move(message);
        };

        while (std::getline(stream, line)) {
            ++line_number;

            auto trimmed = trim(strip_comment(line));
            if (trimmed.empty() || trimmed == "---") {
                continue;
            }

            int indent = 0;
            for (char c : line) {
                if (c == ' ')
                    indent++;
                else if (c == '\t')
                    indent += 2;
                else
                    break;
            }

            // Sequence items may sit at the same indent as their key
            bool is_item = trimmed == "-" || trimmed.starts_with("- ");
            while (!path_stack.empty() &&
                   (is_item ? path_stack.back().first > indent
                            : path_stack.back().first >= indent)) {
                path_stack.pop_back();
            }
            auto path = build_path(path_stack);

            if (is_item) {
                auto item = trim(std::string_view(trimmed).substr(1));
                if (item.empty()) {
                    fail("Nested block sequences are not supported");
                    return result;
                }
                auto item_path =
                    join_path(path, std::to_string(sequence_counters[path]++));
                if (auto error = store_value(item, item_path, result.flat_values)) {
                    fail(*error);
                    return result;
                }
                continue;
            }

            auto colon_pos = find_key_colon(trimmed);
            if (colon_pos == std::string::npos) {
                fail("Invalid YAML syntax: missing colon");
                return result;
            }

            auto key = unquote(trim(std::string_view(trimmed).substr(0, colon_pos)));
            auto value = trim(std::string_view(trimmed).substr(colon_pos + 1));
            if (key.empty()) {
                fail("Invalid YAML syntax: empty key");
                return result;
            }

            if (value.empty()) {
                path_stack.emplace_back(indent, key);
            } else if (auto error = store_value(value, join_path(path, key),
                                                result.flat_values)) {
                fail(*error);
                return result;
            }
        }

        return result;
    }

private:
    [[nodiscard]] static std::string build_path(
        const std::vector<std::pair<int, std::string>>& stack) {
        std::string path;
        for (const auto& [indent, part] : stack) {
            if (!path.empty()) path += ".";
            path += part;
        }
        return path;
    }

    [[nodiscard]] static std::string strip_comment(std::string_view line) {
        char quote = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || line[i - 1] == ' ' ||
                                    line[i - 1] == '\t')) {
                return std::string(line.substr(0, i));
            }
        }
        return std::string(line);
    }

    [[nodiscard]] static std::optional<std::string> store_value(
        const std::string& value, const std::string& path, flat_map& out) {
        if (value.front() == '{' || value.front() == '[') {
            return parse_flow(value, path, out);
        }
        out[path] = unquote(value);
        return std::nullopt;
    }

    /**
     * @brief Split on top-level separators (outside quotes and brackets)
     */
    [[nodiscard]] static std::vector<std::string> split_top_level(
        std::string_view text) {
        std::vector<std::string> parts;
        int depth = 0;
        char quote = 0;
        size_t start = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
            } else if (c == ',' && depth == 0) {
                parts.push_back(trim(text.substr(start, i - start)));
                start = i + 1;
            }
        }
        parts.push_back(trim(text.substr(start)));
        return parts;
    }

    [[nodiscard]] static std::optional<std::string> parse_flow(
        const std::string& text, const std::string& prefix, flat_map& out) {
        const char open = text.front();
        const char close = open == '{' ? '}' : ']';
        if (text.size() < 2 || text.back() != close) {
            return std::string("Unterminated flow collection");
        }

        auto inner = trim(std::string_view(text).substr(1, text.size() - 2));
        if (inner.empty()) {
            out[prefix] = "";
            return std::nullopt;
        }

        size_t index = 0;
        for (const auto& part : split_top_level(inner)) {
            if (part.empty()) {
                continue;
            }

            if (open == '[') {
                auto item_path = join_path(prefix, std::to_string(index++));
                if (auto error = store_value(part, item_path, out)) {
                    return error;
                }
                continue;
            }

            auto colon = part.find(':');
            if (colon == std::string::npos) {
                return "Invalid flow mapping entry: " + part;
            }
            auto key = unquote(trim(std::string_view(part).substr(0, colon)));
            auto value = trim(std::string_view(part).substr(colon + 1));
            if (key.empty()) {
                return std::string("Invalid flow mapping entry: empty key");
            }
            if (value.empty()) {
                out[join_path(prefix, key)] = "";
            } else if (auto error =
                           store_value(value, join_path(prefix, key), out)) {
                return error;
            }
        }
        return std::nullopt;
    }
};

// =============================================================================
// Simple JSON Parser (subset)
// =============================================================================

/**
 * @brief Simple JSON parser flattening objects and arrays into key paths
 */
class simple_json_parser {
public:
    struct parse_result {
        flat_map flat_values;
        size_t error_pos = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        size_t pos = 0;

        skip_whitespace(content, pos);
        if (peek(content, pos) != '{') {
            result.success = false;
            result.error_pos = pos;
            result.error_message = "Expected '{'";
            return result;
        }

        try {
            parse_object(content, pos, "", result.flat_values);
            skip_whitespace(content, pos);
            if (pos != content.size()) {
                throw std::runtime_error("Unexpected data after document");
            }
        } catch (const std::runtime_error& e) {
            result.success = false;
            result.error_pos = pos;
            result.error_message = e.what();
        }

        return result;
    }

private:
    [[nodiscard]] static char peek(std::string_view content, size_t pos) {
        return pos < content.size() ? content[pos] : '\0';
    }

    static void skip_whitespace(std::string_view content, size_t& pos) {
        while (pos < content.length() &&
               std::isspace(static_cast<unsigned char>(content[pos]))) {
            ++pos;
        }
    }

    static std::string parse_string(std::string_view content, size_t& pos) {
        if (peek(content, pos) != '"') {
            throw std::runtime_error("Expected '\"'");
        }
        ++pos;

        std::string result;
        while (pos < content.length() && content[pos] != '"') {
            if (content[pos] == '\\' && pos + 1 < content.length()) {
                ++pos;
                switch (content[pos]) {
                    case 'n':
                        result += '\n';
                        break;
                    case 't':
                        result += '\t';
                        break;
                    case 'r':
                        result += '\r';
                        break;
                    default:
                        result += content[pos];
                }
            } else {
                result += content[pos];
            }
            ++pos;
        }

        if (pos >= content.length()) {
            throw std::runtime_error("Unterminated string");
        }
        ++pos;

        return result;
    }

    static std::string parse_scalar(std::string_view content, size_t& pos) {
        if (peek(content, pos) == '"') {
            return parse_string(content, pos);
        }

        std::string value;
        while (pos < content.length() && content[pos] != ',' &&
               content[pos] != '}' && content[pos] != ']' &&
               !std::isspace(static_cast<unsigned char>(content[pos]))) {
            value += content[pos++];
        }
        if (value.empty()) {
            throw std::runtime_error("Expected value");
        }
        return value;
    }

    static void parse_value(std::string_view content, size_t& pos,
                            const std::string& path, flat_map& result) {
        skip_whitespace(content, pos);
        switch (peek(content, pos)) {
            case '{':
                parse_object(content, pos, path, result);
                break;
            case '[':
                parse_array(content, pos, path, result);
                break;
            default:
                result[path] = parse_scalar(content, pos);
        }
    }

    static void parse_object(std::string_view content, size_t& pos,
                             const std::string& prefix, flat_map& result) {
        ++pos;  // '{'
        skip_whitespace(content, pos);

        if (peek(content, pos) == '}') {
            ++pos;
            if (!prefix.empty()) result[prefix] = "";
            return;
        }

        while (true) {
            skip_whitespace(content, pos);
            auto key = parse_string(content, pos);

            skip_whitespace(content, pos);
            if (peek(content, pos) != ':') {
                throw std::runtime_error("Expected ':'");
            }
            ++pos;

            parse_value(content, pos, join_path(prefix, key), result);

            skip_whitespace(content, pos);
            char c = peek(content, pos);
            ++pos;
            if (c == '}') break;
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}'");
            }
        }
    }

    static void parse_array(std::string_view content, size_t& pos,
                            const std::string& prefix, flat_map& result) {
        ++pos;  // '['
        skip_whitespace(content, pos);

        if (peek(content, pos) == ']') {
            ++pos;
            result[prefix] = "";
            return;
        }

        size_t index = 0;
        while (true) {
            parse_value(content, pos, join_path(prefix, std::to_string(index++)),
                        result);

            skip_whitespace(content, pos);
            char c = peek(content, pos);
            ++pos;
            if (c == ']') break;
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']'");
            }
        }
    }
};

// =============================================================================
// Document Parsing
// =============================================================================

[[nodiscard]] std::expected<flat_map, config_load_error> parse_document(
    std::string_view content, document_format format) {
    if (trim(content).empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration content is empty"));
    }

    if (format == document_format::yaml) {
        auto parsed = simple_yaml_parser::parse(content);
        if (!parsed.success) {
            auto error = make_error(config_error::parse_error,
                                    parsed.error_message);
            error.line_number = parsed.error_line;
            return std::unexpected(error);
        }
        return std::move(parsed.flat_values);
    }

    auto parsed = simple_json_parser::parse(content);
    if (!parsed.success) {
        return std::unexpected(make_error(
            config_error::parse_error,
            parsed.error_message + " at offset " +
                std::to_string(parsed.error_pos)));
    }
    return std::move(parsed.flat_values);
}

// =============================================================================
// Gateway Configuration Mapping
// =============================================================================

[[nodiscard]] config_load_error invalid_value(const std::string& key,
                                              const std::string& value,
                                              const std::string& expected) {
    auto error = make_error(config_error::invalid_value,
                            "Invalid value for " + key + ": '" + value + "'");
    error.validation_errors.push_back({.field_path = key,
                                       .message = "Invalid value",
                                       .actual_value = value,
                                       .expected = expected});
    return error;
}

[[nodiscard]] config_result apply_values(const flat_map& values) {
    gateway_config config;
    std::vector<std::pair<size_t, int>> routing_fields;
    bool routing_set = false;

    constexpr std::string_view routing_prefix = "routing.fields.";

    for (const auto& [key, value] : values) {
        auto expanded = config_loader::expand_env_vars(value);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        const std::string& val = *expanded;

        if (key == "server.name" || key == "name") {
            config.name = val;
        } else if (key == "server.port") {
            auto v = parse_int(val);
            if (!v || *v < 0 || *v > 65535) {
                return std::unexpected(invalid_value(key, val, "0-65535"));
            }
            config.engine.port = static_cast<uint16_t>(*v);
        } else if (key == "server.bind_address") {
            config.engine.bind_address = val;
        } else if (key == "server.idle_timeout") {
            auto v = parse_duration(val);
            if (!v) {
                return std::unexpected(
                    invalid_value(key, val, "Duration such as 30 or 30s"));
            }
            config.engine.idle_timeout = *v;
        } else if (key == "server.backlog") {
            auto v = parse_int(val);
            if (!v) {
                return std::unexpected(invalid_value(key, val, "Integer"));
            }
            config.engine.backlog = static_cast<int>(*v);
        } else if (key == "server.keep_alive") {
            auto v = parse_bool(val);
            if (!v) {
                return std::unexpected(invalid_value(key, val, "Boolean"));
            }
            config.engine.keep_alive = *v;
        } else if (key == "server.no_delay") {
            auto v = parse_bool(val);
            if (!v) {
                return std::unexpected(invalid_value(key, val, "Boolean"));
            }
            config.engine.no_delay = *v;
        } else if (key == "routing.fields") {
            // Empty list, or a single scalar field
            routing_set = true;
            if (!val.empty()) {
                auto v = parse_int(val);
                if (!v) {
                    return std::unexpected(
                        invalid_value(key, val, "List of field indices"));
                }
                routing_fields.emplace_back(0, static_cast<int>(*v));
            }
        } else if (key.starts_with(routing_prefix)) {
            auto position = parse_int(
                std::string_view(key).substr(routing_prefix.size()));
            auto v = parse_int(val);
            if (!position || !v) {
                return std::unexpected(invalid_value(key, val, "Field index"));
            }
            routing_set = true;
            routing_fields.emplace_back(static_cast<size_t>(*position),
                                        static_cast<int>(*v));
        } else if (key == "schema.path") {
            config.schema_path = val;
        } else if (key == "logging.level") {
            auto v = integration::parse_log_level(val);
            if (!v) {
                return std::unexpected(invalid_value(
                    key, val, "trace, debug, info, warning, error, critical"));
            }
            config.logging.level = *v;
        }
    }

    if (routing_set) {
        std::sort(routing_fields.begin(), routing_fields.end());
        config.engine.routing_fields.clear();
        for (const auto& [position, field] : routing_fields) {
            config.engine.routing_fields.push_back(field);
        }
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        auto error = make_error(config_error::validation_error,
                                "Configuration validation failed");
        error.validation_errors = std::move(errors);
        return std::unexpected(error);
    }

    return config;
}

// =============================================================================
// Field Schema Mapping
// =============================================================================

[[nodiscard]] schema_result build_schema(const flat_map& values) {
    std::map<int, codec::field_rule> rules;
    std::map<int, std::pair<bool, bool>> required;  // LenType, MaxLen seen

    for (const auto& [key, value] : values) {
        auto dot = key.find('.');
        auto index_text = std::string_view(key).substr(0, dot);

        auto index = parse_int(index_text);
        if (!index || *index < std::numeric_limits<int>::min() ||
            *index > std::numeric_limits<int>::max()) {
            return std::unexpected(make_error(
                config_error::invalid_value,
                "Field index must be an integer: " + std::string(index_text)));
        }
        const int field = static_cast<int>(*index);

        if (dot == std::string::npos) {
            return std::unexpected(
                make_error(config_error::invalid_value,
                           "Field " + std::to_string(field) +
                               " must be a mapping"));
        }

        auto& rule = rules[field];
        auto& seen = required[field];
        auto property = std::string_view(key).substr(dot + 1);

        if (property == "ContentType") {
            rule.content_type = value;
        } else if (property == "Label") {
            rule.label = value;
        } else if (property == "LenType") {
            rule.len_type_name = value;
            rule.len_type = codec::parse_length_type(value);
            seen.first = true;
        } else if (property == "MaxLen") {
            auto max_len = parse_int(value);
            if (!max_len || *max_len < 0) {
                return std::unexpected(make_error(
                    config_error::invalid_value,
                    "Field " + std::to_string(field) +
                        ": MaxLen must be a non-negative integer, got '" +
                        value + "'"));
            }
            rule.max_len = static_cast<size_t>(*max_len);
            seen.second = true;
        }
    }

    for (const auto& [field, seen] : required) {
        if (!seen.first || !seen.second) {
            return std::unexpected(make_error(
                config_error::missing_required_field,
                "Field " + std::to_string(field) + ": " +
                    (seen.first ? "MaxLen" : "LenType") + " is required"));
        }
    }

    auto schema = codec::field_schema::from_rules(std::move(rules));
    if (!schema) {
        return std::unexpected(make_error(config_error::invalid_schema,
                                          codec::to_string(schema.error())));
    }

    return std::make_shared<const codec::field_schema>(std::move(*schema));
}

template <typename Result, typename Builder>
[[nodiscard]] Result load_file(const std::filesystem::path& path,
                               Builder build) {
    auto format = detect_format(path);
    if (!format) {
        return std::unexpected(format.error());
    }

    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto values = parse_document(*content, *format);
    Result result = values ? build(*values)
                           : Result(std::unexpected(values.error()));
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(error);
    }
    return result;
}

}  // namespace

// =============================================================================
// config_load_error Implementation
// =============================================================================

std::string config_load_error::to_string() const {
    std::string result = message;

    if (file_path) {
        result += " (file: " + file_path->string() + ")";
    }
    if (line_number) {
        result += " at line " + std::to_string(*line_number);
    }

    if (!validation_errors.empty()) {
        result += "\nValidation errors:";
        for (const auto& err : validation_errors) {
            result += "\n  - " + err.field_path + ": " + err.message;
            if (err.actual_value) {
                result += " (got: " + *err.actual_value + ")";
            }
            if (err.expected) {
                result += " (expected: " + *err.expected + ")";
            }
        }
    }

    return result;
}

// =============================================================================
// config_loader Implementation
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    return load_file<config_result>(path, apply_values);
}

config_result config_loader::load_yaml_string(std::string_view yaml_content) {
    auto values = parse_document(yaml_content, document_format::yaml);
    if (!values) {
        return std::unexpected(values.error());
    }
    return apply_values(*values);
}

config_result config_loader::load_json_string(std::string_view json_content) {
    auto values = parse_document(json_content, document_format::json);
    if (!values) {
        return std::unexpected(values.error());
    }
    return apply_values(*values);
}

schema_result config_loader::load_schema(const std::filesystem::path& path) {
    return load_file<schema_result>(path, build_schema);
}

schema_result config_loader::load_schema_yaml_string(
    std::string_view yaml_content) {
    auto values = parse_document(yaml_content, document_format::yaml);
    if (!values) {
        return std::unexpected(values.error());
    }
    return build_schema(*values);
}

schema_result config_loader::load_schema_json_string(
    std::string_view json_content) {
    auto values = parse_document(json_content, document_format::json);
    if (!values) {
        return std::unexpected(values.error());
    }
    return build_schema(*values);
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        if (value[pos] == '$' && pos + 1 < value.size() &&
            value[pos + 1] == '{') {
            size_t end = value.find('}', pos + 2);
            if (end == std::string_view::npos) {
                return std::unexpected(
                    make_error(config_error::parse_error,
                               "Unclosed environment variable reference"));
            }

            std::string_view ref = value.substr(pos + 2, end - pos - 2);
            std::string var_name;
            std::string default_value;
            bool has_default = false;

            if (auto colon_pos = ref.find(":-");
                colon_pos != std::string_view::npos) {
                var_name = std::string(ref.substr(0, colon_pos));
                default_value = std::string(ref.substr(colon_pos + 2));
                has_default = true;
            } else {
                var_name = std::string(ref);
            }

            const char* env_val = std::getenv(var_name.c_str());
            if (env_val != nullptr) {
                result += env_val;
            } else if (has_default) {
                result += default_value;
            } else {
                return std::unexpected(make_error(
                    config_error::env_var_not_found,
                    "Environment variable '" + var_name + "' not found"));
            }

            pos = end + 1;
        } else {
            result += value[pos++];
        }
    }

    return result;
}

bool config_loader::needs_env_expansion(std::string_view value) {
    return value.find("${") != std::string_view::npos;
}

}  // namespace iso8583::gateway::config
