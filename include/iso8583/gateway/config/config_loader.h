#ifndef ISO8583_GATEWAY_CONFIG_CONFIG_LOADER_H
#define ISO8583_GATEWAY_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief Gateway configuration and field schema loader (YAML and JSON)
 *
 * Features:
 *   - Format detection by file extension (.yaml, .yml, .json)
 *   - Environment variable substitution in gateway configuration values
 *   - Validation with detailed error messages
 *
 * Supported environment variable syntax:
 *   - ${VAR} - Required variable (error if not set)
 *   - ${VAR:-default} - Optional with default value
 *
 * Field schema document:
 * ```yaml
 * 0: {ContentType: n, Label: MTI, LenType: fixed, MaxLen: 4}
 * 1: {ContentType: b, Label: Bitmap, LenType: fixed, MaxLen: 16}
 * 2:
 *   ContentType: n
 *   Label: Primary Account Number
 *   LenType: llvar
 *   MaxLen: 19
 * ```
 *
 * @example Loading configuration and schema
 * ```cpp
 * auto config = config_loader::load("/etc/iso8583/gateway.yaml");
 * if (!config) {
 *     std::cerr << config.error().to_string() << std::endl;
 *     return 1;
 * }
 * auto schema = config_loader::load_schema(config->schema_path);
 * ```
 */

#include "gateway_config.h"

#include "iso8583/gateway/codec/field_schema.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iso8583::gateway::config {

// =============================================================================
// Load Result Types
// =============================================================================

/**
 * @brief Detailed error information from configuration loading
 */
struct config_load_error {
    /** Error code */
    config_error code;

    /** Human-readable error message */
    std::string message;

    /** File path where error occurred (if applicable) */
    std::optional<std::filesystem::path> file_path;

    /** Line number where error occurred (if applicable) */
    std::optional<size_t> line_number;

    /** Validation errors (if validation failed) */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Get formatted error message with location
     */
    [[nodiscard]] std::string to_string() const;
};

using config_result = std::expected<gateway_config, config_load_error>;

using schema_result =
    std::expected<std::shared_ptr<const codec::field_schema>, config_load_error>;

// =============================================================================
// Configuration Loader
// =============================================================================

/**
 * @brief Static loader for gateway configuration and field schemas
 */
class config_loader {
public:
    // =========================================================================
    // Gateway Configuration
    // =========================================================================

    /**
     * @brief Load gateway configuration from file (format by extension)
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_yaml_string(
        std::string_view yaml_content);

    [[nodiscard]] static config_result load_json_string(
        std::string_view json_content);

    // =========================================================================
    // Field Schema
    // =========================================================================

    /**
     * @brief Load a field schema from file (format by extension)
     *
     * Every call produces a new schema object.
     *
     * @return Schema or error (SchemaLoadError)
     */
    [[nodiscard]] static schema_result load_schema(
        const std::filesystem::path& path);

    [[nodiscard]] static schema_result load_schema_yaml_string(
        std::string_view yaml_content);

    [[nodiscard]] static schema_result load_schema_json_string(
        std::string_view json_content);

    // =========================================================================
    // Environment Variable Processing
    // =========================================================================

    /**
     * @brief Expand ${VAR} and ${VAR:-default} references
     *
     * @return Expanded string or error if a required variable is missing
     */
    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    /**
     * @brief Check if string contains environment variable references
     */
    [[nodiscard]] static bool needs_env_expansion(std::string_view value);
};

}  // namespace iso8583::gateway::config

#endif  // ISO8583_GATEWAY_CONFIG_CONFIG_LOADER_H
