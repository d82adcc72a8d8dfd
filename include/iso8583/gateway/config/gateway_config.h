#ifndef ISO8583_GATEWAY_CONFIG_GATEWAY_CONFIG_H
#define ISO8583_GATEWAY_CONFIG_GATEWAY_CONFIG_H

/**
 * @file gateway_config.h
 * @brief Gateway configuration data structures
 *
 * Configuration Hierarchy:
 *   gateway_config
 *   ├── name
 *   ├── engine (engine::engine_config: port, bind address, idle timeout,
 *   │           routing fields, backlog)
 *   ├── schema_path
 *   └── logging
 */

#include "iso8583/gateway/engine/engine_types.h"
#include "iso8583/gateway/integration/logger_adapter.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace iso8583::gateway::config {

// =============================================================================
// Error Codes (-750 to -759)
// =============================================================================

/**
 * @brief Errors from loading the gateway configuration or a field schema
 */
enum class config_error : int {
    /** Path does not exist */
    file_not_found = -750,

    /** Document is not valid YAML/JSON (subset) */
    parse_error = -751,

    /** gateway_config::validate() reported errors */
    validation_error = -752,

    /** Schema record lacks LenType or MaxLen */
    missing_required_field = -753,

    /** Value has the wrong type or range */
    invalid_value = -754,

    /** ${VAR} without default is unset */
    env_var_not_found = -755,

    /** Extension is not .yaml, .yml or .json */
    invalid_format = -756,

    /** Document has no content */
    empty_config = -757,

    /** File exists but cannot be read */
    io_error = -758,

    /** Field schema violates the MTI/bitmap rules */
    invalid_schema = -759
};

[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Document not found";
        case config_error::parse_error:
            return "Document parse error";
        case config_error::validation_error:
            return "Configuration is invalid";
        case config_error::missing_required_field:
            return "Missing required key";
        case config_error::invalid_value:
            return "Invalid value";
        case config_error::env_var_not_found:
            return "Unset environment variable";
        case config_error::invalid_format:
            return "Unsupported document format";
        case config_error::empty_config:
            return "Empty document";
        case config_error::io_error:
            return "Document read error";
        case config_error::invalid_schema:
            return "Invalid field schema";
        default:
            return "Unknown config_error";
    }
}

/**
 * @brief One failed validation rule
 */
struct validation_error_info {
    /** Dotted key, e.g. "server.port" */
    std::string field_path;

    /** What is wrong */
    std::string message;

    /** Offending value, when there is one */
    std::optional<std::string> actual_value;

    /** Accepted range or form */
    std::optional<std::string> expected;
};

// =============================================================================
// Logging Configuration
// =============================================================================

struct logging_config {
    /** Minimum level written by the gateway logger */
    integration::log_level level = integration::log_level::info;
};

// =============================================================================
// Gateway Configuration
// =============================================================================

/**
 * @brief Everything the gateway executable reads from its config file
 */
struct gateway_config {
    /** Instance name used in logs */
    std::string name = "ISO8583_GATEWAY";

    /** Listener and dispatch settings */
    engine::engine_config engine;

    /** Field schema document (YAML or JSON) */
    std::filesystem::path schema_path = "isopackager.yml";

    /** Logging settings */
    logging_config logging;

    /**
     * @brief Check port, timeouts, routing fields and schema path
     * @return One entry per violated rule; empty when valid
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    [[nodiscard]] bool is_valid() const { return validate().empty(); }
};

}  // namespace iso8583::gateway::config

#endif  // ISO8583_GATEWAY_CONFIG_GATEWAY_CONFIG_H
