/**
 * @file gateway_config.cpp
 * @brief Gateway configuration validation
 */

#include "iso8583/gateway/config/gateway_config.h"

namespace iso8583::gateway::config {

std::vector<validation_error_info> gateway_config::validate() const {
    std::vector<validation_error_info> errors;

    if (name.empty()) {
        errors.push_back({.field_path = "server.name",
                          .message = "Server name cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Non-empty string"});
    }

    if (engine.idle_timeout.count() <= 0) {
        errors.push_back(
            {.field_path = "server.idle_timeout",
             .message = "Idle timeout must be > 0",
             .actual_value = std::to_string(engine.idle_timeout.count()),
             .expected = "Positive duration"});
    }

    if (engine.backlog <= 0) {
        errors.push_back({.field_path = "server.backlog",
                          .message = "Listen backlog must be > 0",
                          .actual_value = std::to_string(engine.backlog),
                          .expected = "Positive integer"});
    }

    for (size_t i = 0; i < engine.routing_fields.size(); ++i) {
        int field = engine.routing_fields[i];
        if (field < codec::MTI_FIELD || field > codec::MAX_FIELD) {
            errors.push_back(
                {.field_path = "routing.fields." + std::to_string(i),
                 .message = "Routing field index out of range",
                 .actual_value = std::to_string(field),
                 .expected = "0-128"});
        }
    }

    if (schema_path.empty()) {
        errors.push_back({.field_path = "schema.path",
                          .message = "Field schema path cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Path to a YAML or JSON schema"});
    }

    return errors;
}

}  // namespace iso8583::gateway::config
