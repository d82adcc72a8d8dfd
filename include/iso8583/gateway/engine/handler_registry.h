#ifndef ISO8583_GATEWAY_ENGINE_HANDLER_REGISTRY_H
#define ISO8583_GATEWAY_ENGINE_HANDLER_REGISTRY_H

/**
 * @file handler_registry.h
 * @brief Routing key to handler mapping
 *
 * Keys are ordered lists of field values, so {"1", "23"} and {"12", "3"}
 * are different keys. Each registry has its own default handler slot.
 * Registration and lookup may run concurrently.
 */

#include "engine_types.h"

#include <map>
#include <optional>
#include <shared_mutex>

namespace iso8583::gateway::engine {

class handler_registry {
public:
    handler_registry() = default;
    ~handler_registry() = default;

    // Non-copyable, non-movable (contains mutex)
    handler_registry(const handler_registry&) = delete;
    handler_registry& operator=(const handler_registry&) = delete;
    handler_registry(handler_registry&&) = delete;
    handler_registry& operator=(handler_registry&&) = delete;

    /**
     * @brief Register a handler; an existing handler for the key is replaced
     */
    void add(routing_key key, message_handler handler);

    /**
     * @brief Replace the default handler (an empty function clears it)
     */
    void set_default(message_handler handler);

    /**
     * @brief Remove the handler of a key
     * @return true if a handler was removed
     */
    bool remove(const routing_key& key);

    /**
     * @brief Find the handler for a key, falling back to the default
     * @return Handler copy, or std::nullopt if neither exists
     */
    [[nodiscard]] std::optional<message_handler> resolve(
        const routing_key& key) const;

    [[nodiscard]] bool contains(const routing_key& key) const;

    [[nodiscard]] bool has_default() const;

    /** Number of keyed handlers (default handler excluded) */
    [[nodiscard]] size_t size() const;

    /** Remove all handlers, including the default */
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::map<routing_key, message_handler> handlers_;
    message_handler default_handler_;
};

}  // namespace iso8583::gateway::engine

#endif  // ISO8583_GATEWAY_ENGINE_HANDLER_REGISTRY_H
