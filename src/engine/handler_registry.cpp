/**
 * @file handler_registry.cpp
 * @brief Routing key to handler mapping implementation
 */

#include "iso8583/gateway/engine/handler_registry.h"

#include <mutex>

namespace iso8583::gateway::engine {

void handler_registry::add(routing_key key, message_handler handler) {
    std::unique_lock lock(mutex_);
    handlers_[std::move(key)] = std::move(handler);
}

void handler_registry::set_default(message_handler handler) {
    std::unique_lock lock(mutex_);
    default_handler_ = std::move(handler);
}

bool handler_registry::remove(const routing_key& key) {
    std::unique_lock lock(mutex_);
    return handlers_.erase(key) > 0;
}

std::optional<message_handler> handler_registry::resolve(
    const routing_key& key) const {
    std::shared_lock lock(mutex_);

    auto it = handlers_.find(key);
    if (it != handlers_.end() && it->second) {
        return it->second;
    }
    if (default_handler_) {
        return default_handler_;
    }
    return std::nullopt;
}

bool handler_registry::contains(const routing_key& key) const {
    std::shared_lock lock(mutex_);
    return handlers_.contains(key);
}

bool handler_registry::has_default() const {
    std::shared_lock lock(mutex_);
    return static_cast<bool>(default_handler_);
}

size_t handler_registry::size() const {
    std::shared_lock lock(mutex_);
    return handlers_.size();
}

void handler_registry::clear() {
    std::unique_lock lock(mutex_);
    handlers_.clear();
    default_handler_ = nullptr;
}

}  // namespace iso8583::gateway::engine
