#ifndef ISO8583_GATEWAY_ENGINE_ISO_ENGINE_H
#define ISO8583_GATEWAY_ENGINE_ISO_ENGINE_H

/**
 * @file iso_engine.h
 * @brief ISO 8583 TCP dispatch engine
 *
 * Accepts TCP connections and serves one request per connection:
 *
 *   read frame -> parse -> routing key -> handler -> compose -> frame -> write
 *
 * Every accepted connection is handled on its own worker. Any failure is
 * logged and closes only that connection without a response.
 *
 * @example
 * ```cpp
 * engine_config config;
 * config.port = 8583;
 * config.routing_fields = {0, 3};
 *
 * iso_engine engine(config, schema);
 * engine.add_handler([](codec::iso_message& msg) {
 *     msg.set_mti("0210");
 *     msg.set_field(39, "00");
 * }, "0200", "000000");
 *
 * engine.run();  // blocks until stop()
 * ```
 */

#include "engine_types.h"

#include "iso8583/gateway/codec/field_schema.h"
#include "iso8583/gateway/codec/iso_message.h"

#include <concepts>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace iso8583::gateway::engine {

class iso_engine {
public:
    /**
     * @param config Engine configuration
     * @param schema Field schema shared by all connections (must not be null
     *               for run()/process())
     */
    iso_engine(const engine_config& config,
               std::shared_ptr<const codec::field_schema> schema);

    /**
     * @brief Destructor - stops the engine if running
     */
    ~iso_engine();

    iso_engine(const iso_engine&) = delete;
    iso_engine& operator=(const iso_engine&) = delete;
    iso_engine(iso_engine&&) noexcept;
    iso_engine& operator=(iso_engine&&) noexcept;

    // =========================================================================
    // Handler Registration
    // =========================================================================

    /**
     * @brief Register a handler for an ordered routing key
     *
     * The key has one entry per configured routing field. Registering the
     * same key again replaces the handler. Safe while the engine is running.
     */
    void add_handler(message_handler handler, routing_key key);

    /**
     * @brief Register a handler with the key given as separate parts
     */
    template <typename... Parts>
        requires(std::convertible_to<Parts, std::string> && ...)
    void add_handler(message_handler handler, Parts&&... parts) {
        add_handler(std::move(handler),
                    routing_key{std::string(std::forward<Parts>(parts))...});
    }

    /**
     * @brief Replace this engine's fallback handler
     */
    void add_default_handler(message_handler handler);

    // =========================================================================
    // Request Processing
    // =========================================================================

    /**
     * @brief Build the routing key of a message from the routing fields
     *
     * Absent fields contribute an empty string.
     */
    [[nodiscard]] routing_key make_routing_key(
        const codec::iso_message& message) const;

    /**
     * @brief Invoke the handler matching the message (or the default)
     *
     * @return engine_error::handler_not_found if neither exists
     */
    [[nodiscard]] std::expected<void, engine_error> dispatch(
        codec::iso_message& message) const;

    /**
     * @brief Run one request payload through parse, dispatch and compose
     *
     * @param payload Request without the length header
     * @return Framed response (length header included) or error
     */
    [[nodiscard]] std::expected<std::string, engine_error> process(
        std::string_view payload);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Start listening and block until stop() is called
     */
    [[nodiscard]] std::expected<void, engine_error> run();

    /**
     * @brief Start listening and return immediately
     */
    [[nodiscard]] std::expected<void, engine_error> run_in_background();

    /**
     * @brief Stop listening, close open connections and join workers
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Listening port (the actual port once started with port 0)
     */
    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] const engine_config& config() const noexcept;

    [[nodiscard]] engine_statistics statistics() const;

    /**
     * @brief Connection workers still held by the engine
     *
     * Finished workers are released when the next connection is accepted.
     */
    [[nodiscard]] size_t tracked_workers() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace iso8583::gateway::engine

#endif  // ISO8583_GATEWAY_ENGINE_ISO_ENGINE_H
