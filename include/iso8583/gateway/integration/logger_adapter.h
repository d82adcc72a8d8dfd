#ifndef ISO8583_GATEWAY_INTEGRATION_LOGGER_ADAPTER_H
#define ISO8583_GATEWAY_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger system adapter
 *
 * Provides the logging facade used by the codec, engine and server.
 * Standalone builds log to the console; builds with kcenon common_system
 * can route everything through an ILogger via set_default_logger().
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
namespace kcenon::common::interfaces {
class ILogger;
}  // namespace kcenon::common::interfaces
#endif

namespace iso8583::gateway::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

/**
 * @brief Get log level name string ("TRACE" ... "CRIT")
 */
[[nodiscard]] const char* to_string(log_level level) noexcept;

/**
 * @brief Parse a level name (case-insensitive)
 *
 * Accepts trace, debug, info, warn, warning, error, critical and fatal.
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name);

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Log a message at specified level
     * @param level Log level
     * @param message Log message
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }

    void debug(std::string_view message) { log(log_level::debug, message); }

    void info(std::string_view message) { log(log_level::info, message); }

    void warning(std::string_view message) { log(log_level::warning, message); }

    void error(std::string_view message) { log(log_level::error, message); }

    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    /**
     * @brief Check whether a level passes the current threshold
     */
    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    /**
     * @brief Set minimum log level
     * @param level Minimum level to log
     */
    virtual void set_level(log_level level) = 0;

    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Flush pending log entries
     */
    virtual void flush() = 0;
};

/**
 * @brief Get the global logger instance
 *
 * Lazily creates a console logger named "iso8583_gateway".
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Create a named console logger instance
 * @param name Logger name/category
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Drop the global logger; the next get_logger() call recreates it
 */
void reset_default_logger();

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
/**
 * @brief Create a logger adapter over a common_system ILogger
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Route the global logger through a common_system ILogger
 */
void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);
#endif

}  // namespace iso8583::gateway::integration

#endif  // ISO8583_GATEWAY_INTEGRATION_LOGGER_ADAPTER_H
