/**
 * @file logger_adapter.cpp
 * @brief Console and common_system ILogger backends for logger_adapter
 */

#include "iso8583/gateway/integration/logger_adapter.h"

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
#include <kcenon/common/interfaces/logger_interface.h>
#endif

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace iso8583::gateway::integration {

namespace {

struct level_name {
    log_level level;
    std::string_view name;
};

/** Names accepted by parse_log_level() */
constexpr std::array<level_name, 8> LEVEL_NAMES{{
    {log_level::trace, "trace"},
    {log_level::debug, "debug"},
    {log_level::info, "info"},
    {log_level::warning, "warn"},
    {log_level::warning, "warning"},
    {log_level::error, "error"},
    {log_level::critical, "critical"},
    {log_level::critical, "fatal"},
}};

/**
 * @brief "2024-01-15 10:30:00.123 [INFO] [name] message\n"
 */
std::string format_record(log_level level, std::string_view name,
                          std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream record;
    record << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << millis << " ["
           << to_string(level) << "] ";
    if (!name.empty()) {
        record << '[' << name << "] ";
    }
    record << message << '\n';
    return record.str();
}

// =============================================================================
// Console Backend
// =============================================================================

/**
 * @brief Writes error and critical records to stderr, the rest to stdout
 */
class console_logger final : public logger_adapter {
public:
    explicit console_logger(std::string_view name) : name_(name) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }

        auto record = format_record(level, name_, message);
        std::lock_guard<std::mutex> lock(write_mutex_);
        (level >= log_level::error ? std::cerr : std::cout) << record;
    }

    void set_level(log_level level) override { level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override {
        return level_;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    std::atomic<log_level> level_{log_level::info};
    std::mutex write_mutex_;
};

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM

// =============================================================================
// common_system Backend
// =============================================================================

namespace common = kcenon::common::interfaces;

constexpr std::array<std::pair<log_level, common::log_level>, 6> LEVEL_MAP{{
    {log_level::trace, common::log_level::trace},
    {log_level::debug, common::log_level::debug},
    {log_level::info, common::log_level::info},
    {log_level::warning, common::log_level::warning},
    {log_level::error, common::log_level::error},
    {log_level::critical, common::log_level::critical},
}};

common::log_level to_common(log_level level) {
    for (const auto& [ours, theirs] : LEVEL_MAP) {
        if (ours == level) {
            return theirs;
        }
    }
    return common::log_level::info;
}

log_level from_common(common::log_level level) {
    if (level == common::log_level::off) {
        return log_level::critical;
    }
    for (const auto& [ours, theirs] : LEVEL_MAP) {
        if (theirs == level) {
            return ours;
        }
    }
    return log_level::info;
}

/**
 * @brief Forwards to an ILogger; a null ILogger drops every record
 */
class ilogger_bridge final : public logger_adapter {
public:
    explicit ilogger_bridge(std::shared_ptr<common::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            level_ = from_common(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (logger_ && is_enabled(level)) {
            // Failures of the sink are not reported back to callers
            static_cast<void>(logger_->log(to_common(level), message));
        }
    }

    void set_level(log_level level) override {
        level_ = level;
        if (logger_) {
            static_cast<void>(logger_->set_level(to_common(level)));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return level_;
    }

    void flush() override {
        if (logger_) {
            static_cast<void>(logger_->flush());
        }
    }

private:
    std::shared_ptr<common::ILogger> logger_;
    std::atomic<log_level> level_{log_level::info};
};

#endif  // ISO8583_GATEWAY_HAS_COMMON_SYSTEM

std::unique_ptr<logger_adapter> g_default_logger;
std::mutex g_default_logger_mutex;

}  // namespace

// =============================================================================
// Level Names
// =============================================================================

const char* to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
    }
    return "UNKNOWN";
}

std::optional<log_level> parse_log_level(std::string_view name) {
    std::string lower(name);
    for (char& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (const auto& entry : LEVEL_NAMES) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Factories and Default Logger
// =============================================================================

logger_adapter& get_logger() {
    std::lock_guard<std::mutex> lock(g_default_logger_mutex);
    if (!g_default_logger) {
        g_default_logger = std::make_unique<console_logger>("iso8583_gateway");
    }
    return *g_default_logger;
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    return std::make_unique<console_logger>(name);
}

void reset_default_logger() {
    std::lock_guard<std::mutex> lock(g_default_logger_mutex);
    g_default_logger.reset();
}

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM

std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger) {
    return std::make_unique<ilogger_bridge>(std::move(logger));
}

void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger) {
    std::lock_guard<std::mutex> lock(g_default_logger_mutex);
    g_default_logger = std::make_unique<ilogger_bridge>(std::move(logger));
}

#endif  // ISO8583_GATEWAY_HAS_COMMON_SYSTEM

}  // namespace iso8583::gateway::integration
