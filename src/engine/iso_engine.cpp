/**
 * @file iso_engine.cpp
 * @brief ISO 8583 TCP dispatch engine implementation
 */

#include "iso8583/gateway/engine/iso_engine.h"

#include "iso8583/gateway/engine/handler_registry.h"
#include "iso8583/gateway/integration/logger_adapter.h"
#include "iso8583/gateway/network/framing.h"
#include "iso8583/gateway/network/network_adapter.h"

#include "../network/bsd_tcp_server.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <span>
#include <thread>
#include <unordered_map>
#include <vector>

namespace iso8583::gateway::engine {

namespace {

[[nodiscard]] std::string describe_key(const routing_key& key) {
    std::string text = "[";
    for (size_t i = 0; i < key.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += '"';
        text += key[i];
        text += '"';
    }
    text += ']';
    return text;
}

}  // namespace

// =============================================================================
// IExecutor Job Implementation (when available)
// =============================================================================

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM

/**
 * @brief Wraps the handling of one connection for execution via IExecutor
 */
class connection_job : public kcenon::common::interfaces::IJob {
public:
    explicit connection_job(std::function<void()> handler)
        : handler_(std::move(handler)) {}

    kcenon::common::VoidResult execute() override {
        if (handler_) {
            handler_();
        }
        return std::monostate{};
    }

    std::string get_name() const override { return "iso8583_connection"; }

private:
    std::function<void()> handler_;
};

#endif  // ISO8583_GATEWAY_HAS_COMMON_SYSTEM

// =============================================================================
// Connection Worker
// =============================================================================

struct connection_worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished =
        std::make_shared<std::atomic<bool>>(false);
};

// =============================================================================
// Engine Implementation
// =============================================================================

class iso_engine::impl {
public:
    impl(const engine_config& config,
         std::shared_ptr<const codec::field_schema> schema)
        : config_(config), schema_(std::move(schema)) {}

    ~impl() { stop(); }

    // =========================================================================
    // Handler Registration
    // =========================================================================

    void add_handler(message_handler handler, routing_key key) {
        registry_.add(std::move(key), std::move(handler));
    }

    void add_default_handler(message_handler handler) {
        registry_.set_default(std::move(handler));
    }

    // =========================================================================
    // Request Processing
    // =========================================================================

    [[nodiscard]] routing_key make_routing_key(
        const codec::iso_message& message) const {
        routing_key key;
        key.reserve(config_.routing_fields.size());
        for (int field : config_.routing_fields) {
            key.push_back(message.get_field(field));
        }
        return key;
    }

    [[nodiscard]] std::expected<void, engine_error> dispatch(
        codec::iso_message& message) const {
        auto key = make_routing_key(message);
        auto handler = registry_.resolve(key);
        if (!handler) {
            return std::unexpected(engine_error::handler_not_found);
        }
        (*handler)(message);
        return {};
    }

    [[nodiscard]] std::expected<std::string, engine_error> process(
        std::string_view payload) {
        auto& logger = integration::get_logger();

        if (!schema_) {
            logger.error(to_string(engine_error::schema_not_loaded));
            return std::unexpected(engine_error::schema_not_loaded);
        }

        codec::iso_message message(schema_);
        if (auto parsed = message.parse(payload); !parsed) {
            logger.error(std::string("ISO 8583 parser error : ") +
                         codec::to_string(parsed.error()));
            increment(&engine_statistics::decode_errors);
            return std::unexpected(engine_error::decode_failed);
        }

        if (logger.is_enabled(integration::log_level::debug)) {
            logger.debug("Request\n" + message.pretty_print());
        }

        std::expected<void, engine_error> dispatched;
        try {
            dispatched = dispatch(message);
        } catch (const std::exception& e) {
            logger.error("Handler failed for key " +
                         describe_key(make_routing_key(message)) + " : " +
                         e.what());
            increment(&engine_statistics::handler_errors);
            return std::unexpected(engine_error::handler_failed);
        }
        if (!dispatched) {
            logger.error("Handle not found for key " +
                         describe_key(make_routing_key(message)));
            increment(&engine_statistics::unrouted_messages);
            return std::unexpected(dispatched.error());
        }

        auto composed = message.compose();
        if (!composed) {
            logger.error(std::string("ISO 8583 compose error : ") +
                         codec::to_string(composed.error()));
            increment(&engine_statistics::encode_errors);
            return std::unexpected(engine_error::encode_failed);
        }

        auto framed = network::frame_message(*composed);
        if (!framed) {
            logger.error(std::string("ISO 8583 compose error : ") +
                         network::to_string(framed.error()));
            increment(&engine_statistics::encode_errors);
            return std::unexpected(engine_error::frame_too_large);
        }

        return std::move(*framed);
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    [[nodiscard]] std::expected<void, engine_error> start() {
        std::lock_guard lock(state_mutex_);

        if (running_) {
            return std::unexpected(engine_error::already_running);
        }
        if (!config_.is_valid()) {
            return std::unexpected(engine_error::invalid_configuration);
        }
        if (!schema_) {
            return std::unexpected(engine_error::schema_not_loaded);
        }

        network::server_config adapter_config;
        adapter_config.port = config_.port;
        adapter_config.bind_address = config_.bind_address;
        adapter_config.backlog = config_.backlog;
        adapter_config.keep_alive = config_.keep_alive;
        adapter_config.no_delay = config_.no_delay;

        server_adapter_ =
            std::make_unique<network::bsd_tcp_server>(adapter_config);
        server_adapter_->on_connection(
            [this](std::unique_ptr<network::tcp_session> session) {
                handle_new_connection(std::move(session));
            });

        stop_requested_ = false;
        {
            std::lock_guard stats_lock(stats_mutex_);
            stats_ = engine_statistics{};
            stats_.started_at = std::chrono::system_clock::now();
        }

        if (auto result = server_adapter_->start(); !result) {
            integration::get_logger().error(
                std::string("Failed to start listener: ") +
                network::to_string(result.error()));
            server_adapter_.reset();
            return std::unexpected(
                result.error() == network::network_error::bind_failed
                    ? engine_error::bind_failed
                    : engine_error::socket_error);
        }

        bound_port_ = server_adapter_->port();
        running_ = true;
        integration::get_logger().info("Listening on port " +
                                       std::to_string(bound_port_.load()));
        return {};
    }

    [[nodiscard]] std::expected<void, engine_error> run() {
        if (auto result = start(); !result) {
            return result;
        }

        std::unique_lock lock(state_mutex_);
        stopped_cv_.wait(lock, [this] { return !running_; });
        return {};
    }

    void stop() {
        {
            std::lock_guard lock(state_mutex_);
            if (!running_) {
                return;
            }
            stop_requested_ = true;
        }

        if (server_adapter_) {
            server_adapter_->stop();
        }

        // Wake up workers blocked in a read
        {
            std::lock_guard lock(sessions_mutex_);
            for (auto& [id, session] : sessions_) {
                session->close();
            }
        }

        {
            std::lock_guard lock(workers_mutex_);
            for (auto& worker : workers_) {
                if (worker.thread.joinable()) {
                    worker.thread.join();
                }
            }
            workers_.clear();

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
            for (auto& f : worker_futures_) {
                if (f.valid()) {
                    f.wait_for(std::chrono::seconds{5});
                }
            }
            worker_futures_.clear();
#endif
        }

        server_adapter_.reset();

        {
            std::lock_guard lock(state_mutex_);
            running_ = false;
        }
        stopped_cv_.notify_all();
        integration::get_logger().info("Listener stopped");
    }

    [[nodiscard]] bool is_running() const noexcept { return running_; }

    [[nodiscard]] uint16_t port() const noexcept {
        return running_ ? bound_port_.load() : config_.port;
    }

    [[nodiscard]] const engine_config& config() const noexcept {
        return config_;
    }

    [[nodiscard]] engine_statistics statistics() const {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

    [[nodiscard]] size_t tracked_workers() const {
        std::lock_guard lock(workers_mutex_);
        size_t count = workers_.size();
#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
        count += worker_futures_.size();
#endif
        return count;
    }

private:
    // =========================================================================
    // Connection Handling
    // =========================================================================

    void handle_new_connection(std::unique_ptr<network::tcp_session> session) {
        auto deadline = std::chrono::steady_clock::now() + config_.idle_timeout;
        std::shared_ptr<network::tcp_session> shared(std::move(session));

        if (stop_requested_) {
            shared->close();
            return;
        }

        {
            std::lock_guard lock(stats_mutex_);
            ++stats_.total_connections;
            ++stats_.active_connections;
        }

        {
            std::lock_guard lock(sessions_mutex_);
            sessions_[shared->session_id()] = shared;
        }

        reap_finished_workers();

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
        if (config_.executor) {
            auto job = std::make_unique<connection_job>(
                [this, shared, deadline] { handle_connection(shared, deadline); });
            auto result = config_.executor->execute(std::move(job));
            if (result.is_ok()) {
                std::lock_guard lock(workers_mutex_);
                worker_futures_.push_back(std::move(result.value()));
                return;
            }
            integration::get_logger().warning(
                "Executor rejected connection job, using a dedicated thread");
        }
#endif

        connection_worker worker;
        auto finished = worker.finished;
        worker.thread = std::thread([this, shared, deadline, finished] {
            handle_connection(shared, deadline);
            *finished = true;
        });

        std::lock_guard lock(workers_mutex_);
        workers_.push_back(std::move(worker));
    }

    void handle_connection(const std::shared_ptr<network::tcp_session>& session,
                           std::chrono::steady_clock::time_point deadline) {
        auto& logger = integration::get_logger();

        auto request = network::read_framed_message(*session, deadline);
        if (!request) {
            logger.error(std::string("read error : ") +
                         network::to_string(request.error()));
            increment(&engine_statistics::read_errors);
        } else {
            increment(&engine_statistics::messages_received);

            auto response = process(*request);
            if (response) {
                auto bytes = std::span<const uint8_t>(
                    reinterpret_cast<const uint8_t*>(response->data()),
                    response->size());
                if (auto sent = session->send(bytes); !sent) {
                    logger.error(std::string("write error : ") +
                                 network::to_string(sent.error()));
                    increment(&engine_statistics::write_errors);
                } else {
                    increment(&engine_statistics::responses_sent);
                }
            }
        }

        session->close();

        {
            std::lock_guard lock(sessions_mutex_);
            sessions_.erase(session->session_id());
        }
        {
            std::lock_guard lock(stats_mutex_);
            if (stats_.active_connections > 0) {
                --stats_.active_connections;
            }
        }
    }

    void reap_finished_workers() {
        std::lock_guard lock(workers_mutex_);
        auto done = std::stable_partition(
            workers_.begin(), workers_.end(),
            [](const connection_worker& w) { return !w.finished->load(); });
        for (auto it = done; it != workers_.end(); ++it) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
        }
        workers_.erase(done, workers_.end());

#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
        std::erase_if(worker_futures_, [](const std::future<void>& f) {
            return !f.valid() ||
                   f.wait_for(std::chrono::seconds(0)) ==
                       std::future_status::ready;
        });
#endif
    }

    void increment(size_t engine_statistics::*counter) {
        std::lock_guard lock(stats_mutex_);
        ++(stats_.*counter);
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    engine_config config_;
    std::shared_ptr<const codec::field_schema> schema_;

    handler_registry registry_;

    std::unique_ptr<network::tcp_server_adapter> server_adapter_;
    std::atomic<uint16_t> bound_port_{0};

    // State management
    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    // Workers
    mutable std::mutex workers_mutex_;
    std::vector<connection_worker> workers_;
#ifdef ISO8583_GATEWAY_HAS_COMMON_SYSTEM
    std::vector<std::future<void>> worker_futures_;
#endif

    // Open sessions (closed on stop)
    std::mutex sessions_mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<network::tcp_session>>
        sessions_;

    // Statistics
    mutable std::mutex stats_mutex_;
    engine_statistics stats_;
};

// =============================================================================
// Engine Public Interface
// =============================================================================

iso_engine::iso_engine(const engine_config& config,
                       std::shared_ptr<const codec::field_schema> schema)
    : pimpl_(std::make_unique<impl>(config, std::move(schema))) {}

iso_engine::~iso_engine() = default;

iso_engine::iso_engine(iso_engine&&) noexcept = default;
iso_engine& iso_engine::operator=(iso_engine&&) noexcept = default;

void iso_engine::add_handler(message_handler handler, routing_key key) {
    pimpl_->add_handler(std::move(handler), std::move(key));
}

void iso_engine::add_default_handler(message_handler handler) {
    pimpl_->add_default_handler(std::move(handler));
}

routing_key iso_engine::make_routing_key(
    const codec::iso_message& message) const {
    return pimpl_->make_routing_key(message);
}

std::expected<void, engine_error> iso_engine::dispatch(
    codec::iso_message& message) const {
    return pimpl_->dispatch(message);
}

std::expected<std::string, engine_error> iso_engine::process(
    std::string_view payload) {
    return pimpl_->process(payload);
}

std::expected<void, engine_error> iso_engine::run() { return pimpl_->run(); }

std::expected<void, engine_error> iso_engine::run_in_background() {
    return pimpl_->start();
}

void iso_engine::stop() { pimpl_->stop(); }

bool iso_engine::is_running() const noexcept { return pimpl_->is_running(); }

uint16_t iso_engine::port() const noexcept { return pimpl_->port(); }

const engine_config& iso_engine::config() const noexcept {
    return pimpl_->config();
}

engine_statistics iso_engine::statistics() const { return pimpl_->statistics(); }

size_t iso_engine::tracked_workers() const { return pimpl_->tracked_workers(); }

}  // namespace iso8583::gateway::engine
