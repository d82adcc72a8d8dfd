/**
 * @file bsd_adapter_test.cpp
 * @brief Integration tests for the BSD socket TCP server adapter
 *
 * Tests BSD socket implementation:
 * - Listener lifecycle and ephemeral ports
 * - Connection acceptance and session metadata
 * - Send/receive and timeouts
 * - Error conditions
 */

#include "src/network/bsd_tcp_server.h"

#include "utils/test_helpers.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace iso8583::gateway::network::test {

using gateway::test::raw_client;
using gateway::test::wait_for;

/**
 * @brief Test fixture for BSD adapter tests
 */
class BSDAdapterTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (server_) {
            server_->stop();
            server_.reset();
        }
    }

    /**
     * @brief Create and start a server on an ephemeral port
     */
    std::unique_ptr<bsd_tcp_server> create_server() {
        server_config config;
        config.port = 0;
        config.bind_address = "127.0.0.1";
        config.backlog = 10;
        config.accept_poll_interval = std::chrono::milliseconds(20);

        auto server = std::make_unique<bsd_tcp_server>(config);

        server->on_connection([this](std::unique_ptr<tcp_session> session) {
            on_new_connection(std::move(session));
        });

        auto result = server->start();
        EXPECT_TRUE(result.has_value()) << "Server failed to start";

        return server;
    }

    void on_new_connection(std::unique_ptr<tcp_session> session) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.push_back(std::move(session));
        sessions_cv_.notify_all();
    }

    /**
     * @brief Wait for N sessions to be accepted
     */
    bool wait_for_sessions(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(sessions_mutex_);
        return sessions_cv_.wait_for(
            lock, timeout, [this, count] { return sessions_.size() >= count; });
    }

    tcp_session& session(size_t index) {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return *sessions_.at(index);
    }

    std::unique_ptr<bsd_tcp_server> server_;
    std::vector<std::unique_ptr<tcp_session>> sessions_;
    std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
};

// =============================================================================
// Server Lifecycle Tests
// =============================================================================

TEST_F(BSDAdapterTest, ServerStartAndStop) {
    server_ = create_server();

    EXPECT_TRUE(server_->is_running());
    EXPECT_GT(server_->port(), 0);

    server_->stop();

    EXPECT_FALSE(server_->is_running());
}

TEST_F(BSDAdapterTest, ServerStartTwice) {
    server_ = create_server();

    auto result = server_->start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(network_error::already_running, result.error());
}

TEST_F(BSDAdapterTest, ServerRestartAfterStop) {
    server_ = create_server();
    server_->stop();

    auto result = server_->start();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(server_->is_running());
}

TEST_F(BSDAdapterTest, ServerPortAlreadyInUse) {
    server_ = create_server();

    server_config config;
    config.port = server_->port();
    config.bind_address = "127.0.0.1";
    config.reuse_addr = false;

    bsd_tcp_server second(config);
    second.on_connection([](std::unique_ptr<tcp_session>) {});

    auto result = second.start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(network_error::bind_failed, result.error());
}

TEST_F(BSDAdapterTest, InvalidConfiguration) {
    server_config config;
    config.port = 0;
    config.backlog = 0;

    bsd_tcp_server server(config);
    auto result = server.start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(network_error::invalid_config, result.error());

    server_config bad_address;
    bad_address.port = 0;
    bad_address.bind_address = "not-an-address";

    bsd_tcp_server second(bad_address);
    auto second_result = second.start();
    ASSERT_FALSE(second_result.has_value());
    EXPECT_EQ(network_error::invalid_config, second_result.error());
}

// =============================================================================
// Connection Lifecycle Tests
// =============================================================================

TEST_F(BSDAdapterTest, SingleConnectionLifecycle) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));

    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    auto& accepted = session(0);
    EXPECT_TRUE(accepted.is_open());
    EXPECT_EQ("127.0.0.1", accepted.remote_address());
    EXPECT_GT(accepted.remote_port(), 0);
    EXPECT_GT(accepted.session_id(), 0u);
    EXPECT_EQ(1u, server_->accepted_count());
}

TEST_F(BSDAdapterTest, SequentialConnectionsGetDistinctIds) {
    server_ = create_server();

    const size_t num_connections = 5;
    std::vector<std::unique_ptr<raw_client>> clients;
    for (size_t i = 0; i < num_connections; ++i) {
        clients.push_back(std::make_unique<raw_client>());
        ASSERT_TRUE(clients.back()->connect(server_->port()));
    }

    ASSERT_TRUE(wait_for_sessions(num_connections, std::chrono::seconds(5)));
    EXPECT_EQ(num_connections, server_->accepted_count());

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (size_t i = 1; i < sessions_.size(); ++i) {
        EXPECT_NE(sessions_[i - 1]->session_id(), sessions_[i]->session_id());
    }
}

TEST_F(BSDAdapterTest, SendAndReceive) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));
    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    ASSERT_TRUE(client.send("Hello ISO 8583"));

    auto& accepted = session(0);
    std::string received;
    ASSERT_TRUE(wait_for(
        [&] {
            auto chunk = accepted.receive(1024, std::chrono::milliseconds(100));
            if (chunk) {
                received.append(chunk->begin(), chunk->end());
            }
            return received.size() >= 14;
        },
        std::chrono::seconds(5)));
    EXPECT_EQ("Hello ISO 8583", received);

    std::string reply = "0002OK";
    auto sent = accepted.send(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(reply.data()), reply.size()));
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(reply.size(), *sent);

    accepted.close();
    auto echoed = client.read_until_close(std::chrono::seconds(5));
    ASSERT_TRUE(echoed.has_value());
    EXPECT_EQ(reply, *echoed);

    auto stats = accepted.get_stats();
    EXPECT_EQ(14u, stats.bytes_received);
    EXPECT_EQ(reply.size(), stats.bytes_sent);
}

TEST_F(BSDAdapterTest, ReceiveTimeout) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));
    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    auto start = std::chrono::steady_clock::now();
    auto result = session(0).receive(16, std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(network_error::timeout, result.error());
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
}

TEST_F(BSDAdapterTest, ReceiveAfterPeerClose) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));
    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    client.close();

    auto result = session(0).receive(16, std::chrono::seconds(5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(network_error::connection_closed, result.error());
    EXPECT_FALSE(session(0).is_open());
}

TEST_F(BSDAdapterTest, CloseWakesBlockedReceive) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));
    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    auto& accepted = session(0);
    std::atomic<bool> returned{false};
    std::thread reader([&] {
        auto result = accepted.receive(16, std::chrono::seconds(10));
        EXPECT_FALSE(result.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    accepted.close();

    EXPECT_TRUE(wait_for([&] { return returned.load(); }, std::chrono::seconds(2)));
    reader.join();

    auto sent = accepted.send(std::span<const uint8_t>());
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(network_error::connection_closed, sent.error());
}

TEST_F(BSDAdapterTest, StopWithOpenClient) {
    server_ = create_server();

    raw_client client;
    ASSERT_TRUE(client.connect(server_->port()));
    ASSERT_TRUE(wait_for_sessions(1, std::chrono::seconds(5)));

    auto start = std::chrono::steady_clock::now();
    server_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_FALSE(server_->is_running());
}

}  // namespace iso8583::gateway::network::test
