/**
 * @file test_discovery_engine.cpp
 * @brief Integration tests: engines discovering each other over loopback multicast.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/runtime.hpp"
#include "network/announcement_codec.hpp"
#include "network/discovery_engine.hpp"
#include "network/socket_provisioner.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lan_discovery;
using namespace std::chrono_literals;

namespace {

DiscoveryConfig fast_config(uint16_t multicast_port) {
    DiscoveryConfig config;
    config.multicast_port = multicast_port;
    config.announce_interval_ms = 100;
    config.expiry_interval_ms = 100;
    config.peer_timeout_ms = 600;
    return config;
}

bool wait_for(const std::function<bool()>& condition, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return condition();
}

bool has_peer(const DiscoveryEngine& engine, const std::string& name) {
    auto peers = engine.get_peers();
    return std::any_of(peers.begin(), peers.end(),
                       [&](const Peer& p) { return p.name == name; });
}

}  // namespace

// ═══════════════════════════════════════════════
// Two-Engine Discovery
// ═══════════════════════════════════════════════

class TwoEngineIntegration : public ::testing::Test {
protected:
    Runtime runtime_{4};
    std::shared_ptr<DiscoveryEngine> alice_;
    std::shared_ptr<DiscoveryEngine> bob_;

    void SetUp() override {
        auto config = fast_config(19874);

        auto alice = DiscoveryEngine::create(runtime_.context(), 8080, "Alice", config);
        if (!alice) {
            GTEST_SKIP() << "Multicast sockets unavailable: " << alice.error().message;
        }
        auto bob = DiscoveryEngine::create(runtime_.context(), 9090, "Bob", config);
        ASSERT_TRUE(bob.has_value()) << bob.error().message;

        alice_ = std::move(*alice);
        bob_ = std::move(*bob);
    }

    void TearDown() override {
        if (alice_) alice_->stop();
        if (bob_) bob_->stop();
    }
};

TEST_F(TwoEngineIntegration, MutualDiscovery) {
    alice_->start();
    bob_->start();
    EXPECT_TRUE(alice_->is_running());

    ASSERT_TRUE(wait_for([&] { return has_peer(*alice_, "Bob") && has_peer(*bob_, "Alice"); }, 3s));

    for (const auto& peer : alice_->get_peers()) {
        EXPECT_NE(peer.name, "Alice");
        if (peer.name == "Bob") {
            EXPECT_EQ(peer.port, 9090);
            // The source is Bob's announce socket, not his service port
            EXPECT_EQ(peer.addr.port(), bob_->announce_endpoint().port());
        }
    }
    for (const auto& peer : bob_->get_peers()) {
        EXPECT_NE(peer.name, "Bob");
        if (peer.name == "Alice") {
            EXPECT_EQ(peer.port, 8080);
        }
    }
}

TEST_F(TwoEngineIntegration, StoppedPeerIsEvicted) {
    std::atomic<int> lost{0};
    alice_->on_peer_lost([&lost](const Peer& p) {
        if (p.name == "Bob") lost.fetch_add(1);
    });

    alice_->start();
    bob_->start();
    ASSERT_TRUE(wait_for([&] { return has_peer(*alice_, "Bob"); }, 3s));

    bob_->stop();
    EXPECT_FALSE(bob_->is_running());

    // timeout + one sweep interval, with slack
    ASSERT_TRUE(wait_for([&] { return !has_peer(*alice_, "Bob"); }, 2s));
    EXPECT_EQ(lost.load(), 1);

    // Bob's loops are gone, so age his registry by hand once Alice goes quiet
    alice_->stop();
    auto timeout = std::chrono::milliseconds(bob_->config().peer_timeout_ms);
    bob_->sweep_expired(std::chrono::steady_clock::now() + timeout);
    EXPECT_FALSE(has_peer(*bob_, "Alice"));
}

TEST_F(TwoEngineIntegration, RenamePropagates) {
    alice_->start();
    bob_->start();
    ASSERT_TRUE(wait_for([&] { return has_peer(*alice_, "Bob"); }, 3s));

    bob_->update_local_announcement(Announcement{.name = "Robert", .port = 9191});

    ASSERT_TRUE(wait_for([&] { return has_peer(*alice_, "Robert"); }, 3s));
    // The old name ages out on its own
    EXPECT_TRUE(wait_for([&] { return !has_peer(*alice_, "Bob"); }, 2s));
}

TEST_F(TwoEngineIntegration, SecondStartIsIgnored) {
    alice_->start();
    alice_->start();
    EXPECT_TRUE(alice_->is_running());
}

TEST_F(TwoEngineIntegration, StopIsIdempotent) {
    alice_->start();
    alice_->stop();
    alice_->stop();
    EXPECT_FALSE(alice_->is_running());
}

// ═══════════════════════════════════════════════
// Wire behaviour
// ═══════════════════════════════════════════════

TEST(WireIntegration, AnnouncementsAreSentPeriodically) {
    Runtime runtime(2);
    auto config = fast_config(19875);

    auto engine = DiscoveryEngine::create(runtime.context(), 8080, "Alice", config);
    if (!engine) GTEST_SKIP() << engine.error().message;

    // An independent listener on the same group and port
    auto sockets = provision_sockets(runtime.context(), SocketOptions{
        .local_address = (*engine)->local_address(),
        .group = boost::asio::ip::make_address_v4(config.multicast_address),
        .port = config.multicast_port,
        .ttl = 1
    });
    ASSERT_TRUE(sockets.has_value()) << sockets.error().message;
    auto& listen = sockets->listen;

    (*engine)->start();

    std::vector<char> buffer(4096);
    Endpoint sender;
    int received = 0;
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (received < 3 && std::chrono::steady_clock::now() < deadline) {
        boost::system::error_code ec;
        size_t n = listen.available(ec);
        if (ec || n == 0) {
            std::this_thread::sleep_for(10ms);
            continue;
        }
        n = listen.receive_from(boost::asio::buffer(buffer), sender, 0, ec);
        ASSERT_FALSE(ec) << ec.message();

        auto decoded = AnnouncementCodec::decode(buffer.data(), n);
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
        EXPECT_EQ(decoded->name, "Alice");
        EXPECT_EQ(decoded->port, 8080);
        ++received;
    }
    EXPECT_GE(received, 3);

    (*engine)->stop();
}

// ═══════════════════════════════════════════════
// Listener resilience
// ═══════════════════════════════════════════════

class ListenerResilience : public ::testing::Test {
protected:
    Runtime runtime_{2};
    DiscoveryConfig config_ = fast_config(19876);
    std::shared_ptr<DiscoveryEngine> engine_;
    std::optional<ProvisionedSockets> sender_;

    void SetUp() override {
        auto engine = DiscoveryEngine::create(runtime_.context(), 8080, "Alice", config_);
        if (!engine) {
            GTEST_SKIP() << "Multicast sockets unavailable: " << engine.error().message;
        }
        engine_ = std::move(*engine);

        auto sockets = provision_sockets(runtime_.context(), SocketOptions{
            .local_address = engine_->local_address(),
            .group = boost::asio::ip::make_address_v4(config_.multicast_address),
            .port = config_.multicast_port,
            .ttl = 1
        });
        ASSERT_TRUE(sockets.has_value()) << sockets.error().message;
        sender_.emplace(std::move(*sockets));

        boost::system::error_code ec;
        sender_->announce.non_blocking(false, ec);
        ASSERT_FALSE(ec) << ec.message();
    }

    void TearDown() override {
        if (engine_) engine_->stop();
    }

    void send(const std::string& payload) {
        Endpoint group(boost::asio::ip::make_address_v4(config_.multicast_address),
                       config_.multicast_port);
        boost::system::error_code ec;
        sender_->announce.send_to(boost::asio::buffer(payload), group, 0, ec);
        ASSERT_FALSE(ec) << ec.message();
    }
};

TEST_F(ListenerResilience, DeeplyNestedDatagramDoesNotStopListener) {
    engine_->start();

    send(R"({"name":"Before","port":1000})");
    ASSERT_TRUE(wait_for([&] { return has_peer(*engine_, "Before"); }, 2s));

    send(std::string(2000, '['));
    send(R"({"name":"After","port":2000})");

    EXPECT_TRUE(wait_for([&] { return has_peer(*engine_, "After"); }, 2s));
    EXPECT_EQ(engine_->known_peer_count(), 2u);
}

TEST_F(ListenerResilience, ThrowingCallbackDoesNotStopListener) {
    engine_->on_peer_discovered([](const Peer&) {
        throw std::runtime_error("callback failure");
    });
    engine_->start();

    send(R"({"name":"First","port":1000})");
    ASSERT_TRUE(wait_for([&] { return has_peer(*engine_, "First"); }, 2s));

    send(R"({"name":"Second","port":2000})");
    EXPECT_TRUE(wait_for([&] { return has_peer(*engine_, "Second"); }, 2s));
}

TEST_F(ListenerResilience, ThrowingLostCallbackDoesNotStopExpiry) {
    std::atomic<int> lost{0};
    engine_->on_peer_lost([&lost](const Peer&) {
        lost.fetch_add(1);
        throw std::runtime_error("callback failure");
    });
    engine_->start();

    send(R"({"name":"First","port":1000})");
    ASSERT_TRUE(wait_for([&] { return has_peer(*engine_, "First"); }, 2s));
    ASSERT_TRUE(wait_for([&] { return !has_peer(*engine_, "First"); }, 2s));

    // A later peer is still aged out, so the sweep kept running
    send(R"({"name":"Second","port":2000})");
    ASSERT_TRUE(wait_for([&] { return has_peer(*engine_, "Second"); }, 2s));
    EXPECT_TRUE(wait_for([&] { return !has_peer(*engine_, "Second"); }, 2s));
    EXPECT_EQ(lost.load(), 2);
}
