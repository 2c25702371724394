/**
 * @file test_discovery_engine.cpp
 * @brief Unit tests for DiscoveryEngine datagram handling and expiry.
 * @author Dimitris Kafetzis
 *
 * These drive ingest_datagram() and sweep_expired() directly, without
 * starting the network loops.
 */

#include "network/discovery_engine.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lan_discovery;
using namespace std::chrono_literals;

class DiscoveryEngineTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    std::shared_ptr<DiscoveryEngine> engine_;

    void SetUp() override {
        DiscoveryConfig config;
        config.multicast_port = 19871;
        config.interface_address = "127.0.0.1";

        auto result = DiscoveryEngine::create(io_, 8080, "Alice", config);
        if (!result) {
            GTEST_SKIP() << "Multicast sockets unavailable: " << result.error().message;
        }
        engine_ = std::move(*result);
    }

    bool feed(const std::string& payload, const char* ip = "192.168.1.50", uint16_t port = 40000) {
        Endpoint sender(boost::asio::ip::make_address_v4(ip), port);
        return engine_->ingest_datagram(payload.data(), payload.size(), sender);
    }
};

TEST_F(DiscoveryEngineTest, CreatedButNotRunning) {
    EXPECT_FALSE(engine_->is_running());
    EXPECT_EQ(engine_->known_peer_count(), 0u);
    EXPECT_EQ(engine_->local_announcement(), (Announcement{.name = "Alice", .port = 8080}));
    EXPECT_EQ(engine_->local_address(), boost::asio::ip::make_address_v4("127.0.0.1"));
    EXPECT_NE(engine_->announce_endpoint().port(), 0);
}

TEST_F(DiscoveryEngineTest, ValidAnnouncementRegistersPeer) {
    EXPECT_TRUE(feed(R"({"name":"Bob","port":9090})", "192.168.1.50", 40001));

    auto peers = engine_->get_peers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].name, "Bob");
    EXPECT_EQ(peers[0].port, 9090);
    // Source address, not the announced service port
    EXPECT_EQ(peers[0].addr_string(), "192.168.1.50:40001");
}

TEST_F(DiscoveryEngineTest, SelfAnnouncementIsFiltered) {
    EXPECT_FALSE(feed(R"({"name":"Alice","port":8080})"));
    EXPECT_EQ(engine_->known_peer_count(), 0u);
}

TEST_F(DiscoveryEngineTest, SelfFilterFollowsRename) {
    engine_->set_local_name("Alicia");
    EXPECT_TRUE(feed(R"({"name":"Alice","port":8080})"));
    EXPECT_FALSE(feed(R"({"name":"Alicia","port":8080})"));
    EXPECT_EQ(engine_->known_peer_count(), 1u);
}

TEST_F(DiscoveryEngineTest, MalformedDatagramLeavesRegistryUntouched) {
    feed(R"({"name":"Bob","port":9090})");
    auto before = engine_->peers_as_bytes();

    EXPECT_FALSE(feed("garbage"));
    EXPECT_FALSE(feed(R"({"name":"Carol"})"));
    EXPECT_FALSE(feed(R"({"name":"Carol","port":70000})"));

    EXPECT_EQ(engine_->known_peer_count(), 1u);
    EXPECT_EQ(engine_->peers_as_bytes(), before);
}

TEST_F(DiscoveryEngineTest, SameNameFromNewAddressKeepsOneSlot) {
    feed(R"({"name":"Bob","port":9090})", "192.168.1.50", 40000);
    feed(R"({"name":"Bob","port":9191})", "192.168.1.77", 41000);

    auto peers = engine_->get_peers();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].port, 9191);
    EXPECT_EQ(peers[0].addr_string(), "192.168.1.77:41000");
}

TEST_F(DiscoveryEngineTest, SweepEvictsAfterTimeout) {
    feed(R"({"name":"Bob","port":9090})");
    auto now = std::chrono::steady_clock::now();

    EXPECT_EQ(engine_->sweep_expired(now), 0u);
    EXPECT_EQ(engine_->known_peer_count(), 1u);

    auto timeout = std::chrono::milliseconds(engine_->config().peer_timeout_ms);
    EXPECT_EQ(engine_->sweep_expired(now + timeout + 1ms), 1u);
    EXPECT_EQ(engine_->known_peer_count(), 0u);
}

TEST_F(DiscoveryEngineTest, CallbacksFireOnDiscoveryAndLoss) {
    std::vector<std::string> discovered;
    std::vector<std::string> lost;
    engine_->on_peer_discovered([&](const Peer& p) { discovered.push_back(p.name); });
    engine_->on_peer_lost([&](const Peer& p) { lost.push_back(p.name); });

    feed(R"({"name":"Bob","port":9090})");
    feed(R"({"name":"Bob","port":9090})");  // refresh, not a new discovery
    feed(R"({"name":"Carol","port":7000})");

    ASSERT_EQ(discovered.size(), 2u);
    EXPECT_EQ(discovered[0], "Bob");
    EXPECT_EQ(discovered[1], "Carol");

    engine_->sweep_expired(std::chrono::steady_clock::now() + 1h);
    EXPECT_EQ(lost.size(), 2u);
}

TEST_F(DiscoveryEngineTest, ThrowingCallbackDoesNotBlockOthers) {
    std::vector<std::string> discovered;
    engine_->on_peer_discovered([](const Peer&) { throw std::runtime_error("boom"); });
    engine_->on_peer_discovered([&](const Peer& p) { discovered.push_back(p.name); });

    EXPECT_TRUE(feed(R"({"name":"Bob","port":9090})"));
    EXPECT_TRUE(feed(R"({"name":"Carol","port":7000})"));

    EXPECT_EQ(engine_->known_peer_count(), 2u);
    ASSERT_EQ(discovered.size(), 2u);
    EXPECT_EQ(discovered[1], "Carol");
}

TEST_F(DiscoveryEngineTest, ThrowingLostCallbackStillEvictsEveryPeer) {
    int lost = 0;
    engine_->on_peer_lost([&lost](const Peer&) {
        ++lost;
        throw std::runtime_error("boom");
    });

    feed(R"({"name":"Bob","port":9090})");
    feed(R"({"name":"Carol","port":7000})");

    EXPECT_EQ(engine_->sweep_expired(std::chrono::steady_clock::now() + 1h), 2u);
    EXPECT_EQ(engine_->known_peer_count(), 0u);
    EXPECT_EQ(lost, 2);
}

TEST_F(DiscoveryEngineTest, CallbackMayRegisterAnotherCallback) {
    int late = 0;
    engine_->on_peer_discovered([&](const Peer&) {
        engine_->on_peer_lost([&late](const Peer&) { ++late; });
    });

    feed(R"({"name":"Bob","port":9090})");
    engine_->sweep_expired(std::chrono::steady_clock::now() + 1h);
    EXPECT_EQ(late, 1);
}

TEST_F(DiscoveryEngineTest, UpdateLocalAnnouncement) {
    engine_->update_local_announcement(Announcement{.name = "Zed", .port = 1234});
    EXPECT_EQ(engine_->local_announcement().name, "Zed");
    engine_->set_service_port(4321);
    EXPECT_EQ(engine_->local_announcement().port, 4321);
}

TEST_F(DiscoveryEngineTest, PeersAsBytesMatchesSnapshot) {
    feed(R"({"name":"Bob","port":9090})", "10.1.1.1", 5555);
    auto bytes = engine_->peers_as_bytes();
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()),
              R"([{"addr":"10.1.1.1:5555","name":"Bob","port":9090}])");
}

// ═══════════════════════════════════════════════
// Setup failures
// ═══════════════════════════════════════════════

TEST(DiscoveryEngineSetupTest, InvalidGroupIsSetupError) {
    boost::asio::io_context io;
    DiscoveryConfig config;
    config.multicast_address = "10.0.0.1";

    auto result = DiscoveryEngine::create(io, 8080, "Alice", config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Setup);
}

TEST(DiscoveryEngineSetupTest, UnassignedInterfaceIsSetupError) {
    boost::asio::io_context io;
    DiscoveryConfig config;
    config.multicast_port = 19872;
    // TEST-NET-3; never assigned locally, so binding the announce socket fails
    config.interface_address = "203.0.113.254";

    auto result = DiscoveryEngine::create(io, 8080, "Alice", config);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Setup);
}
