#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace orbitguard;
using namespace std::chrono_literals;

namespace {

RegistryConfig manual_config(std::uint32_t seed) {
    RegistryConfig c;
    c.heartbeat_interval = std::chrono::hours(1);  // ticks are driven by the test
    c.random_seed = seed;
    return c;
}

// One satellite on the shared in-process link
struct Node {
    AgentId id;
    SwarmConfig config;
    std::unique_ptr<LocalBus> bus;
    std::unique_ptr<PeerRegistry> registry;

    Node(LocalBusHub& hub, const std::string& serial, RegistryConfig rc, SatelliteRole role)
        : id("astra-v3.0", serial)
        , config(id, role, "astra-v3.0")
        , bus(hub.connect(id))
        , registry(std::make_unique<PeerRegistry>(config, rc))
    {
        registry->start(*bus);
    }

    ~Node() {
        registry->stop();
    }
};

} // namespace

// ===========================================================================
// 1. Two satellites find each other through HELLO beacons
// ===========================================================================

TEST(GossipDiscoveryTest, TwoAgentsDiscoverEachOther) {
    LocalBusHub hub;
    Node a(hub, "SAT-001-A", manual_config(1), SatelliteRole::Primary);
    Node b(hub, "SAT-002-B", manual_config(2), SatelliteRole::Backup);

    ASSERT_TRUE(a.registry->broadcast_hello());
    ASSERT_TRUE(b.registry->broadcast_hello());

    auto seen_by_a = a.registry->get_alive_peers();
    auto seen_by_b = b.registry->get_alive_peers();
    ASSERT_EQ(seen_by_a.size(), 2u);
    ASSERT_EQ(seen_by_b.size(), 2u);
    EXPECT_EQ(seen_by_a[1], b.id);
    EXPECT_EQ(seen_by_b[0], a.id);

    EXPECT_EQ(a.registry->get_quorum_size(), 2u);
    EXPECT_EQ(a.registry->get_peer_state(b.id)->role, SatelliteRole::Backup);
    EXPECT_EQ(b.registry->get_peer_state(a.id)->role, SatelliteRole::Primary);
}

TEST(GossipDiscoveryTest, HeartbeatCarriesHealthToPeers) {
    LocalBusHub hub;
    Node a(hub, "SAT-001-A", manual_config(1), SatelliteRole::Primary);
    Node b(hub, "SAT-002-B", manual_config(2), SatelliteRole::Backup);

    Signature sig;
    sig.fill(0.3F);
    a.registry->update_local_health(HealthSummary(sig, 0.42F, 4.0F));

    EXPECT_EQ(a.registry->heartbeat_once(), Duration(30s));

    auto health = b.registry->get_peer_health(a.id);
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.42F);
    EXPECT_FLOAT_EQ(health->recurrence_score(), 4.0F);
    EXPECT_NEAR(health->anomaly_signature()[0], 0.3F, 2.0F / 255.0F);
    EXPECT_GT(health->compressed_size(), 0u);

    // Consecutive deltas keep decoding against the per-sender stream
    sig.fill(0.35F);
    a.registry->update_local_health(HealthSummary(sig, 0.5F, 4.0F));
    a.registry->heartbeat_once();
    EXPECT_FLOAT_EQ(b.registry->get_peer_health(a.id)->risk_score(), 0.5F);
    EXPECT_EQ(b.registry->get_registry_stats().decode_failures, 0u);
}

// ===========================================================================
// 2. Gossip across a larger constellation terminates and converges
// ===========================================================================

TEST(GossipDiscoveryTest, FiveAgentsConvergeWithBoundedRelays) {
    LocalBusHub hub;
    std::vector<std::unique_ptr<Node>> nodes;
    for (int i = 0; i < 5; ++i) {
        nodes.push_back(std::make_unique<Node>(
            hub, "SAT-00" + std::to_string(i + 1), manual_config(static_cast<std::uint32_t>(i + 10)),
            SatelliteRole::Standby));
    }

    // Two announcement rounds: the first teaches membership, the second is relayed
    for (int round = 0; round < 2; ++round) {
        for (auto& node : nodes) {
            ASSERT_TRUE(node->registry->broadcast_hello());
        }
    }

    for (auto& node : nodes) {
        EXPECT_EQ(node->registry->get_alive_peers().size(), 5u) << node->id.qualified_name();
        EXPECT_EQ(node->registry->get_quorum_size(), 3u);
        for (auto& other : nodes) {
            if (other->id == node->id) continue;
            EXPECT_LE(node->registry->get_relay_count(other->id), 2u);
        }
    }
}

// ===========================================================================
// 3. Liveness
// ===========================================================================

TEST(GossipDiscoveryTest, SilentPeerTimesOutThenRecovers) {
    LocalBusHub hub;
    auto rc = manual_config(1);
    rc.heartbeat_timeout = 50ms;
    Node a(hub, "SAT-001-A", rc, SatelliteRole::Primary);
    Node b(hub, "SAT-002-B", manual_config(2), SatelliteRole::Backup);

    b.registry->heartbeat_once();
    auto alive = a.registry->get_alive_peers();
    EXPECT_NE(std::find(alive.begin(), alive.end(), b.id), alive.end());

    std::this_thread::sleep_for(100ms);
    alive = a.registry->get_alive_peers();
    EXPECT_EQ(std::find(alive.begin(), alive.end(), b.id), alive.end());
    EXPECT_FALSE(a.registry->get_peer_state(b.id)->is_alive);

    b.registry->heartbeat_once();
    alive = a.registry->get_alive_peers();
    EXPECT_NE(std::find(alive.begin(), alive.end(), b.id), alive.end());
}

TEST(GossipDiscoveryTest, OfflinePeerMissesHeartbeats) {
    LocalBusHub hub;
    Node a(hub, "SAT-001-A", manual_config(1), SatelliteRole::Primary);
    Node b(hub, "SAT-002-B", manual_config(2), SatelliteRole::Backup);

    b.bus->set_online(false);
    EXPECT_EQ(a.registry->heartbeat_once(), Duration(30s));
    EXPECT_FALSE(b.registry->get_peer_health(a.id).has_value());

    // An offline sender cannot publish and backs off
    EXPECT_EQ(b.registry->heartbeat_once(), Duration(60s));
    EXPECT_EQ(b.registry->heartbeat_once(), Duration(120s));

    b.bus->set_online(true);
    EXPECT_EQ(b.registry->heartbeat_once(), Duration(30s));
    EXPECT_TRUE(a.registry->get_peer_health(b.id).has_value());
}

TEST(GossipDiscoveryTest, BackgroundHeartbeatLoop) {
    LocalBusHub hub;
    auto rc = manual_config(1);
    rc.heartbeat_interval = 10ms;
    Node a(hub, "SAT-001-A", rc, SatelliteRole::Primary);
    Node b(hub, "SAT-002-B", manual_config(2), SatelliteRole::Backup);

    auto deadline = Clock::now() + 2s;
    while (!b.registry->get_peer_health(a.id).has_value() && Clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }

    EXPECT_TRUE(a.registry->is_running());
    EXPECT_TRUE(b.registry->get_peer_health(a.id).has_value());
}
