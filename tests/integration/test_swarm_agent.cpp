#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>
#include <orbitguard/crypto.hpp>

#include <memory>
#include <string>
#include <thread>

using namespace orbitguard;
using namespace std::chrono_literals;

namespace {

Config agent_settings() {
    Config c;
    c.registry.heartbeat_interval = std::chrono::hours(1);
    c.broadcast.base_interval = std::chrono::hours(1);
    c.governor.peer_rate = 5000.0;
    c.governor.peer_burst = 5000.0;
    c.features.swarm_mode_enabled = true;
    return c;
}

SwarmConfig make_config(const std::string& serial, SatelliteRole role) {
    return SwarmConfig(AgentId("astra-v3.0", serial), role, "astra-v3.0");
}

HealthSummary make_health(float value, float risk) {
    Signature sig;
    sig.fill(value);
    return HealthSummary(sig, risk, 2.0F);
}

// Builds a signed envelope the way a remote broadcaster would
HealthEnvelope craft_envelope(const AgentId& sender, const Bytes& wire) {
    HealthEnvelope env;
    env.agent_id = sender.uuid_hex();
    env.constellation = sender.constellation();
    env.compressed_health = crypto::hex_encode(wire);
    env.timestamp = format_iso8601(WallClock::now());
    env.signature = HealthBroadcaster::sign(env, HealthBroadcaster::derive_key(sender));
    return env;
}

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

// Waits until the broadcaster's immediate first tick has run
void wait_for_first_tick(SwarmAgent& agent) {
    auto deadline = Clock::now() + 2s;
    while (Clock::now() < deadline) {
        auto m = agent.broadcaster().get_metrics();
        if (m.total_broadcasts + m.skipped_broadcasts >= 1) {
            return;
        }
        std::this_thread::sleep_for(5ms);
    }
}

} // namespace

// ===========================================================================
// Test fixture: two satellites, only B is under test for inbound broadcasts
// ===========================================================================

class SwarmAgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_a = hub.connect(AgentId("astra-v3.0", "SAT-001-A"));
        bus_b = hub.connect(AgentId("astra-v3.0", "SAT-002-B"));
        a = std::make_unique<SwarmAgent>(make_config("SAT-001-A", SatelliteRole::Primary),
                                         *bus_a, agent_settings());
        b = std::make_unique<SwarmAgent>(make_config("SAT-002-B", SatelliteRole::Backup),
                                         *bus_b, agent_settings());
    }

    void TearDown() override {
        b.reset();
        a.reset();
    }

    LocalBusHub hub;
    std::unique_ptr<LocalBus> bus_a;
    std::unique_ptr<LocalBus> bus_b;
    std::unique_ptr<SwarmAgent> a;
    std::unique_ptr<SwarmAgent> b;
};

// ===========================================================================
// 1. Inbound broadcast verification
// ===========================================================================

TEST_F(SwarmAgentTest, AcceptsSignedBroadcastFromKnownPeer) {
    b->registry().update_peer(a->id(), HealthSummary::nominal());

    StateCompressor encoder;
    auto env = craft_envelope(a->id(), encoder.encode(make_health(0.4F, 0.25F)));

    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::Accepted);

    auto health = b->registry().get_peer_health(a->id());
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.25F);
    EXPECT_NEAR(health->anomaly_signature()[5], 0.4F, 2.0F / 255.0F);

    // Follow-up delta on the same stream
    env = craft_envelope(a->id(), encoder.encode(make_health(0.45F, 0.3F)));
    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::Accepted);
    EXPECT_NEAR(b->registry().get_peer_health(a->id())->anomaly_signature()[5], 0.45F, 2.0F / 255.0F);
}

TEST_F(SwarmAgentTest, RejectsUnknownSender) {
    StateCompressor encoder;
    auto env = craft_envelope(a->id(), encoder.encode(make_health(0.4F, 0.25F)));

    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::UnknownSender);
    EXPECT_FALSE(b->registry().get_peer_health(a->id()).has_value());
}

TEST_F(SwarmAgentTest, RejectsOwnBroadcastLoopedBack) {
    StateCompressor encoder;
    auto env = craft_envelope(b->id(), encoder.encode(make_health(0.4F, 0.25F)));

    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::UnknownSender);
}

TEST_F(SwarmAgentTest, RejectsBadSignature) {
    b->registry().update_peer(a->id(), HealthSummary::nominal());

    StateCompressor encoder;
    auto env = craft_envelope(a->id(), encoder.encode(make_health(0.4F, 0.25F)));
    env.signature = HealthBroadcaster::sign(env, to_bytes("astra-v3.0:SAT-999-Z"));

    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::BadSignature);
    EXPECT_FLOAT_EQ(b->registry().get_peer_health(a->id())->risk_score(), 0.0F);
}

TEST_F(SwarmAgentTest, RejectsMalformedEnvelope) {
    EXPECT_EQ(b->handle_broadcast(to_bytes("not json")), BroadcastVerdict::MalformedEnvelope);
    EXPECT_EQ(b->handle_broadcast(to_bytes("{\"agent_id\":\"abc\"}")),
              BroadcastVerdict::MalformedEnvelope);

    StateCompressor encoder;
    auto env = craft_envelope(a->id(), encoder.encode(make_health(0.4F, 0.25F)));
    env.constellation = "other-constellation";
    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::MalformedEnvelope);
}

TEST_F(SwarmAgentTest, RejectsUndecodableHealth) {
    b->registry().update_peer(a->id(), HealthSummary::nominal());

    // Correctly signed, but the wire version is unsupported
    Bytes wire = {0x02, 0x00, 0x8C, 0x00, 0x01, 0x02, 0x03};
    auto env = craft_envelope(a->id(), wire);

    EXPECT_EQ(b->handle_broadcast(to_bytes(env.to_json())), BroadcastVerdict::DecodeFailed);
}

TEST_F(SwarmAgentTest, RejectionsReachMonitor) {
    auto monitor = std::make_shared<MetricsMonitor>();
    b->set_monitor(monitor);

    b->handle_broadcast(to_bytes("[]"));
    b->handle_broadcast(to_bytes("{}"));

    EXPECT_EQ(monitor->get_metrics().broadcasts_rejected, 2u);
}

// ===========================================================================
// 2. Safety gate and role
// ===========================================================================

TEST_F(SwarmAgentTest, ValidateActionUsesRegistryMembership) {
    b->registry().update_peer(a->id(), HealthSummary::nominal());

    EXPECT_TRUE(b->validate_action("safe_mode", {}, "dec-1"));
    EXPECT_FALSE(b->validate_action("attitude_adjust", {{"angle_degrees", 10.0}}, "dec-2"));

    // Local decisions bypass the gate
    EXPECT_TRUE(b->validate_action("attitude_adjust", {{"angle_degrees", 10.0}}, "dec-3", "local"));

    auto m = b->simulator().get_metrics();
    EXPECT_EQ(m.simulations_run, 2u);
    EXPECT_EQ(m.simulations_blocked, 1u);
}

TEST_F(SwarmAgentTest, SetRoleUpdatesConfigAndRegistry) {
    b->set_role(SatelliteRole::Primary);

    EXPECT_EQ(b->config().role(), SatelliteRole::Primary);
    EXPECT_EQ(b->registry().get_peer_state(b->id())->role, SatelliteRole::Primary);
}

// ===========================================================================
// 3. Snapshots
// ===========================================================================

TEST_F(SwarmAgentTest, SnapshotReflectsRegistryAndGovernor) {
    b->registry().update_peer(a->id(), HealthSummary::nominal());

    auto snap = b->get_snapshot();
    EXPECT_EQ(snap.agent, "astra-v3.0:SAT-002-B");
    EXPECT_EQ(snap.total_peers, 2u);
    EXPECT_EQ(snap.alive_peers, 2u);
    EXPECT_EQ(snap.quorum_size, 2u);
    EXPECT_EQ(snap.congestion, CongestionLevel::Normal);
    EXPECT_EQ(snap.broadcast_interval, Duration(std::chrono::hours(1)));

    auto monitor = std::make_shared<MetricsMonitor>();
    b->set_monitor(monitor);
    b->emit_snapshot();
    EXPECT_EQ(monitor->get_metrics().alive_peers, 2u);
}

// ===========================================================================
// 4. End to end over the shared link
// ===========================================================================

TEST_F(SwarmAgentTest, StartedAgentsExchangeSignedHealth) {
    a->start();
    b->start();
    EXPECT_TRUE(a->is_running());
    wait_for_first_tick(*a);
    wait_for_first_tick(*b);

    ASSERT_TRUE(a->registry().broadcast_hello());
    ASSERT_TRUE(b->registry().broadcast_hello());
    ASSERT_TRUE(b->registry().get_peer_state(a->id()).has_value());

    a->set_local_health(make_health(0.2F, 0.6F));
    EXPECT_EQ(a->broadcaster().broadcast_once(), BroadcastOutcome::Published);

    // B missed A's first broadcast at start-up; the signature is still exact
    auto health = b->registry().get_peer_health(a->id());
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.6F);
    EXPECT_FLOAT_EQ(health->recurrence_score(), 2.0F);
    for (float v : health->anomaly_signature()) {
        EXPECT_NEAR(v, 0.2F, 2.0F / 255.0F);
    }

    a->stop();
    b->stop();
    EXPECT_FALSE(a->is_running());
    EXPECT_FALSE(a->broadcaster().is_running());
    EXPECT_FALSE(a->registry().is_running());
}

TEST_F(SwarmAgentTest, StartAndStopAreIdempotent) {
    a->start();
    a->start();
    wait_for_first_tick(*a);
    a->stop();
    a->stop();
    EXPECT_FALSE(a->is_running());

    a->start();
    EXPECT_TRUE(a->is_running());
}
