#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>

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
    return c;
}

RegistryConfig manual_registry() {
    RegistryConfig c;
    c.heartbeat_interval = std::chrono::hours(1);
    c.random_seed = 7;
    return c;
}

HealthSummary make_health(float value, float risk) {
    Signature sig;
    sig.fill(value);
    return HealthSummary(sig, risk, 1.0F);
}

// Debits the global bucket until it sits at `target` utilization
void fill_to(BandwidthGovernor& governor, double target, double burst) {
    AgentId filler("astra-v3.0", "SAT-FILL");
    double missing = (target - governor.get_global_utilization()) * burst;
    if (missing > 1.0) {
        governor.acquire(filler, static_cast<std::size_t>(missing), MessagePriority::Critical);
    }
}

} // namespace

// ===========================================================================
// 1. A narrow link throttles broadcasts before heartbeats
// ===========================================================================

TEST(CongestionBackoffTest, NarrowLinkThrottlesBroadcastButAdmitsHeartbeat) {
    LocalBusHub hub;
    AgentId id("astra-v3.0", "SAT-001-A");
    auto bus = hub.connect(id);
    auto peer_bus = hub.connect(AgentId("astra-v3.0", "SAT-002-B"));

    // 1 kbps: 1000 B/s with a 200 byte burst
    SwarmConfig config(id, SatelliteRole::Primary, "astra-v3.0", {}, 1);
    SwarmAgent agent(config, *bus, agent_settings());

    agent.set_local_health(make_health(0.1F, 0.2F));
    EXPECT_EQ(agent.broadcaster().broadcast_once(), BroadcastOutcome::Throttled);

    auto m = agent.broadcaster().get_metrics();
    EXPECT_EQ(m.failed_broadcasts, 1u);
    EXPECT_EQ(m.successful_broadcasts, 0u);
    EXPECT_EQ(agent.governor().get_stats().throttled_messages, 1u);

    // The much smaller heartbeat still fits, and nothing was debited by the refusal
    agent.start();
    EXPECT_EQ(agent.registry().heartbeat_once(), Duration(30s));
    EXPECT_EQ(agent.governor().get_stats().total_messages, 1u);
    agent.stop();
}

TEST(CongestionBackoffTest, SaturatedGovernorStretchesBroadcastInterval) {
    LocalBusHub hub;
    AgentId id("astra-v3.0", "SAT-001-A");
    auto bus = hub.connect(id);

    SwarmConfig config(id, SatelliteRole::Primary, "astra-v3.0");
    auto settings = agent_settings();
    settings.broadcast.base_interval = 30s;
    SwarmAgent agent(config, *bus, settings);

    EXPECT_EQ(agent.broadcaster().adjust_interval(agent.broadcaster().get_congestion_level()),
              Duration(30s));

    // Default 10 kbps link: 2000 byte burst
    fill_to(agent.governor(), 0.97, 2000.0);
    double congestion = agent.broadcaster().get_congestion_level();
    EXPECT_GT(congestion, 0.85);
    EXPECT_EQ(agent.broadcaster().adjust_interval(congestion), Duration(120s));
    EXPECT_EQ(agent.get_snapshot().broadcast_interval, Duration(120s));

    // Once the bucket refills the cadence returns to normal
    EXPECT_EQ(agent.broadcaster().adjust_interval(0.1), Duration(30s));
}

// ===========================================================================
// 2. Priority shedding on the discovery path
// ===========================================================================

class DiscoveryCongestionTest : public ::testing::Test {
protected:
    void SetUp() override {
        GovernorConfig gc;
        gc.peer_rate = 5000.0;
        gc.peer_burst = 5000.0;
        governor = std::make_unique<BandwidthGovernor>(gc);

        bus_a = hub.connect(a_id);
        bus_b = hub.connect(b_id);
        registry_a = std::make_unique<PeerRegistry>(a_config, manual_registry(), FeatureFlags{},
                                                    governor.get());
        registry_b = std::make_unique<PeerRegistry>(b_config, manual_registry());
        registry_a->start(*bus_a);
        registry_b->start(*bus_b);
    }

    void TearDown() override {
        registry_a->stop();
        registry_b->stop();
    }

    LocalBusHub hub;
    AgentId a_id{"astra-v3.0", "SAT-001-A"};
    AgentId b_id{"astra-v3.0", "SAT-002-B"};
    SwarmConfig a_config{a_id, SatelliteRole::Primary, "astra-v3.0"};
    SwarmConfig b_config{b_id, SatelliteRole::Backup, "astra-v3.0"};
    std::unique_ptr<BandwidthGovernor> governor;
    std::unique_ptr<LocalBus> bus_a;
    std::unique_ptr<LocalBus> bus_b;
    std::unique_ptr<PeerRegistry> registry_a;
    std::unique_ptr<PeerRegistry> registry_b;
};

TEST_F(DiscoveryCongestionTest, HelloShedWhileHeartbeatPasses) {
    // Between the 0.70 and 0.90 thresholds only NORMAL traffic is shed
    fill_to(*governor, 0.85, 2000.0);

    EXPECT_FALSE(registry_a->broadcast_hello());
    EXPECT_FALSE(registry_b->get_peer_state(a_id).has_value());

    EXPECT_EQ(registry_a->heartbeat_once(), Duration(30s));
    EXPECT_TRUE(registry_b->get_peer_health(a_id).has_value());
    EXPECT_GE(governor->get_stats().throttled_messages, 1u);
}

TEST_F(DiscoveryCongestionTest, ThrottledHeartbeatBacksOff) {
    // 1 kbps refills one byte per millisecond; an empty bucket refuses even CRITICAL traffic
    governor->set_global_limit(1);
    fill_to(*governor, 1.0, 200.0);

    EXPECT_EQ(registry_a->heartbeat_once(), Duration(60s));
    EXPECT_EQ(registry_a->heartbeat_once(), Duration(120s));
    EXPECT_FALSE(registry_b->get_peer_health(a_id).has_value());

    // A wider link refills faster but does not hand the backlog back
    governor->set_global_limit(10);
    EXPECT_GT(governor->get_global_utilization(), 0.5);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(registry_a->heartbeat_once(), Duration(30s));
    EXPECT_TRUE(registry_b->get_peer_health(a_id).has_value());
}

// ===========================================================================
// 3. Link outages
// ===========================================================================

TEST_F(DiscoveryCongestionTest, OfflineLinkBacksOffThenRecovers) {
    bus_a->set_online(false);

    EXPECT_EQ(registry_a->heartbeat_once(), Duration(60s));
    EXPECT_EQ(registry_a->heartbeat_once(), Duration(120s));
    EXPECT_EQ(registry_a->heartbeat_once(), Duration(120s));
    EXPECT_EQ(registry_a->get_peer_state(a_id)->heartbeat_failures, 3u);

    bus_a->set_online(true);
    EXPECT_EQ(registry_a->heartbeat_once(), Duration(30s));
    EXPECT_EQ(registry_a->get_peer_state(a_id)->heartbeat_failures, 0u);
    EXPECT_TRUE(registry_b->get_peer_health(a_id).has_value());
}

TEST(CongestionBackoffTest, BroadcastRetriesAfterOutage) {
    LocalBusHub hub;
    AgentId a_id("astra-v3.0", "SAT-001-A");
    AgentId b_id("astra-v3.0", "SAT-002-B");
    auto bus_a = hub.connect(a_id);
    auto bus_b = hub.connect(b_id);

    SwarmAgent a(SwarmConfig(a_id, SatelliteRole::Primary, "astra-v3.0"), *bus_a, agent_settings());
    SwarmAgent b(SwarmConfig(b_id, SatelliteRole::Backup, "astra-v3.0"), *bus_b, agent_settings());
    b.registry().update_peer(a_id, HealthSummary::nominal());

    b.start();

    a.set_local_health(make_health(0.3F, 0.4F));
    bus_a->set_online(false);
    EXPECT_EQ(a.broadcaster().broadcast_once(), BroadcastOutcome::Failed);

    // The unchanged health is not considered sent, so it goes out after the outage
    bus_a->set_online(true);
    EXPECT_EQ(a.broadcaster().broadcast_once(), BroadcastOutcome::Published);
    EXPECT_DOUBLE_EQ(a.broadcaster().get_delivery_rate(), 0.5);

    auto health = b.registry().get_peer_health(a_id);
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.4F);
    EXPECT_NEAR(health->anomaly_signature()[0], 0.3F, 2.0F / 255.0F);

    b.stop();
}
