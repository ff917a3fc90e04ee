#include <gtest/gtest.h>
#include <orbitguard/orbitguard.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace orbitguard;
using namespace std::chrono_literals;

namespace {

// Records publishes; never delivers
class RecordingBus : public MessageBus {
public:
    struct Published {
        std::string topic;
        Bytes payload;
        DeliveryQuality quality;
        std::optional<AgentId> receiver;
    };

    bool publish(const std::string& topic, const Bytes& payload, DeliveryQuality quality,
                 const std::optional<AgentId>& receiver = std::nullopt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(Published{topic, payload, quality, receiver});
        return accept_;
    }

    SubscriptionId subscribe(const std::string& filter, MessageCallback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        filters_.push_back(filter);
        return next_id_++;
    }

    void unsubscribe(SubscriptionId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        unsubscribed_++;
    }

    std::vector<Published> published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    std::vector<std::string> filters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return filters_;
    }

    void set_accept(bool accept) {
        std::lock_guard<std::mutex> lock(mutex_);
        accept_ = accept;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Published> published_;
    std::vector<std::string> filters_;
    SubscriptionId next_id_{1};
    int unsubscribed_{0};
    bool accept_{true};
};

AgentId sat(const std::string& serial) {
    return AgentId("astra-v3.0", serial);
}

HealthSummary sample_health(float risk = 0.2F) {
    Signature sig;
    sig.fill(0.1F);
    return HealthSummary(sig, risk, 1.0F);
}

RegistryConfig quiet_config() {
    RegistryConfig c;
    c.heartbeat_interval = std::chrono::hours(1);  // no background ticks during tests
    c.random_seed = 42;
    return c;
}

} // namespace

class PeerRegistryTest : public ::testing::Test {
protected:
    AgentId self = sat("SAT-001-A");
    SwarmConfig config{self, SatelliteRole::Primary, "astra-v3.0"};
    RecordingBus bus;
    std::shared_ptr<MetricsMonitor> metrics = std::make_shared<MetricsMonitor>();
};

// ===========================================================================
// 1. Quorum arithmetic
// ===========================================================================

TEST(QuorumTest, MajorityOfAlivePeers) {
    EXPECT_EQ(quorum_for(1), 1u);
    EXPECT_EQ(quorum_for(2), 2u);
    EXPECT_EQ(quorum_for(3), 2u);
    EXPECT_EQ(quorum_for(4), 3u);
    EXPECT_EQ(quorum_for(5), 3u);
    EXPECT_EQ(quorum_for(10), 6u);
    EXPECT_EQ(quorum_for(50), 26u);
}

// ===========================================================================
// 2. PeerState backoff
// ===========================================================================

TEST(PeerStateTest, BackoffDoublesUpToFourTimes) {
    PeerState state{sat("SAT-009-Z")};
    RegistryConfig c;

    EXPECT_EQ(state.next_heartbeat_interval(c), Duration(30s));

    state.record_heartbeat_failure();
    EXPECT_DOUBLE_EQ(state.backoff_multiplier, 1.0);
    EXPECT_EQ(state.next_heartbeat_interval(c), Duration(60s));

    state.record_heartbeat_failure();
    EXPECT_DOUBLE_EQ(state.backoff_multiplier, 2.0);
    EXPECT_EQ(state.next_heartbeat_interval(c), Duration(120s));

    state.record_heartbeat_failure();
    state.record_heartbeat_failure();
    EXPECT_DOUBLE_EQ(state.backoff_multiplier, 4.0);
    EXPECT_EQ(state.next_heartbeat_interval(c), Duration(120s));

    state.record_heartbeat(Clock::now(), sample_health());
    EXPECT_EQ(state.heartbeat_failures, 0u);
    EXPECT_DOUBLE_EQ(state.backoff_multiplier, 1.0);
    EXPECT_TRUE(state.health_summary.has_value());
}

TEST(PeerStateTest, AliveWithinTimeout) {
    PeerState state{sat("SAT-009-Z")};
    auto t0 = Clock::now();
    state.record_heartbeat(t0);

    EXPECT_TRUE(state.alive_at(t0 + 90s, 90s));
    EXPECT_FALSE(state.alive_at(t0 + 91s, 90s));
}

// ===========================================================================
// 3. HELLO beacon format
// ===========================================================================

TEST(HelloBeaconTest, EncodesQualifiedNameAndRole) {
    HelloBeacon beacon{sat("SAT-001-A"), SatelliteRole::Backup};
    auto bytes = beacon.encode();
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "astra-v3.0:SAT-001-A|backup");

    auto decoded = HelloBeacon::decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->origin, sat("SAT-001-A"));
    EXPECT_EQ(decoded->role, SatelliteRole::Backup);
}

TEST(HelloBeaconTest, RoleIsOptional) {
    std::string text = "astra-v3.0:SAT-004-D";
    auto decoded = HelloBeacon::decode(Bytes(text.begin(), text.end()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->role.has_value());
}

TEST(HelloBeaconTest, MalformedBeaconsRejected) {
    for (std::string text : {"", "SAT-004-D", "astra-v3.0:SAT-004-D|pilot", "mars-1:SAT-1"}) {
        EXPECT_FALSE(HelloBeacon::decode(Bytes(text.begin(), text.end())).has_value()) << text;
    }
}

// ===========================================================================
// 4. Membership bookkeeping
// ===========================================================================

TEST_F(PeerRegistryTest, SelfIsRegisteredAndAlive) {
    PeerRegistry registry(config, quiet_config());

    EXPECT_EQ(registry.get_peer_count(), 1u);
    auto alive = registry.get_alive_peers();
    ASSERT_EQ(alive.size(), 1u);
    EXPECT_EQ(alive[0], self);
    EXPECT_EQ(registry.get_quorum_size(), 1u);

    auto state = registry.get_peer_state(self);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->role, SatelliteRole::Primary);
}

TEST_F(PeerRegistryTest, UpdatePeerDiscoversThenRefreshes) {
    PeerRegistry registry(config, quiet_config());
    registry.set_monitor(metrics);

    EXPECT_TRUE(registry.update_peer(sat("SAT-002-B"), sample_health(0.3F), SatelliteRole::Backup));
    EXPECT_FALSE(registry.update_peer(sat("SAT-002-B"), sample_health(0.4F)));

    auto health = registry.get_peer_health(sat("SAT-002-B"));
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.4F);
    EXPECT_EQ(registry.get_peer_state(sat("SAT-002-B"))->role, SatelliteRole::Backup);
    EXPECT_EQ(metrics->get_metrics().peers_discovered, 1u);

    EXPECT_EQ(registry.get_alive_peers().size(), 2u);
    EXPECT_EQ(registry.get_quorum_size(), 2u);
}

TEST_F(PeerRegistryTest, AlivePeersSortedBySerial) {
    PeerRegistry registry(config, quiet_config());
    registry.update_peer(sat("SAT-005-E"), sample_health());
    registry.update_peer(sat("SAT-003-C"), sample_health());

    auto alive = registry.get_alive_peers();
    ASSERT_EQ(alive.size(), 3u);
    EXPECT_EQ(alive[0].satellite_serial(), "SAT-001-A");
    EXPECT_EQ(alive[1].satellite_serial(), "SAT-003-C");
    EXPECT_EQ(alive[2].satellite_serial(), "SAT-005-E");

    auto all = registry.get_all_peers();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[2].agent_id.satellite_serial(), "SAT-005-E");
}

TEST_F(PeerRegistryTest, SilentPeersBecomeDead) {
    PeerRegistry registry(config, quiet_config());
    registry.update_peer(sat("SAT-002-B"), sample_health());

    auto later = Clock::now() + 91s;
    EXPECT_TRUE(registry.get_alive_peers(later).empty());
    EXPECT_EQ(registry.get_alive_peers().size(), 2u);
}

TEST_F(PeerRegistryTest, PruneRemovesStaleEntriesButNeverSelf) {
    auto cfg = quiet_config();
    cfg.retention_window = std::chrono::hours(24);
    PeerRegistry registry(config, cfg);
    registry.update_peer(sat("SAT-002-B"), sample_health());
    registry.update_peer(sat("SAT-003-C"), sample_health());

    EXPECT_EQ(registry.prune_stale(Clock::now() + std::chrono::hours(1)), 0u);
    EXPECT_EQ(registry.prune_stale(Clock::now() + std::chrono::hours(25)), 2u);
    EXPECT_EQ(registry.get_peer_count(), 1u);
    EXPECT_TRUE(registry.get_peer_state(self).has_value());
}

TEST_F(PeerRegistryTest, FindPeerByUuidIgnoresDashesAndCase) {
    PeerRegistry registry(config, quiet_config());
    auto peer = sat("SAT-002-B");
    registry.update_peer(peer, sample_health());

    auto found = registry.find_peer_by_uuid("75E032AA-4EC7-5088-9FFE-756FAA23A6DE");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, peer);
    EXPECT_FALSE(registry.find_peer_by_uuid("00000000000000000000000000000000").has_value());
}

TEST_F(PeerRegistryTest, LocalHealthAndRole) {
    PeerRegistry registry(config, quiet_config());
    registry.update_local_health(sample_health(0.6F));
    registry.set_local_role(SatelliteRole::SafeMode);

    auto state = registry.get_peer_state(self);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->role, SatelliteRole::SafeMode);
    ASSERT_TRUE(state->health_summary.has_value());
    EXPECT_FLOAT_EQ(state->health_summary->risk_score(), 0.6F);

    // update_peer on self routes to local health
    EXPECT_FALSE(registry.update_peer(self, sample_health(0.7F)));
    EXPECT_FLOAT_EQ(registry.get_peer_health(self)->risk_score(), 0.7F);
}

// ===========================================================================
// 5. Heartbeat publishing and backoff
// ===========================================================================

TEST_F(PeerRegistryTest, HeartbeatWithoutBusBacksOff) {
    PeerRegistry registry(config, quiet_config());

    EXPECT_EQ(registry.heartbeat_once(), Duration(60s));
    EXPECT_EQ(registry.heartbeat_once(), Duration(120s));
    EXPECT_EQ(registry.get_registry_stats().heartbeat_failures, 2u);
    EXPECT_EQ(registry.get_peer_state(self)->heartbeat_failures, 2u);
}

TEST_F(PeerRegistryTest, HeartbeatPublishesCompressedHealth) {
    PeerRegistry registry(config, quiet_config());
    registry.update_local_health(sample_health(0.25F));
    registry.start(bus);

    EXPECT_EQ(registry.heartbeat_once(), Duration(30s));

    auto sent = bus.published();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].topic, "satellite/health/" + self.uuid_hex());
    EXPECT_EQ(sent[0].quality, DeliveryQuality::AtLeastOnce);
    EXPECT_FALSE(sent[0].receiver.has_value());

    StateCompressor decoder;
    auto decoded = decoder.decode(sent[0].payload);
    ASSERT_TRUE(decoded.ok());
    EXPECT_FLOAT_EQ(decoded.summary->risk_score(), 0.25F);

    auto stats = registry.get_registry_stats();
    EXPECT_EQ(stats.heartbeats_sent, 1u);
    EXPECT_GT(registry.get_peer_health(self)->compressed_size(), 0u);

    auto filters = bus.filters();
    EXPECT_NE(std::find(filters.begin(), filters.end(), "satellite/health/#"), filters.end());
    EXPECT_NE(std::find(filters.begin(), filters.end(), "satellite/hello/#"), filters.end());
    registry.stop();
}

TEST_F(PeerRegistryTest, FailureThenRecoveryResetsInterval) {
    PeerRegistry registry(config, quiet_config());
    registry.start(bus);
    bus.set_accept(false);

    EXPECT_EQ(registry.heartbeat_once(), Duration(60s));
    bus.set_accept(true);
    EXPECT_EQ(registry.heartbeat_once(), Duration(30s));
    registry.stop();
}

TEST_F(PeerRegistryTest, EveryThirdHeartbeatAlsoSendsHello) {
    PeerRegistry registry(config, quiet_config());
    registry.start(bus);

    registry.heartbeat_once();
    registry.heartbeat_once();
    EXPECT_EQ(bus.published().size(), 2u);

    registry.heartbeat_once();
    auto sent = bus.published();
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent[3].topic, "satellite/hello/" + self.uuid_hex());
    EXPECT_EQ(sent[3].quality, DeliveryQuality::FireAndForget);
    EXPECT_EQ(std::string(sent[3].payload.begin(), sent[3].payload.end()),
              "astra-v3.0:SAT-001-A|primary");
    registry.stop();
}

TEST_F(PeerRegistryTest, GovernorRejectionCountsAsFailure) {
    GovernorConfig tiny;
    tiny.global_burst = 1.0;
    BandwidthGovernor governor(tiny);
    PeerRegistry registry(config, quiet_config(), FeatureFlags{}, &governor);
    registry.set_monitor(metrics);
    registry.start(bus);

    EXPECT_EQ(registry.heartbeat_once(), Duration(60s));
    EXPECT_TRUE(bus.published().empty());
    EXPECT_EQ(metrics->get_metrics().heartbeats_failed, 1u);
    registry.stop();
}

// ===========================================================================
// 6. Inbound health messages
// ===========================================================================

TEST_F(PeerRegistryTest, HealthMessageDiscoversSender) {
    PeerRegistry registry(config, quiet_config());
    StateCompressor remote_encoder;
    auto peer = sat("SAT-002-B");

    registry.on_health_message(peer, remote_encoder.encode(sample_health(0.5F)));
    registry.on_health_message(peer, remote_encoder.encode(sample_health(0.55F)));

    auto health = registry.get_peer_health(peer);
    ASSERT_TRUE(health.has_value());
    EXPECT_FLOAT_EQ(health->risk_score(), 0.55F);
    EXPECT_EQ(registry.get_alive_peers().size(), 2u);
}

TEST_F(PeerRegistryTest, UndecodableHealthIsDropped) {
    PeerRegistry registry(config, quiet_config());
    registry.set_monitor(metrics);

    registry.on_health_message(sat("SAT-002-B"), Bytes{0x07, 0x00, 0x01});

    EXPECT_EQ(registry.get_peer_count(), 1u);
    EXPECT_EQ(registry.get_registry_stats().decode_failures, 1u);
    EXPECT_EQ(metrics->get_metrics().decode_failures, 1u);
}

// ===========================================================================
// 7. HELLO gossip
// ===========================================================================

TEST_F(PeerRegistryTest, HelloRelayIsBoundedPerOrigin) {
    PeerRegistry registry(config, quiet_config());
    for (const char* serial : {"SAT-002-B", "SAT-003-C", "SAT-004-D", "SAT-005-E"}) {
        registry.update_peer(sat(serial), sample_health());
    }
    registry.start(bus);

    auto origin = sat("SAT-009-X");
    auto beacon = HelloBeacon{origin, SatelliteRole::Standby}.encode();

    registry.on_hello_message(sat("SAT-002-B"), beacon);
    auto first = bus.published();
    ASSERT_EQ(first.size(), 3u);
    for (const auto& p : first) {
        EXPECT_EQ(p.topic, "satellite/hello/" + origin.uuid_hex());
        EXPECT_EQ(p.quality, DeliveryQuality::FireAndForget);
        ASSERT_TRUE(p.receiver.has_value());
        EXPECT_NE(*p.receiver, origin);
        EXPECT_NE(*p.receiver, self);
        EXPECT_EQ(p.payload, beacon);
    }
    EXPECT_EQ(registry.get_peer_state(origin)->role, SatelliteRole::Standby);

    registry.on_hello_message(sat("SAT-003-C"), beacon);
    registry.on_hello_message(sat("SAT-004-D"), beacon);

    EXPECT_EQ(bus.published().size(), 6u);
    EXPECT_EQ(registry.get_relay_count(origin), 2u);
    EXPECT_EQ(registry.get_registry_stats().hellos_relayed, 6u);
    registry.stop();
}

TEST_F(PeerRegistryTest, HelloFanoutLimitedByKnownPeers) {
    PeerRegistry registry(config, quiet_config());
    registry.update_peer(sat("SAT-002-B"), sample_health());
    registry.start(bus);

    registry.on_hello_message(sat("SAT-002-B"), HelloBeacon{sat("SAT-009-X"), std::nullopt}.encode());

    auto sent = bus.published();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(*sent[0].receiver, sat("SAT-002-B"));
    registry.stop();
}

TEST_F(PeerRegistryTest, OwnHelloAndGarbageIgnored) {
    PeerRegistry registry(config, quiet_config());
    registry.start(bus);

    registry.on_hello_message(sat("SAT-002-B"), HelloBeacon{self, SatelliteRole::Backup}.encode());
    registry.on_hello_message(sat("SAT-002-B"), Bytes{'?', '?'});

    EXPECT_TRUE(bus.published().empty());
    EXPECT_EQ(registry.get_peer_count(), 1u);
    EXPECT_EQ(registry.get_peer_state(self)->role, SatelliteRole::Primary);
    registry.stop();
}

TEST_F(PeerRegistryTest, BroadcastHelloRequiresBus) {
    PeerRegistry registry(config, quiet_config());
    EXPECT_FALSE(registry.broadcast_hello());

    registry.start(bus);
    EXPECT_TRUE(registry.broadcast_hello());
    EXPECT_EQ(bus.published().size(), 1u);
    registry.stop();
}
