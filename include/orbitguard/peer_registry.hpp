#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/bandwidth_governor.hpp"
#include "orbitguard/config.hpp"
#include "orbitguard/health_summary.hpp"
#include "orbitguard/message_bus.hpp"
#include "orbitguard/monitor.hpp"
#include "orbitguard/periodic_task.hpp"
#include "orbitguard/state_compressor.hpp"
#include "orbitguard/swarm_config.hpp"
#include "orbitguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace orbitguard {

struct PeerState {
    AgentId agent_id;
    SatelliteRole role{SatelliteRole::Standby};
    Timestamp last_heartbeat{};
    std::optional<HealthSummary> health_summary;
    std::uint32_t heartbeat_failures{0};
    double backoff_multiplier{1.0};  // min(4, 2^(failures-1)) after a failure
    bool is_alive{true};             // recomputed whenever a copy is handed out

    void record_heartbeat(Timestamp now, const std::optional<HealthSummary>& health = std::nullopt);
    void record_heartbeat_failure();
    bool alive_at(Timestamp now, Duration timeout) const noexcept;

    // 30s with no failures, 60s after one, 120s after two or more
    Duration next_heartbeat_interval(const RegistryConfig& config) const noexcept;
};

// Read-only view of live membership, consumed by the safety simulator
class PeerDirectory {
public:
    virtual ~PeerDirectory() = default;
    virtual std::vector<AgentId> get_alive_peers() const = 0;
};

struct RegistryStats {
    std::size_t total_peers{0};
    std::size_t alive_peers{0};
    std::size_t dead_peers{0};
    double alive_percentage{0.0};
    std::size_t quorum_size{1};
    Duration heartbeat_interval{};
    Duration heartbeat_timeout{};
    std::uint64_t heartbeats_sent{0};
    std::uint64_t heartbeat_failures{0};
    std::uint64_t hellos_relayed{0};
    std::uint64_t decode_failures{0};
};

// HELLO beacon: "constellation:serial|role" (role optional on receipt)
struct HelloBeacon {
    AgentId origin;
    std::optional<SatelliteRole> role;

    Bytes encode() const;

    // nullopt on a malformed beacon
    static std::optional<HelloBeacon> decode(const Bytes& payload);
};

// floor(alive/2) + 1
std::size_t quorum_for(std::size_t alive) noexcept;

// Membership and liveness for one agent.
//
// Listens on satellite/health/# and satellite/hello/#, keeps one PeerState
// per known agent (self included) and one inbound decoder per peer stream.
// Publishes its own compressed health every heartbeat and a HELLO beacon
// every few heartbeats; HELLOs from others are gossiped onward a bounded
// number of times. Thread-safe. No lock is held while publishing, so bus
// callbacks may re-enter the registry.
class PeerRegistry : public PeerDirectory {
public:
    using HealthProvider = std::function<HealthSummary()>;

    static constexpr const char* HEALTH_TOPIC_PREFIX = "satellite/health/";
    static constexpr const char* HELLO_TOPIC_PREFIX = "satellite/hello/";

    explicit PeerRegistry(const SwarmConfig& config,
                          RegistryConfig registry_config = {},
                          FeatureFlags features = {},
                          BandwidthGovernor* governor = nullptr);
    ~PeerRegistry() override;

    // Non-copyable
    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Subscribes to discovery topics and starts the heartbeat loop.
    // The bus must outlive the registry or a call to stop().
    void start(MessageBus& bus);
    void stop();
    bool is_running() const noexcept;

    // One heartbeat tick: publish health, maybe HELLO, prune.
    // Returns the delay until the next tick. Never throws.
    Duration heartbeat_once();

    // Announce this agent on the discovery topic (fire-and-forget)
    bool broadcast_hello();

    // Inbound handlers (wired to the bus by start())
    void on_health_message(const AgentId& sender, const Bytes& payload);
    void on_hello_message(const AgentId& sender, const Bytes& payload);

    // Last-write-wins update; returns true if the peer was new
    bool update_peer(const AgentId& peer, const HealthSummary& health,
                     std::optional<SatelliteRole> role = std::nullopt);

    void update_local_health(const HealthSummary& health);
    void set_health_provider(HealthProvider provider);
    void set_local_role(SatelliteRole role);

    // Queries (always copies, liveness computed at call time)
    std::vector<AgentId> get_alive_peers() const override;
    std::vector<AgentId> get_alive_peers(Timestamp now) const;
    std::size_t get_quorum_size() const;
    std::optional<HealthSummary> get_peer_health(const AgentId& peer) const;
    std::optional<PeerState> get_peer_state(const AgentId& peer) const;
    std::vector<PeerState> get_all_peers() const;
    std::size_t get_peer_count() const;
    std::optional<AgentId> find_peer_by_uuid(const std::string& uuid) const;
    std::uint32_t get_relay_count(const AgentId& origin) const;
    RegistryStats get_registry_stats() const;

    // Drops entries silent for longer than the retention window (never self)
    std::size_t prune_stale();
    std::size_t prune_stale(Timestamp now);

    const AgentId& self() const noexcept;
    const RegistryConfig& config() const noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    AgentId self_;
    SatelliteRole local_role_;
    RegistryConfig config_;
    FeatureFlags features_;
    BandwidthGovernor* governor_;

    mutable std::mutex mutex_;
    std::mutex tick_mutex_;  // serializes heartbeat_once on the outbound stream
    std::unordered_map<AgentId, PeerState> peers_;
    std::unordered_map<AgentId, StateCompressor> decoders_;
    std::unordered_map<AgentId, std::uint32_t> hello_seen_;
    StateCompressor encoder_;
    std::optional<HealthSummary> local_health_;
    HealthProvider health_provider_;
    std::mt19937 rng_;
    std::uint64_t heartbeat_counter_{0};
    RegistryStats counters_;

    MessageBus* bus_{nullptr};
    std::vector<SubscriptionId> subscriptions_;
    PeriodicTask heartbeat_task_{"heartbeat"};
    std::shared_ptr<Monitor> monitor_;

    void register_self();
    HealthSummary current_local_health();
    bool admit(const AgentId& peer, std::size_t size, MessagePriority priority);
    void emit_event(EventType type, const std::string& message,
                    const std::optional<AgentId>& agent = std::nullopt,
                    std::optional<std::size_t> bytes = std::nullopt);
};

} // namespace orbitguard
