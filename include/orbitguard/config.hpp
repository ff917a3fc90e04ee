#pragma once

#include "orbitguard/types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace orbitguard {

// Discovery and liveness tuning
struct RegistryConfig {
    Duration heartbeat_interval = std::chrono::seconds(30);
    Duration heartbeat_timeout = std::chrono::seconds(90);   // 3x interval
    Duration congestion_backoff = std::chrono::seconds(60);  // after 1 failure
    Duration failure_backoff = std::chrono::seconds(120);    // after >= 2 failures

    std::size_t gossip_fanout = 3;
    std::size_t gossip_replication = 2;
    std::size_t hello_every_n_heartbeats = 3;

    // Entries silent for longer than this are pruned
    Duration retention_window = std::chrono::hours(24);

    // Fixed seed for gossip target selection (tests); random when unset
    std::optional<std::uint32_t> random_seed;
};

// Token bucket sizing (bytes and bytes/second)
struct GovernorConfig {
    double global_rate = 10000.0;
    double global_burst = 2000.0;
    double peer_rate = 1000.0;
    double peer_burst = 500.0;

    double throttle_low_threshold = 0.70;
    double throttle_all_threshold = 0.90;
    double critical_threshold = 1.00;
};

// Health broadcaster cadence
struct BroadcastConfig {
    Duration base_interval = std::chrono::seconds(30);
    Duration congested_interval = std::chrono::seconds(60);
    Duration severe_interval = std::chrono::seconds(120);

    double congestion_threshold = 0.70;
    double severe_threshold = 0.85;

    // Queue depth treated as full congestion when no governor is attached
    std::size_t max_queue_depth = 100;

    std::string topic_prefix = "health/";
};

// Pre-execution risk gate
struct SafetyConfig {
    double risk_threshold = 0.10;

    // p95/max are only published once this many samples exist
    std::size_t min_percentile_samples = 20;

    // Latency samples kept for percentile computation
    std::size_t latency_window = 1000;
};

// Environment-driven feature switches
struct FeatureFlags {
    bool swarm_mode_enabled = false;
    bool schema_validation = true;
    bool compression_enabled = true;
    std::size_t max_payload_bytes = 1024;
};

struct Config {
    RegistryConfig registry;
    GovernorConfig governor;
    BroadcastConfig broadcast;
    SafetyConfig safety;
    FeatureFlags features;
};

// Reads SWARM_MODE_ENABLED, SWARM_SCHEMA_VALIDATION, SWARM_COMPRESSION and
// SWARM_MAX_PAYLOAD. Unset variables keep their defaults.
// Throws ConfigException on an unparsable value.
FeatureFlags load_feature_flags_from_env();

} // namespace orbitguard
