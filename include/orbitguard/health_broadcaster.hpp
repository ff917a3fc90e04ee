#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/bandwidth_governor.hpp"
#include "orbitguard/config.hpp"
#include "orbitguard/health_summary.hpp"
#include "orbitguard/message_bus.hpp"
#include "orbitguard/monitor.hpp"
#include "orbitguard/peer_registry.hpp"
#include "orbitguard/periodic_task.hpp"
#include "orbitguard/state_compressor.hpp"
#include "orbitguard/swarm_config.hpp"
#include "orbitguard/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace orbitguard {

// Signed health broadcast as carried on health/<constellation>.
// JSON object with five string fields; the signature is lowercase hex
// HMAC-SHA256 over "agent_id:constellation:compressed_health:timestamp".
struct HealthEnvelope {
    std::string agent_id;           // 32 hex digits
    std::string constellation;
    std::string compressed_health;  // hex of the StateCompressor wire bytes
    std::string timestamp;          // ISO-8601 UTC, microsecond precision
    std::string signature;

    std::string signing_input() const;
    std::string to_json() const;

    // Parses the JSON text. With `strict`, also checks field formats
    // (hex lengths, supported constellation). nullopt on failure, with the
    // reason written to `error` when given.
    static std::optional<HealthEnvelope> from_json(const std::string& text,
                                                   bool strict = true,
                                                   std::string* error = nullptr);
};

// "2026-01-01T00:00:00.000000Z"
std::string format_iso8601(WallTime t);

struct BroadcastMetrics {
    std::uint64_t total_broadcasts{0};       // publish attempts
    std::uint64_t successful_broadcasts{0};
    std::uint64_t failed_broadcasts{0};
    std::uint64_t skipped_broadcasts{0};     // unchanged health
    double average_latency_ms{0.0};          // over successful publishes
    Duration current_interval{};
    double current_congestion_level{0.0};
};

enum class BroadcastOutcome {
    Published,
    Skipped,
    Throttled,
    Failed
};

inline const char* to_string(BroadcastOutcome o) {
    switch (o) {
        case BroadcastOutcome::Published: return "Published";
        case BroadcastOutcome::Skipped:   return "Skipped";
        case BroadcastOutcome::Throttled: return "Throttled";
        case BroadcastOutcome::Failed:    return "Failed";
    }
    return "Unknown";
}

// Periodic signed health broadcast with congestion-adaptive cadence.
//
// Each tick reads the local health from the registry, skips the send if it
// is unchanged since the last successful broadcast, otherwise encodes it as
// a reference (non-delta) message, signs the envelope and publishes it.
// The compressor's stats and reference only advance when the publish succeeded.
class HealthBroadcaster {
public:
    HealthBroadcaster(const SwarmConfig& config,
                      PeerRegistry& registry,
                      MessageBus& bus,
                      StateCompressor& compressor,
                      BroadcastConfig broadcast_config = {},
                      BandwidthGovernor* governor = nullptr,
                      std::optional<Bytes> signing_key = std::nullopt);
    ~HealthBroadcaster();

    // Non-copyable
    HealthBroadcaster(const HealthBroadcaster&) = delete;
    HealthBroadcaster& operator=(const HealthBroadcaster&) = delete;

    // First broadcast happens immediately
    void start();
    void stop();
    bool is_running() const noexcept;

    // One tick without the loop; never throws
    BroadcastOutcome broadcast_once();

    // Governor utilization, or bus backlog / max_queue_depth without one
    double get_congestion_level() const;

    // 30s, 60s above 0.70, 120s above 0.85
    Duration adjust_interval(double congestion);
    Duration current_interval() const;

    BroadcastMetrics get_metrics() const;

    // successes / (successes + failures); 0 before any attempt
    double get_delivery_rate() const;

    std::string topic() const;

    static Bytes derive_key(const AgentId& agent);
    static std::string sign(const HealthEnvelope& envelope, const Bytes& key);
    static bool verify_signature(const HealthEnvelope& envelope, const Bytes& key);

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    AgentId self_;
    PeerRegistry& registry_;
    MessageBus& bus_;
    StateCompressor& compressor_;
    BroadcastConfig config_;
    BandwidthGovernor* governor_;
    Bytes key_;

    mutable std::mutex mutex_;
    std::mutex tick_mutex_;  // one broadcast_once at a time
    std::optional<std::string> last_health_hash_;
    Duration current_interval_;
    BroadcastMetrics metrics_;
    PeriodicTask task_{"health-broadcast"};
    std::shared_ptr<Monitor> monitor_;

    static std::string hash_health(const HealthSummary& health);
    void record_result(bool success, double latency_ms);
    void emit_event(EventType type, const std::string& message,
                    std::optional<std::size_t> bytes = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace orbitguard
