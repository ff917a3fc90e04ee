#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/config.hpp"
#include "orbitguard/monitor.hpp"
#include "orbitguard/token_bucket.hpp"
#include "orbitguard/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace orbitguard {

enum class AdmissionOutcome {
    Admitted,
    Throttled,  // priority gate or bucket exhaustion; retry later
    Dropped     // link saturated, only CRITICAL traffic passes
};

inline const char* to_string(AdmissionOutcome o) {
    switch (o) {
        case AdmissionOutcome::Admitted:  return "Admitted";
        case AdmissionOutcome::Throttled: return "Throttled";
        case AdmissionOutcome::Dropped:   return "Dropped";
    }
    return "Unknown";
}

struct AdmissionResult {
    AdmissionOutcome outcome{AdmissionOutcome::Throttled};
    double global_utilization{0.0};  // sampled before the debit
    std::string reason;

    bool admitted() const noexcept { return outcome == AdmissionOutcome::Admitted; }
};

struct BandwidthStats {
    std::uint64_t total_bytes_sent{0};
    std::uint64_t total_messages{0};
    std::uint64_t dropped_messages{0};
    std::uint64_t throttled_messages{0};
    std::uint64_t congestion_events{0};
    double peak_utilization{0.0};

    double average_message_size() const noexcept {
        if (total_messages == 0) return 0.0;
        return static_cast<double>(total_bytes_sent) / static_cast<double>(total_messages);
    }

    // Dropped relative to admitted messages
    double drop_rate() const noexcept {
        if (total_messages == 0) return 0.0;
        return static_cast<double>(dropped_messages) / static_cast<double>(total_messages);
    }
};

// Priority-aware admission control for the inter-satellite link.
//
// A global bucket caps aggregate output and one lazily created bucket per
// peer caps what any single peer stream may consume. Lower priorities are
// shed first as global utilization rises. Thread-safe: each admission
// (gate, debit, refund) runs under one lock.
class BandwidthGovernor {
public:
    explicit BandwidthGovernor(GovernorConfig config = {});

    // Non-copyable
    BandwidthGovernor(const BandwidthGovernor&) = delete;
    BandwidthGovernor& operator=(const BandwidthGovernor&) = delete;

    AdmissionResult acquire(const AgentId& peer, std::size_t size,
                            MessagePriority priority = MessagePriority::Normal);
    AdmissionResult acquire(const AgentId& peer, std::size_t size,
                            MessagePriority priority, Timestamp now);

    // Runtime limits (kbps * 1000 bytes/s). Peer burst = rate/2, global burst = rate/5.
    // Buckets are resized in place, so a saturated link stays saturated.
    void set_peer_limit(const AgentId& peer, int kbps);
    void set_global_limit(int kbps);

    double get_global_utilization();
    double get_global_utilization(Timestamp now);
    double get_peer_utilization(const AgentId& peer);
    std::unordered_map<AgentId, double> get_all_utilizations();

    CongestionLevel get_congestion_level();
    CongestionLevel get_congestion_level(Timestamp now);

    // Global rate divided evenly among known peers (bytes/s)
    double fair_share_per_peer() const;

    BandwidthStats get_stats() const;
    void reset_stats();

    // Nominal share of link capacity for a priority class (80/15/5%)
    static double priority_share(MessagePriority priority) noexcept;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    GovernorConfig config_;
    mutable std::mutex mutex_;
    TokenBucket global_bucket_;
    std::unordered_map<AgentId, TokenBucket> peer_buckets_;
    BandwidthStats stats_;
    std::shared_ptr<Monitor> monitor_;

    TokenBucket& peer_bucket(const AgentId& peer, Timestamp now);
    CongestionLevel classify(double utilization) const noexcept;
    void emit_event(EventType type, const std::string& message, const AgentId& peer,
                    std::size_t size, MessagePriority priority);
};

} // namespace orbitguard
