#include "orbitguard/bandwidth_governor.hpp"

#include <algorithm>

namespace orbitguard {

BandwidthGovernor::BandwidthGovernor(GovernorConfig config)
    : config_(config)
    , global_bucket_(config.global_rate, config.global_burst)
{}

double BandwidthGovernor::priority_share(MessagePriority priority) noexcept {
    switch (priority) {
        case MessagePriority::Critical: return 0.80;
        case MessagePriority::High:     return 0.15;
        case MessagePriority::Normal:   return 0.05;
    }
    return 0.0;
}

TokenBucket& BandwidthGovernor::peer_bucket(const AgentId& peer, Timestamp now) {
    auto it = peer_buckets_.find(peer);
    if (it == peer_buckets_.end()) {
        it = peer_buckets_.emplace(peer, TokenBucket(config_.peer_rate, config_.peer_burst, now)).first;
    }
    return it->second;
}

CongestionLevel BandwidthGovernor::classify(double utilization) const noexcept {
    if (utilization >= config_.critical_threshold) return CongestionLevel::Critical;
    if (utilization >= config_.throttle_all_threshold) return CongestionLevel::Throttled;
    if (utilization >= config_.throttle_low_threshold) return CongestionLevel::Moderate;
    return CongestionLevel::Normal;
}

AdmissionResult BandwidthGovernor::acquire(const AgentId& peer, std::size_t size,
                                           MessagePriority priority) {
    return acquire(peer, size, priority, Clock::now());
}

AdmissionResult BandwidthGovernor::acquire(const AgentId& peer, std::size_t size,
                                           MessagePriority priority, Timestamp now) {
    AdmissionResult result;
    auto amount = static_cast<double>(size);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        double util = global_bucket_.utilization(now);
        result.global_utilization = util;

        switch (classify(util)) {
            case CongestionLevel::Critical:
                if (priority != MessagePriority::Critical) {
                    stats_.dropped_messages++;
                    stats_.congestion_events++;
                    result.outcome = AdmissionOutcome::Dropped;
                    result.reason = "link saturated, only CRITICAL admitted";
                }
                break;
            case CongestionLevel::Throttled:
            case CongestionLevel::Moderate:
                if (priority == MessagePriority::Normal) {
                    stats_.throttled_messages++;
                    result.outcome = AdmissionOutcome::Throttled;
                    result.reason = "NORMAL traffic shed under congestion";
                }
                break;
            case CongestionLevel::Normal:
                break;
        }

        if (result.reason.empty()) {
            TokenBucket& bucket = peer_bucket(peer, now);
            bool global_ok = global_bucket_.acquire(amount, now);
            bool peer_ok = bucket.acquire(amount, now);

            if (global_ok && peer_ok) {
                stats_.total_bytes_sent += size;
                stats_.total_messages++;
                stats_.peak_utilization = std::max(stats_.peak_utilization, util);
                result.outcome = AdmissionOutcome::Admitted;
            } else {
                if (global_ok) global_bucket_.refund(amount);
                if (peer_ok) bucket.refund(amount);
                stats_.throttled_messages++;
                result.outcome = AdmissionOutcome::Throttled;
                result.reason = global_ok ? "peer bucket exhausted" : "global bucket exhausted";
            }
        }
    }

    // Outside the lock: emit events
    switch (result.outcome) {
        case AdmissionOutcome::Admitted:
            emit_event(EventType::MessageAdmitted, "Admitted", peer, size, priority);
            break;
        case AdmissionOutcome::Throttled:
            emit_event(EventType::MessageThrottled, result.reason, peer, size, priority);
            break;
        case AdmissionOutcome::Dropped:
            emit_event(EventType::MessageDropped, result.reason, peer, size, priority);
            break;
    }

    return result;
}

void BandwidthGovernor::set_peer_limit(const AgentId& peer, int kbps) {
    double rate = static_cast<double>(kbps) * 1000.0;
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    peer_bucket(peer, now).set_limits(rate, rate / 2.0, now);
}

void BandwidthGovernor::set_global_limit(int kbps) {
    double rate = static_cast<double>(kbps) * 1000.0;
    std::lock_guard<std::mutex> lock(mutex_);
    global_bucket_.set_limits(rate, rate / 5.0);
}

double BandwidthGovernor::get_global_utilization() {
    return get_global_utilization(Clock::now());
}

double BandwidthGovernor::get_global_utilization(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return global_bucket_.utilization(now);
}

double BandwidthGovernor::get_peer_utilization(const AgentId& peer) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_bucket(peer, now).utilization(now);
}

std::unordered_map<AgentId, double> BandwidthGovernor::get_all_utilizations() {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<AgentId, double> result;
    for (auto& [peer, bucket] : peer_buckets_) {
        result.emplace(peer, bucket.utilization(now));
    }
    return result;
}

CongestionLevel BandwidthGovernor::get_congestion_level() {
    return get_congestion_level(Clock::now());
}

CongestionLevel BandwidthGovernor::get_congestion_level(Timestamp now) {
    return classify(get_global_utilization(now));
}

double BandwidthGovernor::fair_share_per_peer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t peers = peer_buckets_.empty() ? 1 : peer_buckets_.size();
    return global_bucket_.rate() / static_cast<double>(peers);
}

BandwidthStats BandwidthGovernor::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void BandwidthGovernor::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BandwidthStats{};
}

void BandwidthGovernor::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void BandwidthGovernor::emit_event(EventType type, const std::string& message, const AgentId& peer,
                                   std::size_t size, MessagePriority priority) {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = Clock::now();
    event.message = message;
    event.agent = peer.qualified_name();
    event.bytes = size;
    event.priority = priority;
    monitor->on_event(event);
}

} // namespace orbitguard
