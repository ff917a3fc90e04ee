#include "orbitguard/monitor.hpp"

#include <iostream>
#include <iomanip>

namespace orbitguard {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::PeerDiscovered:           return "PeerDiscovered";
        case EventType::PeerRoleChanged:          return "PeerRoleChanged";
        case EventType::PeersPruned:              return "PeersPruned";
        case EventType::HeartbeatPublished:       return "HeartbeatPublished";
        case EventType::HeartbeatFailed:          return "HeartbeatFailed";
        case EventType::HelloBroadcast:           return "HelloBroadcast";
        case EventType::HelloRelayed:             return "HelloRelayed";
        case EventType::HelloDropped:             return "HelloDropped";
        case EventType::HealthDecodeFailed:       return "HealthDecodeFailed";
        case EventType::MessageAdmitted:          return "MessageAdmitted";
        case EventType::MessageThrottled:         return "MessageThrottled";
        case EventType::MessageDropped:           return "MessageDropped";
        case EventType::BroadcastPublished:       return "BroadcastPublished";
        case EventType::BroadcastSkipped:         return "BroadcastSkipped";
        case EventType::BroadcastFailed:          return "BroadcastFailed";
        case EventType::BroadcastIntervalChanged: return "BroadcastIntervalChanged";
        case EventType::BroadcastReceived:        return "BroadcastReceived";
        case EventType::BroadcastRejected:        return "BroadcastRejected";
        case EventType::SafetyCheckPerformed:     return "SafetyCheckPerformed";
        case EventType::ActionBlocked:            return "ActionBlocked";
        case EventType::SafetyEvaluationFailed:   return "SafetyEvaluationFailed";
        case EventType::UnknownActionClassified:  return "UnknownActionClassified";
        case EventType::TaskError:                return "TaskError";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::PeerDiscovered:
        case EventType::PeerRoleChanged:
        case EventType::HeartbeatFailed:
        case EventType::HealthDecodeFailed:
        case EventType::MessageDropped:
        case EventType::BroadcastFailed:
        case EventType::BroadcastIntervalChanged:
        case EventType::BroadcastRejected:
        case EventType::ActionBlocked:
        case EventType::SafetyEvaluationFailed:
        case EventType::UnknownActionClassified:
        case EventType::TaskError:
            return true;
        default:
            return false;
    }
}

// Per-message chatter only shown at Debug
bool is_debug_event(EventType t) {
    switch (t) {
        case EventType::MessageAdmitted:
        case EventType::HelloRelayed:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && is_debug_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[OrbitGuard] " << to_string(event.type);

    if (event.agent.has_value()) {
        std::cout << " agent=" << event.agent.value();
    }
    if (event.bytes.has_value()) {
        std::cout << " bytes=" << event.bytes.value();
    }
    if (event.priority.has_value()) {
        std::cout << " priority=" << to_string(event.priority.value());
    }
    if (event.risk.has_value()) {
        std::cout << " risk=" << std::fixed << std::setprecision(3) << event.risk.value();
    }
    if (event.safety_result.has_value()) {
        std::cout << " safe=" << (event.safety_result.value() ? "true" : "false");
    }
    if (event.duration_us.has_value()) {
        std::cout << " took=" << std::fixed << std::setprecision(1)
                  << event.duration_us.value() << "us";
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const SwarmSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    auto interval_s = std::chrono::duration_cast<std::chrono::milliseconds>(
        snapshot.broadcast_interval).count() / 1000.0;

    std::cout << "\n[OrbitGuard] === Swarm Snapshot: " << snapshot.agent << " ===\n";
    std::cout << "  Peers: " << snapshot.alive_peers << " alive / "
              << snapshot.total_peers << " known\n";
    std::cout << "  Quorum size: " << snapshot.quorum_size << "\n";
    std::cout << "  Link utilization: " << std::fixed << std::setprecision(1)
              << snapshot.global_utilization * 100.0 << "% ("
              << to_string(snapshot.congestion) << ")\n";
    std::cout << "  Broadcast interval: " << interval_s << "s\n";
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::PeerDiscovered:
            metrics_.peers_discovered++;
            break;
        case EventType::HeartbeatPublished:
            metrics_.heartbeats_published++;
            break;
        case EventType::HeartbeatFailed:
            metrics_.heartbeats_failed++;
            break;
        case EventType::HelloRelayed:
            metrics_.hellos_relayed++;
            break;
        case EventType::HealthDecodeFailed:
            metrics_.decode_failures++;
            break;
        case EventType::MessageThrottled:
            metrics_.messages_throttled++;
            break;
        case EventType::MessageDropped:
            metrics_.messages_dropped++;
            break;
        case EventType::BroadcastPublished:
            metrics_.broadcasts_published++;
            break;
        case EventType::BroadcastSkipped:
            metrics_.broadcasts_skipped++;
            break;
        case EventType::BroadcastFailed:
            metrics_.broadcasts_failed++;
            break;
        case EventType::BroadcastRejected:
            metrics_.broadcasts_rejected++;
            break;
        case EventType::SafetyCheckPerformed:
            metrics_.safety_checks++;
            if (event.duration_us.has_value()) {
                safety_check_count_++;
                safety_check_duration_sum_us_ += event.duration_us.value();
                metrics_.safety_check_avg_duration_us =
                    safety_check_duration_sum_us_ / static_cast<double>(safety_check_count_);
            }
            break;
        case EventType::ActionBlocked:
            metrics_.actions_blocked++;
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const SwarmSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    metrics_.global_utilization_percent = snapshot.global_utilization * 100.0;
    metrics_.alive_peers = snapshot.alive_peers;

    if (utilization_cb_ && snapshot.global_utilization > utilization_threshold_) {
        utilization_cb_("Link utilization " +
                        std::to_string(metrics_.global_utilization_percent) +
                        "% exceeds threshold");
    }

    if (quorum_cb_ && snapshot.alive_peers < min_alive_threshold_) {
        quorum_cb_("Alive peers " + std::to_string(snapshot.alive_peers) +
                   " below threshold " + std::to_string(min_alive_threshold_));
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    safety_check_count_ = 0;
    safety_check_duration_sum_us_ = 0.0;
}

void MetricsMonitor::set_utilization_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    utilization_threshold_ = threshold;
    utilization_cb_ = std::move(cb);
}

void MetricsMonitor::set_quorum_alert_threshold(std::size_t min_alive, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    min_alive_threshold_ = min_alive;
    quorum_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const SwarmSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace orbitguard
