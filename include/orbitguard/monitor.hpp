#pragma once

#include "orbitguard/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orbitguard {

enum class EventType {
    // Registry
    PeerDiscovered,
    PeerRoleChanged,
    PeersPruned,
    HeartbeatPublished,
    HeartbeatFailed,
    HelloBroadcast,
    HelloRelayed,
    HelloDropped,
    HealthDecodeFailed,
    // Governor
    MessageAdmitted,
    MessageThrottled,
    MessageDropped,
    // Broadcaster
    BroadcastPublished,
    BroadcastSkipped,
    BroadcastFailed,
    BroadcastIntervalChanged,
    BroadcastReceived,
    BroadcastRejected,
    // Safety gate
    SafetyCheckPerformed,
    ActionBlocked,
    SafetyEvaluationFailed,
    UnknownActionClassified,
    // Background tasks
    TaskError
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    // Qualified name of the agent the event concerns
    std::optional<std::string> agent;
    std::optional<std::size_t> bytes;
    std::optional<MessagePriority> priority;
    std::optional<double> risk;
    std::optional<bool> safety_result;

    // Operation duration in microseconds (publish, safety simulation)
    std::optional<double> duration_us;
};

// Point-in-time view of one agent's coordination state
struct SwarmSnapshot {
    Timestamp timestamp{};
    std::string agent;
    std::size_t total_peers{0};
    std::size_t alive_peers{0};
    std::size_t quorum_size{0};
    double global_utilization{0.0};
    CongestionLevel congestion{CongestionLevel::Normal};
    Duration broadcast_interval{};
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const SwarmSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SwarmSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t peers_discovered{0};
        std::uint64_t heartbeats_published{0};
        std::uint64_t heartbeats_failed{0};
        std::uint64_t hellos_relayed{0};
        std::uint64_t decode_failures{0};
        std::uint64_t messages_throttled{0};
        std::uint64_t messages_dropped{0};
        std::uint64_t broadcasts_published{0};
        std::uint64_t broadcasts_skipped{0};
        std::uint64_t broadcasts_failed{0};
        std::uint64_t broadcasts_rejected{0};
        std::uint64_t safety_checks{0};
        std::uint64_t actions_blocked{0};
        double safety_check_avg_duration_us{0.0};
        double global_utilization_percent{0.0};
        std::size_t alive_peers{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SwarmSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;
    void set_utilization_alert_threshold(double threshold, AlertCallback cb);
    void set_quorum_alert_threshold(std::size_t min_alive, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double utilization_threshold_{1.1};  // > 1.0 means disabled
    AlertCallback utilization_cb_;
    std::size_t min_alive_threshold_{0};
    AlertCallback quorum_cb_;

    std::uint64_t safety_check_count_{0};
    double safety_check_duration_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const SwarmSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace orbitguard
