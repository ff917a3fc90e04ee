// 02_bandwidth_priorities.cpp
//
// Demonstrates the BandwidthGovernor shedding traffic by priority.
//
// A 10 kbps link (10000 B/s, 2000 byte burst) is flooded with NORMAL
// telemetry. As utilization climbs, NORMAL traffic is shed first, then
// HIGH, while CRITICAL heartbeats keep getting through. MetricsMonitor
// reports what was admitted and dropped.

#include <orbitguard/orbitguard.hpp>

#include <iomanip>
#include <iostream>
#include <map>
#include <thread>

using namespace orbitguard;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== OrbitGuard: Bandwidth Priorities Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the governor for a 10 kbps inter-satellite link.
    // ----------------------------------------------------------------
    GovernorConfig config;
    config.peer_rate = 4000.0;
    config.peer_burst = 4000.0;
    BandwidthGovernor governor(config);
    governor.set_global_limit(10);

    auto metrics = std::make_shared<MetricsMonitor>();
    governor.set_monitor(metrics);

    AgentId telemetry("astra-v3.0", "SAT-001-A");
    AgentId payload_ops("astra-v3.0", "SAT-002-B");

    std::cout << "Priority shares: CRITICAL "
              << BandwidthGovernor::priority_share(MessagePriority::Critical) * 100.0 << "%, HIGH "
              << BandwidthGovernor::priority_share(MessagePriority::High) * 100.0 << "%, NORMAL "
              << BandwidthGovernor::priority_share(MessagePriority::Normal) * 100.0 << "%\n\n";

    // ----------------------------------------------------------------
    // 2. Flood the link, interleaving the three priorities.
    // ----------------------------------------------------------------
    std::map<MessagePriority, std::map<AdmissionOutcome, int>> outcomes;
    const MessagePriority cycle[] = {
        MessagePriority::Normal, MessagePriority::Normal, MessagePriority::High,
        MessagePriority::Critical
    };

    for (int i = 0; i < 40; ++i) {
        auto priority = cycle[i % 4];
        const AgentId& peer = (i % 2 == 0) ? telemetry : payload_ops;
        auto result = governor.acquire(peer, 120, priority);
        outcomes[priority][result.outcome]++;

        if (i % 8 == 7) {
            std::cout << "After " << std::setw(2) << (i + 1) << " messages: utilization "
                      << std::fixed << std::setprecision(2)
                      << governor.get_global_utilization() << " ("
                      << to_string(governor.get_congestion_level()) << ")\n";
        }
        std::this_thread::sleep_for(1ms);
    }

    // ----------------------------------------------------------------
    // 3. Report.
    // ----------------------------------------------------------------
    std::cout << "\n=== Admission by priority ===\n";
    for (const auto& [priority, by_outcome] : outcomes) {
        std::cout << "  " << std::setw(8) << to_string(priority) << ":";
        for (const auto& [outcome, count] : by_outcome) {
            std::cout << " " << to_string(outcome) << "=" << count;
        }
        std::cout << "\n";
    }

    auto stats = governor.get_stats();
    std::cout << "\nBytes sent:       " << stats.total_bytes_sent << "\n";
    std::cout << "Messages sent:    " << stats.total_messages << "\n";
    std::cout << "Throttled:        " << stats.throttled_messages << "\n";
    std::cout << "Dropped:          " << stats.dropped_messages << "\n";
    std::cout << "Peak utilization: " << std::setprecision(2) << stats.peak_utilization << "\n";
    std::cout << "Fair share/peer:  " << std::setprecision(0) << governor.fair_share_per_peer()
              << " B/s\n";

    auto m = metrics->get_metrics();
    std::cout << "Monitor saw " << m.messages_throttled << " throttled and "
              << m.messages_dropped << " dropped messages\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
