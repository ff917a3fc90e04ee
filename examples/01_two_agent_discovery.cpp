// 01_two_agent_discovery.cpp
//
// Minimal OrbitGuard example: two satellites on a simulated link.
// Demonstrates HELLO discovery, compressed heartbeats and signed
// health broadcasts between two SwarmAgents.
//
// Scenario:
//   - SAT-001-A (primary) and SAT-002-B (backup) share an in-process link.
//   - Each announces itself with a HELLO beacon and learns the other.
//   - A reports elevated risk; B sees it through a heartbeat and a
//     verified broadcast on health/astra-v3.0.

#include <orbitguard/orbitguard.hpp>

#include <iomanip>
#include <iostream>
#include <string>

using namespace orbitguard;
using namespace std::chrono_literals;

namespace {

void print_peers(SwarmAgent& agent) {
    std::cout << agent.id().qualified_name() << " sees:\n";
    for (const auto& peer : agent.registry().get_all_peers()) {
        std::cout << "  " << peer.agent_id.qualified_name()
                  << " [" << to_string(peer.role) << "] "
                  << (peer.is_alive ? "alive" : "silent");
        if (peer.health_summary.has_value()) {
            std::cout << " risk=" << std::fixed << std::setprecision(2)
                      << peer.health_summary->risk_score();
        }
        std::cout << "\n";
    }
}

} // anonymous namespace

int main() {
    std::cout << "=== OrbitGuard: Two Agent Discovery Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the shared link and one bus endpoint per satellite.
    // ----------------------------------------------------------------
    LocalBusHub hub;
    AgentId id_a("astra-v3.0", "SAT-001-A");
    AgentId id_b("astra-v3.0", "SAT-002-B");
    auto bus_a = hub.connect(id_a);
    auto bus_b = hub.connect(id_b);

    // ----------------------------------------------------------------
    // 2. Create the agents. Loops run slowly so the example drives ticks.
    // ----------------------------------------------------------------
    Config settings;
    settings.features = load_feature_flags_from_env();
    settings.features.swarm_mode_enabled = true;
    settings.registry.heartbeat_interval = 1h;
    settings.broadcast.base_interval = 1h;
    settings.governor.peer_rate = 5000.0;
    settings.governor.peer_burst = 5000.0;

    SwarmAgent a(SwarmConfig(id_a, SatelliteRole::Primary, "astra-v3.0"), *bus_a, settings);
    SwarmAgent b(SwarmConfig(id_b, SatelliteRole::Backup, "astra-v3.0"), *bus_b, settings);

    b.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    a.start();
    b.start();

    // ----------------------------------------------------------------
    // 3. Discovery.
    // ----------------------------------------------------------------
    std::cout << "--- HELLO exchange ---\n";
    a.registry().broadcast_hello();
    b.registry().broadcast_hello();
    print_peers(a);
    print_peers(b);
    std::cout << "Quorum: " << a.registry().get_quorum_size() << "\n\n";

    // ----------------------------------------------------------------
    // 4. A reports degraded health and publishes it both ways.
    // ----------------------------------------------------------------
    Signature sig;
    for (std::size_t i = 0; i < sig.size(); ++i) {
        sig[i] = 0.05F * static_cast<float>(i % 10);
    }
    a.set_local_health(HealthSummary(sig, 0.35F, 2.0F));

    std::cout << "--- Heartbeat from A ---\n";
    auto next = a.registry().heartbeat_once();
    std::cout << "Next heartbeat in "
              << std::chrono::duration_cast<std::chrono::seconds>(next).count() << "s\n";

    std::cout << "--- Broadcast from A ---\n";
    auto outcome = a.broadcaster().broadcast_once();
    std::cout << "Broadcast: " << to_string(outcome) << "\n\n";

    print_peers(b);

    // ----------------------------------------------------------------
    // 5. Snapshots and shutdown.
    // ----------------------------------------------------------------
    b.emit_snapshot();

    a.stop();
    b.stop();

    std::cout << "\n=== Done ===\n";
    return 0;
}
