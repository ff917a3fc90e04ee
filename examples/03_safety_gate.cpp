// 03_safety_gate.cpp
//
// Demonstrates the pre-execution safety gate.
//
// A five-satellite constellation is registered with one agent's
// PeerRegistry. Proposed recovery actions are simulated against it:
// the gate estimates base risk, how far the effect cascades to
// neighbors, and blocks anything above the 10% threshold.

#include <orbitguard/orbitguard.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace orbitguard;

namespace {

struct Proposal {
    std::string action;
    ActionParams params;
    std::string decision_id;
};

} // anonymous namespace

int main() {
    std::cout << "=== OrbitGuard: Safety Gate Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Build the local view of the constellation.
    // ----------------------------------------------------------------
    AgentId self("astra-v3.0", "SAT-001");
    SwarmConfig config(self, SatelliteRole::Primary, "astra-v3.0");
    PeerRegistry registry(config);
    for (int i = 2; i <= 5; ++i) {
        registry.update_peer(AgentId("astra-v3.0", "SAT-00" + std::to_string(i)),
                             HealthSummary::nominal(), SatelliteRole::Standby);
    }
    std::cout << "Alive satellites: " << registry.get_alive_peers().size() << "\n\n";

    // ----------------------------------------------------------------
    // 2. Create the simulator with swarm mode enabled.
    // ----------------------------------------------------------------
    SafetySimulator simulator(&registry, SafetyConfig{}, true);
    simulator.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

    const std::vector<Proposal> proposals = {
        {"attitude_adjust", {{"angle_degrees", 1.0}}, "dec-001"},
        {"attitude_adjust", {{"angle_degrees", 5.0}}, "dec-002"},
        {"load_shed", {{"shed_percent", 12.0}}, "dec-003"},
        {"load_shed", {{"shed_percent", 40.0}}, "dec-004"},
        {"thermal_maneuver", {{"delta_temperature_c", 8.0}}, "dec-005"},
        {"safe_mode", {}, "dec-006"},
        {"reorbit_burn", {}, "dec-007"},
    };

    // ----------------------------------------------------------------
    // 3. Simulate, then gate each proposal.
    // ----------------------------------------------------------------
    for (const auto& p : proposals) {
        auto result = simulator.simulate(p.action, p.params);
        std::cout << std::left << std::setw(18) << p.action
                  << std::right << std::fixed << std::setprecision(3)
                  << " base=" << result.base_risk
                  << " cascade=" << result.cascade_risk
                  << " total=" << result.total_risk
                  << " affected=" << result.affected_agents.size() << "\n";

        bool allowed = simulator.validate_action(p.action, p.params, p.decision_id);
        std::cout << "  -> " << (allowed ? "ALLOWED" : "BLOCKED") << "\n";
    }

    // Local decisions never reach the constellation gate
    bool local = simulator.validate_action("attitude_adjust", {{"angle_degrees", 30.0}},
                                           "dec-008", "local");
    std::cout << "\nLocal-scope attitude_adjust: " << (local ? "ALLOWED" : "BLOCKED") << "\n";

    // ----------------------------------------------------------------
    // 4. Gate metrics.
    // ----------------------------------------------------------------
    auto m = simulator.get_metrics();
    std::cout << "\n=== Safety Metrics ===\n";
    std::cout << "Simulations: " << m.simulations_run << "\n";
    std::cout << "Safe:        " << m.simulations_safe << "\n";
    std::cout << "Blocked:     " << m.simulations_blocked << "\n";
    std::cout << "Block rate:  " << std::setprecision(1) << m.block_rate() * 100.0 << "%\n";
    std::cout << "Avg latency: " << std::setprecision(4) << m.avg_latency_ms << " ms\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
