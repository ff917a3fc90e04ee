#pragma once

#include "orbitguard/config.hpp"
#include "orbitguard/monitor.hpp"
#include "orbitguard/peer_registry.hpp"
#include "orbitguard/types.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace orbitguard {

// Numeric action parameters, e.g. {"angle_degrees": 10}
using ActionParams = std::map<std::string, double>;

struct SimulationResult {
    bool is_safe{false};
    ActionType action_type{ActionType::RoleReassignment};
    double base_risk{0.0};
    double cascade_risk{0.0};
    double total_risk{0.0};
    double threshold{0.0};
    std::vector<std::string> affected_agents;  // satellite serials
    double latency_ms{0.0};
};

struct SafetyMetrics {
    std::uint64_t simulations_run{0};
    std::uint64_t simulations_safe{0};
    std::uint64_t simulations_blocked{0};
    std::uint64_t evaluation_errors{0};
    double total_blocked_risk{0.0};
    std::uint64_t cascade_prevention_count{0};
    double avg_latency_ms{0.0};
    double p95_latency_ms{0.0};  // published once enough samples exist
    double max_latency_ms{0.0};

    double block_rate() const noexcept {
        if (simulations_run == 0) return 0.0;
        return static_cast<double>(simulations_blocked) / static_cast<double>(simulations_run);
    }
};

// Pre-execution gate for constellation-wide actions.
//
// Estimates the direct (base) risk of an action from its parameters, then
// adds a one-hop cascade term over the alive peers it would touch, and
// blocks the action when the total exceeds the configured threshold.
// Evaluation is synchronous and never suspends. Any failure while
// evaluating blocks the action.
class SafetySimulator {
public:
    static constexpr double ATTITUDE_CASCADE_MULTIPLIER = 0.30;  // per 10 degrees
    static constexpr double POWER_BUDGET_MARGIN_PERCENT = 15.0;
    static constexpr double THERMAL_LIMIT_C = 5.0;
    static constexpr double THERMAL_RISK_SCALE_C = 50.0;
    static constexpr double ROLE_REASSIGNMENT_RISK = 0.05;
    static constexpr double PROPAGATION_FACTOR = 0.15;
    static constexpr std::size_t COVERAGE_NEIGHBORS = 10;
    static constexpr std::size_t THERMAL_NEIGHBORS = 5;

    // `directory` may be null (no peers known); it must outlive the simulator
    explicit SafetySimulator(const PeerDirectory* directory,
                             SafetyConfig config = {},
                             bool swarm_mode_enabled = true);

    // Non-copyable
    SafetySimulator(const SafetySimulator&) = delete;
    SafetySimulator& operator=(const SafetySimulator&) = delete;

    // True = allowed. Scopes other than "constellation" and a disabled swarm
    // mode always pass. Never throws.
    bool validate_action(const std::string& action,
                         const ActionParams& params,
                         const std::string& decision_id = "",
                         const std::string& scope = "constellation");

    // Full evaluation without the scope / feature-flag short circuits.
    // Throws OrbitGuardException on non-finite parameters.
    SimulationResult simulate(const std::string& action, const ActionParams& params) const;

    // Substring classification; unknown names map to RoleReassignment
    static ActionType classify_action(const std::string& action, bool* recognized = nullptr);

    void set_swarm_mode_enabled(bool enabled) noexcept;
    bool swarm_mode_enabled() const noexcept;
    double risk_threshold() const noexcept;

    SafetyMetrics get_metrics() const;
    void reset_metrics();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    const PeerDirectory* directory_;
    SafetyConfig config_;
    std::atomic<bool> swarm_mode_enabled_;

    mutable std::mutex mutex_;
    SafetyMetrics metrics_;
    std::deque<double> latency_samples_;
    std::shared_ptr<Monitor> monitor_;

    double base_risk(ActionType type, const ActionParams& params) const;
    std::vector<std::string> affected_agents(ActionType type,
                                             const std::vector<AgentId>& alive) const;
    static double cascade_risk(double base, const std::vector<std::string>& affected,
                               const std::vector<AgentId>& alive);

    void record_latency(double latency_ms);
    void emit_event(EventType type, const std::string& message,
                    std::optional<double> risk = std::nullopt,
                    std::optional<bool> safe = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace orbitguard
