#include "orbitguard/safety_simulator.hpp"
#include "orbitguard/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <numeric>

namespace orbitguard {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Missing parameters read as 0; non-finite values are rejected
double param(const ActionParams& params, const char* name, const char* fallback = nullptr) {
    auto it = params.find(name);
    if (it == params.end() && fallback != nullptr) {
        it = params.find(fallback);
    }
    if (it == params.end()) {
        return 0.0;
    }
    if (!std::isfinite(it->second)) {
        throw OrbitGuardException(std::string("parameter '") + it->first + "' is not finite");
    }
    return it->second;
}

} // anonymous namespace

SafetySimulator::SafetySimulator(const PeerDirectory* directory,
                                 SafetyConfig config,
                                 bool swarm_mode_enabled)
    : directory_(directory)
    , config_(config)
    , swarm_mode_enabled_(swarm_mode_enabled)
{}

ActionType SafetySimulator::classify_action(const std::string& action, bool* recognized) {
    std::string name = lower(action);
    if (recognized != nullptr) {
        *recognized = true;
    }

    if (contains(name, "attitude")) return ActionType::AttitudeAdjust;
    if (contains(name, "load") || contains(name, "power")) return ActionType::LoadShed;
    if (contains(name, "thermal") || contains(name, "maneuver")) return ActionType::ThermalManeuver;
    if (contains(name, "safe")) return ActionType::SafeMode;
    if (contains(name, "role")) return ActionType::RoleReassignment;

    if (recognized != nullptr) {
        *recognized = false;
    }
    return ActionType::RoleReassignment;
}

double SafetySimulator::base_risk(ActionType type, const ActionParams& params) const {
    switch (type) {
        case ActionType::AttitudeAdjust: {
            // Slew direction does not matter, only its magnitude
            double angle = std::fabs(param(params, "angle_degrees"));
            return std::min(1.0, angle / 10.0 * ATTITUDE_CASCADE_MULTIPLIER);
        }
        case ActionType::LoadShed: {
            double shed = param(params, "shed_percent");
            if (shed <= POWER_BUDGET_MARGIN_PERCENT) return 0.0;
            return std::min(1.0, (shed - POWER_BUDGET_MARGIN_PERCENT) / 100.0);
        }
        case ActionType::ThermalManeuver: {
            double delta = param(params, "delta_temperature_c", "delta_temperature");
            if (delta <= THERMAL_LIMIT_C) return 0.0;
            return std::min(1.0, delta / THERMAL_RISK_SCALE_C);
        }
        case ActionType::SafeMode:
            return 0.0;
        case ActionType::RoleReassignment:
            return ROLE_REASSIGNMENT_RISK;
    }
    return 0.0;
}

std::vector<std::string> SafetySimulator::affected_agents(ActionType type,
                                                          const std::vector<AgentId>& alive) const {
    std::size_t limit = 0;
    switch (type) {
        case ActionType::AttitudeAdjust:  limit = COVERAGE_NEIGHBORS; break;
        case ActionType::ThermalManeuver: limit = THERMAL_NEIGHBORS; break;
        case ActionType::LoadShed:        limit = alive.size(); break;
        case ActionType::SafeMode:
        case ActionType::RoleReassignment:
            return {};
    }

    std::vector<std::string> serials;
    for (std::size_t i = 0; i < alive.size() && i < limit; ++i) {
        serials.push_back(alive[i].satellite_serial());
    }
    return serials;
}

double SafetySimulator::cascade_risk(double base, const std::vector<std::string>& affected,
                                     const std::vector<AgentId>& alive) {
    if (affected.empty() || base == 0.0) {
        return 0.0;
    }

    double total = 0.0;
    for (const auto& serial : affected) {
        // One hop: every other alive agent is a neighbor
        for (const auto& peer : alive) {
            if (peer.satellite_serial() != serial) {
                total += base * PROPAGATION_FACTOR;
            }
        }
    }
    return std::min(1.0, total / static_cast<double>(affected.size()));
}

SimulationResult SafetySimulator::simulate(const std::string& action, const ActionParams& params) const {
    auto start = Clock::now();

    SimulationResult result;
    result.action_type = classify_action(action);
    result.threshold = config_.risk_threshold;

    std::vector<AgentId> alive;
    if (directory_ != nullptr) {
        alive = directory_->get_alive_peers();
    }

    result.base_risk = base_risk(result.action_type, params);
    result.affected_agents = affected_agents(result.action_type, alive);
    result.cascade_risk = cascade_risk(result.base_risk, result.affected_agents, alive);
    result.total_risk = std::min(1.0, result.base_risk + result.cascade_risk);
    result.is_safe = result.total_risk <= config_.risk_threshold;
    result.latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    return result;
}

bool SafetySimulator::validate_action(const std::string& action,
                                      const ActionParams& params,
                                      const std::string& decision_id,
                                      const std::string& scope) {
    auto start = Clock::now();
    auto elapsed_ms = [start] {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    };

    if (scope != "constellation" || !swarm_mode_enabled_.load()) {
        record_latency(elapsed_ms());
        return true;
    }

    std::string label = decision_id.empty() ? action : action + " (" + decision_id + ")";

    bool recognized = true;
    classify_action(action, &recognized);
    if (!recognized) {
        emit_event(EventType::UnknownActionClassified,
                   "Unknown action '" + action + "', evaluated as role_reassignment");
    }

    SimulationResult result;
    try {
        result = simulate(action, params);
    } catch (const std::exception& e) {
        double latency = elapsed_ms();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            metrics_.simulations_run++;
            metrics_.simulations_blocked++;
            metrics_.evaluation_errors++;
        }
        record_latency(latency);
        emit_event(EventType::SafetyEvaluationFailed,
                   "Blocked " + label + ": evaluation failed: " + e.what(),
                   std::nullopt, false, latency * 1000.0);
        return false;
    }

    double latency = elapsed_ms();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.simulations_run++;
        if (result.is_safe) {
            metrics_.simulations_safe++;
        } else {
            metrics_.simulations_blocked++;
            metrics_.cascade_prevention_count++;
            metrics_.total_blocked_risk += result.total_risk;
        }
    }
    record_latency(latency);

    emit_event(EventType::SafetyCheckPerformed,
               std::string(result.is_safe ? "Approved " : "Blocked ") + label +
               " as " + to_string(result.action_type),
               result.total_risk, result.is_safe, latency * 1000.0);
    if (!result.is_safe) {
        emit_event(EventType::ActionBlocked,
                   "Blocked " + label + ": risk " + std::to_string(result.total_risk) +
                   " exceeds threshold " + std::to_string(config_.risk_threshold),
                   result.total_risk, false);
    }
    return result.is_safe;
}

void SafetySimulator::record_latency(double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_samples_.push_back(latency_ms);
    while (latency_samples_.size() > config_.latency_window) {
        latency_samples_.pop_front();
    }

    double sum = std::accumulate(latency_samples_.begin(), latency_samples_.end(), 0.0);
    metrics_.avg_latency_ms = sum / static_cast<double>(latency_samples_.size());

    if (latency_samples_.size() >= config_.min_percentile_samples) {
        std::vector<double> sorted(latency_samples_.begin(), latency_samples_.end());
        std::sort(sorted.begin(), sorted.end());
        auto index = static_cast<std::size_t>(static_cast<double>(sorted.size()) * 0.95);
        metrics_.p95_latency_ms = sorted[std::min(index, sorted.size() - 1)];
        metrics_.max_latency_ms = sorted.back();
    }
}

void SafetySimulator::set_swarm_mode_enabled(bool enabled) noexcept {
    swarm_mode_enabled_.store(enabled);
}

bool SafetySimulator::swarm_mode_enabled() const noexcept {
    return swarm_mode_enabled_.load();
}

double SafetySimulator::risk_threshold() const noexcept {
    return config_.risk_threshold;
}

SafetyMetrics SafetySimulator::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void SafetySimulator::reset_metrics() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = SafetyMetrics{};
    latency_samples_.clear();
}

void SafetySimulator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void SafetySimulator::emit_event(EventType type, const std::string& message,
                                 std::optional<double> risk,
                                 std::optional<bool> safe,
                                 std::optional<double> duration_us) {
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
    event.risk = risk;
    event.safety_result = safe;
    event.duration_us = duration_us;
    monitor->on_event(event);
}

} // namespace orbitguard
