#include "bind_forward.hpp"
#include <orbitguard/orbitguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

using namespace orbitguard;

void bind_subsystems(py::module_& m) {
    // TokenBucket - exposed for link budgeting experiments
    py::class_<TokenBucket>(m, "TokenBucket")
        .def(py::init([](double rate, double burst) { return TokenBucket(rate, burst); }),
             py::arg("rate"), py::arg("burst"))
        .def("acquire", py::overload_cast<double>(&TokenBucket::acquire),
             py::arg("amount"))
        .def("refund", &TokenBucket::refund, py::arg("amount"))
        .def("set_limits", py::overload_cast<double, double>(&TokenBucket::set_limits),
             py::arg("rate"), py::arg("burst"))
        .def("utilization", py::overload_cast<>(&TokenBucket::utilization))
        .def("tokens_available", py::overload_cast<>(&TokenBucket::tokens_available))
        .def("rate", &TokenBucket::rate)
        .def("burst", &TokenBucket::burst);

    // BandwidthGovernor
    py::class_<BandwidthGovernor>(m, "BandwidthGovernor")
        .def(py::init<GovernorConfig>(),
             py::arg("config") = GovernorConfig{})
        .def("acquire",
             py::overload_cast<const AgentId&, std::size_t, MessagePriority>(
                 &BandwidthGovernor::acquire),
             py::arg("peer"),
             py::arg("size"),
             py::arg("priority") = MessagePriority::Normal)
        .def("set_peer_limit", &BandwidthGovernor::set_peer_limit,
             py::arg("peer"),
             py::arg("kbps"))
        .def("set_global_limit", &BandwidthGovernor::set_global_limit,
             py::arg("kbps"))
        .def("get_global_utilization",
             py::overload_cast<>(&BandwidthGovernor::get_global_utilization))
        .def("get_peer_utilization", &BandwidthGovernor::get_peer_utilization,
             py::arg("peer"))
        .def("get_all_utilizations", &BandwidthGovernor::get_all_utilizations)
        .def("get_congestion_level",
             py::overload_cast<>(&BandwidthGovernor::get_congestion_level))
        .def("fair_share_per_peer", &BandwidthGovernor::fair_share_per_peer)
        .def("get_stats", &BandwidthGovernor::get_stats)
        .def("reset_stats", &BandwidthGovernor::reset_stats)
        .def_static("priority_share", &BandwidthGovernor::priority_share,
                    py::arg("priority"))
        .def("set_monitor", &BandwidthGovernor::set_monitor,
             py::arg("monitor"));

    // PeerState
    py::class_<PeerState>(m, "PeerState")
        .def_readonly("agent_id",           &PeerState::agent_id)
        .def_readonly("role",               &PeerState::role)
        .def_readonly("last_heartbeat",     &PeerState::last_heartbeat)
        .def_readonly("health_summary",     &PeerState::health_summary)
        .def_readonly("heartbeat_failures", &PeerState::heartbeat_failures)
        .def_readonly("backoff_multiplier", &PeerState::backoff_multiplier)
        .def_readonly("is_alive",           &PeerState::is_alive);

    // PeerRegistry - obtained from SwarmAgent.registry()
    py::class_<PeerRegistry>(m, "PeerRegistry")
        .def("heartbeat_once", &PeerRegistry::heartbeat_once)
        .def("broadcast_hello", &PeerRegistry::broadcast_hello)
        .def("update_peer", &PeerRegistry::update_peer,
             py::arg("peer"),
             py::arg("health"),
             py::arg("role") = std::nullopt)
        .def("update_local_health", &PeerRegistry::update_local_health,
             py::arg("health"))
        .def("get_alive_peers",
             py::overload_cast<>(&PeerRegistry::get_alive_peers, py::const_))
        .def("get_quorum_size", &PeerRegistry::get_quorum_size)
        .def("get_peer_health", &PeerRegistry::get_peer_health,
             py::arg("peer"))
        .def("get_peer_state", &PeerRegistry::get_peer_state,
             py::arg("peer"))
        .def("get_all_peers", &PeerRegistry::get_all_peers)
        .def("get_peer_count", &PeerRegistry::get_peer_count)
        .def("find_peer_by_uuid", &PeerRegistry::find_peer_by_uuid,
             py::arg("uuid"))
        .def("get_relay_count", &PeerRegistry::get_relay_count,
             py::arg("origin"))
        .def("get_registry_stats", &PeerRegistry::get_registry_stats)
        .def("prune_stale", py::overload_cast<>(&PeerRegistry::prune_stale))
        .def("is_running", &PeerRegistry::is_running);

    // HealthBroadcaster - obtained from SwarmAgent.broadcaster()
    py::class_<HealthBroadcaster>(m, "HealthBroadcaster")
        .def("broadcast_once", &HealthBroadcaster::broadcast_once)
        .def("get_congestion_level", &HealthBroadcaster::get_congestion_level)
        .def("adjust_interval", &HealthBroadcaster::adjust_interval,
             py::arg("congestion"))
        .def("current_interval", &HealthBroadcaster::current_interval)
        .def("get_metrics", &HealthBroadcaster::get_metrics)
        .def("get_delivery_rate", &HealthBroadcaster::get_delivery_rate)
        .def("topic", &HealthBroadcaster::topic)
        .def("is_running", &HealthBroadcaster::is_running);

    // SafetySimulator - obtained from SwarmAgent.simulator()
    py::class_<SafetySimulator>(m, "SafetySimulator")
        .def("validate_action", &SafetySimulator::validate_action,
             py::arg("action"),
             py::arg("params"),
             py::arg("decision_id") = "",
             py::arg("scope") = "constellation")
        .def("simulate", &SafetySimulator::simulate,
             py::arg("action"),
             py::arg("params"))
        .def_static("classify_action",
             [](const std::string& action) { return SafetySimulator::classify_action(action); },
             py::arg("action"))
        .def("set_swarm_mode_enabled", &SafetySimulator::set_swarm_mode_enabled,
             py::arg("enabled"))
        .def("swarm_mode_enabled", &SafetySimulator::swarm_mode_enabled)
        .def("risk_threshold", &SafetySimulator::risk_threshold)
        .def("get_metrics", &SafetySimulator::get_metrics)
        .def("reset_metrics", &SafetySimulator::reset_metrics);
}
