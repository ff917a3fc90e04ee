#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <orbitguard/orbitguard.hpp>

using namespace orbitguard;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_orbitguard, m) {
    m.doc() = "OrbitGuard: Health gossip and safety gating for satellite constellations";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
    bind_subsystems(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<SatelliteRole>(m, "SatelliteRole")
        .value("Primary",  SatelliteRole::Primary)
        .value("Backup",   SatelliteRole::Backup)
        .value("Standby",  SatelliteRole::Standby)
        .value("SafeMode", SatelliteRole::SafeMode)
        .export_values();

    py::enum_<MessagePriority>(m, "MessagePriority")
        .value("Critical", MessagePriority::Critical)
        .value("High",     MessagePriority::High)
        .value("Normal",   MessagePriority::Normal)
        .export_values();

    py::enum_<CongestionLevel>(m, "CongestionLevel")
        .value("Normal",    CongestionLevel::Normal)
        .value("Moderate",  CongestionLevel::Moderate)
        .value("Throttled", CongestionLevel::Throttled)
        .value("Critical",  CongestionLevel::Critical);

    py::enum_<DeliveryQuality>(m, "DeliveryQuality")
        .value("FireAndForget", DeliveryQuality::FireAndForget)
        .value("AtLeastOnce",   DeliveryQuality::AtLeastOnce)
        .export_values();

    py::enum_<ActionType>(m, "ActionType")
        .value("AttitudeAdjust",   ActionType::AttitudeAdjust)
        .value("LoadShed",         ActionType::LoadShed)
        .value("ThermalManeuver",  ActionType::ThermalManeuver)
        .value("SafeMode",         ActionType::SafeMode)
        .value("RoleReassignment", ActionType::RoleReassignment);

    py::enum_<AdmissionOutcome>(m, "AdmissionOutcome")
        .value("Admitted",  AdmissionOutcome::Admitted)
        .value("Throttled", AdmissionOutcome::Throttled)
        .value("Dropped",   AdmissionOutcome::Dropped);

    py::enum_<BroadcastOutcome>(m, "BroadcastOutcome")
        .value("Published", BroadcastOutcome::Published)
        .value("Skipped",   BroadcastOutcome::Skipped)
        .value("Throttled", BroadcastOutcome::Throttled)
        .value("Failed",    BroadcastOutcome::Failed);

    py::enum_<BroadcastVerdict>(m, "BroadcastVerdict")
        .value("Accepted",          BroadcastVerdict::Accepted)
        .value("MalformedEnvelope", BroadcastVerdict::MalformedEnvelope)
        .value("UnknownSender",     BroadcastVerdict::UnknownSender)
        .value("BadSignature",      BroadcastVerdict::BadSignature)
        .value("DecodeFailed",      BroadcastVerdict::DecodeFailed);

    py::enum_<DecodeError>(m, "DecodeError")
        .value("None",               DecodeError::None)
        .value("TruncatedHeader",    DecodeError::TruncatedHeader)
        .value("UnsupportedVersion", DecodeError::UnsupportedVersion)
        .value("EntropyStageFailed", DecodeError::EntropyStageFailed)
        .value("MalformedPayload",   DecodeError::MalformedPayload)
        .value("InvalidFields",      DecodeError::InvalidFields);

    py::enum_<EventType>(m, "EventType")
        .value("PeerDiscovered",           EventType::PeerDiscovered)
        .value("PeerRoleChanged",          EventType::PeerRoleChanged)
        .value("PeersPruned",              EventType::PeersPruned)
        .value("HeartbeatPublished",       EventType::HeartbeatPublished)
        .value("HeartbeatFailed",          EventType::HeartbeatFailed)
        .value("HelloBroadcast",           EventType::HelloBroadcast)
        .value("HelloRelayed",             EventType::HelloRelayed)
        .value("HelloDropped",             EventType::HelloDropped)
        .value("HealthDecodeFailed",       EventType::HealthDecodeFailed)
        .value("MessageAdmitted",          EventType::MessageAdmitted)
        .value("MessageThrottled",         EventType::MessageThrottled)
        .value("MessageDropped",           EventType::MessageDropped)
        .value("BroadcastPublished",       EventType::BroadcastPublished)
        .value("BroadcastSkipped",         EventType::BroadcastSkipped)
        .value("BroadcastFailed",          EventType::BroadcastFailed)
        .value("BroadcastIntervalChanged", EventType::BroadcastIntervalChanged)
        .value("BroadcastReceived",        EventType::BroadcastReceived)
        .value("BroadcastRejected",        EventType::BroadcastRejected)
        .value("SafetyCheckPerformed",     EventType::SafetyCheckPerformed)
        .value("ActionBlocked",            EventType::ActionBlocked)
        .value("SafetyEvaluationFailed",   EventType::SafetyEvaluationFailed)
        .value("UnknownActionClassified",  EventType::UnknownActionClassified)
        .value("TaskError",                EventType::TaskError)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Configuration ----------------------------------------------------

    py::class_<RegistryConfig>(m, "RegistryConfig")
        .def(py::init<>())
        .def_readwrite("heartbeat_interval",       &RegistryConfig::heartbeat_interval)
        .def_readwrite("heartbeat_timeout",        &RegistryConfig::heartbeat_timeout)
        .def_readwrite("congestion_backoff",       &RegistryConfig::congestion_backoff)
        .def_readwrite("failure_backoff",          &RegistryConfig::failure_backoff)
        .def_readwrite("gossip_fanout",            &RegistryConfig::gossip_fanout)
        .def_readwrite("gossip_replication",       &RegistryConfig::gossip_replication)
        .def_readwrite("hello_every_n_heartbeats", &RegistryConfig::hello_every_n_heartbeats)
        .def_readwrite("retention_window",         &RegistryConfig::retention_window)
        .def_readwrite("random_seed",              &RegistryConfig::random_seed);

    py::class_<GovernorConfig>(m, "GovernorConfig")
        .def(py::init<>())
        .def_readwrite("global_rate",            &GovernorConfig::global_rate)
        .def_readwrite("global_burst",           &GovernorConfig::global_burst)
        .def_readwrite("peer_rate",              &GovernorConfig::peer_rate)
        .def_readwrite("peer_burst",             &GovernorConfig::peer_burst)
        .def_readwrite("throttle_low_threshold", &GovernorConfig::throttle_low_threshold)
        .def_readwrite("throttle_all_threshold", &GovernorConfig::throttle_all_threshold)
        .def_readwrite("critical_threshold",     &GovernorConfig::critical_threshold);

    py::class_<BroadcastConfig>(m, "BroadcastConfig")
        .def(py::init<>())
        .def_readwrite("base_interval",        &BroadcastConfig::base_interval)
        .def_readwrite("congested_interval",   &BroadcastConfig::congested_interval)
        .def_readwrite("severe_interval",      &BroadcastConfig::severe_interval)
        .def_readwrite("congestion_threshold", &BroadcastConfig::congestion_threshold)
        .def_readwrite("severe_threshold",     &BroadcastConfig::severe_threshold)
        .def_readwrite("max_queue_depth",      &BroadcastConfig::max_queue_depth)
        .def_readwrite("topic_prefix",         &BroadcastConfig::topic_prefix);

    py::class_<SafetyConfig>(m, "SafetyConfig")
        .def(py::init<>())
        .def_readwrite("risk_threshold",         &SafetyConfig::risk_threshold)
        .def_readwrite("min_percentile_samples", &SafetyConfig::min_percentile_samples)
        .def_readwrite("latency_window",         &SafetyConfig::latency_window);

    py::class_<FeatureFlags>(m, "FeatureFlags")
        .def(py::init<>())
        .def_readwrite("swarm_mode_enabled",  &FeatureFlags::swarm_mode_enabled)
        .def_readwrite("schema_validation",   &FeatureFlags::schema_validation)
        .def_readwrite("compression_enabled", &FeatureFlags::compression_enabled)
        .def_readwrite("max_payload_bytes",   &FeatureFlags::max_payload_bytes);

    // Config (top-level, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("registry",  &Config::registry)
        .def_readwrite("governor",  &Config::governor)
        .def_readwrite("broadcast", &Config::broadcast)
        .def_readwrite("safety",    &Config::safety)
        .def_readwrite("features",  &Config::features);

    m.def("load_feature_flags_from_env", &load_feature_flags_from_env);

    // ---- Results and statistics -------------------------------------------

    py::class_<CompressionStats>(m, "CompressionStats")
        .def(py::init<>())
        .def_readwrite("original_size",     &CompressionStats::original_size)
        .def_readwrite("delta_size",        &CompressionStats::delta_size)
        .def_readwrite("quantized_size",    &CompressionStats::quantized_size)
        .def_readwrite("compressed_size",   &CompressionStats::compressed_size)
        .def_readwrite("compression_ratio", &CompressionStats::compression_ratio);

    py::class_<AdmissionResult>(m, "AdmissionResult")
        .def(py::init<>())
        .def_readwrite("outcome",            &AdmissionResult::outcome)
        .def_readwrite("global_utilization", &AdmissionResult::global_utilization)
        .def_readwrite("reason",             &AdmissionResult::reason)
        .def("admitted", &AdmissionResult::admitted);

    py::class_<BandwidthStats>(m, "BandwidthStats")
        .def(py::init<>())
        .def_readwrite("total_bytes_sent",   &BandwidthStats::total_bytes_sent)
        .def_readwrite("total_messages",     &BandwidthStats::total_messages)
        .def_readwrite("dropped_messages",   &BandwidthStats::dropped_messages)
        .def_readwrite("throttled_messages", &BandwidthStats::throttled_messages)
        .def_readwrite("congestion_events",  &BandwidthStats::congestion_events)
        .def_readwrite("peak_utilization",   &BandwidthStats::peak_utilization)
        .def("average_message_size", &BandwidthStats::average_message_size)
        .def("drop_rate",            &BandwidthStats::drop_rate);

    py::class_<RegistryStats>(m, "RegistryStats")
        .def(py::init<>())
        .def_readwrite("total_peers",        &RegistryStats::total_peers)
        .def_readwrite("alive_peers",        &RegistryStats::alive_peers)
        .def_readwrite("dead_peers",         &RegistryStats::dead_peers)
        .def_readwrite("alive_percentage",   &RegistryStats::alive_percentage)
        .def_readwrite("quorum_size",        &RegistryStats::quorum_size)
        .def_readwrite("heartbeat_interval", &RegistryStats::heartbeat_interval)
        .def_readwrite("heartbeat_timeout",  &RegistryStats::heartbeat_timeout)
        .def_readwrite("heartbeats_sent",    &RegistryStats::heartbeats_sent)
        .def_readwrite("heartbeat_failures", &RegistryStats::heartbeat_failures)
        .def_readwrite("hellos_relayed",     &RegistryStats::hellos_relayed)
        .def_readwrite("decode_failures",    &RegistryStats::decode_failures);

    py::class_<BroadcastMetrics>(m, "BroadcastMetrics")
        .def(py::init<>())
        .def_readwrite("total_broadcasts",         &BroadcastMetrics::total_broadcasts)
        .def_readwrite("successful_broadcasts",    &BroadcastMetrics::successful_broadcasts)
        .def_readwrite("failed_broadcasts",        &BroadcastMetrics::failed_broadcasts)
        .def_readwrite("skipped_broadcasts",       &BroadcastMetrics::skipped_broadcasts)
        .def_readwrite("average_latency_ms",       &BroadcastMetrics::average_latency_ms)
        .def_readwrite("current_interval",         &BroadcastMetrics::current_interval)
        .def_readwrite("current_congestion_level", &BroadcastMetrics::current_congestion_level);

    py::class_<SimulationResult>(m, "SimulationResult")
        .def(py::init<>())
        .def_readwrite("is_safe",         &SimulationResult::is_safe)
        .def_readwrite("action_type",     &SimulationResult::action_type)
        .def_readwrite("base_risk",       &SimulationResult::base_risk)
        .def_readwrite("cascade_risk",    &SimulationResult::cascade_risk)
        .def_readwrite("total_risk",      &SimulationResult::total_risk)
        .def_readwrite("threshold",       &SimulationResult::threshold)
        .def_readwrite("affected_agents", &SimulationResult::affected_agents)
        .def_readwrite("latency_ms",      &SimulationResult::latency_ms);

    py::class_<SafetyMetrics>(m, "SafetyMetrics")
        .def(py::init<>())
        .def_readwrite("simulations_run",          &SafetyMetrics::simulations_run)
        .def_readwrite("simulations_safe",         &SafetyMetrics::simulations_safe)
        .def_readwrite("simulations_blocked",      &SafetyMetrics::simulations_blocked)
        .def_readwrite("evaluation_errors",        &SafetyMetrics::evaluation_errors)
        .def_readwrite("total_blocked_risk",       &SafetyMetrics::total_blocked_risk)
        .def_readwrite("cascade_prevention_count", &SafetyMetrics::cascade_prevention_count)
        .def_readwrite("avg_latency_ms",           &SafetyMetrics::avg_latency_ms)
        .def_readwrite("p95_latency_ms",           &SafetyMetrics::p95_latency_ms)
        .def_readwrite("max_latency_ms",           &SafetyMetrics::max_latency_ms)
        .def("block_rate", &SafetyMetrics::block_rate);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",          &MonitorEvent::type)
        .def_readwrite("timestamp",     &MonitorEvent::timestamp)
        .def_readwrite("message",       &MonitorEvent::message)
        .def_readwrite("agent",         &MonitorEvent::agent)
        .def_readwrite("bytes",         &MonitorEvent::bytes)
        .def_readwrite("priority",      &MonitorEvent::priority)
        .def_readwrite("risk",          &MonitorEvent::risk)
        .def_readwrite("safety_result", &MonitorEvent::safety_result)
        .def_readwrite("duration_us",   &MonitorEvent::duration_us);

    // SwarmSnapshot
    py::class_<SwarmSnapshot>(m, "SwarmSnapshot")
        .def(py::init<>())
        .def_readwrite("timestamp",          &SwarmSnapshot::timestamp)
        .def_readwrite("agent",              &SwarmSnapshot::agent)
        .def_readwrite("total_peers",        &SwarmSnapshot::total_peers)
        .def_readwrite("alive_peers",        &SwarmSnapshot::alive_peers)
        .def_readwrite("quorum_size",        &SwarmSnapshot::quorum_size)
        .def_readwrite("global_utilization", &SwarmSnapshot::global_utilization)
        .def_readwrite("congestion",         &SwarmSnapshot::congestion)
        .def_readwrite("broadcast_interval", &SwarmSnapshot::broadcast_interval);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("peers_discovered",             &MetricsMonitor::Metrics::peers_discovered)
        .def_readwrite("heartbeats_published",         &MetricsMonitor::Metrics::heartbeats_published)
        .def_readwrite("heartbeats_failed",            &MetricsMonitor::Metrics::heartbeats_failed)
        .def_readwrite("hellos_relayed",               &MetricsMonitor::Metrics::hellos_relayed)
        .def_readwrite("decode_failures",              &MetricsMonitor::Metrics::decode_failures)
        .def_readwrite("messages_throttled",           &MetricsMonitor::Metrics::messages_throttled)
        .def_readwrite("messages_dropped",             &MetricsMonitor::Metrics::messages_dropped)
        .def_readwrite("broadcasts_published",         &MetricsMonitor::Metrics::broadcasts_published)
        .def_readwrite("broadcasts_skipped",           &MetricsMonitor::Metrics::broadcasts_skipped)
        .def_readwrite("broadcasts_failed",            &MetricsMonitor::Metrics::broadcasts_failed)
        .def_readwrite("broadcasts_rejected",          &MetricsMonitor::Metrics::broadcasts_rejected)
        .def_readwrite("safety_checks",                &MetricsMonitor::Metrics::safety_checks)
        .def_readwrite("actions_blocked",              &MetricsMonitor::Metrics::actions_blocked)
        .def_readwrite("safety_check_avg_duration_us", &MetricsMonitor::Metrics::safety_check_avg_duration_us)
        .def_readwrite("global_utilization_percent",   &MetricsMonitor::Metrics::global_utilization_percent)
        .def_readwrite("alive_peers",                  &MetricsMonitor::Metrics::alive_peers);

    // ---- Constants --------------------------------------------------------

    m.attr("SUPPORTED_CONSTELLATION") = SUPPORTED_CONSTELLATION;
    m.attr("SIGNATURE_SIZE")          = SIGNATURE_SIZE;
    m.def("quorum_for", &quorum_for, py::arg("alive"));
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_OrbitGuardError =
        py::register_exception<OrbitGuardException>(m, "OrbitGuardError", PyExc_RuntimeError);

    // Derived from OrbitGuardError
    static auto py_InvalidAgentIdError =
        py::register_exception<InvalidAgentIdException>(m, "InvalidAgentIdError", py_OrbitGuardError.ptr());
    static auto py_InvalidHealthSummaryError =
        py::register_exception<InvalidHealthSummaryException>(m, "InvalidHealthSummaryError", py_OrbitGuardError.ptr());
    static auto py_InvalidSwarmConfigError =
        py::register_exception<InvalidSwarmConfigException>(m, "InvalidSwarmConfigError", py_OrbitGuardError.ptr());
    static auto py_ConfigError =
        py::register_exception<ConfigException>(m, "ConfigError", py_OrbitGuardError.ptr());

    static auto py_CompressionError =
        py::register_exception<CompressionException>(m, "CompressionError", py_OrbitGuardError.ptr());

    // Derived from CompressionError
    static auto py_PayloadTooLargeError =
        py::register_exception<PayloadTooLargeException>(m, "PayloadTooLargeError", py_CompressionError.ptr());
}
