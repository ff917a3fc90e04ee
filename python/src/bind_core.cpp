#include "bind_forward.hpp"
#include <orbitguard/orbitguard.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/operators.h>

#include <string>
#include <vector>

using namespace orbitguard;

namespace {

Bytes to_bytes(const py::bytes& data) {
    std::string raw = data;
    return Bytes(raw.begin(), raw.end());
}

py::bytes to_py_bytes(const Bytes& data) {
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// bind_core  --  AgentId, HealthSummary, codec, bus, SwarmAgent
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // AgentId
    // ===================================================================
    py::class_<AgentId>(m, "AgentId")
        .def(py::init<std::string, std::string>(),
             py::arg("constellation"), py::arg("satellite_serial"))
        .def_static("parse", &AgentId::parse, py::arg("qualified_name"))
        .def("constellation",    &AgentId::constellation)
        .def("satellite_serial", &AgentId::satellite_serial)
        .def("qualified_name",   &AgentId::qualified_name)
        .def("uuid_hex",         &AgentId::uuid_hex)
        .def("uuid", [](const AgentId& id) { return uuid_to_string(id.uuid()); })
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def("__hash__", [](const AgentId& id) { return std::hash<AgentId>{}(id); })
        .def("__repr__", [](const AgentId& id) {
            return "<AgentId " + id.qualified_name() + ">";
        });

    // ===================================================================
    // HealthSummary
    // ===================================================================
    py::class_<HealthSummary>(m, "HealthSummary")
        // Stamped at construction time, not at import time
        .def(py::init([](const std::vector<float>& signature, float risk, float recurrence) {
                 return HealthSummary(signature, risk, recurrence);
             }),
             py::arg("anomaly_signature"), py::arg("risk_score"),
             py::arg("recurrence_score"))
        .def_static("nominal", [] { return HealthSummary::nominal(); })
        .def("anomaly_signature", [](const HealthSummary& h) {
            const auto& sig = h.anomaly_signature();
            return std::vector<float>(sig.begin(), sig.end());
        })
        .def("risk_score",       &HealthSummary::risk_score)
        .def("recurrence_score", &HealthSummary::recurrence_score)
        .def("timestamp",        &HealthSummary::timestamp)
        .def("compressed_size",  &HealthSummary::compressed_size)
        .def("__repr__", [](const HealthSummary& h) {
            return "<HealthSummary risk=" + std::to_string(h.risk_score())
                 + " recurrence=" + std::to_string(h.recurrence_score()) + ">";
        });

    // ===================================================================
    // SwarmConfig
    // ===================================================================
    py::class_<SwarmConfig>(m, "SwarmConfig")
        .def(py::init<AgentId, SatelliteRole, std::string, std::vector<AgentId>, int>(),
             py::arg("agent_id"), py::arg("role"), py::arg("constellation_id"),
             py::arg("peers") = std::vector<AgentId>{},
             py::arg("bandwidth_limit_kbps") = SwarmConfig::DEFAULT_BANDWIDTH_LIMIT_KBPS)
        .def("agent_id",             &SwarmConfig::agent_id)
        .def("role",                 &SwarmConfig::role)
        .def("constellation_id",     &SwarmConfig::constellation_id)
        .def("peers",                &SwarmConfig::peers)
        .def("bandwidth_limit_kbps", &SwarmConfig::bandwidth_limit_kbps)
        .def("set_role",             &SwarmConfig::set_role, py::arg("role"));

    // ===================================================================
    // StateCompressor
    // ===================================================================
    py::class_<DecodeResult>(m, "DecodeResult")
        .def_readonly("summary", &DecodeResult::summary)
        .def_readonly("error",   &DecodeResult::error)
        .def_readonly("reason",  &DecodeResult::reason)
        .def("ok", &DecodeResult::ok);

    py::class_<StateCompressor>(m, "StateCompressor")
        .def(py::init<bool, std::size_t>(),
             py::arg("entropy_enabled") = true,
             py::arg("max_payload_bytes") = StateCompressor::DEFAULT_MAX_PAYLOAD)
        .def("encode", [](StateCompressor& self, const HealthSummary& summary) {
            return to_py_bytes(self.encode(summary));
        }, py::arg("summary"))
        .def("decode", [](StateCompressor& self, const py::bytes& data) {
            return self.decode(to_bytes(data));
        }, py::arg("data"))
        .def("reset",           &StateCompressor::reset)
        .def("has_reference",   &StateCompressor::has_reference)
        .def("entropy_enabled", &StateCompressor::entropy_enabled)
        .def("last_stats",      &StateCompressor::last_stats)
        .def_static("compression_ratio", &StateCompressor::compression_ratio,
                    py::arg("original_size"), py::arg("compressed_size"));

    // ===================================================================
    // Message bus
    // ===================================================================
    py::class_<MessageBus>(m, "MessageBus")
        .def("pending_messages", &MessageBus::pending_messages);

    py::class_<LocalBus, MessageBus>(m, "LocalBus")
        .def("publish",
             [](LocalBus& self, const std::string& topic, const py::bytes& payload,
                DeliveryQuality quality, std::optional<AgentId> receiver) {
                 return self.publish(topic, to_bytes(payload), quality, receiver);
             },
             py::arg("topic"), py::arg("payload"),
             py::arg("quality") = DeliveryQuality::AtLeastOnce,
             py::arg("receiver") = std::nullopt)
        .def("subscribe",
             [](LocalBus& self, const std::string& filter, py::function callback) {
                 MessageCallback cpp_cb = [cb = py::object(callback)](const BusMessage& msg) {
                     py::gil_scoped_acquire acquire;
                     cb(msg.topic, to_py_bytes(msg.payload), msg.sender);
                 };
                 return self.subscribe(filter, std::move(cpp_cb));
             },
             py::arg("topic_filter"), py::arg("callback"))
        .def("unsubscribe",     &LocalBus::unsubscribe, py::arg("id"))
        .def("set_online",      &LocalBus::set_online, py::arg("online"))
        .def("is_online",       &LocalBus::is_online)
        .def("agent",           &LocalBus::agent)
        .def("published_count", &LocalBus::published_count)
        .def("rejected_count",  &LocalBus::rejected_count);

    py::class_<LocalBusHub>(m, "LocalBusHub")
        .def(py::init<>())
        .def("connect", &LocalBusHub::connect, py::arg("agent"),
             py::keep_alive<0, 1>())
        .def("total_published", &LocalBusHub::total_published)
        .def("total_delivered", &LocalBusHub::total_delivered);

    m.def("topic_matches", &topic_matches, py::arg("filter"), py::arg("topic"));

    // ===================================================================
    // SwarmAgent
    // ===================================================================
    py::class_<SwarmAgent>(m, "SwarmAgent")
        .def(py::init<SwarmConfig, MessageBus&, Config>(),
             py::arg("config"), py::arg("bus"), py::arg("settings") = Config{},
             py::keep_alive<1, 3>())

        // ------------- Lifecycle -------------
        .def("start",      &SwarmAgent::start)
        .def("stop",       &SwarmAgent::stop,
             py::call_guard<py::gil_scoped_release>())
        .def("is_running", &SwarmAgent::is_running)

        // ------------- Local state -------------
        .def("set_local_health", &SwarmAgent::set_local_health, py::arg("health"))
        .def("set_role",         &SwarmAgent::set_role, py::arg("role"))

        // ------------- Safety gate -------------
        .def("validate_action", &SwarmAgent::validate_action,
             py::arg("action"), py::arg("params"),
             py::arg("decision_id") = "",
             py::arg("scope") = "constellation")

        // ------------- Broadcasts -------------
        .def("handle_broadcast",
             [](SwarmAgent& self, const py::bytes& payload) {
                 return self.handle_broadcast(to_bytes(payload));
             },
             py::arg("payload"))

        // ------------- Queries -------------
        .def("get_snapshot",  &SwarmAgent::get_snapshot)
        .def("emit_snapshot", &SwarmAgent::emit_snapshot)
        .def("set_monitor",   &SwarmAgent::set_monitor, py::arg("monitor"))
        .def("id",            &SwarmAgent::id)
        .def("config",        &SwarmAgent::config)
        .def("registry",      &SwarmAgent::registry,
             py::return_value_policy::reference_internal)
        .def("governor",      &SwarmAgent::governor,
             py::return_value_policy::reference_internal)
        .def("broadcaster",   &SwarmAgent::broadcaster,
             py::return_value_policy::reference_internal)
        .def("simulator",     &SwarmAgent::simulator,
             py::return_value_policy::reference_internal);
}
