#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/bandwidth_governor.hpp"
#include "orbitguard/config.hpp"
#include "orbitguard/health_broadcaster.hpp"
#include "orbitguard/health_summary.hpp"
#include "orbitguard/message_bus.hpp"
#include "orbitguard/monitor.hpp"
#include "orbitguard/peer_registry.hpp"
#include "orbitguard/safety_simulator.hpp"
#include "orbitguard/state_compressor.hpp"
#include "orbitguard/swarm_config.hpp"
#include "orbitguard/types.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace orbitguard {

// Outcome of processing one signed health broadcast
enum class BroadcastVerdict {
    Accepted,
    MalformedEnvelope,
    UnknownSender,
    BadSignature,
    DecodeFailed
};

inline const char* to_string(BroadcastVerdict v) {
    switch (v) {
        case BroadcastVerdict::Accepted:          return "Accepted";
        case BroadcastVerdict::MalformedEnvelope: return "MalformedEnvelope";
        case BroadcastVerdict::UnknownSender:     return "UnknownSender";
        case BroadcastVerdict::BadSignature:      return "BadSignature";
        case BroadcastVerdict::DecodeFailed:      return "DecodeFailed";
    }
    return "Unknown";
}

// Everything one satellite runs, wired together.
//
// Owns the bandwidth governor, the outbound broadcast compressor, the peer
// registry, the health broadcaster and the safety simulator, and routes
// signed broadcasts received on health/<constellation> into the registry.
class SwarmAgent {
public:
    // The bus must outlive the agent
    SwarmAgent(SwarmConfig config, MessageBus& bus, Config settings = {});
    ~SwarmAgent();

    // Non-copyable
    SwarmAgent(const SwarmAgent&) = delete;
    SwarmAgent& operator=(const SwarmAgent&) = delete;

    void start();
    void stop();
    bool is_running() const noexcept;

    void set_local_health(const HealthSummary& health);
    void set_role(SatelliteRole role);

    // Safety gate for proposed actions (see SafetySimulator)
    bool validate_action(const std::string& action,
                         const ActionParams& params,
                         const std::string& decision_id = "",
                         const std::string& scope = "constellation");

    // Verify and apply one broadcast envelope (wired to the bus by start())
    BroadcastVerdict handle_broadcast(const Bytes& payload);

    SwarmSnapshot get_snapshot();
    void emit_snapshot();

    void set_monitor(std::shared_ptr<Monitor> monitor);

    const AgentId& id() const noexcept;
    const SwarmConfig& config() const noexcept;
    const Config& settings() const noexcept;
    PeerRegistry& registry() noexcept;
    BandwidthGovernor& governor() noexcept;
    HealthBroadcaster& broadcaster() noexcept;
    SafetySimulator& simulator() noexcept;

private:
    SwarmConfig config_;
    Config settings_;
    MessageBus& bus_;

    BandwidthGovernor governor_;
    StateCompressor broadcast_encoder_;
    PeerRegistry registry_;
    SafetySimulator simulator_;
    HealthBroadcaster broadcaster_;

    mutable std::mutex mutex_;
    std::optional<SubscriptionId> broadcast_subscription_;
    bool running_{false};
    std::shared_ptr<Monitor> monitor_;

    BroadcastVerdict reject(BroadcastVerdict verdict, const std::string& reason,
                            std::size_t bytes);
    void emit_event(EventType type, const std::string& message,
                    std::optional<std::string> agent, std::size_t bytes);
};

} // namespace orbitguard
