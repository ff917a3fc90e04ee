#include "orbitguard/swarm_agent.hpp"
#include "orbitguard/crypto.hpp"

namespace orbitguard {

namespace {

// The link budget from SwarmConfig replaces the configured global bucket
GovernorConfig sized_for_link(GovernorConfig governor, int bandwidth_limit_kbps) {
    governor.global_rate = static_cast<double>(bandwidth_limit_kbps) * 1000.0;
    governor.global_burst = governor.global_rate / 5.0;
    return governor;
}

} // anonymous namespace

SwarmAgent::SwarmAgent(SwarmConfig config, MessageBus& bus, Config settings)
    : config_(std::move(config))
    , settings_(std::move(settings))
    , bus_(bus)
    , governor_(sized_for_link(settings_.governor, config_.bandwidth_limit_kbps()))
    , broadcast_encoder_(settings_.features.compression_enabled, settings_.features.max_payload_bytes)
    , registry_(config_, settings_.registry, settings_.features, &governor_)
    , simulator_(&registry_, settings_.safety, settings_.features.swarm_mode_enabled)
    , broadcaster_(config_, registry_, bus_, broadcast_encoder_, settings_.broadcast, &governor_)
{}

SwarmAgent::~SwarmAgent() {
    stop();
}

void SwarmAgent::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }

    auto id = bus_.subscribe(settings_.broadcast.topic_prefix + config_.constellation_id(),
                             [this](const BusMessage& msg) { handle_broadcast(msg.payload); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        broadcast_subscription_ = id;
    }

    registry_.start(bus_);
    broadcaster_.start();
}

void SwarmAgent::stop() {
    std::optional<SubscriptionId> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        subscription = broadcast_subscription_;
        broadcast_subscription_.reset();
    }

    broadcaster_.stop();
    registry_.stop();
    if (subscription.has_value()) {
        bus_.unsubscribe(*subscription);
    }
}

bool SwarmAgent::is_running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SwarmAgent::set_local_health(const HealthSummary& health) {
    registry_.update_local_health(health);
}

void SwarmAgent::set_role(SatelliteRole role) {
    config_.set_role(role);
    registry_.set_local_role(role);
}

bool SwarmAgent::validate_action(const std::string& action,
                                 const ActionParams& params,
                                 const std::string& decision_id,
                                 const std::string& scope) {
    return simulator_.validate_action(action, params, decision_id, scope);
}

BroadcastVerdict SwarmAgent::handle_broadcast(const Bytes& payload) {
    std::string text(payload.begin(), payload.end());
    std::string error;

    auto envelope = HealthEnvelope::from_json(text, settings_.features.schema_validation, &error);
    if (!envelope.has_value()) {
        return reject(BroadcastVerdict::MalformedEnvelope, error, payload.size());
    }

    auto sender = registry_.find_peer_by_uuid(envelope->agent_id);
    if (!sender.has_value()) {
        return reject(BroadcastVerdict::UnknownSender,
                      "unknown sender " + envelope->agent_id, payload.size());
    }
    if (*sender == config_.agent_id()) {
        return reject(BroadcastVerdict::UnknownSender, "own broadcast looped back", payload.size());
    }

    if (!HealthBroadcaster::verify_signature(*envelope, HealthBroadcaster::derive_key(*sender))) {
        return reject(BroadcastVerdict::BadSignature,
                      "signature mismatch from " + sender->qualified_name(), payload.size());
    }

    auto wire = crypto::hex_decode(envelope->compressed_health);
    if (!wire.has_value()) {
        return reject(BroadcastVerdict::MalformedEnvelope, "compressed_health is not hex",
                      payload.size());
    }

    // Broadcasts are always reference messages, so each decodes on its own
    // without depending on which earlier broadcasts this agent saw
    StateCompressor decoder(settings_.features.compression_enabled,
                            settings_.features.max_payload_bytes);
    DecodeResult decoded = decoder.decode(*wire);
    if (!decoded.ok()) {
        return reject(BroadcastVerdict::DecodeFailed,
                      std::string(to_string(decoded.error)) + ": " + decoded.reason,
                      payload.size());
    }

    registry_.update_peer(*sender, *decoded.summary);
    emit_event(EventType::BroadcastReceived, "Verified health broadcast",
               sender->qualified_name(), payload.size());
    return BroadcastVerdict::Accepted;
}

BroadcastVerdict SwarmAgent::reject(BroadcastVerdict verdict, const std::string& reason,
                                    std::size_t bytes) {
    emit_event(EventType::BroadcastRejected,
               std::string("Rejected broadcast (") + to_string(verdict) + "): " + reason,
               std::nullopt, bytes);
    return verdict;
}

SwarmSnapshot SwarmAgent::get_snapshot() {
    auto stats = registry_.get_registry_stats();

    SwarmSnapshot snapshot;
    snapshot.timestamp = Clock::now();
    snapshot.agent = config_.agent_id().qualified_name();
    snapshot.total_peers = stats.total_peers;
    snapshot.alive_peers = stats.alive_peers;
    snapshot.quorum_size = stats.quorum_size;
    snapshot.global_utilization = governor_.get_global_utilization();
    snapshot.congestion = governor_.get_congestion_level();
    snapshot.broadcast_interval = broadcaster_.current_interval();
    return snapshot;
}

void SwarmAgent::emit_snapshot() {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = monitor_;
    }
    if (monitor) {
        monitor->on_snapshot(get_snapshot());
    }
}

void SwarmAgent::set_monitor(std::shared_ptr<Monitor> monitor) {
    governor_.set_monitor(monitor);
    registry_.set_monitor(monitor);
    simulator_.set_monitor(monitor);
    broadcaster_.set_monitor(monitor);
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void SwarmAgent::emit_event(EventType type, const std::string& message,
                            std::optional<std::string> agent, std::size_t bytes) {
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
    event.agent = std::move(agent);
    event.bytes = bytes;
    monitor->on_event(event);
}

const AgentId& SwarmAgent::id() const noexcept { return config_.agent_id(); }
const SwarmConfig& SwarmAgent::config() const noexcept { return config_; }
const Config& SwarmAgent::settings() const noexcept { return settings_; }
PeerRegistry& SwarmAgent::registry() noexcept { return registry_; }
BandwidthGovernor& SwarmAgent::governor() noexcept { return governor_; }
HealthBroadcaster& SwarmAgent::broadcaster() noexcept { return broadcaster_; }
SafetySimulator& SwarmAgent::simulator() noexcept { return simulator_; }

} // namespace orbitguard
