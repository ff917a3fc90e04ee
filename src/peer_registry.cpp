#include "orbitguard/peer_registry.hpp"
#include "orbitguard/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

namespace orbitguard {

namespace {

constexpr float kPlaceholderSignatureValue = 0.1F;

std::string short_id(const AgentId& id) {
    return id.uuid_hex().substr(0, 8);
}

} // anonymous namespace

std::size_t quorum_for(std::size_t alive) noexcept {
    return alive / 2 + 1;
}

// ========== PeerState ==========

void PeerState::record_heartbeat(Timestamp now, const std::optional<HealthSummary>& health) {
    last_heartbeat = now;
    if (health.has_value()) {
        health_summary = health;
    }
    heartbeat_failures = 0;
    backoff_multiplier = 1.0;
    is_alive = true;
}

void PeerState::record_heartbeat_failure() {
    heartbeat_failures++;
    backoff_multiplier = std::min(4.0, std::pow(2.0, static_cast<double>(heartbeat_failures) - 1.0));
}

bool PeerState::alive_at(Timestamp now, Duration timeout) const noexcept {
    return now - last_heartbeat <= timeout;
}

Duration PeerState::next_heartbeat_interval(const RegistryConfig& config) const noexcept {
    if (heartbeat_failures == 0) return config.heartbeat_interval;
    if (heartbeat_failures == 1) return config.congestion_backoff;
    return config.failure_backoff;
}

// ========== HelloBeacon ==========

Bytes HelloBeacon::encode() const {
    std::string text = origin.qualified_name();
    if (role.has_value()) {
        text += "|";
        text += to_string(*role);
    }
    return Bytes(text.begin(), text.end());
}

std::optional<HelloBeacon> HelloBeacon::decode(const Bytes& payload) {
    std::string text(payload.begin(), payload.end());
    std::optional<SatelliteRole> role;

    auto bar = text.find('|');
    if (bar != std::string::npos) {
        role = role_from_string(text.substr(bar + 1));
        if (!role.has_value()) {
            return std::nullopt;
        }
        text = text.substr(0, bar);
    }

    try {
        return HelloBeacon{AgentId::parse(text), role};
    } catch (const InvalidAgentIdException&) {
        return std::nullopt;
    }
}

// ========== PeerRegistry ==========

PeerRegistry::PeerRegistry(const SwarmConfig& config,
                           RegistryConfig registry_config,
                           FeatureFlags features,
                           BandwidthGovernor* governor)
    : self_(config.agent_id())
    , local_role_(config.role())
    , config_(std::move(registry_config))
    , features_(features)
    , governor_(governor)
    , encoder_(features.compression_enabled, features.max_payload_bytes)
    , rng_(config_.random_seed.value_or(std::random_device{}()))
{
    register_self();
}

PeerRegistry::~PeerRegistry() {
    stop();
}

void PeerRegistry::register_self() {
    PeerState state{self_};
    state.role = local_role_;
    state.last_heartbeat = Clock::now();
    peers_.emplace(self_, std::move(state));
}

void PeerRegistry::start(MessageBus& bus) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bus_ != nullptr) {
            return;
        }
        bus_ = &bus;
    }

    subscriptions_.push_back(bus.subscribe(
        std::string(HEALTH_TOPIC_PREFIX) + "#",
        [this](const BusMessage& msg) { on_health_message(msg.sender, msg.payload); }));
    subscriptions_.push_back(bus.subscribe(
        std::string(HELLO_TOPIC_PREFIX) + "#",
        [this](const BusMessage& msg) { on_hello_message(msg.sender, msg.payload); }));

    heartbeat_task_.start(
        config_.heartbeat_interval,
        [this] { return heartbeat_once(); },
        [this](const std::string& error) { emit_event(EventType::TaskError, error, self_); });
}

void PeerRegistry::stop() {
    heartbeat_task_.stop();

    MessageBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bus = bus_;
        bus_ = nullptr;
    }
    if (bus != nullptr) {
        for (auto id : subscriptions_) {
            bus->unsubscribe(id);
        }
    }
    subscriptions_.clear();
}

bool PeerRegistry::is_running() const noexcept {
    return heartbeat_task_.is_running();
}

HealthSummary PeerRegistry::current_local_health() {
    HealthProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        provider = health_provider_;
        if (!provider && local_health_.has_value()) {
            HealthSummary health = *local_health_;
            health.set_timestamp(WallClock::now());
            return health;
        }
    }
    if (provider) {
        return provider();
    }
    Signature placeholder;
    placeholder.fill(kPlaceholderSignatureValue);
    return HealthSummary(placeholder, 0.0F, 0.0F);
}

bool PeerRegistry::admit(const AgentId& peer, std::size_t size, MessagePriority priority) {
    if (governor_ == nullptr) {
        return true;
    }
    return governor_->acquire(peer, size, priority).admitted();
}

Duration PeerRegistry::heartbeat_once() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    MessageBus* bus = nullptr;
    StateCompressor candidate;
    std::uint64_t tick = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bus = bus_;
        candidate = encoder_;
        tick = ++heartbeat_counter_;
    }

    bool published = false;
    std::string failure_reason;
    std::optional<HealthSummary> health;
    Bytes payload;

    try {
        health = current_local_health();
        payload = candidate.encode(*health);

        if (bus == nullptr) {
            failure_reason = "no message bus attached";
        } else if (!admit(self_, payload.size(), MessagePriority::Critical)) {
            failure_reason = "bandwidth governor rejected heartbeat";
        } else if (!bus->publish(HEALTH_TOPIC_PREFIX + self_.uuid_hex(), payload,
                                 DeliveryQuality::AtLeastOnce)) {
            failure_reason = "bus publish failed";
        } else {
            published = true;
        }
    } catch (const std::exception& e) {
        failure_reason = e.what();
    }

    Duration next{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& state = peers_.at(self_);
        if (published) {
            encoder_ = candidate;
            if (payload.size() <= HealthSummary::MAX_COMPRESSED_SIZE) {
                health->set_compressed_size(payload.size());
            }
            state.record_heartbeat(Clock::now(), health);
            counters_.heartbeats_sent++;
        } else {
            state.record_heartbeat_failure();
            counters_.heartbeat_failures++;
        }
        next = state.next_heartbeat_interval(config_);
    }

    if (published) {
        emit_event(EventType::HeartbeatPublished, "Heartbeat published", self_, payload.size());
    } else {
        emit_event(EventType::HeartbeatFailed,
                   "Heartbeat failed: " + failure_reason +
                   ", next attempt in " +
                   std::to_string(std::chrono::duration_cast<std::chrono::seconds>(next).count()) + "s",
                   self_);
    }

    if (config_.hello_every_n_heartbeats > 0 && tick % config_.hello_every_n_heartbeats == 0) {
        broadcast_hello();
    }

    prune_stale();
    return next;
}

bool PeerRegistry::broadcast_hello() {
    MessageBus* bus = nullptr;
    HelloBeacon beacon{self_, std::nullopt};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bus = bus_;
        beacon.role = local_role_;
    }
    if (bus == nullptr) {
        return false;
    }

    Bytes payload = beacon.encode();
    if (!admit(self_, payload.size(), MessagePriority::Normal)) {
        emit_event(EventType::HeartbeatFailed, "HELLO throttled by bandwidth governor", self_);
        return false;
    }

    bool ok = bus->publish(HELLO_TOPIC_PREFIX + self_.uuid_hex(), payload,
                           DeliveryQuality::FireAndForget);
    if (ok) {
        emit_event(EventType::HelloBroadcast, "HELLO broadcast", self_, payload.size());
    }
    return ok;
}

void PeerRegistry::on_health_message(const AgentId& sender, const Bytes& payload) {
    if (sender == self_) {
        return;
    }

    bool discovered = false;
    DecodeResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = decoders_.find(sender);
        if (it == decoders_.end()) {
            it = decoders_.emplace(sender, StateCompressor(features_.compression_enabled,
                                                           features_.max_payload_bytes)).first;
        }
        result = it->second.decode(payload);

        if (result.ok()) {
            auto now = Clock::now();
            auto peer = peers_.find(sender);
            if (peer == peers_.end()) {
                PeerState state{sender};
                state.role = local_role_;  // corrected by the next HELLO
                state.record_heartbeat(now, result.summary);
                peers_.emplace(sender, std::move(state));
                discovered = true;
            } else {
                peer->second.record_heartbeat(now, result.summary);
            }
        } else {
            counters_.decode_failures++;
        }
    }

    if (!result.ok()) {
        emit_event(EventType::HealthDecodeFailed,
                   std::string("Dropped health message: ") + to_string(result.error) +
                   " (" + result.reason + ")",
                   sender, payload.size());
        return;
    }
    if (discovered) {
        emit_event(EventType::PeerDiscovered, "Discovered new peer " + short_id(sender), sender);
    }
}

void PeerRegistry::on_hello_message(const AgentId& sender, const Bytes& payload) {
    auto beacon = HelloBeacon::decode(payload);
    if (!beacon.has_value()) {
        emit_event(EventType::HelloDropped, "Malformed HELLO", sender, payload.size());
        return;
    }

    const AgentId& origin = beacon->origin;
    if (origin == self_) {
        return;
    }

    bool discovered = false;
    bool role_changed = false;
    bool limited = false;
    std::vector<AgentId> targets;
    MessageBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& seen = hello_seen_[origin];
        if (seen >= config_.gossip_replication) {
            limited = true;
        } else {
            auto now = Clock::now();
            auto peer = peers_.find(origin);
            if (peer == peers_.end()) {
                PeerState state{origin};
                state.role = beacon->role.value_or(local_role_);
                state.last_heartbeat = now;
                peers_.emplace(origin, std::move(state));
                discovered = true;
            } else {
                peer->second.last_heartbeat = now;
                if (beacon->role.has_value() && peer->second.role != *beacon->role) {
                    peer->second.role = *beacon->role;
                    role_changed = true;
                }
            }

            std::vector<AgentId> others;
            for (const auto& [id, state] : peers_) {
                if (id != self_ && id != origin) {
                    others.push_back(id);
                }
            }
            // Deterministic candidate order so a fixed seed gives fixed targets
            std::sort(others.begin(), others.end());
            std::shuffle(others.begin(), others.end(), rng_);
            std::size_t fanout = std::min(config_.gossip_fanout, others.size());
            targets.assign(others.begin(), others.begin() + static_cast<std::ptrdiff_t>(fanout));

            // Counted before forwarding: a forward can loop back synchronously
            seen++;
            bus = bus_;
        }
    }

    if (limited) {
        emit_event(EventType::HelloDropped, "HELLO replication limit reached", origin);
        return;
    }
    if (discovered) {
        emit_event(EventType::PeerDiscovered, "Discovered peer via HELLO " + short_id(origin), origin);
    } else if (role_changed) {
        emit_event(EventType::PeerRoleChanged,
                   "Peer role is now " + std::string(to_string(*beacon->role)), origin);
    }

    if (bus == nullptr) {
        return;
    }

    const std::string topic = HELLO_TOPIC_PREFIX + origin.uuid_hex();
    for (const auto& target : targets) {
        if (!admit(target, payload.size(), MessagePriority::Normal)) {
            emit_event(EventType::HelloDropped, "HELLO forward throttled", target);
            continue;
        }
        if (bus->publish(topic, payload, DeliveryQuality::FireAndForget, target)) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                counters_.hellos_relayed++;
            }
            emit_event(EventType::HelloRelayed,
                       "Forwarded HELLO from " + short_id(origin) + " to " + short_id(target),
                       target, payload.size());
        } else {
            emit_event(EventType::HelloDropped, "HELLO forward failed", target);
        }
    }
}

bool PeerRegistry::update_peer(const AgentId& peer, const HealthSummary& health,
                               std::optional<SatelliteRole> role) {
    if (peer == self_) {
        update_local_health(health);
        return false;
    }

    bool discovered = false;
    bool role_changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto it = peers_.find(peer);
        if (it == peers_.end()) {
            PeerState state{peer};
            state.role = role.value_or(local_role_);
            state.record_heartbeat(now, health);
            peers_.emplace(peer, std::move(state));
            discovered = true;
        } else {
            it->second.record_heartbeat(now, health);
            if (role.has_value() && it->second.role != *role) {
                it->second.role = *role;
                role_changed = true;
            }
        }
    }

    if (discovered) {
        emit_event(EventType::PeerDiscovered, "Discovered new peer " + short_id(peer), peer);
    } else if (role_changed) {
        emit_event(EventType::PeerRoleChanged,
                   "Peer role is now " + std::string(to_string(*role)), peer);
    }
    return discovered;
}

void PeerRegistry::update_local_health(const HealthSummary& health) {
    std::lock_guard<std::mutex> lock(mutex_);
    local_health_ = health;
    peers_.at(self_).health_summary = health;
}

void PeerRegistry::set_health_provider(HealthProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    health_provider_ = std::move(provider);
}

void PeerRegistry::set_local_role(SatelliteRole role) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = local_role_ != role;
        local_role_ = role;
        peers_.at(self_).role = role;
    }
    if (changed) {
        emit_event(EventType::PeerRoleChanged,
                   "Local role is now " + std::string(to_string(role)), self_);
    }
}

std::vector<AgentId> PeerRegistry::get_alive_peers() const {
    return get_alive_peers(Clock::now());
}

std::vector<AgentId> PeerRegistry::get_alive_peers(Timestamp now) const {
    std::vector<AgentId> alive;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, state] : peers_) {
            if (state.alive_at(now, config_.heartbeat_timeout)) {
                alive.push_back(id);
            }
        }
    }
    std::sort(alive.begin(), alive.end());
    return alive;
}

std::size_t PeerRegistry::get_quorum_size() const {
    return quorum_for(get_alive_peers().size());
}

std::optional<HealthSummary> PeerRegistry::get_peer_health(const AgentId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second.health_summary;
}

std::optional<PeerState> PeerRegistry::get_peer_state(const AgentId& peer) const {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    PeerState copy = it->second;
    copy.is_alive = copy.alive_at(now, config_.heartbeat_timeout);
    return copy;
}

std::vector<PeerState> PeerRegistry::get_all_peers() const {
    auto now = Clock::now();
    std::vector<PeerState> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(peers_.size());
        for (const auto& [id, state] : peers_) {
            PeerState copy = state;
            copy.is_alive = copy.alive_at(now, config_.heartbeat_timeout);
            result.push_back(std::move(copy));
        }
    }
    std::sort(result.begin(), result.end(), [](const PeerState& a, const PeerState& b) {
        return a.agent_id < b.agent_id;
    });
    return result;
}

std::size_t PeerRegistry::get_peer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

std::optional<AgentId> PeerRegistry::find_peer_by_uuid(const std::string& uuid) const {
    std::string needle;
    for (char c : uuid) {
        if (c == '-') continue;
        needle.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, state] : peers_) {
        if (id.uuid_hex() == needle) {
            return id;
        }
    }
    return std::nullopt;
}

std::uint32_t PeerRegistry::get_relay_count(const AgentId& origin) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hello_seen_.find(origin);
    return it == hello_seen_.end() ? 0 : it->second;
}

RegistryStats PeerRegistry::get_registry_stats() const {
    auto alive = get_alive_peers().size();

    std::lock_guard<std::mutex> lock(mutex_);
    RegistryStats stats = counters_;
    stats.total_peers = peers_.size();
    stats.alive_peers = alive;
    stats.dead_peers = stats.total_peers > alive ? stats.total_peers - alive : 0;
    stats.alive_percentage = stats.total_peers > 0
        ? static_cast<double>(alive) / static_cast<double>(stats.total_peers) * 100.0
        : 0.0;
    stats.quorum_size = quorum_for(alive);
    stats.heartbeat_interval = config_.heartbeat_interval;
    stats.heartbeat_timeout = config_.heartbeat_timeout;
    return stats;
}

std::size_t PeerRegistry::prune_stale() {
    return prune_stale(Clock::now());
}

std::size_t PeerRegistry::prune_stale(Timestamp now) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (it->first != self_ && now - it->second.last_heartbeat > config_.retention_window) {
                decoders_.erase(it->first);
                it = peers_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        emit_event(EventType::PeersPruned, "Pruned " + std::to_string(removed) + " stale peers");
    }
    return removed;
}

const AgentId& PeerRegistry::self() const noexcept { return self_; }
const RegistryConfig& PeerRegistry::config() const noexcept { return config_; }

void PeerRegistry::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void PeerRegistry::emit_event(EventType type, const std::string& message,
                              const std::optional<AgentId>& agent,
                              std::optional<std::size_t> bytes) {
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
    if (agent.has_value()) {
        event.agent = agent->qualified_name();
    }
    event.bytes = bytes;
    monitor->on_event(event);
}

} // namespace orbitguard
