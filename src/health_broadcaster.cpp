#include "orbitguard/health_broadcaster.hpp"
#include "orbitguard/crypto.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace orbitguard {

namespace {

constexpr std::size_t kAgentIdHexLength = 32;
constexpr std::size_t kSignatureHexLength = 64;

const char* const kEnvelopeFields[] = {
    "agent_id", "constellation", "compressed_health", "timestamp", "signature"
};

bool is_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

std::optional<std::string> check_format(const HealthEnvelope& env) {
    if (env.agent_id.size() != kAgentIdHexLength || !is_hex(env.agent_id)) {
        return std::string("agent_id must be 32 hex digits");
    }
    if (env.constellation != SUPPORTED_CONSTELLATION) {
        return "unsupported constellation '" + env.constellation + "'";
    }
    if (env.compressed_health.empty() || env.compressed_health.size() % 2 != 0 ||
        !is_hex(env.compressed_health)) {
        return std::string("compressed_health must be non-empty even-length hex");
    }
    if (env.signature.size() != kSignatureHexLength || !is_hex(env.signature)) {
        return std::string("signature must be 64 hex digits");
    }
    if (env.timestamp.empty()) {
        return std::string("timestamp must not be empty");
    }
    return std::nullopt;
}

} // anonymous namespace

// ========== HealthEnvelope ==========

std::string HealthEnvelope::signing_input() const {
    return agent_id + ":" + constellation + ":" + compressed_health + ":" + timestamp;
}

std::string HealthEnvelope::to_json() const {
    nlohmann::json j;
    j["agent_id"] = agent_id;
    j["constellation"] = constellation;
    j["compressed_health"] = compressed_health;
    j["timestamp"] = timestamp;
    j["signature"] = signature;
    return j.dump();
}

std::optional<HealthEnvelope> HealthEnvelope::from_json(const std::string& text,
                                                        bool strict,
                                                        std::string* error) {
    auto fail = [error](std::string reason) -> std::optional<HealthEnvelope> {
        if (error != nullptr) {
            *error = std::move(reason);
        }
        return std::nullopt;
    };

    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return fail("envelope is not valid JSON");
    }
    if (!j.is_object()) {
        return fail("envelope is not a JSON object");
    }
    for (const char* field : kEnvelopeFields) {
        auto it = j.find(field);
        if (it == j.end()) {
            return fail(std::string("missing field '") + field + "'");
        }
        if (!it->is_string()) {
            return fail(std::string("field '") + field + "' must be a string");
        }
    }

    HealthEnvelope env;
    env.agent_id = j["agent_id"].get<std::string>();
    env.constellation = j["constellation"].get<std::string>();
    env.compressed_health = j["compressed_health"].get<std::string>();
    env.timestamp = j["timestamp"].get<std::string>();
    env.signature = j["signature"].get<std::string>();

    if (strict) {
        if (auto reason = check_format(env)) {
            return fail(*reason);
        }
    }
    return env;
}

std::string format_iso8601(WallTime t) {
    auto since_epoch = t.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs).count();
    if (micros < 0) {
        secs -= std::chrono::seconds(1);
        micros += 1000000;
    }

    std::time_t tt = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return out.str();
}

// ========== HealthBroadcaster ==========

HealthBroadcaster::HealthBroadcaster(const SwarmConfig& config,
                                     PeerRegistry& registry,
                                     MessageBus& bus,
                                     StateCompressor& compressor,
                                     BroadcastConfig broadcast_config,
                                     BandwidthGovernor* governor,
                                     std::optional<Bytes> signing_key)
    : self_(config.agent_id())
    , registry_(registry)
    , bus_(bus)
    , compressor_(compressor)
    , config_(std::move(broadcast_config))
    , governor_(governor)
    , key_(signing_key.has_value() ? std::move(*signing_key) : derive_key(config.agent_id()))
    , current_interval_(config_.base_interval)
{
    metrics_.current_interval = current_interval_;
}

HealthBroadcaster::~HealthBroadcaster() {
    stop();
}

void HealthBroadcaster::start() {
    task_.start(
        Duration::zero(),
        [this] {
            adjust_interval(get_congestion_level());
            broadcast_once();
            return current_interval();
        },
        [this](const std::string& error) { emit_event(EventType::TaskError, error); },
        config_.base_interval);
}

void HealthBroadcaster::stop() {
    task_.stop();
}

bool HealthBroadcaster::is_running() const noexcept {
    return task_.is_running();
}

Bytes HealthBroadcaster::derive_key(const AgentId& agent) {
    std::string material = agent.constellation() + ":" + agent.satellite_serial();
    return Bytes(material.begin(), material.end());
}

std::string HealthBroadcaster::sign(const HealthEnvelope& envelope, const Bytes& key) {
    return crypto::hex_encode(crypto::hmac_sha256(key, envelope.signing_input()));
}

bool HealthBroadcaster::verify_signature(const HealthEnvelope& envelope, const Bytes& key) {
    return crypto::constant_time_equals(envelope.signature, sign(envelope, key));
}

std::string HealthBroadcaster::hash_health(const HealthSummary& health) {
    std::ostringstream data;
    data << std::setprecision(9) << health.risk_score() << ':' << health.recurrence_score() << ':';
    const auto& sig = health.anomaly_signature();
    // Only the leading components take part in change detection
    for (std::size_t i = 0; i < 8; ++i) {
        if (i > 0) data << ',';
        data << sig[i];
    }
    return crypto::hex_encode(crypto::sha256(data.str()));
}

std::string HealthBroadcaster::topic() const {
    return config_.topic_prefix + self_.constellation();
}

double HealthBroadcaster::get_congestion_level() const {
    if (governor_ != nullptr) {
        return governor_->get_global_utilization();
    }
    if (config_.max_queue_depth == 0) {
        return 0.0;
    }
    double depth = static_cast<double>(bus_.pending_messages());
    return std::min(1.0, depth / static_cast<double>(config_.max_queue_depth));
}

Duration HealthBroadcaster::adjust_interval(double congestion) {
    Duration next = config_.base_interval;
    if (congestion > config_.severe_threshold) {
        next = config_.severe_interval;
    } else if (congestion > config_.congestion_threshold) {
        next = config_.congested_interval;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.current_congestion_level = congestion;
        changed = next != current_interval_;
        current_interval_ = next;
        metrics_.current_interval = next;
    }

    if (changed) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(next).count();
        emit_event(EventType::BroadcastIntervalChanged,
                   "Broadcast interval now " + std::to_string(secs) + "s at congestion " +
                   std::to_string(congestion));
    }
    return next;
}

Duration HealthBroadcaster::current_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_interval_;
}

BroadcastOutcome HealthBroadcaster::broadcast_once() {
    std::lock_guard<std::mutex> tick(tick_mutex_);
    try {
        auto health = registry_.get_peer_health(self_);
        if (!health.has_value()) {
            health = HealthSummary::nominal();
        }

        std::string hash = hash_health(*health);
        bool unchanged = false;
        double congestion = 0.0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            unchanged = last_health_hash_.has_value() && *last_health_hash_ == hash;
            if (unchanged) {
                metrics_.skipped_broadcasts++;
            }
            congestion = metrics_.current_congestion_level;
        }
        if (unchanged) {
            emit_event(EventType::BroadcastSkipped, "Health unchanged since last broadcast");
            return BroadcastOutcome::Skipped;
        }

        // Broadcasts reach an open set of receivers, so every one is a
        // reference message. Encode on a copy; commit once the message left.
        StateCompressor candidate = compressor_;
        candidate.reset();
        Bytes wire = candidate.encode(*health);

        HealthEnvelope envelope;
        envelope.agent_id = self_.uuid_hex();
        envelope.constellation = self_.constellation();
        envelope.compressed_health = crypto::hex_encode(wire);
        envelope.timestamp = format_iso8601(WallClock::now());
        envelope.signature = sign(envelope, key_);

        std::string json = envelope.to_json();
        Bytes payload(json.begin(), json.end());

        if (governor_ != nullptr) {
            auto admission = governor_->acquire(self_, payload.size(), MessagePriority::Critical);
            if (!admission.admitted()) {
                record_result(false, 0.0);
                emit_event(EventType::BroadcastFailed,
                           "Broadcast not admitted: " + admission.reason, payload.size());
                return BroadcastOutcome::Throttled;
            }
        }

        auto quality = congestion > config_.severe_threshold
            ? DeliveryQuality::FireAndForget
            : DeliveryQuality::AtLeastOnce;

        auto start = Clock::now();
        bool ok = bus_.publish(topic(), payload, quality);
        double latency_us = std::chrono::duration<double, std::micro>(Clock::now() - start).count();

        if (!ok) {
            record_result(false, 0.0);
            emit_event(EventType::BroadcastFailed, "Bus rejected health broadcast", payload.size());
            return BroadcastOutcome::Failed;
        }

        compressor_ = candidate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_health_hash_ = hash;
        }
        record_result(true, latency_us / 1000.0);
        emit_event(EventType::BroadcastPublished,
                   "Health broadcast on " + topic() + " (" + to_string(quality) + ")",
                   payload.size(), latency_us);
        return BroadcastOutcome::Published;
    } catch (const std::exception& e) {
        record_result(false, 0.0);
        emit_event(EventType::BroadcastFailed, std::string("Broadcast failed: ") + e.what());
        return BroadcastOutcome::Failed;
    }
}

void HealthBroadcaster::record_result(bool success, double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.total_broadcasts++;
    if (success) {
        metrics_.successful_broadcasts++;
        auto count = static_cast<double>(metrics_.successful_broadcasts);
        metrics_.average_latency_ms =
            (metrics_.average_latency_ms * (count - 1.0) + latency_ms) / count;
    } else {
        metrics_.failed_broadcasts++;
    }
}

BroadcastMetrics HealthBroadcaster::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

double HealthBroadcaster::get_delivery_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto attempts = metrics_.successful_broadcasts + metrics_.failed_broadcasts;
    if (attempts == 0) {
        return 0.0;
    }
    return static_cast<double>(metrics_.successful_broadcasts) / static_cast<double>(attempts);
}

void HealthBroadcaster::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void HealthBroadcaster::emit_event(EventType type, const std::string& message,
                                   std::optional<std::size_t> bytes,
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
    event.agent = self_.qualified_name();
    event.bytes = bytes;
    event.duration_us = duration_us;
    monitor->on_event(event);
}

} // namespace orbitguard
