#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace orbitguard {

// Raw wire bytes
using Bytes = std::vector<std::uint8_t>;

// Monotonic time for liveness, rate limiting and latency
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Wall-clock time carried by health snapshots and broadcast envelopes
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

using SubscriptionId = std::uint64_t;

// The only constellation tag this protocol version speaks
inline constexpr const char* SUPPORTED_CONSTELLATION = "astra-v3.0";

// Fixed dimensionality of the anomaly signature
inline constexpr std::size_t SIGNATURE_SIZE = 32;

// Operational role of a satellite agent
enum class SatelliteRole {
    Primary,
    Backup,
    Standby,
    SafeMode
};

// Bandwidth priority classes (health > intent > coordination)
enum class MessagePriority {
    Critical,
    High,
    Normal
};

// Global link congestion derived from bucket utilization
enum class CongestionLevel {
    Normal,     // < 70%
    Moderate,   // 70% .. 90%
    Throttled,  // 90% .. 100%
    Critical    // >= 100%
};

// Transport delivery guarantee requested by the publisher
enum class DeliveryQuality {
    FireAndForget,
    AtLeastOnce
};

// Action classes understood by the safety simulator
enum class ActionType {
    AttitudeAdjust,
    LoadShed,
    ThermalManeuver,
    SafeMode,
    RoleReassignment
};

inline const char* to_string(SatelliteRole r) {
    switch (r) {
        case SatelliteRole::Primary:  return "primary";
        case SatelliteRole::Backup:   return "backup";
        case SatelliteRole::Standby:  return "standby";
        case SatelliteRole::SafeMode: return "safe_mode";
    }
    return "unknown";
}

inline std::optional<SatelliteRole> role_from_string(const std::string& s) {
    if (s == "primary")   return SatelliteRole::Primary;
    if (s == "backup")    return SatelliteRole::Backup;
    if (s == "standby")   return SatelliteRole::Standby;
    if (s == "safe_mode") return SatelliteRole::SafeMode;
    return std::nullopt;
}

inline const char* to_string(MessagePriority p) {
    switch (p) {
        case MessagePriority::Critical: return "CRITICAL";
        case MessagePriority::High:     return "HIGH";
        case MessagePriority::Normal:   return "NORMAL";
    }
    return "UNKNOWN";
}

inline const char* to_string(CongestionLevel c) {
    switch (c) {
        case CongestionLevel::Normal:    return "NORMAL";
        case CongestionLevel::Moderate:  return "MODERATE";
        case CongestionLevel::Throttled: return "THROTTLED";
        case CongestionLevel::Critical:  return "CRITICAL";
    }
    return "UNKNOWN";
}

inline const char* to_string(DeliveryQuality q) {
    switch (q) {
        case DeliveryQuality::FireAndForget: return "FireAndForget";
        case DeliveryQuality::AtLeastOnce:   return "AtLeastOnce";
    }
    return "Unknown";
}

inline const char* to_string(ActionType a) {
    switch (a) {
        case ActionType::AttitudeAdjust:   return "attitude_adjust";
        case ActionType::LoadShed:         return "load_shed";
        case ActionType::ThermalManeuver:  return "thermal_maneuver";
        case ActionType::SafeMode:         return "safe_mode";
        case ActionType::RoleReassignment: return "role_reassignment";
    }
    return "unknown";
}

} // namespace orbitguard
