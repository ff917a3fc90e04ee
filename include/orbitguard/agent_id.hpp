#pragma once

#include "orbitguard/types.hpp"
#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace orbitguard {

// 128-bit RFC 4122 identifier
using Uuid = std::array<std::uint8_t, 16>;

// Name-based (version 5, SHA-1) UUID in the DNS namespace
Uuid uuid5_dns(const std::string& name);

// Canonical 8-4-4-4-12 rendering
std::string uuid_to_string(const Uuid& uuid);

// Immutable identity of one satellite agent.
// The UUID is derived from "constellation:serial", so every process computes
// the same identifier for the same satellite.
class AgentId {
public:
    // Throws InvalidAgentIdException on an empty serial or unsupported tag
    AgentId(std::string constellation, std::string satellite_serial);

    static AgentId create(std::string constellation, std::string satellite_serial);

    // Inverse of qualified_name(): "constellation:serial"
    static AgentId parse(const std::string& qualified_name);

    const std::string& constellation() const noexcept;
    const std::string& satellite_serial() const noexcept;
    const Uuid& uuid() const noexcept;

    // "astra-v3.0:SAT-001-A"
    std::string qualified_name() const;

    // 32 lowercase hex digits, no dashes
    std::string uuid_hex() const;

    bool operator==(const AgentId& other) const noexcept;
    bool operator!=(const AgentId& other) const noexcept;

    // Orders by serial, then constellation (deterministic peer listings)
    bool operator<(const AgentId& other) const noexcept;

private:
    std::string constellation_;
    std::string satellite_serial_;
    Uuid uuid_{};
};

} // namespace orbitguard

namespace std {

template <>
struct hash<orbitguard::AgentId> {
    std::size_t operator()(const orbitguard::AgentId& id) const noexcept {
        // The UUID is already a uniformly distributed digest
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < id.uuid().size(); ++i) {
            h = (h << 8) | id.uuid()[i];
        }
        return h;
    }
};

} // namespace std
