#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/types.hpp"
#include <string>
#include <vector>

namespace orbitguard {

// Static per-agent configuration, created once at startup.
// Only the role changes afterwards (external role reassignment).
class SwarmConfig {
public:
    static constexpr int DEFAULT_BANDWIDTH_LIMIT_KBPS = 10;

    // Throws InvalidSwarmConfigException if constellation_id differs from
    // agent_id.constellation() or the bandwidth limit is not positive
    SwarmConfig(AgentId agent_id,
                SatelliteRole role,
                std::string constellation_id,
                std::vector<AgentId> peers = {},
                int bandwidth_limit_kbps = DEFAULT_BANDWIDTH_LIMIT_KBPS);

    const AgentId& agent_id() const noexcept;
    SatelliteRole role() const noexcept;
    const std::string& constellation_id() const noexcept;
    const std::vector<AgentId>& peers() const noexcept;
    int bandwidth_limit_kbps() const noexcept;

    void set_role(SatelliteRole role) noexcept;

private:
    AgentId agent_id_;
    SatelliteRole role_;
    std::string constellation_id_;
    std::vector<AgentId> peers_;
    int bandwidth_limit_kbps_;
};

} // namespace orbitguard
