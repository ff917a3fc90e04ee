#include "orbitguard/swarm_config.hpp"
#include "orbitguard/exceptions.hpp"

#include <utility>

namespace orbitguard {

SwarmConfig::SwarmConfig(AgentId agent_id,
                         SatelliteRole role,
                         std::string constellation_id,
                         std::vector<AgentId> peers,
                         int bandwidth_limit_kbps)
    : agent_id_(std::move(agent_id))
    , role_(role)
    , constellation_id_(std::move(constellation_id))
    , peers_(std::move(peers))
    , bandwidth_limit_kbps_(bandwidth_limit_kbps)
{
    if (bandwidth_limit_kbps_ <= 0) {
        throw InvalidSwarmConfigException(
            "bandwidth_limit_kbps must be positive, got " +
            std::to_string(bandwidth_limit_kbps_));
    }
    if (constellation_id_ != agent_id_.constellation()) {
        throw InvalidSwarmConfigException(
            "constellation_id '" + constellation_id_ +
            "' must match agent_id.constellation '" + agent_id_.constellation() + "'");
    }
}

const AgentId& SwarmConfig::agent_id() const noexcept { return agent_id_; }
SatelliteRole SwarmConfig::role() const noexcept { return role_; }
const std::string& SwarmConfig::constellation_id() const noexcept { return constellation_id_; }
const std::vector<AgentId>& SwarmConfig::peers() const noexcept { return peers_; }
int SwarmConfig::bandwidth_limit_kbps() const noexcept { return bandwidth_limit_kbps_; }

void SwarmConfig::set_role(SatelliteRole role) noexcept {
    role_ = role;
}

} // namespace orbitguard
