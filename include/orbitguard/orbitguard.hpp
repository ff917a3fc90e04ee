#pragma once

// OrbitGuard: coordination layer for autonomous satellite constellations
//
// Gossip discovery and liveness, priority-aware bandwidth admission,
// compact health encoding and a pre-execution safety gate for
// constellation-wide actions.

// Core
#include "orbitguard/types.hpp"
#include "orbitguard/exceptions.hpp"
#include "orbitguard/config.hpp"
#include "orbitguard/crypto.hpp"
#include "orbitguard/agent_id.hpp"
#include "orbitguard/health_summary.hpp"
#include "orbitguard/swarm_config.hpp"
#include "orbitguard/monitor.hpp"

// Transport
#include "orbitguard/message_bus.hpp"
#include "orbitguard/local_bus.hpp"
#include "orbitguard/periodic_task.hpp"

// Coordination subsystems
#include "orbitguard/state_compressor.hpp"
#include "orbitguard/token_bucket.hpp"
#include "orbitguard/bandwidth_governor.hpp"
#include "orbitguard/peer_registry.hpp"
#include "orbitguard/health_broadcaster.hpp"
#include "orbitguard/safety_simulator.hpp"

// Composition root
#include "orbitguard/swarm_agent.hpp"
