#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace orbitguard {

struct BusMessage {
    std::string topic;
    Bytes payload;
    AgentId sender;
    DeliveryQuality quality{DeliveryQuality::AtLeastOnce};
    std::optional<AgentId> receiver;  // unset = broadcast
};

using MessageCallback = std::function<void(const BusMessage&)>;

// MQTT-style filter match: '+' matches one level, '#' (last level) the rest
bool topic_matches(const std::string& filter, const std::string& topic);

// Abstract publish/subscribe transport between satellite agents.
// Implementations may invoke callbacks on any thread; callbacks must not
// assume they run on the publisher's thread.
class MessageBus {
public:
    virtual ~MessageBus() = default;

    // Returns false if the message could not be handed to the transport
    // (link down, payload over the link limit, invalid topic)
    virtual bool publish(const std::string& topic,
                         const Bytes& payload,
                         DeliveryQuality quality,
                         const std::optional<AgentId>& receiver = std::nullopt) = 0;

    virtual SubscriptionId subscribe(const std::string& topic_filter,
                                     MessageCallback callback) = 0;

    virtual void unsubscribe(SubscriptionId id) = 0;

    // Messages accepted but not yet delivered (0 for synchronous transports)
    virtual std::size_t pending_messages() const { return 0; }
};

} // namespace orbitguard
