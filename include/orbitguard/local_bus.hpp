#pragma once

#include "orbitguard/agent_id.hpp"
#include "orbitguard/message_bus.hpp"
#include "orbitguard/types.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace orbitguard {

class LocalBus;

// In-process link shared by several agents (tests, demos, ground simulation).
// Delivery is synchronous on the publisher's thread; no lock is held while
// subscriber callbacks run, so callbacks may publish again.
// Unsubscribing blocks until deliveries already running on other threads have
// returned, so a subscriber may be destroyed right after unsubscribe().
// A callback may unsubscribe itself.
class LocalBusHub {
public:
    static constexpr std::size_t MAX_PAYLOAD_BYTES = 10240;  // ISL frame limit

    LocalBusHub() = default;

    // Non-copyable
    LocalBusHub(const LocalBusHub&) = delete;
    LocalBusHub& operator=(const LocalBusHub&) = delete;

    // Endpoint for one agent. The hub must outlive every endpoint.
    std::unique_ptr<LocalBus> connect(const AgentId& agent);

    std::uint64_t total_published() const noexcept;
    std::uint64_t total_delivered() const noexcept;

private:
    friend class LocalBus;

    struct Subscription {
        SubscriptionId id;
        std::string filter;
        AgentId owner;
        MessageCallback callback;
        std::size_t in_flight{0};  // callbacks currently running
    };

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::shared_ptr<Subscription>> subscriptions_;
    std::unordered_map<AgentId, bool> online_;
    SubscriptionId next_id_{1};
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> delivered_{0};

    bool deliver(const BusMessage& message);
    SubscriptionId add_subscription(const AgentId& owner, std::string filter, MessageCallback cb);
    void remove_subscription(SubscriptionId id);
    void remove_agent(const AgentId& agent);
    void wait_idle(std::unique_lock<std::mutex>& lock,
                   const std::vector<std::shared_ptr<Subscription>>& removed);
    void set_online(const AgentId& agent, bool online);
    bool is_online(const AgentId& agent) const;
};

// One agent's view of a LocalBusHub
class LocalBus : public MessageBus {
public:
    LocalBus(LocalBusHub& hub, AgentId agent);
    ~LocalBus() override;

    LocalBus(const LocalBus&) = delete;
    LocalBus& operator=(const LocalBus&) = delete;

    bool publish(const std::string& topic,
                 const Bytes& payload,
                 DeliveryQuality quality,
                 const std::optional<AgentId>& receiver = std::nullopt) override;

    SubscriptionId subscribe(const std::string& topic_filter, MessageCallback callback) override;
    void unsubscribe(SubscriptionId id) override;

    // Simulated link loss: an offline endpoint can neither send nor receive
    void set_online(bool online);
    bool is_online() const;

    const AgentId& agent() const noexcept;
    std::uint64_t published_count() const noexcept;
    std::uint64_t rejected_count() const noexcept;

private:
    LocalBusHub& hub_;
    AgentId agent_;
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace orbitguard
