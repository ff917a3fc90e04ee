#include "orbitguard/local_bus.hpp"

#include <algorithm>

namespace orbitguard {

namespace {

std::vector<std::string> split_levels(const std::string& s) {
    std::vector<std::string> levels;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find('/', start);
        if (pos == std::string::npos) {
            levels.push_back(s.substr(start));
            break;
        }
        levels.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return levels;
}

// Subscriptions whose callbacks are running on this thread, innermost last
thread_local std::vector<SubscriptionId> t_delivering;

std::size_t delivering_here(SubscriptionId id) {
    return static_cast<std::size_t>(std::count(t_delivering.begin(), t_delivering.end(), id));
}

} // anonymous namespace

bool topic_matches(const std::string& filter, const std::string& topic) {
    auto f = split_levels(filter);
    auto t = split_levels(topic);

    for (std::size_t i = 0; i < f.size(); ++i) {
        if (f[i] == "#") {
            return i == f.size() - 1;
        }
        if (i >= t.size()) {
            return false;
        }
        if (f[i] != "+" && f[i] != t[i]) {
            return false;
        }
    }
    return f.size() == t.size();
}

// ========== LocalBusHub ==========

std::unique_ptr<LocalBus> LocalBusHub::connect(const AgentId& agent) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        online_[agent] = true;
    }
    return std::make_unique<LocalBus>(*this, agent);
}

std::uint64_t LocalBusHub::total_published() const noexcept { return published_.load(); }
std::uint64_t LocalBusHub::total_delivered() const noexcept { return delivered_.load(); }

bool LocalBusHub::deliver(const BusMessage& message) {
    std::vector<std::shared_ptr<Subscription>> targets;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sender = online_.find(message.sender);
        if (sender == online_.end() || !sender->second) {
            return false;
        }

        if (message.receiver.has_value()) {
            auto receiver = online_.find(*message.receiver);
            bool reachable = receiver != online_.end() && receiver->second;
            if (!reachable && message.quality == DeliveryQuality::AtLeastOnce) {
                return false;
            }
        }

        for (const auto& sub : subscriptions_) {
            if (sub->owner == message.sender) continue;
            if (message.receiver.has_value() && sub->owner != *message.receiver) continue;
            auto it = online_.find(sub->owner);
            if (it == online_.end() || !it->second) continue;
            if (!topic_matches(sub->filter, message.topic)) continue;
            targets.push_back(sub);
        }
    }

    published_++;

    // Outside the lock: subscribers may publish in turn
    for (const auto& sub : targets) {
        struct Release {
            LocalBusHub& hub;
            Subscription& sub;
            ~Release() {
                t_delivering.pop_back();
                {
                    std::lock_guard<std::mutex> lock(hub.mutex_);
                    sub.in_flight--;
                }
                hub.idle_.notify_all();
            }
        };

        {
            // Skip subscriptions removed since the targets were collected;
            // the in-flight count only covers calls that actually start
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::find(subscriptions_.begin(), subscriptions_.end(), sub) == subscriptions_.end()) {
                continue;
            }
            sub->in_flight++;
        }
        t_delivering.push_back(sub->id);
        Release release{*this, *sub};
        sub->callback(message);
        delivered_++;
    }
    return true;
}

SubscriptionId LocalBusHub::add_subscription(const AgentId& owner, std::string filter,
                                             MessageCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscriptions_.push_back(std::make_shared<Subscription>(
        Subscription{id, std::move(filter), owner, std::move(cb), 0}));
    return id;
}

void LocalBusHub::remove_subscription(SubscriptionId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto split = std::stable_partition(
        subscriptions_.begin(), subscriptions_.end(),
        [id](const std::shared_ptr<Subscription>& s) { return s->id != id; });
    std::vector<std::shared_ptr<Subscription>> removed(split, subscriptions_.end());
    subscriptions_.erase(split, subscriptions_.end());
    wait_idle(lock, removed);
}

void LocalBusHub::remove_agent(const AgentId& agent) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto split = std::stable_partition(
        subscriptions_.begin(), subscriptions_.end(),
        [&agent](const std::shared_ptr<Subscription>& s) { return s->owner != agent; });
    std::vector<std::shared_ptr<Subscription>> removed(split, subscriptions_.end());
    subscriptions_.erase(split, subscriptions_.end());
    online_.erase(agent);
    wait_idle(lock, removed);
}

void LocalBusHub::wait_idle(std::unique_lock<std::mutex>& lock,
                            const std::vector<std::shared_ptr<Subscription>>& removed) {
    // Deliveries on this thread (a callback removing itself) cannot finish
    // while we wait, so they are not waited for
    idle_.wait(lock, [&removed] {
        return std::all_of(removed.begin(), removed.end(),
                           [](const std::shared_ptr<Subscription>& s) {
                               return s->in_flight <= delivering_here(s->id);
                           });
    });
}

void LocalBusHub::set_online(const AgentId& agent, bool online) {
    std::lock_guard<std::mutex> lock(mutex_);
    online_[agent] = online;
}

bool LocalBusHub::is_online(const AgentId& agent) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = online_.find(agent);
    return it != online_.end() && it->second;
}

// ========== LocalBus ==========

LocalBus::LocalBus(LocalBusHub& hub, AgentId agent)
    : hub_(hub)
    , agent_(std::move(agent))
{}

LocalBus::~LocalBus() {
    hub_.remove_agent(agent_);
}

bool LocalBus::publish(const std::string& topic,
                       const Bytes& payload,
                       DeliveryQuality quality,
                       const std::optional<AgentId>& receiver) {
    if (topic.empty() || payload.size() > LocalBusHub::MAX_PAYLOAD_BYTES) {
        rejected_++;
        return false;
    }

    BusMessage message{topic, payload, agent_, quality, receiver};
    if (!hub_.deliver(message)) {
        rejected_++;
        return false;
    }
    published_++;
    return true;
}

SubscriptionId LocalBus::subscribe(const std::string& topic_filter, MessageCallback callback) {
    return hub_.add_subscription(agent_, topic_filter, std::move(callback));
}

void LocalBus::unsubscribe(SubscriptionId id) {
    hub_.remove_subscription(id);
}

void LocalBus::set_online(bool online) {
    hub_.set_online(agent_, online);
}

bool LocalBus::is_online() const {
    return hub_.is_online(agent_);
}

const AgentId& LocalBus::agent() const noexcept { return agent_; }
std::uint64_t LocalBus::published_count() const noexcept { return published_.load(); }
std::uint64_t LocalBus::rejected_count() const noexcept { return rejected_.load(); }

} // namespace orbitguard
