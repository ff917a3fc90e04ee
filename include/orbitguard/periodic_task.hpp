#pragma once

#include "orbitguard/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace orbitguard {

// Shared cancellation flag. Waiters wake as soon as cancel() is called.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const noexcept;

    // Sleeps for up to `d`; returns false if cancelled before or during the wait
    bool wait_for(Duration d);

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// Background loop on its own thread. The body runs once per tick and
// returns the delay before the next tick, so callers can adapt their period.
class PeriodicTask {
public:
    using Body = std::function<Duration()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    explicit PeriodicTask(std::string name);
    ~PeriodicTask();

    // Non-copyable
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // First tick after `initial_delay`. No-op if already running.
    // A std::exception escaping the body is reported to `on_error` and the
    // loop continues after `error_delay`.
    void start(Duration initial_delay, Body body,
               ErrorHandler on_error = nullptr,
               Duration error_delay = std::chrono::seconds(1));

    // Cancels the wait and joins. Idempotent; safe before start().
    void stop();

    bool is_running() const noexcept;
    const std::string& name() const noexcept;
    std::uint64_t tick_count() const noexcept;

private:
    std::string name_;
    std::shared_ptr<CancellationToken> token_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
    std::mutex lifecycle_mutex_;

    void run(std::shared_ptr<CancellationToken> token, Duration initial_delay, Body body,
             ErrorHandler on_error, Duration error_delay);
};

} // namespace orbitguard
