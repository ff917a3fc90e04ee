#include "orbitguard/periodic_task.hpp"

#include <exception>

namespace orbitguard {

// ========== CancellationToken ==========

void CancellationToken::cancel() {
    cancelled_.store(true);
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

bool CancellationToken::is_cancelled() const noexcept {
    return cancelled_.load();
}

bool CancellationToken::wait_for(Duration d) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, d, [this] {
        return cancelled_.load();
    });
    return !cancelled_.load();
}

// ========== PeriodicTask ==========

PeriodicTask::PeriodicTask(std::string name)
    : name_(std::move(name)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start(Duration initial_delay, Body body,
                         ErrorHandler on_error, Duration error_delay) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }
    token_ = std::make_shared<CancellationToken>();
    running_.store(true);
    thread_ = std::thread(&PeriodicTask::run, this, token_, initial_delay,
                          std::move(body), std::move(on_error), error_delay);
}

void PeriodicTask::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (token_) {
        token_->cancel();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    token_.reset();
    running_.store(false);
}

bool PeriodicTask::is_running() const noexcept { return running_.load(); }
const std::string& PeriodicTask::name() const noexcept { return name_; }
std::uint64_t PeriodicTask::tick_count() const noexcept { return ticks_.load(); }

void PeriodicTask::run(std::shared_ptr<CancellationToken> token, Duration initial_delay, Body body,
                       ErrorHandler on_error, Duration error_delay) {
    Duration delay = initial_delay;

    while (token->wait_for(delay)) {
        try {
            delay = body();
        } catch (const std::exception& e) {
            if (on_error) {
                on_error(name_ + ": " + e.what());
            }
            delay = error_delay;
        }
        ticks_++;
    }
}

} // namespace orbitguard
