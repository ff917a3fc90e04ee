#include "orbitguard/token_bucket.hpp"

#include <algorithm>

namespace orbitguard {

TokenBucket::TokenBucket(double rate, double burst, Timestamp now)
    : rate_(rate)
    , burst_(burst)
    , tokens_(burst)
    , last_refill_(now)
{}

void TokenBucket::refill(Timestamp now) {
    if (now <= last_refill_) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(burst_, tokens_ + elapsed * rate_);
    last_refill_ = now;
}

bool TokenBucket::acquire(double amount) {
    return acquire(amount, Clock::now());
}

bool TokenBucket::acquire(double amount, Timestamp now) {
    refill(now);
    if (tokens_ >= amount) {
        tokens_ -= amount;
        return true;
    }
    return false;
}

void TokenBucket::refund(double amount) noexcept {
    tokens_ = std::min(burst_, tokens_ + amount);
}

void TokenBucket::set_limits(double rate, double burst) {
    set_limits(rate, burst, Clock::now());
}

void TokenBucket::set_limits(double rate, double burst, Timestamp now) {
    refill(now);
    rate_ = rate;
    burst_ = burst;
    tokens_ = std::min(tokens_, burst_);
}

double TokenBucket::utilization() {
    return utilization(Clock::now());
}

double TokenBucket::utilization(Timestamp now) {
    refill(now);
    if (burst_ <= 0.0) {
        return 1.0;
    }
    return std::max(0.0, std::min(1.0, 1.0 - tokens_ / burst_));
}

double TokenBucket::tokens_available() {
    return tokens_available(Clock::now());
}

double TokenBucket::tokens_available(Timestamp now) {
    refill(now);
    return tokens_;
}

double TokenBucket::rate() const noexcept { return rate_; }
double TokenBucket::burst() const noexcept { return burst_; }

} // namespace orbitguard
