#pragma once

#include "orbitguard/types.hpp"

namespace orbitguard {

// Classic token bucket: `rate` tokens (bytes) per second up to `burst`.
// Starts full and refills lazily on every access.
// Not synchronized; BandwidthGovernor serializes access.
class TokenBucket {
public:
    TokenBucket(double rate, double burst, Timestamp now = Clock::now());

    // Refill from elapsed time, then debit `amount` if enough tokens exist.
    // On failure the token count is left as refilled.
    bool acquire(double amount);
    bool acquire(double amount, Timestamp now);

    // Return tokens from a cancelled debit; never exceeds burst
    void refund(double amount) noexcept;

    // Resize in place: refill at the old rate, then clamp to the new burst.
    // Tokens already spent stay spent.
    void set_limits(double rate, double burst);
    void set_limits(double rate, double burst, Timestamp now);

    // 1 - tokens/burst, in [0, 1]
    double utilization();
    double utilization(Timestamp now);

    double tokens_available();
    double tokens_available(Timestamp now);

    double rate() const noexcept;
    double burst() const noexcept;

private:
    double rate_;
    double burst_;
    double tokens_;
    Timestamp last_refill_;

    void refill(Timestamp now);
};

} // namespace orbitguard
