#pragma once

#include "orbitguard/types.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace orbitguard {

using Signature = std::array<float, SIGNATURE_SIZE>;

// Bounded health snapshot exchanged over the inter-satellite link.
// Every bound is checked at construction; nothing is clamped.
class HealthSummary {
public:
    static constexpr float MAX_RISK_SCORE = 1.0F;
    static constexpr float MAX_RECURRENCE_SCORE = 10.0F;
    static constexpr std::size_t MAX_COMPRESSED_SIZE = 1024;

    // Throws InvalidHealthSummaryException if the signature is not
    // SIGNATURE_SIZE long or any field is out of bounds / non-finite
    HealthSummary(const std::vector<float>& anomaly_signature,
                  float risk_score,
                  float recurrence_score,
                  WallTime timestamp = WallClock::now(),
                  std::size_t compressed_size = 0);

    HealthSummary(const Signature& anomaly_signature,
                  float risk_score,
                  float recurrence_score,
                  WallTime timestamp = WallClock::now(),
                  std::size_t compressed_size = 0);

    // All-zero signature and scores
    static HealthSummary nominal(WallTime timestamp = WallClock::now());

    const Signature& anomaly_signature() const noexcept;
    float risk_score() const noexcept;
    float recurrence_score() const noexcept;
    WallTime timestamp() const noexcept;
    std::size_t compressed_size() const noexcept;

    void set_timestamp(WallTime timestamp) noexcept;
    void set_compressed_size(std::size_t size);

private:
    Signature signature_{};
    float risk_score_;
    float recurrence_score_;
    WallTime timestamp_;
    std::size_t compressed_size_;

    void validate() const;
};

} // namespace orbitguard
