#include "orbitguard/health_summary.hpp"
#include "orbitguard/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace orbitguard {

namespace {

Signature to_signature(const std::vector<float>& values) {
    if (values.size() != SIGNATURE_SIZE) {
        throw InvalidHealthSummaryException(
            "anomaly_signature must be " + std::to_string(SIGNATURE_SIZE) +
            "-dimensional, got " + std::to_string(values.size()));
    }
    Signature sig{};
    std::copy(values.begin(), values.end(), sig.begin());
    return sig;
}

} // anonymous namespace

HealthSummary::HealthSummary(const std::vector<float>& anomaly_signature,
                             float risk_score,
                             float recurrence_score,
                             WallTime timestamp,
                             std::size_t compressed_size)
    : HealthSummary(to_signature(anomaly_signature), risk_score, recurrence_score,
                    timestamp, compressed_size)
{}

HealthSummary::HealthSummary(const Signature& anomaly_signature,
                             float risk_score,
                             float recurrence_score,
                             WallTime timestamp,
                             std::size_t compressed_size)
    : signature_(anomaly_signature)
    , risk_score_(risk_score)
    , recurrence_score_(recurrence_score)
    , timestamp_(timestamp)
    , compressed_size_(compressed_size)
{
    validate();
}

HealthSummary HealthSummary::nominal(WallTime timestamp) {
    return HealthSummary(Signature{}, 0.0F, 0.0F, timestamp);
}

const Signature& HealthSummary::anomaly_signature() const noexcept { return signature_; }
float HealthSummary::risk_score() const noexcept { return risk_score_; }
float HealthSummary::recurrence_score() const noexcept { return recurrence_score_; }
WallTime HealthSummary::timestamp() const noexcept { return timestamp_; }
std::size_t HealthSummary::compressed_size() const noexcept { return compressed_size_; }

void HealthSummary::set_timestamp(WallTime timestamp) noexcept {
    timestamp_ = timestamp;
}

void HealthSummary::set_compressed_size(std::size_t size) {
    if (size > MAX_COMPRESSED_SIZE) {
        throw InvalidHealthSummaryException(
            "compressed_size exceeds 1KB limit: " + std::to_string(size) + " bytes");
    }
    compressed_size_ = size;
}

void HealthSummary::validate() const {
    for (std::size_t i = 0; i < signature_.size(); ++i) {
        if (!std::isfinite(signature_[i])) {
            throw InvalidHealthSummaryException(
                "anomaly_signature[" + std::to_string(i) + "] is not finite");
        }
    }
    if (!std::isfinite(risk_score_) || risk_score_ < 0.0F || risk_score_ > MAX_RISK_SCORE) {
        throw InvalidHealthSummaryException(
            "risk_score must be in [0.0, 1.0], got " + std::to_string(risk_score_));
    }
    if (!std::isfinite(recurrence_score_) || recurrence_score_ < 0.0F ||
        recurrence_score_ > MAX_RECURRENCE_SCORE) {
        throw InvalidHealthSummaryException(
            "recurrence_score must be in [0, 10], got " + std::to_string(recurrence_score_));
    }
    if (compressed_size_ > MAX_COMPRESSED_SIZE) {
        throw InvalidHealthSummaryException(
            "compressed_size exceeds 1KB limit: " + std::to_string(compressed_size_) + " bytes");
    }
}

} // namespace orbitguard
