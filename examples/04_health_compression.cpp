// 04_health_compression.cpp
//
// Demonstrates the three-stage health codec.
//
// A satellite streams thirty slowly drifting health summaries through
// one StateCompressor; a second instance plays the receiving peer.
// The example prints per-stage sizes for the first messages and the
// overall savings against the raw 140 byte record.

#include <orbitguard/orbitguard.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>

using namespace orbitguard;

namespace {

HealthSummary drifting_health(int t) {
    Signature sig;
    for (std::size_t i = 0; i < sig.size(); ++i) {
        sig[i] = 0.1F * static_cast<float>(i % 8) / 8.0F + 0.002F * static_cast<float>(t);
    }
    return HealthSummary(sig, 0.1F + 0.01F * static_cast<float>(t), 1.0F);
}

} // anonymous namespace

int main() {
    std::cout << "=== OrbitGuard: Health Compression Example ===\n\n";

    StateCompressor sender;
    StateCompressor receiver;

    constexpr int kMessages = 30;
    std::size_t total_wire = 0;
    float worst_error = 0.0F;

    for (int t = 0; t < kMessages; ++t) {
        auto health = drifting_health(t);
        Bytes wire = sender.encode(health);
        total_wire += wire.size();

        auto decoded = receiver.decode(wire);
        if (!decoded.ok()) {
            std::cerr << "Decode failed: " << to_string(decoded.error) << " " << decoded.reason << "\n";
            return 1;
        }

        for (std::size_t i = 0; i < SIGNATURE_SIZE; ++i) {
            float err = std::fabs(decoded.summary->anomaly_signature()[i] -
                                  health.anomaly_signature()[i]);
            if (err > worst_error) worst_error = err;
        }

        if (t < 4) {
            const auto& s = *sender.last_stats();
            std::cout << "Message " << t << ": raw " << s.original_size
                      << " -> delta " << s.delta_size
                      << " -> quantized " << s.quantized_size
                      << " -> lz4 frame " << s.compressed_size
                      << " (wire " << wire.size() << " bytes)\n";
        }
    }

    std::size_t total_raw = StateCompressor::ORIGINAL_SIZE_HINT * kMessages;
    std::cout << "\n=== Totals over " << kMessages << " messages ===\n";
    std::cout << "Raw:      " << total_raw << " bytes\n";
    std::cout << "Wire:     " << total_wire << " bytes\n";
    std::cout << "Saved:    " << std::fixed << std::setprecision(1)
              << StateCompressor::compression_ratio(total_raw, total_wire) << "%\n";
    std::cout << "Max error " << std::setprecision(4) << worst_error << " (step "
              << 2.0F / 255.0F << ")\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
