#pragma once

#include "orbitguard/health_summary.hpp"
#include "orbitguard/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace orbitguard {

enum class DecodeError {
    None,
    TruncatedHeader,     // fewer than MIN_MESSAGE_SIZE bytes
    UnsupportedVersion,  // version byte != WIRE_VERSION
    EntropyStageFailed,  // payload is not a complete LZ4 frame
    MalformedPayload,    // payload is not a quantized health record
    InvalidFields        // decoded values violate HealthSummary bounds
};

const char* to_string(DecodeError e);

struct DecodeResult {
    std::optional<HealthSummary> summary;
    DecodeError error{DecodeError::None};
    std::string reason;  // Human-readable explanation (if failed)

    bool ok() const noexcept { return summary.has_value(); }
};

// Per-stage sizes of the most recent encode
struct CompressionStats {
    std::size_t original_size{0};    // raw record size hint
    std::size_t delta_size{0};       // stage 1 output
    std::size_t quantized_size{0};   // stage 2 output
    std::size_t compressed_size{0};  // stage 3 output (payload, no header)
    double compression_ratio{0.0};   // 1 - compressed / delta
};

// Three-stage codec for HealthSummary (delta, 8-bit quantization, LZ4 frame).
//
// Wire layout: [version:u8][flags:u8][original_size:u16 LE][payload]
//   flags bit 0 = entropy stage applied
//
// One instance serves one stream: it remembers the previous signature for
// delta coding, so use one encoder per outbound stream and one decoder per
// inbound peer. Instances are copyable, which lets a sender encode on a copy
// and commit the new reference only once the message actually left.
class StateCompressor {
public:
    static constexpr std::uint8_t WIRE_VERSION = 1;
    static constexpr std::uint8_t FLAG_ENTROPY = 0x01;
    static constexpr std::size_t HEADER_SIZE = 4;
    static constexpr std::size_t MIN_MESSAGE_SIZE = 6;
    static constexpr std::uint16_t ORIGINAL_SIZE_HINT = 140;  // 3 scalars + 32 float32
    static constexpr std::size_t QUANTIZED_SIZE = 8 + SIGNATURE_SIZE;
    static constexpr std::size_t DEFAULT_MAX_PAYLOAD = 1024;

    explicit StateCompressor(bool entropy_enabled = true,
                             std::size_t max_payload_bytes = DEFAULT_MAX_PAYLOAD);

    // Throws CompressionException if LZ4 compression fails and
    // PayloadTooLargeException if the result exceeds max_payload_bytes
    Bytes encode(const HealthSummary& summary);

    // Never throws for malformed input; the previous-signature reference is
    // only advanced on success. The result is stamped with receipt_time.
    DecodeResult decode(const Bytes& data, WallTime receipt_time = WallClock::now());

    // Forget the delta reference (next message is absolute)
    void reset() noexcept;

    bool has_reference() const noexcept;
    bool entropy_enabled() const noexcept;
    const std::optional<CompressionStats>& last_stats() const noexcept;

    // Percentage saved, e.g. 4200 -> 630 gives 85.0
    static double compression_ratio(std::size_t original_size, std::size_t compressed_size);

    // Quantization map shared by both directions
    static std::uint8_t quantize(float value) noexcept;
    static float dequantize(std::uint8_t value) noexcept;

private:
    bool entropy_enabled_;
    std::size_t max_payload_bytes_;
    std::optional<Signature> previous_;
    std::optional<CompressionStats> stats_;
};

} // namespace orbitguard
