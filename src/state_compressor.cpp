#include "orbitguard/state_compressor.hpp"
#include "orbitguard/exceptions.hpp"

#include <lz4frame.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <memory>

namespace orbitguard {

namespace {

constexpr float kMinValue = -1.0F;
constexpr float kMaxValue = 1.0F;
constexpr std::size_t kDeltaSize = 8 + SIGNATURE_SIZE * 4;
constexpr int kFrameCompressionLevel = 12;

struct DecompressionContextDeleter {
    void operator()(LZ4F_dctx* ctx) const noexcept { LZ4F_freeDecompressionContext(ctx); }
};
using DecompressionContext = std::unique_ptr<LZ4F_dctx, DecompressionContextDeleter>;

void put_f32(Bytes& out, float value) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::uint8_t>((bits >> shift) & 0xFF));
    }
}

float get_f32(const Bytes& in, std::size_t offset) {
    std::uint32_t bits = 0;
    for (int i = 3; i >= 0; --i) {
        bits = (bits << 8) | in[offset + static_cast<std::size_t>(i)];
    }
    float value = 0.0F;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

DecodeResult failure(DecodeError error, std::string reason) {
    DecodeResult result;
    result.error = error;
    result.reason = std::move(reason);
    return result;
}

} // anonymous namespace

const char* to_string(DecodeError e) {
    switch (e) {
        case DecodeError::None:               return "None";
        case DecodeError::TruncatedHeader:    return "TruncatedHeader";
        case DecodeError::UnsupportedVersion: return "UnsupportedVersion";
        case DecodeError::EntropyStageFailed: return "EntropyStageFailed";
        case DecodeError::MalformedPayload:   return "MalformedPayload";
        case DecodeError::InvalidFields:      return "InvalidFields";
    }
    return "Unknown";
}

StateCompressor::StateCompressor(bool entropy_enabled, std::size_t max_payload_bytes)
    : entropy_enabled_(entropy_enabled)
    , max_payload_bytes_(max_payload_bytes)
{}

std::uint8_t StateCompressor::quantize(float value) noexcept {
    float clamped = std::max(kMinValue, std::min(kMaxValue, value));
    float normalized = (clamped - kMinValue) / (kMaxValue - kMinValue);
    return static_cast<std::uint8_t>(std::lround(normalized * 255.0F));
}

float StateCompressor::dequantize(std::uint8_t value) noexcept {
    float normalized = static_cast<float>(value) / 255.0F;
    return kMinValue + normalized * (kMaxValue - kMinValue);
}

Bytes StateCompressor::encode(const HealthSummary& summary) {
    const auto& signature = summary.anomaly_signature();

    // Stage 1: delta against the previous signature of this stream
    Bytes delta;
    delta.reserve(kDeltaSize);
    put_f32(delta, summary.risk_score());
    put_f32(delta, summary.recurrence_score());
    for (std::size_t i = 0; i < SIGNATURE_SIZE; ++i) {
        float value = previous_ ? signature[i] - (*previous_)[i] : signature[i];
        put_f32(delta, value);
    }

    // Stage 2: scalars stay float32, signature goes to one byte per value
    Bytes quantized(delta.begin(), delta.begin() + 8);
    quantized.reserve(QUANTIZED_SIZE);
    for (std::size_t offset = 8; offset < delta.size(); offset += 4) {
        quantized.push_back(quantize(get_f32(delta, offset)));
    }

    // Stage 3: single LZ4 frame, no checksums, no stored content size
    Bytes payload;
    if (entropy_enabled_) {
        LZ4F_preferences_t prefs;
        std::memset(&prefs, 0, sizeof(prefs));
        prefs.compressionLevel = kFrameCompressionLevel;

        payload.resize(LZ4F_compressFrameBound(quantized.size(), &prefs));
        std::size_t written = LZ4F_compressFrame(payload.data(), payload.size(),
                                                 quantized.data(), quantized.size(), &prefs);
        if (LZ4F_isError(written)) {
            throw CompressionException(std::string("LZ4 frame compression failed: ") +
                                       LZ4F_getErrorName(written));
        }
        payload.resize(written);
    } else {
        payload = quantized;
    }

    Bytes out;
    out.reserve(HEADER_SIZE + payload.size());
    out.push_back(WIRE_VERSION);
    out.push_back(entropy_enabled_ ? FLAG_ENTROPY : 0x00);
    out.push_back(static_cast<std::uint8_t>(ORIGINAL_SIZE_HINT & 0xFF));
    out.push_back(static_cast<std::uint8_t>((ORIGINAL_SIZE_HINT >> 8) & 0xFF));
    out.insert(out.end(), payload.begin(), payload.end());

    if (out.size() > max_payload_bytes_) {
        throw PayloadTooLargeException(out.size(), max_payload_bytes_);
    }

    previous_ = signature;

    CompressionStats stats;
    stats.original_size = ORIGINAL_SIZE_HINT;
    stats.delta_size = delta.size();
    stats.quantized_size = quantized.size();
    stats.compressed_size = payload.size();
    stats.compression_ratio =
        1.0 - static_cast<double>(payload.size()) / static_cast<double>(delta.size());
    stats_ = stats;

    return out;
}

DecodeResult StateCompressor::decode(const Bytes& data, WallTime receipt_time) {
    if (data.size() < MIN_MESSAGE_SIZE) {
        return failure(DecodeError::TruncatedHeader,
                       "Data too short for header: " + std::to_string(data.size()) + " bytes");
    }

    std::uint8_t version = data[0];
    std::uint8_t flags = data[1];
    if (version != WIRE_VERSION) {
        return failure(DecodeError::UnsupportedVersion,
                       "Unsupported compression version: " + std::to_string(version));
    }

    Bytes quantized;
    if (flags & FLAG_ENTROPY) {
        LZ4F_dctx* raw_ctx = nullptr;
        std::size_t rc = LZ4F_createDecompressionContext(&raw_ctx, LZ4F_VERSION);
        if (LZ4F_isError(rc)) {
            return failure(DecodeError::EntropyStageFailed,
                           std::string("LZ4 context: ") + LZ4F_getErrorName(rc));
        }
        DecompressionContext ctx(raw_ctx);

        // Room for more than one record, so an oversized frame shows up as
        // a size mismatch below rather than as a truncated frame
        quantized.resize(QUANTIZED_SIZE * 4);
        const std::uint8_t* src = data.data() + HEADER_SIZE;
        std::size_t src_left = data.size() - HEADER_SIZE;
        std::size_t produced = 0;
        std::size_t hint = 1;

        while (src_left > 0 && hint != 0) {
            std::size_t dst_size = quantized.size() - produced;
            std::size_t src_size = src_left;
            hint = LZ4F_decompress(ctx.get(), quantized.data() + produced, &dst_size,
                                   src, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                return failure(DecodeError::EntropyStageFailed,
                               std::string("LZ4 frame rejected: ") + LZ4F_getErrorName(hint));
            }
            produced += dst_size;
            src += src_size;
            src_left -= src_size;
            if (dst_size == 0 && src_size == 0) {
                break;
            }
        }
        if (hint != 0) {
            return failure(DecodeError::EntropyStageFailed, "LZ4 frame is incomplete");
        }
        quantized.resize(produced);
    } else {
        quantized.assign(data.begin() + HEADER_SIZE, data.end());
    }

    if (quantized.size() != QUANTIZED_SIZE) {
        return failure(DecodeError::MalformedPayload,
                       "Expected " + std::to_string(QUANTIZED_SIZE) +
                       " quantized bytes, got " + std::to_string(quantized.size()));
    }

    float risk_score = get_f32(quantized, 0);
    float recurrence_score = get_f32(quantized, 4);

    Signature signature{};
    for (std::size_t i = 0; i < SIGNATURE_SIZE; ++i) {
        float delta = dequantize(quantized[8 + i]);
        signature[i] = previous_ ? (*previous_)[i] + delta : delta;
    }

    try {
        DecodeResult result;
        result.summary.emplace(signature, risk_score, recurrence_score,
                               receipt_time, data.size());
        previous_ = signature;
        return result;
    } catch (const InvalidHealthSummaryException& e) {
        return failure(DecodeError::InvalidFields, e.what());
    }
}

void StateCompressor::reset() noexcept {
    previous_.reset();
}

bool StateCompressor::has_reference() const noexcept {
    return previous_.has_value();
}

bool StateCompressor::entropy_enabled() const noexcept {
    return entropy_enabled_;
}

const std::optional<CompressionStats>& StateCompressor::last_stats() const noexcept {
    return stats_;
}

double StateCompressor::compression_ratio(std::size_t original_size, std::size_t compressed_size) {
    if (original_size == 0) {
        return 0.0;
    }
    return 100.0 * (1.0 - static_cast<double>(compressed_size) /
                          static_cast<double>(original_size));
}

} // namespace orbitguard
