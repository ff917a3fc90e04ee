#pragma once

#include "orbitguard/types.hpp"
#include <array>
#include <optional>
#include <string>

namespace orbitguard::crypto {

using Sha1Digest = std::array<std::uint8_t, 20>;
using Sha256Digest = std::array<std::uint8_t, 32>;

Sha1Digest sha1(const Bytes& data);
Sha256Digest sha256(const std::string& data);

// HMAC-SHA256 of message under key
Sha256Digest hmac_sha256(const Bytes& key, const std::string& message);

// Lowercase hex rendering
std::string hex_encode(const std::uint8_t* data, std::size_t size);
std::string hex_encode(const Bytes& data);

template <std::size_t N>
std::string hex_encode(const std::array<std::uint8_t, N>& data) {
    return hex_encode(data.data(), data.size());
}

// Accepts upper or lower case. nullopt on odd length or a non-hex digit.
std::optional<Bytes> hex_decode(const std::string& hex);

// Constant-time comparison; false when sizes differ
bool constant_time_equals(const std::string& a, const std::string& b);

} // namespace orbitguard::crypto
