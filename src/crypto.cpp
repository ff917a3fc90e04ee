#include "orbitguard/crypto.hpp"
#include "orbitguard/exceptions.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace orbitguard::crypto {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <std::size_t N>
std::array<std::uint8_t, N> digest(const EVP_MD* md, const void* data, std::size_t size) {
    std::array<std::uint8_t, N> out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data, size, out.data(), &out_len, md, nullptr) != 1 || out_len != N) {
        throw OrbitGuardException("EVP_Digest failed");
    }
    return out;
}

} // anonymous namespace

Sha1Digest sha1(const Bytes& data) {
    return digest<20>(EVP_sha1(), data.data(), data.size());
}

Sha256Digest sha256(const std::string& data) {
    return digest<32>(EVP_sha256(), data.data(), data.size());
}

Sha256Digest hmac_sha256(const Bytes& key, const std::string& message) {
    Sha256Digest out{};
    unsigned int out_len = 0;
    const auto* result = HMAC(EVP_sha256(),
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(message.data()),
                              message.size(),
                              out.data(), &out_len);
    if (result == nullptr || out_len != out.size()) {
        throw OrbitGuardException("HMAC-SHA256 computation failed");
    }
    return out;
}

std::string hex_encode(const std::uint8_t* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

std::optional<Bytes> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace orbitguard::crypto
