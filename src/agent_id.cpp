#include "orbitguard/agent_id.hpp"
#include "orbitguard/crypto.hpp"
#include "orbitguard/exceptions.hpp"

#include <algorithm>
#include <utility>

namespace orbitguard {

namespace {

// 6ba7b810-9dad-11d1-80b4-00c04fd430c8
constexpr Uuid kNamespaceDns = {
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8
};

} // anonymous namespace

Uuid uuid5_dns(const std::string& name) {
    Bytes input(kNamespaceDns.begin(), kNamespaceDns.end());
    input.insert(input.end(), name.begin(), name.end());

    auto digest = crypto::sha1(input);

    Uuid out{};
    std::copy_n(digest.begin(), out.size(), out.begin());
    out[6] = static_cast<std::uint8_t>((out[6] & 0x0F) | 0x50);  // version 5
    out[8] = static_cast<std::uint8_t>((out[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return out;
}

std::string uuid_to_string(const Uuid& uuid) {
    auto hex = crypto::hex_encode(uuid);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
           "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

AgentId::AgentId(std::string constellation, std::string satellite_serial)
    : constellation_(std::move(constellation))
    , satellite_serial_(std::move(satellite_serial))
{
    if (constellation_.empty() || satellite_serial_.empty()) {
        throw InvalidAgentIdException("constellation and satellite_serial must not be empty");
    }
    if (constellation_ != SUPPORTED_CONSTELLATION) {
        throw InvalidAgentIdException(
            std::string("Only '") + SUPPORTED_CONSTELLATION +
            "' constellation supported, got '" + constellation_ + "'");
    }
    uuid_ = uuid5_dns(qualified_name());
}

AgentId AgentId::create(std::string constellation, std::string satellite_serial) {
    return AgentId(std::move(constellation), std::move(satellite_serial));
}

AgentId AgentId::parse(const std::string& qualified_name) {
    auto sep = qualified_name.find(':');
    if (sep == std::string::npos) {
        throw InvalidAgentIdException("Malformed agent id '" + qualified_name +
                                      "': expected constellation:serial");
    }
    return AgentId(qualified_name.substr(0, sep), qualified_name.substr(sep + 1));
}

const std::string& AgentId::constellation() const noexcept { return constellation_; }
const std::string& AgentId::satellite_serial() const noexcept { return satellite_serial_; }
const Uuid& AgentId::uuid() const noexcept { return uuid_; }

std::string AgentId::qualified_name() const {
    return constellation_ + ":" + satellite_serial_;
}

std::string AgentId::uuid_hex() const {
    return crypto::hex_encode(uuid_);
}

bool AgentId::operator==(const AgentId& other) const noexcept {
    return uuid_ == other.uuid_ &&
           satellite_serial_ == other.satellite_serial_ &&
           constellation_ == other.constellation_;
}

bool AgentId::operator!=(const AgentId& other) const noexcept {
    return !(*this == other);
}

bool AgentId::operator<(const AgentId& other) const noexcept {
    if (satellite_serial_ != other.satellite_serial_) {
        return satellite_serial_ < other.satellite_serial_;
    }
    return constellation_ < other.constellation_;
}

} // namespace orbitguard
