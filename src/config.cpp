#include "orbitguard/config.hpp"
#include "orbitguard/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace orbitguard {

namespace {

std::string trim(const std::string& value) {
    const auto begin = std::find_if_not(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(value.rbegin(), value.rend(),
        [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string lower(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::optional<std::string> read_env(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    auto value = trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool parse_bool(const char* name, const std::string& value) {
    const auto v = lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw ConfigException(std::string(name) + " must be a boolean, got '" + value + "'");
}

std::size_t parse_size(const char* name, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigException(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigException(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (parsed <= 0) {
        throw ConfigException(std::string(name) + " must be greater than 0");
    }
    return static_cast<std::size_t>(parsed);
}

} // anonymous namespace

FeatureFlags load_feature_flags_from_env() {
    FeatureFlags flags;

    if (auto v = read_env("SWARM_MODE_ENABLED")) {
        flags.swarm_mode_enabled = parse_bool("SWARM_MODE_ENABLED", *v);
    }
    if (auto v = read_env("SWARM_SCHEMA_VALIDATION")) {
        flags.schema_validation = parse_bool("SWARM_SCHEMA_VALIDATION", *v);
    }
    if (auto v = read_env("SWARM_COMPRESSION")) {
        flags.compression_enabled = parse_bool("SWARM_COMPRESSION", *v);
    }
    if (auto v = read_env("SWARM_MAX_PAYLOAD")) {
        flags.max_payload_bytes = parse_size("SWARM_MAX_PAYLOAD", *v);
    }

    return flags;
}

} // namespace orbitguard
