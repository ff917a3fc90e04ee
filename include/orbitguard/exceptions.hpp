#pragma once

#include "orbitguard/types.hpp"
#include <stdexcept>
#include <string>

namespace orbitguard {

class OrbitGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidAgentIdException : public OrbitGuardException {
public:
    using OrbitGuardException::OrbitGuardException;
};

class InvalidHealthSummaryException : public OrbitGuardException {
public:
    using OrbitGuardException::OrbitGuardException;
};

class InvalidSwarmConfigException : public OrbitGuardException {
public:
    using OrbitGuardException::OrbitGuardException;
};

class ConfigException : public OrbitGuardException {
public:
    using OrbitGuardException::OrbitGuardException;
};

// Encode-side failure of the compression pipeline
class CompressionException : public OrbitGuardException {
public:
    using OrbitGuardException::OrbitGuardException;
};

class PayloadTooLargeException : public CompressionException {
public:
    PayloadTooLargeException(std::size_t size, std::size_t limit)
        : CompressionException(
            "Encoded payload of " + std::to_string(size) +
            " bytes exceeds limit of " + std::to_string(limit) + " bytes")
        , size_(size)
        , limit_(limit) {}

    std::size_t size() const noexcept { return size_; }
    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t size_;
    std::size_t limit_;
};

} // namespace orbitguard
