#pragma once

#include <stdexcept>
#include <string>

// Base for everything the harness throws.
class HarnessError : public std::runtime_error {
public:
    explicit HarnessError(const std::string& msg) : std::runtime_error(msg) {}
};

// Contradictory construction arguments. Raised before any fake exists.
class ConfigError : public HarnessError {
public:
    explicit ConfigError(const std::string& msg) : HarnessError(msg) {}
};

// Recorded calls disagree with the declared expectations. Raised at teardown.
class VerificationError : public HarnessError {
public:
    explicit VerificationError(const std::string& msg) : HarnessError(msg) {}
};

// The fakes were driven outside their script: more clients or channels than
// declared, a revoked factory, a second start().
class UsageError : public HarnessError {
public:
    explicit UsageError(const std::string& msg) : HarnessError(msg) {}
};
