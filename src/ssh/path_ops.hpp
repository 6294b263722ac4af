#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>

// Local filesystem path queries used by Transfer. Swappable so tests can
// make path massaging deterministic.
class PathOps {
public:
    virtual ~PathOps() = default;

    virtual std::string abspath(const std::string& path) = 0;
    virtual std::string basename(const std::string& path) = 0;

    // Permission bits (S_IMODE) of a local file.
    virtual Result<std::uint32_t> stat_mode(const std::string& path) = 0;
    virtual Result<void> chmod(const std::string& path, std::uint32_t mode) = 0;
};

// std::filesystem-backed implementation.
class LocalPathOps : public PathOps {
public:
    std::string abspath(const std::string& path) override;
    std::string basename(const std::string& path) override;
    Result<std::uint32_t> stat_mode(const std::string& path) override;
    Result<void> chmod(const std::string& path, std::uint32_t mode) override;
};

// POSIX basename: text after the last '/', empty if path ends with '/'.
std::string posix_basename(const std::string& path);

// POSIX join: b if b is absolute, otherwise a + "/" + b without doubling the slash.
std::string posix_join(const std::string& a, const std::string& b);
