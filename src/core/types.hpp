#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct ExecResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Where a client should connect and how it authenticates
struct ConnectTarget {
    std::string host;
    std::string user;
    int port = DEFAULT_SSH_PORT;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
};

// Metadata returned by an SFTP stat
struct SFTPAttributes {
    std::uint32_t mode = 0;     // POSIX bits (type + permissions)
    std::uint64_t size = 0;
};
