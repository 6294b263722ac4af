#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

// Remote execution client surface.
//
// Connection and Transfer only talk to these interfaces. Production code
// plugs in the libssh2 backend (ssh/libssh2_client.hpp); tests plug in the
// scripted fakes from harness/.
//
//   SSHClient ──get_transport()──> Transport ──open_session()──> Channel
//             ──open_sftp()──────> SFTPClient

class Channel {
public:
    virtual ~Channel() = default;

    virtual Result<void> exec_command(const std::string& command) = 0;

    // Read up to n bytes without blocking. Empty when nothing is pending.
    virtual std::string recv(std::size_t n) = 0;
    virtual std::string recv_stderr(std::size_t n) = 0;

    // Write all of data to the remote stdin; returns bytes written.
    virtual std::size_t sendall(const std::string& data) = 0;

    // Signal end of stdin to the remote command.
    virtual void send_eof() = 0;

    // Non-blocking: has the remote command finished?
    virtual bool exit_status_ready() = 0;
    virtual int recv_exit_status() = 0;

    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual bool is_active() = 0;

    // New exec channel per call. Null on failure.
    virtual std::shared_ptr<Channel> open_session() = 0;
};

class SFTPClient {
public:
    virtual ~SFTPClient() = default;

    virtual std::string getcwd() = 0;
    virtual Result<SFTPAttributes> stat(const std::string& path) = 0;
    virtual Result<void> get(const std::string& remote, const std::string& local) = 0;
    virtual Result<void> put(const std::string& local, const std::string& remote) = 0;
    virtual Result<void> chmod(const std::string& path, std::uint32_t mode) = 0;
};

class SSHClient {
public:
    virtual ~SSHClient() = default;

    virtual Result<void> connect(const ConnectTarget& target) = 0;

    // Null until connect() has succeeded.
    virtual std::shared_ptr<Transport> get_transport() = 0;
    virtual std::shared_ptr<SFTPClient> open_sftp() = 0;

    virtual void close() = 0;
};

// Connection-constructing facility. Each call yields a fresh, unconnected client.
using ClientFactory = std::function<std::shared_ptr<SSHClient>()>;
