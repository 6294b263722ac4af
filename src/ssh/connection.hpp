#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "client.hpp"

struct ConnectionOptions {
    int poll_interval_ms = EXEC_POLL_INTERVAL_MS;
    int read_chunk = SSH_READ_BUF_SIZE;
};

// One logical connection to a remote host.
//
// The client is built lazily from the injected factory, exactly once per
// Connection. open() connects and fetches the transport once; every run()
// gets its own exec channel on that transport.
class Connection {
public:
    Connection(ConnectTarget target, ClientFactory factory,
               ConnectionOptions options = {});
    Connection(const std::string& host, ClientFactory factory);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Result<void> open();
    bool is_connected() const;
    void close();

    // Execute a command on a new channel, optionally feeding stdin, and
    // wait for it to finish.
    ExecResult run(const std::string& command, const std::string& stdin_data = "");

    // SFTP endpoint for this connection (opened once, then reused).
    std::shared_ptr<SFTPClient> sftp();

    const ConnectTarget& target() const { return target_; }
    std::shared_ptr<SSHClient> client();

private:
    ConnectTarget target_;
    ClientFactory factory_;
    ConnectionOptions options_;
    std::shared_ptr<SSHClient> client_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<SFTPClient> sftp_;

    void drain(Channel& channel, std::string& out, std::string& err);
};
