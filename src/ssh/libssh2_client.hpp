#pragma once

#include <memory>
#include <core/types.hpp>
#include "client.hpp"

struct Libssh2Handle;

// libssh2-backed SSHClient.
//
// connect() opens the TCP socket, runs the handshake in non-blocking mode
// and authenticates with, in order: the key file, the password, the
// ssh-agent. Host keys are not checked.
class Libssh2Client : public SSHClient {
public:
    Libssh2Client();
    ~Libssh2Client() override;

    Result<void> connect(const ConnectTarget& target) override;
    std::shared_ptr<Transport> get_transport() override;
    std::shared_ptr<SFTPClient> open_sftp() override;
    void close() override;

private:
    std::shared_ptr<Libssh2Handle> handle_;
    std::shared_ptr<Transport> transport_;

    Result<void> authenticate(const ConnectTarget& target);
};

// Factory producing a fresh Libssh2Client per call.
ClientFactory make_libssh2_client_factory();
