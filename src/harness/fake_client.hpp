#pragma once

#include <cstddef>
#include <memory>
#include <vector>
#include <ssh/client.hpp>
#include "call_log.hpp"
#include "mock_channel.hpp"

// Transport fake: always active, hands out its scripted channels in order.
class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::vector<std::shared_ptr<MockChannel>> channels);

    bool is_active() override;

    // Throws UsageError once every scripted channel has been handed out.
    std::shared_ptr<Channel> open_session() override;

    std::size_t opened() const { return next_; }
    const CallLog& calls() const { return log_; }

private:
    std::vector<std::shared_ptr<MockChannel>> channels_;
    std::size_t next_ = 0;
    CallLog log_;
};

// Client fake: records connect/get_transport/open_sftp and owns one transport.
class FakeClient : public SSHClient {
public:
    FakeClient(std::shared_ptr<FakeTransport> transport,
               std::shared_ptr<SFTPClient> sftp = nullptr);

    Result<void> connect(const ConnectTarget& target) override;
    std::shared_ptr<Transport> get_transport() override;

    // Null unless an SFTP fake was wired in.
    std::shared_ptr<SFTPClient> open_sftp() override;
    void close() override;

    std::shared_ptr<FakeTransport> transport() const { return transport_; }
    const CallLog& calls() const { return log_; }

private:
    std::shared_ptr<FakeTransport> transport_;
    std::shared_ptr<SFTPClient> sftp_;
    CallLog log_;
};
