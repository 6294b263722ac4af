#include "fake_client.hpp"
#include "errors.hpp"
#include <fmt/format.h>

FakeTransport::FakeTransport(std::vector<std::shared_ptr<MockChannel>> channels)
    : channels_(std::move(channels)) {
}

bool FakeTransport::is_active() {
    log_.record("is_active");
    return true;
}

std::shared_ptr<Channel> FakeTransport::open_session() {
    log_.record("open_session");
    if (next_ >= channels_.size()) {
        throw UsageError(fmt::format(
            "open_session() called {} times but only {} command(s) were scripted",
            log_.count("open_session"), channels_.size()));
    }
    return channels_[next_++];
}

FakeClient::FakeClient(std::shared_ptr<FakeTransport> transport,
                       std::shared_ptr<SFTPClient> sftp)
    : transport_(std::move(transport)), sftp_(std::move(sftp)) {
}

Result<void> FakeClient::connect(const ConnectTarget& target) {
    log_.record("connect", {target.host, target.user, std::to_string(target.port)});
    return Result<void>::Ok();
}

std::shared_ptr<Transport> FakeClient::get_transport() {
    log_.record("get_transport");
    return transport_;
}

std::shared_ptr<SFTPClient> FakeClient::open_sftp() {
    log_.record("open_sftp");
    return sftp_;
}

void FakeClient::close() {
    log_.record("close");
}
