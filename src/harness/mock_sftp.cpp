#include "mock_sftp.hpp"
#include "errors.hpp"
#include "fake_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

static std::string octal(std::uint32_t mode) {
    return fmt::format("{:o}", mode);
}

// ── FakeSFTPClient ─────────────────────────────────────────────

std::string FakeSFTPClient::getcwd() {
    log_.record("getcwd");
    return FAKE_REMOTE_CWD;
}

Result<SFTPAttributes> FakeSFTPClient::stat(const std::string& path) {
    log_.record("stat", {path});
    SFTPAttributes attrs;
    attrs.mode = FAKE_FILE_MODE;
    return Result<SFTPAttributes>::Ok(attrs);
}

Result<void> FakeSFTPClient::get(const std::string& remote, const std::string& local) {
    log_.record("get", {remote, local});
    return Result<void>::Ok();
}

Result<void> FakeSFTPClient::put(const std::string& local, const std::string& remote) {
    log_.record("put", {local, remote});
    return Result<void>::Ok();
}

Result<void> FakeSFTPClient::chmod(const std::string& path, std::uint32_t mode) {
    log_.record("chmod", {path, octal(mode)});
    return Result<void>::Ok();
}

// ── FakePathOps ────────────────────────────────────────────────

std::string FakePathOps::abspath(const std::string& path) {
    log_.record("abspath", {path});
    return fmt::format("{}/{}", FAKE_LOCAL_ROOT, path);
}

std::string FakePathOps::basename(const std::string& path) {
    log_.record("basename", {path});
    return posix_basename(path);
}

Result<std::uint32_t> FakePathOps::stat_mode(const std::string& path) {
    log_.record("stat_mode", {path});
    return Result<std::uint32_t>::Ok(FAKE_FILE_MODE);
}

Result<void> FakePathOps::chmod(const std::string& path, std::uint32_t mode) {
    log_.record("chmod", {path, octal(mode)});
    return Result<void>::Ok();
}

// ── MockSFTP ───────────────────────────────────────────────────

MockSFTP::MockSFTP()
    : sftp_(std::make_shared<FakeSFTPClient>()),
      path_ops_(std::make_shared<FakePathOps>()),
      installed_(std::make_shared<bool>(false)) {
}

MockSFTP::~MockSFTP() {
    *installed_ = false;
}

SFTPFakes MockSFTP::start() {
    if (*installed_) {
        throw UsageError("MockSFTP already started; nested harnesses are not supported");
    }
    *installed_ = true;
    sshfake_log("MockSFTP: installed");
    return SFTPFakes{sftp_, path_ops_};
}

void MockSFTP::stop() {
    *installed_ = false;
    sshfake_log("MockSFTP: uninstalled");
}

ClientFactory MockSFTP::factory() const {
    std::shared_ptr<bool> installed = installed_;
    std::shared_ptr<FakeSFTPClient> sftp = sftp_;
    return [installed, sftp]() -> std::shared_ptr<SSHClient> {
        if (!*installed) {
            throw UsageError("Client requested from a MockSFTP that is not installed");
        }
        auto transport = std::make_shared<FakeTransport>(std::vector<std::shared_ptr<MockChannel>>{});
        return std::make_shared<FakeClient>(transport, sftp);
    };
}
