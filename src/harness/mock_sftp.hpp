#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <ssh/client.hpp>
#include <ssh/connection.hpp>
#include <ssh/path_ops.hpp>
#include <ssh/transfer.hpp>
#include "call_log.hpp"

// SFTP endpoint with fixed answers: cwd is "/remote", every stat reports
// mode 0644. get/put/chmod succeed and are recorded.
class FakeSFTPClient : public SFTPClient {
public:
    std::string getcwd() override;
    Result<SFTPAttributes> stat(const std::string& path) override;
    Result<void> get(const std::string& remote, const std::string& local) override;
    Result<void> put(const std::string& local, const std::string& remote) override;
    Result<void> chmod(const std::string& path, std::uint32_t mode) override;

    const CallLog& calls() const { return log_; }

private:
    CallLog log_;
};

// Path queries with deterministic answers: abspath(p) is "/local/" + p,
// basename is the real POSIX basename, stat_mode is 0644.
class FakePathOps : public PathOps {
public:
    std::string abspath(const std::string& path) override;
    std::string basename(const std::string& path) override;
    Result<std::uint32_t> stat_mode(const std::string& path) override;
    Result<void> chmod(const std::string& path, std::uint32_t mode) override;

    const CallLog& calls() const { return log_; }

private:
    CallLog log_;
};

struct SFTPFakes {
    std::shared_ptr<FakeSFTPClient> sftp;
    std::shared_ptr<FakePathOps> path_ops;
};

// Static stubbing for file-transfer tests. Same start/stop lifecycle as
// MockRemote, without verification. Every client the factory builds shares
// the one FakeSFTPClient.
class MockSFTP {
public:
    MockSFTP();
    ~MockSFTP();

    MockSFTP(const MockSFTP&) = delete;
    MockSFTP& operator=(const MockSFTP&) = delete;

    // Throws UsageError if already started.
    SFTPFakes start();
    void stop();

    ClientFactory factory() const;
    std::shared_ptr<PathOps> path_ops() const { return path_ops_; }
    bool installed() const { return *installed_; }

private:
    std::shared_ptr<FakeSFTPClient> sftp_;
    std::shared_ptr<FakePathOps> path_ops_;
    std::shared_ptr<bool> installed_;
};

// Run body(sftp, transfer, path_ops) with a Transfer over Connection("host")
// wired to a started MockSFTP; stops it on every exit path.
template <typename Body>
void with_sftp(Body&& body) {
    MockSFTP mock;
    SFTPFakes fakes = mock.start();
    std::exception_ptr failure;
    try {
        Connection connection("host", mock.factory());
        Transfer transfer(connection, mock.path_ops());
        body(*fakes.sftp, transfer, *fakes.path_ops);
    } catch (...) {
        failure = std::current_exception();
    }
    mock.stop();
    if (failure) std::rethrow_exception(failure);
}
