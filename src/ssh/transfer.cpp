#include "transfer.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// S_IMODE: permission bits only, file type stripped
static std::uint32_t imode(std::uint32_t mode) {
    return mode & 07777;
}

Transfer::Transfer(Connection& connection, std::shared_ptr<PathOps> path_ops)
    : connection_(connection), path_ops_(std::move(path_ops)) {
}

Transfer::Transfer(Connection& connection)
    : Transfer(connection, std::make_shared<LocalPathOps>()) {
}

Result<TransferResult> Transfer::get(const std::string& remote,
                                     const std::string& local,
                                     bool preserve_mode) {
    if (remote.empty()) {
        return Result<TransferResult>::Err("Remote path must not be empty");
    }

    auto sftp = connection_.sftp();
    if (!sftp) {
        return Result<TransferResult>::Err("No SFTP session to " + connection_.target().host);
    }

    TransferResult r;
    r.orig_remote = remote;
    r.orig_local = local;
    r.remote = posix_join(sftp->getcwd(), remote);

    std::string dest = local.empty() ? posix_basename(r.remote) : local;
    r.local = path_ops_->abspath(dest);

    sshfake_log(fmt::format("Transfer: get {} -> {}", r.remote, r.local));
    auto copied = sftp->get(r.remote, r.local);
    if (copied.is_err()) return Result<TransferResult>::Err(copied.error);

    if (preserve_mode) {
        auto attrs = sftp->stat(r.remote);
        if (attrs.is_err()) return Result<TransferResult>::Err(attrs.error);
        auto chmodded = path_ops_->chmod(r.local, imode(attrs.value.mode));
        if (chmodded.is_err()) return Result<TransferResult>::Err(chmodded.error);
    }

    return Result<TransferResult>::Ok(r);
}

Result<TransferResult> Transfer::put(const std::string& local,
                                     const std::string& remote,
                                     bool preserve_mode) {
    if (local.empty()) {
        return Result<TransferResult>::Err("Local path must not be empty");
    }

    auto sftp = connection_.sftp();
    if (!sftp) {
        return Result<TransferResult>::Err("No SFTP session to " + connection_.target().host);
    }

    TransferResult r;
    r.orig_local = local;
    r.orig_remote = remote;
    r.local = path_ops_->abspath(local);

    std::string dest = remote.empty() ? path_ops_->basename(r.local) : remote;
    r.remote = posix_join(sftp->getcwd(), dest);

    sshfake_log(fmt::format("Transfer: put {} -> {}", r.local, r.remote));
    auto copied = sftp->put(r.local, r.remote);
    if (copied.is_err()) return Result<TransferResult>::Err(copied.error);

    if (preserve_mode) {
        auto mode = path_ops_->stat_mode(r.local);
        if (mode.is_err()) return Result<TransferResult>::Err(mode.error);
        auto chmodded = sftp->chmod(r.remote, imode(mode.value));
        if (chmodded.is_err()) return Result<TransferResult>::Err(chmodded.error);
    }

    return Result<TransferResult>::Ok(r);
}
