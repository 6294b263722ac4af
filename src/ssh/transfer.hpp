#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "connection.hpp"
#include "path_ops.hpp"

struct TransferResult {
    std::string orig_remote;
    std::string remote;
    std::string orig_local;
    std::string local;
};

// SFTP file transfer on top of a Connection.
//
// Remote paths are relative to the SFTP working directory unless absolute.
// A missing destination defaults to the basename of the source. Local paths
// are made absolute through PathOps so tests can pin them down.
class Transfer {
public:
    Transfer(Connection& connection, std::shared_ptr<PathOps> path_ops);
    explicit Transfer(Connection& connection);

    Result<TransferResult> get(const std::string& remote,
                               const std::string& local = "",
                               bool preserve_mode = true);

    Result<TransferResult> put(const std::string& local,
                               const std::string& remote = "",
                               bool preserve_mode = true);

private:
    Connection& connection_;
    std::shared_ptr<PathOps> path_ops_;
};
