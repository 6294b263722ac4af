#include "connection.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

Connection::Connection(ConnectTarget target, ClientFactory factory,
                       ConnectionOptions options)
    : target_(std::move(target)), factory_(std::move(factory)), options_(options) {
}

Connection::Connection(const std::string& host, ClientFactory factory)
    : Connection(ConnectTarget{host, "", DEFAULT_SSH_PORT}, std::move(factory)) {
}

Connection::~Connection() {
    close();
}

std::shared_ptr<SSHClient> Connection::client() {
    if (!client_) client_ = factory_();
    return client_;
}

bool Connection::is_connected() const {
    return transport_ && transport_->is_active();
}

Result<void> Connection::open() {
    if (is_connected()) return Result<void>::Ok();
    if (transport_) {
        return Result<void>::Err(fmt::format("Transport to {} is no longer active", target_.host));
    }

    auto c = client();
    if (!c) return Result<void>::Err("Client factory returned no client");

    sshfake_log(fmt::format("Connection: connecting to {}@{}:{}",
                            target_.user, target_.host, target_.port));
    auto result = c->connect(target_);
    if (result.is_err()) return result;

    transport_ = c->get_transport();
    if (!transport_) {
        return Result<void>::Err(fmt::format("No transport after connecting to {}", target_.host));
    }
    return Result<void>::Ok();
}

void Connection::close() {
    sftp_.reset();
    transport_.reset();
    if (client_) {
        client_->close();
        client_.reset();
    }
}

void Connection::drain(Channel& channel, std::string& out, std::string& err) {
    auto chunk = static_cast<std::size_t>(options_.read_chunk);
    for (std::string data = channel.recv(chunk); !data.empty(); data = channel.recv(chunk))
        out += data;
    for (std::string data = channel.recv_stderr(chunk); !data.empty(); data = channel.recv_stderr(chunk))
        err += data;
}

ExecResult Connection::run(const std::string& command, const std::string& stdin_data) {
    auto opened = open();
    if (opened.is_err()) {
        return ExecResult{-1, "", opened.error};
    }

    auto channel = transport_->open_session();
    if (!channel) {
        return ExecResult{-1, "", "Failed to open exec channel"};
    }

    auto exec = channel->exec_command(command);
    if (exec.is_err()) {
        channel->close();
        return ExecResult{-1, "", "Failed to exec command on channel: " + exec.error};
    }

    if (!stdin_data.empty()) {
        std::size_t sent = channel->sendall(stdin_data);
        if (sent != stdin_data.size()) {
            channel->close();
            return ExecResult{-1, "", fmt::format("Short write to stdin ({} of {} bytes)",
                                                  sent, stdin_data.size())};
        }
        channel->send_eof();
    }

    // Read until both streams are empty and the remote reports completion.
    std::string output;
    std::string errors;
    while (true) {
        std::size_t before = output.size() + errors.size();
        drain(*channel, output, errors);
        if (output.size() + errors.size() != before) continue;
        if (channel->exit_status_ready()) break;
        platform::sleep_ms(options_.poll_interval_ms);
    }
    drain(*channel, output, errors);

    ExecResult result{channel->recv_exit_status(), output, errors};
    channel->close();

    sshfake_log_exec(fmt::format("Connection[{}]", target_.host), command, result);
    return result;
}

std::shared_ptr<SFTPClient> Connection::sftp() {
    if (sftp_) return sftp_;
    auto opened = open();
    if (opened.is_err()) {
        sshfake_log(fmt::format("Connection: sftp unavailable: {}", opened.error));
        return nullptr;
    }
    sftp_ = client_->open_sftp();
    return sftp_;
}
