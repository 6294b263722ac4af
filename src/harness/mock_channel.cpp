#include "mock_channel.hpp"
#include <algorithm>

MockChannel::MockChannel(const Command& command)
    : stdout_(command.out), stderr_(command.err),
      exit_code_(command.exit), waits_(command.waits) {
}

std::string MockChannel::take(const std::string& buf, std::size_t& pos, std::size_t n) {
    std::size_t count = std::min(n, buf.size() - pos);
    std::string chunk = buf.substr(pos, count);
    pos += count;
    return chunk;
}

Result<void> MockChannel::exec_command(const std::string& command) {
    log_.record("exec_command", {command});
    return Result<void>::Ok();
}

std::string MockChannel::recv(std::size_t n) {
    log_.record("recv", {std::to_string(n)});
    return take(stdout_, stdout_pos_, n);
}

std::string MockChannel::recv_stderr(std::size_t n) {
    log_.record("recv_stderr", {std::to_string(n)});
    return take(stderr_, stderr_pos_, n);
}

std::size_t MockChannel::sendall(const std::string& data) {
    log_.record("sendall", {data});
    stdin_ += data;
    return data.size();
}

void MockChannel::send_eof() {
    log_.record("send_eof");
    stdin_closed_ = true;
}

bool MockChannel::exit_status_ready() {
    log_.record("exit_status_ready");
    return polls_++ >= waits_;
}

int MockChannel::recv_exit_status() {
    log_.record("recv_exit_status");
    return exit_code_;
}

void MockChannel::close() {
    log_.record("close");
    closed_ = true;
}
