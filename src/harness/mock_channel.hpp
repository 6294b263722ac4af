#pragma once

#include <cstddef>
#include <string>
#include <ssh/client.hpp>
#include "call_log.hpp"
#include "command.hpp"

// Scripted stand-in for one exec channel.
//
// Replays the Command's stdout/stderr bytes through independent cursors,
// captures everything written to stdin, and answers exit_status_ready()
// with false `waits` times before switching to true. Every call lands in
// calls() for later assertions. Never fails.
class MockChannel : public Channel {
public:
    explicit MockChannel(const Command& command);

    Result<void> exec_command(const std::string& command) override;
    std::string recv(std::size_t n) override;
    std::string recv_stderr(std::size_t n) override;
    std::size_t sendall(const std::string& data) override;
    void send_eof() override;
    bool exit_status_ready() override;
    int recv_exit_status() override;
    void close() override;

    const std::string& stdin_data() const { return stdin_; }
    int poll_count() const { return polls_; }
    bool closed() const { return closed_; }
    bool stdin_closed() const { return stdin_closed_; }
    const CallLog& calls() const { return log_; }

private:
    std::string stdout_;
    std::string stderr_;
    std::size_t stdout_pos_ = 0;
    std::size_t stderr_pos_ = 0;
    std::string stdin_;
    int exit_code_;
    int waits_;
    int polls_ = 0;
    bool closed_ = false;
    bool stdin_closed_ = false;
    CallLog log_;

    static std::string take(const std::string& buf, std::size_t& pos, std::size_t n);
};
