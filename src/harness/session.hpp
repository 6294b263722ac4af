#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "command.hpp"
#include "fake_client.hpp"
#include "mock_channel.hpp"

// Expected connection target. Unset fields accept any value.
struct SessionTarget {
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<int> port;
};

// Loose description of a Session, as written in a scenario file or built
// field by field. Either `commands` or the single-command shorthand fields
// may be given, never both.
struct SessionSpec {
    SessionTarget target;
    std::vector<Command> commands;

    std::optional<std::string> cmd;
    std::optional<std::string> out;
    std::optional<std::string> err;
    std::optional<std::string> in;
    std::optional<int> exit;
    std::optional<int> waits;

    bool has_shorthand() const {
        return cmd || out || err || in || exit || waits;
    }
};

// A scripted single connection with one or more command executions.
//
// generate_fakes() builds the fake client, its transport and one MockChannel
// per Command; verify() then checks, in order, that the client was used
// exactly as scripted:
//   1. get_transport() called once
//   2. connect() called once, matching host/user/port where given
//   3. each channel's last exec_command() matches its Command (and stdin, if expected)
//   4. open_session() called once per Command
// Any mismatch throws VerificationError.
class Session {
public:
    // One default Command, any target.
    Session();

    // Throws ConfigError if both `commands` and shorthand fields are given.
    explicit Session(const SessionSpec& spec);

    static Session for_command(Command command, SessionTarget target = {});
    static Session for_commands(std::vector<Command> commands, SessionTarget target = {});
    static Result<Session> from_spec(const SessionSpec& spec);

    void generate_fakes();
    void verify() const;

    const SessionTarget& target() const { return target_; }
    const std::vector<Command>& commands() const { return commands_; }

    // Null / empty until generate_fakes().
    std::shared_ptr<FakeClient> client() const { return client_; }
    const std::vector<std::shared_ptr<MockChannel>>& channels() const { return channels_; }

    // "user@host:port" with '*' for unset fields.
    std::string describe() const;

private:
    Session(SessionTarget target, std::vector<Command> commands);

    SessionTarget target_;
    std::vector<Command> commands_;
    std::shared_ptr<FakeClient> client_;
    std::vector<std::shared_ptr<MockChannel>> channels_;
};
