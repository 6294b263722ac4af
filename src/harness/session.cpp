#include "session.hpp"
#include "errors.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

static std::string check_spec(const SessionSpec& spec) {
    if (!spec.commands.empty() && spec.has_shorthand()) {
        return "You can't give both 'commands' and individual Command parameters";
    }
    if (spec.waits && *spec.waits < 0) {
        return fmt::format("waits must be >= 0 (got {})", *spec.waits);
    }
    for (std::size_t i = 0; i < spec.commands.size(); i++) {
        if (spec.commands[i].waits < 0) {
            return fmt::format("command {}: waits must be >= 0 (got {})",
                               i + 1, spec.commands[i].waits);
        }
    }
    return "";
}

static std::vector<Command> commands_from_spec(const SessionSpec& spec) {
    if (!spec.has_shorthand()) return spec.commands;

    Command c;
    c.cmd = spec.cmd;
    c.in = spec.in;
    if (spec.out) c.out = *spec.out;
    if (spec.err) c.err = *spec.err;
    if (spec.exit) c.exit = *spec.exit;
    if (spec.waits) c.waits = *spec.waits;
    return {c};
}

Session::Session() : Session(SessionTarget{}, {}) {
}

Session::Session(SessionTarget target, std::vector<Command> commands)
    : target_(std::move(target)), commands_(std::move(commands)) {
    if (commands_.empty()) commands_.push_back(Command{});
}

Session::Session(const SessionSpec& spec) : Session() {
    std::string problem = check_spec(spec);
    if (!problem.empty()) throw ConfigError(problem);
    target_ = spec.target;
    commands_ = commands_from_spec(spec);
    if (commands_.empty()) commands_.push_back(Command{});
}

Session Session::for_command(Command command, SessionTarget target) {
    if (command.waits < 0) {
        throw ConfigError(fmt::format("waits must be >= 0 (got {})", command.waits));
    }
    return Session(std::move(target), {std::move(command)});
}

Session Session::for_commands(std::vector<Command> commands, SessionTarget target) {
    SessionSpec spec;
    spec.target = std::move(target);
    spec.commands = std::move(commands);
    return Session(spec);
}

Result<Session> Session::from_spec(const SessionSpec& spec) {
    std::string problem = check_spec(spec);
    if (!problem.empty()) return Result<Session>::Err(problem);
    return Result<Session>::Ok(Session(spec));
}

std::string Session::describe() const {
    return fmt::format("{}@{}:{}",
                       target_.user.value_or("*"),
                       target_.host.value_or("*"),
                       target_.port ? std::to_string(*target_.port) : "*");
}

void Session::generate_fakes() {
    std::vector<std::shared_ptr<MockChannel>> channels;
    channels.reserve(commands_.size());
    for (const auto& command : commands_) {
        channels.push_back(std::make_shared<MockChannel>(command));
    }

    auto transport = std::make_shared<FakeTransport>(channels);
    client_ = std::make_shared<FakeClient>(transport);
    channels_ = std::move(channels);

    sshfake_log(fmt::format("Session[{}]: generated client with {} channel(s)",
                            describe(), channels_.size()));
}

void Session::verify() const {
    if (!client_) {
        throw UsageError(fmt::format("Session[{}]: verify() before generate_fakes()", describe()));
    }

    // Per-session we expect a single transport get
    std::size_t transport_gets = client_->calls().count("get_transport");
    if (transport_gets != 1) {
        throw VerificationError(fmt::format(
            "Session[{}]: expected get_transport() to be called once, called {} times",
            describe(), transport_gets));
    }

    // And a single connect to our target
    auto connects = client_->calls().calls("connect");
    if (connects.size() != 1) {
        throw VerificationError(fmt::format(
            "Session[{}]: expected connect() to be called once, called {} times",
            describe(), connects.size()));
    }
    const auto& args = connects.front().args;
    const std::string& host = args.at(0);
    const std::string& user = args.at(1);
    const std::string& port = args.at(2);
    bool host_ok = !target_.host || *target_.host == host;
    bool user_ok = !target_.user || *target_.user == user;
    bool port_ok = !target_.port || std::to_string(*target_.port) == port;
    if (!host_ok || !user_ok || !port_ok) {
        throw VerificationError(fmt::format(
            "Session[{}]: connect() target mismatch, got {}@{}:{}",
            describe(), user, host, port));
    }

    for (std::size_t i = 0; i < channels_.size(); i++) {
        const auto& channel = channels_[i];
        const auto& command = commands_[i];

        auto exec = channel->calls().last("exec_command");
        if (!exec) {
            throw VerificationError(fmt::format(
                "Session[{}]: channel {} expected exec_command({}), never called",
                describe(), i + 1, command.cmd ? fmt::format("{:?}", *command.cmd) : "<any>"));
        }
        if (command.cmd && exec->args.at(0) != *command.cmd) {
            throw VerificationError(fmt::format(
                "Session[{}]: channel {} expected exec_command({:?}), last call was {}",
                describe(), i + 1, *command.cmd, describe_call(*exec)));
        }

        if (command.in && channel->stdin_data() != *command.in) {
            throw VerificationError(fmt::format(
                "Session[{}]: channel {} expected stdin {:?}, got {:?}",
                describe(), i + 1, *command.in, channel->stdin_data()));
        }
    }

    // One open_session per command, and no more
    std::size_t opens = client_->transport()->calls().count("open_session");
    if (opens != commands_.size()) {
        throw VerificationError(fmt::format(
            "Session[{}]: expected open_session() to be called {} times, called {} times",
            describe(), commands_.size(), opens));
    }
}
