#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <ssh/client.hpp>
#include "command.hpp"
#include "mock_channel.hpp"
#include "session.hpp"

struct FactorySlot;

// Orchestrates one or more scripted Sessions.
//
// start() generates every Session's fakes and installs a test-scoped
// ClientFactory that yields the Sessions' clients in declared order. stop()
// revokes that factory and verifies each Session in order, stopping at the
// first failure. Connections must be created in the same order the Sessions
// are declared.
//
//   MockRemote remote({Session::for_command({"whoami", "root\n"}),
//                      Session::for_command({"uname", "Linux\n"})});
//   auto channels = remote.start();
//   Connection conn("host", remote.factory());
//   ...
//   remote.stop();
class MockRemote {
public:
    // One default Session with one default Command.
    MockRemote();
    explicit MockRemote(std::vector<Session> sessions);
    ~MockRemote();

    MockRemote(const MockRemote&) = delete;
    MockRemote& operator=(const MockRemote&) = delete;

    static MockRemote for_command(Command command);
    static MockRemote for_commands(std::vector<Command> commands);
    static MockRemote from_spec(const SessionSpec& spec);

    // Sessions from a YAML scenario file. Throws ConfigError if it can't be loaded.
    static MockRemote from_scenario(const std::string& path);

    // Returns every Session's channels, flattened in declaration order.
    // Throws UsageError if already started.
    std::vector<std::shared_ptr<MockChannel>> start();

    // Uninstall, then verify. Throws VerificationError on the first mismatch.
    void stop();

    // The installed connection factory. Calling it after stop() throws UsageError.
    ClientFactory factory() const;

    bool installed() const;
    const std::vector<Session>& sessions() const { return sessions_; }

    MockRemote(MockRemote&& other) noexcept;

private:
    std::vector<Session> sessions_;
    std::shared_ptr<FactorySlot> slot_;

    void uninstall() noexcept;
};

// Run body(factory, channels) against a started MockRemote built from
// `sessions`, always stopping it afterwards. channels holds one MockChannel
// per Command across all Sessions, in order. If the body throws, teardown
// still runs; the body's exception is rethrown unless verification fails
// first.
template <typename Body>
void with_remote(std::vector<Session> sessions, Body&& body) {
    MockRemote remote(std::move(sessions));
    auto channels = remote.start();
    std::exception_ptr failure;
    try {
        body(remote.factory(), channels);
    } catch (...) {
        failure = std::current_exception();
    }
    remote.stop();
    if (failure) std::rethrow_exception(failure);
}

// Bare form: one default Session with one default Command.
template <typename Body>
void with_remote(Body&& body) {
    with_remote(std::vector<Session>{Session()}, std::forward<Body>(body));
}
