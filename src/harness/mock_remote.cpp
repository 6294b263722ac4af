#include "mock_remote.hpp"
#include "errors.hpp"
#include "scenario.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// Shared between a MockRemote and the factories it hands out, so a factory
// outliving its harness still sees the uninstall.
struct FactorySlot {
    std::vector<std::shared_ptr<FakeClient>> clients;
    std::size_t next = 0;
    bool installed = false;
};

MockRemote::MockRemote() : MockRemote(std::vector<Session>{Session()}) {
}

MockRemote::MockRemote(std::vector<Session> sessions)
    : sessions_(std::move(sessions)), slot_(std::make_shared<FactorySlot>()) {
    if (sessions_.empty()) sessions_.push_back(Session());
}

MockRemote::MockRemote(MockRemote&& other) noexcept
    : sessions_(std::move(other.sessions_)), slot_(std::move(other.slot_)) {
    other.slot_ = std::make_shared<FactorySlot>();
}

MockRemote::~MockRemote() {
    uninstall();
}

MockRemote MockRemote::for_command(Command command) {
    return MockRemote(std::vector<Session>{Session::for_command(std::move(command))});
}

MockRemote MockRemote::for_commands(std::vector<Command> commands) {
    return MockRemote(std::vector<Session>{Session::for_commands(std::move(commands))});
}

MockRemote MockRemote::from_spec(const SessionSpec& spec) {
    return MockRemote(std::vector<Session>{Session(spec)});
}

MockRemote MockRemote::from_scenario(const std::string& path) {
    auto loaded = load_scenario(path);
    if (loaded.is_err()) throw ConfigError(loaded.error);
    return MockRemote(std::move(loaded.value));
}

std::vector<std::shared_ptr<MockChannel>> MockRemote::start() {
    if (slot_->installed) {
        throw UsageError("MockRemote already started; nested harnesses are not supported");
    }

    slot_->clients.clear();
    slot_->next = 0;
    std::vector<std::shared_ptr<MockChannel>> channels;
    for (auto& session : sessions_) {
        session.generate_fakes();
        slot_->clients.push_back(session.client());
        channels.insert(channels.end(), session.channels().begin(), session.channels().end());
    }
    slot_->installed = true;

    sshfake_log(fmt::format("MockRemote: installed {} session(s), {} channel(s)",
                            sessions_.size(), channels.size()));
    return channels;
}

ClientFactory MockRemote::factory() const {
    std::shared_ptr<FactorySlot> slot = slot_;
    return [slot]() -> std::shared_ptr<SSHClient> {
        if (!slot->installed) {
            throw UsageError("Client requested from a MockRemote that is not installed");
        }
        if (slot->next >= slot->clients.size()) {
            throw UsageError(fmt::format(
                "Client #{} requested but only {} session(s) were scripted",
                slot->next + 1, slot->clients.size()));
        }
        return slot->clients[slot->next++];
    };
}

bool MockRemote::installed() const {
    return slot_->installed;
}

void MockRemote::uninstall() noexcept {
    if (slot_ && slot_->installed) {
        slot_->installed = false;
        sshfake_log(fmt::format("MockRemote: uninstalled after {} of {} client(s)",
                                slot_->next, slot_->clients.size()));
    }
}

void MockRemote::stop() {
    if (!slot_->installed) {
        throw UsageError("MockRemote::stop() without a matching start()");
    }
    uninstall();

    for (std::size_t i = 0; i < sessions_.size(); i++) {
        try {
            sessions_[i].verify();
        } catch (const VerificationError& e) {
            sshfake_log(fmt::format("MockRemote: verification failed: {}", e.what()));
            throw VerificationError(fmt::format("session {} of {}: {}",
                                                i + 1, sessions_.size(), e.what()));
        }
    }
}
