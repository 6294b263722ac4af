#include <gtest/gtest.h>
#include <gtest/gtest-spi.h>
#include <harness/errors.hpp>
#include <harness/mock_remote.hpp>
#include <harness/remote_test.hpp>
#include <ssh/connection.hpp>
#include <stdexcept>

static Command cmd(const std::string& text, const std::string& out = "",
                   int exit = 0, int waits = 0) {
    Command c;
    c.cmd = text;
    c.out = out;
    c.exit = exit;
    c.waits = waits;
    return c;
}

static ConnectionOptions no_sleep() {
    ConnectionOptions o;
    o.poll_interval_ms = 0;
    return o;
}

static ConnectTarget target_of(const std::string& host, const std::string& user = "") {
    ConnectTarget t;
    t.host = host;
    t.user = user;
    return t;
}

// ── end to end ──────────────────────────────────────────────

TEST(MockRemote, TwoCommandsOneSessionWithPolling) {
    MockRemote remote(std::vector<Session>{Session::for_commands({cmd("whoami", "root\n"),
                                              cmd("uname", "Linux\n", 0, 2)})});
    auto channels = remote.start();
    ASSERT_EQ(channels.size(), 2u);

    {
        Connection conn(target_of("host"), remote.factory(), no_sleep());
        auto first = conn.run("whoami");
        auto second = conn.run("uname");
        EXPECT_EQ(first.exit_code, 0);
        EXPECT_EQ(first.stdout_data, "root\n");
        EXPECT_EQ(second.exit_code, 0);
        EXPECT_EQ(second.stdout_data, "Linux\n");
    }

    EXPECT_NO_THROW(remote.stop());
    // waits=2: two false answers, then true; only on the second channel
    EXPECT_EQ(channels[0]->poll_count(), 1);
    EXPECT_EQ(channels[1]->poll_count(), 3);
}

TEST(MockRemote, DefaultRemoteAcceptsAnySingleCommand) {
    MockRemote remote;
    auto channels = remote.start();
    ASSERT_EQ(channels.size(), 1u);
    {
        Connection conn("somewhere", remote.factory());
        auto r = conn.run("true");
        EXPECT_TRUE(r.success());
        EXPECT_EQ(r.stdout_data, "");
    }
    EXPECT_NO_THROW(remote.stop());
}

TEST(MockRemote, ChannelsFlattenedAcrossSessions) {
    MockRemote remote(std::vector<Session>{
        Session::for_commands({cmd("whoami"), cmd("uname")}),
        Session::for_command(cmd("ls /"), SessionTarget{"foo", std::nullopt, std::nullopt}),
    });
    auto channels = remote.start();
    ASSERT_EQ(channels.size(), 3u);
    EXPECT_EQ(channels[0], remote.sessions()[0].channels()[0]);
    EXPECT_EQ(channels[1], remote.sessions()[0].channels()[1]);
    EXPECT_EQ(channels[2], remote.sessions()[1].channels()[0]);
}

TEST(MockRemote, SessionsConsumedInDeclaredOrder) {
    MockRemote remote(std::vector<Session>{
        Session::for_command(cmd("hostname", "web1\n"), SessionTarget{"web1", "deploy", std::nullopt}),
        Session::for_command(cmd("hostname", "db1\n"), SessionTarget{"db1", "admin", std::nullopt}),
    });
    remote.start();
    {
        Connection web(target_of("web1", "deploy"), remote.factory(), no_sleep());
        Connection db(target_of("db1", "admin"), remote.factory(), no_sleep());
        EXPECT_EQ(web.run("hostname").stdout_data, "web1\n");
        EXPECT_EQ(db.run("hostname").stdout_data, "db1\n");
    }
    EXPECT_NO_THROW(remote.stop());
}

TEST(MockRemote, OutOfOrderConnectionsFailVerification) {
    MockRemote remote(std::vector<Session>{
        Session::for_command(cmd("ls"), SessionTarget{"web1", std::nullopt, std::nullopt}),
        Session::for_command(cmd("ls"), SessionTarget{"db1", std::nullopt, std::nullopt}),
    });
    remote.start();
    {
        Connection db(target_of("db1"), remote.factory(), no_sleep());
        Connection web(target_of("web1"), remote.factory(), no_sleep());
        db.run("ls");
        web.run("ls");
    }
    try {
        remote.stop();
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_NE(std::string(e.what()).find("session 1 of 2"), std::string::npos);
    }
    EXPECT_FALSE(remote.installed());
}

TEST(MockRemote, StdinExpectationThroughConnection) {
    Command c = cmd("cat", "hello");
    c.in = "hello";
    MockRemote remote(std::vector<Session>{Session::for_command(c)});
    auto channels = remote.start();
    {
        Connection conn(target_of("h"), remote.factory(), no_sleep());
        auto r = conn.run("cat", "hello");
        EXPECT_EQ(r.stdout_data, "hello");
    }
    EXPECT_TRUE(channels[0]->stdin_closed());
    EXPECT_NO_THROW(remote.stop());
}

TEST(MockRemote, WrongCommandFailsAtStop) {
    auto remote = MockRemote::for_command(cmd("whoami"));
    remote.start();
    {
        Connection conn(target_of("h"), remote.factory(), no_sleep());
        conn.run("id");
    }
    EXPECT_THROW(remote.stop(), VerificationError);
}

TEST(MockRemote, ForCommandsWrapsOneSession) {
    auto remote = MockRemote::for_commands({cmd("a"), cmd("b")});
    ASSERT_EQ(remote.sessions().size(), 1u);
    EXPECT_EQ(remote.sessions()[0].commands().size(), 2u);
}

TEST(MockRemote, FromSpecRejectsContradictions) {
    SessionSpec spec;
    spec.commands = {cmd("a")};
    spec.cmd = "ls";
    EXPECT_THROW(MockRemote::from_spec(spec), ConfigError);
}

// ── install / uninstall ─────────────────────────────────────

TEST(MockRemote, ExtraClientIsUsageError) {
    MockRemote remote;
    remote.start();
    auto factory = remote.factory();
    factory();
    EXPECT_THROW(factory(), UsageError);
}

TEST(MockRemote, FactoryRevokedAfterStop) {
    MockRemote remote;
    remote.start();
    auto factory = remote.factory();
    EXPECT_TRUE(remote.installed());
    {
        Connection conn("h", factory);
        conn.run("anything");
    }
    remote.stop();
    EXPECT_FALSE(remote.installed());
    EXPECT_THROW(factory(), UsageError);
}

TEST(MockRemote, FactoryUnusableBeforeStart) {
    MockRemote remote;
    EXPECT_THROW(remote.factory()(), UsageError);
}

TEST(MockRemote, NestedStartIsUsageError) {
    MockRemote remote;
    remote.start();
    EXPECT_THROW(remote.start(), UsageError);
}

TEST(MockRemote, StopWithoutStartIsUsageError) {
    MockRemote remote;
    EXPECT_THROW(remote.stop(), UsageError);
}

TEST(MockRemote, DestructionUninstalls) {
    ClientFactory factory;
    {
        MockRemote remote;
        remote.start();
        factory = remote.factory();
    }
    EXPECT_THROW(factory(), UsageError);
}

TEST(MockRemote, RestartAfterStopGeneratesFreshFakes) {
    MockRemote remote;
    auto first = remote.start();
    {
        Connection conn("h", remote.factory());
        conn.run("x");
    }
    remote.stop();

    auto second = remote.start();
    EXPECT_NE(first[0], second[0]);
    {
        Connection conn("h", remote.factory());
        conn.run("y");
    }
    EXPECT_NO_THROW(remote.stop());
}

// ── with_remote ─────────────────────────────────────────────

TEST(WithRemote, BareFormInjectsOneChannel) {
    std::size_t seen = 0;
    with_remote([&](const ClientFactory& factory, std::vector<std::shared_ptr<MockChannel>>& channels) {
        seen = channels.size();
        Connection conn("h", factory);
        conn.run("whatever");
    });
    EXPECT_EQ(seen, 1u);
}

TEST(WithRemote, InjectsChannelsInGlobalOrder) {
    with_remote({Session::for_commands({cmd("whoami", "root\n"), cmd("uname", "Linux\n")}),
                 Session::for_command(cmd("ls /", "bin\n"))},
                [](const ClientFactory& factory, std::vector<std::shared_ptr<MockChannel>>& channels) {
        ASSERT_EQ(channels.size(), 3u);
        Connection a(target_of("a"), factory, no_sleep());
        Connection b(target_of("b"), factory, no_sleep());
        EXPECT_EQ(a.run("whoami").stdout_data, "root\n");
        EXPECT_EQ(a.run("uname").stdout_data, "Linux\n");
        EXPECT_EQ(b.run("ls /").stdout_data, "bin\n");
        EXPECT_EQ(channels[2]->calls().last("exec_command")->args.at(0), "ls /");
    });
}

TEST(WithRemote, VerificationFailureRaised) {
    EXPECT_THROW(
        with_remote({Session::for_command(cmd("whoami"))},
                    [](const ClientFactory&, std::vector<std::shared_ptr<MockChannel>>&) {
                        // never connects
                    }),
        VerificationError);
}

TEST(WithRemote, TeardownRunsWhenBodyThrows) {
    ClientFactory leaked;
    std::vector<std::shared_ptr<MockChannel>> injected;
    EXPECT_THROW(
        with_remote({Session::for_command(cmd("ls"))},
                    [&](const ClientFactory& factory, std::vector<std::shared_ptr<MockChannel>>& channels) {
                        leaked = factory;
                        injected = channels;
                        Connection conn("h", factory);
                        conn.run("ls");
                        throw std::logic_error("unrelated failure");
                    }),
        std::logic_error);

    // Substitution removed; the session was used correctly so verification
    // passed and the body's own error came through.
    EXPECT_THROW(leaked(), UsageError);
    ASSERT_EQ(injected.size(), 1u);
    EXPECT_TRUE(injected[0]->closed());
}

TEST(WithRemote, NoLeftoverSubstitutionForLaterRuns) {
    EXPECT_THROW(
        with_remote([](const ClientFactory&, std::vector<std::shared_ptr<MockChannel>>&) {
            throw std::runtime_error("boom");
        }),
        std::exception);

    // A fresh harness in the same process starts cleanly
    std::size_t seen = 0;
    with_remote([&](const ClientFactory& factory, std::vector<std::shared_ptr<MockChannel>>& channels) {
        seen = channels.size();
        Connection conn("h", factory);
        conn.run("ok");
    });
    EXPECT_EQ(seen, 1u);
}

TEST(WithRemote, VerifiesEvenWhenBodyThrows) {
    // The session is never used, so teardown's mismatch replaces the body's error
    EXPECT_THROW(
        with_remote({Session::for_command(cmd("whoami"))},
                    [](const ClientFactory&, std::vector<std::shared_ptr<MockChannel>>&) {
                        throw std::logic_error("body failed before connecting");
                    }),
        VerificationError);
}

// ── RemoteTest fixture ──────────────────────────────────────

TEST_F(RemoteTest, FixtureRunsAndVerifiesInTearDown) {
    auto channels = mock_remote({Session::for_command(cmd("uptime", "up 3 days\n"))});
    Connection conn(target_of("box"), factory(), no_sleep());
    auto r = conn.run("uptime");
    EXPECT_EQ(r.stdout_data, "up 3 days\n");
    EXPECT_EQ(channels.size(), 1u);
}

TEST_F(RemoteTest, FixtureExposesHarness) {
    mock_remote();
    ASSERT_NE(remote(), nullptr);
    EXPECT_TRUE(remote()->installed());
    Connection conn("h", factory());
    conn.run("id");
}

TEST_F(RemoteTest, SecondMockRemoteIsUsageError) {
    mock_remote({Session::for_command(cmd("whoami"))});
    EXPECT_THROW(mock_remote(), UsageError);

    // The first harness stays installed and is still verified at teardown
    ASSERT_TRUE(remote()->installed());
    Connection conn("h", factory());
    conn.run("whoami");
}

TEST_F(RemoteTest, FactoryBeforeMockRemoteIsUsageError) {
    EXPECT_THROW(factory(), UsageError);
}

TEST_F(RemoteTest, TearDownReportsMismatchAsFailure) {
    mock_remote({Session::for_command(cmd("whoami"))});
    EXPECT_NONFATAL_FAILURE(TearDown(), "session 1 of 1");
    EXPECT_FALSE(remote()->installed());
}
