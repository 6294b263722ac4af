#include <gtest/gtest.h>
#include <harness/errors.hpp>
#include <harness/session.hpp>

static Command cmd(const std::string& text, const std::string& out = "") {
    Command c;
    c.cmd = text;
    c.out = out;
    return c;
}

static ConnectTarget target_of(const std::string& host, const std::string& user = "", int port = 22) {
    ConnectTarget t;
    t.host = host;
    t.user = user;
    t.port = port;
    return t;
}

// Use a generated session the way a well-behaved client would.
static void drive(Session& s, const ConnectTarget& target) {
    auto client = s.client();
    ASSERT_TRUE(client->connect(target).is_ok());
    auto transport = client->get_transport();
    ASSERT_TRUE(transport->is_active());
    for (const auto& command : s.commands()) {
        auto channel = transport->open_session();
        ASSERT_NE(channel, nullptr);
        ASSERT_TRUE(channel->exec_command(command.cmd.value_or("anything")).is_ok());
    }
}

// ── construction ────────────────────────────────────────────

TEST(Session, DefaultHasOneDefaultCommand) {
    Session s;
    ASSERT_EQ(s.commands().size(), 1u);
    EXPECT_FALSE(s.commands()[0].cmd.has_value());
    EXPECT_EQ(s.commands()[0].exit, 0);
    EXPECT_EQ(s.commands()[0].waits, 0);
    EXPECT_EQ(s.describe(), "*@*:*");
}

TEST(Session, ShorthandBuildsSingleCommand) {
    SessionSpec spec;
    spec.target.host = "web1";
    spec.cmd = "ls /";
    spec.out = "bin\netc\n";
    spec.exit = 2;
    spec.waits = 1;

    Session s(spec);
    ASSERT_EQ(s.commands().size(), 1u);
    EXPECT_EQ(s.commands()[0].cmd, std::optional<std::string>("ls /"));
    EXPECT_EQ(s.commands()[0].out, "bin\netc\n");
    EXPECT_EQ(s.commands()[0].exit, 2);
    EXPECT_EQ(s.commands()[0].waits, 1);
    EXPECT_EQ(s.describe(), "*@web1:*");
}

TEST(Session, CommandsAndShorthandIsConfigError) {
    SessionSpec spec;
    spec.commands = {cmd("whoami")};
    spec.cmd = "ls";
    EXPECT_THROW(Session{spec}, ConfigError);

    auto result = Session::from_spec(spec);
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("commands"), std::string::npos);
}

TEST(Session, StdinShorthandAlsoConflictsWithCommands) {
    SessionSpec spec;
    spec.commands = {cmd("cat")};
    spec.in = "data";
    EXPECT_THROW(Session{spec}, ConfigError);
}

TEST(Session, NegativeWaitsIsConfigError) {
    Command c;
    c.waits = -1;
    EXPECT_THROW(Session::for_command(c), ConfigError);
    EXPECT_THROW(Session::for_commands({c}), ConfigError);
}

TEST(Session, EmptyCommandListFallsBackToDefault) {
    Session s = Session::for_commands({});
    EXPECT_EQ(s.commands().size(), 1u);
}

TEST(Session, FromSpecOk) {
    SessionSpec spec;
    spec.target.user = "deploy";
    spec.target.port = 2222;
    spec.commands = {cmd("a"), cmd("b")};
    auto result = Session::from_spec(spec);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.commands().size(), 2u);
    EXPECT_EQ(result.value.describe(), "deploy@*:2222");
}

// ── generate_fakes ──────────────────────────────────────────

TEST(Session, NoFakesBeforeGenerate) {
    Session s;
    EXPECT_EQ(s.client(), nullptr);
    EXPECT_TRUE(s.channels().empty());
    EXPECT_THROW(s.verify(), UsageError);
}

TEST(Session, TransportYieldsChannelsInOrder) {
    Session s = Session::for_commands({cmd("first", "1"), cmd("second", "2"), cmd("third", "3")});
    s.generate_fakes();
    ASSERT_EQ(s.channels().size(), 3u);

    auto transport = s.client()->get_transport();
    for (std::size_t i = 0; i < 3; i++) {
        auto channel = transport->open_session();
        EXPECT_EQ(channel, s.channels()[i]);
    }
    EXPECT_EQ(s.channels()[0]->recv(10), "1");
    EXPECT_EQ(s.channels()[2]->recv(10), "3");
}

TEST(Session, ExtraOpenSessionIsUsageError) {
    Session s = Session::for_command(cmd("only"));
    s.generate_fakes();
    auto transport = s.client()->get_transport();
    transport->open_session();
    EXPECT_THROW(transport->open_session(), UsageError);
}

TEST(Session, TransportAlwaysActive) {
    Session s;
    s.generate_fakes();
    auto transport = s.client()->get_transport();
    for (int i = 0; i < 5; i++) EXPECT_TRUE(transport->is_active());
}

TEST(Session, RegenerateReplacesFakes) {
    Session s;
    s.generate_fakes();
    auto first = s.client();
    s.generate_fakes();
    EXPECT_NE(s.client(), first);
    EXPECT_EQ(s.channels().size(), 1u);
}

// ── verify ──────────────────────────────────────────────────

TEST(Session, VerifyPassesWhenUsedAsScripted) {
    Session s = Session::for_commands({cmd("whoami"), cmd("uname")}, SessionTarget{"web1", "root", 22});
    s.generate_fakes();
    drive(s, target_of("web1", "root", 22));
    EXPECT_NO_THROW(s.verify());
}

TEST(Session, UnsetTargetAcceptsAnything) {
    Session s = Session::for_command(cmd("ls"));
    s.generate_fakes();
    drive(s, target_of("anywhere.example", "nobody", 2200));
    EXPECT_NO_THROW(s.verify());
}

TEST(Session, WrongHostFails) {
    Session s = Session::for_command(cmd("ls"), SessionTarget{"x", "y", std::nullopt});
    s.generate_fakes();
    drive(s, target_of("other", "y"));
    try {
        s.verify();
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_NE(std::string(e.what()).find("connect()"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("y@other:22"), std::string::npos);
    }
}

TEST(Session, WrongUserFails) {
    Session s = Session::for_command(cmd("ls"), SessionTarget{"x", "y", std::nullopt});
    s.generate_fakes();
    drive(s, target_of("x", "z"));
    EXPECT_THROW(s.verify(), VerificationError);
}

TEST(Session, WrongPortFails) {
    Session s = Session::for_command(cmd("ls"), SessionTarget{std::nullopt, std::nullopt, 2222});
    s.generate_fakes();
    drive(s, target_of("x", "y", 22));
    EXPECT_THROW(s.verify(), VerificationError);
}

TEST(Session, MissingTransportGetFails) {
    Session s;
    s.generate_fakes();
    s.client()->connect(target_of("h"));
    try {
        s.verify();
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_NE(std::string(e.what()).find("get_transport()"), std::string::npos);
    }
}

TEST(Session, DoubleTransportGetFails) {
    Session s;
    s.generate_fakes();
    drive(s, target_of("h"));
    s.client()->get_transport();
    EXPECT_THROW(s.verify(), VerificationError);
}

TEST(Session, DoubleConnectFails) {
    Session s;
    s.generate_fakes();
    drive(s, target_of("h"));
    s.client()->connect(target_of("h"));
    EXPECT_THROW(s.verify(), VerificationError);
}

TEST(Session, WrongCommandTextFails) {
    Session s = Session::for_command(cmd("whoami"));
    s.generate_fakes();
    auto client = s.client();
    client->connect(target_of("h"));
    client->get_transport()->open_session()->exec_command("uname");
    try {
        s.verify();
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("\"whoami\""), std::string::npos);
        EXPECT_NE(msg.find("\"uname\""), std::string::npos);
    }
}

TEST(Session, ExecNeverCalledFails) {
    Session s;
    s.generate_fakes();
    auto client = s.client();
    client->connect(target_of("h"));
    client->get_transport()->open_session();
    EXPECT_THROW(s.verify(), VerificationError);
}

TEST(Session, StdinMustMatchExactly) {
    Command c = cmd("cat");
    c.in = "hello";
    Session s = Session::for_command(c);
    s.generate_fakes();
    drive(s, target_of("h"));
    s.channels()[0]->sendall("hel");
    EXPECT_THROW(s.verify(), VerificationError);
    s.channels()[0]->sendall("lo");
    EXPECT_NO_THROW(s.verify());
}

TEST(Session, UnsetStdinIsNotChecked) {
    Session s = Session::for_command(cmd("cat"));
    s.generate_fakes();
    drive(s, target_of("h"));
    s.channels()[0]->sendall("whatever");
    EXPECT_NO_THROW(s.verify());
}

TEST(Session, FewerOpensThanCommandsFails) {
    Session s = Session::for_commands({Command{}, Command{}});
    s.generate_fakes();
    auto client = s.client();
    client->connect(target_of("h"));
    auto transport = client->get_transport();
    transport->open_session()->exec_command("one");
    // Second channel never opened, but exec it directly so only the count is off
    s.channels()[1]->exec_command("two");
    try {
        s.verify();
        FAIL() << "expected VerificationError";
    } catch (const VerificationError& e) {
        EXPECT_NE(std::string(e.what()).find("open_session()"), std::string::npos);
    }
}

TEST(Session, EmptyStdinExpectationMeansNoStdin) {
    Command c = cmd("true");
    c.in = "";
    Session s = Session::for_command(c);
    s.generate_fakes();
    drive(s, target_of("h"));
    EXPECT_NO_THROW(s.verify());
    s.channels()[0]->sendall("x");
    EXPECT_THROW(s.verify(), VerificationError);
}
