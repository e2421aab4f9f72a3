#include <gtest/gtest.h>
#include "fake_shell.hpp"
#include <session/session_manager.hpp>
#include <thread>

class SessionManagerTest : public ::testing::Test {
protected:
    Result<CommandResult> run(const std::string& command, int timeout_ms = 0,
                              const std::string& session_id = DEFAULT_SESSION_ID) {
        CommandContext ctx;
        ctx.session_id = session_id;
        ctx.command = command;
        ctx.timeout_ms = timeout_ms;
        return manager.execute_command(ctx);
    }

    static fake::FakePty* shell(const std::shared_ptr<TerminalSession>& s) {
        return dynamic_cast<fake::FakePty*>(s->pty.get());
    }

    static bool shell_ran(const std::shared_ptr<TerminalSession>& s, const std::string& line) {
        for (const auto& l : shell(s)->executed()) {
            if (l == line) return true;
        }
        return false;
    }

    std::shared_ptr<fake::FakeBackend> backend = std::make_shared<fake::FakeBackend>();
    SessionManager manager{backend, fake::fast_config()};
};

// ── Lifecycle ───────────────────────────────────────────────

TEST_F(SessionManagerTest, CreateAssignsIdAndName) {
    auto r = manager.create_session();
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& s = r.value;
    EXPECT_EQ(s->id.size(), 36u);
    EXPECT_EQ(s->name, "session-" + s->id.substr(0, 8));
    EXPECT_EQ(s->get_status(), SessionStatus::READY);
    EXPECT_EQ(s->cwd, "/home/user");
    EXPECT_EQ(backend->last_options().shell, "/bin/fake");
    EXPECT_EQ(manager.session_count(), 1u);
    EXPECT_EQ(manager.get_session(s->id), s);
}

TEST_F(SessionManagerTest, CreatePassesShellOptions) {
    SessionOptions opts;
    opts.id = "build";
    opts.name = "builder";
    opts.cwd = "/srv/app";
    opts.shell = "/bin/zsh";
    opts.env = {{"MODE", "ci"}};
    opts.cols = 100;
    opts.rows = 30;

    auto r = manager.create_session(opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value->name, "builder");
    EXPECT_EQ(r.value->info().cwd, "/srv/app");

    auto pty = backend->last_options();
    EXPECT_EQ(pty.shell, "/bin/zsh");
    EXPECT_EQ(pty.cwd, "/srv/app");
    EXPECT_EQ(pty.env.at("MODE"), "ci");
    EXPECT_EQ(pty.cols, 100);
    EXPECT_EQ(pty.rows, 30);
}

TEST_F(SessionManagerTest, DuplicateIdRejected) {
    SessionOptions opts;
    opts.id = "work";
    ASSERT_TRUE(manager.create_session(opts).is_ok());

    auto again = manager.create_session(opts);
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(again.code, ErrorCode::SESSION_ALREADY_EXISTS);
    EXPECT_EQ(manager.session_count(), 1u);
}

TEST_F(SessionManagerTest, CapacityFreedByClose) {
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto r = manager.create_session();
        ASSERT_TRUE(r.is_ok()) << r.error;
        ids.push_back(r.value->id);
    }

    auto over = manager.create_session();
    EXPECT_EQ(over.code, ErrorCode::MAX_SESSIONS_REACHED);
    EXPECT_EQ(backend->created(), 3);

    manager.close_session(ids[0]);
    EXPECT_TRUE(manager.create_session().is_ok());
    EXPECT_EQ(manager.create_session().code, ErrorCode::MAX_SESSIONS_REACHED);
}

TEST_F(SessionManagerTest, BackendFailureReleasesSlot) {
    backend->set_fail_create(true);
    auto r = manager.create_session();
    EXPECT_EQ(r.code, ErrorCode::SESSION_CREATE_FAILED);
    EXPECT_EQ(manager.session_count(), 0u);

    backend->set_fail_create(false);
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(manager.create_session().is_ok());
    }
}

TEST(SessionManagerStartup, ShellDyingAtStartupFailsCreate) {
    fake::ShellOptions opts;
    opts.exit_on_start = true;
    SessionManager manager(std::make_shared<fake::FakeBackend>(opts), fake::fast_config());

    auto r = manager.create_session();
    EXPECT_EQ(r.code, ErrorCode::SESSION_CREATE_FAILED);
    EXPECT_NE(r.error.find("Process exited with code 1"), std::string::npos);
    EXPECT_EQ(manager.session_count(), 0u);
}

TEST_F(SessionManagerTest, GetOrCreateReusesSession) {
    auto first = manager.get_or_create_session("main");
    auto second = manager.get_or_create_session("main");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value, second.value);
    EXPECT_EQ(backend->created(), 1);
}

TEST_F(SessionManagerTest, ConcurrentGetOrCreateSpawnsOnce) {
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<TerminalSession>> got(4);
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            auto r = manager.get_or_create_session("shared");
            if (r.is_ok()) got[i] = r.value;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(backend->created(), 1);
    for (const auto& s : got) EXPECT_EQ(s, got[0]);
}

TEST_F(SessionManagerTest, ListSortedByCreation) {
    for (const char* id : {"c", "a", "b"}) {
        SessionOptions opts;
        opts.id = id;
        ASSERT_TRUE(manager.create_session(opts).is_ok());
    }
    auto list = manager.list_sessions();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].id, "c");
    EXPECT_EQ(list[1].id, "a");
    EXPECT_EQ(list[2].id, "b");
}

TEST_F(SessionManagerTest, CloseMarksClosedAndForgets) {
    auto s = manager.create_session().value;
    manager.close_session(s->id);
    EXPECT_EQ(s->get_status(), SessionStatus::CLOSED);
    EXPECT_EQ(manager.get_session(s->id), nullptr);
    EXPECT_FALSE(s->pty->alive());

    // Unknown id is a no-op
    manager.close_session("nope");
}

TEST_F(SessionManagerTest, CloseAll) {
    auto a = manager.create_session().value;
    auto b = manager.create_session().value;
    manager.close_all_sessions();
    EXPECT_EQ(manager.session_count(), 0u);
    EXPECT_EQ(a->get_status(), SessionStatus::CLOSED);
    EXPECT_EQ(b->get_status(), SessionStatus::CLOSED);
}

TEST(SessionManagerExpiry, ClosesIdleSessions) {
    auto config = fake::fast_config();
    config.session_expiry_ms = 150;
    SessionManager manager(std::make_shared<fake::FakeBackend>(), config);

    ASSERT_TRUE(manager.create_session().is_ok());
    ASSERT_TRUE(manager.create_session().is_ok());
    EXPECT_EQ(manager.close_expired_sessions(), 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_EQ(manager.close_expired_sessions(), 2);
    EXPECT_EQ(manager.session_count(), 0u);
}

TEST_F(SessionManagerTest, ShellExitRetiresSession) {
    SessionOptions opts;
    opts.id = "doomed";
    auto s = manager.create_session(opts).value;

    s->pty->write("exit 3\n");
    ASSERT_TRUE(fake::wait_for([&] { return manager.get_session("doomed") == nullptr; }));

    auto info = s->info();
    EXPECT_EQ(info.status, SessionStatus::CLOSED);
    EXPECT_EQ(info.error, "Process exited with code 3");

    // The id is free again
    EXPECT_TRUE(manager.create_session(opts).is_ok());
}

// ── Command protocol ────────────────────────────────────────

TEST_F(SessionManagerTest, EchoHello) {
    auto r = run("echo hello");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "hello");
    EXPECT_EQ(r.value.exit_code.value_or(-1), 0);
    EXPECT_TRUE(r.value.success);
    EXPECT_FALSE(r.value.timed_out);
    EXPECT_EQ(r.value.session_id, DEFAULT_SESSION_ID);
    EXPECT_EQ(r.value.command, "echo hello");
    EXPECT_EQ(manager.get_session(DEFAULT_SESSION_ID)->get_status(), SessionStatus::READY);
}

TEST(SessionManagerQuietShell, EchoHelloWithoutTerminalEcho) {
    fake::ShellOptions opts;
    opts.echo_input = false;
    opts.prompt = "";
    SessionManager manager(std::make_shared<fake::FakeBackend>(opts), fake::fast_config());

    CommandContext ctx;
    ctx.command = "echo hello";
    auto r = manager.execute_command(ctx);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "hello");
    EXPECT_EQ(r.value.exit_code.value_or(-1), 0);
    EXPECT_TRUE(r.value.success);
    EXPECT_FALSE(r.value.timed_out);
}

TEST_F(SessionManagerTest, MultiLineOutput) {
    auto r = run("seq 3");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "1\n2\n3");
}

TEST_F(SessionManagerTest, NonZeroExit) {
    auto r = run("false");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code.value_or(-1), 1);
    EXPECT_FALSE(r.value.success);
    EXPECT_EQ(r.value.output, "");
}

TEST_F(SessionManagerTest, UnknownCommandReportsShellError) {
    auto r = run("nosuch --flag");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.exit_code.value_or(-1), 127);
    EXPECT_EQ(r.value.output, "fake: nosuch: command not found");
}

TEST_F(SessionManagerTest, SuccessiveCommandsSeeOnlyTheirOutput) {
    ASSERT_TRUE(run("echo one").is_ok());
    auto r = run("echo two");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "two");
}

TEST_F(SessionManagerTest, EmptyCommandLeavesSessionUntouched) {
    ASSERT_TRUE(run("echo hi").is_ok());
    auto s = manager.get_session(DEFAULT_SESSION_ID);
    auto before = s->info();
    auto buffer = s->buffer_snapshot();

    auto r = run("   \t");
    EXPECT_EQ(r.code, ErrorCode::COMMAND_EMPTY);

    auto after = s->info();
    EXPECT_EQ(after.status, SessionStatus::READY);
    EXPECT_EQ(after.last_command, before.last_command);
    EXPECT_EQ(s->buffer_snapshot(), buffer);
}

TEST_F(SessionManagerTest, EmptyCommandCreatesNothing) {
    EXPECT_EQ(run("").code, ErrorCode::COMMAND_EMPTY);
    EXPECT_EQ(backend->created(), 0);
}

TEST_F(SessionManagerTest, TimeoutLeavesSessionReady) {
    ASSERT_TRUE(manager.get_or_create_session().is_ok());
    auto started = std::chrono::steady_clock::now();
    auto r = run("hang", 200);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.timed_out);
    EXPECT_FALSE(r.value.success);
    EXPECT_FALSE(r.value.exit_code.has_value());
    EXPECT_EQ(r.value.output, "");
    EXPECT_EQ(r.value.error, "Command timeout after 200ms");
    EXPECT_GE(elapsed, 200);
    EXPECT_LT(elapsed, 450);
    EXPECT_EQ(manager.get_session(DEFAULT_SESSION_ID)->get_status(), SessionStatus::READY);
}

TEST_F(SessionManagerTest, BusySessionRejectsSecondCommand) {
    auto s = manager.get_or_create_session().value;

    Result<CommandResult> first = Result<CommandResult>::Err("not run");
    std::thread worker([&] { first = run("hang", 3000); });

    ASSERT_TRUE(fake::wait_for([&] { return shell_ran(s, "hang"); }));
    EXPECT_EQ(s->get_status(), SessionStatus::BUSY);

    auto second = run("echo nope");
    EXPECT_EQ(second.code, ErrorCode::SESSION_BUSY);

    s->pty->write("\x03");
    worker.join();

    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_FALSE(first.value.timed_out);
    EXPECT_EQ(first.value.exit_code.value_or(-1), 130);
    EXPECT_EQ(s->get_status(), SessionStatus::READY);
}

TEST_F(SessionManagerTest, ShellExitDuringCommandReportsClosed) {
    auto r = run("exit 2");
    EXPECT_EQ(r.code, ErrorCode::SESSION_CLOSED);
    EXPECT_TRUE(fake::wait_for([&] { return manager.session_count() == 0; }));
}

TEST_F(SessionManagerTest, ClosedSessionRejectsCommand) {
    auto s = manager.get_or_create_session().value;

    Result<CommandResult> first = Result<CommandResult>::Err("not run");
    std::thread worker([&] { first = run("hang", 3000); });
    ASSERT_TRUE(fake::wait_for([&] { return shell_ran(s, "hang"); }));

    manager.close_session(DEFAULT_SESSION_ID);
    worker.join();
    EXPECT_EQ(first.code, ErrorCode::SESSION_CLOSED);
    EXPECT_EQ(s->get_status(), SessionStatus::CLOSED);
}

TEST_F(SessionManagerTest, ResolvedSessionIsNeverRecreated) {
    auto s = manager.get_or_create_session().value;
    manager.close_session(DEFAULT_SESSION_ID);

    CommandContext ctx;
    ctx.command = "echo late";
    auto r = manager.execute_command(s, ctx);
    EXPECT_EQ(r.code, ErrorCode::SESSION_CLOSED);
    EXPECT_EQ(r.error, "Session is closed: default");
    EXPECT_EQ(manager.session_count(), 0u);
    EXPECT_EQ(backend->created(), 1);

    auto missing = manager.execute_command(manager.get_session(DEFAULT_SESSION_ID), ctx);
    EXPECT_EQ(missing.code, ErrorCode::SESSION_NOT_FOUND);
    EXPECT_EQ(manager.session_count(), 0u);
}

TEST_F(SessionManagerTest, ResolvedSessionRunsCommand) {
    auto s = manager.get_or_create_session().value;
    CommandContext ctx;
    ctx.command = "echo hi";
    auto r = manager.execute_command(s, ctx);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.output, "hi");
}

TEST(SessionManagerBuffer, CaptureBufferStaysBounded) {
    auto config = fake::fast_config();
    config.max_buffer_size = 256;
    SessionManager manager(std::make_shared<fake::FakeBackend>(), config);

    CommandContext ctx;
    ctx.command = "bytes 4000";
    auto r = manager.execute_command(ctx);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.timed_out);
    EXPECT_LE(manager.get_session(DEFAULT_SESSION_ID)->buffer_snapshot().size(), 256u);
}
