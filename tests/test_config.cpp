#include <gtest/gtest.h>
#include <core/config.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

TEST(Config, EmptyDocumentUsesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.backend().type, "auto");
    EXPECT_EQ(c.sessions().max_sessions, DEFAULT_MAX_SESSIONS);
    EXPECT_EQ(c.sessions().default_timeout_ms, DEFAULT_COMMAND_TIMEOUT_MS);
    EXPECT_EQ(c.polling().interval_ms, DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(c.tail().lines, DEFAULT_TAIL_LINES);
    EXPECT_EQ(c.ssh().port, SSH_DEFAULT_PORT);
    EXPECT_TRUE(c.log_path().empty());
}

TEST(Config, SectionsOverrideDefaults) {
    auto r = Config::parse(R"(
backend:
  type: docker
docker:
  image: alpine:3.19
  mounts: ["/src:/work"]
  privileged: true
ssh:
  host: build.example.com
  port: 2222
sessions:
  max_sessions: 4
  default_timeout_ms: 5000
tail:
  lines: 20
log_path: /tmp/tk.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.backend().type, "docker");
    EXPECT_EQ(c.docker().image, "alpine:3.19");
    ASSERT_EQ(c.docker().mounts.size(), 1u);
    EXPECT_EQ(c.docker().mounts[0], "/src:/work");
    EXPECT_TRUE(c.docker().privileged);
    EXPECT_EQ(c.ssh().host, "build.example.com");
    EXPECT_EQ(c.ssh().port, 2222);
    EXPECT_EQ(c.sessions().max_sessions, 4);
    EXPECT_EQ(c.sessions().default_timeout_ms, 5000);
    EXPECT_EQ(c.tail().lines, 20);
    EXPECT_EQ(c.log_path(), "/tmp/tk.log");
}

TEST(Config, RootMustBeMapping) {
    auto r = Config::parse("- a\n- b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Config root must be a mapping");
}

TEST(Config, RejectsNonPositiveLimits) {
    auto r = Config::parse("sessions:\n  max_sessions: 0\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.code, ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(r.error, "sessions.max_sessions must be positive");

    EXPECT_TRUE(Config::parse("polling:\n  interval_ms: -5\n").is_err());
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("sessions: [unclosed");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, MissingFile) {
    auto r = Config::load_file(platform::temp_dir() / "termkeep-no-such-config.yaml");
    EXPECT_EQ(r.code, ErrorCode::FILE_NOT_FOUND);
}

TEST(Config, DefaultFileRoundTrips) {
    auto dir = platform::temp_dir() / ("termkeep-test-" + std::to_string(::getpid()));
    auto path = dir / "config.yaml";
    fs::remove_all(dir);

    ASSERT_TRUE(create_default_config(path).is_ok());
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.backend().type, "auto");
    EXPECT_EQ(r.value.sessions().max_sessions, 10);

    // Existing files are left alone
    {
        std::ofstream out(path);
        out << "sessions:\n  max_sessions: 2\n";
    }
    ASSERT_TRUE(create_default_config(path).is_ok());
    EXPECT_EQ(Config::load_file(path).value.sessions().max_sessions, 2);

    fs::remove_all(dir);
}

TEST(Config, EnvironmentOverrides) {
    ::setenv("TERMKEEP_BACKEND", "ssh", 1);
    ::setenv("TERMKEEP_MAX_SESSIONS", "7", 1);
    ::setenv("TERMKEEP_DEFAULT_TIMEOUT", "not-a-number", 1);

    auto c = Config::parse("sessions:\n  default_timeout_ms: 1234\n").value;
    c.apply_env_overrides();
    EXPECT_EQ(c.backend().type, "ssh");
    EXPECT_EQ(c.sessions().max_sessions, 7);
    EXPECT_EQ(c.sessions().default_timeout_ms, 1234);

    ::unsetenv("TERMKEEP_BACKEND");
    ::unsetenv("TERMKEEP_MAX_SESSIONS");
    ::unsetenv("TERMKEEP_DEFAULT_TIMEOUT");
}
