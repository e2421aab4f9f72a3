#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".termkeep";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& config_path) {
    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::FILE_WRITE_ERROR,
                                 "Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# termkeep configuration

backend:
  type: "auto"                     # local | docker | ssh | auto
  shell: ""                        # empty: $SHELL (local), /bin/bash (docker)
  cwd: ""                          # empty: $HOME (local), /root (docker)

docker:
  image: "ubuntu:latest"
  container: ""                    # reuse an existing container
  container_prefix: "termkeep-"
  shell: "/bin/bash"
  mounts: []                       # ["/host/path:/container/path"]
  privileged: false

ssh:
  host: ""
  user: ""
  port: 22
  timeout: 30
  ssh_key_path: ""                 # e.g. ~/.ssh/id_ed25519
  password: ""

sessions:
  max_sessions: 10
  default_timeout_ms: 30000
  session_expiry_ms: 3600000
  max_buffer_size: 1048576

polling:
  interval_ms: 1000
  timeout_ms: 300000
  max_buffer_size: 10485760

tail:
  lines: 100
  timeout_ms: 300000

# log_path: "/tmp/termkeep_debug.log"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorCode::FILE_WRITE_ERROR,
                                 "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err(ErrorCode::FILE_WRITE_ERROR,
                                 "Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static BackendSettings parse_backend_config(const YAML::Node& node) {
    BackendSettings backend;
    backend.type = node["type"].as<std::string>("auto");
    backend.shell = node["shell"].as<std::string>("");
    backend.cwd = node["cwd"].as<std::string>("");
    return backend;
}

static DockerConfig parse_docker_config(const YAML::Node& node) {
    DockerConfig docker;
    docker.image = node["image"].as<std::string>(DEFAULT_DOCKER_IMAGE);
    docker.container = node["container"].as<std::string>("");
    docker.container_prefix = node["container_prefix"].as<std::string>(DEFAULT_CONTAINER_PREFIX);
    docker.shell = node["shell"].as<std::string>("/bin/bash");
    docker.mounts = node["mounts"].as<std::vector<std::string>>(std::vector<std::string>());
    docker.privileged = node["privileged"].as<bool>(false);
    return docker;
}

static SSHConfig parse_ssh_config(const YAML::Node& node) {
    SSHConfig ssh;
    ssh.host = node["host"].as<std::string>("");
    ssh.user = node["user"].as<std::string>("");
    ssh.password = node["password"].as<std::string>("");
    ssh.port = node["port"].as<int>(SSH_DEFAULT_PORT);
    ssh.timeout = node["timeout"].as<int>(30);
    ssh.ssh_key_path = node["ssh_key_path"].as<std::string>("");
    return ssh;
}

static SessionConfig parse_session_config(const YAML::Node& node) {
    SessionConfig s;
    s.max_sessions = node["max_sessions"].as<int>(DEFAULT_MAX_SESSIONS);
    s.default_timeout_ms = node["default_timeout_ms"].as<int>(DEFAULT_COMMAND_TIMEOUT_MS);
    s.session_expiry_ms = node["session_expiry_ms"].as<long long>(DEFAULT_SESSION_EXPIRY_MS);
    s.max_buffer_size = node["max_buffer_size"].as<std::size_t>(DEFAULT_SESSION_BUFFER);
    s.create_settle_ms = node["create_settle_ms"].as<int>(SESSION_CREATE_SETTLE_MS);
    s.command_settle_ms = node["command_settle_ms"].as<int>(COMMAND_SETTLE_MS);
    s.write_pacing_ms = node["write_pacing_ms"].as<int>(MARKER_WRITE_PACING_MS);
    s.completion_settle_ms = node["completion_settle_ms"].as<int>(COMPLETION_SETTLE_MS);
    return s;
}

static PollingConfig parse_polling_config(const YAML::Node& node) {
    PollingConfig p;
    p.interval_ms = node["interval_ms"].as<int>(DEFAULT_POLL_INTERVAL_MS);
    p.timeout_ms = node["timeout_ms"].as<int>(DEFAULT_BACKGROUND_TIMEOUT_MS);
    p.max_buffer_size = node["max_buffer_size"].as<std::size_t>(DEFAULT_PROCESS_BUFFER);
    return p;
}

static TailConfig parse_tail_config(const YAML::Node& node) {
    TailConfig t;
    t.lines = node["lines"].as<int>(DEFAULT_TAIL_LINES);
    t.timeout_ms = node["timeout_ms"].as<int>(DEFAULT_TAIL_TIMEOUT_MS);
    return t;
}

static Result<Config> from_root(const YAML::Node& root);

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return from_root(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::INVALID_PARAMETER,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorCode::FILE_NOT_FOUND,
                                   "Config not found at " + path.string());
    }
    try {
        return from_root(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorCode::FILE_READ_ERROR,
                                   "Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    Config config;
    if (config_exists()) {
        auto loaded = load_file(get_config_path());
        if (loaded.is_err()) return loaded;
        config = loaded.value;
    }
    config.apply_env_overrides();

    auto valid = config.validate();
    if (valid.is_err()) return Result<Config>::Err(valid.code, valid.error);
    return Result<Config>::Ok(config);
}

void Config::apply_env_overrides() {
    if (auto backend = platform::get_env("TERMKEEP_BACKEND")) {
        backend_.type = *backend;
    }
    if (auto max = platform::get_env("TERMKEEP_MAX_SESSIONS")) {
        sessions_.max_sessions = safe_stoi(*max, sessions_.max_sessions);
    }
    if (auto timeout = platform::get_env("TERMKEEP_DEFAULT_TIMEOUT")) {
        sessions_.default_timeout_ms = safe_stoi(*timeout, sessions_.default_timeout_ms);
    }
}

Result<void> Config::validate() const {
    auto bad = [](const std::string& key) {
        return Result<void>::Err(ErrorCode::INVALID_PARAMETER,
                                 fmt::format("{} must be positive", key));
    };
    if (sessions_.max_sessions <= 0) return bad("sessions.max_sessions");
    if (sessions_.default_timeout_ms <= 0) return bad("sessions.default_timeout_ms");
    if (sessions_.session_expiry_ms <= 0) return bad("sessions.session_expiry_ms");
    if (sessions_.max_buffer_size == 0) return bad("sessions.max_buffer_size");
    if (polling_.interval_ms <= 0) return bad("polling.interval_ms");
    if (polling_.timeout_ms <= 0) return bad("polling.timeout_ms");
    if (polling_.max_buffer_size == 0) return bad("polling.max_buffer_size");
    if (sessions_.create_settle_ms < 0 || sessions_.command_settle_ms < 0 ||
        sessions_.write_pacing_ms < 0 || sessions_.completion_settle_ms < 0) {
        return Result<void>::Err(ErrorCode::INVALID_PARAMETER,
                                 "sessions settle/pacing delays cannot be negative");
    }
    return Result<void>::Ok();
}

// Config's members are private; this is the one place that fills them.
class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root) {
        Config config;
        YAML::Node empty;
        config.backend_ = parse_backend_config(root["backend"] ? root["backend"] : empty);
        config.docker_ = parse_docker_config(root["docker"] ? root["docker"] : empty);
        config.ssh_ = parse_ssh_config(root["ssh"] ? root["ssh"] : empty);
        config.sessions_ = parse_session_config(root["sessions"] ? root["sessions"] : empty);
        config.polling_ = parse_polling_config(root["polling"] ? root["polling"] : empty);
        config.tail_ = parse_tail_config(root["tail"] ? root["tail"] : empty);
        config.log_path_ = root["log_path"].as<std::string>("");

        auto valid = config.validate();
        if (valid.is_err()) return Result<Config>::Err(valid.code, valid.error);
        return Result<Config>::Ok(config);
    }
};

static Result<Config> from_root(const YAML::Node& root) {
    if (root && !root.IsNull() && !root.IsMap()) {
        return Result<Config>::Err(ErrorCode::INVALID_PARAMETER,
                                   "Config root must be a mapping");
    }
    return ConfigBuilder::build(root);
}
