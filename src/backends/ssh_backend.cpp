#include "ssh_backend.hpp"
#include <ssh/ssh_connection.hpp>
#include <ssh/ssh_pty.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

namespace {

// cd/export prefix so one-shot commands honor cwd and env.
std::string with_context(const std::string& command, const std::string& cwd, const EnvMap& env) {
    std::string prefix;
    if (!cwd.empty()) prefix += "cd " + shell_quote(cwd) + " && ";
    for (const auto& [k, v] : env) prefix += "export " + k + "=" + shell_quote(v) + "; ";
    return prefix + command;
}

} // namespace

SshBackend::SshBackend(SSHConfig config, BackendSettings settings)
    : config_(std::move(config)), settings_(std::move(settings)) {}

SshBackend::~SshBackend() {
    shutdown();
}

Result<std::shared_ptr<SshConnection>> SshBackend::connection() {
    using R = Result<std::shared_ptr<SshConnection>>;
    std::lock_guard<std::mutex> lock(mutex_);

    if (connection_ && connection_->is_active()) return R::Ok(connection_);

    auto conn = std::make_shared<SshConnection>(config_);
    auto established = conn->establish([](const std::string& msg) {
        termkeep_log("ssh: " + msg);
    });
    if (established.is_err()) {
        return R::Err(established.code, errors::backend_error("ssh", established.error));
    }
    connection_ = conn;
    return R::Ok(connection_);
}

bool SshBackend::is_available() {
    auto conn = connection();
    return conn.is_ok() && conn.value->check_alive();
}

std::string SshBackend::default_shell() const {
    // The account's login shell, expanded remotely.
    return settings_.shell.empty() ? "$SHELL" : settings_.shell;
}

std::string SshBackend::default_cwd() const {
    return settings_.cwd.empty() ? "~" : settings_.cwd;
}

Result<std::unique_ptr<PtyHandle>> SshBackend::create_pty(const PtyOptions& options) {
    using R = Result<std::unique_ptr<PtyHandle>>;
    auto conn = connection();
    if (conn.is_err()) return R::Err(ErrorCode::SESSION_CREATE_FAILED, conn.error);

    auto channel = conn.value->open_shell(DEFAULT_TERM, options.cols, options.rows);
    if (channel.is_err()) {
        return R::Err(ErrorCode::SESSION_CREATE_FAILED, errors::backend_error("ssh", channel.error));
    }

    auto pty = std::make_unique<SshPty>(conn.value, channel.value);

    std::string setup;
    for (const auto& [k, v] : options.env) setup += "export " + k + "=" + shell_quote(v) + "\n";
    std::string cwd = options.cwd.empty() ? default_cwd() : options.cwd;
    if (cwd != "~") setup += "cd " + shell_quote(cwd) + "\n";
    // The login shell is the account's; replace it when another was asked for.
    if (!options.shell.empty() && options.shell != "$SHELL") setup += "exec " + options.shell + "\n";
    if (!setup.empty() && !pty->write(setup)) {
        return R::Err(ErrorCode::SESSION_CREATE_FAILED, "Failed to initialize remote shell");
    }

    termkeep_log(fmt::format("ssh: opened shell on {} ({}x{})",
                             conn.value->target(), options.cols, options.rows));
    return R::Ok(std::move(pty));
}

ExecResult SshBackend::execute(const std::string& command, const ExecuteOptions& options) {
    auto conn = connection();
    if (conn.is_err()) return ExecResult{-1, "", conn.error};
    return conn.value->exec(with_context(command, options.cwd, options.env), options.timeout_ms);
}

Result<SystemInfo> SshBackend::system_info() {
    auto uname = execute("uname -s -n -r -m");
    if (uname.failed()) {
        return Result<SystemInfo>::Err(ErrorCode::BACKEND_ERROR,
                                       errors::backend_error("ssh", trimmed(uname.get_output())));
    }

    SystemInfo info;
    info.backend = BackendType::SSH;
    std::istringstream fields(uname.stdout_data);
    fields >> info.os >> info.hostname >> info.kernel >> info.arch;

    auto os_release = execute("cat /etc/os-release 2>/dev/null");
    if (os_release.success()) info.os_version = os_release_name(os_release.stdout_data);

    auto who = execute("whoami; echo $HOME; echo $SHELL");
    if (who.success()) {
        auto lines = split_lines(who.stdout_data);
        if (lines.size() > 0) info.user = trimmed(lines[0]);
        if (lines.size() > 1) info.home_dir = trimmed(lines[1]);
        if (lines.size() > 2) info.shell = trimmed(lines[2]);
    }
    if (info.shell.empty()) info.shell = settings_.shell;

    info.remote_host = config_.host;
    info.remote_port = config_.port;
    return Result<SystemInfo>::Ok(info);
}

// Open shells keep the connection alive until they close.
void SshBackend::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_.reset();
}
