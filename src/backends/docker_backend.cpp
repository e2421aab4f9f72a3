#include "docker_backend.hpp"
#include <platform/local_pty.hpp>
#include <platform/process.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

namespace {

ExecResult docker(const std::vector<std::string>& args,
                  int timeout_ms = BACKEND_EXEC_TIMEOUT_MS) {
    platform::RunOptions opts;
    opts.timeout_ms = timeout_ms;
    return platform::run_process("docker", args, opts);
}

} // namespace

DockerBackend::DockerBackend(DockerConfig config, BackendSettings settings)
    : config_(std::move(config)), settings_(std::move(settings)) {}

DockerBackend::~DockerBackend() {
    shutdown();
}

bool DockerBackend::is_available() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (available_ < 0) {
        auto r = docker({"--version"}, BACKEND_PROBE_TIMEOUT_MS);
        available_ = (r.success() && r.stdout_data.find("Docker version") != std::string::npos) ? 1 : 0;
    }
    return available_ == 1;
}

std::string DockerBackend::default_shell() const {
    if (!settings_.shell.empty()) return settings_.shell;
    return config_.shell.empty() ? "/bin/bash" : config_.shell;
}

std::string DockerBackend::default_cwd() const {
    return settings_.cwd.empty() ? "/root" : settings_.cwd;
}

Result<std::string> DockerBackend::ensure_container() {
    using R = Result<std::string>;
    if (!is_available()) {
        return R::Err(ErrorCode::DOCKER_NOT_AVAILABLE, "Docker is not available");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!container_.empty()) return R::Ok(container_);

    if (!config_.container.empty()) {
        auto state = docker({"inspect", "-f", "{{.State.Running}}", config_.container});
        if (state.failed()) {
            return R::Err(ErrorCode::BACKEND_ERROR,
                          errors::backend_error("docker", "container not found: " + config_.container));
        }
        if (trimmed(state.stdout_data) != "true") {
            auto started = docker({"start", config_.container});
            if (started.failed()) {
                return R::Err(ErrorCode::BACKEND_ERROR,
                              errors::backend_error("docker", trimmed(started.stderr_data)));
            }
        }
        container_ = config_.container;
        termkeep_log(fmt::format("docker: using container {}", container_));
        return R::Ok(container_);
    }

    std::string name = config_.container_prefix + generate_uuid().substr(0, 8);
    std::vector<std::string> args = {"run", "-d", "--name", name};
    for (const auto& m : config_.mounts) {
        args.push_back("-v");
        args.push_back(m);
    }
    if (config_.privileged) args.push_back("--privileged");
    args.push_back(config_.image);
    args.push_back("sleep");
    args.push_back("infinity");

    auto run = docker(args, 120000);
    if (run.failed()) {
        return R::Err(ErrorCode::BACKEND_ERROR,
                      errors::backend_error("docker", "failed to create container: " +
                                            trimmed(run.get_output())));
    }
    container_ = trimmed(run.stdout_data);
    if (container_.empty()) container_ = name;
    created_ = true;
    termkeep_log(fmt::format("docker: started container {} from {}", name, config_.image));
    return R::Ok(container_);
}

Result<std::unique_ptr<PtyHandle>> DockerBackend::create_pty(const PtyOptions& options) {
    using R = Result<std::unique_ptr<PtyHandle>>;
    auto container = ensure_container();
    if (container.is_err()) return R::Err(container.code, container.error);

    PtySpawnOptions spawn;
    spawn.program = "docker";
    spawn.args = {"exec", "-it", "-w", options.cwd.empty() ? default_cwd() : options.cwd};
    spawn.args.push_back("-e");
    spawn.args.push_back(std::string("TERM=") + DEFAULT_TERM);
    for (const auto& [k, v] : options.env) {
        spawn.args.push_back("-e");
        spawn.args.push_back(k + "=" + v);
    }
    spawn.args.push_back(container.value);
    spawn.args.push_back(options.shell.empty() ? default_shell() : options.shell);
    spawn.cols = options.cols;
    spawn.rows = options.rows;
    return LocalPty::spawn(spawn);
}

ExecResult DockerBackend::execute(const std::string& command, const ExecuteOptions& options) {
    auto container = ensure_container();
    if (container.is_err()) return ExecResult{-1, "", container.error};

    std::vector<std::string> args = {"exec"};
    if (!options.input.empty()) args.push_back("-i");
    if (!options.cwd.empty()) {
        args.push_back("-w");
        args.push_back(options.cwd);
    }
    for (const auto& [k, v] : options.env) {
        args.push_back("-e");
        args.push_back(k + "=" + v);
    }
    args.push_back(container.value);
    args.push_back("sh");
    args.push_back("-c");
    args.push_back(command);

    platform::RunOptions run;
    run.input = options.input;
    run.timeout_ms = options.timeout_ms;
    return platform::run_process("docker", args, run);
}

Result<SystemInfo> DockerBackend::system_info() {
    auto container = ensure_container();
    if (container.is_err()) return Result<SystemInfo>::Err(container.code, container.error);

    SystemInfo info;
    info.backend = BackendType::DOCKER;
    info.container_id = container.value;
    info.image = config_.image;
    info.user = "root";
    info.home_dir = "/root";
    info.shell = default_shell();

    auto version = docker({"--version"}, BACKEND_PROBE_TIMEOUT_MS);
    if (version.success()) info.docker_version = trimmed(version.stdout_data);

    auto uname = execute("uname -s -n -r -m");
    if (uname.failed()) {
        return Result<SystemInfo>::Err(ErrorCode::BACKEND_ERROR,
                                       errors::backend_error("docker", trimmed(uname.get_output())));
    }
    // sysname nodename release machine
    std::istringstream fields(uname.stdout_data);
    fields >> info.os >> info.hostname >> info.kernel >> info.arch;

    auto os_release = execute("cat /etc/os-release 2>/dev/null");
    info.os_version = os_release.success() ? os_release_name(os_release.stdout_data) : "Unknown";
    if (info.os_version.empty()) info.os_version = "Unknown";

    return Result<SystemInfo>::Ok(info);
}

void DockerBackend::shutdown() {
    std::string container;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!created_) return;
        container = container_;
        container_.clear();
        created_ = false;
    }
    auto rm = docker({"rm", "-f", container});
    if (rm.failed()) {
        termkeep_log(fmt::format("docker: failed to remove {}: {}", container,
                                 trimmed(rm.get_output())));
    } else {
        termkeep_log(fmt::format("docker: removed container {}", container));
    }
}
