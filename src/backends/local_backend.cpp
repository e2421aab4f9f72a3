#include "local_backend.hpp"
#include <platform/local_pty.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fstream>
#include <sstream>
#include <pwd.h>
#include <unistd.h>
#include <sys/sysinfo.h>
#include <sys/utsname.h>

LocalBackend::LocalBackend(BackendSettings settings) : settings_(std::move(settings)) {}

std::string LocalBackend::default_shell() const {
    if (!settings_.shell.empty()) return settings_.shell;
    return platform::get_env("SHELL").value_or("/bin/bash");
}

std::string LocalBackend::default_cwd() const {
    if (!settings_.cwd.empty()) return settings_.cwd;
    return platform::home_dir().string();
}

Result<std::unique_ptr<PtyHandle>> LocalBackend::create_pty(const PtyOptions& options) {
    PtySpawnOptions spawn;
    spawn.program = options.shell.empty() ? default_shell() : options.shell;
    spawn.cwd = options.cwd.empty() ? default_cwd() : options.cwd;
    spawn.env = options.env;
    spawn.cols = options.cols;
    spawn.rows = options.rows;
    return LocalPty::spawn(spawn);
}

ExecResult LocalBackend::execute(const std::string& command, const ExecuteOptions& options) {
    platform::RunOptions run;
    run.cwd = options.cwd.empty() ? default_cwd() : options.cwd;
    run.env = options.env;
    run.input = options.input;
    run.timeout_ms = options.timeout_ms;
    return platform::run_shell(command, run);
}

Result<SystemInfo> LocalBackend::system_info() {
    SystemInfo info;
    info.backend = BackendType::LOCAL;

    struct utsname uts;
    if (uname(&uts) == 0) {
        info.os = uts.sysname;
        info.kernel = uts.release;
        info.hostname = uts.nodename;
        info.arch = uts.machine;
    }

    std::ifstream os_release("/etc/os-release");
    if (os_release) {
        std::stringstream ss;
        ss << os_release.rdbuf();
        info.os_version = os_release_name(ss.str());
    }

    if (auto user = platform::get_env("USER")) {
        info.user = *user;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        info.user = pw->pw_name;
    }
    info.home_dir = platform::home_dir().string();
    info.shell = default_shell();

    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        info.total_memory = static_cast<uint64_t>(si.totalram) * si.mem_unit;
        info.free_memory = static_cast<uint64_t>(si.freeram) * si.mem_unit;
    }
    return Result<SystemInfo>::Ok(info);
}
