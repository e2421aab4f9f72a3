#include "local_pty.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <pty.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

extern char** environ;

Result<std::unique_ptr<PtyHandle>> LocalPty::spawn(const PtySpawnOptions& options) {
    using R = Result<std::unique_ptr<PtyHandle>>;
    if (options.program.empty()) {
        return R::Err(ErrorCode::INVALID_PARAMETER, "No program given for PTY");
    }

    // Everything the child needs is prepared before fork.
    std::vector<const char*> argv;
    argv.push_back(options.program.c_str());
    for (const auto& a : options.args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    EnvMap overrides = options.env;
    overrides["TERM"] = options.term;
    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq))) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides) env_storage.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(options.cols);
    ws.ws_row = static_cast<unsigned short>(options.rows);

    int master_fd = -1;
    pid_t pid = forkpty(&master_fd, nullptr, nullptr, &ws);
    if (pid < 0) {
        return R::Err(ErrorCode::SESSION_CREATE_FAILED,
                      std::string("forkpty failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: exec the shell
        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(126);
        }
        execvpe(options.program.c_str(), const_cast<char* const*>(argv.data()), envp.data());
        _exit(127);
    }

    int flags = fcntl(master_fd, F_GETFL, 0);
    fcntl(master_fd, F_SETFL, flags | O_NONBLOCK);

    termkeep_log(fmt::format("pty: spawned {} pid={} ({}x{})",
                             options.program, pid, options.cols, options.rows));
    return R::Ok(std::unique_ptr<PtyHandle>(new LocalPty(master_fd, pid)));
}

LocalPty::LocalPty(int master_fd, int pid)
    : master_fd_(master_fd), pid_(pid) {
    reader_thread_ = std::thread(&LocalPty::reader_loop, this);
}

LocalPty::~LocalPty() {
    running_ = false;
    if (!reaped_) {
        ::kill(pid_, SIGHUP);
    }
    if (reader_thread_.joinable()) {
        // An exit listener may drop the last owner from the reader thread itself.
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    if (!reaped_) {
        ::kill(pid_, SIGKILL);
        reap(true);
    }
    if (master_fd_ >= 0) {
        close(master_fd_);
        master_fd_ = -1;
    }
}

bool LocalPty::write(const std::string& data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (master_fd_ < 0 || reaped_) return false;

    size_t sent = 0;
    int retries = 0;
    while (sent < data.size()) {
        ssize_t w = ::write(master_fd_, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (++retries > 100) return false;
                platform::sleep_ms(10);
                continue;
            }
            return false;
        }
        retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void LocalPty::kill() {
    if (reaped_) return;
    if (::kill(pid_, SIGHUP) != 0 && errno != ESRCH) {
        termkeep_log(fmt::format("pty: SIGHUP to {} failed: {}", pid_, std::strerror(errno)));
    }
    // Escalate if the shell ignores SIGHUP
    for (int i = 0; i < 20 && !reaped_; ++i) {
        reap(false);
        if (reaped_) return;
        platform::sleep_ms(10);
    }
    if (!reaped_) ::kill(pid_, SIGKILL);
}

void LocalPty::resize(int cols, int rows) {
    if (master_fd_ < 0) return;
    struct winsize ws;
    std::memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_row = static_cast<unsigned short>(rows);
    ioctl(master_fd_, TIOCSWINSZ, &ws);
}

bool LocalPty::alive() const {
    return !reaped_;
}

// Returns the exit code once reaped, -1 while still running.
int LocalPty::reap(bool block) {
    if (reaped_) return exit_code_;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, block ? 0 : WNOHANG);
    if (ret != pid_) return reaped_ ? exit_code_.load() : -1;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    reaped_ = true;
    return exit_code_;
}

void LocalPty::reader_loop() {
    char buf[PTY_READ_BUF_SIZE];

    while (running_) {
        struct pollfd pfd = {master_fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        ssize_t n = read(master_fd_, buf, sizeof(buf));
        if (n > 0) {
            emit_data(std::string(buf, static_cast<size_t>(n)));
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;

        // EOF or EIO: slave side closed, the child is exiting
        break;
    }

    if (!running_) return;

    int code = reap(true);
    termkeep_log(fmt::format("pty: pid={} exited with code {}", pid_, code));
    // Must be the last statement: the listener may destroy this object.
    emit_exit(code);
}
