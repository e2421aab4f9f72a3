#include "process.hpp"
#include "platform.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>

extern char** environ;

namespace platform {

struct SpawnAccess {
    static void adopt(ProcessHandle& h, int pid) { h.pid_ = pid; }
};

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (pid_ > 0 && !reaped_) {
        terminate();
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (pid_ > 0 && !reaped_) terminate();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
        }
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return exit_code_;
        }
        if (ret < 0) return -1;
        if (elapsed >= timeout_ms) break;
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        exit_code_ = decode_status(status);
    }
    reaped_ = true;
}

// ── run_process ──────────────────────────────────────────────

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

ExecResult run_process(const std::string& program,
                       const std::vector<std::string>& args,
                       const RunOptions& options) {
    auto start = std::chrono::steady_clock::now();
    ExecResult result{-1, "", "", false, 0};

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe(in_pipe) != 0) {
        result.exit_code = 127;
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    // Build argv/envp before fork: the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && options.env.count(entry.substr(0, eq))) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& [k, v] : options.env) env_storage.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_code = 127;
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, in_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        if (!options.cwd.empty() && chdir(options.cwd.c_str()) != 0) {
            _exit(127);
        }
        execvpe(program.c_str(), const_cast<char* const*>(argv.data()), envp.data());
        _exit(127);  // exec failed
    }

    // Parent
    ProcessHandle handle;
    SpawnAccess::adopt(handle, pid);

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (!options.input.empty()) {
        size_t sent = 0;
        while (sent < options.input.size()) {
            ssize_t w = write(in_pipe[1], options.input.data() + sent,
                              options.input.size() - sent);
            if (w < 0) {
                if (errno == EINTR) continue;
                break;
            }
            sent += static_cast<size_t>(w);
        }
    }
    close_fd(in_pipe[1]);

    auto deadline = start + std::chrono::milliseconds(options.timeout_ms);
    char buf[4096];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (options.timeout_ms > 0 && now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = options.timeout_ms > 0
            ? static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count())
            : -1;

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int rc = poll(fds, nfds, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            bool is_out = fds[i].fd == out_fd;
            if (n > 0) {
                (is_out ? result.stdout_data : result.stderr_data).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(is_out ? out_fd : err_fd);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    if (result.timed_out) {
        handle.terminate();
        result.exit_code = -1;
    } else {
        result.exit_code = handle.wait();
    }

    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

ExecResult run_shell(const std::string& command, const RunOptions& options) {
    return run_process("/bin/sh", {"-c", command}, options);
}

} // namespace platform
