#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One authenticated SSH transport shared by every channel opened on it.
// libssh2 runs non-blocking; every libssh2 call is made under io_mutex(),
// held briefly per call so channels interleave.
class SshConnection {
public:
    explicit SshConnection(SSHConfig target);
    ~SshConnection();

    SshConnection(const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    // TCP connect, handshake, authenticate.
    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const { return active_; }
    bool check_alive();

    // Interactive shell channel with a PTY of the given size.
    Result<LIBSSH2_CHANNEL*> open_shell(const std::string& term, int cols, int rows);

    // One-shot exec channel: stdout and stderr captured separately.
    ExecResult exec(const std::string& command, int timeout_ms);

    LIBSSH2_SESSION* raw_session() { return session_; }
    int socket() const { return sock_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }
    std::string target() const { return target_.user + "@" + target_.host; }

private:
    Result<void> userauth(StatusCallback callback);
    Result<LIBSSH2_CHANNEL*> open_channel();
    void free_channel(LIBSSH2_CHANNEL* ch);

    SSHConfig target_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    std::atomic<bool> active_{false};
    std::shared_ptr<std::mutex> io_mutex_;
};
