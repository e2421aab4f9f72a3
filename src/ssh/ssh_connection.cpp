#include "ssh_connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#include <chrono>
#include <cstring>
#include <filesystem>

namespace {

// Password handed to the keyboard-interactive callback through the
// session's abstract pointer.
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        // Every prompt gets the password; there is nothing else to offer.
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

} // namespace

SshConnection::SshConnection(SSHConfig target)
    : target_(std::move(target)), io_mutex_(std::make_shared<std::mutex>()) {}

SshConnection::~SshConnection() {
    close();
}

Result<void> SshConnection::establish(StatusCallback callback) {
    if (active_) return Result<void>::Ok();
    if (target_.host.empty()) {
        return Result<void>::Err(ErrorCode::INVALID_PARAMETER, "No SSH host configured");
    }

    if (callback) callback("Connecting to " + target_.host + "...");

    if (libssh2_init(0) != 0) {
        return Result<void>::Err(ErrorCode::BACKEND_ERROR, "Failed to initialize libssh2");
    }

    auto sock = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (sock.is_err()) {
        return Result<void>::Err(ErrorCode::BACKEND_NOT_AVAILABLE, sock.error);
    }
    sock_ = sock.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        return Result<void>::Err(ErrorCode::BACKEND_ERROR, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }
    if (ret != 0) {
        close();
        return Result<void>::Err(ErrorCode::BACKEND_ERROR, "SSH handshake failed");
    }

    // Send keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = userauth(callback);
    if (auth.is_err()) {
        close();
        return auth;
    }

    active_ = true;
    termkeep_log(fmt::format("ssh: connected to {}:{}", target(), target_.port));
    if (callback) callback("Connected to " + target_.host);
    return Result<void>::Ok();
}

Result<void> SshConnection::userauth(StatusCallback callback) {
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) callback("Auth methods: " + methods);

    // Public key first when a key is configured
    if (!target_.ssh_key_path.empty() &&
        (methods.empty() || methods.find("publickey") != std::string::npos)) {
        std::string key = expand_home(target_.ssh_key_path);
        std::string pub = key + ".pub";
        const char* pub_path = std::filesystem::exists(pub) ? pub.c_str() : nullptr;
        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();

        if (callback) callback("Using public key " + key + "...");
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                                                          pub_path, key.c_str(),
                                                          passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) return Result<void>::Ok();
        if (callback) callback("Public key rejected");
    }

    if (!target_.password.empty() &&
        methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data{target_.password, callback};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                target_.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return Result<void>::Ok();

        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (!target_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        if (callback) callback("Using password auth...");
        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }
        if (ret == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorCode::BACKEND_ERROR,
                             "Authentication failed (check username/password/key)");
}

void SshConnection::close() {
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SshConnection::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ < 0) return false;

    int seconds_to_next = 0;
    if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
        active_ = false;
        return false;
    }
    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

// ── Channels ────────────────────────────────────────────────

Result<LIBSSH2_CHANNEL*> SshConnection::open_channel() {
    using R = Result<LIBSSH2_CHANNEL*>;
    if (!session_) return R::Err(ErrorCode::BACKEND_ERROR, "Not connected");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < deadline) {
        LIBSSH2_CHANNEL* ch;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            ch = libssh2_channel_open_session(session_);
            if (!ch && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return R::Err(ErrorCode::BACKEND_ERROR, "Failed to open SSH channel");
            }
        }
        if (ch) return R::Ok(ch);
        platform::sleep_ms(10);
    }
    return R::Err(ErrorCode::BACKEND_ERROR, "Timed out opening SSH channel");
}

void SshConnection::free_channel(LIBSSH2_CHANNEL* ch) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(ch);
    libssh2_channel_free(ch);
}

Result<LIBSSH2_CHANNEL*> SshConnection::open_shell(const std::string& term, int cols, int rows) {
    using R = Result<LIBSSH2_CHANNEL*>;
    auto opened = open_channel();
    if (opened.is_err()) return opened;
    LIBSSH2_CHANNEL* ch = opened.value;

    int ret;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        ret = libssh2_channel_request_pty_ex(ch, term.c_str(),
                                             static_cast<unsigned int>(term.size()),
                                             nullptr, 0, cols, rows, 0, 0);
    } while (ret == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
    if (ret != 0) {
        free_channel(ch);
        return R::Err(ErrorCode::BACKEND_ERROR, "Failed to request PTY");
    }

    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        ret = libssh2_channel_shell(ch);
    } while (ret == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
    if (ret != 0) {
        free_channel(ch);
        return R::Err(ErrorCode::BACKEND_ERROR, "Failed to request shell");
    }

    return R::Ok(ch);
}

ExecResult SshConnection::exec(const std::string& command, int timeout_ms) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    };

    auto opened = open_channel();
    if (opened.is_err()) return ExecResult{-1, "", opened.error, false, elapsed()};
    LIBSSH2_CHANNEL* ch = opened.value;

    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_exec(ch, command.c_str());
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
    if (rc != 0) {
        free_channel(ch);
        return ExecResult{-1, "", "Failed to exec command on channel", false, elapsed()};
    }

    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    auto deadline = started + std::chrono::milliseconds(timeout_ms);
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n, e;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n > 0) out.append(buf, static_cast<size_t>(n));
            e = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (e > 0) err.append(buf, static_cast<size_t>(e));
            eof = libssh2_channel_eof(ch);
        }
        if ((n < 0 && n != LIBSSH2_ERROR_EAGAIN) || (e < 0 && e != LIBSSH2_ERROR_EAGAIN)) {
            timed_out = false;
            break;
        }
        if (eof && n <= 0 && e <= 0) {
            timed_out = false;
            break;
        }
        if (n <= 0 && e <= 0) platform::sleep_ms(10);
    }

    int exit_status = -1;
    if (!timed_out) {
        do {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(ch);
        } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
        if (rc == 0) {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exit_status = libssh2_channel_get_exit_status(ch);
        }
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
    } else {
        free_channel(ch);
    }

    return ExecResult{exit_status, out, err, timed_out, elapsed()};
}
