#include "ssh_pty.hpp"
#include "ssh_connection.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>

SshPty::SshPty(std::shared_ptr<SshConnection> connection, LIBSSH2_CHANNEL* channel)
    : connection_(std::move(connection)),
      io_mutex_(connection_->io_mutex()),
      channel_(channel) {
    reader_thread_ = std::thread(&SshPty::reader_loop, this);
}

SshPty::~SshPty() {
    running_ = false;
    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    close_channel();
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (channel_) {
        libssh2_channel_free(channel_);
        channel_ = nullptr;
    }
}

void SshPty::close_channel() {
    if (closed_.exchange(true)) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (channel_) libssh2_channel_close(channel_);
}

bool SshPty::write(const std::string& data) {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    if (closed_) return false;

    size_t sent = 0;
    int retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++retries > 100) return false;
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) return false;
        retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void SshPty::kill() {
    close_channel();
}

void SshPty::resize(int cols, int rows) {
    if (closed_) return;
    int rc;
    do {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_channel_request_pty_size(channel_, cols, rows);
    } while (rc == LIBSSH2_ERROR_EAGAIN && (platform::sleep_ms(10), true));
}

void SshPty::reader_loop() {
    char buf[SSH_READ_BUF_SIZE];
    int exit_code = -1;

    while (running_ && !closed_) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n <= 0) eof = libssh2_channel_eof(channel_) != 0;
        }
        if (n > 0) {
            emit_data(std::string(buf, static_cast<size_t>(n)));
            continue;
        }
        if (eof || (n < 0 && n != LIBSSH2_ERROR_EAGAIN)) break;
        platform::sleep_ms(10);
    }

    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        exit_code = libssh2_channel_get_exit_status(channel_);
    }
    closed_ = true;
    termkeep_log(fmt::format("ssh pty: shell on {} exited with code {}",
                             connection_->target(), exit_code));
    // Must be the last statement: the listener may destroy this object.
    emit_exit(exit_code);
}
