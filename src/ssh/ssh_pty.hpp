#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <platform/pty.hpp>

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
class SshConnection;

// PtyHandle over an interactive SSH shell channel. A reader thread pulls
// channel data with brief io_mutex holds; channel EOF is the shell exiting.
class SshPty : public PtyHandle {
public:
    SshPty(std::shared_ptr<SshConnection> connection, LIBSSH2_CHANNEL* channel);
    ~SshPty() override;

    bool write(const std::string& data) override;
    void kill() override;
    void resize(int cols, int rows) override;
    bool alive() const override { return !closed_; }

    SshPty(const SshPty&) = delete;
    SshPty& operator=(const SshPty&) = delete;

private:
    void reader_loop();
    void close_channel();

    std::shared_ptr<SshConnection> connection_;
    std::shared_ptr<std::mutex> io_mutex_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> running_{true};
    std::atomic<bool> closed_{false};
    std::mutex write_mutex_;
    std::thread reader_thread_;
};
