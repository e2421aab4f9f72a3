#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include "pty.hpp"

// forkpty-backed PtyHandle. A reader thread polls the master fd and
// delivers output to listeners; EOF/EIO on the master means the child is
// gone, at which point the exit code is reaped and the exit listener fires.
class LocalPty : public PtyHandle {
public:
    static Result<std::unique_ptr<PtyHandle>> spawn(const PtySpawnOptions& options);

    ~LocalPty() override;

    bool write(const std::string& data) override;
    void kill() override;
    void resize(int cols, int rows) override;
    bool alive() const override;

    int pid() const { return pid_; }

    LocalPty(const LocalPty&) = delete;
    LocalPty& operator=(const LocalPty&) = delete;

private:
    LocalPty(int master_fd, int pid);

    void reader_loop();
    int reap(bool block);

    int master_fd_;
    int pid_;
    std::atomic<bool> running_{true};
    std::atomic<bool> reaped_{false};
    std::atomic<int> exit_code_{-1};
    std::mutex write_mutex_;
    std::thread reader_thread_;
};
