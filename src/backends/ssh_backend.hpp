#pragma once

#include <memory>
#include <mutex>
#include "backend.hpp"

class SshConnection;

// Shells on a remote host over one shared SSH connection, opened on first
// use. Each PTY is its own shell channel.
class SshBackend : public Backend {
public:
    explicit SshBackend(SSHConfig config, BackendSettings settings = {});
    ~SshBackend() override;

    BackendType type() const override { return BackendType::SSH; }
    bool is_available() override;
    Result<SystemInfo> system_info() override;

    Result<std::unique_ptr<PtyHandle>> create_pty(const PtyOptions& options) override;
    ExecResult execute(const std::string& command,
                       const ExecuteOptions& options = {}) override;

    std::string default_shell() const override;
    std::string default_cwd() const override;

    void shutdown() override;

private:
    Result<std::shared_ptr<SshConnection>> connection();

    SSHConfig config_;
    BackendSettings settings_;
    std::mutex mutex_;
    std::shared_ptr<SshConnection> connection_;
};
