#pragma once

#include "backend.hpp"

// Shells on this machine, spawned under forkpty.
class LocalBackend : public Backend {
public:
    explicit LocalBackend(BackendSettings settings = {});

    BackendType type() const override { return BackendType::LOCAL; }
    bool is_available() override { return true; }
    Result<SystemInfo> system_info() override;

    Result<std::unique_ptr<PtyHandle>> create_pty(const PtyOptions& options) override;
    ExecResult execute(const std::string& command,
                       const ExecuteOptions& options = {}) override;

    std::string default_shell() const override;
    std::string default_cwd() const override;

private:
    BackendSettings settings_;
};
