#pragma once

#include <mutex>
#include "backend.hpp"

// Shells inside one long-lived container. The container is the configured
// one when set, otherwise one this backend starts on first use and
// removes on shutdown().
class DockerBackend : public Backend {
public:
    explicit DockerBackend(DockerConfig config = {}, BackendSettings settings = {});
    ~DockerBackend() override;

    BackendType type() const override { return BackendType::DOCKER; }
    bool is_available() override;
    Result<SystemInfo> system_info() override;

    Result<std::unique_ptr<PtyHandle>> create_pty(const PtyOptions& options) override;
    ExecResult execute(const std::string& command,
                       const ExecuteOptions& options = {}) override;

    std::string default_shell() const override;
    std::string default_cwd() const override;

    void shutdown() override;

    // Start (or adopt) the container. Returns its id or name.
    Result<std::string> ensure_container();

private:
    DockerConfig config_;
    BackendSettings settings_;

    std::mutex mutex_;
    std::string container_;          // id or name once ensured
    bool created_ = false;           // started by us, removed on shutdown
    int available_ = -1;             // -1 unknown, 0 no, 1 yes
};
