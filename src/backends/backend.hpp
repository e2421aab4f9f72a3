#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/pty.hpp>

enum class BackendType { LOCAL, DOCKER, SSH };

const char* backend_type_name(BackendType type);

// PRETTY_NAME (falling back to VERSION) from /etc/os-release text.
std::string os_release_name(const std::string& text);

struct PtyOptions {
    std::string shell;           // empty: backend default
    std::string cwd;             // empty: backend default
    EnvMap env;
    int cols = DEFAULT_PTY_COLS;
    int rows = DEFAULT_PTY_ROWS;
};

struct ExecuteOptions {
    std::string cwd;
    EnvMap env;
    std::string input;           // fed to stdin
    int timeout_ms = BACKEND_EXEC_TIMEOUT_MS;
};

struct SystemInfo {
    BackendType backend = BackendType::LOCAL;
    std::string os;
    std::string os_version;
    std::string kernel;
    std::string hostname;
    std::string arch;
    std::string user;
    std::string home_dir;
    std::string shell;
    uint64_t total_memory = 0;   // bytes, 0 when unknown
    uint64_t free_memory = 0;

    // Docker
    std::string docker_version;
    std::string container_id;
    std::string image;

    // SSH
    std::string remote_host;
    int remote_port = 0;
};

// Where shells run. A backend allocates interactive PTY processes for
// sessions and runs one-shot commands outside of any session.
class Backend {
public:
    virtual ~Backend() = default;

    virtual BackendType type() const = 0;
    virtual bool is_available() = 0;
    virtual Result<SystemInfo> system_info() = 0;

    virtual Result<std::unique_ptr<PtyHandle>> create_pty(const PtyOptions& options) = 0;
    virtual ExecResult execute(const std::string& command,
                               const ExecuteOptions& options = {}) = 0;

    virtual std::string default_shell() const = 0;
    virtual std::string default_cwd() const = 0;

    // Release backend-wide resources (containers, connections).
    virtual void shutdown() {}
};
