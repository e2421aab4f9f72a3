#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Owned child pid. Reaps (and if needed kills) the child on destruction.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code (128+N for signal N).
    // timeout_ms = -1 means indefinite wait; returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // SIGTERM, then SIGKILL after 2s.
    void terminate();

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    friend struct SpawnAccess;
};

struct RunOptions {
    std::string cwd;                 // empty: inherit
    EnvMap env;                      // merged over the current environment
    std::string input;               // written to stdin, then closed
    int timeout_ms = 30000;
};

// Run program with args to completion, capturing stdout and stderr.
// A timed out child is terminated and reported with timed_out = true.
// Spawn failure is exit_code 127 with the reason in stderr_data.
ExecResult run_process(const std::string& program,
                       const std::vector<std::string>& args,
                       const RunOptions& options = {});

// Convenience: /bin/sh -c command
ExecResult run_shell(const std::string& command, const RunOptions& options = {});

} // namespace platform
