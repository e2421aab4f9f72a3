#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// An interactive pseudo-terminal process: a byte stream out, writes in,
// and a single exit notification. Concrete handles (forkpty, SSH shell
// channel) deliver output from their own reader thread.
//
// Listeners are copied out under the registry lock and invoked without it,
// so a listener may call remove_listener() or write() freely. A listener
// removed concurrently with a delivery can still see that one chunk.
// An exit listener registered after the process died is called at once.
class PtyHandle {
public:
    using DataListener = std::function<void(const std::string& data)>;
    using ExitListener = std::function<void(int exit_code)>;
    using ListenerId = uint64_t;

    virtual ~PtyHandle() = default;

    ListenerId on_data(DataListener cb);
    void remove_listener(ListenerId id);
    void on_exit(ExitListener cb);
    size_t listener_count() const;

    virtual bool write(const std::string& data) = 0;
    virtual void kill() = 0;
    virtual void resize(int cols, int rows) = 0;
    virtual bool alive() const = 0;

protected:
    void emit_data(const std::string& data);
    void emit_exit(int exit_code);

private:
    mutable std::mutex listeners_mutex_;
    std::map<ListenerId, DataListener> data_listeners_;
    ExitListener exit_listener_;
    ListenerId next_id_ = 1;
    std::optional<int> exit_code_;
};

struct PtySpawnOptions {
    std::string program;
    std::vector<std::string> args;
    std::string cwd;
    EnvMap env;                  // merged over the current environment
    std::string term = "xterm-256color";
    int cols = 160;
    int rows = 40;
};
