#include "pty.hpp"
#include <vector>

PtyHandle::ListenerId PtyHandle::on_data(DataListener cb) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_id_++;
    data_listeners_[id] = std::move(cb);
    return id;
}

void PtyHandle::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    data_listeners_.erase(id);
}

void PtyHandle::on_exit(ExitListener cb) {
    std::optional<int> exited;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        exit_listener_ = cb;
        exited = exit_code_;
    }
    if (exited && cb) cb(*exited);
}

size_t PtyHandle::listener_count() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return data_listeners_.size();
}

void PtyHandle::emit_data(const std::string& data) {
    std::vector<DataListener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        targets.reserve(data_listeners_.size());
        for (const auto& [id, cb] : data_listeners_) targets.push_back(cb);
    }
    for (const auto& cb : targets) {
        if (cb) cb(data);
    }
}

void PtyHandle::emit_exit(int exit_code) {
    ExitListener cb;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        if (exit_code_) return;
        exit_code_ = exit_code;
        cb = exit_listener_;
    }
    if (cb) cb(exit_code);
}
