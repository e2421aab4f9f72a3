#pragma once

// Scripted stand-in for a shell behind a PTY.
//
// A FakePty runs a worker thread that plays the shell: every written chunk
// is echoed back the way a terminal line discipline would, then each
// complete line is interpreted as a tiny command language over an
// in-memory file map. `hang` blocks the shell until Ctrl+C arrives, while
// typed input keeps being echoed.

#include <backends/backend.hpp>
#include <platform/pty.hpp>
#include <session/session_manager.hpp>
#include <condition_variable>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fake {

struct ShellOptions {
    bool echo_input = true;
    std::string prompt = "user@fake:~$ ";
    bool exit_on_start = false;     // shell dies right after spawning
};

// Files shared by every shell of one backend; tests edit them while
// sessions run.
class FileSystem {
public:
    void write(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = content;
    }

    void append(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] += content;
    }

    bool read(const std::string& path, std::string& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) return false;
        out = it->second;
        return true;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
};

class FakePty : public PtyHandle {
public:
    FakePty(ShellOptions options, std::shared_ptr<FileSystem> fs, std::string cwd)
        : options_(std::move(options)), fs_(std::move(fs)), cwd_(std::move(cwd)) {
        worker_ = std::thread(&FakePty::run, this);
    }

    ~FakePty() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach();
            } else {
                worker_.join();
            }
        }
    }

    bool write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dead_) return false;
        input_.push_back(data);
        cv_.notify_all();
        return true;
    }

    void kill() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (dead_) return;
            dead_ = true;
            killed_ = true;
        }
        cv_.notify_all();
    }

    void resize(int cols, int rows) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cols_ = cols;
        rows_ = rows;
    }

    bool alive() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !dead_;
    }

    std::vector<std::string> executed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return executed_;
    }

private:
    void run() {
        if (options_.exit_on_start) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                dead_ = true;
            }
            emit_exit(1);
            return;
        }
        emit_data(options_.prompt);

        while (true) {
            std::string chunk;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&] { return stopping_ || killed_ || !input_.empty(); });
                if (stopping_) return;
                if (killed_) break;
                chunk = input_.front();
                input_.pop_front();
            }
            if (!feed(chunk)) break;
        }

        bool killed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dead_ = true;
            killed = killed_;
        }
        emit_exit(killed ? 137 : exit_code_);
    }

    // False once the shell has exited.
    bool feed(const std::string& chunk) {
        std::string echo;
        for (char c : chunk) {
            if (c == '\x03') {
                if (!echo.empty()) emit_echo(echo);
                echo.clear();
                interrupt();
                continue;
            }
            echo += c;
            if (c == '\n') {
                pending_.push_back(line_);
                line_.clear();
            } else {
                line_ += c;
            }
        }
        if (!echo.empty()) emit_echo(echo);

        while (!hanging_ && !pending_.empty()) {
            std::string line = pending_.front();
            pending_.pop_front();
            if (!execute(line)) return false;
        }
        return true;
    }

    void emit_echo(const std::string& text) {
        if (options_.echo_input) emit_data(crlf(text));
    }

    void interrupt() {
        line_.clear();
        emit_data("^C\r\n");
        if (hanging_) {
            hanging_ = false;
            status_ = 130;
        }
        emit_data(options_.prompt);
    }

    static std::string crlf(const std::string& text) {
        std::string out;
        for (char c : text) {
            if (c == '\n') out += "\r\n";
            else out += c;
        }
        return out;
    }

    // Split on blanks, honoring quotes and backslashes; $? expands outside
    // single quotes.
    std::vector<std::string> words(const std::string& line) const {
        std::vector<std::string> out;
        std::string cur;
        bool in_word = false;
        char quote = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote) {
                if (c == quote) quote = 0;
                else if (quote == '"' && c == '$' && i + 1 < line.size() && line[i + 1] == '?') {
                    cur += std::to_string(status_);
                    ++i;
                } else {
                    cur += c;
                }
                continue;
            }
            if (c == '\\' && i + 1 < line.size()) {
                cur += line[++i];
                in_word = true;
            } else if (c == '\'' || c == '"') {
                quote = c;
                in_word = true;
            } else if (c == ' ' || c == '\t') {
                if (in_word) out.push_back(cur);
                cur.clear();
                in_word = false;
            } else if (c == '$' && i + 1 < line.size() && line[i + 1] == '?') {
                cur += std::to_string(status_);
                in_word = true;
                ++i;
            } else {
                cur += c;
                in_word = true;
            }
        }
        if (in_word) out.push_back(cur);
        return out;
    }

    // Runs one line; false when the shell exits.
    bool execute(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            executed_.push_back(line);
        }

        // a || b
        auto alt = line.find(" || ");
        std::string first = alt == std::string::npos ? line : line.substr(0, alt);

        std::string out;
        bool exiting = false;
        status_ = run_simple(first, out, exiting);
        if (!exiting && status_ != 0 && alt != std::string::npos) {
            out.clear();
            status_ = run_simple(line.substr(alt + 4), out, exiting);
        }
        if (exiting) {
            exit_code_ = status_;
            return false;
        }

        if (!out.empty()) emit_data(crlf(out));
        if (!hanging_) emit_data(options_.prompt);
        return true;
    }

    int run_simple(const std::string& line, std::string& out, bool& exiting) {
        auto args = words(line);
        bool quiet = false;
        std::vector<std::string> argv;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "2>/dev/null") { quiet = true; continue; }
            if (args[i] == "<") continue;
            argv.push_back(args[i]);
        }
        if (argv.empty()) return status_;

        const std::string& cmd = argv[0];
        auto fail = [&](const std::string& msg, int code) {
            if (!quiet) out = msg + "\n";
            return code;
        };
        auto file_arg = [&](std::string& content) -> bool {
            return fs_->read(argv.back(), content);
        };

        if (cmd == "echo") {
            for (size_t i = 1; i < argv.size(); ++i) {
                if (i > 1) out += ' ';
                out += argv[i];
            }
            out += "\n";
            return 0;
        }
        if (cmd == "true") return 0;
        if (cmd == "false") return 1;
        if (cmd == "pwd") { out = cwd_ + "\n"; return 0; }
        if (cmd == "exit") {
            exiting = true;
            return argv.size() > 1 ? std::stoi(argv[1]) : 0;
        }
        if (cmd == "hang") {
            hanging_ = true;
            return 0;
        }
        if (cmd == "seq" && argv.size() == 2) {
            int n = std::stoi(argv[1]);
            for (int i = 1; i <= n; ++i) out += std::to_string(i) + "\n";
            return 0;
        }
        if (cmd == "bytes" && argv.size() == 2) {
            out = std::string(static_cast<size_t>(std::stoi(argv[1])), 'x') + "\n";
            return 0;
        }

        std::string content;
        if (cmd == "stat" || cmd == "wc" || cmd == "cat" || cmd == "tail") {
            if (argv.size() < 2 || !file_arg(content)) {
                return fail(cmd + ": " + (argv.size() > 1 ? argv.back() : "") +
                            ": No such file or directory", 1);
            }
        }
        if (cmd == "stat" || cmd == "wc") {
            out = std::to_string(content.size()) + "\n";
            return 0;
        }
        if (cmd == "cat") {
            out = content;
            return 0;
        }
        if (cmd == "tail" && argv.size() == 4 && argv[1] == "-c") {
            size_t from = static_cast<size_t>(std::stoll(argv[2].substr(1)));
            out = from == 0 || from - 1 >= content.size() ? "" : content.substr(from - 1);
            return 0;
        }
        if (cmd == "tail" && argv.size() == 4 && argv[1] == "-n") {
            size_t n = static_cast<size_t>(std::stoi(argv[2]));
            std::vector<std::string> lines;
            std::string cur;
            for (char c : content) {
                if (c == '\n') { lines.push_back(cur); cur.clear(); }
                else cur += c;
            }
            if (!cur.empty()) lines.push_back(cur);
            size_t start = lines.size() > n ? lines.size() - n : 0;
            for (size_t i = start; i < lines.size(); ++i) out += lines[i] + "\n";
            return 0;
        }

        return fail("fake: " + cmd + ": command not found", 127);
    }

    ShellOptions options_;
    std::shared_ptr<FileSystem> fs_;
    std::string cwd_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> input_;
    std::vector<std::string> executed_;
    bool stopping_ = false;
    bool killed_ = false;
    bool dead_ = false;
    int cols_ = 0;
    int rows_ = 0;

    // Worker-thread state
    std::string line_;
    std::deque<std::string> pending_;
    bool hanging_ = false;
    int status_ = 0;
    int exit_code_ = 0;

    std::thread worker_;
};

class FakeBackend : public Backend {
public:
    explicit FakeBackend(ShellOptions options = {})
        : options_(std::move(options)), fs_(std::make_shared<FileSystem>()) {}

    BackendType type() const override { return BackendType::LOCAL; }
    bool is_available() override { return true; }

    Result<SystemInfo> system_info() override {
        SystemInfo info;
        info.backend = BackendType::LOCAL;
        info.os = "Fake OS";
        info.hostname = "fake";
        info.user = "user";
        info.home_dir = default_cwd();
        info.shell = default_shell();
        return Result<SystemInfo>::Ok(info);
    }

    Result<std::unique_ptr<PtyHandle>> create_pty(const PtyOptions& options) override {
        using R = Result<std::unique_ptr<PtyHandle>>;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_create_) return R::Err(ErrorCode::BACKEND_ERROR, "fake: no pty available");
            last_options_ = options;
            ++created_;
        }
        return R::Ok(std::make_unique<FakePty>(options_, fs_, options.cwd));
    }

    ExecResult execute(const std::string& command, const ExecuteOptions& options) override {
        ExecResult r;
        r.exit_code = 0;
        r.stdout_data = command;
        return r;
    }

    std::string default_shell() const override { return "/bin/fake"; }
    std::string default_cwd() const override { return "/home/user"; }

    FileSystem& files() { return *fs_; }
    void set_fail_create(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_create_ = fail;
    }
    int created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return created_;
    }
    PtyOptions last_options() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_options_;
    }

private:
    ShellOptions options_;
    std::shared_ptr<FileSystem> fs_;
    mutable std::mutex mutex_;
    bool fail_create_ = false;
    int created_ = 0;
    PtyOptions last_options_;
};

// Short delays so the protocol runs in milliseconds.
inline SessionConfig fast_config() {
    SessionConfig config;
    config.max_sessions = 3;
    config.default_timeout_ms = 2000;
    config.create_settle_ms = 10;
    config.command_settle_ms = 5;
    config.write_pacing_ms = 2;
    config.completion_settle_ms = 20;
    return config;
}

// Spin until pred() or the deadline; returns pred().
inline bool wait_for(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace fake
