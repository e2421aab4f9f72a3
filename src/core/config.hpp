#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.termkeep/config.yaml, or built-in defaults when it does not
    // exist. Environment overrides are applied either way.
    static Result<Config> load();

    // Load a specific file (no environment overrides).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (no environment overrides).
    static Result<Config> parse(const std::string& yaml_text);

    // TERMKEEP_BACKEND, TERMKEEP_MAX_SESSIONS, TERMKEEP_DEFAULT_TIMEOUT
    void apply_env_overrides();

    // Accessors
    const BackendSettings& backend() const { return backend_; }
    const DockerConfig& docker() const { return docker_; }
    const SSHConfig& ssh() const { return ssh_; }
    const SessionConfig& sessions() const { return sessions_; }
    const PollingConfig& polling() const { return polling_; }
    const TailConfig& tail() const { return tail_; }
    const std::string& log_path() const { return log_path_; }

    void set_backend_type(const std::string& type) { backend_.type = type; }

public:
    Config() = default;

private:
    Result<void> validate() const;

    BackendSettings backend_;
    DockerConfig docker_;
    SSHConfig ssh_;
    SessionConfig sessions_;
    PollingConfig polling_;
    TailConfig tail_;
    std::string log_path_;

    friend class ConfigBuilder;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write a commented default config. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path = get_config_path());
