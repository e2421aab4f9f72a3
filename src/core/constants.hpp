#pragma once

#include <cstddef>

// ── Sessions ────────────────────────────────────────────────
constexpr int DEFAULT_MAX_SESSIONS           = 10;
constexpr int DEFAULT_COMMAND_TIMEOUT_MS     = 30000;
constexpr int DEFAULT_SESSION_EXPIRY_MS      = 3600000;  // 1 hour idle
constexpr std::size_t DEFAULT_SESSION_BUFFER = 1024 * 1024;  // 1 MB
constexpr int DEFAULT_PTY_COLS               = 160;
constexpr int DEFAULT_PTY_ROWS               = 40;
constexpr const char* DEFAULT_SESSION_ID     = "default";
constexpr const char* DEFAULT_TERM           = "xterm-256color";

// ── Command protocol timing ─────────────────────────────────
constexpr int SESSION_CREATE_SETTLE_MS       = 500;   // Shell startup before "ready"
constexpr int COMMAND_SETTLE_MS              = 100;   // Residual output from the previous command
constexpr int MARKER_WRITE_PACING_MS         = 50;    // Gap between marker/command writes
constexpr int COMPLETION_SETTLE_MS           = 200;   // Trailing output after the end marker

// ── Background processes ────────────────────────────────────
constexpr int DEFAULT_POLL_INTERVAL_MS       = 1000;
constexpr int DEFAULT_BACKGROUND_TIMEOUT_MS  = 300000;  // 5 min
constexpr std::size_t DEFAULT_PROCESS_BUFFER = 10 * 1024 * 1024;  // 10 MB
constexpr const char* INTERRUPT_SEQUENCE     = "\x03";  // Ctrl+C

// ── Log tailing ─────────────────────────────────────────────
constexpr int DEFAULT_TAIL_LINES             = 100;
constexpr int DEFAULT_TAIL_TIMEOUT_MS        = 300000;
constexpr int TAIL_READ_TIMEOUT_MS           = 10000;
constexpr int TAIL_STAT_TIMEOUT_MS           = 5000;

// ── Backends ────────────────────────────────────────────────
constexpr int BACKEND_EXEC_TIMEOUT_MS        = 30000;
constexpr int BACKEND_PROBE_TIMEOUT_MS       = 5000;
constexpr const char* DEFAULT_DOCKER_IMAGE   = "ubuntu:latest";
constexpr const char* DEFAULT_CONTAINER_PREFIX = "termkeep-";
constexpr int SSH_DEFAULT_PORT               = 22;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PTY_READ_BUF_SIZE              = 4096;
constexpr int SSH_READ_BUF_SIZE              = 4096;
