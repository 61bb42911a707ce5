#pragma once

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_WATCHDOG_SECS      = 15;    // Max wait for a connection_result
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 10;    // TCP connect + handshake + auth
constexpr int SSH_IO_POLL_MS             = 50;    // Transport I/O loop granularity
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Back-off while libssh2 returns EAGAIN
constexpr int CLI_POLL_MS                = 50;    // Console loop: stdin poll timeout
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr const char* PTY_TERM_TYPE      = "xterm";

// ── Transcript placeholders ─────────────────────────────────
constexpr const char* MASKED_INPUT_TEXT  = "(input hidden)";
constexpr const char* EMPTY_INPUT_TEXT   = "(empty line sent)";

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".rterm";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* LOG_FILE_NAME      = "rterm_debug.log";

// ── Version ─────────────────────────────────────────────────
constexpr const char* RTERM_VERSION      = "0.1.0";
