#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int EXEC_POLL_INTERVAL_MS      = 10;    // Sleep between empty exit-status polls

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SFTP_COPY_BUF_SIZE         = 32768;

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;

// ── File-transfer fake ──────────────────────────────────────
// Fixed values returned by MockSFTP in place of a real remote filesystem.
constexpr const char* FAKE_REMOTE_CWD    = "/remote";
constexpr const char* FAKE_LOCAL_ROOT    = "/local";
constexpr unsigned int FAKE_FILE_MODE    = 0644;

// ── Logging ─────────────────────────────────────────────────
constexpr const char* LOG_ENABLE_ENV     = "SSHFAKE_LOG";
constexpr const char* LOG_PATH_ENV       = "SSHFAKE_LOG_PATH";
constexpr const char* LOG_FILE_NAME      = "sshfake_debug.log";
constexpr std::size_t LOG_PREVIEW_CHARS  = 500;
