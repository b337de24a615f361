#pragma once

// ── Identity ────────────────────────────────────────────────
constexpr const char* SOLO_VERSION        = "0.1.0";
constexpr const char* DEFAULT_APP_ID      = "work-stack";
constexpr const char* LOCK_FILE_SUFFIX    = ".lock";
constexpr const char* PORT_FILE_SUFFIX    = ".port";

// ── Wire protocol ───────────────────────────────────────────
// Loopback only. Client sends the request word, server answers the ack word.
constexpr const char* ACTIVATE_REQUEST    = "activate";
constexpr const char* ACTIVATE_ACK        = "ok";
constexpr const char* LOOPBACK_ADDRESS    = "127.0.0.1";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_POLL_INTERVAL_MS   = 500;   // accept() poll, bounds shutdown latency
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 1000;  // activation round trip from a duplicate
constexpr int DEFAULT_READ_TIMEOUT_MS    = 1000;  // server waits this long for a request word

// Accepted ranges for the configurable timeouts
constexpr int MIN_POLL_INTERVAL_MS       = 10;
constexpr int MAX_POLL_INTERVAL_MS       = 10000;
constexpr int MIN_IO_TIMEOUT_MS          = 50;
constexpr int MAX_IO_TIMEOUT_MS          = 60000;

// ── Sockets ─────────────────────────────────────────────────
constexpr int ACTIVATION_BACKLOG         = 1;
constexpr int ACTIVATION_READ_BUF_SIZE   = 1024;
constexpr int ACTIVATION_REPLY_BUF_SIZE  = 16;

// Port record values must fall strictly inside (0, MAX_PORT_EXCLUSIVE)
constexpr int MAX_PORT_EXCLUSIVE         = 65535;
