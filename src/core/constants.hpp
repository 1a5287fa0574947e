#pragma once

// ── External tool ───────────────────────────────────────────
// Leading word of every tool command line; replaced by the resolved path.
constexpr const char* TOOL_TOKEN = "lxc";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_COMMAND_TIMEOUT_SECS = 120;  // Max time for a single tool command
constexpr int PROBE_TIMEOUT_SECS           = 30;   // Usage sampling commands
constexpr int TERMINATE_GRACE_MS           = 2000; // SIGTERM -> SIGKILL window
constexpr int GUARDIAN_SLEEP_SLICE_MS      = 100;  // Shutdown responsiveness of loops

// ── Guardian defaults ───────────────────────────────────────
constexpr int DEFAULT_CPU_THRESHOLD        = 90;
constexpr int DEFAULT_RAM_THRESHOLD        = 90;
constexpr int DEFAULT_HOST_CHECK_SECS      = 60;
constexpr int DEFAULT_INSTANCE_CHECK_SECS  = 600;
constexpr const char* AUTO_SYSTEM_ACTOR    = "auto-system";

// ── Ports ───────────────────────────────────────────────────
constexpr int DEFAULT_PORT_FIRST           = 10000;
constexpr int DEFAULT_PORT_LAST            = 19999;

// ── Confirmation protocol ───────────────────────────────────
constexpr int DEFAULT_CONFIRM_TTL_SECS     = 60;

// ── Display limits ──────────────────────────────────────────
constexpr int HISTORY_DISPLAY_LIMIT        = 10;
constexpr size_t EXEC_OUTPUT_DISPLAY_LIMIT = 1000;
constexpr int MAX_LOG_TAIL_LINES           = 1000;

// ── Persisted document names (under the state directory) ────
constexpr const char* INSTANCES_FILE = "instances.yaml";
constexpr const char* ADMINS_FILE    = "admins.yaml";
constexpr const char* PORTS_FILE     = "ports.yaml";

// ── Naming templates ────────────────────────────────────────
// Use fmt::format with these: fmt::format(INSTANCE_ID_TEMPLATE, prefix, owner, seq)
constexpr const char* INSTANCE_ID_TEMPLATE = "{}-vps-{}-{}";
constexpr const char* CLONE_ID_TEMPLATE    = "{}-{}-clone-{}";
constexpr const char* MIGRATE_TEMP_TEMPLATE = "{}-{}-temp-{}";
constexpr const char* SNAPSHOT_TEMPLATE    = "{}-backup-{}";

// ── Release ─────────────────────────────────────────────────
constexpr const char* WARDEN_VERSION = "0.4.0";
