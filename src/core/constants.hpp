#pragma once

#include <cstddef>

// ── Version ─────────────────────────────────────────────────
constexpr const char* DEVBOX_VERSION = "0.1.0";

// ── Session defaults ────────────────────────────────────────
// Used when neither the operator nor a config file supplies a value.
constexpr const char* DEFAULT_CONTAINER_NAME = "ai-scientist-container";
constexpr const char* DEFAULT_IMAGE_NAME     = "ai-scientist-image";
constexpr const char* DEFAULT_MOUNT_DIR      = "/mnt/e/docker/ai-scientist/";

// ── Launch defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_RUNTIME        = "docker";
constexpr const char* DEFAULT_WORKSPACE      = "/workspace";
constexpr const char* DEFAULT_ENV_FILE       = ".env";
constexpr const char* DEFAULT_SHELL          = "/bin/bash";
constexpr const char* DEFAULT_GPUS           = "all";

// ── Timing ──────────────────────────────────────────────────
constexpr int MONITOR_TICK_MS            = 1000;  // Session monitor wait tick
constexpr int MIN_MONITOR_TICK_MS        = 10;

// ── Logging ─────────────────────────────────────────────────
constexpr size_t LOG_OUTPUT_TRUNCATE     = 500;   // Max bytes of command output per log line

// ── Config file names ───────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR      = ".devbox";
constexpr const char* GLOBAL_CONFIG_FILE     = "config.yaml";
constexpr const char* PROJECT_CONFIG_FILE    = "devbox.yaml";
