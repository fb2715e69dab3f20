#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* VIZBIN_VERSION = "0.4.0";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_CACHE_MAX_ENTRIES  = 100;   // LRU range-cache capacity
constexpr int DEFAULT_WINDOW_ROUNDS      = 32;    // Rounds per playback fetch window
constexpr int DEFAULT_GPUS_PER_NODE      = 1;     // Files written before gpus_per_node existed

// ── Display limits ──────────────────────────────────────────
constexpr int MAX_QUEUE_ROWS             = 40;    // Queue entries printed before eliding
constexpr int MAX_JOB_ROWS               = 50;    // Job rows printed by `jobs`
constexpr int ALLOC_GRID_WIDTH           = 36;    // Units per row in the allocation grid

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".vizbin";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEBUG_LOG_NAME     = "vizbin_debug.log";
