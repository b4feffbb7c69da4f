#pragma once

#include <cstdint>

// ── Cache defaults ──────────────────────────────────────────
constexpr int DEFAULT_CACHE_TTL_SECONDS   = 3600;     // 1 hour
constexpr int MIN_CACHE_TTL_SECONDS       = 60;       // 1 minute
constexpr int MAX_CACHE_TTL_SECONDS       = 604800;   // 7 days
constexpr int DEFAULT_CACHE_MAX_SIZE_MB   = 100;      // advisory only, never enforced
constexpr const char* CACHE_FILE_EXTENSION = ".yaml";
constexpr const char* CACHE_TEMP_EXTENSION = ".tmp";
constexpr int STALE_CACHE_TEMP_SECONDS    = 600;      // temp files older than this are abandoned

// ── Environment overrides ───────────────────────────────────
constexpr const char* ENV_CACHE_TTL_SECONDS = "FINCORE_CACHE_TTL_SECONDS";
constexpr const char* ENV_CACHE_ENABLED     = "FINCORE_CACHE_ENABLED";
constexpr const char* ENV_CACHE_DIR         = "FINCORE_CACHE_DIR";
constexpr const char* ENV_CACHE_MAX_SIZE_MB = "FINCORE_CACHE_MAX_SIZE_MB";

// ── Budget health thresholds (percent of limit, lower edge inclusive) ──
constexpr double HEALTH_THRESHOLD_WARNING  = 80.0;
constexpr double HEALTH_THRESHOLD_CRITICAL = 90.0;
constexpr double HEALTH_THRESHOLD_EXCEEDED = 100.0;

// ── Budget alerts ───────────────────────────────────────────
constexpr double APPROACHING_THRESHOLD_BUFFER = 5.0;   // points below a threshold
constexpr double DEFAULT_ALERT_INFO     = 50.0;
constexpr double DEFAULT_ALERT_WARNING  = 80.0;
constexpr double DEFAULT_ALERT_CRITICAL = 100.0;
constexpr double MIN_ALERT_THRESHOLD    = 0.0;
constexpr double MAX_ALERT_THRESHOLD    = 1000.0;

// ── Budget configuration ────────────────────────────────────
constexpr const char* DEFAULT_BUDGET_PERIOD = "monthly";
constexpr int DEFAULT_BUDGET_EXIT_CODE = 1;
constexpr int MIN_EXIT_CODE = 0;
constexpr int MAX_EXIT_CODE = 255;
