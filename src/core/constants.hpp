#pragma once

// ── Status command ──────────────────────────────────────────
constexpr const char* QSTAT_PROGRAM       = "qstat";
constexpr const char* QSTAT_XML_FLAG      = "-x";    // extended (XML) output
constexpr const char* QSTAT_JOB_ELEMENT   = "Job";

// ── Timing ──────────────────────────────────────────────────
constexpr int REFRESH_INTERVAL_MS         = 2000;  // Auto-refresh cadence, measured from end of cycle
constexpr int INPUT_POLL_MS               = 100;   // Main loop stdin poll granularity

// ── Buffer sizes ────────────────────────────────────────────
constexpr int CAPTURE_READ_BUF_SIZE       = 4096;

// ── Dashboard layout ────────────────────────────────────────
constexpr int HEADER_ROW                  = 0;
constexpr int COLUMN_HEADER_ROW           = 1;
constexpr int FIRST_JOB_ROW               = 2;
constexpr int AUTO_REFRESH_MARK_COL       = 1;
constexpr int ONLY_MINE_MARK_COL          = 25;
constexpr int STATUS_COL                  = 70;
constexpr int EMPTY_MESSAGE_COL           = 20;

constexpr const char* EMPTY_QUEUE_MESSAGE = "Currently no jobs in the queue.";
constexpr const char* CELL_PLACEHOLDER    = "-";

// ── Versioning ──────────────────────────────────────────────
constexpr const char* QWATCH_VERSION      = "1.1.0";
