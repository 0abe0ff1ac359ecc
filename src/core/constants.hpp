#pragma once

#include <cstdint>

// ── State directory layout ──────────────────────────────────
// Everything forager persists lives under <source>/.forager/ unless
// state_dir is configured explicitly.
constexpr const char* STATE_DIR_NAME        = ".forager";
constexpr const char* UPLOADED_CSV          = "uploaded_files.csv";
constexpr const char* SKIPPED_CSV           = "skipped_files.csv";
constexpr const char* PROCESSING_LOG        = "processing_errors.log";
constexpr const char* METADATA_FILE         = "metadata.yaml";
constexpr const char* CONFIG_FILE           = "config.yaml";
constexpr const char* RUN_LOG               = "forager.log";
constexpr const char* OUTBOX_DIR            = "outbox";

// ── Ledger values ───────────────────────────────────────────
constexpr const char* UPLOAD_STATUS_SUCCESS = "success";
constexpr const char* SKIP_REASON_OVERSIZED = "oversized";

// ── Run statistics reasons ──────────────────────────────────
constexpr const char* STAT_ALREADY_PROCESSED = "already_processed";
constexpr const char* STAT_OVERSIZED         = "oversized";
constexpr const char* STAT_DEFERRED          = "deferred";
constexpr const char* STAT_BATCH_LIMIT       = "batch_limit";

// ── Publish topics ──────────────────────────────────────────
constexpr const char* TOPIC_STATUS          = "status";
constexpr const char* TOPIC_ERROR           = "error";
constexpr const char* TOPIC_STATS           = "upload.stats";

// ── Metadata keys ───────────────────────────────────────────
constexpr const char* META_ORIGINAL_PATH    = "original_path";
constexpr const char* META_FILENAME         = "filename";
constexpr const char* META_SIZE_BYTES       = "size_bytes";
constexpr const char* META_MTIME            = "last_modified_timestamp_source";
constexpr const char* META_DEVICE_NAME      = "device_name";

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_SOURCE        = "/data/";
constexpr int DEFAULT_SKIP_LAST_N           = 1;
constexpr int DEFAULT_NUM_FILES             = 10;
constexpr double DEFAULT_SLEEP_SECS         = 3.0;
constexpr int64_t DEFAULT_MAX_FILE_SIZE     = 1LL * 1024 * 1024 * 1024;  // 1 GiB

// ── SFTP ────────────────────────────────────────────────────
constexpr int SFTP_DEFAULT_PORT             = 22;
constexpr int SFTP_CHUNK_SIZE               = 32768;
constexpr int SSH_CONNECT_TIMEOUT_SECS      = 30;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                       = 0;
constexpr int EXIT_FAILURE_RUN              = 1;
constexpr int EXIT_USAGE                    = 2;
