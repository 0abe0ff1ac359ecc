#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// The ledger could not be read back (corrupt header, unreadable file).
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// An outcome could not be made durable. Continuing would risk a duplicate
// upload on restart, so callers must abort the run.
class LedgerWriteError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

enum class LedgerStatus {
    UPLOADED,
    SKIPPED,
};

struct LedgerEntry {
    std::string path;
    LedgerStatus status = LedgerStatus::UPLOADED;
    std::string reason;                 // skipped only
    std::string timestamp;              // ISO 8601 UTC, when the row was written
    int64_t size_bytes = 0;
    double mtime = 0.0;
    std::string filename_at_upload;     // uploaded only
};

// Durable per-file outcome record: the cross-run dedup source of truth.
//
// Persisted as two append-only CSV logs in the state directory:
//   uploaded_files.csv  original_path, filename_at_upload, size_bytes,
//                       last_modified_timestamp_source, upload_timestamp_utc,
//                       metadata_sent_json, upload_status
//   skipped_files.csv   file_path, reason_skipped, size_bytes,
//                       last_modified_timestamp_source, log_timestamp_utc
//
// Every append is fsynced before the call returns. The in-memory index is
// rebuilt from both files by load(), which also cuts off a row left
// incomplete by a crash so later appends start on a clean line.
class Ledger {
public:
    explicit Ledger(const fs::path& state_dir);

    // Create the state dir and any missing CSV (header only), then read both
    // files into the index. Throws LedgerWriteError if files cannot be
    // created, LedgerError if they cannot be parsed.
    void load();

    bool contains(const std::string& path) const;
    std::optional<LedgerEntry> find(const std::string& path) const;

    // Append an "uploaded" row. A path already recorded as uploaded is left
    // alone (no second row). Throws LedgerWriteError.
    void record_uploaded(const FileRecord& file,
                         const std::string& filename_at_upload,
                         const Metadata& metadata_sent);

    // Append a "skipped" row. Throws LedgerWriteError.
    void record_skipped(const FileRecord& file, const std::string& reason);

    size_t size() const { return index_.size(); }
    size_t uploaded_count() const;
    size_t skipped_count() const;

    const fs::path& uploaded_path() const { return uploaded_path_; }
    const fs::path& skipped_path() const { return skipped_path_; }

    static const std::vector<std::string>& uploaded_columns();
    static const std::vector<std::string>& skipped_columns();

    // RFC 4180 helpers
    static std::string csv_escape(const std::string& field);
    static std::string csv_row(const std::vector<std::string>& fields);
    // Parses complete rows. complete_len is set to the byte offset just past
    // the last row terminator; anything after it is a torn row and is dropped.
    static std::vector<std::vector<std::string>> parse_csv(const std::string& content,
                                                           size_t& complete_len);

private:
    fs::path state_dir_;
    fs::path uploaded_path_;
    fs::path skipped_path_;
    std::unordered_map<std::string, LedgerEntry> index_;

    void ensure_file(const fs::path& path, const std::vector<std::string>& columns);
    std::vector<std::vector<std::string>> read_rows(const fs::path& path);
    void read_uploaded();
    void read_skipped();
    void append(const fs::path& path, const std::string& row);
};
