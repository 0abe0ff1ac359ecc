#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "ledger.hpp"
#include "uploader.hpp"

namespace fs = std::filesystem;

// Processes a selected batch in order, one file at a time.
//
// Per file: upload with the merged metadata, record the outcome, then
// optionally delete the source. The source is deleted only after the
// ledger row is on disk. A failed upload is counted and reported and the
// batch moves on; a ledger write failure propagates (LedgerWriteError).
class Dispatcher {
public:
    // uploader may be null only for a dry run.
    Dispatcher(const RunConfig& config,
               Ledger& ledger,
               Uploader* uploader,
               const Metadata& metadata,
               PublishCallback publish = nullptr);

    // Stops early (stats.interrupted) if SIGINT/SIGTERM arrives between files.
    void dispatch(const std::vector<FileRecord>& batch, RunStats& stats);

    // Static metadata plus the per-file fields for one record.
    Metadata build_metadata(const FileRecord& file, const std::string& upload_name) const;

    // Where upload failures are appended (<state_dir>/processing_errors.log).
    void set_error_log(const fs::path& path) { error_log_ = path; }

private:
    const RunConfig& config_;
    Ledger& ledger_;
    Uploader* uploader_;
    const Metadata& metadata_;
    PublishCallback publish_;
    fs::path error_log_;

    bool process_one(const FileRecord& file, RunStats& stats);
    void report_failure(const FileRecord& file, const std::string& error, RunStats& stats);
    void pause_between_files() const;
};
