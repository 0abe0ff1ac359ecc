#include "dispatcher.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cmath>

Dispatcher::Dispatcher(const RunConfig& config,
                       Ledger& ledger,
                       Uploader* uploader,
                       const Metadata& metadata,
                       PublishCallback publish)
    : config_(config), ledger_(ledger), uploader_(uploader),
      metadata_(metadata), publish_(std::move(publish)) {
}

Metadata Dispatcher::build_metadata(const FileRecord& file, const std::string& upload_name) const {
    Metadata meta = metadata_;
    meta[META_ORIGINAL_PATH] = file.path;
    meta[META_FILENAME] = upload_name;
    meta[META_SIZE_BYTES] = std::to_string(file.size_bytes);
    meta[META_MTIME] = iso_utc(file.mtime);
    return meta;
}

void Dispatcher::dispatch(const std::vector<FileRecord>& batch, RunStats& stats) {
    for (size_t i = 0; i < batch.size(); ++i) {
        if (platform::interrupted()) {
            log_warn(fmt::format("Interrupted; {} file(s) left for the next run", batch.size() - i));
            stats.interrupted = true;
            return;
        }

        bool uploaded = process_one(batch[i], stats);

        // Only pause when another upload follows
        if (uploaded && i + 1 < batch.size()) {
            pause_between_files();
        }
    }
}

bool Dispatcher::process_one(const FileRecord& file, RunStats& stats) {
    std::string upload_name = apply_filename_modifiers(file.name, config_.prefix, config_.suffix);

    if (config_.dry_run) {
        log_info(fmt::format("[dry run] would upload {} as {} ({})",
                             file.path, upload_name, format_bytes(file.size_bytes)));
        stats.dry_run_files++;
        return false;
    }

    UploadRequest req;
    req.local_path = file.path;
    req.upload_name = upload_name;
    req.metadata = build_metadata(file, upload_name);
    req.timestamp_ns = epoch_to_ns(file.mtime);

    std::string start = fmt::format("Uploading {} ({})", file.path, format_bytes(file.size_bytes));
    log_info(start);
    if (publish_) publish_(TOPIC_STATUS, start);
    auto result = uploader_ ? uploader_->upload(req)
                            : Result<void>::Err("no uploader configured");
    if (result.is_err()) {
        report_failure(file, result.error, stats);
        return false;
    }

    // Throws LedgerWriteError; nothing below runs unless the row is durable
    ledger_.record_uploaded(file, upload_name, req.metadata);
    stats.files_uploaded++;
    stats.bytes_uploaded += file.size_bytes;
    std::string done = fmt::format("Uploaded {} as {}", file.path, upload_name);
    log_info(done);
    if (publish_) publish_(TOPIC_STATUS, done);

    if (config_.delete_files) {
        std::error_code ec;
        fs::remove(file.path, ec);
        if (ec) {
            std::string msg = fmt::format("Uploaded but could not delete {}: {}", file.path, ec.message());
            log_error(msg);
            if (publish_) publish_(TOPIC_ERROR, msg);
            stats.errors++;
        } else {
            log_debug("Deleted " + file.path);
        }
    }
    return true;
}

void Dispatcher::report_failure(const FileRecord& file, const std::string& error, RunStats& stats) {
    std::string msg = fmt::format("Upload of {} failed: {}", file.path, error);
    log_error(msg);
    stats.errors++;
    if (publish_) publish_(TOPIC_ERROR, msg);

    if (!error_log_.empty()) {
        std::string err;
        std::string line = fmt::format("{} - {} - {}\n", now_iso_utc(), file.path, error);
        if (!platform::durable_append(error_log_, line, err)) {
            log_warn(fmt::format("Could not append to {}: {}", error_log_.string(), err));
        }
    }
}

void Dispatcher::pause_between_files() const {
    if (config_.sleep_secs <= 0) return;
    log_debug(fmt::format("Sleeping {:.1f}s", config_.sleep_secs));

    // Sleep in short slices so an interrupt is noticed promptly
    int remaining = static_cast<int>(std::lround(config_.sleep_secs * 1000));
    while (remaining > 0 && !platform::interrupted()) {
        int slice = remaining < 100 ? remaining : 100;
        platform::sleep_ms(slice);
        remaining -= slice;
    }
}
