#include "forager_service.hpp"
#include "dispatcher.hpp"
#include "file_scanner.hpp"
#include "selector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

ForagerService::ForagerService(const RunConfig& config,
                               const Metadata& metadata,
                               std::shared_ptr<Uploader> uploader,
                               PublishCallback publish)
    : config_(config), metadata_(metadata), uploader_(std::move(uploader)),
      publish_(std::move(publish)), ledger_(config.state_dir) {
}

std::string ForagerService::device_name() const {
    auto it = metadata_.find(META_DEVICE_NAME);
    if (it == metadata_.end() || it->second.empty()) return "unknown";
    return it->second;
}

void ForagerService::publish(const std::string& topic, const std::string& message) {
    if (!publish_) return;
    nlohmann::json body = {
        {"device_name", device_name()},
        {"timestamp", now_iso_utc()},
        {"message", message},
    };
    publish_(topic, body.dump());
}

std::string ForagerService::stats_json(const RunStats& stats, const std::string& device_name) {
    nlohmann::json skipped = nlohmann::json::object();
    for (const auto& [reason, count] : stats.skipped) {
        skipped[reason] = count;
    }
    nlohmann::json body = {
        {"device_name", device_name},
        {"files_scanned", stats.files_scanned},
        {"files_skipped", stats.total_skipped()},
        {"skipped", skipped},
        {"files_uploaded", stats.files_uploaded},
        {"bytes_uploaded", stats.bytes_uploaded},
        {"errors", stats.errors},
        {"scan_errors", stats.scan_errors},
        {"dry_run_files", stats.dry_run_files},
        {"interrupted", stats.interrupted},
        {"elapsed_secs", stats.elapsed_secs},
    };
    return body.dump();
}

// ── Setup ──────────────────────────────────────────────────

Result<void> ForagerService::prepare() {
    std::error_code ec;
    if (!fs::is_directory(config_.source, ec)) {
        return Result<void>::Err("Source directory does not exist: " + config_.source);
    }

    if (!uploader_ && !config_.dry_run) {
        auto made = make_uploader(config_);
        if (made.is_err()) return Result<void>::Err(made.error);
        uploader_ = made.value;
    }

    if (!loaded_) {
        // Creates the state dir and empty ledgers on first use
        ledger_.load();
        loaded_ = true;
    }
    return Result<void>::Ok();
}

std::vector<FileRecord> ForagerService::scan(RunStats& stats) {
    FileScanner scanner(config_.source, config_.glob, config_.recursive, config_.follow_symlinks);
    scanner.exclude_dir(config_.state_dir);
    if (config_.uploader.type == "directory" && !config_.uploader.spool_dir.empty()) {
        scanner.exclude_dir(config_.uploader.spool_dir);
    }

    std::vector<FileRecord> found;
    scanner.scan(
        [&](const FileRecord& rec) {
            stats.files_scanned++;
            found.push_back(rec);
        },
        [&](const ScanError& err) {
            stats.scan_errors++;
            std::string msg = fmt::format("Cannot scan {}: {}", err.path, err.message);
            log_warn(msg);
            publish(TOPIC_ERROR, msg);
        });

    log_info(fmt::format("Found {} matching file(s) in {}", found.size(), config_.source));
    return found;
}

// ── Run ────────────────────────────────────────────────────

Result<RunStats> ForagerService::run(StatusCallback cb) {
    RunStats stats;
    double started = now_epoch_secs();

    auto ready = prepare();
    if (ready.is_err()) return Result<RunStats>::Err(ready.error);

    log_info(fmt::format("Starting batch from {} (device {}){}", config_.source, device_name(),
                         config_.dry_run ? " [dry run]" : ""));
    publish(TOPIC_STATUS, "Batch started");
    if (cb) cb("Scanning " + config_.source);

    Selector selector(config_, ledger_);
    selector.on_reject([this](const FileRecord& rec, const std::string& reason) {
        publish(TOPIC_ERROR, fmt::format("Skipped {}: {} ({})", rec.path, reason,
                                         format_bytes(rec.size_bytes)));
    });

    auto batch = selector.select(scan(stats), stats);
    if (cb) cb(fmt::format("Selected {} file(s)", batch.size()));

    if (batch.empty()) {
        log_info("Nothing to upload");
    } else {
        if (cb && uploader_) cb("Uploading to " + uploader_->describe());
        Dispatcher dispatcher(config_, ledger_, uploader_.get(), metadata_,
                              [this](const std::string& topic, const std::string& msg) {
                                  publish(topic, msg);
                              });
        dispatcher.set_error_log(fs::path(config_.state_dir) / PROCESSING_LOG);
        dispatcher.dispatch(batch, stats);
    }

    stats.elapsed_secs = now_epoch_secs() - started;
    log_info(fmt::format("Batch finished in {}: {} uploaded ({}), {} skipped, {} error(s)",
                         format_elapsed(stats.elapsed_secs), stats.files_uploaded,
                         format_bytes(stats.bytes_uploaded), stats.total_skipped(), stats.errors));
    publish(TOPIC_STATUS, stats.interrupted ? "Batch interrupted" : "Batch finished");
    if (publish_) publish_(TOPIC_STATS, stats_json(stats, device_name()));

    return Result<RunStats>::Ok(stats);
}
