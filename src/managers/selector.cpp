#include "selector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

Selector::Selector(const RunConfig& config, Ledger& ledger)
    : config_(config), ledger_(ledger) {
}

void Selector::sort_records(std::vector<FileRecord>& records, SortKey key) {
    if (key == SortKey::MTIME) {
        std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
            if (a.mtime != b.mtime) return a.mtime < b.mtime;
            return a.path < b.path;
        });
    } else {
        std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
            if (a.name != b.name) return a.name < b.name;
            return a.path < b.path;
        });
    }
}

std::vector<FileRecord> Selector::select(std::vector<FileRecord> candidates, RunStats& stats) {
    std::vector<FileRecord> eligible;
    eligible.reserve(candidates.size());

    for (auto& rec : candidates) {
        if (ledger_.contains(rec.path)) {
            stats.skipped[STAT_ALREADY_PROCESSED]++;
            continue;
        }

        if (config_.max_file_size > 0 && rec.size_bytes > config_.max_file_size) {
            log_warn(fmt::format("Skipping {}: {} ({} bytes > {} bytes)", rec.path,
                                 SKIP_REASON_OVERSIZED, rec.size_bytes, config_.max_file_size));
            // Dry runs never touch the ledger
            if (!config_.dry_run) {
                ledger_.record_skipped(rec, SKIP_REASON_OVERSIZED);
            }
            stats.skipped[STAT_OVERSIZED]++;
            if (on_reject_) on_reject_(rec, SKIP_REASON_OVERSIZED);
            continue;
        }

        eligible.push_back(std::move(rec));
    }

    sort_records(eligible, config_.sort_key);

    size_t skip_n = config_.skip_last_n > 0 ? static_cast<size_t>(config_.skip_last_n) : 0;
    if (skip_n > 0) {
        size_t deferred = std::min(skip_n, eligible.size());
        eligible.resize(eligible.size() - deferred);
        stats.skipped[STAT_DEFERRED] += static_cast<int64_t>(deferred);
        if (deferred > 0) {
            log_info(fmt::format("Skipping {} recently modified files", deferred));
        }
    }

    if (config_.num_files > 0 && eligible.size() > static_cast<size_t>(config_.num_files)) {
        size_t over = eligible.size() - static_cast<size_t>(config_.num_files);
        eligible.resize(static_cast<size_t>(config_.num_files));
        stats.skipped[STAT_BATCH_LIMIT] += static_cast<int64_t>(over);
    }

    return eligible;
}
