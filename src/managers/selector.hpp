#pragma once

#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>
#include "ledger.hpp"

// Decides which scanned files make up this run's batch.
//
//   1. drop paths the ledger already knows (any status)
//   2. reject files over max_file_size, recording them as skipped/oversized
//   3. sort by mtime or name, ties broken by path
//   4. hold back the last skip_last_n (a producer may still be writing them)
//   5. truncate to num_files (0 = no limit)
class Selector {
public:
    using RejectCallback = std::function<void(const FileRecord&, const std::string& reason)>;

    Selector(const RunConfig& config, Ledger& ledger);

    // Called for every size rejection, after the ledger write.
    void on_reject(RejectCallback cb) { on_reject_ = std::move(cb); }

    // Throws LedgerWriteError if a rejection cannot be recorded.
    std::vector<FileRecord> select(std::vector<FileRecord> candidates, RunStats& stats);

    // Deterministic total order for the given key.
    static void sort_records(std::vector<FileRecord>& records, SortKey key);

private:
    const RunConfig& config_;
    Ledger& ledger_;
    RejectCallback on_reject_;
};
