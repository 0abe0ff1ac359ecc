#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/types.hpp>
#include "ledger.hpp"
#include "uploader.hpp"

// Headless run facade: one call does scan -> select -> dispatch against the
// ledger in config.state_dir. Usable from the CLI or from tests.
class ForagerService {
public:
    // uploader may be null, in which case make_uploader(config) is used.
    ForagerService(const RunConfig& config,
                   const Metadata& metadata,
                   std::shared_ptr<Uploader> uploader = nullptr,
                   PublishCallback publish = nullptr);

    // One batch. Setup problems (bad source dir, uploader settings) come
    // back as Err before anything is scanned. LedgerError and
    // LedgerWriteError are thrown and end the run.
    Result<RunStats> run(StatusCallback cb = nullptr);

    const Ledger& ledger() const { return ledger_; }

    // Name reported with every published message ("unknown" if unset).
    std::string device_name() const;

    // JSON body of the upload.stats message.
    static std::string stats_json(const RunStats& stats, const std::string& device_name);

private:
    RunConfig config_;
    Metadata metadata_;
    std::shared_ptr<Uploader> uploader_;
    PublishCallback publish_;
    Ledger ledger_;
    bool loaded_ = false;

    Result<void> prepare();
    std::vector<FileRecord> scan(RunStats& stats);
    void publish(const std::string& topic, const std::string& message);
};
