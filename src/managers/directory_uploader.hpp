#pragma once

#include <string>
#include <filesystem>
#include "uploader.hpp"

namespace fs = std::filesystem;

// Uploads into a local spool directory that an external agent drains.
// Each file lands as <spool>/<upload_name> with a YAML sidecar; both are
// written to a ".part" name first and renamed into place.
class DirectoryUploader : public Uploader {
public:
    explicit DirectoryUploader(const fs::path& spool_dir);

    Result<void> upload(const UploadRequest& request) override;
    std::string describe() const override;

    const fs::path& spool_dir() const { return spool_dir_; }

private:
    fs::path spool_dir_;
};
