#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct UploadRequest {
    fs::path local_path;
    std::string upload_name;        // remote file name (prefix/suffix applied)
    Metadata metadata;              // static metadata + per-file fields
    int64_t timestamp_ns = 0;       // source mtime
};

// Transfers one file and its metadata to the remote store. Implementations
// report transport failures through the Result; they must not throw for them.
class Uploader {
public:
    virtual ~Uploader() = default;

    virtual Result<void> upload(const UploadRequest& request) = 0;

    // One-line description for status output ("sftp://user@host:/dir").
    virtual std::string describe() const = 0;
};

// YAML sidecar written next to every uploaded file:
//   name, timestamp_ns, meta: {key: value, ...}
std::string render_sidecar(const UploadRequest& request);

// Sidecar file name for an upload: "<upload_name>.meta.yaml".
std::string sidecar_name(const std::string& upload_name);

// Build the uploader selected by config.uploader.type.
// Returns Err for an unknown type or incomplete settings.
Result<std::shared_ptr<Uploader>> make_uploader(const RunConfig& config);
