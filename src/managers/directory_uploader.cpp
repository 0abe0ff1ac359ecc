#include "directory_uploader.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

DirectoryUploader::DirectoryUploader(const fs::path& spool_dir)
    : spool_dir_(spool_dir) {
}

std::string DirectoryUploader::describe() const {
    return "dir://" + spool_dir_.string();
}

Result<void> DirectoryUploader::upload(const UploadRequest& request) {
    std::error_code ec;
    fs::create_directories(spool_dir_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create spool dir {}: {}",
                                             spool_dir_.string(), ec.message()));
    }

    fs::path target = spool_dir_ / request.upload_name;
    fs::path part = spool_dir_ / (request.upload_name + ".part");

    fs::copy_file(request.local_path, part, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        fs::remove(part, ec);
        return Result<void>::Err(fmt::format("Copy {} -> {} failed: {}",
                                             request.local_path.string(), part.string(), ec.message()));
    }
    fs::rename(part, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(part, rm_ec);
        return Result<void>::Err(fmt::format("Rename into {} failed: {}", target.string(), ec.message()));
    }

    fs::path meta = spool_dir_ / sidecar_name(request.upload_name);
    fs::path meta_part = spool_dir_ / (sidecar_name(request.upload_name) + ".part");
    {
        std::ofstream out(meta_part, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot write metadata sidecar " + meta_part.string());
        }
        out << render_sidecar(request);
        if (!out.flush()) {
            return Result<void>::Err("Cannot write metadata sidecar " + meta_part.string());
        }
    }
    fs::rename(meta_part, meta, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Rename into {} failed: {}", meta.string(), ec.message()));
    }

    log_debug(fmt::format("Spooled {} as {}", request.local_path.string(), target.string()));
    return Result<void>::Ok();
}
