#include "uploader.hpp"
#include "directory_uploader.hpp"
#include <ssh/sftp_uploader.hpp>
#include <yaml-cpp/yaml.h>

std::string render_sidecar(const UploadRequest& request) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << request.upload_name;
    out << YAML::Key << "timestamp_ns" << YAML::Value << request.timestamp_ns;
    out << YAML::Key << "meta" << YAML::Value << YAML::BeginMap;
    for (const auto& [k, v] : request.metadata) {
        out << YAML::Key << k << YAML::Value << v;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::string sidecar_name(const std::string& upload_name) {
    return upload_name + ".meta.yaml";
}

Result<std::shared_ptr<Uploader>> make_uploader(const RunConfig& config) {
    const auto& u = config.uploader;

    if (u.type == "directory") {
        if (u.spool_dir.empty()) {
            return Result<std::shared_ptr<Uploader>>::Err("uploader.spool_dir is not set");
        }
        return Result<std::shared_ptr<Uploader>>::Ok(
            std::make_shared<DirectoryUploader>(u.spool_dir));
    }

    if (u.type == "sftp") {
        if (u.host.empty()) {
            return Result<std::shared_ptr<Uploader>>::Err("uploader.host is required for sftp");
        }
        if (u.user.empty()) {
            return Result<std::shared_ptr<Uploader>>::Err("uploader.user is required for sftp");
        }
        if (!u.password && !u.ssh_key_path) {
            return Result<std::shared_ptr<Uploader>>::Err(
                "sftp uploader needs uploader.password or uploader.ssh_key_path");
        }
        if (u.remote_dir.empty()) {
            return Result<std::shared_ptr<Uploader>>::Err("uploader.remote_dir is required for sftp");
        }
        return Result<std::shared_ptr<Uploader>>::Ok(std::make_shared<SftpUploader>(u));
    }

    return Result<std::shared_ptr<Uploader>>::Err("Unknown uploader type: " + u.type);
}
