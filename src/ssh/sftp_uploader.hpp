#pragma once

#include <memory>
#include <string>
#include <managers/uploader.hpp>
#include "session.hpp"

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Uploads over SFTP into uploader.remote_dir. The session is opened on the
// first upload and kept for the rest of the run; a transport failure drops
// it so the next file reconnects.
//
// Each file lands as "<name>.part" and is renamed into place once complete,
// followed by a "<name>.meta.yaml" sidecar.
class SftpUploader : public Uploader {
public:
    explicit SftpUploader(const UploaderConfig& config);
    ~SftpUploader() override;

    Result<void> upload(const UploadRequest& request) override;
    std::string describe() const override;

private:
    UploaderConfig config_;
    std::unique_ptr<SessionManager> session_;
    LIBSSH2_SFTP* sftp_ = nullptr;
    bool remote_dir_ready_ = false;

    Result<void> ensure_connected();
    void disconnect();

    Result<void> mkdir_p(const std::string& dir);
    Result<void> write_local_file(const std::string& local, const std::string& remote);
    Result<void> write_string(const std::string& content, const std::string& remote);
    Result<void> rename_into_place(const std::string& from, const std::string& to);
    std::string sftp_error(const std::string& what) const;
    std::string remote_path(const std::string& name) const;
};
