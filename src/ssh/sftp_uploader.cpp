#include "sftp_uploader.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <vector>

SftpUploader::SftpUploader(const UploaderConfig& config)
    : config_(config) {
}

SftpUploader::~SftpUploader() {
    disconnect();
}

std::string SftpUploader::describe() const {
    return fmt::format("sftp://{}@{}:{}", config_.user, config_.host, config_.remote_dir);
}

std::string SftpUploader::remote_path(const std::string& name) const {
    std::string dir = config_.remote_dir;
    if (!dir.empty() && dir.back() != '/') dir += '/';
    return dir + name;
}

std::string SftpUploader::sftp_error(const std::string& what) const {
    if (sftp_) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code != LIBSSH2_FX_OK) {
            return fmt::format("{} (sftp status {})", what, code);
        }
    }
    return fmt::format("{} ({})", what, session_ ? session_->last_error() : "no session");
}

// ── Connection ─────────────────────────────────────────────

Result<void> SftpUploader::ensure_connected() {
    if (session_ && session_->is_active() && sftp_) {
        return Result<void>::Ok();
    }
    disconnect();

    SessionTarget target;
    target.host = config_.host;
    target.port = config_.port;
    target.user = config_.user;
    target.password = config_.password.value_or("");
    target.timeout = config_.timeout;
    target.ssh_key_path = config_.ssh_key_path;
    target.ssh_public_key_path = config_.ssh_public_key_path;

    session_ = std::make_unique<SessionManager>(target);
    auto result = session_->establish([](const std::string& msg) { log_debug(msg); });
    if (result.failed()) {
        std::string err = result.get_output();
        disconnect();
        return Result<void>::Err(fmt::format("SSH connection to {} failed: {}", config_.host, err));
    }

    sftp_ = libssh2_sftp_init(session_->get_raw_session());
    if (!sftp_) {
        std::string err = session_->last_error();
        disconnect();
        return Result<void>::Err("Failed to start SFTP subsystem: " + err);
    }

    log_info(fmt::format("Connected to {}", describe()));
    return Result<void>::Ok();
}

void SftpUploader::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        session_->close();
        session_.reset();
    }
    remote_dir_ready_ = false;
}

// ── Remote filesystem ──────────────────────────────────────

Result<void> SftpUploader::mkdir_p(const std::string& dir) {
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
        size_t next = dir.find('/', pos + 1);
        partial = dir.substr(0, next);
        pos = next;
        if (partial.empty() || partial == "/") continue;

        LIBSSH2_SFTP_ATTRIBUTES attrs;
        if (libssh2_sftp_stat(sftp_, partial.c_str(), &attrs) == 0) {
            if (!LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
                return Result<void>::Err(fmt::format("Remote path {} is not a directory", partial));
            }
            continue;
        }

        int rc = libssh2_sftp_mkdir(sftp_, partial.c_str(),
                                    LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP |
                                    LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
                                    LIBSSH2_SFTP_S_IXOTH);
        if (rc != 0) {
            return Result<void>::Err(sftp_error("Cannot create remote directory " + partial));
        }
    }
    return Result<void>::Ok();
}

Result<void> SftpUploader::write_local_file(const std::string& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<void>::Err("Cannot open " + local);
    }

    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP);
    if (!fh) {
        return Result<void>::Err(sftp_error("Cannot open remote file " + remote));
    }

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        const char* p = buf.data();
        size_t left = static_cast<size_t>(got);
        while (left > 0) {
            ssize_t n = libssh2_sftp_write(fh, p, left);
            if (n < 0) {
                std::string err = sftp_error("Write to " + remote + " failed");
                libssh2_sftp_close(fh);
                return Result<void>::Err(err);
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    if (in.bad()) {
        libssh2_sftp_close(fh);
        return Result<void>::Err("Read error on " + local);
    }

    if (libssh2_sftp_close(fh) != 0) {
        return Result<void>::Err(sftp_error("Close of " + remote + " failed"));
    }
    return Result<void>::Ok();
}

Result<void> SftpUploader::write_string(const std::string& content, const std::string& remote) {
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote.c_str(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP);
    if (!fh) {
        return Result<void>::Err(sftp_error("Cannot open remote file " + remote));
    }

    size_t off = 0;
    while (off < content.size()) {
        ssize_t n = libssh2_sftp_write(fh, content.data() + off, content.size() - off);
        if (n < 0) {
            std::string err = sftp_error("Write to " + remote + " failed");
            libssh2_sftp_close(fh);
            return Result<void>::Err(err);
        }
        off += static_cast<size_t>(n);
    }

    if (libssh2_sftp_close(fh) != 0) {
        return Result<void>::Err(sftp_error("Close of " + remote + " failed"));
    }
    return Result<void>::Ok();
}

Result<void> SftpUploader::rename_into_place(const std::string& from, const std::string& to) {
    int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned int>(from.size()),
                                    to.c_str(), static_cast<unsigned int>(to.size()),
                                    LIBSSH2_SFTP_RENAME_OVERWRITE |
                                    LIBSSH2_SFTP_RENAME_ATOMIC |
                                    LIBSSH2_SFTP_RENAME_NATIVE);
    if (rc != 0) {
        // Servers without the overwrite extension refuse to replace an existing file
        libssh2_sftp_unlink(sftp_, to.c_str());
        rc = libssh2_sftp_rename(sftp_, from.c_str(), to.c_str());
    }
    if (rc != 0) {
        return Result<void>::Err(sftp_error(fmt::format("Rename {} -> {} failed", from, to)));
    }
    return Result<void>::Ok();
}

// ── Upload ─────────────────────────────────────────────────

Result<void> SftpUploader::upload(const UploadRequest& request) {
    auto conn = ensure_connected();
    if (conn.is_err()) return conn;

    if (!remote_dir_ready_) {
        auto mk = mkdir_p(config_.remote_dir);
        if (mk.is_err()) {
            disconnect();
            return mk;
        }
        remote_dir_ready_ = true;
    }

    std::string target = remote_path(request.upload_name);
    std::string part = target + ".part";

    auto wr = write_local_file(request.local_path.string(), part);
    if (wr.is_err()) {
        libssh2_sftp_unlink(sftp_, part.c_str());
        disconnect();
        return wr;
    }
    auto mv = rename_into_place(part, target);
    if (mv.is_err()) {
        disconnect();
        return mv;
    }

    std::string meta = remote_path(sidecar_name(request.upload_name));
    auto meta_wr = write_string(render_sidecar(request), meta + ".part");
    if (meta_wr.is_err()) {
        disconnect();
        return meta_wr;
    }
    auto meta_mv = rename_into_place(meta + ".part", meta);
    if (meta_mv.is_err()) {
        disconnect();
        return meta_mv;
    }

    log_debug(fmt::format("Uploaded {} to {}", request.local_path.string(), target));
    return Result<void>::Ok();
}
