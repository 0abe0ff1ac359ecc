#pragma once

#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 30;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> ssh_public_key_path;
};

// One authenticated SSH transport. No shell or PTY is opened; callers
// layer subsystems (SFTP) on top of get_raw_session().
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }

    // Most recent libssh2 error message for this session.
    std::string last_error() const;

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    int sock_;
    bool active_;

    SSHResult establish_connection(StatusCallback callback);
    SSHResult ssh_userauth(StatusCallback callback);
};
