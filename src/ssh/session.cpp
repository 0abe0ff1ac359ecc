#include "session.hpp"
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cstring>
#include <cstdlib>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// "~/.ssh/id_ed25519" -> "$HOME/.ssh/id_ed25519"
static std::string expand_home(const std::string& path) {
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(-1), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    return establish_connection(callback);
}

SSHResult SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    // Initialize libssh2
    int rc = libssh2_init(0);
    if (rc != 0) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string err;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout, err);
    if (sock_ < 0) {
        sock_ = -1;
        return SSHResult{-1, "", err};
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        platform::close_socket(sock_);
        sock_ = -1;
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    // Blocking API on top of the non-blocking socket; libssh2 waits on the
    // socket internally, bounded by the session timeout.
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(target_.timeout) * 1000);

    // SSH handshake (key exchange)
    int ret = libssh2_session_handshake(session_, sock_);
    if (ret != 0) {
        std::string msg = "SSH handshake failed: " + last_error();
        close();
        return SSHResult{-1, "", msg};
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif

    // Enable SSH keepalive (send every 30s)
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        close();
        return auth_result;
    }

    active_ = true;

    if (callback) {
        callback("Connected to " + target_.host);
    }

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback callback) {
    // Check what auth methods the server supports
    char* auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                            static_cast<unsigned int>(target_.user.length()));
    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    // Public key from file
    if (target_.ssh_key_path &&
        (methods.empty() || methods.find("publickey") != std::string::npos)) {
        if (callback) callback("Using publickey auth...");

        std::string priv = expand_home(*target_.ssh_key_path);
        std::string pub = target_.ssh_public_key_path ? expand_home(*target_.ssh_public_key_path) : "";
        int ret = libssh2_userauth_publickey_fromfile(
            session_, target_.user.c_str(),
            pub.empty() ? nullptr : pub.c_str(),
            priv.c_str(),
            target_.password.empty() ? nullptr : target_.password.c_str());

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
        if (callback) callback("Publickey auth failed: " + last_error());
    }

    if (target_.password.empty()) {
        return SSHResult{-1, "", "Authentication failed (key rejected, no password configured)"};
    }

    // Try password auth
    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        int ret = libssh2_userauth_password(session_, target_.user.c_str(), target_.password.c_str());
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    // Some servers only offer keyboard-interactive for passwords
    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(session_) = &kbd_data;

        int ret = libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(), kbd_callback);
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check user/password/key)"};
}

std::string SessionManager::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg ? std::string(msg, static_cast<size_t>(len)) : "unknown error";
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
