#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

socket_t connect_tcp(const std::string& host, int port, int timeout_secs, std::string& err) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0) {
        err = "Failed to resolve host " + host + ": " + gai_strerror(gai);
        return FORAGER_INVALID_SOCKET;
    }

    socket_t sock = FORAGER_INVALID_SOCKET;
    err = "No usable address for " + host;

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            err = std::string("Failed to create socket: ") + std::strerror(errno);
            continue;
        }

        set_nonblocking(sock);
        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            err = std::string("Failed to connect: ") + std::strerror(errno);
            close_socket(sock);
            sock = FORAGER_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
            if (revents == 0) {
                err = "Connection timed out: " + host;
                close_socket(sock);
                sock = FORAGER_INVALID_SOCKET;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                err = std::string("Connection failed: ") + std::strerror(sock_err);
                close_socket(sock);
                sock = FORAGER_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }

    freeaddrinfo(res);
    if (sock != FORAGER_INVALID_SOCKET) err.clear();
    return sock;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
