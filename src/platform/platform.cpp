#include "platform.hpp"
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

std::optional<FileStat> stat_path(const fs::path& p, bool follow, std::string& err) {
    struct stat st;
    int rc = follow ? ::stat(p.c_str(), &st) : ::lstat(p.c_str(), &st);
    if (rc != 0) {
        err = std::strerror(errno);
        return std::nullopt;
    }

    FileStat out;
    out.size = static_cast<int64_t>(st.st_size);
    out.mtime = static_cast<double>(st.st_mtim.tv_sec) +
                static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    out.is_regular = S_ISREG(st.st_mode);
    out.is_directory = S_ISDIR(st.st_mode);
    out.is_symlink = S_ISLNK(st.st_mode);
    return out;
}

bool durable_append(const fs::path& p, const std::string& data, std::string& err) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        err = std::string("open: ") + std::strerror(errno);
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = std::string("write: ") + std::strerror(errno);
            ::close(fd);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        err = std::string("close: ") + std::strerror(errno);
        return false;
    }
    return true;
}

bool durable_truncate(const fs::path& p, uint64_t length, std::string& err) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        err = std::string("open: ") + std::strerror(errno);
        return false;
    }
    if (::ftruncate(fd, static_cast<off_t>(length)) != 0) {
        err = std::string("ftruncate: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::fsync(fd) != 0) {
        err = std::string("fsync: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        err = std::string("close: ") + std::strerror(errno);
        return false;
    }
    return true;
}

static volatile sig_atomic_t g_interrupted = 0;

static void interrupt_handler(int) {
    g_interrupted = 1;
}

void install_interrupt_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

bool interrupted() {
    return g_interrupted != 0;
}

void set_interrupted(bool value) {
    g_interrupted = value ? 1 : 0;
}

} // namespace platform
