#include "common/file_io.hpp"
#include "common/error.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pagekv {

std::error_code pwrite_all(int fd, const uint8_t* data, std::size_t len,
                           off_t offset) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::pwrite(fd, data + written, len - written,
                          offset + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_system_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code pread_some(int fd, uint8_t* buf, std::size_t len, off_t offset,
                           std::size_t& got) {
    got = 0;
    while (got < len) {
        auto n = ::pread(fd, buf + got, len - got,
                         offset + static_cast<off_t>(got));
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_system_error();
        }
        if (n == 0) break;  // EOF
        got += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code pread_exact(int fd, uint8_t* buf, std::size_t len,
                            off_t offset) {
    std::size_t got = 0;
    if (auto ec = pread_some(fd, buf, len, offset, got)) return ec;
    if (got != len) return make_error_code(Errc::short_read);
    return {};
}

std::error_code sync_fd(int fd) {
    while (::fdatasync(fd) < 0) {
        if (errno != EINTR) return last_system_error();
    }
    return {};
}

std::error_code truncate_fd(int fd, off_t size) {
    while (::ftruncate(fd, size) < 0) {
        if (errno != EINTR) return last_system_error();
    }
    return {};
}

std::error_code file_size(int fd, off_t& size) {
    struct stat st {};
    if (::fstat(fd, &st) < 0) return last_system_error();
    size = st.st_size;
    return {};
}

std::error_code sync_directory(const char* path) {
    int fd = ::open(path, O_RDONLY | O_DIRECTORY);
    if (fd < 0) return last_system_error();
    std::error_code ec;
    while (::fsync(fd) < 0) {
        if (errno != EINTR) {
            ec = last_system_error();
            break;
        }
    }
    ::close(fd);
    return ec;
}

} // namespace pagekv
