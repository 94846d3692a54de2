#pragma once

#include <cstddef>
#include <cstdint>
#include <system_error>

#include <sys/types.h>

namespace pagekv {

// ── Positional POSIX I/O ────────────────────────────────────────────────────
//
// Thin wrappers that retry on EINTR and on short transfers. Failures carry
// errno in std::system_category().

// Write exactly `len` bytes at `offset`.
[[nodiscard]] std::error_code pwrite_all(int fd, const uint8_t* data,
                                         std::size_t len, off_t offset);

// Read exactly `len` bytes at `offset`. Errc::short_read if EOF comes first.
[[nodiscard]] std::error_code pread_exact(int fd, uint8_t* buf,
                                          std::size_t len, off_t offset);

// Read up to `len` bytes at `offset`, stopping at EOF. `got` receives the count.
[[nodiscard]] std::error_code pread_some(int fd, uint8_t* buf, std::size_t len,
                                         off_t offset, std::size_t& got);

// fdatasync, retried on EINTR.
[[nodiscard]] std::error_code sync_fd(int fd);

// Truncate to `size` bytes.
[[nodiscard]] std::error_code truncate_fd(int fd, off_t size);

// Current size of the file behind `fd`.
[[nodiscard]] std::error_code file_size(int fd, off_t& size);

// fsync the directory so newly created files survive a crash.
[[nodiscard]] std::error_code sync_directory(const char* path);

} // namespace pagekv
