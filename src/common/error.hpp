#pragma once

#include <string>
#include <system_error>

namespace pagekv {

// ── Error codes ──────────────────────────────────────────────────────────────
//
// Store-level failures that have no errno equivalent. OS-level I/O failures
// are reported as std::system_category() codes carrying errno.

enum class Errc {
    corruption = 1,     // page CRC mismatch, malformed header
    short_read,         // unexpected end of file
    entry_too_large,    // key/value cannot fit in a single page
    not_open,           // operation on a closed engine, WAL or page store
    wal_failed,         // an earlier fsync failed; WAL must be reopened
};

[[nodiscard]] const std::error_category& pagekv_category() noexcept;

[[nodiscard]] std::error_code make_error_code(Errc e) noexcept;

// Errno-carrying code for the last failed system call.
[[nodiscard]] std::error_code last_system_error() noexcept;

// CorruptionError: data on disk failed its integrity check.
[[nodiscard]] bool is_corruption(const std::error_code& ec) noexcept;

// IoError: the underlying read/write/sync failed.
[[nodiscard]] bool is_io_error(const std::error_code& ec) noexcept;

} // namespace pagekv

namespace std {
template <>
struct is_error_code_enum<pagekv::Errc> : true_type {};
} // namespace std
