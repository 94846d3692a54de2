#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "storage/operation.hpp"

namespace pagekv::persistence {

// ── WAL header constants ─────────────────────────────────────────────────────

static constexpr char kWalMagic[] = "PKWAL";          // 5 bytes (no NUL)
static constexpr std::size_t kWalMagicSize = 5;
static constexpr uint16_t kWalVersion = 1;
static constexpr std::size_t kWalHeaderSize = kWalMagicSize + sizeof(uint16_t);

// ── WAL frame ────────────────────────────────────────────────────────────────
//
// [record_length: u32 LE][sequence: u64 LE][op_tag: u8]
// [key_len: u32 LE][key][value_len: u32 LE][value][crc32: u32 LE]
//
// record_length counts sequence through value. The CRC covers every byte
// before it, record_length included. Deletes carry value_len = 0.

static constexpr std::size_t kFrameLengthSize = sizeof(uint32_t);
static constexpr std::size_t kFrameCrcSize = sizeof(uint32_t);
static constexpr uint32_t kMinRecordLength = 8 + 1 + 4 + 4;
static constexpr uint32_t kMaxRecordLength = 64u * 1024 * 1024;

struct WalRecord {
    uint64_t sequence = 0;
    Operation op;
};

// Serialise one frame, length prefix and CRC included.
[[nodiscard]] std::vector<uint8_t> serialise_record(uint64_t sequence,
                                                    const Operation& op);

// ── WalReader ────────────────────────────────────────────────────────────────
//
// Lazy, forward-only scan of a WAL file from its first frame. Restartable only
// by constructing a new reader.
//
// Iteration ends at a clean end of file or at the first frame that is
// truncated, fails its CRC, has an impossible length, or does not advance the
// sequence number. The latter cases set tail_dropped(); they are the
// signature of a crash mid-append and are not errors. OS read failures end
// iteration with error() set.

class WalReader {
public:
    explicit WalReader(const std::filesystem::path& path);
    ~WalReader();

    WalReader(const WalReader&) = delete;
    WalReader& operator=(const WalReader&) = delete;

    // Opens the file and validates the header. A missing file, an empty file
    // or a torn header (a strict prefix of a valid one) reads as an empty log
    // with has_header() == false.
    [[nodiscard]] std::error_code open();

    void close();

    // Reads the next valid record. Returns false when the log is exhausted.
    [[nodiscard]] bool next(WalRecord& record);

    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }
    [[nodiscard]] bool tail_dropped() const noexcept { return tail_dropped_; }
    [[nodiscard]] bool has_header() const noexcept { return has_header_; }

    // Byte offset just past the last valid frame (or the header).
    [[nodiscard]] uint64_t valid_end() const noexcept { return offset_; }

    // Bytes beyond valid_end() once a tail was dropped.
    [[nodiscard]] uint64_t dropped_bytes() const noexcept {
        return tail_dropped_ ? file_size_ - offset_ : 0;
    }

    // Sequence number of the last record returned, 0 if none.
    [[nodiscard]] uint64_t last_sequence() const noexcept { return last_sequence_; }

private:
    void drop_tail(const char* reason);

    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t file_size_ = 0;
    uint64_t offset_ = 0;
    uint64_t last_sequence_ = 0;
    bool has_header_ = false;
    bool tail_dropped_ = false;
    bool done_ = false;
    std::error_code error_;
    std::vector<uint8_t> frame_;
};

// ── Replay summary ───────────────────────────────────────────────────────────

struct WalReplayStats {
    uint64_t records = 0;
    uint64_t last_sequence = 0;
    bool tail_dropped = false;
};

// ── Write-Ahead Log ──────────────────────────────────────────────────────────
//
// Append-only binary file. Every append is fsynced before it returns.
// Thread-safety: NOT thread-safe. Caller must serialise access.

class WAL {
public:
    // Invoked per record during replay; a non-empty error stops the replay.
    using Visitor = std::function<std::error_code(const WalRecord&)>;

    explicit WAL(const std::filesystem::path& path);
    ~WAL();

    // Non-copyable, non-movable.
    WAL(const WAL&) = delete;
    WAL& operator=(const WAL&) = delete;
    WAL(WAL&&) = delete;
    WAL& operator=(WAL&&) = delete;

    // Opens the WAL file, creating it with a fresh header if needed. An
    // invalid tail is truncated away so later appends stay reachable.
    // The next sequence number is greater than both the last logged record
    // and `applied_floor` (the highest sequence already on data pages).
    [[nodiscard]] std::error_code open(uint64_t applied_floor = 0);

    void close();

    // Append one mutation and fsync. On success `sequence` receives the
    // number assigned to it. On failure no number is consumed.
    [[nodiscard]] std::error_code append(const Operation& op, uint64_t& sequence);

    // Scan the WAL at `path` from the start, calling `visitor` for each record.
    [[nodiscard]] static std::error_code replay(const std::filesystem::path& path,
                                                const Visitor& visitor,
                                                WalReplayStats* stats = nullptr);

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Sequence number the next append will receive.
    [[nodiscard]] uint64_t next_sequence() const { return next_sequence_; }

    [[nodiscard]] uint64_t last_sequence() const { return next_sequence_ - 1; }

    // Bytes of header and valid frames.
    [[nodiscard]] uint64_t size_bytes() const { return end_offset_; }

private:
    // Truncate the file and write just the header ("PKWAL" + version).
    [[nodiscard]] std::error_code write_header();

    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t end_offset_ = 0;
    uint64_t next_sequence_ = 1;
    bool failed_ = false;
};

} // namespace pagekv::persistence
