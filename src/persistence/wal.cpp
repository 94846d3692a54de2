#include "persistence/wal.hpp"

#include "common/binary_io.hpp"
#include "common/crc32.hpp"
#include "common/error.hpp"
#include "common/file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace pagekv::persistence {

// ── Serialisation ────────────────────────────────────────────────────────────

std::vector<uint8_t> serialise_record(uint64_t sequence, const Operation& op) {
    const std::string& key = op_key(op);
    const std::string_view value = op_value(op);

    // sequence(8) + op_tag(1) + key_len(4) + key + value_len(4) + value
    const uint32_t record_length = kMinRecordLength +
                                   static_cast<uint32_t>(key.size()) +
                                   static_cast<uint32_t>(value.size());

    std::vector<uint8_t> buf;
    buf.reserve(kFrameLengthSize + record_length + kFrameCrcSize);

    write_u32_le(buf, record_length);
    write_u64_le(buf, sequence);
    write_u8(buf, static_cast<uint8_t>(op_tag(op)));
    write_u32_le(buf, static_cast<uint32_t>(key.size()));
    append_raw(buf, key);
    write_u32_le(buf, static_cast<uint32_t>(value.size()));
    append_raw(buf, value);

    // CRC covers record_length through value.
    uint32_t c = crc32(buf.data(), buf.size());
    write_u32_le(buf, c);

    return buf;
}

namespace {

// Decode the body of a frame whose CRC already matched. Returns false if the
// fields do not add up to exactly `record_length` bytes.
bool parse_body(const uint8_t* ptr, const uint8_t* end, WalRecord& rec) {
    uint8_t tag = 0;
    uint32_t key_len = 0;
    uint32_t value_len = 0;

    if (!read_u64_le(ptr, end, rec.sequence)) return false;
    if (!read_u8(ptr, end, tag)) return false;

    if (!read_u32_le(ptr, end, key_len)) return false;
    if (static_cast<uint64_t>(end - ptr) < key_len) return false;
    std::string key(reinterpret_cast<const char*>(ptr), key_len);
    ptr += key_len;

    if (!read_u32_le(ptr, end, value_len)) return false;
    if (static_cast<uint64_t>(end - ptr) != value_len) return false;

    switch (static_cast<OpTag>(tag)) {
        case OpTag::Put:
            rec.op = PutOp{std::move(key),
                           std::string(reinterpret_cast<const char*>(ptr), value_len)};
            return true;
        case OpTag::Delete:
            if (value_len != 0) return false;
            rec.op = DeleteOp{std::move(key)};
            return true;
    }
    return false;
}

// True if `data[0, len)` is a prefix of a valid header (a torn creation).
bool is_header_prefix(const uint8_t* data, std::size_t len) {
    uint8_t hdr[kWalHeaderSize];
    std::memcpy(hdr, kWalMagic, kWalMagicSize);
    store_u16_le(hdr + kWalMagicSize, kWalVersion);
    return len <= kWalHeaderSize && std::memcmp(data, hdr, len) == 0;
}

} // anonymous namespace

// ── WalReader ────────────────────────────────────────────────────────────────

WalReader::WalReader(const std::filesystem::path& path) : path_(path) {}

WalReader::~WalReader() {
    close();
}

std::error_code WalReader::open() {
    close();
    file_size_ = 0;
    offset_ = 0;
    last_sequence_ = 0;
    has_header_ = false;
    tail_dropped_ = false;
    done_ = false;
    error_ = {};

    fd_ = ::open(path_.c_str(), O_RDONLY);
    if (fd_ < 0) {
        if (errno == ENOENT) {
            done_ = true;  // No log yet.
            return {};
        }
        return last_system_error();
    }

    off_t size = 0;
    if (auto ec = file_size(fd_, size)) {
        close();
        return ec;
    }
    file_size_ = static_cast<uint64_t>(size);

    uint8_t hdr[kWalHeaderSize];
    std::size_t got = 0;
    if (auto ec = pread_some(fd_, hdr, kWalHeaderSize, 0, got)) {
        close();
        return ec;
    }

    if (got < kWalHeaderSize) {
        if (!is_header_prefix(hdr, got)) {
            spdlog::error("WAL {}: invalid header", path_.string());
            close();
            return make_error_code(Errc::corruption);
        }
        // Crash while the file was being created: nothing was ever logged.
        done_ = true;
        return {};
    }

    if (std::memcmp(hdr, kWalMagic, kWalMagicSize) != 0) {
        spdlog::error("WAL {}: bad magic", path_.string());
        close();
        return make_error_code(Errc::corruption);
    }

    uint16_t version = load_u16_le(hdr + kWalMagicSize);
    if (version != kWalVersion) {
        spdlog::error("WAL {}: unsupported version {}", path_.string(), version);
        close();
        return std::make_error_code(std::errc::not_supported);
    }

    has_header_ = true;
    offset_ = kWalHeaderSize;
    return {};
}

void WalReader::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

void WalReader::drop_tail(const char* reason) {
    spdlog::warn("WAL {}: dropping {} trailing bytes at offset {} ({})",
                 path_.string(), file_size_ - offset_, offset_, reason);
    tail_dropped_ = true;
    done_ = true;
}

bool WalReader::next(WalRecord& record) {
    if (done_ || fd_ == -1) return false;

    if (offset_ == file_size_) {
        done_ = true;  // Clean end of log.
        return false;
    }

    const uint64_t remaining = file_size_ - offset_;
    if (remaining < kFrameLengthSize) {
        drop_tail("truncated length prefix");
        return false;
    }

    uint8_t len_buf[kFrameLengthSize];
    if (auto ec = pread_exact(fd_, len_buf, kFrameLengthSize,
                              static_cast<off_t>(offset_))) {
        error_ = ec;
        done_ = true;
        return false;
    }

    const uint32_t record_length = load_u32_le(len_buf);
    if (record_length < kMinRecordLength || record_length > kMaxRecordLength) {
        drop_tail("impossible record length");
        return false;
    }

    const std::size_t frame_size = kFrameLengthSize + record_length + kFrameCrcSize;
    if (remaining < frame_size) {
        drop_tail("truncated frame");
        return false;
    }

    frame_.resize(frame_size);
    if (auto ec = pread_exact(fd_, frame_.data(), frame_size,
                              static_cast<off_t>(offset_))) {
        error_ = ec;
        done_ = true;
        return false;
    }

    const std::size_t crc_offset = frame_size - kFrameCrcSize;
    const uint32_t stored_crc = load_u32_le(frame_.data() + crc_offset);
    if (crc32(frame_.data(), crc_offset) != stored_crc) {
        drop_tail("CRC mismatch");
        return false;
    }

    WalRecord rec;
    if (!parse_body(frame_.data() + kFrameLengthSize,
                    frame_.data() + crc_offset, rec)) {
        drop_tail("malformed record body");
        return false;
    }

    if (rec.sequence <= last_sequence_) {
        drop_tail("sequence number did not advance");
        return false;
    }

    offset_ += frame_size;
    last_sequence_ = rec.sequence;
    record = std::move(rec);
    return true;
}

// ── WAL implementation ───────────────────────────────────────────────────────

WAL::WAL(const std::filesystem::path& path) : path_(path) {}

WAL::~WAL() {
    close();
}

std::error_code WAL::open(uint64_t applied_floor) {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    // Create parent directories if needed.
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return ec;
    }

    // Find the end of the valid log before taking the write handle.
    WalReader reader(path_);
    if (auto ec = reader.open()) return ec;

    WalRecord scratch;
    while (reader.next(scratch)) {
    }
    if (reader.error()) return reader.error();

    const bool has_header = reader.has_header();
    const bool tail_dropped = reader.tail_dropped();
    const uint64_t valid_end = reader.valid_end();
    const uint64_t last_logged = reader.last_sequence();
    reader.close();

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ < 0) {
        return last_system_error();
    }
    failed_ = false;

    if (!has_header) {
        // New (or torn-at-creation) file: write the header.
        if (auto ec = write_header()) {
            close();
            return ec;
        }
        if (path_.has_parent_path()) {
            if (auto ec = sync_directory(path_.parent_path().c_str())) {
                close();
                return ec;
            }
        }
        end_offset_ = kWalHeaderSize;
    } else {
        if (tail_dropped) {
            // Cut the invalid tail so new frames follow the last valid one.
            spdlog::warn("WAL {}: truncating to {} bytes", path_.string(), valid_end);
            if (auto ec = truncate_fd(fd_, static_cast<off_t>(valid_end))) {
                close();
                return ec;
            }
            if (auto ec = sync_fd(fd_)) {
                close();
                return ec;
            }
        }
        end_offset_ = valid_end;
    }

    if (applied_floor > last_logged) {
        spdlog::warn("WAL {}: data pages are at sequence {} but the log ends at {}",
                     path_.string(), applied_floor, last_logged);
    }
    next_sequence_ = std::max(last_logged, applied_floor) + 1;

    spdlog::debug("WAL {}: opened, {} bytes, next sequence {}",
                  path_.string(), end_offset_, next_sequence_);
    return {};
}

void WAL::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code WAL::write_header() {
    std::vector<uint8_t> hdr;
    hdr.reserve(kWalHeaderSize);
    append_raw(hdr, std::string_view(kWalMagic, kWalMagicSize));
    write_u16_le(hdr, kWalVersion);

    if (auto ec = truncate_fd(fd_, 0)) return ec;
    if (auto ec = pwrite_all(fd_, hdr.data(), hdr.size(), 0)) return ec;
    return sync_fd(fd_);
}

std::error_code WAL::append(const Operation& op, uint64_t& sequence) {
    if (fd_ == -1) return make_error_code(Errc::not_open);
    if (failed_) return make_error_code(Errc::wal_failed);

    const auto& key = op_key(op);
    const auto value = op_value(op);
    if (key.size() + value.size() > kMaxRecordLength - kMinRecordLength) {
        return make_error_code(Errc::entry_too_large);
    }

    auto frame = serialise_record(next_sequence_, op);

    if (auto ec = pwrite_all(fd_, frame.data(), frame.size(),
                             static_cast<off_t>(end_offset_))) {
        spdlog::error("WAL {}: write of sequence {} failed: {}",
                      path_.string(), next_sequence_, ec.message());
        // Remove the partial frame; if that fails the tail is unknown.
        if (truncate_fd(fd_, static_cast<off_t>(end_offset_))) {
            failed_ = true;
        }
        return ec;
    }

    // fsync to ensure durability.
    if (auto ec = sync_fd(fd_)) {
        // After a failed fsync the kernel may have dropped the dirty pages;
        // nothing more can be trusted until the log is rescanned.
        spdlog::error("WAL {}: fsync of sequence {} failed: {}",
                      path_.string(), next_sequence_, ec.message());
        failed_ = true;
        return ec;
    }

    end_offset_ += frame.size();
    sequence = next_sequence_++;
    return {};
}

std::error_code WAL::replay(const std::filesystem::path& path,
                            const Visitor& visitor,
                            WalReplayStats* stats) {
    WalReader reader(path);
    if (auto ec = reader.open()) return ec;

    uint64_t records = 0;
    WalRecord rec;
    while (reader.next(rec)) {
        ++records;
        if (auto ec = visitor(rec)) return ec;
    }
    if (reader.error()) return reader.error();

    if (stats) {
        stats->records = records;
        stats->last_sequence = reader.last_sequence();
        stats->tail_dropped = reader.tail_dropped();
    }
    return {};
}

} // namespace pagekv::persistence
