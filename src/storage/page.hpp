#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pagekv::storage {

using PageId = uint64_t;

// ── Page geometry ────────────────────────────────────────────────────────────

static constexpr uint32_t kDefaultPageSize = 4096;
static constexpr uint32_t kMinPageSize = 512;
static constexpr uint32_t kMaxPageSize = 65536;

// A power of two in [kMinPageSize, kMaxPageSize].
[[nodiscard]] constexpr bool is_valid_page_size(uint32_t page_size) {
    const bool power_of_two = page_size != 0 && (page_size & (page_size - 1)) == 0;
    return power_of_two && page_size >= kMinPageSize && page_size <= kMaxPageSize;
}

// [page_crc32: u32][last_applied_seq: u64][slot_count: u16]
static constexpr std::size_t kPageHeaderSize = 4 + 8 + 2;

// [entry_offset: u16][entry_size: u16]; entry_offset == 0 marks a vacant slot.
static constexpr std::size_t kSlotSize = 4;

// [flags: u8][key_len: u16][value_len: u16][seq: u64], then key and value.
static constexpr std::size_t kEntryHeaderSize = 1 + 2 + 2 + 8;

static constexpr uint8_t kEntryFlagTombstone = 0x01;

[[nodiscard]] constexpr std::size_t entry_size(std::size_t key_len,
                                               std::size_t value_len) {
    return kEntryHeaderSize + key_len + value_len;
}

// Largest entry an empty page can hold (one slot plus the entry itself).
[[nodiscard]] constexpr std::size_t max_entry_size(uint32_t page_size) {
    return page_size - kPageHeaderSize - kSlotSize;
}

// ── PageEntry ────────────────────────────────────────────────────────────────

struct PageEntry {
    std::string key;
    std::string value;          // empty for a tombstone
    uint64_t sequence = 0;      // WAL record that wrote this entry
    bool tombstone = false;

    [[nodiscard]] std::size_t encoded_size() const {
        return entry_size(key.size(), value.size());
    }

    bool operator==(const PageEntry&) const = default;
};

// ── Page ─────────────────────────────────────────────────────────────────────
//
// Decoded form of one fixed-size page. Slots keep their index for the life of
// the page: a removed entry leaves a vacant slot that a later insert reuses,
// so (page_id, slot) locations held by the key index stay valid.
//
// encode() is deterministic: entries are packed from the end of the page in
// slot order, so equal pages produce identical bytes.

class Page {
public:
    Page(PageId id, uint32_t page_size);

    // Validate and decode raw page bytes. Errc::corruption on a CRC mismatch
    // or on a directory/entry that does not fit the page.
    [[nodiscard]] static std::error_code decode(PageId id,
                                                const std::vector<uint8_t>& bytes,
                                                Page& out);

    // Full page image with a freshly computed CRC.
    [[nodiscard]] std::vector<uint8_t> encode() const;

    [[nodiscard]] PageId id() const noexcept { return id_; }
    [[nodiscard]] uint32_t page_size() const noexcept { return page_size_; }

    [[nodiscard]] uint64_t last_applied_seq() const noexcept { return last_applied_seq_; }

    // Raise the page stamp to `seq`; never lowers it.
    void stamp(uint64_t seq) noexcept;

    // Directory length, vacant slots included.
    [[nodiscard]] std::size_t slot_count() const noexcept { return slots_.size(); }

    [[nodiscard]] std::size_t live_count() const noexcept;

    // Entry in `slot`, or nullptr if the slot is vacant or out of range.
    [[nodiscard]] const PageEntry* entry(std::size_t slot) const;

    [[nodiscard]] std::optional<std::size_t> find(std::string_view key) const;

    // Bytes not used by the header, the directory or any entry.
    [[nodiscard]] std::size_t free_space() const noexcept;

    [[nodiscard]] bool has_vacant_slot() const noexcept;

    // True if an entry of `size` bytes fits as a new insert.
    [[nodiscard]] bool can_insert(std::size_t size) const noexcept;

    // True if the entry in `slot` can be replaced by one of `size` bytes.
    [[nodiscard]] bool can_replace(std::size_t slot, std::size_t size) const;

    // Insert into the first vacant slot or a new one. Caller checks can_insert().
    std::size_t insert(PageEntry entry);

    // Overwrite `slot`. Caller checks can_replace().
    void replace(std::size_t slot, PageEntry entry);

    // Vacate `slot`. Trailing vacant slots are dropped from the directory.
    void remove(std::size_t slot);

private:
    PageId id_;
    uint32_t page_size_;
    uint64_t last_applied_seq_ = 0;
    std::vector<std::optional<PageEntry>> slots_;
    std::size_t used_ = kPageHeaderSize;   // header + directory + entries
};

} // namespace pagekv::storage
