#include "storage/page.hpp"

#include "common/binary_io.hpp"
#include "common/crc32.hpp"
#include "common/error.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace pagekv::storage {

Page::Page(PageId id, uint32_t page_size)
    : id_(id)
    , page_size_(page_size)
{
}

std::error_code Page::decode(PageId id, const std::vector<uint8_t>& bytes,
                             Page& out) {
    const auto page_size = static_cast<uint32_t>(bytes.size());
    if (page_size < kMinPageSize || page_size > kMaxPageSize) {
        return make_error_code(Errc::corruption);
    }

    const uint8_t* p = bytes.data();
    const uint32_t stored_crc = load_u32_le(p);
    const uint32_t computed_crc = crc32(p + 4, page_size - 4);
    if (stored_crc != computed_crc) {
        spdlog::error("Page {}: CRC mismatch (stored 0x{:08X}, computed 0x{:08X})",
                      id, stored_crc, computed_crc);
        return make_error_code(Errc::corruption);
    }

    Page page(id, page_size);
    page.last_applied_seq_ = load_u64_le(p + 4);
    const uint16_t slot_count = load_u16_le(p + 12);

    const std::size_t dir_end = kPageHeaderSize + slot_count * kSlotSize;
    if (dir_end > page_size) {
        spdlog::error("Page {}: slot directory overruns page ({} slots)", id, slot_count);
        return make_error_code(Errc::corruption);
    }

    page.slots_.resize(slot_count);
    page.used_ = dir_end;

    for (std::size_t i = 0; i < slot_count; ++i) {
        const uint8_t* slot = p + kPageHeaderSize + i * kSlotSize;
        const uint16_t offset = load_u16_le(slot);
        const uint16_t size = load_u16_le(slot + 2);
        if (offset == 0) continue;  // vacant

        if (offset < dir_end || size < kEntryHeaderSize ||
            static_cast<std::size_t>(offset) + size > page_size) {
            spdlog::error("Page {}: slot {} points outside the page", id, i);
            return make_error_code(Errc::corruption);
        }

        const uint8_t* e = p + offset;
        const uint8_t flags = e[0];
        const uint16_t key_len = load_u16_le(e + 1);
        const uint16_t value_len = load_u16_le(e + 3);
        if (entry_size(key_len, value_len) != size ||
            (flags & ~kEntryFlagTombstone) != 0) {
            spdlog::error("Page {}: malformed entry in slot {}", id, i);
            return make_error_code(Errc::corruption);
        }

        PageEntry entry;
        entry.tombstone = (flags & kEntryFlagTombstone) != 0;
        entry.sequence = load_u64_le(e + 5);
        entry.key.assign(reinterpret_cast<const char*>(e + kEntryHeaderSize), key_len);
        entry.value.assign(
            reinterpret_cast<const char*>(e + kEntryHeaderSize + key_len), value_len);

        page.used_ += size;
        page.slots_[i] = std::move(entry);
    }

    if (page.used_ > page_size) {
        spdlog::error("Page {}: entries overlap", id);
        return make_error_code(Errc::corruption);
    }

    out = std::move(page);
    return {};
}

std::vector<uint8_t> Page::encode() const {
    std::vector<uint8_t> buf(page_size_, 0);
    uint8_t* p = buf.data();

    store_u64_le(p + 4, last_applied_seq_);
    store_u16_le(p + 12, static_cast<uint16_t>(slots_.size()));

    // Entries grow downward from the end of the page.
    std::size_t tail = page_size_;
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        uint8_t* slot = p + kPageHeaderSize + i * kSlotSize;
        if (!slots_[i]) continue;  // directory bytes stay zero

        const PageEntry& entry = *slots_[i];
        const std::size_t size = entry.encoded_size();
        tail -= size;

        uint8_t* e = p + tail;
        e[0] = entry.tombstone ? kEntryFlagTombstone : 0;
        store_u16_le(e + 1, static_cast<uint16_t>(entry.key.size()));
        store_u16_le(e + 3, static_cast<uint16_t>(entry.value.size()));
        store_u64_le(e + 5, entry.sequence);
        std::copy(entry.key.begin(), entry.key.end(), e + kEntryHeaderSize);
        std::copy(entry.value.begin(), entry.value.end(),
                  e + kEntryHeaderSize + entry.key.size());

        store_u16_le(slot, static_cast<uint16_t>(tail));
        store_u16_le(slot + 2, static_cast<uint16_t>(size));
    }

    store_u32_le(p, crc32(p + 4, page_size_ - 4));
    return buf;
}

void Page::stamp(uint64_t seq) noexcept {
    if (seq > last_applied_seq_) last_applied_seq_ = seq;
}

std::size_t Page::live_count() const noexcept {
    std::size_t n = 0;
    for (const auto& slot : slots_) {
        if (slot) ++n;
    }
    return n;
}

const PageEntry* Page::entry(std::size_t slot) const {
    if (slot >= slots_.size() || !slots_[slot]) return nullptr;
    return &*slots_[slot];
}

std::optional<std::size_t> Page::find(std::string_view key) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] && slots_[i]->key == key) return i;
    }
    return std::nullopt;
}

std::size_t Page::free_space() const noexcept {
    return page_size_ - used_;
}

bool Page::has_vacant_slot() const noexcept {
    for (const auto& slot : slots_) {
        if (!slot) return true;
    }
    return false;
}

bool Page::can_insert(std::size_t size) const noexcept {
    const std::size_t needed = size + (has_vacant_slot() ? 0 : kSlotSize);
    return needed <= free_space();
}

bool Page::can_replace(std::size_t slot, std::size_t size) const {
    const PageEntry* old = entry(slot);
    if (!old) return false;
    return size <= free_space() + old->encoded_size();
}

std::size_t Page::insert(PageEntry entry) {
    used_ += entry.encoded_size();
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            slots_[i] = std::move(entry);
            return i;
        }
    }
    used_ += kSlotSize;
    slots_.push_back(std::move(entry));
    return slots_.size() - 1;
}

void Page::replace(std::size_t slot, PageEntry entry) {
    used_ -= slots_[slot]->encoded_size();
    used_ += entry.encoded_size();
    slots_[slot] = std::move(entry);
}

void Page::remove(std::size_t slot) {
    if (slot >= slots_.size() || !slots_[slot]) return;
    used_ -= slots_[slot]->encoded_size();
    slots_[slot].reset();
    while (!slots_.empty() && !slots_.back()) {
        slots_.pop_back();
        used_ -= kSlotSize;
    }
}

} // namespace pagekv::storage
