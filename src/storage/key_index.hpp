#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

#include "storage/page.hpp"

namespace pagekv::storage {

// Most recent location of a key: where its entry lives and which WAL record
// wrote it. A tombstone still has a location (the tombstone entry).
struct IndexEntry {
    PageId page_id = 0;
    std::size_t slot = 0;
    uint64_t sequence = 0;
    bool tombstone = false;

    bool operator==(const IndexEntry&) const = default;
};

// ── KeyIndex ─────────────────────────────────────────────────────────────────
//
// In-memory map from key to IndexEntry. Derived state: rebuilt from the pages
// and the WAL on every open, never persisted.
//
// NOT thread-safe. Owned by a single Engine.

class KeyIndex {
public:
    // Entry for `key`, or nullptr if the key has never been seen.
    [[nodiscard]] const IndexEntry* find(std::string_view key) const;

    // Insert or overwrite the entry for `key`.
    void upsert(const std::string& key, const IndexEntry& entry);

    // Forget `key` entirely (its entry left the page store).
    void erase(std::string_view key);

    // Keys that currently resolve to a value (tombstones excluded).
    [[nodiscard]] std::size_t live_count() const noexcept { return live_; }

    // Keys tracked, tombstones included.
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    void clear();

    [[nodiscard]] const std::unordered_map<std::string, IndexEntry>& entries() const noexcept {
        return map_;
    }

private:
    std::unordered_map<std::string, IndexEntry> map_;
    std::size_t live_ = 0;
};

} // namespace pagekv::storage
