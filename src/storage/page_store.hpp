#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "storage/key_index.hpp"
#include "storage/operation.hpp"
#include "storage/page.hpp"

namespace pagekv::storage {

// Outcome of PageStore::apply().
struct ApplyResult {
    // False when the record was already reflected on disk (replay) or had
    // nothing to change (delete of an unknown key).
    bool applied = false;

    // False when the key no longer has an entry on any page.
    bool present = false;

    // New location of the key, valid when `present`.
    IndexEntry entry;
};

// ── PageStore ────────────────────────────────────────────────────────────────
//
// Single file of fixed-size, CRC-protected pages. Page N lives at byte offset
// N * page_size. Every write is fsynced before it returns.
//
// A trailing partial page (a crash while a new page was being appended) is
// ignored on open and overwritten by the next allocation.
//
// Thread-safety: NOT thread-safe. Owned by a single Engine.

class PageStore {
public:
    using PageVisitor = std::function<void(const Page&)>;

    PageStore(const std::filesystem::path& path, uint32_t page_size);
    ~PageStore();

    // Non-copyable, non-movable.
    PageStore(const PageStore&) = delete;
    PageStore& operator=(const PageStore&) = delete;
    PageStore(PageStore&&) = delete;
    PageStore& operator=(PageStore&&) = delete;

    // Opens (or creates) the page file, verifies every page's CRC and builds
    // the free-space map. `visitor`, if set, sees each page once.
    [[nodiscard]] std::error_code open(const PageVisitor& visitor = {});

    void close();

    // Read and verify one page. Errc::corruption on CRC mismatch,
    // Errc::short_read if the page does not exist.
    [[nodiscard]] std::error_code read_page(PageId id, Page& out) const;

    // Encode (fresh CRC), write at the page's offset and fsync.
    [[nodiscard]] std::error_code write_page(const Page& page);

    // Materialize a WAL record. Locates the key through `index`, or allocates
    // space for it, mutates the page and writes it. A record already reflected
    // on disk is a no-op.
    [[nodiscard]] std::error_code apply(uint64_t sequence, const Operation& op,
                                        const KeyIndex& index, ApplyResult& result);

    // Read the value stored at `entry` for `key`; re-verifies the page CRC.
    [[nodiscard]] std::error_code read_value(const IndexEntry& entry,
                                             std::string_view key,
                                             std::string& value) const;

    // True if a key/value pair of these sizes fits in a single page.
    [[nodiscard]] bool fits(std::size_t key_len, std::size_t value_len) const noexcept;

    [[nodiscard]] bool is_open() const { return fd_ != -1; }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] uint32_t page_size() const noexcept { return page_size_; }

    [[nodiscard]] PageId page_count() const noexcept { return free_.size(); }

    // Highest last_applied_seq over all pages.
    [[nodiscard]] uint64_t max_applied_seq() const noexcept { return max_applied_seq_; }

private:
    struct PageSpace {
        std::size_t free = 0;
        bool has_vacant = false;
    };

    // Best-fit choice among existing pages, or nullopt if none fits.
    [[nodiscard]] std::optional<PageId> choose_page(std::size_t size) const;

    // Place `entry` in the best-fitting page or a new one, then write it.
    [[nodiscard]] std::error_code place(PageEntry entry, ApplyResult& result);

    // Write `page` and refresh its free-space bookkeeping.
    [[nodiscard]] std::error_code persist(const Page& page);

    std::filesystem::path path_;
    uint32_t page_size_;
    int fd_ = -1;
    std::vector<PageSpace> free_;
    uint64_t max_applied_seq_ = 0;
};

} // namespace pagekv::storage
