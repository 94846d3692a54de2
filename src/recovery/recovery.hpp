#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <system_error>

#include "storage/key_index.hpp"
#include "storage/page_store.hpp"

namespace pagekv::recovery {

// ── Recovery state ───────────────────────────────────────────────────────────

enum class RecoveryState : uint8_t {
    Closed    = 0,
    Scanning  = 1,
    Replaying = 2,
    Ready     = 3,
    Failed    = 4,
};

[[nodiscard]] std::string_view to_string(RecoveryState state) noexcept;

struct RecoveryStats {
    uint64_t pages_scanned = 0;
    uint64_t records_scanned = 0;
    uint64_t records_applied = 0;
    uint64_t records_skipped = 0;   // already reflected on the pages
    bool tail_dropped = false;
    uint64_t dropped_bytes = 0;
    uint64_t last_sequence = 0;     // highest sequence in the WAL or on a page
    std::size_t live_keys = 0;
};

// ── RecoveryEngine ───────────────────────────────────────────────────────────
//
// Rebuilds consistent state after a clean or unclean shutdown:
//
//   Closed → Scanning → Replaying → Ready
//
// The page store is (re)opened and every page's entries are loaded into the
// key index. The WAL is then read from its first frame and each record is
// applied to the page store; records already reflected on the pages are
// skipped, so running recovery again over the same files changes nothing.
//
// An invalid trailing WAL frame ends the replay normally. A page failing its
// CRC is fatal (Errc::corruption) and leaves the engine in Failed.
//
// NOT thread-safe. Runs on the thread that opens the Engine.

class RecoveryEngine {
public:
    RecoveryEngine(const std::filesystem::path& wal_path,
                   storage::PageStore& pages,
                   storage::KeyIndex& index);

    [[nodiscard]] std::error_code recover();

    [[nodiscard]] RecoveryState state() const noexcept { return state_; }

    [[nodiscard]] const RecoveryStats& stats() const noexcept { return stats_; }

private:
    // Load one scanned page's entries into the index.
    void index_page(const storage::Page& page);

    std::filesystem::path wal_path_;
    storage::PageStore& pages_;
    storage::KeyIndex& index_;
    RecoveryState state_ = RecoveryState::Closed;
    RecoveryStats stats_;
};

} // namespace pagekv::recovery
