#include "recovery/recovery.hpp"

#include "persistence/wal.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace pagekv::recovery {

std::string_view to_string(RecoveryState state) noexcept {
    switch (state) {
        case RecoveryState::Closed:    return "closed";
        case RecoveryState::Scanning:  return "scanning";
        case RecoveryState::Replaying: return "replaying";
        case RecoveryState::Ready:     return "ready";
        case RecoveryState::Failed:    return "failed";
    }
    return "unknown";
}

RecoveryEngine::RecoveryEngine(const std::filesystem::path& wal_path,
                               storage::PageStore& pages,
                               storage::KeyIndex& index)
    : wal_path_(wal_path)
    , pages_(pages)
    , index_(index)
{
}

void RecoveryEngine::index_page(const storage::Page& page) {
    ++stats_.pages_scanned;
    for (std::size_t slot = 0; slot < page.slot_count(); ++slot) {
        const storage::PageEntry* entry = page.entry(slot);
        if (!entry) continue;

        // A key is stored once; should two pages disagree, the newer wins.
        if (const auto* seen = index_.find(entry->key)) {
            spdlog::warn("Recovery: key stored twice (page {} and page {})",
                         seen->page_id, page.id());
            if (seen->sequence >= entry->sequence) continue;
        }
        index_.upsert(entry->key, storage::IndexEntry{
            page.id(), slot, entry->sequence, entry->tombstone});
    }
}

std::error_code RecoveryEngine::recover() {
    stats_ = {};
    index_.clear();
    state_ = RecoveryState::Closed;

    // ── Page scan ────────────────────────────────────────────────────────────
    pages_.close();
    if (auto ec = pages_.open([this](const storage::Page& page) { index_page(page); })) {
        spdlog::error("Recovery: page store {} unreadable: {}",
                      pages_.path().string(), ec.message());
        state_ = RecoveryState::Failed;
        return ec;
    }

    // ── Scanning ─────────────────────────────────────────────────────────────
    state_ = RecoveryState::Scanning;
    persistence::WalReader reader(wal_path_);
    if (auto ec = reader.open()) {
        spdlog::error("Recovery: cannot open WAL {}: {}", wal_path_.string(), ec.message());
        state_ = RecoveryState::Failed;
        return ec;
    }

    // ── Replaying ────────────────────────────────────────────────────────────
    state_ = RecoveryState::Replaying;
    persistence::WalRecord record;
    while (reader.next(record)) {
        ++stats_.records_scanned;

        storage::ApplyResult result;
        if (auto ec = pages_.apply(record.sequence, record.op, index_, result)) {
            spdlog::error("Recovery: replay of sequence {} failed: {}",
                          record.sequence, ec.message());
            state_ = RecoveryState::Failed;
            return ec;
        }

        if (!result.applied) {
            ++stats_.records_skipped;
            continue;
        }
        ++stats_.records_applied;
        if (result.present) {
            index_.upsert(op_key(record.op), result.entry);
        } else {
            index_.erase(op_key(record.op));
        }
    }

    if (reader.error()) {
        spdlog::error("Recovery: WAL read failed: {}", reader.error().message());
        state_ = RecoveryState::Failed;
        return reader.error();
    }

    stats_.tail_dropped = reader.tail_dropped();
    stats_.dropped_bytes = reader.dropped_bytes();
    stats_.last_sequence = std::max(reader.last_sequence(), pages_.max_applied_seq());
    stats_.live_keys = index_.live_count();
    state_ = RecoveryState::Ready;

    spdlog::info("Recovery: {} pages, {} WAL records ({} applied, {} already on disk), "
                 "{} live keys, last sequence {}{}",
                 stats_.pages_scanned, stats_.records_scanned, stats_.records_applied,
                 stats_.records_skipped, stats_.live_keys, stats_.last_sequence,
                 stats_.tail_dropped ? ", torn tail dropped" : "");
    return {};
}

} // namespace pagekv::recovery
