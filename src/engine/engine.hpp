#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "persistence/wal.hpp"
#include "recovery/recovery.hpp"
#include "storage/key_index.hpp"
#include "storage/page_store.hpp"

namespace pagekv {

// ── EngineOptions ────────────────────────────────────────────────────────────

struct EngineOptions {
    // Bytes per page; a power of two in [kMinPageSize, kMaxPageSize].
    // Must match the size the store was created with.
    uint32_t page_size = storage::kDefaultPageSize;
};

// std::errc::invalid_argument if any option is out of range.
[[nodiscard]] std::error_code validate_options(const EngineOptions& options);

// ── Engine ───────────────────────────────────────────────────────────────────
//
// Durable single-key store in one directory:
//
//   <dir>/pagekv.wal   write-ahead log
//   <dir>/pagekv.db    page file
//
// Mutations are appended to the WAL and fsynced before the page store is
// touched. If the page write then fails, the error is returned but the WAL
// record stays and is applied on the next open.
//
// Reads go through the in-memory key index to a single page, whose CRC is
// verified on every read; they never touch the WAL.
//
// Thread-safety: NOT thread-safe. One Engine per directory; callers serialise
// access.

class Engine {
public:
    static constexpr const char* kWalFilename  = "pagekv.wal";
    static constexpr const char* kDataFilename = "pagekv.db";

    explicit Engine(std::filesystem::path dir, EngineOptions options = {});
    ~Engine();

    // Non-copyable, non-movable.
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    // Create the directory if needed, run recovery, open the WAL for appends.
    [[nodiscard]] std::error_code open();

    // Release both files. The engine may be opened again.
    void close();

    [[nodiscard]] std::error_code put(std::string_view key, std::string_view value);

    // Logs a delete and tombstones the key. Deleting an unknown key succeeds.
    [[nodiscard]] std::error_code del(std::string_view key);

    // `value` receives the stored value, or std::nullopt if the key is absent
    // or deleted. Errc::corruption if the page fails its CRC.
    [[nodiscard]] std::error_code get(std::string_view key,
                                      std::optional<std::string>& value) const;

    [[nodiscard]] bool is_open() const { return open_; }

    // Number of keys that currently hold a value.
    [[nodiscard]] std::size_t size() const { return index_.live_count(); }

    // Highest sequence number durably logged.
    [[nodiscard]] uint64_t last_sequence() const { return wal_.last_sequence(); }

    [[nodiscard]] const recovery::RecoveryStats& recovery_stats() const { return recovery_stats_; }

    [[nodiscard]] const storage::KeyIndex& index() const { return index_; }

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

    [[nodiscard]] std::filesystem::path wal_path() const { return dir_ / kWalFilename; }

    [[nodiscard]] std::filesystem::path data_path() const { return dir_ / kDataFilename; }

private:
    // WAL append, then page apply, then index update.
    [[nodiscard]] std::error_code mutate(Operation op);

    std::filesystem::path dir_;
    EngineOptions options_;
    persistence::WAL wal_;
    storage::PageStore pages_;
    storage::KeyIndex index_;
    recovery::RecoveryStats recovery_stats_;
    bool open_ = false;
};

// Run recovery on the store in `dir` and report what it did. Leaves the
// store consistent and closed; equivalent to open() followed by close().
[[nodiscard]] std::error_code recover(const std::filesystem::path& dir,
                                      const EngineOptions& options,
                                      recovery::RecoveryStats& stats);

} // namespace pagekv
