#include "engine/engine.hpp"

#include "common/error.hpp"
#include "common/file_io.hpp"

#include <spdlog/spdlog.h>

namespace pagekv {

std::error_code validate_options(const EngineOptions& options) {
    if (!storage::is_valid_page_size(options.page_size)) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

Engine::Engine(std::filesystem::path dir, EngineOptions options)
    : dir_(std::move(dir))
    , options_(options)
    , wal_(dir_ / kWalFilename)
    , pages_(dir_ / kDataFilename, options_.page_size)
{
}

Engine::~Engine() {
    close();
}

std::error_code Engine::open() {
    if (open_) {
        return {};  // Already open.
    }

    if (auto ec = validate_options(options_)) {
        spdlog::error("Engine: invalid page size {}", options_.page_size);
        return ec;
    }

    std::error_code fs_ec;
    std::filesystem::create_directories(dir_, fs_ec);
    if (fs_ec) {
        spdlog::error("Engine: cannot create {}: {}", dir_.string(), fs_ec.message());
        return fs_ec;
    }

    // Startup: scan pages → replay WAL → open WAL for appends → ready.
    recovery::RecoveryEngine recovery(wal_path(), pages_, index_);
    if (auto ec = recovery.recover()) {
        pages_.close();
        index_.clear();
        return ec;
    }
    recovery_stats_ = recovery.stats();

    if (auto ec = wal_.open(pages_.max_applied_seq())) {
        spdlog::error("Engine: cannot open WAL {}: {}", wal_path().string(), ec.message());
        pages_.close();
        index_.clear();
        return ec;
    }

    // Make the directory entries of freshly created files durable.
    if (auto ec = sync_directory(dir_.c_str())) {
        spdlog::error("Engine: cannot sync {}: {}", dir_.string(), ec.message());
        close();
        return ec;
    }

    open_ = true;
    spdlog::info("Engine: opened {} ({} live keys, next sequence {})",
                 dir_.string(), index_.live_count(), wal_.next_sequence());
    return {};
}

void Engine::close() {
    wal_.close();
    pages_.close();
    index_.clear();
    open_ = false;
}

std::error_code Engine::put(std::string_view key, std::string_view value) {
    return mutate(PutOp{std::string(key), std::string(value)});
}

std::error_code Engine::del(std::string_view key) {
    return mutate(DeleteOp{std::string(key)});
}

std::error_code Engine::mutate(Operation op) {
    if (!open_) return make_error_code(Errc::not_open);

    const std::string& key = op_key(op);
    if (!pages_.fits(key.size(), op_value(op).size())) {
        return make_error_code(Errc::entry_too_large);
    }

    // 1. Durable intent.
    uint64_t sequence = 0;
    if (auto ec = wal_.append(op, sequence)) {
        return ec;
    }

    // 2. Materialize.
    storage::ApplyResult result;
    if (auto ec = pages_.apply(sequence, op, index_, result)) {
        spdlog::error("Engine: sequence {} is logged but its page write failed ({}); "
                      "it will be applied on the next open", sequence, ec.message());
        // The old slot may already be gone when the value was being moved.
        if (result.applied && !result.present) index_.erase(key);
        return ec;
    }

    // 3. Index.
    if (result.applied) {
        if (result.present) {
            index_.upsert(key, result.entry);
        } else {
            index_.erase(key);
        }
    }

    spdlog::debug("Engine: {} key of {} bytes at sequence {}",
                  op_tag(op) == OpTag::Put ? "put" : "delete", key.size(), sequence);
    return {};
}

std::error_code Engine::get(std::string_view key,
                            std::optional<std::string>& value) const {
    value.reset();
    if (!open_) return make_error_code(Errc::not_open);

    const storage::IndexEntry* entry = index_.find(key);
    if (!entry || entry->tombstone) {
        return {};
    }

    std::string stored;
    if (auto ec = pages_.read_value(*entry, key, stored)) {
        return ec;
    }
    value = std::move(stored);
    return {};
}

std::error_code recover(const std::filesystem::path& dir,
                        const EngineOptions& options,
                        recovery::RecoveryStats& stats) {
    Engine engine(dir, options);
    if (auto ec = engine.open()) return ec;
    stats = engine.recovery_stats();
    return {};
}

} // namespace pagekv
