#include "storage/page_store.hpp"

#include "common/error.hpp"
#include "common/file_io.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace pagekv::storage {

PageStore::PageStore(const std::filesystem::path& path, uint32_t page_size)
    : path_(path)
    , page_size_(page_size)
{
}

PageStore::~PageStore() {
    close();
}

std::error_code PageStore::open(const PageVisitor& visitor) {
    if (fd_ != -1) {
        return {};  // Already open.
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) return ec;
    }

    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ < 0) {
        return last_system_error();
    }

    off_t size = 0;
    if (auto ec = file_size(fd_, size)) {
        close();
        return ec;
    }

    const auto total = static_cast<uint64_t>(size);
    const PageId count = total / page_size_;
    if (const auto partial = total % page_size_; partial != 0) {
        spdlog::warn("PageStore {}: ignoring {} bytes of a partially written page {}",
                     path_.string(), partial, count);
    }

    free_.clear();
    free_.reserve(count);
    max_applied_seq_ = 0;

    for (PageId id = 0; id < count; ++id) {
        Page page(id, page_size_);
        if (auto ec = read_page(id, page)) {
            close();
            return ec;
        }
        free_.push_back({page.free_space(), page.has_vacant_slot()});
        max_applied_seq_ = std::max(max_applied_seq_, page.last_applied_seq());
        if (visitor) visitor(page);
    }

    spdlog::debug("PageStore {}: opened, {} pages of {} bytes, max applied sequence {}",
                  path_.string(), count, page_size_, max_applied_seq_);
    return {};
}

void PageStore::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    free_.clear();
}

std::error_code PageStore::read_page(PageId id, Page& out) const {
    if (fd_ == -1) return make_error_code(Errc::not_open);

    std::vector<uint8_t> bytes(page_size_);
    if (auto ec = pread_exact(fd_, bytes.data(), bytes.size(),
                              static_cast<off_t>(id * page_size_))) {
        return ec;
    }
    return Page::decode(id, bytes, out);
}

std::error_code PageStore::write_page(const Page& page) {
    if (fd_ == -1) return make_error_code(Errc::not_open);
    if (page.page_size() != page_size_) {
        return std::make_error_code(std::errc::invalid_argument);
    }

    const auto bytes = page.encode();
    if (auto ec = pwrite_all(fd_, bytes.data(), bytes.size(),
                             static_cast<off_t>(page.id() * page_size_))) {
        spdlog::error("PageStore {}: write of page {} failed: {}",
                      path_.string(), page.id(), ec.message());
        return ec;
    }
    if (auto ec = sync_fd(fd_)) {
        spdlog::error("PageStore {}: fsync of page {} failed: {}",
                      path_.string(), page.id(), ec.message());
        return ec;
    }
    return {};
}

bool PageStore::fits(std::size_t key_len, std::size_t value_len) const noexcept {
    constexpr std::size_t kFieldMax = std::numeric_limits<uint16_t>::max();
    return key_len <= kFieldMax && value_len <= kFieldMax &&
           entry_size(key_len, value_len) <= max_entry_size(page_size_);
}

std::optional<PageId> PageStore::choose_page(std::size_t size) const {
    std::optional<PageId> best;
    std::size_t best_free = 0;
    for (PageId id = 0; id < free_.size(); ++id) {
        const auto& space = free_[id];
        const std::size_t needed = size + (space.has_vacant ? 0 : kSlotSize);
        if (needed > space.free) continue;
        if (!best || space.free < best_free) {
            best = id;
            best_free = space.free;
        }
    }
    return best;
}

std::error_code PageStore::persist(const Page& page) {
    if (auto ec = write_page(page)) return ec;

    const PageSpace space{page.free_space(), page.has_vacant_slot()};
    if (page.id() < free_.size()) {
        free_[page.id()] = space;
    } else {
        free_.resize(page.id() + 1);
        free_[page.id()] = space;
    }
    max_applied_seq_ = std::max(max_applied_seq_, page.last_applied_seq());
    return {};
}

std::error_code PageStore::place(PageEntry entry, ApplyResult& result) {
    const uint64_t sequence = entry.sequence;
    const bool tombstone = entry.tombstone;

    Page page(page_count(), page_size_);
    if (auto chosen = choose_page(entry.encoded_size())) {
        if (auto ec = read_page(*chosen, page)) return ec;
    }

    const std::size_t slot = page.insert(std::move(entry));
    page.stamp(sequence);
    if (auto ec = persist(page)) return ec;

    result.applied = true;
    result.present = true;
    result.entry = IndexEntry{page.id(), slot, sequence, tombstone};
    return {};
}

std::error_code PageStore::apply(uint64_t sequence, const Operation& op,
                                 const KeyIndex& index, ApplyResult& result) {
    result = {};
    if (fd_ == -1) return make_error_code(Errc::not_open);

    const std::string& key = op_key(op);
    const bool tombstone = std::holds_alternative<DeleteOp>(op);
    PageEntry entry{key, std::string(op_value(op)), sequence, tombstone};
    if (!fits(entry.key.size(), entry.value.size())) {
        return make_error_code(Errc::entry_too_large);
    }

    const IndexEntry* current = index.find(key);
    if (!current) {
        // Nothing stored under this key, so there is nothing to tombstone.
        if (tombstone) return {};
        return place(std::move(entry), result);
    }

    Page page(current->page_id, page_size_);
    if (auto ec = read_page(current->page_id, page)) return ec;

    const PageEntry* existing = page.entry(current->slot);
    if (!existing || existing->key != key) {
        spdlog::error("PageStore {}: page {} slot {} does not hold the indexed key",
                      path_.string(), current->page_id, current->slot);
        return make_error_code(Errc::corruption);
    }

    // Already reflected: the page has seen this record and the entry is at
    // least as new.
    if (page.last_applied_seq() >= sequence && existing->sequence >= sequence) {
        result.present = true;
        result.entry = *current;
        return {};
    }

    const std::size_t slot = current->slot;
    if (page.can_replace(slot, entry.encoded_size())) {
        page.replace(slot, std::move(entry));
        page.stamp(sequence);
        if (auto ec = persist(page)) return ec;

        result.applied = true;
        result.present = true;
        result.entry = IndexEntry{page.id(), slot, sequence, tombstone};
        return {};
    }

    // The new value outgrew its page. Vacate the old slot first, then place
    // the entry elsewhere; a crash in between leaves the key absent and
    // replay of this record places it again.
    page.remove(slot);
    page.stamp(sequence);
    if (auto ec = persist(page)) return ec;

    result.applied = true;
    result.present = false;
    return place(std::move(entry), result);
}

std::error_code PageStore::read_value(const IndexEntry& entry,
                                      std::string_view key,
                                      std::string& value) const {
    Page page(entry.page_id, page_size_);
    if (auto ec = read_page(entry.page_id, page)) return ec;

    const PageEntry* stored = page.entry(entry.slot);
    if (!stored || stored->key != key || stored->tombstone) {
        spdlog::error("PageStore {}: page {} slot {} does not hold a value for the indexed key",
                      path_.string(), entry.page_id, entry.slot);
        return make_error_code(Errc::corruption);
    }

    value = stored->value;
    return {};
}

} // namespace pagekv::storage
