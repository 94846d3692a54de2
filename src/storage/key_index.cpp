#include "storage/key_index.hpp"

namespace pagekv::storage {

const IndexEntry* KeyIndex::find(std::string_view key) const {
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return nullptr;
    }
    return &it->second;
}

void KeyIndex::upsert(const std::string& key, const IndexEntry& entry) {
    auto [it, inserted] = map_.try_emplace(key, entry);
    if (!inserted) {
        if (!it->second.tombstone) --live_;
        it->second = entry;
    }
    if (!entry.tombstone) ++live_;
}

void KeyIndex::erase(std::string_view key) {
    auto it = map_.find(std::string(key));
    if (it == map_.end()) return;
    if (!it->second.tombstone) --live_;
    map_.erase(it);
}

void KeyIndex::clear() {
    map_.clear();
    live_ = 0;
}

} // namespace pagekv::storage
