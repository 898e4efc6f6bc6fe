// Nodeweave kernel: session-only result store
#include "kernel/store/memory_result_store.hpp"

#include <algorithm>
#include <mutex>

namespace nw {

namespace {

CacheEntry copy_entry(const CacheEntry& e) {
    CacheEntry out = e;
    out.result = clone_result(e.result);
    return out;
}

} // namespace

void MemoryResultStore::put(const CacheEntry& entry) {
    std::unique_lock<std::shared_mutex> lk(mx_);
    entries_[entry.id] = copy_entry(entry);
}

std::optional<CacheEntry> MemoryResultStore::get(const NodeId& id) const {
    std::shared_lock<std::shared_mutex> lk(mx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return copy_entry(it->second);
}

std::optional<CacheEntry> MemoryResultStore::find(const NodeId& id, const std::string& input_hash) const {
    std::shared_lock<std::shared_mutex> lk(mx_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.input_hash != input_hash) return std::nullopt;
    return copy_entry(it->second);
}

std::optional<CacheEntry> MemoryResultStore::find_by_hash(const std::string& hash) const {
    std::shared_lock<std::shared_mutex> lk(mx_);
    const CacheEntry* best = nullptr;
    for (const auto& pair : entries_) {
        if (pair.second.hash != hash) continue;
        // Lowest id wins so lookups are stable across runs.
        if (!best || pair.first < best->id) best = &pair.second;
    }
    if (!best) return std::nullopt;
    return copy_entry(*best);
}

bool MemoryResultStore::update_age(const NodeId& id, int64_t age) {
    std::unique_lock<std::shared_mutex> lk(mx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    it->second.age = age;
    return true;
}

int MemoryResultStore::remove(const NodeId& id) {
    std::unique_lock<std::shared_mutex> lk(mx_);
    return static_cast<int>(entries_.erase(id));
}

int MemoryResultStore::remove_older_than(int64_t cutoff) {
    std::unique_lock<std::shared_mutex> lk(mx_);
    int removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.age <= cutoff) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<CacheEntry> MemoryResultStore::list() const {
    std::shared_lock<std::shared_mutex> lk(mx_);
    std::vector<CacheEntry> out;
    out.reserve(entries_.size());
    for (const auto& pair : entries_) out.push_back(copy_entry(pair.second));
    std::sort(out.begin(), out.end(), [](const CacheEntry& a, const CacheEntry& b) { return a.id < b.id; });
    return out;
}

size_t MemoryResultStore::size() const {
    std::shared_lock<std::shared_mutex> lk(mx_);
    return entries_.size();
}

} // namespace nw
