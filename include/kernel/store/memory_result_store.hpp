// Nodeweave kernel: session-only result store
#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "kernel/store/result_store.hpp"

namespace nw {

class NODEWEAVE_API MemoryResultStore final : public ResultStore {
public:
    void put(const CacheEntry& entry) override;
    std::optional<CacheEntry> get(const NodeId& id) const override;
    std::optional<CacheEntry> find(const NodeId& id, const std::string& input_hash) const override;
    std::optional<CacheEntry> find_by_hash(const std::string& hash) const override;
    bool update_age(const NodeId& id, int64_t age) override;
    int remove(const NodeId& id) override;
    int remove_older_than(int64_t cutoff) override;
    std::vector<CacheEntry> list() const override;
    size_t size() const override;

private:
    mutable std::shared_mutex mx_;
    std::unordered_map<NodeId, CacheEntry> entries_;
};

} // namespace nw
