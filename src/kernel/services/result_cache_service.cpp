#include "kernel/services/result_cache_service.hpp"

#include <chrono>

namespace nw {

int64_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

ResultCacheService::ResultCacheService(ResultStore& store, const HashService& hashes, Clock now_ms)
    : store_(store), hashes_(hashes), now_ms_(now_ms ? std::move(now_ms) : Clock(&system_now_ms)) {}

NodeId ResultCacheService::put(const NodeId& node_id, const std::string& name,
                               const NodeResult& result, const std::string& input_hash) {
    CacheEntry entry;
    entry.id = node_id;
    entry.name = name;
    entry.hash = hashes_.hash_result(result);
    entry.input_hash = input_hash;
    entry.age = now();
    entry.result = clone_result(result);
    store_.put(entry);
    return entry.id;
}

std::optional<CacheEntry> ResultCacheService::get(const NodeId& node_id,
                                                  const std::string& input_hash) const {
    return store_.find(node_id, input_hash);
}

std::optional<CacheEntry> ResultCacheService::latest(const NodeId& node_id) const {
    return store_.get(node_id);
}

std::optional<CacheEntry> ResultCacheService::find_by_hash(const std::string& hash) const {
    return store_.find_by_hash(hash);
}

bool ResultCacheService::touch(const NodeId& id) {
    return store_.update_age(id, now());
}

int ResultCacheService::cleanup(int64_t max_age_ms) {
    return store_.remove_older_than(now() - max_age_ms);
}

int ResultCacheService::delete_for_node(const NodeId& node_id) {
    return store_.remove(node_id);
}

int ResultCacheService::delete_for_nodes(const std::vector<NodeId>& node_ids) {
    int removed = 0;
    for (const auto& id : node_ids) {
        removed += store_.remove(id);
    }
    return removed;
}

CacheEntry ResultCacheService::get_or_create(const Node& node, const NodeResult& result,
                                             const std::string& input_hash) {
    const std::string hash = hashes_.hash_result(result);
    if (auto existing = store_.find_by_hash(hash)) {
        store_.update_age(existing->id, now());
        existing->age = now();
        return *existing;
    }
    put(node.id, node.name, result, input_hash);
    auto stored = store_.get(node.id);
    if (!stored) {
        throw GraphError(GraphErrc::Storage, "Cache write for node " + node.id + " was not persisted");
    }
    return *stored;
}

std::vector<CacheEntry> ResultCacheService::entries() const {
    return store_.list();
}

size_t ResultCacheService::size() const {
    return store_.size();
}

} // namespace nw
