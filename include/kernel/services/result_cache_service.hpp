#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "node.hpp"
#include "kernel/services/hash_service.hpp"
#include "kernel/store/result_store.hpp"

namespace nw {

/**
 * @brief 节点结果缓存：以 (node_id, input_hash) 为记忆键，以 hash 为内容标识。
 *
 * 每个节点最多一条记录，写入即覆盖。存储错误以 GraphError{Storage} 抛出，
 * 找不到记录不算错误，返回 std::nullopt。
 */
class NODEWEAVE_API ResultCacheService {
public:
    using Clock = std::function<int64_t()>;

    ResultCacheService(ResultStore& store, const HashService& hashes, Clock now_ms = {});

    // Upsert; stores hash(result) and age = now. Returns the entry id.
    NodeId put(const NodeId& node_id, const std::string& name,
               const NodeResult& result, const std::string& input_hash);

    std::optional<CacheEntry> get(const NodeId& node_id, const std::string& input_hash) const;
    std::optional<CacheEntry> latest(const NodeId& node_id) const;
    std::optional<CacheEntry> find_by_hash(const std::string& hash) const;

    // age = now; false if the entry is gone.
    bool touch(const NodeId& id);

    // Removes entries with age <= now - max_age_ms.
    int cleanup(int64_t max_age_ms);

    int delete_for_node(const NodeId& node_id);
    int delete_for_nodes(const std::vector<NodeId>& node_ids);

    // Returns an existing entry holding the same content (touched), otherwise
    // stores `result` under the node's current input hash.
    CacheEntry get_or_create(const Node& node, const NodeResult& result,
                             const std::string& input_hash = {});

    std::vector<CacheEntry> entries() const;
    size_t size() const;

    int64_t now() const { return now_ms_(); }

private:
    ResultStore& store_;
    const HashService& hashes_;
    Clock now_ms_;
};

// Milliseconds since the Unix epoch from the system clock.
NODEWEAVE_API int64_t system_now_ms();

} // namespace nw
