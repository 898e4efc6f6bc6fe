#pragma once

#include <optional>
#include <string>
#include <vector>

#include "graph_model.hpp"
#include "kernel/services/result_cache_service.hpp"

namespace nw {

// One connected input of a node: the upstream's committed result and/or its
// latest cache entry, plus the item on the connected source handle of each.
struct ResolvedInput {
    std::string target_handle_id;
    NodeId source_node_id;
    std::string source_handle_id;

    std::optional<NodeResult> result;
    std::optional<CacheEntry> cached;
    std::optional<OutputItem> value;
    std::optional<OutputItem> cached_value;

    bool has_value() const { return value.has_value() || cached_value.has_value(); }
    // Committed result when present, otherwise the cached one.
    const NodeResult* result_to_use() const;
    // true when the value comes from the cache rather than a committed result.
    bool from_cache() const { return !value.has_value() && cached_value.has_value(); }
};

using ResolvedInputs = std::vector<ResolvedInput>;

class NODEWEAVE_API InputResolver {
public:
    // Inputs in incoming edge order. Unknown source nodes yield an entry
    // without values.
    ResolvedInputs resolve(const GraphSnapshot& graph, const NodeId& node_id,
                           const ResultCacheService& cache) const;
};

// First input with a value whose item type is `type`.
const ResolvedInput* find_input(const ResolvedInputs& inputs, ItemType type);

} // namespace nw
