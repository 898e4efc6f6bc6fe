#pragma once

#include "nw_types.hpp"
#include "node.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace nw {

class GraphIOService;

// Read-only {nodes, edges} view handed to the engine. Copies are deep.
struct GraphSnapshot {
    std::unordered_map<NodeId, Node> nodes;
    std::vector<Edge> edges;

    bool has_node(const NodeId& id) const { return nodes.count(id) > 0; }
    const Node* find(const NodeId& id) const;
    GraphSnapshot clone() const;
};

// The node/edge store the engine reads from and commits results into.
// Stands in for the editor's reactive store.
class GraphModel {
public:
    GraphModel() = default;
    explicit GraphModel(GraphSnapshot initial);

    GraphModel(const GraphModel&) = delete;
    GraphModel& operator=(const GraphModel&) = delete;

    void clear();
    void add_node(const Node& node);
    bool has_node(const NodeId& id) const;
    std::vector<NodeId> node_ids() const;

    GraphSnapshot snapshot() const;
    void replace(GraphSnapshot next);
    // Same as replace(), but nodes matching `keep_result` carry over the result
    // committed in the model at swap time instead of the one in `next`.
    void replace_keeping_results(GraphSnapshot next,
                                 const std::function<bool(const Node&)>& keep_result);

    std::optional<NodeResult> result_of(const NodeId& id) const;
    // Returns false when the node no longer exists.
    bool apply_result(const NodeId& id, const NodeResult& result);

private:
    friend class GraphIOService;

    mutable std::mutex graph_mutex_;
    GraphSnapshot graph_;
};

} // namespace nw
