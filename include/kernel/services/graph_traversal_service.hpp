#pragma once

#include <ostream>
#include <unordered_set>
#include <vector>

#include "graph_model.hpp"

namespace nw {

class GraphTraversalService {
 public:
  // Every node reachable by following edges forward from node_id, excluding
  // node_id itself. Terminates on cyclic edge sets.
  std::unordered_set<NodeId> downstream_of(const NodeId& node_id,
                                           const std::vector<Edge>& edges) const;

  std::vector<Edge> upstream_edges(const NodeId& node_id,
                                   const std::vector<Edge>& edges) const;

  // Topological order of `ids` using only the edges between them. Members of
  // a cycle are appended in their input order.
  std::vector<NodeId> topo_order(const std::vector<NodeId>& ids,
                                 const std::vector<Edge>& edges) const;

  std::vector<NodeId> ending_nodes(const GraphSnapshot& graph) const;

  void print_dependency_tree(const GraphSnapshot& graph, std::ostream& os,
                             bool show_config = true) const;
};

}  // namespace nw
