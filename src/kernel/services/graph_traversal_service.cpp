#include "kernel/services/graph_traversal_service.hpp"

#include "graph_model.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <unordered_map>
#include <yaml-cpp/emitter.h>

namespace nw {

namespace {

std::unordered_map<NodeId, std::vector<NodeId>> build_adjacency(
    const std::vector<Edge>& edges) {
  std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
  adjacency.reserve(edges.size());
  for (const auto& edge : edges) {
    adjacency[edge.source].push_back(edge.target);
  }
  return adjacency;
}

void print_dep_tree_recursive(const GraphSnapshot& graph,
                              const std::unordered_map<NodeId, std::vector<Edge>>& incoming,
                              std::ostream& os,
                              const NodeId& node_id,
                              int level,
                              std::unordered_set<NodeId>& path,
                              bool show_config) {
  auto indent = [&](int l) {
    for (int i = 0; i < l; ++i) {
      os << "  ";
    }
  };

  if (path.count(node_id)) {
    indent(level);
    os << "- ... (Cycle detected on Node " << node_id << ") ...\n";
    return;
  }
  path.insert(node_id);

  indent(level);
  const Node* node = graph.find(node_id);
  if (!node) {
    os << "- Node " << node_id << " (missing)\n";
    path.erase(node_id);
    return;
  }
  os << "- Node " << node->id << " (" << node->name << " | " << node->type << ")"
     << (node->result ? " [result]" : "") << "\n";

  if (show_config && node->config && node->config.IsMap() && node->config.size() > 0) {
    indent(level + 1);
    YAML::Emitter ve;
    ve << YAML::Flow << node->config;
    os << "config: " << ve.c_str() << "\n";
  }

  auto it = incoming.find(node_id);
  if (it != incoming.end()) {
    for (const auto& edge : it->second) {
      indent(level + 1);
      os << "(" << edge.target_handle_id << " from " << edge.source << ":"
         << edge.source_handle_id << ")\n";
      print_dep_tree_recursive(graph, incoming, os, edge.source, level + 2, path,
                               show_config);
    }
  }
  path.erase(node_id);
}

}  // namespace

std::unordered_set<NodeId> GraphTraversalService::downstream_of(
    const NodeId& node_id, const std::vector<Edge>& edges) const {
  auto adjacency = build_adjacency(edges);

  std::unordered_set<NodeId> visited{node_id};
  std::unordered_set<NodeId> downstream;
  std::deque<NodeId> frontier{node_id};
  while (!frontier.empty()) {
    NodeId current = std::move(frontier.front());
    frontier.pop_front();
    auto it = adjacency.find(current);
    if (it == adjacency.end()) {
      continue;
    }
    for (const auto& target : it->second) {
      if (target.empty() || visited.count(target)) {
        continue;
      }
      visited.insert(target);
      downstream.insert(target);
      frontier.push_back(target);
    }
  }
  return downstream;
}

std::vector<Edge> GraphTraversalService::upstream_edges(
    const NodeId& node_id, const std::vector<Edge>& edges) const {
  std::vector<Edge> result;
  for (const auto& edge : edges) {
    if (edge.target == node_id) {
      result.push_back(edge);
    }
  }
  return result;
}

std::vector<NodeId> GraphTraversalService::topo_order(
    const std::vector<NodeId>& ids, const std::vector<Edge>& edges) const {
  std::unordered_map<NodeId, size_t> position;
  for (size_t i = 0; i < ids.size(); ++i) {
    position.emplace(ids[i], i);
  }

  std::unordered_map<NodeId, int> in_degree;
  std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
  for (const auto& id : ids) {
    in_degree[id] = 0;
  }
  for (const auto& edge : edges) {
    if (!position.count(edge.source) || !position.count(edge.target) ||
        edge.source == edge.target) {
      continue;
    }
    adjacency[edge.source].push_back(edge.target);
    in_degree[edge.target]++;
  }

  // Ready set ordered by input position so the result is deterministic.
  auto by_position = [&](const NodeId& a, const NodeId& b) {
    return position.at(a) > position.at(b);
  };
  std::vector<NodeId> ready;
  for (const auto& id : ids) {
    if (in_degree[id] == 0) {
      ready.push_back(id);
    }
  }
  std::make_heap(ready.begin(), ready.end(), by_position);

  std::vector<NodeId> order;
  order.reserve(ids.size());
  std::unordered_set<NodeId> emitted;
  while (!ready.empty()) {
    std::pop_heap(ready.begin(), ready.end(), by_position);
    NodeId current = ready.back();
    ready.pop_back();
    if (!emitted.insert(current).second) {
      continue;
    }
    order.push_back(current);
    for (const auto& next : adjacency[current]) {
      if (--in_degree[next] == 0) {
        ready.push_back(next);
        std::push_heap(ready.begin(), ready.end(), by_position);
      }
    }
  }

  for (const auto& id : ids) {
    if (!emitted.count(id)) {
      emitted.insert(id);
      order.push_back(id);
    }
  }
  return order;
}

std::vector<NodeId> GraphTraversalService::ending_nodes(const GraphSnapshot& graph) const {
  std::unordered_set<NodeId> is_input_to_something;
  for (const auto& edge : graph.edges) {
    is_input_to_something.insert(edge.source);
  }
  std::vector<NodeId> ends;
  ends.reserve(graph.nodes.size());
  for (const auto& pair : graph.nodes) {
    if (is_input_to_something.find(pair.first) == is_input_to_something.end()) {
      ends.push_back(pair.first);
    }
  }
  std::sort(ends.begin(), ends.end());
  return ends;
}

void GraphTraversalService::print_dependency_tree(const GraphSnapshot& graph,
                                                  std::ostream& os,
                                                  bool show_config) const {
  os << "Dependency Tree (reversed from ending nodes):\n";
  auto ends = ending_nodes(graph);
  if (ends.empty() && !graph.nodes.empty()) {
    os << "(Graph has cycles or is fully connected)\n";
  } else if (graph.nodes.empty()) {
    os << "(Graph is empty)\n";
  }

  std::unordered_map<NodeId, std::vector<Edge>> incoming;
  for (const auto& edge : graph.edges) {
    incoming[edge.target].push_back(edge);
  }
  for (const auto& end_node_id : ends) {
    std::unordered_set<NodeId> path;
    print_dep_tree_recursive(graph, incoming, os, end_node_id, 0, path, show_config);
  }
}

}  // namespace nw
