#include "graph_model.hpp"

#include <algorithm>

namespace nw {

const Node* GraphSnapshot::find(const NodeId& id) const {
  auto it = nodes.find(id);
  return it == nodes.end() ? nullptr : &it->second;
}

GraphSnapshot GraphSnapshot::clone() const {
  GraphSnapshot copy;
  copy.nodes.reserve(nodes.size());
  for (const auto& pair : nodes) {
    copy.nodes.emplace(pair.first, clone_node(pair.second));
  }
  copy.edges = edges;
  return copy;
}

GraphModel::GraphModel(GraphSnapshot initial) : graph_(std::move(initial)) {}

void GraphModel::clear() {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  graph_.nodes.clear();
  graph_.edges.clear();
}

void GraphModel::add_node(const Node& node) {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  if (graph_.nodes.count(node.id)) {
    throw GraphError(GraphErrc::InvalidYaml, "Duplicate node ID: " + node.id);
  }
  graph_.nodes.emplace(node.id, clone_node(node));
}

bool GraphModel::has_node(const NodeId& id) const {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  return graph_.has_node(id);
}

std::vector<NodeId> GraphModel::node_ids() const {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  std::vector<NodeId> ids;
  ids.reserve(graph_.nodes.size());
  for (const auto& pair : graph_.nodes) ids.push_back(pair.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

GraphSnapshot GraphModel::snapshot() const {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  return graph_.clone();
}

void GraphModel::replace(GraphSnapshot next) {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  graph_ = std::move(next);
}

void GraphModel::replace_keeping_results(GraphSnapshot next,
                                         const std::function<bool(const Node&)>& keep_result) {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  for (auto& pair : next.nodes) {
    if (!keep_result(pair.second)) continue;
    const Node* current = graph_.find(pair.first);
    if (current && current->result) {
      pair.second.result = clone_result(*current->result);
    } else {
      pair.second.result.reset();
    }
  }
  graph_ = std::move(next);
}

std::optional<NodeResult> GraphModel::result_of(const NodeId& id) const {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  const Node* node = graph_.find(id);
  if (!node || !node->result) return std::nullopt;
  return clone_result(*node->result);
}

bool GraphModel::apply_result(const NodeId& id, const NodeResult& result) {
  std::lock_guard<std::mutex> lk(graph_mutex_);
  auto it = graph_.nodes.find(id);
  if (it == graph_.nodes.end()) return false;
  it->second.result = clone_result(result);
  return true;
}

}  // namespace nw
