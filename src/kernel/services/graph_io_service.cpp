#include "kernel/services/graph_io_service.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>

#include "graph_model.hpp"

namespace nw {

GraphSnapshot GraphIOService::read(const std::filesystem::path& yaml_path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path.string());
  } catch (const std::exception& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " +
                                        yaml_path.string() + ": " + e.what());
  }
  if (!root.IsMap() || !root["nodes"] || !root["nodes"].IsSequence()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "YAML root must be a map with a 'nodes' sequence.");
  }

  GraphSnapshot snapshot;
  for (const auto& node_yaml : root["nodes"]) {
    Node node = Node::from_yaml(node_yaml);
    if (snapshot.nodes.count(node.id)) {
      throw GraphError(GraphErrc::InvalidYaml, "Duplicate node ID: " + node.id);
    }
    snapshot.nodes.emplace(node.id, std::move(node));
  }
  if (root["edges"]) {
    if (!root["edges"].IsSequence()) {
      throw GraphError(GraphErrc::InvalidYaml, "'edges' must be a sequence.");
    }
    for (const auto& edge_yaml : root["edges"]) {
      snapshot.edges.push_back(Edge::from_yaml(edge_yaml));
    }
  }
  return snapshot;
}

void GraphIOService::load(GraphModel& graph,
                          const std::filesystem::path& yaml_path) const {
  graph.replace(read(yaml_path));
}

void GraphIOService::save(const GraphModel& graph,
                          const std::filesystem::path& yaml_path) const {
  YAML::Node root;
  YAML::Node nodes(YAML::NodeType::Sequence);
  YAML::Node edges(YAML::NodeType::Sequence);
  {
    std::lock_guard<std::mutex> lk(graph.graph_mutex_);
    std::vector<NodeId> sorted_ids;
    sorted_ids.reserve(graph.graph_.nodes.size());
    for (const auto& pair : graph.graph_.nodes) {
      sorted_ids.push_back(pair.first);
    }
    std::sort(sorted_ids.begin(), sorted_ids.end());
    for (const auto& id : sorted_ids) {
      nodes.push_back(graph.graph_.nodes.at(id).to_yaml());
    }
    for (const auto& edge : graph.graph_.edges) {
      edges.push_back(edge.to_yaml());
    }
  }
  root["nodes"] = nodes;
  root["edges"] = edges;

  std::ofstream fout(yaml_path);
  if (!fout) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for writing: " + yaml_path.string());
  }
  fout << root;
}

}  // namespace nw
