#pragma once

#include <filesystem>

#include "graph_model.hpp"

namespace nw {

class GraphIOService {
 public:
  GraphSnapshot read(const std::filesystem::path& yaml_path) const;
  void load(GraphModel& graph, const std::filesystem::path& yaml_path) const;
  void save(const GraphModel& graph,
            const std::filesystem::path& yaml_path) const;
};

}  // namespace nw
