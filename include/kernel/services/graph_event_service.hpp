#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "nw_types.hpp"

namespace nw {

class GraphEventService {
 public:
  // source is one of "start", "processed", "no_input", "error", "cancelled".
  struct ComputeEvent {
    NodeId id;
    std::string name;
    std::string source;
    double elapsed_ms;
    std::string message;
  };

  void push(const NodeId& id, const std::string& name, const std::string& source,
            double ms, const std::string& message = {});
  std::vector<ComputeEvent> drain();

 private:
  std::mutex mutex_;
  std::vector<ComputeEvent> buffer_;
};

}  // namespace nw
