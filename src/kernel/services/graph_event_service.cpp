#include "kernel/services/graph_event_service.hpp"

namespace nw {

void GraphEventService::push(const NodeId& id,
                             const std::string& name,
                             const std::string& source,
                             double ms,
                             const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(ComputeEvent{ id, name, source, ms, message });
}

std::vector<GraphEventService::ComputeEvent> GraphEventService::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ComputeEvent> out;
    out.swap(buffer_);
    return out;
}

} // namespace nw
