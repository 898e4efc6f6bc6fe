#include "kernel/services/input_resolver.hpp"

#include "kernel/services/graph_traversal_service.hpp"

namespace nw {

namespace {

std::optional<OutputItem> item_on_handle(const NodeResult& result, const std::string& handle) {
    const OutputItem* item = nullptr;
    if (handle.empty()) {
        const NodeOutputSet* set = result.selected();
        if (set && !set->items.empty()) item = &set->items.front();
    } else {
        item = result.find_item(handle);
    }
    if (!item) return std::nullopt;
    OutputItem copy;
    copy.type = item->type;
    copy.data = item->data ? YAML::Clone(item->data) : YAML::Node();
    copy.output_handle_id = item->output_handle_id;
    return copy;
}

} // namespace

const NodeResult* ResolvedInput::result_to_use() const {
    if (result) return &*result;
    if (cached) return &cached->result;
    return nullptr;
}

ResolvedInputs InputResolver::resolve(const GraphSnapshot& graph, const NodeId& node_id,
                                      const ResultCacheService& cache) const {
    ResolvedInputs inputs;
    GraphTraversalService traversal;
    for (const auto& edge : traversal.upstream_edges(node_id, graph.edges)) {
        ResolvedInput in;
        in.target_handle_id = edge.target_handle_id;
        in.source_node_id = edge.source;
        in.source_handle_id = edge.source_handle_id;

        const Node* source = graph.find(edge.source);
        if (source) {
            if (source->result) {
                in.result = clone_result(*source->result);
                in.value = item_on_handle(*in.result, edge.source_handle_id);
            }
            in.cached = cache.latest(edge.source);
            if (in.cached) {
                in.cached_value = item_on_handle(in.cached->result, edge.source_handle_id);
            }
        }
        inputs.push_back(std::move(in));
    }
    return inputs;
}

const ResolvedInput* find_input(const ResolvedInputs& inputs, ItemType type) {
    for (const auto& in : inputs) {
        if (in.value && in.value->type == type) return &in;
        if (!in.value && in.cached_value && in.cached_value->type == type) return &in;
    }
    return nullptr;
}

} // namespace nw
