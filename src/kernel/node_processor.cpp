// Nodeweave kernel: CachingNodeProcessor and ProcessorRegistry
#include "kernel/node_processor.hpp"

#include <algorithm>
#include <iostream>

#include "adapter/media_codec_opencv.hpp"

namespace nw {

void CachingNodeProcessor::log(const std::string& msg) const {
    if (!services_.quiet) {
        std::cout << "[" << label() << "] " << msg << std::endl;
    }
}

std::string CachingNodeProcessor::cancel_message(const Node& node) const {
    return std::string(label()) + " processing cancelled for node " + node.id;
}

void CachingNodeProcessor::present_cached(const ProcessContext& ctx, const CacheEntry& entry) const {
    if (!ctx.preview) return;
    const NodeOutputSet* set = entry.result.selected();
    if (!set || set->items.empty() || set->items.front().type != ItemType::Image) return;
    FileData file = FileData::from_yaml(set->items.front().data);
    if (file.data_url.empty()) return;
    try {
        ctx.preview->present(ctx.node.id, decode_data_url(file.data_url));
    } catch (const GraphError& e) {
        // 预览失败不影响缓存命中的结果
        std::cerr << "Warning: preview of cached result for node " << ctx.node.id
                  << " failed: " << e.what() << std::endl;
    }
}

Outcome CachingNodeProcessor::process(const ProcessContext& ctx) {
    const Node& node = ctx.node;
    ctx.token.throw_if_cancelled(cancel_message(node));

    try {
        std::optional<InputSelection> selection = select(ctx);
        if (!selection) {
            int removed = services_.cache.delete_for_node(node.id);
            log("node " + node.id + " has no input; evicted " + std::to_string(removed) + " cache entries");
            return Outcome::failure("no input");
        }

        const std::string config_hash = services_.hashes.hash_config(node.config);
        const std::string input_hash =
            services_.hashes.input_hash(selection->source_hash, config_hash, selection->prior_hash);

        if (auto cached = services_.cache.get(node.id, input_hash)) {
            services_.cache.touch(cached->id);
            log("cache hit for node " + node.id);
            present_cached(ctx, *cached);
            return Outcome::ok(std::move(cached->result));
        }

        const std::string* handle = node.primary_output_handle();
        if (!handle) {
            return Outcome::failure("No output handle found");
        }

        ctx.token.throw_if_cancelled(cancel_message(node));
        NodeResult result = compute(ctx, *selection, *handle);
        ctx.token.throw_if_cancelled(cancel_message(node));

        services_.cache.put(node.id, node.name, result, input_hash);
        log("computed node " + node.id);
        return Outcome::ok(std::move(result));
    } catch (const ProcessingCancelled&) {
        log("node " + node.id + " cancelled");
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << label() << " processing failed for node " << node.id << ": "
                  << e.what() << std::endl;
        return Outcome::failure(e.what());
    }
}

// --- ProcessorRegistry ---

void ProcessorRegistry::register_processor(const std::string& type,
                                           std::shared_ptr<NodeProcessor> processor) {
    table_[type] = std::move(processor);
}

bool ProcessorRegistry::unregister_processor(const std::string& type) {
    return table_.erase(type) > 0;
}

NodeProcessor* ProcessorRegistry::find(const std::string& type) const {
    auto it = table_.find(type);
    return it == table_.end() ? nullptr : it->second.get();
}

std::vector<std::string> ProcessorRegistry::types() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace nw
