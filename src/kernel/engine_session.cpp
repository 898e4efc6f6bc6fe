// Nodeweave kernel: EngineSession implementation
#include "kernel/engine_session.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <unordered_set>

#include "kernel/builtin_processors.hpp"
#include "kernel/services/graph_io_service.hpp"
#include "kernel/store/memory_result_store.hpp"
#include "kernel/store/sqlite_result_store.hpp"

namespace nw {

namespace {

// target -> sorted "target_handle|source|source_handle"
std::unordered_map<NodeId, std::vector<std::string>> incoming_signatures(const std::vector<Edge>& edges) {
    std::unordered_map<NodeId, std::vector<std::string>> sigs;
    for (const auto& e : edges) {
        sigs[e.target].push_back(e.target_handle_id + "|" + e.source + "|" + e.source_handle_id);
    }
    for (auto& pair : sigs) {
        std::sort(pair.second.begin(), pair.second.end());
    }
    return sigs;
}

const std::vector<std::string>& signature_of(
    const std::unordered_map<NodeId, std::vector<std::string>>& sigs, const NodeId& id) {
    static const std::vector<std::string> kNone;
    auto it = sigs.find(id);
    return it == sigs.end() ? kNone : it->second;
}

} // namespace

std::unique_ptr<ResultStore> make_result_store(const EngineConfig& config) {
    if (config.cache_backend == "memory") {
        return std::make_unique<MemoryResultStore>();
    }
    if (config.cache_backend == "sqlite") {
        return std::make_unique<SqliteResultStore>(config.cache_path);
    }
    throw GraphError(GraphErrc::InvalidParameter, "Unknown cache_backend: " + config.cache_backend);
}

EngineSession::EngineSession(EngineConfig config, std::unique_ptr<ResultStore> store,
                             std::unique_ptr<MediaLoader> media, ResultCacheService::Clock clock)
    : config_(std::move(config)),
      hashes_(hasher_),
      store_(store ? std::move(store) : make_result_store(config_)),
      cache_(*store_, hashes_, std::move(clock)),
      media_(media ? std::move(media) : std::make_unique<DefaultMediaLoader>()),
      pool_(config_.use_worker_pool
                ? std::make_unique<WorkerPool>(WorkerOpTable::builtin(), config_.worker_pool_size,
                                               WorkerPool::InitFn(), config_.quiet)
                : nullptr),
      queue_(traversal_, config_.queue_concurrency, config_.quiet) {
    register_builtin_processors(registry_,
                                ProcessorServices{cache_, hashes_, *media_, pool_.get(), config_.quiet});
    log("session ready (" + std::string(pool_ ? std::to_string(pool_->size()) + " workers" : "inline transforms") +
        ", cache backend " + config_.cache_backend + ")");
}

EngineSession::~EngineSession() { shutdown(); }

void EngineSession::log(const std::string& msg) const {
    if (!config_.quiet) {
        std::cout << "[session] " << msg << std::endl;
    }
}

void EngineSession::load_graph(const std::filesystem::path& yaml_path) {
    GraphIOService().load(model_, yaml_path);
}

void EngineSession::save_graph(const std::filesystem::path& yaml_path) const {
    GraphIOService().save(model_, yaml_path);
}

void EngineSession::attach_preview(const NodeId& node_id, PreviewSurface* surface) {
    std::lock_guard<std::mutex> lk(preview_mutex_);
    previews_[node_id] = surface;
}

void EngineSession::detach_preview(const NodeId& node_id) {
    std::lock_guard<std::mutex> lk(preview_mutex_);
    previews_.erase(node_id);
}

PreviewSurface* EngineSession::preview_for(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lk(preview_mutex_);
    auto it = previews_.find(node_id);
    return it == previews_.end() ? nullptr : it->second;
}

Outcome EngineSession::run_node(const NodeId& node_id, const CancellationToken& token,
                                const std::vector<std::shared_future<Outcome>>& wait_for) {
    const std::string cancel_what = "Processing cancelled for node " + node_id;
    for (const auto& upstream : wait_for) {
        wait_until_ready(upstream, token, cancel_what);
        // 上游被取消时下游一并取消；上游失败则由输入解析报告 "no input"
        try {
            upstream.get();
        } catch (const ProcessingCancelled&) {
            throw ProcessingCancelled(cancel_what);
        } catch (const GraphError& e) {
            log("upstream of " + node_id + " failed: " + e.what());
        }
    }

    GraphSnapshot snapshot = model_.snapshot();
    const Node* node = snapshot.find(node_id);
    if (!node) {
        return Outcome::failure("Node not found: " + node_id);
    }
    NodeProcessor* processor = registry_.find(node->type);
    if (!processor) {
        return Outcome::failure("No processor registered for node type '" + node->type + "'");
    }

    events_.push(node->id, node->name, "start", 0.0);
    auto start = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = [&] {
        return std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start)
            .count();
    };

    try {
        ResolvedInputs inputs = resolver_.resolve(snapshot, node_id, cache_);
        ProcessContext ctx{*node, inputs, token, preview_for(node_id)};
        Outcome outcome = processor->process(ctx);
        if (outcome.success) {
            events_.push(node->id, node->name, "processed", elapsed_ms());
        } else if (outcome.error == "no input") {
            events_.push(node->id, node->name, "no_input", elapsed_ms(), outcome.error);
        } else {
            events_.push(node->id, node->name, "error", elapsed_ms(), outcome.error);
        }
        return outcome;
    } catch (const ProcessingCancelled& e) {
        events_.push(node->id, node->name, "cancelled", elapsed_ms(), e.what());
        throw;
    } catch (const GraphError& e) {
        events_.push(node->id, node->name, "error", elapsed_ms(), e.what());
        return Outcome::failure(e.what());
    }
}

std::shared_future<Outcome> EngineSession::submit(const NodeId& node_id, const std::vector<Edge>& edges,
                                                  std::vector<std::shared_future<Outcome>> wait_for) {
    auto work = [this, node_id, wait_for = std::move(wait_for)](const CancellationToken& token) {
        return run_node(node_id, token, wait_for);
    };
    auto commit = [this, node_id](const Outcome& outcome) {
        if (outcome.success && outcome.new_result) {
            if (!model_.apply_result(node_id, *outcome.new_result)) {
                log("node " + node_id + " was removed before its result could be applied");
            }
        }
    };
    return queue_.add(node_id, edges, std::move(work), std::move(commit)).share();
}

std::future<Outcome> EngineSession::process_node(const NodeId& node_id) {
    const std::vector<Edge> edges = model_.snapshot().edges;
    auto work = [this, node_id](const CancellationToken& token) {
        return run_node(node_id, token, {});
    };
    auto commit = [this, node_id](const Outcome& outcome) {
        if (outcome.success && outcome.new_result) {
            model_.apply_result(node_id, *outcome.new_result);
        }
    };
    return queue_.add(node_id, edges, std::move(work), std::move(commit));
}

std::string EngineSession::intrinsic_signature(const Node& node) const {
    std::string sig = hashes_.hash_config(node.config);
    // 有处理器的节点其结果归引擎所有，不计入签名
    if (!registry_.find(node.type)) {
        sig += "|" + (node.result ? hashes_.hash_result(*node.result) : std::string());
    }
    return sig;
}

std::vector<EngineSession::Submission> EngineSession::update_graph(GraphSnapshot next) {
    // YAML::Node copies share storage with the caller's snapshot.
    next = next.clone();
    GraphSnapshot prev = model_.snapshot();

    std::vector<NodeId> removed;
    for (const auto& pair : prev.nodes) {
        if (!next.has_node(pair.first)) removed.push_back(pair.first);
    }
    std::sort(removed.begin(), removed.end());
    for (const auto& id : removed) {
        queue_.cancel_node(id);
    }
    if (!removed.empty()) {
        int evicted = cache_.delete_for_nodes(removed);
        log("removed " + std::to_string(removed.size()) + " nodes, evicted " + std::to_string(evicted) +
            " cache entries");
    }

    const auto prev_sigs = incoming_signatures(prev.edges);
    const auto next_sigs = incoming_signatures(next.edges);

    std::vector<NodeId> changed;
    for (const auto& pair : next.nodes) {
        const Node* before = prev.find(pair.first);
        if (!before || intrinsic_signature(*before) != intrinsic_signature(pair.second) ||
            signature_of(prev_sigs, pair.first) != signature_of(next_sigs, pair.first)) {
            changed.push_back(pair.first);
        }
    }

    std::unordered_set<NodeId> affected(changed.begin(), changed.end());
    for (const auto& id : changed) {
        auto closure = traversal_.downstream_of(id, next.edges);
        affected.insert(closure.begin(), closure.end());
    }

    std::vector<NodeId> runnable;
    for (const auto& id : affected) {
        const Node* node = next.find(id);
        if (node && registry_.find(node->type)) runnable.push_back(id);
    }
    std::sort(runnable.begin(), runnable.end());
    std::vector<NodeId> order = traversal_.topo_order(runnable, next.edges);

    const std::vector<Edge> edges = next.edges;
    // 有处理器的节点保留模型中此刻已提交的结果，期间完成的任务不会被回退
    model_.replace_keeping_results(std::move(next), [this](const Node& node) {
        return registry_.find(node.type) != nullptr;
    });

    std::vector<Submission> submissions;
    std::map<NodeId, std::shared_future<Outcome>> submitted;
    for (const auto& id : order) {
        std::vector<std::shared_future<Outcome>> wait_for;
        for (const auto& edge : traversal_.upstream_edges(id, edges)) {
            auto it = submitted.find(edge.source);
            if (it != submitted.end()) wait_for.push_back(it->second);
        }
        auto fut = submit(id, edges, std::move(wait_for));
        submitted[id] = fut;
        submissions.push_back(Submission{id, fut});
    }
    log("update_graph: " + std::to_string(changed.size()) + " changed, " +
        std::to_string(submissions.size()) + " submitted");
    return submissions;
}

void EngineSession::stop_node(const NodeId& node_id) {
    queue_.cancel_node(node_id);
}

int EngineSession::cleanup_expired() {
    return cache_.cleanup(config_.cache_max_age_ms);
}

void EngineSession::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    queue_.stop();
    if (pool_) pool_->terminate();
    log("session shut down");
}

} // namespace nw
