// Nodeweave kernel: per-editor-session composition root
#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine_config.hpp"
#include "graph_model.hpp"
#include "kernel/media_loader.hpp"
#include "kernel/node_processor.hpp"
#include "kernel/processing_queue.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "kernel/services/graph_traversal_service.hpp"
#include "kernel/services/hash_service.hpp"
#include "kernel/services/input_resolver.hpp"
#include "kernel/services/result_cache_service.hpp"
#include "kernel/store/result_store.hpp"
#include "kernel/worker_pool.hpp"

namespace nw {

/**
 * @brief 一个编辑器会话的全部引擎服务。
 *
 * 拥有结果存储、缓存、处理队列、工作线程池、处理器注册表、事件缓冲和图模型。
 * 没有任何全局单例，多个会话可以并存。
 */
class NODEWEAVE_API EngineSession {
public:
    struct Submission {
        NodeId node_id;
        std::shared_future<Outcome> outcome;
    };

    // store / media / clock default to the configured backend, DefaultMediaLoader
    // and the system clock.
    explicit EngineSession(EngineConfig config,
                           std::unique_ptr<ResultStore> store = nullptr,
                           std::unique_ptr<MediaLoader> media = nullptr,
                           ResultCacheService::Clock clock = {});
    ~EngineSession();

    EngineSession(const EngineSession&) = delete;
    EngineSession& operator=(const EngineSession&) = delete;

    // Replaces the model with the graph file without processing anything.
    void load_graph(const std::filesystem::path& yaml_path);
    void save_graph(const std::filesystem::path& yaml_path) const;

    // Resolves inputs when the task starts, runs the node's processor and
    // commits a successful result into the model.
    std::future<Outcome> process_node(const NodeId& node_id);

    // Diffs `next` against the model, evicts removed nodes and submits every
    // changed node plus its downstream closure in topological order.
    std::vector<Submission> update_graph(GraphSnapshot next);

    // "stop generation" for one node.
    void stop_node(const NodeId& node_id);
    int cleanup_expired();
    void shutdown();

    void attach_preview(const NodeId& node_id, PreviewSurface* surface);
    void detach_preview(const NodeId& node_id);

    std::vector<GraphEventService::ComputeEvent> drain_events() { return events_.drain(); }

    const EngineConfig& config() const { return config_; }
    GraphModel& model() { return model_; }
    ResultCacheService& cache() { return cache_; }
    const HashService& hashes() const { return hashes_; }
    ProcessingQueue& queue() { return queue_; }
    WorkerPool* worker_pool() { return pool_.get(); }
    ProcessorRegistry& processors() { return registry_; }
    GraphEventService& events() { return events_; }
    const GraphTraversalService& traversal() const { return traversal_; }

private:
    std::shared_future<Outcome> submit(const NodeId& node_id, const std::vector<Edge>& edges,
                                       std::vector<std::shared_future<Outcome>> wait_for);
    Outcome run_node(const NodeId& node_id, const CancellationToken& token,
                     const std::vector<std::shared_future<Outcome>>& wait_for);
    PreviewSurface* preview_for(const NodeId& node_id) const;
    std::string intrinsic_signature(const Node& node) const;
    void log(const std::string& msg) const;

    EngineConfig config_;
    Sha256Hasher hasher_;
    HashService hashes_;
    std::unique_ptr<ResultStore> store_;
    ResultCacheService cache_;
    std::unique_ptr<MediaLoader> media_;
    GraphTraversalService traversal_;
    InputResolver resolver_;
    GraphEventService events_;
    GraphModel model_;
    std::unique_ptr<WorkerPool> pool_;
    ProcessorRegistry registry_;
    ProcessingQueue queue_;

    mutable std::mutex preview_mutex_;
    std::unordered_map<NodeId, PreviewSurface*> previews_;
    bool shut_down_ = false;
};

// Builds the store named by config.cache_backend.
NODEWEAVE_API std::unique_ptr<ResultStore> make_result_store(const EngineConfig& config);

} // namespace nw
