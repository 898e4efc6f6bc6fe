// Nodeweave kernel: single-flight cancelling processing queue
#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "kernel/cancellation.hpp"
#include "kernel/services/graph_traversal_service.hpp"

namespace nw {

/**
 * @brief 按节点串行化的处理队列。
 *
 * add() 提交时先取消该节点及其全部下游节点上排队或正在运行的任务，
 * 再以新的取消令牌入队。排空线程按 FIFO 取任务，但不会为仍有活动任务的
 * 节点启动新任务。同一节点最后一次提交总是胜出。
 */
class NODEWEAVE_API ProcessingQueue {
public:
    using Work = std::function<Outcome(const CancellationToken&)>;
    // Runs under the queue lock together with the final cancellation check.
    using Commit = std::function<void(const Outcome&)>;

    explicit ProcessingQueue(const GraphTraversalService& traversal,
                             unsigned concurrency = 1, bool quiet = true);
    ~ProcessingQueue();

    ProcessingQueue(const ProcessingQueue&) = delete;
    ProcessingQueue& operator=(const ProcessingQueue&) = delete;

    std::future<Outcome> add(const NodeId& node_id, const std::vector<Edge>& edges,
                             Work work, Commit commit = {});

    void cancel_node(const NodeId& node_id);
    void clear_all();
    // Clears and joins the drain threads. Later add() calls are rejected.
    void stop();

    size_t queued_count() const;
    size_t active_count() const;
    bool is_active(const NodeId& node_id) const;
    bool is_queued(const NodeId& node_id) const;
    unsigned concurrency() const { return concurrency_; }

private:
    struct Task {
        uint64_t seq = 0;
        NodeId node_id;
        Work work;
        Commit commit;
        std::promise<Outcome> promise;
        CancellationSource source;
    };

    void run_loop(int thread_id);
    void cancel_locked(const NodeId& node_id);
    void reject_cancelled(Task& task);
    std::deque<std::shared_ptr<Task>>::iterator next_runnable_locked();
    void log(const std::string& msg) const;

    const GraphTraversalService& traversal_;
    unsigned concurrency_;
    bool quiet_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<Task>> queue_;
    std::unordered_map<NodeId, std::shared_ptr<Task>> active_;
    std::vector<std::thread> workers_;
    bool running_ = true;
    uint64_t next_seq_ = 0;
};

} // namespace nw
