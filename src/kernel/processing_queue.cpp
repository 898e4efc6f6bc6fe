// Nodeweave kernel: ProcessingQueue implementation
#include "kernel/processing_queue.hpp"

#include <algorithm>
#include <iostream>

namespace nw {

namespace {

std::string cancel_message(const NodeId& node_id) {
    return "Processing cancelled for node " + node_id;
}

} // namespace

ProcessingQueue::ProcessingQueue(const GraphTraversalService& traversal,
                                 unsigned concurrency, bool quiet)
    : traversal_(traversal), concurrency_(std::max(1u, concurrency)), quiet_(quiet) {
    workers_.reserve(concurrency_);
    for (unsigned i = 0; i < concurrency_; ++i) {
        workers_.emplace_back(&ProcessingQueue::run_loop, this, static_cast<int>(i));
    }
}

ProcessingQueue::~ProcessingQueue() { stop(); }

void ProcessingQueue::log(const std::string& msg) const {
    if (!quiet_) {
        std::cout << "[queue] " << msg << std::endl;
    }
}

std::future<Outcome> ProcessingQueue::add(const NodeId& node_id, const std::vector<Edge>& edges,
                                          Work work, Commit commit) {
    auto task = std::make_shared<Task>();
    task->node_id = node_id;
    task->work = std::move(work);
    task->commit = std::move(commit);
    std::future<Outcome> fut = task->promise.get_future();

    // Closure computed outside the lock; edges belong to the caller.
    auto closure = traversal_.downstream_of(node_id, edges);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) {
            reject_cancelled(*task);
            return fut;
        }
        cancel_locked(node_id);
        for (const auto& id : closure) {
            cancel_locked(id);
        }
        task->seq = next_seq_++;
        queue_.push_back(task);
        log("queued node " + node_id + " (" + std::to_string(closure.size()) + " downstream cancelled)");
    }
    cv_.notify_all();
    return fut;
}

void ProcessingQueue::reject_cancelled(Task& task) {
    task.source.cancel();
    task.promise.set_exception(std::make_exception_ptr(ProcessingCancelled(cancel_message(task.node_id))));
}

void ProcessingQueue::cancel_locked(const NodeId& node_id) {
    auto active = active_.find(node_id);
    if (active != active_.end()) {
        active->second->source.cancel();
    }
    for (auto it = queue_.begin(); it != queue_.end();) {
        if ((*it)->node_id == node_id) {
            reject_cancelled(**it);
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
}

void ProcessingQueue::cancel_node(const NodeId& node_id) {
    std::lock_guard<std::mutex> lk(mtx_);
    cancel_locked(node_id);
}

void ProcessingQueue::clear_all() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& task : queue_) {
        reject_cancelled(*task);
    }
    queue_.clear();
    for (auto& pair : active_) {
        pair.second->source.cancel();
    }
}

void ProcessingQueue::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!running_) return;
        running_ = false;
        for (auto& task : queue_) {
            reject_cancelled(*task);
        }
        queue_.clear();
        for (auto& pair : active_) {
            pair.second->source.cancel();
        }
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

std::deque<std::shared_ptr<ProcessingQueue::Task>>::iterator ProcessingQueue::next_runnable_locked() {
    return std::find_if(queue_.begin(), queue_.end(), [this](const std::shared_ptr<Task>& t) {
        return active_.count(t->node_id) == 0;
    });
}

void ProcessingQueue::run_loop(int thread_id) {
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return !running_ || next_runnable_locked() != queue_.end(); });
            if (!running_) break;
            auto it = next_runnable_locked();
            task = *it;
            queue_.erase(it);
            if (task->source.cancelled()) {
                reject_cancelled(*task);
                continue;
            }
            active_[task->node_id] = task;
        }
        log("thread " + std::to_string(thread_id) + " started node " + task->node_id);

        const CancellationToken token = task->source.token();
        Outcome outcome;
        std::exception_ptr error;
        bool cancelled = false;
        try {
            outcome = task->work(token);
        } catch (const ProcessingCancelled&) {
            cancelled = true;
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lk(mtx_);
            auto it = active_.find(task->node_id);
            if (it != active_.end() && it->second == task) {
                active_.erase(it);
            }
            if (cancelled || (!error && task->source.cancelled())) {
                log("node " + task->node_id + " cancelled; result discarded");
                task->promise.set_exception(
                    std::make_exception_ptr(ProcessingCancelled(cancel_message(task->node_id))));
            } else if (error) {
                task->promise.set_exception(error);
            } else {
                bool committed = true;
                if (task->commit) {
                    try {
                        task->commit(outcome);
                    } catch (...) {
                        committed = false;
                        task->promise.set_exception(std::current_exception());
                    }
                }
                if (committed) {
                    task->promise.set_value(std::move(outcome));
                }
            }
        }
        cv_.notify_all();
    }
}

size_t ProcessingQueue::queued_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

size_t ProcessingQueue::active_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.size();
}

bool ProcessingQueue::is_active(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_.count(node_id) > 0;
}

bool ProcessingQueue::is_queued(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::any_of(queue_.begin(), queue_.end(),
                       [&](const std::shared_ptr<Task>& t) { return t->node_id == node_id; });
}

} // namespace nw
