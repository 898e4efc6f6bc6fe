// Nodeweave kernel: WorkerPool implementation
#include "kernel/worker_pool.hpp"

#include <algorithm>
#include <iostream>

#include "kernel/image_ops.hpp"

namespace nw {

// --- WorkerOpTable ---

void WorkerOpTable::register_op(const std::string& name, WorkerOp op) {
    ops_[name] = std::move(op);
}

const WorkerOp* WorkerOpTable::find(const std::string& name) const {
    auto it = ops_.find(name);
    return it == ops_.end() ? nullptr : &it->second;
}

std::vector<std::string> WorkerOpTable::names() const {
    std::vector<std::string> out;
    out.reserve(ops_.size());
    for (const auto& pair : ops_) out.push_back(pair.first);
    return out;
}

WorkerOpTable WorkerOpTable::builtin() {
    WorkerOpTable table;
    table.register_op("resize", &ops::resize);
    table.register_op("blur", &ops::blur);
    return table;
}

// --- WorkerPool ---

WorkerPool::WorkerPool(WorkerOpTable ops, unsigned size, InitFn init, bool quiet)
    : ops_(std::move(ops)),
      size_(size > 0 ? size : std::max(1u, std::thread::hardware_concurrency())),
      init_(std::move(init)),
      quiet_(quiet) {
    // Busy until init completes.
    busy_.assign(size_, true);
    workers_.reserve(size_);
    for (unsigned i = 0; i < size_; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
    for (unsigned i = 0; i < size_; ++i) {
        workers_[i]->thread = std::thread(&WorkerPool::worker_loop, this, static_cast<int>(i));
    }
}

WorkerPool::~WorkerPool() {
    terminate();
}

std::future<cv::Mat> WorkerPool::process(const cv::Mat& payload, const std::string& op,
                                         const YAML::Node& params) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::promise<cv::Mat> promise;
    std::future<cv::Mat> fut = promise.get_future();
    if (terminated_) {
        promise.set_exception(std::make_exception_ptr(
            GraphError(GraphErrc::ComputeError, "Worker pool has been terminated")));
        return fut;
    }
    WorkerRequest req;
    req.task_id = next_task_id_++;
    req.op = op;
    req.payload = payload;
    req.params = params ? YAML::Clone(params) : YAML::Node(YAML::NodeType::Map);
    task_map_.emplace(req.task_id, std::move(promise));
    task_queue_.push_back(std::move(req));
    process_queue_locked();
    return fut;
}

void WorkerPool::process_queue_locked() {
    while (!task_queue_.empty()) {
        int idle = -1;
        for (unsigned i = 0; i < size_; ++i) {
            if (!busy_[i]) {
                idle = static_cast<int>(i);
                break;
            }
        }
        if (idle < 0) return;

        busy_[idle] = true;
        Worker& w = *workers_[idle];
        {
            std::lock_guard<std::mutex> wlk(w.mx);
            w.inbox = std::move(task_queue_.front());
        }
        task_queue_.pop_front();
        w.cv.notify_one();
    }
}

WorkerResponse WorkerPool::execute(const WorkerRequest& req) const {
    WorkerResponse resp;
    resp.task_id = req.task_id;
    const WorkerOp* op = ops_.find(req.op);
    if (!op) {
        resp.error = "Unknown operation: " + req.op;
        return resp;
    }
    try {
        resp.data = (*op)(req.payload, req.params);
        resp.success = true;
    } catch (const std::exception& e) {
        resp.error = e.what();
    }
    return resp;
}

void WorkerPool::worker_loop(int index) {
    Worker& w = *workers_[index];
    bool init_ok = true;
    if (init_) {
        try {
            init_(index);
        } catch (const std::exception& e) {
            init_ok = false;
            std::cerr << "[worker_pool] worker " << index << " init failed: " << e.what() << std::endl;
        }
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++initialized_;
        // A worker whose init failed stays busy and never receives tasks.
        if (init_ok && !terminated_) {
            busy_[index] = false;
            process_queue_locked();
        }
    }
    ready_cv_.notify_all();

    while (true) {
        WorkerRequest req;
        {
            std::unique_lock<std::mutex> wlk(w.mx);
            w.cv.wait(wlk, [&] { return w.stop || w.inbox.has_value(); });
            if (w.stop) return;
            req = std::move(*w.inbox);
            w.inbox.reset();
        }
        on_response(index, execute(req));
    }
}

void WorkerPool::on_response(int index, WorkerResponse resp) {
    std::promise<cv::Mat> promise;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (terminated_) return;
        busy_[index] = false;
        auto it = task_map_.find(resp.task_id);
        if (it == task_map_.end()) {
            if (!quiet_) {
                std::cerr << "[worker_pool] response for unknown task " << resp.task_id << std::endl;
            }
            process_queue_locked();
            return;
        }
        promise = std::move(it->second);
        task_map_.erase(it);
        process_queue_locked();
    }
    if (resp.success) {
        promise.set_value(std::move(resp.data));
    } else {
        if (!quiet_) {
            std::cerr << "[worker_pool] task " << resp.task_id << " failed: " << resp.error << std::endl;
        }
        promise.set_exception(std::make_exception_ptr(GraphError(GraphErrc::ComputeError, resp.error)));
    }
}

void WorkerPool::terminate() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (terminated_) return;
        terminated_ = true;
        task_queue_.clear();
        for (auto& w : workers_) {
            std::lock_guard<std::mutex> wlk(w->mx);
            w->stop = true;
        }
    }
    for (auto& w : workers_) {
        w->cv.notify_all();
    }
    ready_cv_.notify_all();
    for (auto& w : workers_) {
        if (w->thread.joinable()) w->thread.join();
    }
}

size_t WorkerPool::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return task_queue_.size();
}

unsigned WorkerPool::busy_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    unsigned n = 0;
    for (bool b : busy_) {
        if (b) ++n;
    }
    return n;
}

bool WorkerPool::terminated() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return terminated_;
}

void WorkerPool::wait_ready() {
    std::unique_lock<std::mutex> lk(mtx_);
    ready_cv_.wait(lk, [&] { return terminated_ || initialized_ == size_; });
}

} // namespace nw
