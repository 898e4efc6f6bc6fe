// Nodeweave kernel: fixed-size worker pool for CPU-bound image transforms
#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

#include "nw_types.hpp"

namespace nw {

using WorkerOp = std::function<cv::Mat(const cv::Mat&, const YAML::Node&)>;

// Name -> transform. Shared read-only by every worker once the pool starts.
class NODEWEAVE_API WorkerOpTable {
public:
    void register_op(const std::string& name, WorkerOp op);
    const WorkerOp* find(const std::string& name) const;
    std::vector<std::string> names() const;

    // "resize" and "blur"
    static WorkerOpTable builtin();

private:
    std::map<std::string, WorkerOp> ops_;
};

// Request / response envelope; the response echoes task_id.
struct WorkerRequest {
    uint64_t task_id = 0;
    std::string op;
    cv::Mat payload;
    YAML::Node params;
};

struct WorkerResponse {
    uint64_t task_id = 0;
    bool success = false;
    cv::Mat data;
    std::string error;
};

/**
 * @brief 固定大小的后台工作线程池。
 *
 * - 每个工作线程先运行一次 init 钩子，完成后才被标记为空闲。
 * - 调度：FIFO 任务队列 + busy 位图；每次提交与每次完成时，
 *   把队首任务交给第一个空闲线程。
 * - 某个任务失败只会拒绝该任务的 future，线程继续可用。
 * - terminate() 停止所有线程；尚未完成的 future 保持未决，
 *   直到线程池析构时变为 broken_promise。
 */
class NODEWEAVE_API WorkerPool {
public:
    using InitFn = std::function<void(int worker_index)>;

    // size 0 -> std::thread::hardware_concurrency()
    explicit WorkerPool(WorkerOpTable ops, unsigned size = 0, InitFn init = {}, bool quiet = true);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::future<cv::Mat> process(const cv::Mat& payload, const std::string& op,
                                 const YAML::Node& params = YAML::Node());

    void terminate();

    unsigned size() const { return size_; }
    size_t pending() const;
    unsigned busy_count() const;
    bool terminated() const;
    // Blocks until every worker has finished its init hook.
    void wait_ready();

private:
    struct Worker {
        std::thread thread;
        std::mutex mx;
        std::condition_variable cv;
        std::optional<WorkerRequest> inbox;
        bool stop = false;
    };

    void worker_loop(int index);
    WorkerResponse execute(const WorkerRequest& req) const;
    void on_response(int index, WorkerResponse resp);
    void process_queue_locked();

    const WorkerOpTable ops_;
    const unsigned size_;
    InitFn init_;
    bool quiet_;

    // Lock order: mtx_ before Worker::mx.
    mutable std::mutex mtx_;
    std::condition_variable ready_cv_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<bool> busy_;
    std::deque<WorkerRequest> task_queue_;
    std::unordered_map<uint64_t, std::promise<cv::Mat>> task_map_;
    uint64_t next_task_id_ = 1;
    unsigned initialized_ = 0;
    bool terminated_ = false;
};

} // namespace nw
