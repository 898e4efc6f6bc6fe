#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "kernel/worker_pool.hpp"
#include "test_support.hpp"

using namespace nw;
using nw::fixtures::eventually;

namespace {

// Each task blocks on gates[params.gate] and returns a 1x1 CV_32S mat holding
// params.value.
struct Gates {
    explicit Gates(size_t n) : promises(n) {
        for (auto& p : promises) futures.push_back(p.get_future().share());
    }
    void open(size_t i) { promises[i].set_value(); }
    std::vector<std::promise<void>> promises;
    std::vector<std::shared_future<void>> futures;
};

WorkerOpTable gated_ops(Gates& gates) {
    WorkerOpTable table;
    table.register_op("gated", [&gates](const cv::Mat&, const YAML::Node& params) {
        gates.futures.at(params["gate"].as<size_t>()).wait();
        return cv::Mat(1, 1, CV_32S, cv::Scalar(params["value"].as<int>()));
    });
    table.register_op("fail", [](const cv::Mat&, const YAML::Node&) -> cv::Mat {
        throw GraphError(GraphErrc::ComputeError, "worker op failed");
    });
    table.register_op("echo", [](const cv::Mat& in, const YAML::Node&) { return in.clone(); });
    return table;
}

YAML::Node gate_params(int gate, int value) {
    YAML::Node p;
    p["gate"] = gate;
    p["value"] = value;
    return p;
}

int value_of(std::future<cv::Mat>& fut) {
    return fut.get().at<int>(0, 0);
}

} // namespace

TEST(WorkerPoolTest, InitHookRunsOncePerWorkerBeforeTasks) {
    std::atomic<int> inits{0};
    WorkerPool pool(WorkerOpTable::builtin(), 3, [&](int) { inits.fetch_add(1); });
    pool.wait_ready();
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_EQ(inits.load(), 3);
    EXPECT_EQ(pool.busy_count(), 0u);
}

TEST(WorkerPoolTest, DispatchesPTasksImmediatelyAndQueuesTheNext) {
    Gates gates(3);
    WorkerPool pool(gated_ops(gates), 2);
    pool.wait_ready();

    cv::Mat payload(1, 1, CV_8U, cv::Scalar(0));
    auto f0 = pool.process(payload, "gated", gate_params(0, 10));
    auto f1 = pool.process(payload, "gated", gate_params(1, 11));
    EXPECT_EQ(pool.busy_count(), 2u);
    EXPECT_EQ(pool.pending(), 0u);

    auto f2 = pool.process(payload, "gated", gate_params(2, 12));
    EXPECT_EQ(pool.pending(), 1u);

    gates.open(0);
    EXPECT_EQ(value_of(f0), 10);
    EXPECT_TRUE(eventually([&] { return pool.pending() == 0; }));
    EXPECT_EQ(pool.busy_count(), 2u);

    gates.open(1);
    gates.open(2);
    EXPECT_EQ(value_of(f1), 11);
    EXPECT_EQ(value_of(f2), 12);
    EXPECT_TRUE(eventually([&] { return pool.busy_count() == 0; }));
}

TEST(WorkerPoolTest, OutOfOrderCompletionsResolveTheirOwnFutures) {
    Gates gates(3);
    WorkerPool pool(gated_ops(gates), 3);
    pool.wait_ready();
    cv::Mat payload(1, 1, CV_8U, cv::Scalar(0));
    auto a = pool.process(payload, "gated", gate_params(0, 100));
    auto b = pool.process(payload, "gated", gate_params(1, 200));
    auto c = pool.process(payload, "gated", gate_params(2, 300));

    gates.open(2);
    EXPECT_EQ(value_of(c), 300);
    gates.open(0);
    EXPECT_EQ(value_of(a), 100);
    gates.open(1);
    EXPECT_EQ(value_of(b), 200);
}

TEST(WorkerPoolTest, ErrorRejectsOnlyThatTask) {
    Gates gates(0);
    WorkerPool pool(gated_ops(gates), 1);
    cv::Mat payload(2, 2, CV_8U, cv::Scalar(7));

    auto bad = pool.process(payload, "fail");
    auto unknown = pool.process(payload, "no_such_op");
    auto good = pool.process(payload, "echo");

    try {
        bad.get();
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.code(), GraphErrc::ComputeError);
        EXPECT_NE(std::string(e.what()).find("worker op failed"), std::string::npos);
    }
    EXPECT_THROW(unknown.get(), GraphError);
    cv::Mat out = good.get();
    EXPECT_EQ(out.at<uchar>(1, 1), 7);
}

TEST(WorkerPoolTest, BuiltinResizeAndBlur) {
    EXPECT_EQ(WorkerOpTable::builtin().names(), (std::vector<std::string>{"blur", "resize"}));
    WorkerPool pool(WorkerOpTable::builtin(), 2);
    cv::Mat img(10, 20, CV_8UC3, cv::Scalar(10, 20, 30));

    auto resized = pool.process(img, "resize", YAML::Load("{width: 5, height: 4}"));
    cv::Mat r = resized.get();
    EXPECT_EQ(r.cols, 5);
    EXPECT_EQ(r.rows, 4);

    auto blurred = pool.process(img, "blur", YAML::Load("{size: 2, blur_type: Box}"));
    cv::Mat b = blurred.get();
    EXPECT_EQ(b.size(), img.size());
    // Uniform image stays uniform under any blur.
    EXPECT_EQ(b.at<cv::Vec3b>(5, 5), cv::Vec3b(10, 20, 30));

    auto missing = pool.process(img, "resize", YAML::Load("{width: 5}"));
    EXPECT_THROW(missing.get(), GraphError);
}

TEST(WorkerPoolTest, FailedInitKeepsWorkerBusy) {
    WorkerPool pool(WorkerOpTable::builtin(), 2, [](int index) {
        if (index == 0) throw GraphError(GraphErrc::Unknown, "init failed");
    });
    pool.wait_ready();
    EXPECT_EQ(pool.busy_count(), 1u);

    cv::Mat img(4, 4, CV_8UC1, cv::Scalar(1));
    auto fut = pool.process(img, "resize", YAML::Load("{width: 2, height: 2}"));
    EXPECT_EQ(fut.get().cols, 2);
}

TEST(WorkerPoolTest, TerminateLeavesInFlightFuturesUnresolved) {
    Gates gates(1);
    auto pool = std::make_unique<WorkerPool>(gated_ops(gates), 1);
    pool->wait_ready();
    cv::Mat payload(1, 1, CV_8U, cv::Scalar(0));
    auto in_flight = pool->process(payload, "gated", gate_params(0, 1));
    EXPECT_TRUE(eventually([&] { return pool->busy_count() == 1; }));

    std::thread terminator([&] { pool->terminate(); });
    EXPECT_TRUE(eventually([&] { return pool->terminated(); }));
    gates.open(0);
    terminator.join();

    EXPECT_TRUE(pool->terminated());
    EXPECT_EQ(in_flight.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    EXPECT_THROW(pool->process(payload, "echo").get(), GraphError);

    pool.reset();
    EXPECT_THROW(in_flight.get(), std::future_error);
}
