#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "kernel/processing_queue.hpp"
#include "test_support.hpp"

using namespace nw;
using nw::fixtures::eventually;
using nw::fixtures::make_edge;

namespace {

Outcome text_outcome(const std::string& text) {
    return Outcome::ok(make_single_item_result(ItemType::Text, YAML::Node(text), "out"));
}

// Work that signals when it starts, then waits for `gate` while honoring the token.
ProcessingQueue::Work cooperative_work(std::shared_future<void> gate, std::promise<void>* started,
                                       const std::string& text) {
    return [gate, started, text](const CancellationToken& token) {
        if (started) started->set_value();
        wait_until_ready(gate, token, "cancelled");
        return text_outcome(text);
    };
}

template <typename T>
bool rejected_as_cancelled(std::future<T>& fut) {
    try {
        fut.get();
    } catch (const ProcessingCancelled&) {
        return true;
    }
    return false;
}

} // namespace

TEST(ProcessingQueueTest, ResolvesOutcomeAndRunsCommit) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);
    std::atomic<int> commits{0};
    auto fut = queue.add("A", {}, [](const CancellationToken&) { return text_outcome("a"); },
                         [&](const Outcome& o) {
                             EXPECT_TRUE(o.success);
                             commits.fetch_add(1);
                         });
    Outcome o = fut.get();
    EXPECT_TRUE(o.success);
    EXPECT_EQ(o.new_result->find_item("out")->data.as<std::string>(), "a");
    EXPECT_EQ(commits.load(), 1);
}

TEST(ProcessingQueueTest, SecondSubmitInSameTickCancelsFirst) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal, 1);

    // Occupy the only drain thread so both submissions for A stay queued.
    std::promise<void> release;
    std::promise<void> blocker_started;
    auto blocker = queue.add("X", {}, cooperative_work(release.get_future().share(), &blocker_started, "x"));
    blocker_started.get_future().wait();

    std::atomic<int> first_runs{0};
    auto first = queue.add("A", {}, [&](const CancellationToken&) {
        first_runs.fetch_add(1);
        return text_outcome("first");
    });
    auto second = queue.add("A", {}, [](const CancellationToken&) { return text_outcome("second"); });
    EXPECT_EQ(queue.queued_count(), 1u);

    release.set_value();
    EXPECT_TRUE(rejected_as_cancelled(first));
    EXPECT_EQ(second.get().new_result->find_item("out")->data.as<std::string>(), "second");
    EXPECT_EQ(first_runs.load(), 0);
    EXPECT_TRUE(blocker.get().success);
}

TEST(ProcessingQueueTest, LateResultOfCancelledTaskIsDiscarded) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> commits{0};
    // Ignores its token on purpose.
    auto fut = queue.add("A", {},
                         [&](const CancellationToken&) {
                             started.set_value();
                             gate.wait();
                             return text_outcome("late");
                         },
                         [&](const Outcome&) { commits.fetch_add(1); });
    started.get_future().wait();
    EXPECT_TRUE(queue.is_active("A"));
    queue.cancel_node("A");
    queue.cancel_node("A");  // idempotent
    release.set_value();

    EXPECT_TRUE(rejected_as_cancelled(fut));
    EXPECT_EQ(commits.load(), 0);
}

TEST(ProcessingQueueTest, EditUpstreamCancelsDownstreamBeforeItStarts) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal, 3);
    std::vector<Edge> edges = {make_edge("A", "B"), make_edge("B", "C")};

    std::promise<void> never;
    std::shared_future<void> gate = never.get_future().share();

    std::promise<void> b_started;
    std::promise<void> c_started;
    auto b = queue.add("B", edges, cooperative_work(gate, &b_started, "b"));
    auto c = queue.add("C", edges, cooperative_work(gate, &c_started, "c"));
    b_started.get_future().wait();
    c_started.get_future().wait();
    EXPECT_EQ(queue.active_count(), 2u);

    std::atomic<bool> downstream_idle_when_a_ran{false};
    auto a = queue.add("A", edges, [&](const CancellationToken&) {
        // B and C were aborted at submission time; they may still be unwinding.
        downstream_idle_when_a_ran = !queue.is_queued("B") && !queue.is_queued("C");
        return text_outcome("a");
    });

    EXPECT_TRUE(rejected_as_cancelled(b));
    EXPECT_TRUE(rejected_as_cancelled(c));
    EXPECT_TRUE(a.get().success);
    EXPECT_TRUE(downstream_idle_when_a_ran.load());
}

TEST(ProcessingQueueTest, NeverRunsTwoTasksForOneNode) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal, 2);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> concurrent{0};
    std::atomic<int> max_concurrent{0};
    auto track = [&] {
        int now = concurrent.fetch_add(1) + 1;
        int prev = max_concurrent.load();
        while (now > prev && !max_concurrent.compare_exchange_weak(prev, now)) {
        }
    };

    auto first = queue.add("A", {}, [&](const CancellationToken&) {
        track();
        started.set_value();
        gate.wait();  // keeps running after cancellation
        concurrent.fetch_sub(1);
        return text_outcome("first");
    });
    started.get_future().wait();

    std::atomic<bool> second_ran{false};
    auto second = queue.add("A", {}, [&](const CancellationToken&) {
        track();
        second_ran = true;
        concurrent.fetch_sub(1);
        return text_outcome("second");
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(second_ran.load());
    EXPECT_TRUE(queue.is_active("A"));
    EXPECT_TRUE(queue.is_queued("A"));

    release.set_value();
    EXPECT_TRUE(rejected_as_cancelled(first));
    EXPECT_TRUE(second.get().success);
    EXPECT_EQ(max_concurrent.load(), 1);
}

TEST(ProcessingQueueTest, WorkErrorsAreIsolated) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);
    auto bad = queue.add("A", {}, [](const CancellationToken&) -> Outcome {
        throw std::runtime_error("boom");
    });
    auto good = queue.add("B", {}, [](const CancellationToken&) { return text_outcome("b"); });
    EXPECT_THROW(bad.get(), std::runtime_error);
    EXPECT_TRUE(good.get().success);
}

TEST(ProcessingQueueTest, FailureOutcomesResolveNormally) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);
    auto fut = queue.add("A", {}, [](const CancellationToken&) { return Outcome::failure("no input"); });
    Outcome o = fut.get();
    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.error, "no input");
}

TEST(ProcessingQueueTest, RapidEditsOnlyLastCompletes) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;
    auto size2 = queue.add("blur", {}, cooperative_work(gate, &started, "2"));
    started.get_future().wait();
    auto size5 = queue.add("blur", {}, cooperative_work(gate, nullptr, "5"));
    auto size8 = queue.add("blur", {}, cooperative_work(gate, nullptr, "8"));
    release.set_value();

    EXPECT_TRUE(rejected_as_cancelled(size2));
    EXPECT_TRUE(rejected_as_cancelled(size5));
    EXPECT_EQ(size8.get().new_result->find_item("out")->data.as<std::string>(), "8");
}

TEST(ProcessingQueueTest, ClearAllAndStopRejectEverything) {
    GraphTraversalService traversal;
    ProcessingQueue queue(traversal);
    std::promise<void> never;
    std::shared_future<void> gate = never.get_future().share();
    std::promise<void> started;
    auto active = queue.add("A", {}, cooperative_work(gate, &started, "a"));
    started.get_future().wait();
    auto queued = queue.add("B", {}, cooperative_work(gate, nullptr, "b"));

    queue.clear_all();
    EXPECT_TRUE(rejected_as_cancelled(active));
    EXPECT_TRUE(rejected_as_cancelled(queued));
    EXPECT_TRUE(eventually([&] { return queue.active_count() == 0; }));

    queue.stop();
    auto after = queue.add("C", {}, [](const CancellationToken&) { return text_outcome("c"); });
    EXPECT_TRUE(rejected_as_cancelled(after));
}
