#include "loop.hpp"

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace shareflow {
namespace {

TEST(LoopTest, RunsTasksInOrder) {
    Loop loop;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop.EnqueueTask([&order, i] { order.push_back(i); });
    }

    EXPECT_EQ(loop.RunPending(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(LoopTest, DrainsTasksEnqueuedWhileDraining) {
    Loop loop;
    int runs = 0;
    loop.EnqueueTask([&] {
        ++runs;
        loop.EnqueueTask([&] { ++runs; });
    });

    EXPECT_EQ(loop.RunPending(), 2u);
    EXPECT_EQ(runs, 2);
}

TEST(LoopTest, FailingTaskDoesNotStopTheLoop) {
    Loop loop;
    bool ran = false;
    loop.EnqueueTask([] { throw std::runtime_error("boom"); });
    loop.EnqueueTask([&] { ran = true; });

    EXPECT_EQ(loop.RunPending(), 2u);
    EXPECT_TRUE(ran);
}

TEST(LoopTest, StopEndsRunAndDropsLateTasks) {
    auto loop = std::make_shared<Loop>();
    std::thread thread([loop] { loop->Run(); });

    std::promise<void> done;
    loop->EnqueueTask([&done] { done.set_value(); });
    done.get_future().wait();

    loop->Stop();
    thread.join();

    bool ran = false;
    loop->EnqueueTask([&] { ran = true; });
    EXPECT_EQ(loop->RunPending(), 0u);
    EXPECT_FALSE(ran);
}

} // namespace
} // namespace shareflow
