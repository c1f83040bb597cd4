#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/threading/thread_pool.hpp"

using namespace LRP;

// EN: Test fixture for ThreadPool tests
// FR: Fixture de test pour les tests de ThreadPool
class ThreadPoolTest : public ::testing::Test {
protected:
    ThreadPoolConfig makeConfig(size_t threads, size_t max_queue = 0) {
        ThreadPoolConfig config;
        config.thread_count = threads;
        config.max_queue_size = max_queue;
        config.name = "test_pool";
        return config;
    }
};

TEST_F(ThreadPoolTest, ReturnsTaskResultsThroughFutures) {
    ThreadPool pool(makeConfig(4));

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST_F(ThreadPoolTest, ForwardsArguments) {
    ThreadPool pool(makeConfig(2));
    auto future = pool.submit([](const std::string& a, int b) { return a + std::to_string(b); },
                              std::string("value-"), 7);
    EXPECT_EQ(future.get(), "value-7");
}

TEST_F(ThreadPoolTest, PropagatesExceptionsThroughFuture) {
    ThreadPool pool(makeConfig(1));
    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // EN: The worker survives a failing task.
    // FR: Le worker survit à une tâche en échec.
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST_F(ThreadPoolTest, RunsHigherPriorityFirstOnSingleWorker) {
    ThreadPool pool(makeConfig(1));

    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();
    auto blocker = pool.submit([gate_future] { gate_future.wait(); });

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(name);
    };

    auto low = pool.submit(TaskPriority::LOW, record, std::string("low"));
    auto normal_a = pool.submit(TaskPriority::NORMAL, record, std::string("normal-a"));
    auto urgent = pool.submit(TaskPriority::URGENT, record, std::string("urgent"));
    auto normal_b = pool.submit(TaskPriority::NORMAL, record, std::string("normal-b"));

    gate.set_value();
    pool.waitForAll();

    ASSERT_EQ(order.size(), 4u);
    EXPECT_EQ(order[0], "urgent");
    EXPECT_EQ(order[1], "normal-a");
    EXPECT_EQ(order[2], "normal-b");
    EXPECT_EQ(order[3], "low");
}

TEST_F(ThreadPoolTest, RejectsTasksWhenQueueIsFull) {
    ThreadPool pool(makeConfig(1, 1));

    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();
    std::promise<void> started;
    auto blocker = pool.submit([gate_future, &started] {
        started.set_value();
        gate_future.wait();
    });
    started.get_future().wait();

    auto queued = pool.submit([] { return 1; });
    EXPECT_THROW(pool.submit([] { return 2; }), TaskRejectedError);

    gate.set_value();
    EXPECT_EQ(queued.get(), 1);
}

TEST_F(ThreadPoolTest, ShutdownDrainsQueueThenRejects) {
    ThreadPool pool(makeConfig(2));
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&counter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            counter++;
        });
    }

    pool.shutdown();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_TRUE(pool.isShutdown());
    EXPECT_THROW(pool.submit([] { return 0; }), TaskRejectedError);
}

TEST_F(ThreadPoolTest, ReportsStatsAndCallbacks) {
    ThreadPool pool(makeConfig(2));
    std::atomic<int> callbacks{0};
    pool.setTaskCallback([&callbacks](const std::string& name, bool success, std::chrono::milliseconds) {
        if (name == "named" && success) {
            callbacks++;
        }
    });

    for (int i = 0; i < 5; ++i) {
        pool.submitNamed("named", TaskPriority::NORMAL, [] { return true; });
    }
    pool.waitForAll();

    auto stats = pool.getStats();
    EXPECT_EQ(stats.total_threads, 2u);
    EXPECT_EQ(stats.completed_tasks, 5u);
    EXPECT_EQ(stats.queued_tasks, 0u);
    EXPECT_EQ(callbacks.load(), 5);
}

TEST_F(ThreadPoolTest, CountsFailedTasksAndReportsThemToCallback) {
    ThreadPool pool(makeConfig(1));
    std::atomic<int> failures{0};
    pool.setTaskCallback([&failures](const std::string& name, bool success, std::chrono::milliseconds) {
        if (name == "broken" && !success) {
            failures++;
        }
    });

    auto broken = pool.submitNamed("broken", TaskPriority::NORMAL, []() -> int {
        throw std::runtime_error("agent unreachable");
    });
    auto healthy = pool.submitNamed("healthy", TaskPriority::NORMAL, [] { return 2; });

    EXPECT_THROW(broken.get(), std::runtime_error);
    EXPECT_EQ(healthy.get(), 2);
    pool.waitForAll();

    auto stats = pool.getStats();
    EXPECT_EQ(stats.failed_tasks, 1u);
    EXPECT_EQ(stats.completed_tasks, 1u);
    EXPECT_EQ(failures.load(), 1);
}

TEST_F(ThreadPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(ThreadPool pool(makeConfig(0)), std::invalid_argument);
}
