/**
 * @file test_task_group.cpp
 * @brief Unit tests for TaskGroup.
 */

#include "executor/task_group.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace fabric_controller;

TEST(TaskGroupTest, WaitJoinsAllTasks) {
    TaskGroup group;
    std::atomic<int> counter{0};

    for (int i = 0; i < 16; ++i) {
        group.spawn([&counter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            counter.fetch_add(1, std::memory_order_relaxed);
        });
    }

    auto failures = group.wait();
    EXPECT_TRUE(failures.empty());
    EXPECT_EQ(counter.load(), 16);
    EXPECT_EQ(group.in_flight(), 0u);
}

TEST(TaskGroupTest, ExceptionsAreReported) {
    TaskGroup group;
    group.spawn([] { throw std::runtime_error("probe exploded"); });
    group.spawn([] {});

    auto failures = group.wait();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "probe exploded");
}

TEST(TaskGroupTest, RequestStopReachesTasks) {
    TaskGroup group;
    std::atomic<bool> observed{false};

    group.spawn([&observed](std::stop_token stop) {
        while (!stop.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        observed = true;
    });

    EXPECT_EQ(group.in_flight(), 1u);
    group.request_stop();
    group.wait();
    EXPECT_TRUE(observed.load());
}

TEST(TaskGroupTest, DestructorJoins) {
    std::atomic<bool> finished{false};
    {
        TaskGroup group;
        group.spawn([&finished](std::stop_token stop) {
            while (!stop.stop_requested()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            finished = true;
        });
    }
    EXPECT_TRUE(finished.load());
}

TEST(TaskGroupTest, FinishedTasksAreReapedOnSpawn) {
    TaskGroup group;
    group.spawn([] { throw std::runtime_error("early"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    // Reaping keeps the failure for the next wait()
    group.spawn([] {});
    auto failures = group.wait();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "early");
}
