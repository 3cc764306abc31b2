#include <gtest/gtest.h>
#include "speedtest/task_group.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace speedtest;

TEST(TaskGroup, JoinAllWaitsForEveryTask) {
    std::atomic<int> done{0};
    TaskGroup g;
    for (int i = 0; i < 16; ++i) {
        g.spawn([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            done++;
        });
    }
    g.join_all();
    EXPECT_EQ(done.load(), 16);
    EXPECT_EQ(g.size(), 0u);
}

TEST(TaskGroup, ReapJoinsOnlyFinishedTasks) {
    std::atomic<bool> release{false};
    TaskGroup g;
    g.spawn([] {});
    g.spawn([&release] {
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    });

    size_t reaped = 0;
    for (int i = 0; i < 200 && reaped == 0; ++i) {
        reaped += g.reap();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(reaped, 1u);
    EXPECT_EQ(g.size(), 1u);

    release = true;
    g.join_all();
    EXPECT_EQ(g.size(), 0u);
}

TEST(TaskGroup, ThrowingTaskDoesNotAffectOthers) {
    std::atomic<int> done{0};
    TaskGroup g;
    g.spawn([] { throw std::runtime_error("boom"); });
    g.spawn([&done] { done++; });
    g.join_all();
    EXPECT_EQ(done.load(), 1);
}

TEST(TaskGroup, LaunchFailureIsReportedAndTaskDiscarded) {
    std::atomic<int> ran{0};
    TaskGroup g([](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });
    EXPECT_FALSE(g.spawn([&ran] { ran++; }));
    EXPECT_EQ(g.size(), 0u);
    g.join_all();
    EXPECT_EQ(ran.load(), 0);
}
