#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "event_loop.h"

using std::chrono::milliseconds;

TEST(EventLoop, RunsByDueTimeThenSubmissionOrder) {
    EventLoop loop;
    std::vector<std::string> order;

    loop.schedule(milliseconds(20), [&order]() { order.push_back("late"); });
    loop.schedule(milliseconds(10), [&order]() { order.push_back("early-a"); });
    loop.schedule(milliseconds(10), [&order]() { order.push_back("early-b"); });
    loop.post([&order]() { order.push_back("now"); });

    EXPECT_EQ(1u, loop.runPending());
    EXPECT_EQ(3u, loop.advance(milliseconds(20)));

    std::vector<std::string> expected = {"now", "early-a", "early-b", "late"};
    EXPECT_EQ(expected, order);
    EXPECT_EQ(milliseconds(20), loop.now());
}

TEST(EventLoop, AdvanceStopsAtTarget) {
    EventLoop loop;
    int fired = 0;
    loop.schedule(milliseconds(100), [&fired]() { ++fired; });

    loop.advance(milliseconds(99));
    EXPECT_EQ(0, fired);
    EXPECT_EQ(milliseconds(99), loop.now());

    loop.advance(milliseconds(1));
    EXPECT_EQ(1, fired);
    EXPECT_EQ(0u, loop.pendingCount());
}

TEST(EventLoop, CancelRemovesTask) {
    EventLoop loop;
    int fired = 0;
    EventLoop::TaskId id = loop.schedule(milliseconds(5), [&fired]() { ++fired; });

    EXPECT_TRUE(loop.isPending(id));
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.cancel(id));
    EXPECT_FALSE(loop.isPending(id));

    loop.advance(milliseconds(10));
    EXPECT_EQ(0, fired);
}

TEST(EventLoop, TasksMayScheduleMoreWork) {
    EventLoop loop;
    std::vector<std::int64_t> ticks;

    std::function<void()> tick;
    tick = [&]() {
        ticks.push_back(loop.now().count());
        if (ticks.size() < 3) loop.schedule(milliseconds(10), tick);
    };
    loop.schedule(milliseconds(10), tick);

    loop.advance(milliseconds(100));
    std::vector<std::int64_t> expected = {10, 20, 30};
    EXPECT_EQ(expected, ticks);
}

TEST(EventLoop, RunPendingIncludesNewlyPostedWork) {
    EventLoop loop;
    int fired = 0;
    loop.post([&]() {
        ++fired;
        loop.post([&fired]() { ++fired; });
    });

    EXPECT_EQ(2u, loop.runPending());
    EXPECT_EQ(2, fired);
}

TEST(EventLoop, RunReturnsWhenStopped) {
    EventLoop loop;
    int fired = 0;
    loop.schedule(milliseconds(1), [&]() {
        ++fired;
        loop.stop();
    });
    loop.schedule(milliseconds(10000), [&fired]() { ++fired; });

    loop.run();
    EXPECT_EQ(1, fired);
    EXPECT_EQ(1u, loop.pendingCount());
}

TEST(TimerHandle, CancelsOnDestruction) {
    EventLoop loop;
    int fired = 0;
    {
        TimerHandle timer(&loop, loop.schedule(milliseconds(5), [&fired]() { ++fired; }));
        EXPECT_TRUE(timer.isActive());
    }
    loop.advance(milliseconds(10));
    EXPECT_EQ(0, fired);
}

TEST(TimerHandle, ReassignCancelsPrevious) {
    EventLoop loop;
    int first = 0;
    int second = 0;

    TimerHandle timer(&loop, loop.schedule(milliseconds(5), [&first]() { ++first; }));
    timer = TimerHandle(&loop, loop.schedule(milliseconds(5), [&second]() { ++second; }));

    loop.advance(milliseconds(10));
    EXPECT_EQ(0, first);
    EXPECT_EQ(1, second);
}

TEST(TimerHandle, ResetReportsWhetherWorkWasCancelled) {
    EventLoop loop;
    TimerHandle timer(&loop, loop.schedule(milliseconds(5), []() {}));

    loop.advance(milliseconds(5));
    EXPECT_FALSE(timer.isActive());
    EXPECT_FALSE(timer.reset());

    TimerHandle pending(&loop, loop.schedule(milliseconds(5), []() {}));
    EXPECT_TRUE(pending.reset());
    EXPECT_FALSE(pending.reset());
}

TEST(TimerHandle, MoveTransfersOwnership) {
    EventLoop loop;
    int fired = 0;

    TimerHandle original(&loop, loop.schedule(milliseconds(5), [&fired]() { ++fired; }));
    TimerHandle moved(std::move(original));

    EXPECT_FALSE(original.isActive());
    EXPECT_TRUE(moved.isActive());
    EXPECT_FALSE(original.reset());

    loop.advance(milliseconds(5));
    EXPECT_EQ(1, fired);
}
