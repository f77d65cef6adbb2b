#include <gtest/gtest.h>
#include "event_loop.h"
#include "test_helpers.h"
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <thread>
#include <vector>
#include <stdexcept>

using namespace std::chrono_literals;

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);
    }

    void TearDown() override {
        close(fds[0]);
        close(fds[1]);
    }

    EventLoop loop;
    int fds[2];
};

// =============================================================================
// Timers
// =============================================================================

TEST_F(EventLoopTest, TimersFireInDeadlineOrder) {
    std::vector<int> order;
    loop.add_timer(30ms, [&]() { order.push_back(3); });
    loop.add_timer(10ms, [&]() { order.push_back(1); });
    loop.add_timer(20ms, [&]() { order.push_back(2); });

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return order.size() == 3; }, 1000));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.pending_timer_count(), 0u);
}

TEST_F(EventLoopTest, TimerIdsAreNonZero) {
    EventLoop::TimerId id = loop.add_timer(1000ms, []() {});
    EXPECT_NE(id, 0u);
    EXPECT_TRUE(loop.timer_pending(id));
}

TEST_F(EventLoopTest, CancelledTimerNeverFires) {
    bool fired = false;
    EventLoop::TimerId id = loop.add_timer(10ms, [&]() { fired = true; });
    EXPECT_TRUE(loop.cancel_timer(id));
    EXPECT_FALSE(loop.cancel_timer(id));
    loop.run_for(50ms);
    EXPECT_FALSE(fired);
}

TEST_F(EventLoopTest, TimerMayCancelLaterTimer) {
    bool second_fired = false;
    EventLoop::TimerId second = 0;
    loop.add_timer(5ms, [&]() { loop.cancel_timer(second); });
    second = loop.add_timer(6ms, [&]() { second_fired = true; });
    loop.run_for(50ms);
    EXPECT_FALSE(second_fired);
}

TEST_F(EventLoopTest, ThrowingCallbackDoesNotStopLoop) {
    bool after = false;
    loop.add_timer(1ms, []() { throw std::runtime_error("boom"); });
    loop.add_timer(5ms, [&]() { after = true; });
    EXPECT_TRUE(test_helpers::wait_until(loop, [&]() { return after; }, 1000));
}

// =============================================================================
// File descriptors
// =============================================================================

TEST_F(EventLoopTest, ReadableFdDispatches) {
    std::string received;
    loop.watch(fds[0], POLLIN, [&](short) {
        char buf[16];
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            received.append(buf, n);
        }
    });
    ASSERT_EQ(write(fds[1], "hi", 2), 2);
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return received == "hi"; }, 1000));
}

TEST_F(EventLoopTest, UnwatchInsideCallback) {
    int calls = 0;
    loop.watch(fds[0], POLLIN, [&](short) {
        calls++;
        loop.unwatch(fds[0]);
    });
    ASSERT_EQ(write(fds[1], "x", 1), 1);
    loop.run_for(30ms);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(loop.is_watched(fds[0]));
}

TEST_F(EventLoopTest, ModifyChangesMask) {
    int calls = 0;
    loop.watch(fds[1], 0, [&](short revents) {
        if (revents & POLLOUT) {
            calls++;
            loop.modify(fds[1], 0);
        }
    });
    loop.run_for(20ms);
    EXPECT_EQ(calls, 0);
    loop.modify(fds[1], POLLOUT);
    loop.run_for(20ms);
    EXPECT_EQ(calls, 1);
}

// =============================================================================
// Posting and nesting
// =============================================================================

TEST_F(EventLoopTest, PostFromOtherThread) {
    bool ran = false;
    std::thread t([&]() { loop.post([&]() { ran = true; }); });
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return ran; }, 1000));
    t.join();
}

TEST_F(EventLoopTest, StopEndsRun) {
    loop.add_timer(10ms, [&]() { loop.stop(); });
    loop.run();
    SUCCEED();
}

TEST_F(EventLoopTest, NestedRunUntilServicesOtherWork) {
    bool inner_done = false;
    bool outer_result = false;
    loop.add_timer(1ms, [&]() {
        loop.add_timer(10ms, [&]() { inner_done = true; });
        outer_result = loop.run_until([&]() { return inner_done; }, 1000ms);
    });
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return outer_result; }, 2000));
}

TEST_F(EventLoopTest, RunUntilTimesOut) {
    auto start = EventLoop::Clock::now();
    EXPECT_FALSE(loop.run_until([]() { return false; }, 30ms));
    EXPECT_GE(EventLoop::Clock::now() - start, 30ms);
}
