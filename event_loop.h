#pragma once

#include "thread_queue.h"
#include <functional>
#include <map>
#include <chrono>
#include <atomic>
#include <memory>
#include <cstdint>

/// @brief Single-threaded poll(2) reactor shared by the controller and the
/// shepherd daemon.
///
/// Every fd callback, timer and posted task runs on the thread that drives
/// the loop, one at a time. The loop is reentrant: a callback may call
/// run_until() to wait for a condition while other fds and timers keep
/// being serviced, and any callback may unwatch or cancel anything,
/// including itself. Exceptions thrown by callbacks are logged, never
/// propagated into the loop.
class EventLoop {
public:
    using Callback = std::function<void()>;
    using FdCallback = std::function<void(short revents)>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// @brief Watch fd for poll events, replacing any existing watch on it
    void watch(int fd, short events, FdCallback callback);

    /// @brief Change the event mask of an existing watch (no-op if unwatched)
    void modify(int fd, short events);

    void unwatch(int fd);
    bool is_watched(int fd) const;

    /// @brief Schedule a one-shot callback after delay
    /// @return Handle usable with cancel_timer(); never 0
    TimerId add_timer(std::chrono::milliseconds delay, Callback callback);

    /// @brief Cancel a pending timer
    /// @return true if the timer was pending and is now cancelled
    bool cancel_timer(TimerId id);
    bool timer_pending(TimerId id) const;
    size_t pending_timer_count() const { return timers.size(); }

    /// @brief Queue a callback for the loop thread. Safe from any thread.
    void post(Callback callback);

    /// @brief Run until stop() is called
    void run();
    void stop();

    /// @brief One poll iteration: wait up to timeout_ms (-1 = until an
    /// event or the next timer), then dispatch fds, due timers and posts
    void run_once(int timeout_ms);

    void run_for(std::chrono::milliseconds duration);

    /// @brief Service the loop until done() is true or timeout expires
    /// @return Final value of done()
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

private:
    struct Watch {
        short events;
        uint64_t generation;
        std::shared_ptr<FdCallback> callback;
    };

    struct Timer {
        Clock::time_point deadline;
        Callback callback;
    };

    std::map<int, Watch> watches;
    std::map<TimerId, Timer> timers;
    TimerId next_timer_id = 1;
    uint64_t next_generation = 1;

    ThreadQueue<Callback> posted;
    int wake_pipe[2];
    std::atomic<bool> stop_requested{false};

    int next_timeout_ms(int limit_ms) const;
    void dispatch_timers();
    void dispatch_posted();
    void drain_wake_pipe();
};
