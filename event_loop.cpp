#include "tower.h"
#include "event_loop.h"
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <vector>
#include <algorithm>
#include <stdexcept>

namespace {

// Runs a user callback, keeping its exceptions out of the loop
template<typename F>
void guarded_call(const char* what, F&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unhandled exception in ") + what + " callback: " + e.what());
    }
}

int ceil_ms(EventLoop::Clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d);
    if (ms < d) {
        ms += std::chrono::milliseconds(1);
    }
    if (ms.count() < 0) {
        return 0;
    }
    return static_cast<int>(std::min<int64_t>(ms.count(), 24 * 3600 * 1000));
}

} // namespace

EventLoop::EventLoop() {
    if (pipe2(wake_pipe, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::runtime_error(tower::errno_string("EventLoop wake pipe", errno));
    }
}

EventLoop::~EventLoop() {
    close(wake_pipe[0]);
    close(wake_pipe[1]);
}

void EventLoop::watch(int fd, short events, FdCallback callback) {
    Watch w;
    w.events = events;
    w.generation = next_generation++;
    w.callback = std::make_shared<FdCallback>(std::move(callback));
    watches[fd] = std::move(w);
}

void EventLoop::modify(int fd, short events) {
    auto it = watches.find(fd);
    if (it != watches.end()) {
        it->second.events = events;
    }
}

void EventLoop::unwatch(int fd) {
    watches.erase(fd);
}

bool EventLoop::is_watched(int fd) const {
    return watches.find(fd) != watches.end();
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Callback callback) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    TimerId id = next_timer_id++;
    timers[id] = Timer{Clock::now() + delay, std::move(callback)};
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    return timers.erase(id) > 0;
}

bool EventLoop::timer_pending(TimerId id) const {
    return timers.find(id) != timers.end();
}

void EventLoop::post(Callback callback) {
    posted.push(std::move(callback));
    char c = 1;
    // A full pipe already guarantees a wakeup
    if (write(wake_pipe[1], &c, 1) < 0 && errno != EAGAIN) {
        LOG_WARN(tower::errno_string("EventLoop wake write", errno));
    }
}

void EventLoop::run() {
    stop_requested = false;
    while (!stop_requested) {
        run_once(-1);
    }
}

void EventLoop::stop() {
    stop_requested = true;
    char c = 1;
    if (write(wake_pipe[1], &c, 1) < 0 && errno != EAGAIN) {
        LOG_WARN(tower::errno_string("EventLoop wake write", errno));
    }
}

int EventLoop::next_timeout_ms(int limit_ms) const {
    if (!posted.empty()) {
        return 0;
    }
    int timeout = limit_ms;
    if (!timers.empty()) {
        auto earliest = Clock::time_point::max();
        for (const auto& [id, timer] : timers) {
            earliest = std::min(earliest, timer.deadline);
        }
        int until = ceil_ms(earliest - Clock::now());
        if (timeout < 0 || until < timeout) {
            timeout = until;
        }
    }
    return timeout;
}

void EventLoop::run_once(int timeout_ms) {
    std::vector<struct pollfd> fds;
    std::vector<uint64_t> generations;
    fds.reserve(watches.size() + 1);
    generations.reserve(watches.size());

    fds.push_back({wake_pipe[0], POLLIN, 0});
    for (const auto& [fd, w] : watches) {
        fds.push_back({fd, w.events, 0});
        generations.push_back(w.generation);
    }

    int ret = ::poll(fds.data(), fds.size(), next_timeout_ms(timeout_ms));
    if (ret < 0 && errno != EINTR) {
        LOG_ERROR(tower::errno_string("poll", errno));
    }

    if (ret > 0) {
        if (fds[0].revents & POLLIN) {
            drain_wake_pipe();
        }
        for (size_t i = 1; i < fds.size(); i++) {
            short revents = fds[i].revents;
            if (revents == 0) {
                continue;
            }
            // The watch may have been removed or replaced by an earlier callback
            auto it = watches.find(fds[i].fd);
            if (it == watches.end() || it->second.generation != generations[i - 1]) {
                continue;
            }
            std::shared_ptr<FdCallback> callback = it->second.callback;
            guarded_call("fd", [&]() { (*callback)(revents); });

            if (revents & POLLNVAL) {
                auto again = watches.find(fds[i].fd);
                if (again != watches.end() && again->second.generation == generations[i - 1]) {
                    LOG_WARN("Dropping watch on invalid fd " + std::to_string(fds[i].fd));
                    watches.erase(again);
                }
            }
        }
    }

    dispatch_timers();
    dispatch_posted();
}

void EventLoop::dispatch_timers() {
    if (timers.empty()) {
        return;
    }

    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers) {
        if (timer.deadline <= now) {
            due.emplace_back(timer.deadline, id);
        }
    }
    // Earliest first; equal deadlines keep creation order
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        auto it = timers.find(entry.second);
        if (it == timers.end()) {
            continue;  // cancelled by an earlier timer in this pass
        }
        Callback callback = std::move(it->second.callback);
        timers.erase(it);
        guarded_call("timer", callback);
    }
}

void EventLoop::dispatch_posted() {
    for (auto& callback : posted.drain()) {
        guarded_call("posted", callback);
    }
}

void EventLoop::drain_wake_pipe() {
    char buf[64];
    while (read(wake_pipe[0], buf, sizeof(buf)) > 0) {
    }
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
    auto deadline = Clock::now() + duration;
    while (true) {
        auto now = Clock::now();
        if (now >= deadline) {
            return;
        }
        run_once(ceil_ms(deadline - now));
    }
}

bool EventLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (!done()) {
        auto now = Clock::now();
        if (now >= deadline) {
            return done();
        }
        run_once(ceil_ms(deadline - now));
    }
    return true;
}
