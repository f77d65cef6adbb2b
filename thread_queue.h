#pragma once

#include <queue>
#include <vector>
#include <mutex>
#include <optional>

/// @brief Mutex protected FIFO used to hand work to the event loop thread.
/// Producers push from any thread; the loop drains in order.
template<typename T>
class ThreadQueue {
public:
    void push(const T& item) {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push(item);
    }

    void push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex);
        queue.push(std::move(item));
    }

    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mutex);
        if (queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue.front());
        queue.pop();
        return item;
    }

    /// @brief Take everything queued so far, oldest first
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<T> items;
        items.reserve(queue.size());
        while (!queue.empty()) {
            items.push_back(std::move(queue.front()));
            queue.pop();
        }
        return items;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return queue.size();
    }

private:
    std::queue<T> queue;
    mutable std::mutex mutex;
};
