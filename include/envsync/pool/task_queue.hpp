/**
 * @file task_queue.hpp
 * @brief Thread-safe priority queue feeding the TaskPool workers
 *
 * ORDERING:
 * Items leave the queue strictly by (priority descending, enqueue order
 * ascending). Two items of equal priority come out in the order they were
 * pushed, so the queue degrades to plain FIFO when every priority is equal.
 *
 * EXAMPLE:
 * PriorityTaskQueue<Job> queue;
 * queue.push(job, TaskPriority::High);    // Producer
 * auto job = queue.pop_for(50ms);          // Consumer (waits at most 50ms)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string_view>
#include <vector>

namespace envsync::pool {

enum class TaskPriority {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

constexpr std::string_view to_string(TaskPriority priority) noexcept {
    switch (priority) {
        case TaskPriority::Low: return "low";
        case TaskPriority::Normal: return "normal";
        case TaskPriority::High: return "high";
        case TaskPriority::Critical: return "critical";
    }
    return "unknown";
}

/**
 * @brief Thread-safe queue ordered by priority, FIFO within a priority
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - Uses condition variable for blocking wait
 */
template<typename T>
class PriorityTaskQueue {
public:
    PriorityTaskQueue() = default;

    // Non-copyable
    PriorityTaskQueue(const PriorityTaskQueue&) = delete;
    PriorityTaskQueue& operator=(const PriorityTaskQueue&) = delete;

    /**
     * @brief Push item with the given priority
     *
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    void push(T item, TaskPriority priority = TaskPriority::Normal) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(Entry{priority, next_sequence_++, std::chrono::steady_clock::now(), std::move(item)});
        }
        cv_.notify_one();
    }

    /**
     * @brief Try to pop the highest-priority item (non-blocking)
     *
     * RETURNS: Item if available, nullopt if queue empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_top();
    }

    /**
     * @brief Pop the highest-priority item, waiting up to timeout
     *
     * RETURNS: Item if one became available within timeout. nullopt on
     * timeout, or once shutdown() was called and the queue is empty.
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);

        if (!cv_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;  // Timeout
        }

        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_top();
    }

    /**
     * @brief Remove and return every queued item in dequeue order
     */
    std::vector<T> drain() {
        std::unique_lock lock(mutex_);
        std::vector<T> items;
        items.reserve(queue_.size());
        while (!queue_.empty()) {
            items.push_back(take_top());
        }
        return items;
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /**
     * @brief Signal shutdown (wake up all waiting consumers)
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

private:
    struct Entry {
        TaskPriority priority;
        std::uint64_t sequence;
        std::chrono::steady_clock::time_point enqueued_at;
        T item;
    };

    // std::priority_queue keeps the "largest" on top: higher priority first,
    // then the smaller (older) sequence number.
    struct Before {
        bool operator()(const Entry& lhs, const Entry& rhs) const {
            if (lhs.priority != rhs.priority) {
                return lhs.priority < rhs.priority;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    // Caller holds mutex_ and has checked !queue_.empty()
    T take_top() {
        // top() is const; the entry is popped right after, so moving out is safe
        T item = std::move(const_cast<Entry&>(queue_.top()).item);
        queue_.pop();
        return item;
    }

    std::priority_queue<Entry, std::vector<Entry>, Before> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t next_sequence_ = 0;
    bool shutdown_ = false;
};

} // namespace envsync::pool
