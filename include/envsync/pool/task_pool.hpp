/**
 * @file task_pool.hpp
 * @brief Bounded worker pool with priority scheduling and a results table
 *
 * Architecture:
 * - Fixed number of worker threads, decided at construction
 * - PriorityTaskQueue: (priority desc, enqueue order asc)
 * - Results table keyed by task id, filled by workers, read by waiters
 * - Condition variable signalled on every completion (no busy polling)
 *
 * A task that throws is recorded as a failed TaskResult; the exception never
 * reaches the worker loop or the submitter.
 *
 * Usage:
 * ```cpp
 * TaskPool<int> pool(4);
 * auto id = pool.submit([] { return 42; }, TaskPriority::High);
 * auto result = pool.wait_for(id, std::chrono::seconds(5));
 * if (result.success) { use(*result.value); }
 * pool.shutdown(true);
 * ```
 */

#pragma once

#include "envsync/core/errors.hpp"
#include "envsync/pool/task_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace envsync::pool {

using TaskId = std::uint64_t;

/**
 * @brief Start count threads from spawn, all or nothing
 *
 * If a spawn throws, stop() is called so the threads already started can
 * return, they are joined, and the exception is rethrown.
 */
template<typename Spawn, typename Stop>
void spawn_workers(std::vector<std::thread>& workers, std::size_t count, Spawn spawn, Stop stop) {
    workers.reserve(workers.size() + count);
    try {
        for (std::size_t i = 0; i < count; ++i) {
            workers.push_back(spawn());
        }
    } catch (...) {
        stop();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        throw;
    }
}

template<typename T>
struct TaskResult {
    TaskId id = 0;
    bool success = false;
    std::optional<T> value;             ///< Set when success == true
    std::string error;                  ///< Populated when success == false
    std::chrono::milliseconds duration{0};
};

template<typename T>
class TaskPool {
public:
    using Work = std::function<T()>;

    /// How long an idle worker waits on the queue before re-checking the stop flag
    static constexpr std::chrono::milliseconds kPollInterval{50};

    explicit TaskPool(std::size_t worker_count) {
        if (worker_count == 0) {
            throw ConfigurationError("TaskPool requires at least one worker");
        }
        // The destructor does not run for a throwing constructor
        spawn_workers(
            workers_, worker_count,
            [this]() { return std::thread([this]() { worker_loop(); }); },
            [this]() {
                stop_.store(true);
                queue_.shutdown();
            });
    }

    ~TaskPool() {
        shutdown(false);
    }

    // Owns threads that capture this
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    /**
     * @brief Queue work for execution
     *
     * @return Task id, unique for the lifetime of the pool
     * @throws std::logic_error if the pool has been shut down
     */
    TaskId submit(Work work, TaskPriority priority = TaskPriority::Normal) {
        std::lock_guard lock(results_mutex_);
        if (!accepting_) {
            throw std::logic_error("TaskPool::submit called after shutdown");
        }
        const TaskId id = next_id_++;
        ++outstanding_;
        // Pushed under results_mutex_ so shutdown() cannot miss it when draining
        queue_.push(Task{id, std::move(work)}, priority);
        return id;
    }

    /**
     * @brief Block until the task completes (or the timeout elapses)
     *
     * @throws std::out_of_range for an id this pool never issued
     * @throws TaskTimeoutError if timeout elapses first; the task keeps running
     */
    TaskResult<T> wait_for(TaskId id,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) const {
        std::unique_lock lock(results_mutex_);
        ensure_issued(id);
        if (timeout) {
            const auto deadline = std::chrono::steady_clock::now() + *timeout;
            wait_until_ready(lock, id, deadline);
        } else {
            results_cv_.wait(lock, [&]() { return results_.count(id) > 0; });
        }
        return results_.at(id);
    }

    /**
     * @brief Block until every listed task completes
     *
     * The timeout is a single deadline shared by the whole batch.
     *
     * @return One entry per distinct id
     */
    std::unordered_map<TaskId, TaskResult<T>> wait_all(
        const std::vector<TaskId>& ids,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const {
        std::unique_lock lock(results_mutex_);
        for (TaskId id : ids) {
            ensure_issued(id);
        }

        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (timeout) {
            deadline = std::chrono::steady_clock::now() + *timeout;
        }

        std::unordered_map<TaskId, TaskResult<T>> collected;
        collected.reserve(ids.size());
        for (TaskId id : ids) {
            if (deadline) {
                wait_until_ready(lock, id, *deadline);
            } else {
                results_cv_.wait(lock, [&]() { return results_.count(id) > 0; });
            }
            collected.emplace(id, results_.at(id));
        }
        return collected;
    }

    /**
     * @brief Stop accepting work, stop the workers and join them
     *
     * drain == true waits for every queued and running task to finish first.
     * drain == false lets in-flight tasks finish but drops whatever is still
     * queued; dropped tasks are recorded as failed results so waiters wake up.
     * Safe to call more than once.
     */
    void shutdown(bool drain = true) {
        std::lock_guard shutdown_lock(shutdown_mutex_);
        if (stopped_) {
            return;
        }

        {
            std::unique_lock lock(results_mutex_);
            accepting_ = false;
            if (drain) {
                results_cv_.wait(lock, [this]() { return outstanding_ == 0; });
            }
        }

        stop_.store(true);
        queue_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        for (auto& task : queue_.drain()) {
            TaskResult<T> dropped;
            dropped.id = task.id;
            dropped.error = "task dropped at shutdown before execution";
            store_result(std::move(dropped));
        }
        stopped_ = true;
    }

    std::size_t worker_count() const noexcept { return workers_.size(); }

    std::size_t queued() const { return queue_.size(); }

    bool is_running() const noexcept { return !stop_.load(); }

private:
    struct Task {
        TaskId id = 0;
        Work work;
    };

    void worker_loop() {
        while (!stop_.load()) {
            auto task = queue_.pop_for(kPollInterval);
            if (!task) {
                continue;
            }
            execute(std::move(*task));
        }
    }

    void execute(Task task) {
        TaskResult<T> result;
        result.id = task.id;
        const auto started = std::chrono::steady_clock::now();
        try {
            result.value.emplace(task.work());
            result.success = true;
        } catch (const std::exception& e) {
            result.error = e.what();
        } catch (...) {
            result.error = "task threw a non-standard exception";
        }
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        store_result(std::move(result));
    }

    void store_result(TaskResult<T> result) {
        {
            std::lock_guard lock(results_mutex_);
            results_.insert_or_assign(result.id, std::move(result));
            if (outstanding_ > 0) {
                --outstanding_;
            }
        }
        results_cv_.notify_all();
    }

    // Caller holds results_mutex_
    void ensure_issued(TaskId id) const {
        if (id == 0 || id >= next_id_) {
            throw std::out_of_range("Unknown task id: " + std::to_string(id));
        }
    }

    // Caller holds results_mutex_ through lock
    void wait_until_ready(std::unique_lock<std::mutex>& lock,
                          TaskId id,
                          std::chrono::steady_clock::time_point deadline) const {
        if (!results_cv_.wait_until(lock, deadline, [&]() { return results_.count(id) > 0; })) {
            throw TaskTimeoutError("Timed out waiting for task " + std::to_string(id));
        }
    }

    PriorityTaskQueue<Task> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stop_{false};

    mutable std::mutex results_mutex_;
    mutable std::condition_variable results_cv_;
    std::unordered_map<TaskId, TaskResult<T>> results_;
    TaskId next_id_ = 1;
    std::size_t outstanding_ = 0;
    bool accepting_ = true;

    std::mutex shutdown_mutex_;
    bool stopped_ = false;
};

} // namespace envsync::pool
