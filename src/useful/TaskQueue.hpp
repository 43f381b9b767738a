/******************************************************************************\
 * TaskQueue.hpp - A fixed-size worker pool that runs blocking calls off the
 *                 caller's thread and hands results back through futures.
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace spawner {

// Tasks are started in submission order. With a single worker, at most one
// task runs at a time, so callers sharing the queue are serialized.
class TaskQueue {
private: // variables
    size_t const m_workers;

    mutable std::mutex m_mutex;
    std::condition_variable m_taskAvailable;
    std::queue<std::function<void()>> m_tasks;
    bool m_shutdown;

    std::vector<std::thread> m_workerThreads;

private: // helpers
    void workerLoop(size_t workerId);

public: // interface
    // Queue func for execution. The returned future holds func's result, or the
    // exception it threw. Throws std::runtime_error if the queue is shut down.
    template <typename Func>
    auto enqueue(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
    {
        using ResultType = std::invoke_result_t<std::decay_t<Func>>;

        // std::function requires a copyable target, packaged_task is move-only
        auto task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<Func>(func));
        auto result = task->get_future();

        { auto lock = std::lock_guard<std::mutex>{m_mutex};
            if (m_shutdown) {
                throw std::runtime_error("task queue is shut down");
            }
            m_tasks.emplace([task]() { (*task)(); });
        }
        m_taskAvailable.notify_one();

        return result;
    }

    // Stop accepting tasks, run the ones already queued, and join the workers
    void shutdown();

    size_t workerCount() const { return m_workers; }

public: // constructor / destructor interface
    explicit TaskQueue(size_t workers = 1);
    ~TaskQueue();
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;
};

} /* namespace spawner */
