/******************************************************************************\
 * TaskQueue.cpp - Worker loop for the serialized task queue.
 *
 * Copyright 2020 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "useful/TaskQueue.hpp"
#include "useful/spawner_log.h"

namespace spawner {

TaskQueue::TaskQueue(size_t workers)
    : m_workers{workers}
    , m_mutex{}
    , m_taskAvailable{}
    , m_tasks{}
    , m_shutdown{false}
    , m_workerThreads{}
{
    if (m_workers == 0) {
        throw std::invalid_argument("task queue requires at least one worker");
    }

    m_workerThreads.reserve(m_workers);
    for (size_t i = 0; i < m_workers; ++i) {
        m_workerThreads.emplace_back(&TaskQueue::workerLoop, this, i);
    }
}

TaskQueue::~TaskQueue()
{
    shutdown();
}

void
TaskQueue::shutdown()
{
    { auto lock = std::lock_guard<std::mutex>{m_mutex};
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
    }
    m_taskAvailable.notify_all();

    for (auto& thread : m_workerThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_workerThreads.clear();
}

void
TaskQueue::workerLoop(size_t workerId)
{
    while (true) {
        auto task = std::function<void()>{};

        { auto lock = std::unique_lock<std::mutex>{m_mutex};
            m_taskAvailable.wait(lock, [this] {
                return !m_tasks.empty() || m_shutdown;
            });

            // drain remaining work before exiting so no caller is left with a broken promise
            if (m_tasks.empty()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores exceptions in the future, so nothing escapes here
        task();
    }

    getLogger().write("task queue worker %zu exiting\n", workerId);
}

} /* namespace spawner */
