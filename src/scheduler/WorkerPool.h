/*****************************************************************************
 * Feed Mailer
 *****************************************************************************
 * Copyright (C) 2026 Feed Mailer authors
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation; either version 2.1 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program; if not, write to the Free Software Foundation,
 * Inc., 51 Franklin Street, Fifth Floor, Boston MA 02110-1301, USA.
 *****************************************************************************/

#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace feedmailer
{

/**
 * @brief WorkerPool A fixed number of threads running queued tasks
 *
 * Tasks are run in submission order, by whichever worker is available
 * first. Stopping the pool discards the tasks which didn't start yet, and
 * waits for the running ones to complete.
 */
class WorkerPool
{
public:
    using Task = std::function<void()>;

    explicit WorkerPool( uint32_t nbWorkers );
    ~WorkerPool();

    void start();
    void stop();
    /**
     * @brief schedule Queues a task
     * @return false if the pool isn't running, in which case the task is
     *         discarded
     */
    bool schedule( Task task );
    size_t nbPending() const;
    uint32_t nbWorkers() const;

private:
    void run();

private:
    uint32_t m_nbWorkers;
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::queue<Task> m_tasks;
    std::vector<std::thread> m_threads;
    bool m_run;
};

}
