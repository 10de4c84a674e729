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

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "feedmailer/Hash.h"
#include "WorkerPool.h"

namespace feedmailer
{

struct ConfigSnapshot;

/**
 * @brief Scheduler Owns one timer per configured feed group, and the
 * periodic maintenance sweep.
 *
 * A single thread keeps track of the timers, and hands the due polls over to
 * a bounded worker pool. Groups are polled independently: a slow group only
 * delays its own next poll.
 */
class Scheduler
{
public:
    class IHandler
    {
    public:
        virtual ~IHandler() = default;
        virtual void onPoll( const GroupKey& key ) = 0;
        virtual void onMaintenance() = 0;
        /**
         * @brief nextDelay Returns the delay before polling a group again,
         *        counted from the start of its previous poll
         */
        virtual std::chrono::seconds nextDelay( const GroupKey& key,
                                                std::chrono::seconds interval ) = 0;
        /**
         * @brief lastCheck Returns the time of the group's last poll attempt,
         *        0 if it was never polled
         */
        virtual int64_t lastCheck( const GroupKey& key ) = 0;
    };

    /**
     * @param maintenanceInterval The maintenance period, 0 to disable it
     */
    Scheduler( IHandler* handler, uint32_t nbWorkers, std::chrono::seconds maxJitter,
               std::chrono::seconds maintenanceInterval );
    ~Scheduler();

    void start();
    /**
     * @brief stop Stops the timers, drops the pending polls, and waits for
     *        the running ones to complete
     *
     * The timers are kept, and will resume on the next start()
     */
    void stop();
    bool isStarted() const;

    /**
     * @brief reconcile Updates the timers to match the provided configuration
     *
     * New groups get a timer, groups whose interval changed get their timer
     * restarted, and removed groups lose their timer. No persisted state is
     * touched.
     */
    void reconcile( const ConfigSnapshot& snapshot );

    size_t nbTimers() const;
    bool isScheduled( const GroupKey& key ) const;
    /**
     * @brief interval Returns the interval of a group's timer, 0 if unscheduled
     */
    std::chrono::seconds interval( const GroupKey& key ) const;
    /**
     * @brief dueIn Returns the delay until the group's next poll, 0 if it is
     *        due or unscheduled
     */
    std::chrono::seconds dueIn( const GroupKey& key ) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Timer
    {
        std::chrono::seconds interval;
        Clock::time_point nextRun;
        /* Identifies this timer instance, a restarted timer gets a new one */
        uint64_t handle;
    };

    void run();
    void dispatch( const GroupKey& key, Timer& timer, Clock::time_point now );
    void dispatchMaintenance( Clock::time_point now );
    void runPoll( const GroupKey& key, uint64_t handle, std::chrono::seconds interval,
                  Clock::time_point dispatched );
    std::chrono::seconds jitter();

private:
    IHandler* m_handler;
    std::chrono::seconds m_maxJitter;
    std::chrono::seconds m_maintenanceInterval;

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::thread m_thread;
    bool m_run;
    std::unordered_map<GroupKey, Timer> m_timers;
    std::unordered_set<GroupKey> m_inFlight;
    uint64_t m_nextHandle;
    Clock::time_point m_nextMaintenance;
    bool m_maintenanceInFlight;
    std::mt19937 m_rng;

    WorkerPool m_pool;
};

}
