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

#if HAVE_CONFIG_H
# include "config.h"
#endif

#include "Scheduler.h"

#include "config/ConfigStore.h"
#include "logging/Logger.h"
#include "utils/Date.h"

#include <algorithm>
#include <vector>

namespace feedmailer
{

Scheduler::Scheduler( IHandler* handler, uint32_t nbWorkers,
                      std::chrono::seconds maxJitter,
                      std::chrono::seconds maintenanceInterval )
    : m_handler( handler )
    , m_maxJitter( maxJitter )
    , m_maintenanceInterval( maintenanceInterval )
    , m_run( false )
    , m_nextHandle( 1 )
    , m_maintenanceInFlight( false )
    , m_rng( std::random_device{}() )
    , m_pool( nbWorkers )
{
}

Scheduler::~Scheduler()
{
    stop();
}

void Scheduler::start()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_run == true )
        return;
    m_run = true;
    m_pool.start();
    m_nextMaintenance = Clock::now();
    m_thread = std::thread{ &Scheduler::run, this };
}

void Scheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if ( m_run == false )
            return;
        m_run = false;
        m_cond.notify_all();
    }
    m_thread.join();
    m_pool.stop();
    std::lock_guard<std::mutex> lock( m_mutex );
    m_inFlight.clear();
    m_maintenanceInFlight = false;
}

bool Scheduler::isStarted() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_run;
}

void Scheduler::reconcile( const ConfigSnapshot& snapshot )
{
    std::vector<std::pair<GroupKey, std::chrono::seconds>> added;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        auto now = Clock::now();
        for ( auto it = begin( m_timers ); it != end( m_timers ); )
        {
            if ( snapshot.contains( it->first ) == false )
            {
                LOG_INFO( "Unscheduling group ", it->first.toString() );
                it = m_timers.erase( it );
            }
            else
                ++it;
        }
        for ( const auto& g : snapshot.groups )
        {
            auto it = m_timers.find( g->key );
            if ( it == end( m_timers ) )
            {
                added.emplace_back( g->key, g->settings.interval );
                continue;
            }
            auto& timer = it->second;
            if ( timer.interval == g->settings.interval )
                continue;
            LOG_INFO( "Interval of group ", g->key.toString(), " changed from ",
                      timer.interval.count(), "s to ", g->settings.interval.count(), 's' );
            timer.interval = g->settings.interval;
            timer.nextRun = now + timer.interval;
            timer.handle = m_nextHandle++;
        }
    }
    if ( added.empty() == true )
        return;

    /* Resume where the previous run left, instead of polling everything now */
    std::vector<std::chrono::seconds> delays;
    delays.reserve( added.size() );
    auto nowUnix = utils::date::now();
    for ( const auto& p : added )
    {
        auto lastCheck = m_handler->lastCheck( p.first );
        auto remaining = lastCheck + p.second.count() - nowUnix;
        remaining = std::max<int64_t>( 0, std::min<int64_t>( remaining, p.second.count() ) );
        delays.emplace_back( remaining );
    }

    std::lock_guard<std::mutex> lock( m_mutex );
    auto now = Clock::now();
    for ( auto i = 0u; i < added.size(); ++i )
    {
        const auto& key = added[i].first;
        auto delay = delays[i] + jitter();
        LOG_INFO( "Scheduling group ", key.toString(), " every ",
                  added[i].second.count(), "s, first poll in ", delay.count(), 's' );
        m_timers.emplace( key, Timer{ added[i].second, now + delay, m_nextHandle++ } );
    }
    m_cond.notify_all();
}

size_t Scheduler::nbTimers() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_timers.size();
}

bool Scheduler::isScheduled( const GroupKey& key ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_timers.find( key ) != end( m_timers );
}

std::chrono::seconds Scheduler::interval( const GroupKey& key ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_timers.find( key );
    if ( it == end( m_timers ) )
        return std::chrono::seconds{ 0 };
    return it->second.interval;
}

std::chrono::seconds Scheduler::dueIn( const GroupKey& key ) const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    auto it = m_timers.find( key );
    if ( it == end( m_timers ) )
        return std::chrono::seconds{ 0 };
    auto now = Clock::now();
    if ( it->second.nextRun <= now )
        return std::chrono::seconds{ 0 };
    return std::chrono::duration_cast<std::chrono::seconds>( it->second.nextRun - now );
}

void Scheduler::run()
{
    LOG_DEBUG( "Starting scheduler thread" );
    std::unique_lock<std::mutex> lock( m_mutex );
    while ( m_run == true )
    {
        auto now = Clock::now();
        /* Wake up regularly even when idle, a new timer will notify us anyway */
        auto next = now + std::chrono::hours{ 1 };
        for ( auto& p : m_timers )
        {
            if ( p.second.nextRun <= now )
                dispatch( p.first, p.second, now );
            next = std::min( next, p.second.nextRun );
        }
        if ( m_maintenanceInterval.count() > 0 )
        {
            if ( m_nextMaintenance <= now )
                dispatchMaintenance( now );
            next = std::min( next, m_nextMaintenance );
        }
        m_cond.wait_until( lock, next );
    }
    LOG_DEBUG( "Exiting scheduler thread" );
}

void Scheduler::dispatch( const GroupKey& key, Timer& timer, Clock::time_point now )
{
    timer.nextRun = now + timer.interval;
    if ( m_inFlight.find( key ) != end( m_inFlight ) )
    {
        LOG_DEBUG( "Group ", key.toString(), " is still being polled, skipping" );
        return;
    }
    auto handle = timer.handle;
    auto interval = timer.interval;
    auto res = m_pool.schedule( [this, key, handle, interval, now]() {
        runPoll( key, handle, interval, now );
    });
    if ( res == true )
        m_inFlight.insert( key );
}

void Scheduler::dispatchMaintenance( Clock::time_point now )
{
    m_nextMaintenance = now + m_maintenanceInterval;
    if ( m_maintenanceInFlight == true )
        return;
    auto res = m_pool.schedule( [this]() {
        try
        {
            m_handler->onMaintenance();
        }
        catch ( const std::exception& ex )
        {
            LOG_ERROR( "Maintenance failed: ", ex.what() );
        }
        std::lock_guard<std::mutex> lock( m_mutex );
        m_maintenanceInFlight = false;
    });
    if ( res == true )
        m_maintenanceInFlight = true;
}

void Scheduler::runPoll( const GroupKey& key, uint64_t handle,
                         std::chrono::seconds interval, Clock::time_point dispatched )
{
    auto delay = interval;
    try
    {
        m_handler->onPoll( key );
        delay = m_handler->nextDelay( key, interval );
    }
    catch ( const std::exception& ex )
    {
        LOG_ERROR( "Failed to poll group ", key.toString(), ": ", ex.what() );
    }
    std::lock_guard<std::mutex> lock( m_mutex );
    m_inFlight.erase( key );
    auto it = m_timers.find( key );
    /* The timer was restarted or removed in the meantime, leave it alone */
    if ( it == end( m_timers ) || it->second.handle != handle )
        return;
    it->second.nextRun = dispatched + delay;
    m_cond.notify_all();
}

std::chrono::seconds Scheduler::jitter()
{
    if ( m_maxJitter.count() <= 0 )
        return std::chrono::seconds{ 0 };
    std::uniform_int_distribution<int64_t> dist( 0, m_maxJitter.count() );
    return std::chrono::seconds{ dist( m_rng ) };
}

}
