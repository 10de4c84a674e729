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

#include "WorkerPool.h"

#include "logging/Logger.h"

namespace feedmailer
{

WorkerPool::WorkerPool( uint32_t nbWorkers )
    : m_nbWorkers( nbWorkers > 0 ? nbWorkers : 1 )
    , m_run( false )
{
}

WorkerPool::~WorkerPool()
{
    stop();
}

void WorkerPool::start()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_run == true )
        return;
    m_run = true;
    for ( auto i = 0u; i < m_nbWorkers; ++i )
        m_threads.emplace_back( &WorkerPool::run, this );
}

void WorkerPool::stop()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        if ( m_run == false )
            return;
        m_run = false;
        std::queue<Task>{}.swap( m_tasks );
        std::swap( threads, m_threads );
        m_cond.notify_all();
    }
    for ( auto& t : threads )
        t.join();
}

bool WorkerPool::schedule( Task task )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_run == false )
        return false;
    m_tasks.push( std::move( task ) );
    m_cond.notify_one();
    return true;
}

size_t WorkerPool::nbPending() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_tasks.size();
}

uint32_t WorkerPool::nbWorkers() const
{
    return m_nbWorkers;
}

void WorkerPool::run()
{
    LOG_DEBUG( "Starting worker thread" );
    while ( true )
    {
        Task t;
        {
            std::unique_lock<std::mutex> lock( m_mutex );
            m_cond.wait( lock, [this]() {
                return m_run == false || m_tasks.empty() == false;
            });
            if ( m_run == false )
                break;
            t = std::move( m_tasks.front() );
            m_tasks.pop();
        }
        try
        {
            t();
        }
        catch ( const std::exception& ex )
        {
            LOG_ERROR( "Unhandled exception in worker task: ", ex.what() );
        }
    }
    LOG_DEBUG( "Exiting worker thread" );
}

}
