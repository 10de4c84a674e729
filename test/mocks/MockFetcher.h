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

#include "feedmailer/Errors.h"
#include "feedmailer/IFetcher.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mock
{

/**
 * Serves canned feeds, by URL. URLs without a feed fail with a FetchError.
 * When blocking is enabled, fetches wait for release() (or stop()) before
 * returning, which lets a test act while a poll is in flight.
 */
class Fetcher : public feedmailer::IFetcher
{
public:
    Fetcher()
        : m_block( false )
        , m_nbBlocked( 0 )
        , m_stopped( false )
    {
    }

    void setFeed( const std::string& url, feedmailer::Feed feed )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        feed.url = url;
        m_feeds[url] = std::move( feed );
        m_errors.erase( url );
    }

    void setError( const std::string& url, const std::string& error )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_feeds.erase( url );
        m_errors[url] = error;
    }

    void block()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_block = true;
    }

    void release()
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_block = false;
        m_cond.notify_all();
    }

    /* Waits until at least one fetch is blocked */
    bool waitForBlocked( std::chrono::milliseconds timeout )
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        return m_cond.wait_for( lock, timeout, [this]() {
            return m_nbBlocked > 0;
        });
    }

    /* Waits until at least nbFetches fetches were requested */
    bool waitForFetches( size_t nbFetches, std::chrono::milliseconds timeout )
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        return m_cond.wait_for( lock, timeout, [this, nbFetches]() {
            return m_requests.size() >= nbFetches;
        });
    }

    size_t nbFetches() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_requests.size();
    }

    std::vector<feedmailer::FetchRequest> requests() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_requests;
    }

    bool isStopped() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_stopped;
    }

    virtual feedmailer::Feed fetch( const feedmailer::FetchRequest& req ) override
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        m_requests.push_back( req );
        m_cond.notify_all();
        if ( m_block == true )
        {
            ++m_nbBlocked;
            m_cond.notify_all();
            m_cond.wait( lock, [this]() {
                return m_block == false || m_stopped == true;
            });
            --m_nbBlocked;
        }
        if ( m_stopped == true )
            throw feedmailer::errors::FetchError( req.url, "interrupted" );
        auto it = m_feeds.find( req.url );
        if ( it != end( m_feeds ) )
            return it->second;
        auto err = m_errors.find( req.url );
        throw feedmailer::errors::FetchError( req.url,
                    err != end( m_errors ) ? err->second : "no such feed" );
    }

    virtual void stop() override
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_stopped = true;
        m_cond.notify_all();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::unordered_map<std::string, feedmailer::Feed> m_feeds;
    std::unordered_map<std::string, std::string> m_errors;
    std::vector<feedmailer::FetchRequest> m_requests;
    bool m_block;
    uint32_t m_nbBlocked;
    bool m_stopped;
};

}
