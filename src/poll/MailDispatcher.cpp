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

#include "MailDispatcher.h"

#include "feedmailer/Errors.h"
#include "logging/Logger.h"

#include <algorithm>

namespace feedmailer
{

namespace poll
{

constexpr uint32_t MailDispatcher::MaxBackoffShift;

MailDispatcher::MailDispatcher( std::shared_ptr<IMailer> mailer, uint32_t nbAttempts,
                                std::chrono::milliseconds retryDelay )
    : m_mailer( std::move( mailer ) )
    , m_nbAttempts( nbAttempts > 0 ? nbAttempts : 1 )
    , m_retryDelay( retryDelay )
    , m_interrupted( false )
{
}

void MailDispatcher::send( const Mail& mail )
{
    for ( auto attempt = 1u; ; ++attempt )
    {
        try
        {
            m_mailer->send( mail );
            return;
        }
        catch ( const errors::SendError& ex )
        {
            if ( attempt >= m_nbAttempts )
            {
                LOG_ERROR( "Giving up sending \"", mail.subject, "\" after ",
                           attempt, " attempts" );
                throw;
            }
            LOG_WARN( "Failed to send mail (attempt ", attempt, "): ", ex.what() );
        }
        if ( wait( retryDelay( attempt ) ) == false )
            throw errors::SendError{ "Interrupted while waiting to retry" };
    }
}

std::chrono::milliseconds MailDispatcher::retryDelay( uint32_t attempt ) const
{
    return m_retryDelay * ( 1 << std::min( attempt, MaxBackoffShift ) );
}

void MailDispatcher::interrupt()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    m_interrupted = true;
    m_cond.notify_all();
}

void MailDispatcher::resume()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    m_interrupted = false;
}

bool MailDispatcher::wait( std::chrono::milliseconds delay )
{
    std::unique_lock<std::mutex> lock( m_mutex );
    return m_cond.wait_for( lock, delay, [this]() {
        return m_interrupted;
    }) == false;
}

}

}
