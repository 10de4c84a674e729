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

#include "FailureReporter.h"

#include "Failure.h"
#include "FeedMailer.h"
#include "config/ConfigStore.h"
#include "feedmailer/Errors.h"
#include "logging/Logger.h"
#include "poll/MailDispatcher.h"
#include "utils/Date.h"
#include "utils/Strings.h"
#include "utils/XxHasher.h"

#include <sstream>

namespace feedmailer
{

const uint8_t FailureReporter::DebounceSweeps = 5;
const uint32_t FailureReporter::MinFailCount = 2;

FailureReporter::FailureReporter( FeedMailerPtr fm, poll::MailDispatcher& dispatcher,
                                  std::string mailFrom )
    : m_fm( fm )
    , m_dispatcher( dispatcher )
    , m_mailFrom( std::move( mailFrom ) )
    , m_failingHash( utils::hash::Hasher{}.digest() )
    , m_debounce( 0 )
{
}

bool FailureReporter::sweep( const ConfigSnapshot& snapshot )
{
    /* Failures are listed by group key, so the hash is order independent */
    auto failures = Failure::listFailing( m_fm, MinFailCount );
    std::vector<FailingGroup> failing;
    utils::hash::Hasher hasher;
    for ( const auto& f : failures )
    {
        auto group = snapshot.group( f->groupKey() );
        if ( group == nullptr )
            continue;
        hasher.update( f->groupKey() );
        failing.push_back( FailingGroup{ group->urls, f->error() } );
    }
    auto failingHash = hasher.digest();

    if ( failingHash != m_failingHash )
    {
        LOG_INFO( "Failing groups changed (", failing.size(), " failing)" );
        m_failingHash = failingHash;
        m_debounce = DebounceSweeps;
        return false;
    }
    switch ( m_debounce )
    {
        case 0:
            return false;
        case 1:
            break;
        default:
            --m_debounce;
            return false;
    }
    if ( snapshot.errorReportTo.empty() == true )
    {
        m_debounce = 0;
        return false;
    }
    try
    {
        sendReport( snapshot, failing );
    }
    catch ( const errors::SendError& ex )
    {
        LOG_ERROR( "Failed to send the failure report: ", ex.what() );
        return false;
    }
    m_debounce = 0;
    return true;
}

uint8_t FailureReporter::debounceCount() const
{
    return m_debounce;
}

void FailureReporter::sendReport( const ConfigSnapshot& snapshot,
                                  const std::vector<FailingGroup>& failing )
{
    LOG_INFO( "Sending failure report for ", failing.size(), " failing group(s)" );
    auto now = utils::date::toIso8601( utils::date::now() );
    Mail m;
    m.from = m_mailFrom;
    m.to = snapshot.errorReportTo;
    if ( failing.empty() == true )
    {
        m.subject = "All feeds are working";
        m.body = "All feeds are back to normal now (" + now + ").";
    }
    else
    {
        std::ostringstream body;
        body << "<div>" << failing.size()
             << ( failing.size() == 1 ? " feed is" : " feeds are" )
             << " not working (" << now << "):\n<ul>\n";
        for ( const auto& f : failing )
        {
            body << "  <li>\n    URL" << ( f.urls.size() > 1 ? "s" : "" ) << ": "
                 << utils::str::escapeHtml( utils::str::join( f.urls, ", " ) )
                 << "<br>\n    <blockquote><pre>"
                 << utils::str::escapeHtml( f.error )
                 << "</pre></blockquote>\n  </li>\n";
        }
        body << "</ul>\n</div>\n";
        m.subject = "Error processing feeds";
        m.body = body.str();
    }
    m_dispatcher.send( m );
}

}
