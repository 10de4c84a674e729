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

#include "RegexCache.h"

#include "feedmailer/Errors.h"
#include "logging/Logger.h"

#include <re2/re2.h>

namespace feedmailer
{

namespace
{

std::shared_ptr<const re2::RE2> compile( const std::string& pattern )
{
    re2::RE2::Options opts;
    opts.set_log_errors( false );
    auto re = std::make_shared<const re2::RE2>( pattern, opts );
    if ( re->ok() == false )
        throw errors::ConfigError( "invalid filter pattern '" + pattern + "': " +
                                   re->error() );
    return re;
}

}

std::shared_ptr<const re2::RE2> RegexCache::get( uint64_t generation,
                                                 const std::string& pattern )
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( generation < m_generation )
    {
        /* Stale generation, don't pollute the current cache */
        return compile( pattern );
    }
    if ( generation > m_generation )
    {
        LOG_DEBUG( "Dropping ", m_regexes.size(), " compiled patterns from generation ",
                   m_generation );
        m_regexes.clear();
        m_generation = generation;
    }
    auto it = m_regexes.find( pattern );
    if ( it != end( m_regexes ) )
        return it->second;
    auto re = compile( pattern );
    m_regexes.emplace( pattern, re );
    return re;
}

uint64_t RegexCache::generation() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_generation;
}

size_t RegexCache::size() const
{
    std::lock_guard<std::mutex> lock( m_mutex );
    return m_regexes.size();
}

}
