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

#include "Date.h"
#include "Strings.h"

#include <cctype>
#include <ctime>
#include <limits>

namespace feedmailer
{
namespace utils
{
namespace date
{

namespace
{

int64_t unitFactor( const std::string& unit )
{
    if ( unit.empty() == true || unit == "s" || unit == "sec" ||
         unit == "second" || unit == "seconds" )
        return 1;
    if ( unit == "m" || unit == "min" || unit == "minute" || unit == "minutes" )
        return 60;
    if ( unit == "h" || unit == "hour" || unit == "hours" )
        return 3600;
    if ( unit == "d" || unit == "day" || unit == "days" )
        return 24 * 3600;
    if ( unit == "w" || unit == "week" || unit == "weeks" )
        return 7 * 24 * 3600;
    return 0;
}

}

int64_t now()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch() ).count();
}

bool parseDuration( const std::string& input, std::chrono::seconds& res )
{
    auto str = str::toLower( str::trim( input ) );
    if ( str.empty() == true )
        return false;
    int64_t total = 0;
    auto i = 0u;
    while ( i < str.size() )
    {
        while ( i < str.size() && isspace( static_cast<unsigned char>( str[i] ) ) )
            ++i;
        if ( i >= str.size() )
            break;
        if ( isdigit( static_cast<unsigned char>( str[i] ) ) == 0 )
            return false;
        int64_t value = 0;
        while ( i < str.size() && isdigit( static_cast<unsigned char>( str[i] ) ) )
        {
            value = value * 10 + ( str[i] - '0' );
            if ( value > std::numeric_limits<int32_t>::max() )
                return false;
            ++i;
        }
        while ( i < str.size() && isspace( static_cast<unsigned char>( str[i] ) ) )
            ++i;
        std::string unit;
        while ( i < str.size() && isalpha( static_cast<unsigned char>( str[i] ) ) )
            unit.push_back( str[i++] );
        auto factor = unitFactor( unit );
        if ( factor == 0 )
            return false;
        total += value * factor;
        if ( total > MaxDuration )
            return false;
    }
    res = std::chrono::seconds{ total };
    return true;
}

std::string toIso8601( int64_t timestamp )
{
    auto t = static_cast<time_t>( timestamp );
    struct tm tm;
    if ( gmtime_r( &t, &tm ) == nullptr )
        return {};
    char buff[32];
    auto len = strftime( buff, sizeof( buff ), "%Y-%m-%dT%H:%M:%SZ", &tm );
    return std::string( buff, len );
}

int64_t cutoff( int64_t now, std::chrono::seconds window )
{
    auto c = now - window.count();
    return c < 0 ? 0 : c;
}

}
}
}
