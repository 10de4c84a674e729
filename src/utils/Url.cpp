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

#include "Url.h"
#include "Strings.h"

#include <algorithm>

namespace feedmailer
{
namespace utils
{
namespace url
{

std::string scheme( const std::string& url )
{
    auto pos = url.find( "://" );
    if ( pos == std::string::npos )
        return {};
    return str::toLower( url.substr( 0, pos ) );
}

std::string normalize( const std::string& url )
{
    auto res = str::trim( url );
    auto fragmentPos = res.find( '#' );
    if ( fragmentPos != std::string::npos )
        res.erase( fragmentPos );
    auto schemePos = res.find( "://" );
    if ( schemePos == std::string::npos )
        return res;
    auto s = str::toLower( res.substr( 0, schemePos ) );
    const auto authorityBegin = schemePos + 3;
    auto authorityEnd = res.find_first_of( "/?", authorityBegin );
    if ( authorityEnd == std::string::npos )
        authorityEnd = res.size();
    auto authority = res.substr( authorityBegin, authorityEnd - authorityBegin );
    auto remainder = res.substr( authorityEnd );

    /* Only the host part is case insensitive, the user info is kept as is */
    auto hostBegin = authority.rfind( '@' );
    hostBegin = hostBegin == std::string::npos ? 0 : hostBegin + 1;
    std::transform( begin( authority ) + hostBegin, end( authority ),
                    begin( authority ) + hostBegin, []( char c ) {
        return static_cast<char>( tolower( static_cast<unsigned char>( c ) ) );
    });
    if ( ( s == "http" && str::endsWith( authority, ":80" ) == true ) ||
         ( s == "https" && str::endsWith( authority, ":443" ) == true ) )
    {
        authority.erase( authority.rfind( ':' ) );
    }
    if ( remainder.empty() == true || remainder[0] == '?' )
        remainder.insert( 0, "/" );
    return s + "://" + authority + remainder;
}

}
}
}
