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

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

#include "Strings.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace feedmailer
{
namespace utils
{
namespace str
{

std::string trim( std::string value )
{
    value.erase( begin( value ), std::find_if( begin( value ), end( value ), []( char c ) {
            return isspace( static_cast<unsigned char>( c ) ) == false;
        }));
    value.erase( std::find_if( value.rbegin(), value.rend(), []( char c ) {
            return isspace( static_cast<unsigned char>( c ) ) == false;
        }).base(), value.end() );
    return value;
}

std::string toLower( std::string value )
{
    std::transform( begin( value ), end( value ), begin( value ), []( char c ) {
        return static_cast<char>( tolower( static_cast<unsigned char>( c ) ) );
    });
    return value;
}

bool endsWith( const std::string& value, const std::string& suffix )
{
    if ( suffix.size() > value.size() )
        return false;
    return value.compare( value.size() - suffix.size(), suffix.size(), suffix ) == 0;
}

std::string stripHtml( const std::string& html )
{
    static const struct
    {
        const char* entity;
        char c;
    } entities[] = {
        { "&amp;", '&' },
        { "&lt;", '<' },
        { "&gt;", '>' },
        { "&quot;", '"' },
        { "&#39;", '\'' },
        { "&apos;", '\'' },
        { "&nbsp;", ' ' },
    };
    std::string res;
    res.reserve( html.size() );
    auto inTag = false;
    for ( auto i = 0u; i < html.size(); ++i )
    {
        auto c = html[i];
        if ( inTag == true )
        {
            if ( c == '>' )
                inTag = false;
            continue;
        }
        if ( c == '<' )
        {
            inTag = true;
            continue;
        }
        if ( c == '&' )
        {
            auto decoded = false;
            for ( const auto& e : entities )
            {
                if ( html.compare( i, strlen( e.entity ), e.entity ) == 0 )
                {
                    res.push_back( e.c );
                    i += strlen( e.entity ) - 1;
                    decoded = true;
                    break;
                }
            }
            if ( decoded == true )
                continue;
        }
        res.push_back( c );
    }
    return res;
}

std::string escapeHtml( const std::string& text )
{
    std::string res;
    res.reserve( text.size() );
    for ( auto c : text )
    {
        switch ( c )
        {
            case '&':
                res += "&amp;";
                break;
            case '<':
                res += "&lt;";
                break;
            case '>':
                res += "&gt;";
                break;
            case '"':
                res += "&quot;";
                break;
            case '\'':
                res += "&#39;";
                break;
            default:
                res.push_back( c );
        }
    }
    return res;
}

std::string join( const std::vector<std::string>& values, const std::string& sep )
{
    std::string res;
    for ( auto i = 0u; i < values.size(); ++i )
    {
        if ( i > 0 )
            res += sep;
        res += values[i];
    }
    return res;
}

}
}
}
