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

#include <sqlite3.h>
#include <cstdint>
#include <string>
#include <type_traits>

#include "feedmailer/Hash.h"

namespace feedmailer
{

namespace sqlite
{

/*
 * Binds C++ values to statement parameters, and loads them back from result
 * columns. Timestamps and counters are INTEGER columns, URL sets and
 * fingerprints are 16 bytes BLOBs, everything else is TEXT.
 */

template <typename ToCheck, typename T>
using IsSameDecay = std::is_same<std::decay_t<ToCheck>, T>;

template <typename T, typename Enable = void>
struct Traits;

template <typename T>
struct Traits<T, std::enable_if_t<std::is_integral<std::decay_t<T>>::value &&
                                  sizeof( std::decay_t<T> ) <= sizeof( int )>>
{
    static int Bind( sqlite3_stmt* stmt, int pos, T value )
    {
        return sqlite3_bind_int( stmt, pos, static_cast<int>( value ) );
    }

    static std::decay_t<T> Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<std::decay_t<T>>( sqlite3_column_int( stmt, pos ) );
    }
};

template <typename T>
struct Traits<T, std::enable_if_t<std::is_integral<std::decay_t<T>>::value &&
                                  ( sizeof( std::decay_t<T> ) > sizeof( int ) )>>
{
    static int Bind( sqlite3_stmt* stmt, int pos, T value )
    {
        return sqlite3_bind_int64( stmt, pos, static_cast<sqlite3_int64>( value ) );
    }

    static std::decay_t<T> Load( sqlite3_stmt* stmt, int pos )
    {
        return static_cast<std::decay_t<T>>( sqlite3_column_int64( stmt, pos ) );
    }
};

template <typename T>
struct Traits<T, std::enable_if_t<IsSameDecay<T, std::string>::value ||
                                  IsSameDecay<T, const char*>::value ||
                                  IsSameDecay<T, char*>::value>>
{
    /* Parameters are only bound for the duration of the request */
    static int Bind( sqlite3_stmt* stmt, int pos, const std::string& value )
    {
        return sqlite3_bind_text( stmt, pos, value.c_str(),
                                  static_cast<int>( value.size() ), SQLITE_STATIC );
    }

    static std::string Load( sqlite3_stmt* stmt, int pos )
    {
        auto text = reinterpret_cast<const char*>( sqlite3_column_text( stmt, pos ) );
        if ( text == nullptr )
            return {};
        return std::string( text, sqlite3_column_bytes( stmt, pos ) );
    }
};

template <>
struct Traits<std::nullptr_t>
{
    static int Bind( sqlite3_stmt* stmt, int pos, std::nullptr_t )
    {
        return sqlite3_bind_null( stmt, pos );
    }
};

template <typename T>
struct Traits<T, std::enable_if_t<IsSameDecay<T, Hash>::value>>
{
    static int Bind( sqlite3_stmt* stmt, int pos, const Hash& h )
    {
        return sqlite3_bind_blob( stmt, pos, h.data(), Hash::Size, SQLITE_TRANSIENT );
    }

    /* A NULL or malformed blob loads as the null hash */
    static Hash Load( sqlite3_stmt* stmt, int pos )
    {
        auto blob = sqlite3_column_blob( stmt, pos );
        auto size = sqlite3_column_bytes( stmt, pos );
        if ( blob == nullptr || size != Hash::Size )
            return Hash{};
        return Hash{ blob, Hash::Size };
    }
};

}

}
