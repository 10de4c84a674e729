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

#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>

namespace feedmailer
{

/**
 * @brief Fixed size content digest.
 *
 * Used both as a feed group identity (hash of its URL set) and as an item
 * fingerprint (hash of its update-key values). Stored as a 16 bytes BLOB.
 */
class Hash
{
public:
    static constexpr size_t Size = 16;
    using Bytes = std::array<uint8_t, Size>;

    Hash() : m_bytes{} {}
    explicit Hash( const Bytes& b ) : m_bytes( b ) {}
    Hash( const void* buff, size_t size )
        : m_bytes{}
    {
        memcpy( m_bytes.data(), buff, size < Size ? size : static_cast<size_t>( Size ) );
    }

    const Bytes& bytes() const { return m_bytes; }
    const uint8_t* data() const { return m_bytes.data(); }

    bool isNull() const
    {
        for ( auto b : m_bytes )
            if ( b != 0 )
                return false;
        return true;
    }

    /**
     * @brief toString Returns the lowercase hexadecimal representation
     */
    std::string toString() const
    {
        static const char digits[] = "0123456789abcdef";
        std::string res;
        res.reserve( Size * 2 );
        for ( auto b : m_bytes )
        {
            res.push_back( digits[b >> 4] );
            res.push_back( digits[b & 0x0F] );
        }
        return res;
    }

    bool operator==( const Hash& h ) const { return m_bytes == h.m_bytes; }
    bool operator!=( const Hash& h ) const { return m_bytes != h.m_bytes; }
    bool operator<( const Hash& h ) const { return m_bytes < h.m_bytes; }

private:
    Bytes m_bytes;
};

using GroupKey = Hash;

}

namespace std
{
template <>
struct hash<feedmailer::Hash>
{
    size_t operator()( const feedmailer::Hash& h ) const
    {
        size_t res;
        memcpy( &res, h.data(), sizeof( res ) );
        return res;
    }
};
}
