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

#include "XxHasher.h"

#define XXH_INLINE_ALL 1
#define XXH_STATIC_LINKING_ONLY 1

# include <xxhash.h>

namespace feedmailer
{
namespace utils
{
namespace hash
{

Hash xxFromBuff( const void* buff, size_t size )
{
    auto h = XXH3_128bits( buff, size );
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash( &canonical, h );
    return Hash{ canonical.digest, sizeof( canonical.digest ) };
}

void Hasher::update( const std::string& field )
{
    uint64_t size = field.size();
    for ( auto i = 0u; i < sizeof( size ); ++i )
        m_buffer.push_back( static_cast<char>( ( size >> ( i * 8 ) ) & 0xFF ) );
    m_buffer.append( field );
}

void Hasher::update( const Hash& h )
{
    m_buffer.append( reinterpret_cast<const char*>( h.data() ), Hash::Size );
}

Hash Hasher::digest() const
{
    return xxFromBuff( m_buffer.data(), m_buffer.size() );
}

}
}
}
