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

#include <string>
#include <cstddef>
#include <cstdint>

#include "feedmailer/Hash.h"

namespace feedmailer
{
namespace utils
{
namespace hash
{
    /*
     * Given the amount of inlining and macro based magic in xxhash, we do not want
     * to include xxhash.h from this header, so we only publicly expose those
     * helpers
     */
    Hash xxFromBuff( const void* buff, size_t size );

    /**
     * @brief Hasher Accumulates a sequence of fields and digests them as a
     * whole.
     *
     * Each field is length prefixed, so ["ab", "c"] and ["a", "bc"] yield
     * different digests.
     */
    class Hasher
    {
    public:
        void update( const std::string& field );
        void update( const Hash& h );
        Hash digest() const;

    private:
        std::string m_buffer;
    };
}
}
}
