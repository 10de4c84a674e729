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

#include "UpdateKeys.h"

#include "utils/XxHasher.h"

namespace feedmailer
{

namespace poll
{

Hash fingerprint( const std::vector<std::string>& updateKeys,
                  const ItemContext& ctx, IEvaluator& evaluator )
{
    utils::hash::Hasher hasher;
    for ( const auto& k : updateKeys )
    {
        auto v = evaluator.evaluate( k, ctx );
        /* Keep "null" apart from an empty string */
        hasher.update( v.isNull() == true ? std::string{ "\0", 1 } : v.toString() );
    }
    return hasher.digest();
}

}

}
