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

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "feedmailer/Config.h"
#include "feedmailer/IEvaluator.h"
#include "feedmailer/IMailer.h"

namespace feedmailer
{

namespace poll
{

class Batcher
{
public:
    enum class Delivery : uint8_t
    {
        /// Nothing to notify
        None,
        /// One mail per entry, using the item templates
        PerItem,
        /// A single mail covering every entry, using the digest templates
        Digest,
    };

    /**
     * @brief plan Picks the delivery mode for a poll
     *
     * Per item delivery is only used when digests are disabled and there
     * are at most maxMailsPerCheck entries. Any larger batch gets folded
     * into a digest.
     */
    static Delivery plan( size_t nbItems, bool digest, uint32_t maxMailsPerCheck );

    /**
     * @brief render Builds the mails notifying the provided entries
     * @param feeds Every feed fetched for the group, exposed to digests
     *
     * Throws errors::RenderError
     */
    static std::vector<Mail> render( Delivery delivery, const Settings& settings,
                                     const std::vector<Feed>& feeds,
                                     const std::vector<ItemContext>& items,
                                     IEvaluator& evaluator, const std::string& from );
};

}

}
