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

#include <chrono>
#include <cstdint>

#include "feedmailer/Types.h"

namespace feedmailer
{

struct ConfigSnapshot;

/**
 * @brief Pruner Bounds the growth of the database across configuration
 * changes.
 *
 * Items are pruned by the group's poll itself, this only takes care of the
 * groups which were removed from the configuration.
 */
class Pruner
{
public:
    struct Result
    {
        uint32_t nbGroups = 0;
        int64_t nbFailures = 0;
    };

    /**
     * @brief sweep Refreshes last_seen for every configured group, then
     *        deletes the groups which haven't been configured for longer than
     *        groupRetention, along with their items and orphan failures.
     */
    static Result sweep( FeedMailerPtr fm, const ConfigSnapshot& snapshot,
                         int64_t now, std::chrono::seconds groupRetention );
};

}
