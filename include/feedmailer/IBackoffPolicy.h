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

namespace feedmailer
{

/**
 * @brief IBackoffPolicy Lets the application stretch a failing group's
 * polling interval.
 *
 * When no policy is provided, groups are polled at their configured interval
 * regardless of their failure count.
 */
class IBackoffPolicy
{
public:
    virtual ~IBackoffPolicy() = default;
    /**
     * @param interval The group's configured interval
     * @param failCount The number of consecutive failures, 0 if healthy
     * @return The delay until the next poll
     */
    virtual std::chrono::seconds nextDelay( std::chrono::seconds interval,
                                            uint32_t failCount ) const = 0;
};

}
