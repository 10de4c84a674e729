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
#include <string>
#include <utility>
#include <vector>

#include "feedmailer/Feed.h"

namespace feedmailer
{

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct FetchRequest
{
    std::string url;
    std::chrono::seconds timeout;
    /// Strip unsafe HTML from titles, summaries and contents
    bool sanitize;
    HttpHeaders httpHeaders;
};

class IFetcher
{
public:
    virtual ~IFetcher() = default;
    /**
     * @brief fetch Downloads and parses a feed
     *
     * This is expected to block until the feed is available, the request
     * times out, or stop() gets called.
     * Throws errors::FetchError on network, timeout or parsing failures.
     */
    virtual Feed fetch( const FetchRequest& request ) = 0;
    /**
     * @brief stop Interrupt any ongoing fetch as soon as possible
     */
    virtual void stop() = 0;
};

}
