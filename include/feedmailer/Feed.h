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

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace feedmailer
{

/**
 * @brief Entry A single item of a parsed RSS/Atom/JSON feed
 *
 * Text fields are expected to already be sanitized by the fetcher when the
 * group enables sanitizing.
 * Dates are expressed in seconds since epoch, 0 meaning unknown.
 */
struct Entry
{
    std::string id;
    std::string title;
    std::string summary;
    std::string content;
    std::string link;
    std::vector<std::string> authors;
    std::vector<std::string> categories;
    int64_t published = 0;
    int64_t updated = 0;
    /// Any additional field exposed by the parser, by name
    std::unordered_map<std::string, std::string> extra;
};

struct Feed
{
    /// The URL this feed was fetched from
    std::string url;
    std::string id;
    std::string title;
    std::string description;
    std::string link;
    int64_t updated = 0;
    std::vector<Entry> entries;
};

}
