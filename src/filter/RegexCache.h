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
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace re2
{
class RE2;
}

namespace feedmailer
{

/**
 * @brief RegexCache Compiled filter patterns, keyed by configuration
 * generation and pattern.
 *
 * Patterns use the RE2 syntax, and match in linear time over the subject.
 * Requesting a pattern for a newer generation drops every regex compiled for
 * the previous ones. Compiled regexes are shared with the filters using them,
 * so dropping the cache doesn't invalidate a filter still in use by an
 * in-flight poll.
 */
class RegexCache
{
public:
    /**
     * @brief get Returns the compiled pattern, compiling it if needed
     *
     * Throws errors::ConfigError if the pattern is invalid
     */
    std::shared_ptr<const re2::RE2> get( uint64_t generation,
                                         const std::string& pattern );

    uint64_t generation() const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    uint64_t m_generation = 0;
    std::unordered_map<std::string, std::shared_ptr<const re2::RE2>> m_regexes;
};

}
