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
#include <string>

namespace feedmailer
{
namespace utils
{
namespace date
{
    /**
     * @brief now Returns the current time as a Unix timestamp
     */
    int64_t now();

    /// The longest duration accepted in a configuration, 10 years
    constexpr int64_t MaxDuration = 10 * 365 * 24 * 3600;

    /**
     * @brief parseDuration Parses a human readable duration
     * @param str A sequence of <integer><unit> pairs, unit being one of
     *            s, m, h, d or w, for instance "1h30m" or "2w". Long unit
     *            names ("minutes", "days", ...) and spaces between pairs are
     *            accepted. A plain integer is a number of seconds.
     * @param res The parsed duration, only modified in case of success
     * @return true if the conversion was successful, false otherwise,
     *         including for durations longer than MaxDuration
     */
    bool parseDuration( const std::string& str, std::chrono::seconds& res );

    /**
     * @brief toIso8601 Formats a Unix timestamp as an UTC ISO 8601 date
     */
    std::string toIso8601( int64_t timestamp );

    /**
     * @brief cutoff Returns now - window, saturated at the epoch
     */
    int64_t cutoff( int64_t now, std::chrono::seconds window );
}
}
}
