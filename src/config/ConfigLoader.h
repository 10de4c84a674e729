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

#include "feedmailer/Config.h"

namespace feedmailer
{

/**
 * @brief ConfigLoader Builds a Config from its JSON representation
 *
 * Group settings start as a copy of the global ones, which themselves start
 * from the built-in defaults, so every key present at a level overrides the
 * lower ones. Template args are merged key by key.
 * Every function throws errors::ConfigError on invalid input.
 */
class ConfigLoader
{
public:
    static Config fromFile( const std::string& path );
    /**
     * @param json The configuration document
     * @param baseDir The directory relative template paths are resolved from
     */
    static Config fromString( const std::string& json, const std::string& baseDir );
    /**
     * @brief modificationTime Returns the last modification time of a file,
     *        in nanoseconds, or 0 if it can't be accessed
     */
    static int64_t modificationTime( const std::string& path );
};

}
