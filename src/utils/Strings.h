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
#include <vector>

namespace feedmailer
{
namespace utils
{
namespace str
{

/**
 * @brief trim Returns a copy of the trimmed provided string
 */
std::string trim( std::string value );

std::string toLower( std::string value );

bool endsWith( const std::string& value, const std::string& suffix );

/**
 * @brief stripHtml Returns the text content of an HTML fragment
 *
 * Tags are removed and the most common entities are decoded. This is meant
 * for matching, not for display.
 */
std::string stripHtml( const std::string& html );

/**
 * @brief escapeHtml Escapes the characters with a special meaning in HTML
 */
std::string escapeHtml( const std::string& text );

/**
 * @brief join Concatenates the provided values, separated by sep
 */
std::string join( const std::vector<std::string>& values, const std::string& sep );

}
}
}
