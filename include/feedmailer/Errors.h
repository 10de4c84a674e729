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

#include <stdexcept>
#include <string>

namespace feedmailer
{
namespace errors
{

/**
 * Base type for every error raised by the feedmailer core or by one of the
 * external collaborators it drives.
 * Storage failures are reported through sqlite::errors::Exception instead.
 */
class Exception : public std::runtime_error
{
public:
    explicit Exception( const std::string& msg )
        : std::runtime_error( msg )
    {
    }
};

/// Network, timeout or feed parsing failure
class FetchError : public Exception
{
public:
    FetchError( const std::string& url, const std::string& msg )
        : Exception( "Failed to fetch feed from " + url + ": " + msg )
        , m_url( url )
    {
    }

    const std::string& url() const
    {
        return m_url;
    }

private:
    std::string m_url;
};

/// Invalid expression, or an expression referring to a missing field
class EvalError : public Exception
{
public:
    EvalError( const std::string& expr, const std::string& msg )
        : Exception( "Failed to evaluate expression [" + expr + "]: " + msg )
    {
    }
};

class RenderError : public Exception
{
public:
    explicit RenderError( const std::string& msg )
        : Exception( "Failed to render template: " + msg )
    {
    }
};

class SendError : public Exception
{
public:
    explicit SendError( const std::string& msg )
        : Exception( "Failed to send mail: " + msg )
    {
    }
};

class ConfigError : public Exception
{
public:
    explicit ConfigError( const std::string& msg )
        : Exception( "Invalid configuration: " + msg )
    {
    }
};

}
}
