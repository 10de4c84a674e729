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

#include "feedmailer/ILogger.h"

#include <iostream>
#include <mutex>

namespace feedmailer
{

class IostreamLogger : public ILogger
{
public:
    virtual void Error( const std::string& msg ) override
    {
        write( "Error: ", msg );
    }

    virtual void Warning( const std::string& msg ) override
    {
        write( "Warning: ", msg );
    }

    virtual void Info( const std::string& msg ) override
    {
        write( "Info: ", msg );
    }

    virtual void Debug( const std::string& msg ) override
    {
        write( "Debug: ", msg );
    }

    virtual void Verbose( const std::string& msg ) override
    {
        write( "Verbose: ", msg );
    }

private:
    void write( const char* prefix, const std::string& msg )
    {
        // Polls run on several workers, don't interleave their lines
        std::lock_guard<std::mutex> lock( m_mutex );
        std::cout << prefix << msg;
    }

private:
    std::mutex m_mutex;
};

}
