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

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

static inline std::string getTempDir()
{
    auto forcedPath = getenv( "FEEDMAILER_TEST_FOLDER" );
    if ( forcedPath != nullptr )
        return forcedPath;
    return "/tmp/";
}

static inline std::string getTempPath( std::string name )
{
    return getTempDir() + "feedmailer/" + std::move( name ) + "/";
}

static inline bool makeDir( const std::string& path )
{
    std::string::size_type pos = 0;
    while ( ( pos = path.find( '/', pos + 1 ) ) != std::string::npos )
    {
        auto sub = path.substr( 0, pos );
        if ( mkdir( sub.c_str(), 0700 ) != 0 && errno != EEXIST )
            return false;
    }
    return true;
}

/*
 * Test folders only ever contain plain files: the database, its journals, and
 * configuration files written by the tests
 */
static inline bool removeDir( const std::string& path )
{
    auto dir = opendir( path.c_str() );
    if ( dir == nullptr )
        return errno == ENOENT;
    struct dirent* ent;
    while ( ( ent = readdir( dir ) ) != nullptr )
    {
        std::string name = ent->d_name;
        if ( name == "." || name == ".." )
            continue;
        unlink( ( path + name ).c_str() );
    }
    closedir( dir );
    return rmdir( path.c_str() ) == 0;
}

static inline bool writeFile( const std::string& path, const std::string& content )
{
    std::ofstream f( path, std::ios::binary | std::ios::trunc );
    if ( f.is_open() == false )
        return false;
    f << content;
    return f.good();
}
