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

#include <memory>
#include <vector>

#include "SqliteTools.h"
#include "SqliteTransaction.h"

namespace feedmailer
{

template <typename IMPL>
class DatabaseHelpers
{
    public:
        template <typename... Args>
        static std::shared_ptr<IMPL> fetch( FeedMailerPtr fm, const std::string& req, Args&&... args )
        {
            try
            {
                return sqlite::Tools::fetchOne<IMPL>( fm, req, std::forward<Args>( args )... );
            }
            catch ( const sqlite::errors::Exception& ex )
            {
                if ( sqlite::errors::isInnocuous( ex ) == false )
                    throw;
                LOG_WARN( "Ignoring innocuous error: ", ex.what() );
            }
            return {};
        }

        template <typename PK>
        static std::shared_ptr<IMPL> fetchByKey( FeedMailerPtr fm, const PK& pkValue )
        {
            static const std::string req = "SELECT * FROM " + IMPL::Table::Name + " WHERE " +
                    IMPL::Table::PrimaryKeyColumn + " = ?";
            return fetch( fm, req, pkValue );
        }

        static std::vector<std::shared_ptr<IMPL>> fetchAll( FeedMailerPtr fm )
        {
            static const std::string req = "SELECT * FROM " + IMPL::Table::Name;
            return fetchAll( fm, req );
        }

        template <typename... Args>
        static std::vector<std::shared_ptr<IMPL>> fetchAll( FeedMailerPtr fm, const std::string& req, Args&&... args )
        {
            try
            {
                return sqlite::Tools::fetchAll<IMPL>( fm, req, std::forward<Args>( args )... );
            }
            catch ( const sqlite::errors::Exception& ex )
            {
                if ( sqlite::errors::isInnocuous( ex ) == false )
                    throw;
                LOG_WARN( "Ignoring innocuous error: ", ex.what() );
            }
            return {};
        }

        template <typename PK>
        static bool destroy( FeedMailerPtr fm, const PK& pkValue )
        {
            static const std::string req = "DELETE FROM " + IMPL::Table::Name + " WHERE "
                    + IMPL::Table::PrimaryKeyColumn + " = ?";
            return sqlite::Tools::executeDelete( fm->getConn(), req, pkValue );
        }

        static bool deleteAll( FeedMailerPtr fm )
        {
            static const std::string req = "DELETE FROM " + IMPL::Table::Name;
            return sqlite::Tools::executeDelete( fm->getConn(), req );
        }

        static int64_t count( FeedMailerPtr fm )
        {
            static const std::string req = "SELECT COUNT(*) FROM " + IMPL::Table::Name;
            return sqlite::Tools::fetchInteger( fm->getConn(), req );
        }
};

}
