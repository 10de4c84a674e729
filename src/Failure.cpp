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

#if HAVE_CONFIG_H
# include "config.h"
#endif

#include "Failure.h"
#include "DatabaseSettings.h"
#include "FeedGroup.h"
#include "FeedMailer.h"

#include <cassert>

namespace feedmailer
{

const std::string Failure::Table::Name = "failures";
const std::string Failure::Table::PrimaryKeyColumn = "urls_hash";

Failure::Failure( FeedMailerPtr fm, sqlite::Row& row )
    : m_fm( fm )
    , m_groupKey( row.extract<decltype(m_groupKey)>() )
    , m_failCount( row.extract<decltype(m_failCount)>() )
    , m_error( row.extract<decltype(m_error)>() )
{
    assert( row.hasRemainingColumns() == false );
}

const GroupKey& Failure::groupKey() const
{
    return m_groupKey;
}

uint32_t Failure::failCount() const
{
    return m_failCount;
}

const std::string& Failure::error() const
{
    return m_error;
}

void Failure::record( FeedMailerPtr fm, const GroupKey& key, const std::string& error )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(urls_hash, fail_count, error) VALUES(?, 1, ?) "
            "ON CONFLICT(urls_hash) DO UPDATE SET "
            "fail_count = fail_count + 1, error = excluded.error";
    sqlite::Tools::executeRequest( fm->getConn(), req, key, error );
}

void Failure::clear( FeedMailerPtr fm, const GroupKey& key )
{
    static const std::string req = "DELETE FROM " + Table::Name +
            " WHERE urls_hash = ?";
    sqlite::Tools::executeRequest( fm->getConn(), req, key );
}

std::shared_ptr<Failure> Failure::fetch( FeedMailerPtr fm, const GroupKey& key )
{
    return fetchByKey( fm, key );
}

std::vector<std::shared_ptr<Failure>> Failure::listFailing( FeedMailerPtr fm,
                                                            uint32_t minCount )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE fail_count >= ? ORDER BY urls_hash";
    return fetchAll( fm, req, minCount );
}

int64_t Failure::deleteOrphans( FeedMailerPtr fm )
{
    static const std::string req = "DELETE FROM " + Table::Name +
            " WHERE urls_hash NOT IN (SELECT urls_hash FROM " +
            FeedGroup::Table::Name + ")";
    OPEN_WRITE_CONTEXT( ctx, fm->getConn() );
    sqlite::Tools::executeRequest( fm->getConn(), req );
    return sqlite::Tools::changes();
}

std::string Failure::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    (void)tableName;
    return "CREATE TABLE " + Table::Name +
    "("
        "urls_hash BLOB PRIMARY KEY NOT NULL,"
        "fail_count INTEGER NOT NULL,"
        "error TEXT NOT NULL"
    ")";
}

void Failure::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
        schema( Table::Name, DatabaseSettings::DbModelVersion ) );
}

bool Failure::checkDbModel( FeedMailerPtr fm )
{
    return sqlite::Tools::checkTableSchema( fm->getConn(),
                                            schema( Table::Name, DatabaseSettings::DbModelVersion ),
                                            Table::Name );
}

}
