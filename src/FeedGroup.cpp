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

#include "FeedGroup.h"
#include "DatabaseSettings.h"
#include "FeedMailer.h"

#include <cassert>

namespace feedmailer
{

const std::string FeedGroup::Table::Name = "feed_groups";
const std::string FeedGroup::Table::PrimaryKeyColumn = "urls_hash";

FeedGroup::FeedGroup( FeedMailerPtr fm, sqlite::Row& row )
    : m_fm( fm )
    , m_key( row.extract<decltype(m_key)>() )
    , m_lastCheck( row.extract<decltype(m_lastCheck)>() )
    , m_lastUpdate( row.extract<decltype(m_lastUpdate)>() )
    , m_lastSeen( row.extract<decltype(m_lastSeen)>() )
{
    assert( row.hasRemainingColumns() == false );
}

const GroupKey& FeedGroup::key() const
{
    return m_key;
}

int64_t FeedGroup::lastCheck() const
{
    return m_lastCheck;
}

int64_t FeedGroup::lastUpdate() const
{
    return m_lastUpdate;
}

int64_t FeedGroup::lastSeen() const
{
    return m_lastSeen;
}

void FeedGroup::createIfMissing( FeedMailerPtr fm, const GroupKey& key, int64_t now )
{
    static const std::string req = "INSERT OR IGNORE INTO " + Table::Name +
            "(urls_hash, last_check, last_update, last_seen) VALUES(?, ?, NULL, ?)";
    sqlite::Tools::executeRequest( fm->getConn(), req, key, now, now );
}

void FeedGroup::setLastCheck( FeedMailerPtr fm, const GroupKey& key, int64_t now )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET last_check = ? WHERE urls_hash = ?";
    sqlite::Tools::executeRequest( fm->getConn(), req, now, key );
}

void FeedGroup::setLastUpdate( FeedMailerPtr fm, const GroupKey& key, int64_t now )
{
    static const std::string req = "UPDATE " + Table::Name +
            " SET last_update = ? WHERE urls_hash = ?";
    sqlite::Tools::executeRequest( fm->getConn(), req, now, key );
}

void FeedGroup::touch( FeedMailerPtr fm, const std::vector<GroupKey>& keys, int64_t now )
{
    if ( keys.empty() == true )
        return;
    static const std::string req = "UPDATE " + Table::Name +
            " SET last_seen = ? WHERE urls_hash = ?";
    auto t = fm->getConn()->newTransaction();
    for ( const auto& k : keys )
        sqlite::Tools::executeRequest( fm->getConn(), req, now, k );
    t->commit();
}

std::shared_ptr<FeedGroup> FeedGroup::fetch( FeedMailerPtr fm, const GroupKey& key )
{
    return fetchByKey( fm, key );
}

std::vector<std::shared_ptr<FeedGroup>> FeedGroup::listUnseenSince( FeedMailerPtr fm,
                                                                    int64_t cutoff )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE last_seen < ?";
    return fetchAll( fm, req, cutoff );
}

std::string FeedGroup::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    (void)tableName;
    return "CREATE TABLE " + Table::Name +
    "("
        "urls_hash BLOB PRIMARY KEY NOT NULL,"
        "last_check INTEGER NOT NULL,"
        "last_update INTEGER,"
        "last_seen INTEGER NOT NULL"
    ")";
}

void FeedGroup::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
        schema( Table::Name, DatabaseSettings::DbModelVersion ) );
}

bool FeedGroup::checkDbModel( FeedMailerPtr fm )
{
    return sqlite::Tools::checkTableSchema( fm->getConn(),
                                            schema( Table::Name, DatabaseSettings::DbModelVersion ),
                                            Table::Name );
}

}
