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

#include "FeedItem.h"
#include "DatabaseSettings.h"
#include "FeedGroup.h"
#include "FeedMailer.h"

#include <cassert>

namespace feedmailer
{

const std::string FeedItem::Table::Name = "feed_items";
const std::string FeedItem::Table::PrimaryKeyColumn = "id";

FeedItem::FeedItem( FeedMailerPtr fm, sqlite::Row& row )
    : m_fm( fm )
    , m_id( row.extract<decltype(m_id)>() )
    , m_groupKey( row.extract<decltype(m_groupKey)>() )
    , m_fingerprint( row.extract<decltype(m_fingerprint)>() )
    , m_lastSeen( row.extract<decltype(m_lastSeen)>() )
{
    assert( row.hasRemainingColumns() == false );
}

int64_t FeedItem::id() const
{
    return m_id;
}

const GroupKey& FeedItem::groupKey() const
{
    return m_groupKey;
}

const Hash& FeedItem::fingerprint() const
{
    return m_fingerprint;
}

int64_t FeedItem::lastSeen() const
{
    return m_lastSeen;
}

std::unordered_set<Hash> FeedItem::fingerprints( FeedMailerPtr fm, const GroupKey& key )
{
    static const std::string req = "SELECT update_hash FROM " + Table::Name +
            " WHERE urls_hash = ?";
    OPEN_READ_CONTEXT( ctx, fm->getConn() );
    sqlite::Statement stmt( req );
    stmt.execute( key );
    std::unordered_set<Hash> res;
    sqlite::Row row;
    while ( ( row = stmt.row() ) != nullptr )
        res.insert( row.extract<Hash>() );
    return res;
}

std::vector<std::shared_ptr<FeedItem>> FeedItem::fromGroup( FeedMailerPtr fm,
                                                            const GroupKey& key )
{
    static const std::string req = "SELECT * FROM " + Table::Name +
            " WHERE urls_hash = ? ORDER BY id";
    return fetchAll( fm, req, key );
}

void FeedItem::upsert( FeedMailerPtr fm, const GroupKey& key,
                       const Hash& fingerprint, int64_t now )
{
    static const std::string req = "INSERT INTO " + Table::Name +
            "(urls_hash, update_hash, last_seen) VALUES(?, ?, ?) "
            "ON CONFLICT(urls_hash, update_hash) DO UPDATE SET last_seen = excluded.last_seen";
    sqlite::Tools::executeRequest( fm->getConn(), req, key, fingerprint, now );
}

int64_t FeedItem::deleteUnseenSince( FeedMailerPtr fm, const GroupKey& key,
                                     int64_t cutoff )
{
    static const std::string req = "DELETE FROM " + Table::Name +
            " WHERE urls_hash = ? AND last_seen < ?";
    OPEN_WRITE_CONTEXT( ctx, fm->getConn() );
    sqlite::Tools::executeRequest( fm->getConn(), req, key, cutoff );
    return sqlite::Tools::changes();
}

uint32_t FeedItem::count( FeedMailerPtr fm, const GroupKey& key )
{
    static const std::string req = "SELECT COUNT(*) FROM " + Table::Name +
            " WHERE urls_hash = ?";
    return static_cast<uint32_t>( sqlite::Tools::fetchInteger( fm->getConn(), req, key ) );
}

std::string FeedItem::schema( const std::string& tableName, uint32_t )
{
    assert( tableName == Table::Name );
    (void)tableName;
    return "CREATE TABLE " + Table::Name +
    "("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "urls_hash BLOB NOT NULL,"
        "update_hash BLOB NOT NULL,"
        "last_seen INTEGER NOT NULL,"
        "UNIQUE(urls_hash, update_hash),"
        "FOREIGN KEY(urls_hash) REFERENCES " + FeedGroup::Table::Name +
            "(urls_hash) ON DELETE CASCADE"
    ")";
}

std::string FeedItem::index( Indexes index, uint32_t )
{
    switch ( index )
    {
        case Indexes::LastSeen:
            return "CREATE INDEX IF NOT EXISTS feed_items_last_seen_idx ON " +
                    Table::Name + "(urls_hash, last_seen)";
    }
    return "<invalid request>";
}

void FeedItem::createTable( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
        schema( Table::Name, DatabaseSettings::DbModelVersion ) );
}

void FeedItem::createIndexes( sqlite::Connection* dbConnection )
{
    sqlite::Tools::executeRequest( dbConnection,
        index( Indexes::LastSeen, DatabaseSettings::DbModelVersion ) );
}

bool FeedItem::checkDbModel( FeedMailerPtr fm )
{
    return sqlite::Tools::checkTableSchema( fm->getConn(),
                                            schema( Table::Name, DatabaseSettings::DbModelVersion ),
                                            Table::Name );
}

}
