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

#include "feedmailer/Hash.h"
#include "database/DatabaseHelpers.h"

namespace feedmailer
{

/**
 * @brief FeedGroup The persisted state of a feed group
 *
 * A group is identified by the hash of its URL set. Its row is created the
 * first time it gets polled, and only removed by pruning.
 */
class FeedGroup : public DatabaseHelpers<FeedGroup>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
    };

    FeedGroup( FeedMailerPtr fm, sqlite::Row& row );

    const GroupKey& key() const;
    int64_t lastCheck() const;
    /// 0 if the group never produced a notification
    int64_t lastUpdate() const;
    int64_t lastSeen() const;

    /**
     * @brief createIfMissing Inserts the group row unless it already exists
     */
    static void createIfMissing( FeedMailerPtr fm, const GroupKey& key, int64_t now );
    static void setLastCheck( FeedMailerPtr fm, const GroupKey& key, int64_t now );
    static void setLastUpdate( FeedMailerPtr fm, const GroupKey& key, int64_t now );
    /**
     * @brief touch Refreshes last_seen for every provided group
     */
    static void touch( FeedMailerPtr fm, const std::vector<GroupKey>& keys, int64_t now );
    static std::shared_ptr<FeedGroup> fetch( FeedMailerPtr fm, const GroupKey& key );
    /**
     * @brief listUnseenSince Returns the groups whose last_seen predates cutoff
     */
    static std::vector<std::shared_ptr<FeedGroup>> listUnseenSince( FeedMailerPtr fm,
                                                                    int64_t cutoff );

    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static void createTable( sqlite::Connection* dbConnection );
    static bool checkDbModel( FeedMailerPtr fm );

private:
    FeedMailerPtr m_fm;
    GroupKey m_key;
    int64_t m_lastCheck;
    int64_t m_lastUpdate;
    int64_t m_lastSeen;
};

}
