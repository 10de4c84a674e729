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
#include <unordered_set>
#include <vector>

#include "feedmailer/Hash.h"
#include "database/DatabaseHelpers.h"

namespace feedmailer
{

/**
 * @brief FeedItem A fingerprint already observed for a feed group
 *
 * Once recorded, a fingerprint is never notified again for this group, until
 * it gets pruned after not being seen for the group's keep-old window.
 */
class FeedItem : public DatabaseHelpers<FeedItem>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
    };
    enum class Indexes : uint8_t
    {
        LastSeen,
    };

    FeedItem( FeedMailerPtr fm, sqlite::Row& row );

    int64_t id() const;
    const GroupKey& groupKey() const;
    const Hash& fingerprint() const;
    int64_t lastSeen() const;

    /**
     * @brief fingerprints Returns every fingerprint recorded for a group
     */
    static std::unordered_set<Hash> fingerprints( FeedMailerPtr fm, const GroupKey& key );
    static std::vector<std::shared_ptr<FeedItem>> fromGroup( FeedMailerPtr fm,
                                                             const GroupKey& key );
    /**
     * @brief upsert Records a fingerprint, or refreshes its last_seen if it
     *        is already known
     */
    static void upsert( FeedMailerPtr fm, const GroupKey& key,
                        const Hash& fingerprint, int64_t now );
    /**
     * @brief deleteUnseenSince Deletes the group's items whose last_seen
     *        predates cutoff
     * @return The number of deleted items
     */
    static int64_t deleteUnseenSince( FeedMailerPtr fm, const GroupKey& key,
                                      int64_t cutoff );
    using DatabaseHelpers<FeedItem>::count;
    static uint32_t count( FeedMailerPtr fm, const GroupKey& key );

    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static std::string index( Indexes index, uint32_t dbModel );
    static void createTable( sqlite::Connection* dbConnection );
    static void createIndexes( sqlite::Connection* dbConnection );
    static bool checkDbModel( FeedMailerPtr fm );

private:
    FeedMailerPtr m_fm;
    int64_t m_id;
    GroupKey m_groupKey;
    Hash m_fingerprint;
    int64_t m_lastSeen;
};

}
