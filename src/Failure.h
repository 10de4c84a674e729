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
 * @brief Failure The consecutive failures of a feed group
 *
 * There is at most one row per group, and its presence means the group is
 * currently unhealthy. It is deleted on the next successful poll.
 */
class Failure : public DatabaseHelpers<Failure>
{
public:
    struct Table
    {
        static const std::string Name;
        static const std::string PrimaryKeyColumn;
    };

    Failure( FeedMailerPtr fm, sqlite::Row& row );

    const GroupKey& groupKey() const;
    uint32_t failCount() const;
    const std::string& error() const;

    /**
     * @brief record Inserts a failure with a count of 1, or increments the
     *        existing count and overwrites the error
     */
    static void record( FeedMailerPtr fm, const GroupKey& key, const std::string& error );
    static void clear( FeedMailerPtr fm, const GroupKey& key );
    static std::shared_ptr<Failure> fetch( FeedMailerPtr fm, const GroupKey& key );
    /**
     * @brief listFailing Returns the failures with at least minCount
     *        consecutive failures, ordered by group key
     */
    static std::vector<std::shared_ptr<Failure>> listFailing( FeedMailerPtr fm,
                                                              uint32_t minCount );
    /**
     * @brief deleteOrphans Deletes the failures of groups which don't exist anymore
     * @return The number of deleted rows
     */
    static int64_t deleteOrphans( FeedMailerPtr fm );

    static std::string schema( const std::string& tableName, uint32_t dbModel );
    static void createTable( sqlite::Connection* dbConnection );
    static bool checkDbModel( FeedMailerPtr fm );

private:
    FeedMailerPtr m_fm;
    GroupKey m_groupKey;
    uint32_t m_failCount;
    std::string m_error;
};

}
