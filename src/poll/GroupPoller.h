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

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "feedmailer/IFeedMailer.h"
#include "feedmailer/Types.h"

namespace feedmailer
{

struct GroupSnapshot;
struct ConfigSnapshot;

namespace poll
{

class MailDispatcher;

/**
 * @brief GroupPoller Runs the fetch, dedup, filter, notify and persist chain
 * for one feed group.
 *
 * A group is never polled twice simultaneously: an attempt to poll a group
 * which is already being polled returns immediately with a Skipped status.
 * Different groups can be polled concurrently from different threads.
 */
class GroupPoller
{
public:
    GroupPoller( FeedMailerPtr fm, std::shared_ptr<IFetcher> fetcher,
                 std::shared_ptr<IEvaluator> evaluator,
                 MailDispatcher& dispatcher, std::string mailFrom );

    /**
     * @brief poll Polls a group using the provided settings
     *
     * The caller is expected to keep the snapshot owning this group alive
     * for the duration of the call.
     * Fetch, render, send and storage failures are recorded as a failure of
     * the group and reported through the result, they are never thrown.
     */
    PollResult poll( const GroupSnapshot& group );

    bool isPolling( const GroupKey& key ) const;

    /**
     * @brief interrupt Flags the polls currently in flight as cancelled
     *
     * A poll which fails after being interrupted returns a Cancelled status
     * and doesn't count as a failure of its group.
     */
    void interrupt();

    /**
     * @brief retain Forgets the in-flight flags of the idle groups which are
     * not part of the provided configuration anymore
     */
    void retain( const ConfigSnapshot& snapshot );

private:
    std::shared_ptr<std::atomic_bool> flag( const GroupKey& key );
    void doPoll( const GroupSnapshot& group, int64_t now, PollResult& res );
    std::vector<Feed> fetch( const GroupSnapshot& group );
    void recordFailure( const GroupKey& key, int64_t now, const std::string& error );

private:
    FeedMailerPtr m_fm;
    std::shared_ptr<IFetcher> m_fetcher;
    std::shared_ptr<IEvaluator> m_evaluator;
    MailDispatcher& m_dispatcher;
    std::string m_mailFrom;
    std::atomic_uint m_nbInterruptions;

    mutable std::mutex m_flagsMutex;
    std::unordered_map<GroupKey, std::shared_ptr<std::atomic_bool>> m_flags;
};

}

}
