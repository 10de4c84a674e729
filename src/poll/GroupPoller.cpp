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

#include "GroupPoller.h"

#include "Batcher.h"
#include "MailDispatcher.h"
#include "UpdateKeys.h"
#include "Failure.h"
#include "FeedGroup.h"
#include "FeedItem.h"
#include "FeedMailer.h"
#include "config/ConfigStore.h"
#include "database/SqliteErrors.h"
#include "database/SqliteTransaction.h"
#include "feedmailer/Errors.h"
#include "logging/Logger.h"
#include "utils/Date.h"

#include <algorithm>
#include <unordered_set>

namespace feedmailer
{

namespace poll
{

namespace
{

int64_t lastModified( const ItemContext& ctx )
{
    return ctx.item->updated != 0 ? ctx.item->updated : ctx.item->published;
}

bool hasRecipients( const Settings& settings )
{
    return settings.to.empty() == false || settings.cc.empty() == false ||
           settings.bcc.empty() == false;
}

/* Holds a group's in-flight flag for the duration of a poll */
class InFlight
{
public:
    explicit InFlight( std::shared_ptr<std::atomic_bool> flag )
        : m_flag( std::move( flag ) )
    {
        auto expected = false;
        m_acquired = m_flag->compare_exchange_strong( expected, true );
    }

    ~InFlight()
    {
        if ( m_acquired == true )
            m_flag->store( false );
    }

    InFlight( const InFlight& ) = delete;
    InFlight& operator=( const InFlight& ) = delete;

    bool acquired() const
    {
        return m_acquired;
    }

private:
    std::shared_ptr<std::atomic_bool> m_flag;
    bool m_acquired;
};

}

GroupPoller::GroupPoller( FeedMailerPtr fm, std::shared_ptr<IFetcher> fetcher,
                          std::shared_ptr<IEvaluator> evaluator,
                          MailDispatcher& dispatcher, std::string mailFrom )
    : m_fm( fm )
    , m_fetcher( std::move( fetcher ) )
    , m_evaluator( std::move( evaluator ) )
    , m_dispatcher( dispatcher )
    , m_mailFrom( std::move( mailFrom ) )
    , m_nbInterruptions( 0 )
{
}

PollResult GroupPoller::poll( const GroupSnapshot& group )
{
    PollResult res;
    InFlight inFlight{ flag( group.key ) };
    if ( inFlight.acquired() == false )
    {
        LOG_DEBUG( "Group ", group.key.toString(), " is already being polled" );
        res.status = PollResult::Status::Skipped;
        return res;
    }

    auto nbInterruptions = m_nbInterruptions.load();
    auto now = utils::date::now();
    try
    {
        doPoll( group, now, res );
        res.status = PollResult::Status::Success;
        return res;
    }
    catch ( const errors::Exception& ex )
    {
        res.error = ex.what();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        res.error = ex.what();
    }
    if ( m_nbInterruptions.load() != nbInterruptions )
    {
        LOG_INFO( "Poll of group ", group.key.toString(), " was interrupted: ",
                  res.error );
        res.status = PollResult::Status::Cancelled;
        return res;
    }
    LOG_ERROR( "Failed to poll group ", group.key.toString(), ": ", res.error );
    res.status = PollResult::Status::Failed;
    recordFailure( group.key, now, res.error );
    return res;
}

bool GroupPoller::isPolling( const GroupKey& key ) const
{
    std::lock_guard<std::mutex> lock( m_flagsMutex );
    auto it = m_flags.find( key );
    if ( it == end( m_flags ) )
        return false;
    return it->second->load();
}

void GroupPoller::interrupt()
{
    ++m_nbInterruptions;
}

void GroupPoller::retain( const ConfigSnapshot& snapshot )
{
    std::lock_guard<std::mutex> lock( m_flagsMutex );
    for ( auto it = begin( m_flags ); it != end( m_flags ); )
    {
        if ( snapshot.contains( it->first ) == false && it->second->load() == false )
            it = m_flags.erase( it );
        else
            ++it;
    }
}

std::shared_ptr<std::atomic_bool> GroupPoller::flag( const GroupKey& key )
{
    std::lock_guard<std::mutex> lock( m_flagsMutex );
    auto& f = m_flags[key];
    if ( f == nullptr )
        f = std::make_shared<std::atomic_bool>( false );
    return f;
}

std::vector<Feed> GroupPoller::fetch( const GroupSnapshot& group )
{
    const auto& settings = group.settings;
    std::vector<Feed> feeds;
    feeds.reserve( group.urls.size() );
    for ( const auto& url : group.urls )
    {
        FetchRequest req{ url, settings.timeout, settings.sanitize,
                          settings.httpHeaders };
        auto feed = m_fetcher->fetch( req );
        if ( feed.url.empty() == true )
            feed.url = url;
        LOG_VERBOSE( "Fetched ", feed.entries.size(), " entries from ", url );
        feeds.push_back( std::move( feed ) );
    }
    return feeds;
}

void GroupPoller::doPoll( const GroupSnapshot& group, int64_t now, PollResult& res )
{
    const auto& settings = group.settings;
    LOG_DEBUG( "Polling group ", group.key.toString() );

    FeedGroup::createIfMissing( m_fm, group.key, now );

    /*
     * Every URL is fetched before any entry gets looked at, the contexts we
     * build below point into this vector.
     */
    auto feeds = fetch( group );

    auto known = FeedItem::fingerprints( m_fm, group.key );
    std::unordered_set<Hash> pollFingerprints;
    std::vector<Hash> newFingerprints;
    std::vector<Hash> knownFingerprints;
    std::vector<ItemContext> items;

    for ( const auto& feed : feeds )
    {
        for ( const auto& entry : feed.entries )
        {
            ItemContext ctx{ &feed, &entry };
            Hash fp;
            try
            {
                fp = fingerprint( settings.updateKeys, ctx, *m_evaluator );
            }
            catch ( const errors::EvalError& ex )
            {
                LOG_WARN( "Skipping entry ", entry.id, " from ", feed.url,
                          ": ", ex.what() );
                ++res.nbSkipped;
                continue;
            }
            if ( pollFingerprints.insert( fp ).second == false )
                continue;
            if ( known.find( fp ) != end( known ) )
            {
                knownFingerprints.push_back( fp );
                continue;
            }
            ++res.nbNew;
            auto pass = true;
            if ( group.filter != nullptr )
            {
                try
                {
                    pass = group.filter->matches( ctx, *m_evaluator );
                }
                catch ( const errors::EvalError& ex )
                {
                    LOG_WARN( "Failed to filter entry ", entry.id, " from ",
                              feed.url, ": ", ex.what() );
                    ++res.nbSkipped;
                    continue;
                }
            }
            newFingerprints.push_back( fp );
            if ( pass == true )
                items.push_back( ctx );
            else
                LOG_VERBOSE( "Entry ", entry.id, " filtered out" );
        }
    }

    if ( settings.sortByLastModified == true )
    {
        std::stable_sort( begin( items ), end( items ),
                          []( const ItemContext& lhs, const ItemContext& rhs ) {
            return lastModified( lhs ) > lastModified( rhs );
        });
    }

    LOG_INFO( "Group ", group.key.toString(), ": ", res.nbNew, " new entries, ",
              items.size(), " to notify" );

    auto delivery = Batcher::plan( items.size(), settings.digest,
                                   settings.maxMailsPerCheck );
    auto mails = Batcher::render( delivery, settings, feeds, items,
                                  *m_evaluator, m_mailFrom );
    res.nbNotified = static_cast<uint32_t>( items.size() );
    if ( mails.empty() == false )
    {
        if ( hasRecipients( settings ) == false )
        {
            LOG_WARN( "No recipients for group ", group.key.toString(),
                      ", dropping ", mails.size(), " mail(s)" );
        }
        else
        {
            for ( const auto& m : mails )
            {
                m_dispatcher.send( m );
                ++res.nbMails;
            }
            LOG_INFO( "Group ", group.key.toString(), ": sent ", res.nbMails, " mail(s)" );
        }
    }

    auto t = m_fm->getConn()->newTransaction();
    for ( const auto& fp : newFingerprints )
        FeedItem::upsert( m_fm, group.key, fp, now );
    for ( const auto& fp : knownFingerprints )
        FeedItem::upsert( m_fm, group.key, fp, now );
    FeedGroup::setLastCheck( m_fm, group.key, now );
    if ( delivery != Batcher::Delivery::None )
        FeedGroup::setLastUpdate( m_fm, group.key, now );
    Failure::clear( m_fm, group.key );
    auto nbPruned = FeedItem::deleteUnseenSince( m_fm, group.key,
                        utils::date::cutoff( now, settings.keepOld ) );
    t->commit();
    if ( nbPruned > 0 )
        LOG_DEBUG( "Pruned ", nbPruned, " old item(s) from group ", group.key.toString() );
}

void GroupPoller::recordFailure( const GroupKey& key, int64_t now,
                                 const std::string& error )
{
    try
    {
        auto t = m_fm->getConn()->newTransaction();
        FeedGroup::createIfMissing( m_fm, key, now );
        FeedGroup::setLastCheck( m_fm, key, now );
        Failure::record( m_fm, key, error );
        t->commit();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_ERROR( "Failed to record failure of group ", key.toString(), ": ",
                   ex.what() );
    }
}

}

}
