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

#include "UnitTests.h"

#include "FeedGroup.h"
#include "config/ConfigStore.h"
#include "scheduler/Scheduler.h"
#include "scheduler/WorkerPool.h"
#include "utils/Date.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>

static const std::string Url = "https://example.org/feed.xml";
static const std::string OtherUrl = "https://other.org/atom";

namespace
{

class BackoffPolicy : public IBackoffPolicy
{
public:
    virtual std::chrono::seconds nextDelay( std::chrono::seconds interval,
                                            uint32_t failCount ) const override
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_failCounts.push_back( failCount );
        m_cond.notify_all();
        if ( failCount == 0 )
            return interval;
        return std::chrono::seconds{ 3600 };
    }

    bool waitForCalls( size_t nbCalls, std::chrono::milliseconds timeout ) const
    {
        std::unique_lock<std::mutex> lock( m_mutex );
        return m_cond.wait_for( lock, timeout, [this, nbCalls]() {
            return m_failCounts.size() >= nbCalls;
        });
    }

    std::vector<uint32_t> failCounts() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_failCounts;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cond;
    mutable std::vector<uint32_t> m_failCounts;
};

}

class SchedulerTests : public Tests
{
public:
    std::shared_ptr<BackoffPolicy> policy;

protected:
    virtual void TestSpecificSetup( SetupConfig& cfg ) override
    {
        policy = std::make_shared<BackoffPolicy>();
        cfg.backoffPolicy = policy;
    }
};

static Config withInterval( const std::vector<std::string>& urls,
                            std::chrono::seconds interval )
{
    auto s = Tests::settings();
    s.interval = interval;
    return Tests::config( urls, s );
}

static void Reconcile( SchedulerTests* T )
{
    auto& scheduler = T->fm->scheduler();
    auto key = groupKey( { Url } );
    auto otherKey = groupKey( { OtherUrl } );
    ASSERT_EQ( 0u, scheduler.nbTimers() );

    auto c = withInterval( { Url }, std::chrono::seconds{ 600 } );
    c.feeds.push_back( withInterval( { OtherUrl }, std::chrono::seconds{ 1200 } ).feeds[0] );
    ASSERT_TRUE( T->fm->setConfig( c ) );
    ASSERT_EQ( 2u, scheduler.nbTimers() );
    ASSERT_EQ( 600, scheduler.interval( key ).count() );
    ASSERT_EQ( 1200, scheduler.interval( otherKey ).count() );
    /* Never polled, so due right away */
    ASSERT_EQ( 0, scheduler.dueIn( key ).count() );

    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 600 } ) ) );
    ASSERT_EQ( 1u, scheduler.nbTimers() );
    ASSERT_TRUE( scheduler.isScheduled( key ) );
    ASSERT_FALSE( scheduler.isScheduled( otherKey ) );
    ASSERT_EQ( 0, scheduler.interval( otherKey ).count() );
    ASSERT_EQ( 0, scheduler.dueIn( otherKey ).count() );
}

static void IntervalChange( SchedulerTests* T )
{
    auto& scheduler = T->fm->scheduler();
    auto key = groupKey( { Url } );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 600 } ) ) );
    ASSERT_EQ( 0, scheduler.dueIn( key ).count() );

    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 1800 } ) ) );
    ASSERT_EQ( 1800, scheduler.interval( key ).count() );
    ASSERT_GE( scheduler.dueIn( key ).count(), 1790 );
    ASSERT_LE( scheduler.dueIn( key ).count(), 1800 );

    /* An unchanged interval leaves the timer alone */
    auto s = Tests::settings();
    s.interval = std::chrono::seconds{ 1800 };
    s.digest = true;
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url }, s ) ) );
    ASSERT_GE( scheduler.dueIn( key ).count(), 1790 );
}

static void HonoursLastCheck( SchedulerTests* T )
{
    auto& scheduler = T->fm->scheduler();
    auto key = groupKey( { Url } );
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 3600 } ) ) );
    ASSERT_EQ( PollResult::Status::Success, T->fm->pollNow( key ).status );

    /* Remove, then re-add the group: its persisted last_check is honoured */
    ASSERT_TRUE( T->fm->setConfig( withInterval( { OtherUrl }, std::chrono::seconds{ 3600 } ) ) );
    ASSERT_FALSE( scheduler.isScheduled( key ) );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 3600 } ) ) );
    ASSERT_GE( scheduler.dueIn( key ).count(), 3590 );
    ASSERT_LE( scheduler.dueIn( key ).count(), 3600 );

    /* A last_check older than the interval makes it due right away */
    FeedGroup::setLastCheck( T->fm.get(), key, utils::date::now() - 7200 );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { OtherUrl }, std::chrono::seconds{ 3600 } ) ) );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 3600 } ) ) );
    ASSERT_EQ( 0, scheduler.dueIn( key ).count() );
}

static void PeriodicPolls( SchedulerTests* T )
{
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 1 } ) ) );
    T->fm->start();
    ASSERT_TRUE( T->fm->scheduler().isStarted() );
    ASSERT_TRUE( T->fetcher->waitForFetches( 3, std::chrono::seconds{ 10 } ) );
    T->fm->stop();
    ASSERT_FALSE( T->fm->scheduler().isStarted() );

    /* The entry was only notified once */
    ASSERT_EQ( 1u, T->mailer->nbMails() );
    auto counts = T->policy->failCounts();
    ASSERT_GE( counts.size(), 2u );
    for ( auto c : counts )
        ASSERT_EQ( 0u, c );
}

static void NoOverlap( SchedulerTests* T )
{
    auto key = groupKey( { Url } );
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url } ) ) );
    T->fetcher->block();

    PollResult first;
    std::thread t( [T, key, &first]() {
        first = T->fm->pollNow( key );
    });
    ASSERT_TRUE( T->fetcher->waitForBlocked( std::chrono::seconds{ 5 } ) );
    ASSERT_TRUE( T->fm->poller().isPolling( key ) );

    auto second = T->fm->pollNow( key );
    T->fetcher->release();
    t.join();

    ASSERT_EQ( PollResult::Status::Skipped, second.status );
    ASSERT_EQ( PollResult::Status::Success, first.status );
    ASSERT_EQ( 1u, first.nbNotified );
    ASSERT_EQ( 1u, T->fetcher->nbFetches() );
    ASSERT_FALSE( T->fm->poller().isPolling( key ) );
}

static void ConcurrentGroups( SchedulerTests* T )
{
    auto key = groupKey( { Url } );
    auto otherKey = groupKey( { OtherUrl } );
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    T->fetcher->setFeed( OtherUrl, Tests::feed( "Other", { Tests::entry( "b", "B" ) } ) );
    auto c = Tests::config( { Url } );
    c.feeds.push_back( Tests::config( { OtherUrl } ).feeds[0] );
    ASSERT_TRUE( T->fm->setConfig( c ) );
    T->fetcher->block();
    T->fm->start();

    /* Both groups get fetched while neither poll could complete */
    ASSERT_TRUE( T->fetcher->waitForFetches( 2, std::chrono::seconds{ 5 } ) );
    ASSERT_TRUE( T->fm->poller().isPolling( key ) );
    ASSERT_TRUE( T->fm->poller().isPolling( otherKey ) );
    T->fetcher->release();
    ASSERT_TRUE( T->mailer->waitForMails( 2, std::chrono::seconds{ 5 } ) );
    T->fm->stop();
    ASSERT_TRUE( T->fm->failures().empty() );
}

static void Backoff( SchedulerTests* T )
{
    auto key = groupKey( { Url } );
    T->fetcher->setError( Url, "connection timed out" );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 1 } ) ) );
    T->fm->start();
    ASSERT_TRUE( T->policy->waitForCalls( 1, std::chrono::seconds{ 5 } ) );
    /* The failing group got pushed back by the policy */
    for ( auto i = 0; i < 50 && T->fm->scheduler().dueIn( key ).count() < 60; ++i )
        std::this_thread::sleep_for( std::chrono::milliseconds{ 10 } );
    ASSERT_GE( T->fm->scheduler().dueIn( key ).count(), 3500 );
    T->fm->stop();

    auto counts = T->policy->failCounts();
    ASSERT_EQ( 1u, counts.size() );
    ASSERT_EQ( 1u, counts[0] );
    ASSERT_EQ( 1u, T->fetcher->nbFetches() );
}

static void StopKeepsTimers( SchedulerTests* T )
{
    auto key = groupKey( { Url } );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 3600 } ) ) );
    T->fm->start();
    T->fm->stop();
    ASSERT_TRUE( T->fetcher->isStopped() );
    ASSERT_TRUE( T->fm->scheduler().isScheduled( key ) );
    ASSERT_EQ( 3600, T->fm->scheduler().interval( key ).count() );
}

static void StopCancelsPoll( SchedulerTests* T )
{
    auto key = groupKey( { Url } );
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    /* Checked just now, so the scheduler leaves it alone for an hour */
    FeedGroup::createIfMissing( T->fm.get(), key, utils::date::now() );
    ASSERT_TRUE( T->fm->setConfig( withInterval( { Url }, std::chrono::seconds{ 3600 } ) ) );
    T->fetcher->block();
    T->fm->start();

    PollResult res;
    std::thread t( [T, key, &res]() {
        res = T->fm->pollNow( key );
    });
    ASSERT_TRUE( T->fetcher->waitForBlocked( std::chrono::seconds{ 5 } ) );
    T->fm->stop();
    t.join();

    ASSERT_EQ( PollResult::Status::Cancelled, res.status );
    ASSERT_TRUE( T->fm->failures().empty() );
    ASSERT_EQ( 0u, T->mailer->nbMails() );
    ASSERT_FALSE( T->fm->poller().isPolling( key ) );
}

static void Pool( SchedulerTests* )
{
    WorkerPool pool{ 0 };
    ASSERT_EQ( 1u, pool.nbWorkers() );
    ASSERT_FALSE( pool.schedule( []() {} ) );

    pool.start();
    std::mutex mutex;
    std::condition_variable cond;
    std::vector<int> done;
    for ( auto i = 0; i < 5; ++i )
    {
        ASSERT_TRUE( pool.schedule( [i, &mutex, &cond, &done]() {
            std::lock_guard<std::mutex> lock( mutex );
            done.push_back( i );
            cond.notify_all();
        }));
    }
    /* A throwing task doesn't kill its worker */
    ASSERT_TRUE( pool.schedule( []() { throw std::runtime_error( "boom" ); } ) );
    ASSERT_TRUE( pool.schedule( [&mutex, &cond, &done]() {
        std::lock_guard<std::mutex> lock( mutex );
        done.push_back( 5 );
        cond.notify_all();
    }));
    {
        std::unique_lock<std::mutex> lock( mutex );
        ASSERT_TRUE( cond.wait_for( lock, std::chrono::seconds{ 5 }, [&done]() {
            return done.size() == 6;
        }));
    }
    ASSERT_EQ( ( std::vector<int>{ 0, 1, 2, 3, 4, 5 } ), done );
    pool.stop();
    ASSERT_FALSE( pool.schedule( []() {} ) );
    ASSERT_EQ( 0u, pool.nbPending() );
}

int main( int ac, char** av )
{
    INIT_TESTS_C( SchedulerTests );

    ADD_TEST( Reconcile );
    ADD_TEST( IntervalChange );
    ADD_TEST( HonoursLastCheck );
    ADD_TEST( PeriodicPolls );
    ADD_TEST( NoOverlap );
    ADD_TEST( ConcurrentGroups );
    ADD_TEST( Backoff );
    ADD_TEST( StopKeepsTimers );
    ADD_TEST( StopCancelsPoll );
    ADD_TEST( Pool );

    END_TESTS;
}
