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

#include "DatabaseSettings.h"
#include "Failure.h"
#include "FeedGroup.h"
#include "FeedItem.h"
#include "database/SqliteTools.h"
#include "utils/XxHasher.h"

static const std::string Url = "https://example.org/feed.xml";

static Hash fp( const std::string& s )
{
    return utils::hash::xxFromBuff( s.data(), s.size() );
}

static void Schema( Tests* T )
{
    auto tables = sqlite::Tools::listTables( T->fm->getConn() );
    ASSERT_EQ( 4u, tables.size() );
    ASSERT_TRUE( FeedGroup::checkDbModel( T->fm.get() ) );
    ASSERT_TRUE( FeedItem::checkDbModel( T->fm.get() ) );
    ASSERT_TRUE( Failure::checkDbModel( T->fm.get() ) );
}

static void Reopen( Tests* T )
{
    auto key = groupKey( { Url } );
    FeedGroup::createIfMissing( T->fm.get(), key, 1234 );
    FeedItem::upsert( T->fm.get(), key, fp( "a" ), 1234 );

    auto cfg = T->fm->setupConfig();
    T->fm.reset();
    T->InstantiateFeedMailer( cfg );
    T->Initialize();
    ASSERT_EQ( InitializeResult::AlreadyInitialized, T->fm->initialize() );

    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( key, state ) );
    ASSERT_EQ( 1234, state.lastCheck );
    ASSERT_EQ( 1u, T->fm->nbItems( key ) );
}

static void GroupState( Tests* T )
{
    auto key = groupKey( { Url } );
    FeedGroupState state;
    ASSERT_FALSE( T->fm->feedGroup( key, state ) );

    FeedGroup::createIfMissing( T->fm.get(), key, 100 );
    FeedGroup::createIfMissing( T->fm.get(), key, 200 );
    ASSERT_EQ( 1, FeedGroup::count( T->fm.get() ) );
    auto g = FeedGroup::fetch( T->fm.get(), key );
    ASSERT_NON_NULL( g );
    ASSERT_EQ( key, g->key() );
    ASSERT_EQ( 100, g->lastCheck() );
    ASSERT_EQ( 0, g->lastUpdate() );
    ASSERT_EQ( 100, g->lastSeen() );

    FeedGroup::setLastCheck( T->fm.get(), key, 300 );
    FeedGroup::setLastUpdate( T->fm.get(), key, 250 );
    FeedGroup::touch( T->fm.get(), { key }, 400 );
    g = FeedGroup::fetch( T->fm.get(), key );
    ASSERT_EQ( 300, g->lastCheck() );
    ASSERT_EQ( 250, g->lastUpdate() );
    ASSERT_EQ( 400, g->lastSeen() );
}

static void Items( Tests* T )
{
    auto key = groupKey( { Url } );
    auto other = groupKey( { "https://other.org/" } );
    FeedGroup::createIfMissing( T->fm.get(), key, 100 );
    FeedGroup::createIfMissing( T->fm.get(), other, 100 );

    FeedItem::upsert( T->fm.get(), key, fp( "a" ), 100 );
    FeedItem::upsert( T->fm.get(), key, fp( "b" ), 100 );
    FeedItem::upsert( T->fm.get(), key, fp( "a" ), 200 );
    FeedItem::upsert( T->fm.get(), other, fp( "a" ), 100 );
    ASSERT_EQ( 2u, FeedItem::count( T->fm.get(), key ) );
    ASSERT_EQ( 1u, FeedItem::count( T->fm.get(), other ) );

    auto known = FeedItem::fingerprints( T->fm.get(), key );
    ASSERT_EQ( 2u, known.size() );
    ASSERT_TRUE( known.count( fp( "a" ) ) == 1 );
    ASSERT_TRUE( known.count( fp( "c" ) ) == 0 );

    for ( const auto& i : FeedItem::fromGroup( T->fm.get(), key ) )
    {
        ASSERT_EQ( key, i->groupKey() );
        ASSERT_EQ( i->fingerprint() == fp( "a" ) ? 200 : 100, i->lastSeen() );
    }
}

static void ItemsRequireGroup( Tests* T )
{
    ASSERT_THROW( FeedItem::upsert( T->fm.get(), groupKey( { Url } ), fp( "a" ), 100 ),
                  sqlite::errors::ConstraintForeignKey );
}

static void CascadeDelete( Tests* T )
{
    auto key = groupKey( { Url } );
    FeedGroup::createIfMissing( T->fm.get(), key, 100 );
    FeedItem::upsert( T->fm.get(), key, fp( "a" ), 100 );
    FeedItem::upsert( T->fm.get(), key, fp( "b" ), 100 );
    ASSERT_TRUE( FeedGroup::destroy( T->fm.get(), key ) );
    ASSERT_EQ( 0u, FeedItem::count( T->fm.get(), key ) );
    ASSERT_EQ( 0, FeedItem::count( T->fm.get() ) );
}

static void FailureRecord( Tests* T )
{
    auto key = groupKey( { Url } );
    ASSERT_EQ( nullptr, Failure::fetch( T->fm.get(), key ) );
    Failure::record( T->fm.get(), key, "timeout" );
    auto f = Failure::fetch( T->fm.get(), key );
    ASSERT_NON_NULL( f );
    ASSERT_EQ( 1u, f->failCount() );
    ASSERT_EQ( "timeout", f->error() );

    Failure::record( T->fm.get(), key, "connection refused" );
    f = Failure::fetch( T->fm.get(), key );
    ASSERT_EQ( 2u, f->failCount() );
    ASSERT_EQ( "connection refused", f->error() );

    Failure::clear( T->fm.get(), key );
    ASSERT_EQ( nullptr, Failure::fetch( T->fm.get(), key ) );
    Failure::record( T->fm.get(), key, "again" );
    ASSERT_EQ( 1u, Failure::fetch( T->fm.get(), key )->failCount() );
}

static void ListFailing( Tests* T )
{
    auto k1 = groupKey( { "https://a.org/" } );
    auto k2 = groupKey( { "https://b.org/" } );
    auto k3 = groupKey( { "https://c.org/" } );
    Failure::record( T->fm.get(), k1, "e" );
    for ( auto i = 0; i < 3; ++i )
        Failure::record( T->fm.get(), k2, "e" );
    for ( auto i = 0; i < 2; ++i )
        Failure::record( T->fm.get(), k3, "e" );
    auto failing = Failure::listFailing( T->fm.get(), 2 );
    ASSERT_EQ( 2u, failing.size() );
    ASSERT_TRUE( failing[0]->groupKey() < failing[1]->groupKey() );
    for ( const auto& f : failing )
        ASSERT_NE( k1, f->groupKey() );
    ASSERT_EQ( 3u, Failure::listFailing( T->fm.get(), 1 ).size() );
}

static void FailureReset( Tests* T )
{
    auto key = groupKey( { Url } );
    T->fetcher->setError( Url, "503 Service Unavailable" );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url } ) ) );
    for ( auto i = 1u; i <= 3; ++i )
    {
        auto res = T->fm->pollNow( key );
        ASSERT_EQ( PollResult::Status::Failed, res.status );
        auto failures = T->fm->failures();
        ASSERT_EQ( 1u, failures.size() );
        ASSERT_EQ( i, failures[0].failCount );
        ASSERT_EQ( key, failures[0].key );
    }
    ASSERT_TRUE( T->fm->failures()[0].error.find( "503" ) != std::string::npos );

    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( key, state ) );
    ASSERT_TRUE( state.lastCheck > 0 );
    ASSERT_EQ( 0, state.lastUpdate );

    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    auto res = T->fm->pollNow( key );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( nullptr, Failure::fetch( T->fm.get(), key ) );
    ASSERT_EQ( 0u, T->fm->failures().size() );
}

static void FailureKeepsItems( Tests* T )
{
    auto key = groupKey( { Url } );
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { Tests::entry( "a", "A" ) } ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url } ) ) );
    T->fm->pollNow( key );
    FeedGroupState before;
    ASSERT_TRUE( T->fm->feedGroup( key, before ) );

    T->fetcher->setError( Url, "DNS failure" );
    ASSERT_EQ( PollResult::Status::Failed, T->fm->pollNow( key ).status );
    FeedGroupState after;
    ASSERT_TRUE( T->fm->feedGroup( key, after ) );
    ASSERT_EQ( before.lastUpdate, after.lastUpdate );
    ASSERT_EQ( 1u, T->fm->nbItems( key ) );
}

static void UnknownGroup( Tests* T )
{
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url } ) ) );
    auto res = T->fm->pollNow( groupKey( { "https://unknown.org/" } ) );
    ASSERT_EQ( PollResult::Status::Unknown, res.status );
    ASSERT_EQ( 0u, T->fetcher->nbFetches() );
    ASSERT_EQ( 0, FeedGroup::count( T->fm.get() ) );
}

int main( int ac, char** av )
{
    INIT_TESTS(Persistence);

    ADD_TEST( Schema );
    ADD_TEST( Reopen );
    ADD_TEST( GroupState );
    ADD_TEST( Items );
    ADD_TEST( ItemsRequireGroup );
    ADD_TEST( CascadeDelete );
    ADD_TEST( FailureRecord );
    ADD_TEST( ListFailing );
    ADD_TEST( FailureReset );
    ADD_TEST( FailureKeepsItems );
    ADD_TEST( UnknownGroup );

    END_TESTS;
}
