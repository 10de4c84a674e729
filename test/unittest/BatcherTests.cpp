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

#include "poll/Batcher.h"
#include "poll/MailDispatcher.h"

static const std::string Url = "https://example.org/feed.xml";

static std::vector<Entry> entries( uint32_t nb )
{
    std::vector<Entry> res;
    for ( auto i = 0u; i < nb; ++i )
        res.push_back( Tests::entry( std::to_string( i ), "Entry " + std::to_string( i ) ) );
    return res;
}

static PollResult pollWith( Tests* T, uint32_t nbEntries, bool digest, uint32_t cap )
{
    auto s = Tests::settings();
    s.digest = digest;
    s.maxMailsPerCheck = cap;
    T->fetcher->setFeed( Url, Tests::feed( "Feed", entries( nbEntries ) ) );
    if ( T->fm->setConfig( Tests::config( { Url }, s ) ) == false )
        FAIL_TEST_MSG( "Configuration rejected" );
    return T->fm->pollNow( groupKey( { Url } ) );
}

static void Plan( Tests* )
{
    using D = poll::Batcher::Delivery;
    ASSERT_EQ( D::None, poll::Batcher::plan( 0, false, 5 ) );
    ASSERT_EQ( D::None, poll::Batcher::plan( 0, true, 5 ) );
    ASSERT_EQ( D::PerItem, poll::Batcher::plan( 1, false, 5 ) );
    ASSERT_EQ( D::PerItem, poll::Batcher::plan( 5, false, 5 ) );
    ASSERT_EQ( D::Digest, poll::Batcher::plan( 6, false, 5 ) );
    ASSERT_EQ( D::Digest, poll::Batcher::plan( 1, true, 5 ) );
    ASSERT_EQ( D::Digest, poll::Batcher::plan( 1, false, 0 ) );
}

static void PerItemUnderCap( Tests* T )
{
    auto res = pollWith( T, 5, false, 5 );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( 5u, res.nbMails );
    auto mails = T->mailer->mails();
    ASSERT_EQ( 5u, mails.size() );
    ASSERT_EQ( "Entry 0", mails[0].subject );
    ASSERT_EQ( "https://example.org/0", mails[0].body );
    ASSERT_EQ( "feeds@example.org", mails[0].from );
    ASSERT_EQ( 1u, mails[0].to.size() );
    ASSERT_EQ( "reader@example.org", mails[0].to[0] );
}

static void DigestOverCap( Tests* T )
{
    auto res = pollWith( T, 6, false, 5 );
    ASSERT_EQ( 1u, res.nbMails );
    ASSERT_EQ( 6u, res.nbNotified );
    auto mails = T->mailer->mails();
    ASSERT_EQ( 1u, mails.size() );
    ASSERT_EQ( "6 new items", mails[0].subject );
    ASSERT_EQ( "Entry 0, Entry 1, Entry 2, Entry 3, Entry 4, Entry 5", mails[0].body );
}

static void DigestEnabled( Tests* T )
{
    auto res = pollWith( T, 1, true, 5 );
    ASSERT_EQ( 1u, res.nbMails );
    ASSERT_EQ( "1 new items", T->mailer->mails()[0].subject );
}

static void NothingNew( Tests* T )
{
    auto res = pollWith( T, 0, true, 5 );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( 0u, res.nbMails );
    ASSERT_EQ( 0u, T->mailer->nbMails() );

    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( groupKey( { Url } ), state ) );
    ASSERT_TRUE( state.lastCheck > 0 );
    ASSERT_EQ( 0, state.lastUpdate );
}

static void LastUpdate( Tests* T )
{
    pollWith( T, 2, false, 5 );
    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( groupKey( { Url } ), state ) );
    ASSERT_TRUE( state.lastUpdate > 0 );
    ASSERT_EQ( state.lastCheck, state.lastUpdate );
}

static void NoRecipients( Tests* T )
{
    auto s = Tests::settings();
    s.to.clear();
    T->fetcher->setFeed( Url, Tests::feed( "Feed", entries( 2 ) ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url }, s ) ) );
    auto key = groupKey( { Url } );
    auto res = T->fm->pollNow( key );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( 2u, res.nbNotified );
    ASSERT_EQ( 0u, res.nbMails );
    ASSERT_EQ( 0u, T->mailer->nbAttempts() );

    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( key, state ) );
    ASSERT_TRUE( state.lastUpdate > 0 );
    ASSERT_EQ( 2u, T->fm->nbItems( key ) );
}

static void SortByLastModified( Tests* T )
{
    auto s = Tests::settings();
    s.sortByLastModified = true;
    auto old = Tests::entry( "old", "Old" );
    old.published = 1000;
    auto updated = Tests::entry( "updated", "Updated" );
    updated.published = 500;
    updated.updated = 3000;
    auto recent = Tests::entry( "recent", "Recent" );
    recent.published = 2000;
    T->fetcher->setFeed( Url, Tests::feed( "Feed", { old, updated, recent } ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url }, s ) ) );
    T->fm->pollNow( groupKey( { Url } ) );
    auto mails = T->mailer->mails();
    ASSERT_EQ( 3u, mails.size() );
    ASSERT_EQ( "Updated", mails[0].subject );
    ASSERT_EQ( "Recent", mails[1].subject );
    ASSERT_EQ( "Old", mails[2].subject );
}

static void TemplateArguments( Tests* T )
{
    auto s = Tests::settings();
    s.itemSubject = "[{{ args.prefix }}] {{ item.title }}";
    s.templateArgs["prefix"] = "news";
    T->fetcher->setFeed( Url, Tests::feed( "Feed", entries( 1 ) ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url }, s ) ) );
    T->fm->pollNow( groupKey( { Url } ) );
    ASSERT_EQ( "[news] Entry 0", T->mailer->mails()[0].subject );
}

static void RenderFailure( Tests* T )
{
    auto s = Tests::settings();
    s.itemSubject = "{{ args.undefined }}";
    T->fetcher->setFeed( Url, Tests::feed( "Feed", entries( 1 ) ) );
    ASSERT_TRUE( T->fm->setConfig( Tests::config( { Url }, s ) ) );
    auto key = groupKey( { Url } );
    auto res = T->fm->pollNow( key );
    ASSERT_EQ( PollResult::Status::Failed, res.status );
    ASSERT_EQ( 0u, T->mailer->nbMails() );
    /* Nothing was committed, the entry will be retried */
    ASSERT_EQ( 0u, T->fm->nbItems( key ) );
    ASSERT_EQ( 1u, T->fm->failures().size() );
}

static void SendRetry( Tests* T )
{
    T->mailer->failNext( 2 );
    auto res = pollWith( T, 1, false, 5 );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( 1u, T->mailer->nbMails() );
    ASSERT_EQ( 3u, T->mailer->nbAttempts() );
}

static void SendFailure( Tests* T )
{
    T->mailer->failNext( 3 );
    auto res = pollWith( T, 1, false, 5 );
    auto key = groupKey( { Url } );
    ASSERT_EQ( PollResult::Status::Failed, res.status );
    ASSERT_EQ( 3u, T->mailer->nbAttempts() );
    ASSERT_EQ( 0u, T->fm->nbItems( key ) );
    auto failures = T->fm->failures();
    ASSERT_EQ( 1u, failures.size() );
    ASSERT_EQ( 1u, failures[0].failCount );

    FeedGroupState state;
    ASSERT_TRUE( T->fm->feedGroup( key, state ) );
    ASSERT_EQ( 0, state.lastUpdate );

    /* The entry is notified by the next successful poll */
    res = T->fm->pollNow( key );
    ASSERT_EQ( PollResult::Status::Success, res.status );
    ASSERT_EQ( 1u, res.nbMails );
    ASSERT_EQ( 0u, T->fm->failures().size() );
}

static void ManyRetries( Tests* T )
{
    poll::MailDispatcher dispatcher{ T->mailer, 40, std::chrono::milliseconds{ 0 } };
    Mail mail;
    mail.subject = "subject";
    mail.to = { "someone@example.org" };
    T->mailer->failNext( 39 );
    dispatcher.send( mail );
    ASSERT_EQ( 40u, T->mailer->nbAttempts() );
    ASSERT_EQ( 1u, T->mailer->nbMails() );

    T->mailer->failNext( 40 );
    ASSERT_THROW( dispatcher.send( mail ), errors::SendError );

    /* The exponential delay stops growing past a few attempts */
    poll::MailDispatcher slow{ T->mailer, 40, std::chrono::milliseconds{ 10 } };
    ASSERT_EQ( 20, slow.retryDelay( 1 ).count() );
    ASSERT_EQ( 80, slow.retryDelay( 3 ).count() );
    auto ceiling = slow.retryDelay( poll::MailDispatcher::MaxBackoffShift ).count();
    ASSERT_EQ( 10 << poll::MailDispatcher::MaxBackoffShift, ceiling );
    ASSERT_EQ( ceiling, slow.retryDelay( 39 ).count() );
    ASSERT_EQ( ceiling, slow.retryDelay( 1000 ).count() );
}

int main( int ac, char** av )
{
    INIT_TESTS(Batcher);

    ADD_TEST( Plan );
    ADD_TEST( PerItemUnderCap );
    ADD_TEST( DigestOverCap );
    ADD_TEST( DigestEnabled );
    ADD_TEST( NothingNew );
    ADD_TEST( LastUpdate );
    ADD_TEST( NoRecipients );
    ADD_TEST( SortByLastModified );
    ADD_TEST( TemplateArguments );
    ADD_TEST( RenderFailure );
    ADD_TEST( SendRetry );
    ADD_TEST( SendFailure );
    ADD_TEST( ManyRetries );

    END_TESTS;
}
