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

#include "common/Tests.h"
#include "common/util.h"

#include "FeedMailerTester.h"
#include "mocks/MockEvaluator.h"
#include "mocks/MockFetcher.h"
#include "mocks/MockMailer.h"

#include <chrono>
#include <cstdio>
#include <thread>

struct UnitTests
{
    std::unique_ptr<FeedMailerTester> fm;
    std::shared_ptr<mock::Fetcher> fetcher;
    std::shared_ptr<mock::Evaluator> evaluator;
    std::shared_ptr<mock::Mailer> mailer;

    UnitTests() = default;
    virtual ~UnitTests() = default;

    virtual void SetUp( const std::string& testSuite, const std::string& testName )
    {
        m_testDir = getTempPath( testSuite + "." + testName );
        removeDir( m_testDir );
        ASSERT_TRUE( makeDir( m_testDir ) );
        fetcher = std::make_shared<mock::Fetcher>();
        evaluator = std::make_shared<mock::Evaluator>();
        mailer = std::make_shared<mock::Mailer>();

        SetupConfig cfg;
        cfg.fetcher = fetcher;
        cfg.evaluator = evaluator;
        cfg.mailer = mailer;
        cfg.logLevel = LogLevel::Debug;
        cfg.mailFrom = "feeds@example.org";
        cfg.mailRetryDelay = std::chrono::milliseconds{ 1 };
        /* Tests run the maintenance by hand */
        cfg.maintenanceInterval = std::chrono::seconds{ 0 };
        TestSpecificSetup( cfg );
        InstantiateFeedMailer( cfg );
        Initialize();
    }

    virtual void TestSpecificSetup( SetupConfig& )
    {
    }

    virtual void InstantiateFeedMailer( const SetupConfig& cfg )
    {
        fm.reset( new FeedMailerTester( getDbPath(), cfg ) );
    }

    virtual void Initialize()
    {
        auto res = fm->initialize();
        ASSERT_EQ( InitializeResult::Success, res );
    }

    virtual void TearDown()
    {
        fm.reset();
        ASSERT_TRUE( removeDir( m_testDir ) );
    }

    std::string getDbPath() const
    {
        return m_testDir + "test.db";
    }

    std::string testDir() const
    {
        return m_testDir;
    }

    /*
     * Helpers to build configurations & feeds
     */
    static Entry entry( const std::string& id, const std::string& title,
                        const std::string& summary = {} )
    {
        Entry e;
        e.id = id;
        e.title = title;
        e.summary = summary;
        e.link = "https://example.org/" + id;
        return e;
    }

    static Feed feed( const std::string& title, std::vector<Entry> entries )
    {
        Feed f;
        f.title = title;
        f.entries = std::move( entries );
        return f;
    }

    static Settings settings()
    {
        Settings s;
        s.to = { "reader@example.org" };
        s.itemSubject = "{{ item.title }}";
        s.itemBody = "{{ item.link }}";
        s.digestSubject = "{{ items|length }} new items";
        s.digestBody = "{{ items.title }}";
        return s;
    }

    static Config config( const std::vector<std::string>& urls,
                          const Settings& s = settings(),
                          std::shared_ptr<const FilterNode> filter = nullptr )
    {
        FeedGroupConfig g;
        g.urls = urls;
        g.settings = s;
        g.filter = std::move( filter );
        Config c;
        c.feeds.push_back( std::move( g ) );
        return c;
    }

private:
    std::string m_testDir;
};

using Tests = UnitTests;

#define INIT_TESTS_COMMON(TestClass, TestSuite) \
    if ( ac != 2 ) { fprintf(stderr, "Missing test name\n" ); return 1; } \
    const char* selectedTest = av[1]; \
    auto t = std::unique_ptr<TestClass>( new TestClass ); \
    auto testSuite = #TestSuite;

#define INIT_TESTS(TestSuite) INIT_TESTS_COMMON(Tests, TestSuite)
#define INIT_TESTS_C(TestClass) INIT_TESTS_COMMON( TestClass, TestClass )

#define ADD_TEST( func ) \
    do { \
        if ( strcmp( #func, selectedTest ) == 0 ) { \
            try { \
                t->SetUp( testSuite, selectedTest ); \
                func( t.get() ); \
                t->TearDown(); \
                return 0; \
            } catch ( const TestFailed& tf ) { \
                fprintf(stderr, "Test %s failed: %s\n", #func, tf.what() ); \
            } \
        } \
    } while ( 0 )

#define END_TESTS \
    return 1;
