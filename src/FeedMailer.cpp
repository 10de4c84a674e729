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

#include "FeedMailer.h"

#include "Failure.h"
#include "FailureReporter.h"
#include "FeedGroup.h"
#include "FeedItem.h"
#include "Pruner.h"
#include "config/ConfigLoader.h"
#include "database/SqliteConnection.h"
#include "database/SqliteErrors.h"
#include "database/SqliteTransaction.h"
#include "feedmailer/Errors.h"
#include "logging/Logger.h"
#include "poll/GroupPoller.h"
#include "poll/MailDispatcher.h"
#include "utils/Date.h"

namespace feedmailer
{

FeedMailer::FeedMailer( const std::string& dbPath, const SetupConfig& cfg )
    : m_setup( cfg )
    , m_dbPath( dbPath )
    , m_settings( this )
    , m_configStore( cfg.evaluator )
    , m_initialized( false )
    , m_configPath( cfg.configPath )
    , m_configMtime( 0 )
{
    if ( m_setup.logger != nullptr )
        Log::SetLogger( m_setup.logger );
    Log::setLogLevel( m_setup.logLevel );

    m_dispatcher.reset( new poll::MailDispatcher( m_setup.mailer, m_setup.mailRetries,
                                                  m_setup.mailRetryDelay ) );
    m_poller.reset( new poll::GroupPoller( this, m_setup.fetcher, m_setup.evaluator,
                                           *m_dispatcher, m_setup.mailFrom ) );
    m_failureReporter.reset( new FailureReporter( this, *m_dispatcher,
                                                  m_setup.mailFrom ) );
    m_scheduler.reset( new Scheduler( this, m_setup.nbWorkers, m_setup.maxJitter,
                                      m_setup.maintenanceInterval ) );
}

FeedMailer::~FeedMailer()
{
    stop();
}

InitializeResult FeedMailer::initialize()
{
    std::lock_guard<std::mutex> lock( m_mutex );
    if ( m_initialized == true )
        return InitializeResult::AlreadyInitialized;

    LOG_INFO( "Initializing feedmailer. Database model is ",
              DatabaseSettings::DbModelVersion );
    try
    {
        m_dbConnection = sqlite::Connection::connect( m_dbPath );
        auto t = m_dbConnection->newTransaction();
        DatabaseSettings::createTable( m_dbConnection.get() );
        if ( m_settings.load() == false )
        {
            LOG_ERROR( "Failed to load settings" );
            return InitializeResult::Failed;
        }
        auto dbModel = m_settings.dbModelVersion();
        if ( dbModel == 0 )
        {
            createAllTables();
            t->commit();
        }
        else
        {
            t->commit();
            if ( dbModel != DatabaseSettings::DbModelVersion )
            {
                LOG_ERROR( "Unsupported database model version ", dbModel );
                return InitializeResult::Failed;
            }
            if ( checkDbModel() == false )
            {
                LOG_ERROR( "Database schema doesn't match model version ", dbModel );
                return InitializeResult::Failed;
            }
        }
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_ERROR( "Can't initialize feedmailer: ", ex.what() );
        return InitializeResult::Failed;
    }

    if ( m_configPath.empty() == false )
    {
        std::lock_guard<std::mutex> configLock( m_configMutex );
        if ( loadConfigFileLocked( m_configPath ) == false )
        {
            LOG_ERROR( "Failed to load the initial configuration" );
            return InitializeResult::Failed;
        }
    }
    m_initialized = true;
    LOG_INFO( "Successfully initialized" );
    return InitializeResult::Success;
}

void FeedMailer::createAllTables()
{
    auto dbConn = m_dbConnection.get();
    FeedGroup::createTable( dbConn );
    FeedItem::createTable( dbConn );
    FeedItem::createIndexes( dbConn );
    Failure::createTable( dbConn );
}

bool FeedMailer::checkDbModel()
{
    if ( m_dbConnection->checkSchemaIntegrity() == false )
        return false;
    return FeedGroup::checkDbModel( this ) &&
           FeedItem::checkDbModel( this ) &&
           Failure::checkDbModel( this );
}

bool FeedMailer::setConfig( Config config )
{
    if ( m_initialized == false )
    {
        LOG_ERROR( "Can't set a configuration before initializing" );
        return false;
    }
    std::lock_guard<std::mutex> lock( m_configMutex );
    return install( config );
}

bool FeedMailer::loadConfigFile( const std::string& path )
{
    if ( m_initialized == false )
    {
        LOG_ERROR( "Can't load a configuration before initializing" );
        return false;
    }
    std::lock_guard<std::mutex> lock( m_configMutex );
    return loadConfigFileLocked( path );
}

bool FeedMailer::install( const Config& config )
{
    std::shared_ptr<const ConfigSnapshot> snapshot;
    try
    {
        snapshot = m_configStore.install( config );
    }
    catch ( const errors::ConfigError& ex )
    {
        LOG_ERROR( "Rejecting configuration, keeping the previous one: ", ex.what() );
        return false;
    }
    m_scheduler->reconcile( *snapshot );
    return true;
}

bool FeedMailer::loadConfigFileLocked( const std::string& path )
{
    /*
     * Remember the file even if it's invalid, so it gets reloaded once it is
     * fixed, and not before.
     */
    m_configPath = path;
    m_configMtime = ConfigLoader::modificationTime( path );
    LOG_INFO( "Loading configuration from ", path );
    Config config;
    try
    {
        config = ConfigLoader::fromFile( path );
    }
    catch ( const errors::ConfigError& ex )
    {
        LOG_ERROR( "Failed to load ", path, ": ", ex.what() );
        return false;
    }
    return install( config );
}

void FeedMailer::reloadConfigFileIfChanged()
{
    std::lock_guard<std::mutex> lock( m_configMutex );
    if ( m_configPath.empty() == true )
        return;
    auto mtime = ConfigLoader::modificationTime( m_configPath );
    if ( mtime == m_configMtime )
        return;
    LOG_INFO( "Configuration file ", m_configPath, " changed" );
    loadConfigFileLocked( m_configPath );
}

uint64_t FeedMailer::configGeneration() const
{
    return m_configStore.generation();
}

std::vector<GroupKey> FeedMailer::groupKeys() const
{
    std::vector<GroupKey> keys;
    auto snapshot = m_configStore.snapshot();
    if ( snapshot == nullptr )
        return keys;
    keys.reserve( snapshot->groups.size() );
    for ( const auto& g : snapshot->groups )
        keys.push_back( g->key );
    return keys;
}

bool FeedMailer::start()
{
    if ( m_initialized == false )
    {
        LOG_ERROR( "Can't start before initializing" );
        return false;
    }
    m_dispatcher->resume();
    m_scheduler->start();
    return true;
}

void FeedMailer::stop()
{
    if ( m_scheduler->isStarted() == false )
        return;
    LOG_INFO( "Stopping feedmailer" );
    m_poller->interrupt();
    m_setup.fetcher->stop();
    m_dispatcher->interrupt();
    m_scheduler->stop();
}

PollResult FeedMailer::pollNow( const GroupKey& key )
{
    PollResult res;
    if ( m_initialized == false )
    {
        res.status = PollResult::Status::Failed;
        res.error = "Not initialized";
        return res;
    }
    /* Holding the snapshot keeps the whole poll on a single configuration */
    auto snapshot = m_configStore.snapshot();
    auto group = snapshot != nullptr ? snapshot->group( key ) : nullptr;
    if ( group == nullptr )
    {
        LOG_WARN( "Group ", key.toString(), " isn't configured" );
        return res;
    }
    return m_poller->poll( *group );
}

void FeedMailer::runMaintenance()
{
    if ( m_initialized == false )
        return;
    std::lock_guard<std::mutex> lock( m_maintenanceMutex );
    LOG_DEBUG( "Running maintenance" );
    reloadConfigFileIfChanged();
    auto snapshot = m_configStore.snapshot();
    if ( snapshot == nullptr )
        return;
    try
    {
        auto res = Pruner::sweep( this, *snapshot, utils::date::now(),
                                  m_setup.groupRetention );
        if ( res.nbGroups > 0 || res.nbFailures > 0 )
            LOG_INFO( "Pruned ", res.nbGroups, " group(s) and ", res.nbFailures,
                      " failure(s)" );
        m_poller->retain( *snapshot );
        m_failureReporter->sweep( *snapshot );
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_ERROR( "Maintenance failed: ", ex.what() );
    }
}

void FeedMailer::setVerbosity( LogLevel v )
{
    Log::setLogLevel( v );
}

bool FeedMailer::feedGroup( const GroupKey& key, FeedGroupState& state ) const
{
    auto g = FeedGroup::fetch( this, key );
    if ( g == nullptr )
        return false;
    state.key = g->key();
    state.lastCheck = g->lastCheck();
    state.lastUpdate = g->lastUpdate();
    state.lastSeen = g->lastSeen();
    return true;
}

std::vector<FailureState> FeedMailer::failures() const
{
    std::vector<FailureState> res;
    for ( const auto& f : Failure::fetchAll( this ) )
        res.push_back( FailureState{ f->groupKey(), f->failCount(), f->error() } );
    return res;
}

uint32_t FeedMailer::nbItems( const GroupKey& key ) const
{
    return FeedItem::count( this, key );
}

sqlite::Connection* FeedMailer::getConn() const
{
    return m_dbConnection.get();
}

const SetupConfig& FeedMailer::setupConfig() const
{
    return m_setup;
}

void FeedMailer::onPoll( const GroupKey& key )
{
    pollNow( key );
}

void FeedMailer::onMaintenance()
{
    runMaintenance();
}

std::chrono::seconds FeedMailer::nextDelay( const GroupKey& key,
                                            std::chrono::seconds interval )
{
    if ( m_setup.backoffPolicy == nullptr )
        return interval;
    uint32_t failCount = 0;
    try
    {
        auto f = Failure::fetch( this, key );
        if ( f != nullptr )
            failCount = f->failCount();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_WARN( "Failed to fetch the failure count of ", key.toString(), ": ",
                  ex.what() );
    }
    return m_setup.backoffPolicy->nextDelay( interval, failCount );
}

int64_t FeedMailer::lastCheck( const GroupKey& key )
{
    try
    {
        auto g = FeedGroup::fetch( this, key );
        if ( g != nullptr )
            return g->lastCheck();
    }
    catch ( const sqlite::errors::Exception& ex )
    {
        LOG_WARN( "Failed to fetch the last check of ", key.toString(), ": ",
                  ex.what() );
    }
    return 0;
}

}

extern "C" feedmailer::IFeedMailer* NewFeedMailer( const char* dbPath,
                                                   const feedmailer::SetupConfig* cfg )
{
    if ( dbPath == nullptr || cfg == nullptr || cfg->fetcher == nullptr ||
         cfg->evaluator == nullptr || cfg->mailer == nullptr )
        return nullptr;
    return new feedmailer::FeedMailer( dbPath, *cfg );
}
