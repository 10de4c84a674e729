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

#include "SqliteConnection.h"

#include "database/SqliteTools.h"
#include "database/SqliteTransaction.h"
#include "logging/Logger.h"

#include <cassert>

namespace feedmailer
{
namespace sqlite
{

thread_local Connection::Handle Connection::Context::m_handle;
thread_local Connection::Context::Type Connection::Context::m_type;

Connection::Connection( const std::string& dbPath )
    : m_dbPath( dbPath )
    , m_readLock( m_contextLock )
    , m_writeLock( m_contextLock )
{
    /* Indirect call to sqlite3_config */
    static SqliteConfigurator config;
}

Connection::~Connection()
{
    sqlite::Statement::FlushStatementCache();
}

Connection::Handle Connection::handle()
{
    /*
     * One sqlite connection per thread. They are all stored in a single map
     * so they can be released when the Connection wrapper goes away, and a
     * thread_local object removes a thread's connection when the thread exits
     * so that a new thread reusing the same id gets a fresh connection.
     */
    std::unique_lock<std::mutex> lock( m_connMutex );
    auto it = m_conns.find( std::this_thread::get_id() );
    if ( it != end( m_conns ) )
        return it->second.get();
    sqlite3* dbConnection;
    auto flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX;
    if ( m_conns.empty() == true )
        flags |= SQLITE_OPEN_CREATE;
    auto res = sqlite3_open_v2( m_dbPath.c_str(), &dbConnection, flags, nullptr );
    ConnPtr dbConn( dbConnection, &sqlite3_close );
    if ( res != SQLITE_OK )
    {
        int err = sqlite3_system_errno( dbConnection );
        LOG_ERROR( "Failed to connect to database. OS error: ", err );
        errors::mapToException( "<connecting to db>", "", res );
    }
    /*
     * Fetch the absolute path to the database, so that a later change of
     * working directory doesn't make other threads open another file.
     */
    if ( m_conns.empty() == true )
    {
        m_dbPath = sqlite3_db_filename( dbConnection, nullptr );
        LOG_DEBUG( "Fetched absolute database path from sqlite: ", m_dbPath );
    }

    res = sqlite3_extended_result_codes( dbConnection, 1 );
    if ( res != SQLITE_OK )
        errors::mapToException( "<enabling extended errors>", "", res );
    res = sqlite3_busy_timeout( dbConnection, 5000 );
    if ( res != SQLITE_OK )
        errors::mapToException( "<setting busy timeout>", "", res );
    setPragma( dbConnection, "foreign_keys", "1" );
    m_conns.emplace( std::this_thread::get_id(), std::move( dbConn ) );
    static thread_local ThreadSpecificConnection tsc( shared_from_this() );
    return dbConnection;
}

std::unique_ptr<sqlite::Transaction> Connection::newTransaction()
{
    if ( sqlite::Transaction::isInProgress() == false )
        return std::unique_ptr<sqlite::Transaction>{ new sqlite::ActualTransaction( this ) };
    return std::unique_ptr<sqlite::Transaction>{ new sqlite::NoopTransaction() };
}

Connection::ReadContext Connection::acquireReadContext()
{
    assert( Context::isOpened( Context::Type::Read ) == false );
    return ReadContext{ this };
}

Connection::WriteContext Connection::acquireWriteContext()
{
    assert( Context::isOpened( Context::Type::Write ) == false );
    return WriteContext{ this };
}

void Connection::setPragma( Connection::Handle conn, const std::string& pragmaName,
                            const std::string& value )
{
    std::string reqBase = std::string{ "PRAGMA " } + pragmaName;
    std::string reqSet = reqBase + " = " + value;

    sqlite::Statement stmt( conn, reqSet );
    stmt.execute();
    if ( stmt.row() != nullptr )
        throw std::runtime_error( "Failed to enable/disable " + pragmaName );

    sqlite::Statement stmtCheck( conn, reqBase );
    stmtCheck.execute();
    auto resultRow = stmtCheck.row();
    std::string resultValue;
    resultRow >> resultValue;
    if( resultValue != value )
        throw std::runtime_error( "PRAGMA " + pragmaName + " value mismatch" );
}

bool Connection::checkSchemaIntegrity()
{
    auto ctx = acquireReadContext();
    std::string req = std::string{ "PRAGMA integrity_check" };

    sqlite::Statement stmt( Context::handle(), req );
    stmt.execute();
    auto row = stmt.row();
    if ( row.load<std::string>( 0 ) == "ok" )
    {
        while ( stmt.row() != nullptr )
            ;
        return true;
    }
    do
    {
        LOG_ERROR( "Error string from integrity_check: ", row.load<std::string>( 0 ) );
        row = stmt.row();
    }
    while ( row != nullptr );
    return false;
}

std::shared_ptr<Connection> Connection::connect( const std::string& dbPath )
{
    // Use a wrapper to allow make_shared to use the private Connection ctor
    struct SqliteConnectionWrapper : public Connection
    {
        explicit SqliteConnectionWrapper( const std::string& p ) : Connection( p ) {}
    };
    return std::make_shared<SqliteConnectionWrapper>( dbPath );
}

Connection::ThreadSpecificConnection::ThreadSpecificConnection(
        std::shared_ptr<Connection> conn )
    : m_weakConnection( std::move( conn ) )
{
}

Connection::ThreadSpecificConnection::~ThreadSpecificConnection()
{
    auto conn =  m_weakConnection.lock();
    if ( conn == nullptr )
        return;
    std::unique_lock<std::mutex> lock( conn->m_connMutex );
    auto it = conn->m_conns.find( std::this_thread::get_id() );
    if ( it != end( conn->m_conns ) )
    {
        // Ensure those cached statements will not be used if another thread
        // with the same ID gets created
        sqlite::Statement::FlushConnectionStatementCache( it->second.get() );
        conn->m_conns.erase( it );
    }
}

Connection::SqliteConfigurator::SqliteConfigurator()
{
    if ( sqlite3_threadsafe() == 0 )
        throw std::runtime_error( "SQLite isn't built with threadsafe mode" );
    if ( sqlite3_config( SQLITE_CONFIG_MULTITHREAD ) == SQLITE_ERROR )
        throw std::runtime_error( "Failed to enable sqlite multithreaded mode" );
}

Connection::Context::~Context()
{
    releaseHandle();
}

Connection::Handle Connection::Context::handle()
{
    assert( m_handle != nullptr );
    return m_handle;
}

bool Connection::Context::isOpened( Type t )
{
    if ( m_handle == nullptr )
        return false;
    switch ( m_type )
    {
    case Type::Write:
        /*
         * If a write context is already opened, it has an exclusive access and can
         * be used to execute read requests
         */
        return true;
    case Type::Read:
        /*
         * Upgrading a read context to a write context is not supported. The
         * only supported configuration is a recursive context of the same type
         */
        assert( t == Type::Read );
        (void)t;
        return true;
    default:
        assert( !"Invalid context type" );
        return false;
    }
}

void Connection::Context::connect( Connection* c, Type t )
{
    assert( m_handle == nullptr );
    m_handle = c->handle();
    m_type = t;
    m_owning = true;
}

void Connection::Context::releaseHandle()
{
    /*
     * We don't want to unset the current thread's context when destroying
     * a default constructed Context
     */
    if ( m_owning == false )
        return;
    m_handle = nullptr;
    m_type = Type::None;
    m_owning = false;
}

Connection::Context::Context( Context&& ctx ) noexcept
{
    *this = std::move( ctx );
}

Connection::Context& Connection::Context::operator=( Context&& ctx ) noexcept
{
    m_owning = ctx.m_owning;
    ctx.m_owning = false;
    return *this;
}

Connection::ReadContext::ReadContext( Connection* c )
    : m_lock( c->m_readLock )
{
    connect( c, Type::Read );
}

Connection::WriteContext::WriteContext( Connection* c )
    : m_lock( c->m_writeLock )
{
    connect( c, Type::Write );
}

void Connection::WriteContext::unlock()
{
    m_lock.unlock();
    releaseHandle();
}

}

}
