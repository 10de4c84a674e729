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

#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <thread>
#include <unordered_map>

#include "utils/SWMRLock.h"

/*
 * Conditionally open a read context if no context is currently opened.
 * The first macro parameter is the context instance name, the 2nd a pointer to
 * a sqlite::Connection instance.
 * The resulting object must not be used as it may be default constructed if
 * a context was already opened.
 */
#define OPEN_READ_CONTEXT( name, dbConn ) \
    sqlite::Connection::ReadContext name; \
    if ( sqlite::Connection::Context::isOpened( \
            sqlite::Connection::Context::Type::Read ) == false ) { \
        name = dbConn->acquireReadContext(); \
    }

/*
 * Conditionally open a write context if no context is currently opened.
 * Same rules as OPEN_READ_CONTEXT apply.
 */
#define OPEN_WRITE_CONTEXT( name, dbConn ) \
    sqlite::Connection::WriteContext name; \
    if ( sqlite::Connection::Context::isOpened( \
            sqlite::Connection::Context::Type::Write ) == false ) { \
        name = dbConn->acquireWriteContext(); \
    }

namespace feedmailer
{

namespace sqlite
{

class Transaction;

class Connection : public std::enable_shared_from_this<Connection>
{
public:
    using Handle = sqlite3*;

    /**
     * @brief Represents a generic acquired context, which can be read or write
     *
     * This base class allows the caller to acquire a connection handle, which is
     * otherwise inaccessible.
     */
    class Context
    {
    public:
        enum class Type : uint8_t
        {
            None,
            Read,
            Write,
        };

        Context() noexcept = default;
        ~Context();

        /**
         * @brief handle Returns a connection handle for the calling thread
         *
         * It is invalid to call this function if no context is opened
         */
        static Handle handle();
        /**
         * @brief isOpened Returns true if the calling thread has acquired a context
         * @param t The type of context to check for.
         */
        static bool isOpened( Type t );

    protected:
        void connect( Connection* c, Type t );
        void releaseHandle();

        Context( const Context& ) = delete;
        Context& operator=( const Context& ) = delete;
        Context( Context&& ctx ) noexcept;
        Context& operator=( Context&& ctx ) noexcept;

    private:
        static thread_local Handle m_handle;
        static thread_local Type m_type;
        bool m_owning = false;
    };

    /**
     * @brief The ReadContext class represents a read context to the database
     *
     * Performing writes to the database with such a context is undefined
     */
    class ReadContext final : public Context
    {
    public:
        ReadContext() = default;
        ReadContext( Connection* c );
        ReadContext( const ReadContext& ) = delete;
        ReadContext& operator=( const ReadContext& ) = delete;
        ReadContext( ReadContext&& ) = default;
        ReadContext& operator=( ReadContext&& ) = default;
    private:
        std::unique_lock<utils::ReadLocker> m_lock;
    };

    /**
     * @brief The WriteContext class represents an opened write context
     *
     * Performing writes or read to the database with such a context is valid
     */
    class WriteContext final : public Context
    {
    public:
        WriteContext() = default;
        WriteContext( Connection* c );

        void unlock();

        WriteContext( const WriteContext& ) = delete;
        WriteContext& operator=( const WriteContext& ) = delete;
        WriteContext( WriteContext&& ) = default;
        WriteContext& operator=( WriteContext&& ) = default;

    private:
        std::unique_lock<utils::WriteLocker> m_lock;
    };

    /**
     * @brief newTransaction Creates a transaction and acquires a write context
     *
     * This is safe to call recursively, only the first returned transaction
     * object will actually perform operations, the later will be noops, but will
     * not deadlock trying to acquire a second write context.
     */
    std::unique_ptr<sqlite::Transaction> newTransaction();
    /**
     * @brief acquireReadContext Acquires a read context
     *
     * This is not safe to be called recursively.
     * If the caller might already hold a read context, OPEN_READ_CONTEXT can be used
     */
    ReadContext acquireReadContext();
    /**
     * @brief acquireWriteContext Acquires a write context
     *
     * This is not safe to be called recursively.
     * If the caller might already hold a context, OPEN_WRITE_CONTEXT can be used
     */
    WriteContext acquireWriteContext();

    bool checkSchemaIntegrity();

    static std::shared_ptr<Connection> connect( const std::string& dbPath );

protected:
    explicit Connection( const std::string& dbPath );
    ~Connection();

private:
    Connection( const Connection& ) = delete;
    Connection( Connection&& ) = delete;
    Connection& operator=( const Connection& ) = delete;
    Connection& operator=( Connection&& ) = delete;

    void setPragma( Handle conn, const std::string& pragmaName,
                    const std::string& value );

    // Returns the current thread's connection
    // This will initiate a connection if required
    Handle handle();

private:
    struct ThreadSpecificConnection
    {
        explicit ThreadSpecificConnection( std::shared_ptr<Connection> conn );
        ~ThreadSpecificConnection();

    private:
        std::weak_ptr<Connection> m_weakConnection;
    };

    /*
     * Wrapper object to sqlite_config calls, to ensure we call those only once
     * per process
     */
    struct SqliteConfigurator
    {
        SqliteConfigurator();
        SqliteConfigurator( const SqliteConfigurator& ) = delete;
        SqliteConfigurator& operator=( const SqliteConfigurator& ) = delete;
    };

    using ConnPtr = std::unique_ptr<sqlite3, int(*)(sqlite3*)>;
    std::string m_dbPath;
    std::mutex m_connMutex;
    std::unordered_map<std::thread::id, ConnPtr> m_conns;
    utils::SWMRLock m_contextLock;
    utils::ReadLocker m_readLock;
    utils::WriteLocker m_writeLock;
};

}

}
