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
#include <exception>
#include <stdexcept>

#include <sqlite3.h>

namespace feedmailer
{

namespace sqlite
{
namespace errors
{

/**
 * This is the general type for all sqlite error
 */
class Exception : public std::runtime_error
{
public:
    Exception( const char* req, const char* errMsg, int extendedCode )
        : std::runtime_error( std::string( "Failed to run request [" ) + req + "]: " +
                    ( errMsg != nullptr ? errMsg : "" ) +
                   "(" + std::to_string( extendedCode ) + ")" )
        , m_errorCode( extendedCode )
    {
    }

    Exception( const std::string& msg, int errCode )
        : std::runtime_error( msg )
        , m_errorCode( errCode )
    {
    }

    int code() const
    {
        return m_errorCode & 0xFF;
    }

    int extendedCode() const
    {
        return m_errorCode;
    }

private:
    int m_errorCode;
};

class ConstraintViolation : public Exception
{
public:
    ConstraintViolation( const char* req, const char* err, int errCode )
        : Exception( std::string( "Request [" ) + req + "] aborted due to "
                    "constraint violation (" + ( err != nullptr ? err : "" ) + ")",
                     errCode )
    {
    }
};

class ConstraintForeignKey : public ConstraintViolation
{
public:
    ConstraintForeignKey( const char* req, const char* err, int errCode )
        : ConstraintViolation( req, err, errCode )
    {
    }
};

class ConstraintNotNull : public ConstraintViolation
{
public:
    ConstraintNotNull( const char* req, const char* err, int errCode )
        : ConstraintViolation( req, err, errCode )
    {
    }
};

class ConstraintPrimaryKey : public ConstraintViolation
{
public:
    ConstraintPrimaryKey( const char* req, const char* err, int errCode )
        : ConstraintViolation( req, err, errCode )
    {
    }
};

class ConstraintUnique : public ConstraintViolation
{
public:
    ConstraintUnique( const char* req, const char* err, int errCode )
        : ConstraintViolation( req, err, errCode )
    {
    }
};

class GenericError : public Exception
{
public:
    GenericError( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseBusy : public Exception
{
public:
    DatabaseBusy( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseLocked : public Exception
{
public:
    DatabaseLocked( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseReadOnly : public Exception
{
public:
    DatabaseReadOnly( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseIOErr : public Exception
{
public:
    DatabaseIOErr( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseCorrupt : public Exception
{
public:
    DatabaseCorrupt( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class DatabaseFull: public Exception
{
public:
    DatabaseFull( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class CantOpen : public Exception
{
public:
    CantOpen( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class TypeMismatch : public Exception
{
public:
    TypeMismatch( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class LibMisuse : public Exception
{
public:
    LibMisuse( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }
};

class ColumnOutOfRange : public Exception
{
public:
    ColumnOutOfRange( const char* req, const char* errMsg, int extendedCode )
        : Exception( req, errMsg, extendedCode )
    {
    }

    ColumnOutOfRange( unsigned int idx, unsigned int nbColumns )
        : Exception( "Attempting to extract column at index " + std::to_string( idx ) +
                   " from a request with " + std::to_string( nbColumns ) + " columns",
                   SQLITE_RANGE )
    {
    }
};

/**
 * @brief isInnocuous Returns true for transient errors, after which the
 * request can be retried
 */
static inline bool isInnocuous( int errCode )
{
    switch ( errCode )
    {
    case SQLITE_IOERR:
    case SQLITE_NOMEM:
    case SQLITE_BUSY:
    case SQLITE_READONLY:
    case SQLITE_FULL:
        return true;
    }
    return false;
}

static inline bool isInnocuous( const Exception& ex )
{
    return isInnocuous( ex.code() );
}

[[noreturn]] void mapToException( const char* reqStr, const char* errMsg, int extRes );

} // namespace errors
} // namespace sqlite

} // namespace feedmailer
