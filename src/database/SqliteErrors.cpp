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

#include "SqliteErrors.h"

namespace feedmailer
{
namespace sqlite
{
namespace errors
{

void mapToException( const char* reqStr, const char* errMsg, int extRes )
{
    auto res = extRes & 0xFF;
    switch ( res )
    {
        case SQLITE_CONSTRAINT:
        {
            switch ( extRes )
            {
                case SQLITE_CONSTRAINT_FOREIGNKEY:
                    throw errors::ConstraintForeignKey( reqStr, errMsg, extRes );
                case SQLITE_CONSTRAINT_NOTNULL:
                    throw errors::ConstraintNotNull( reqStr, errMsg, extRes );
                case SQLITE_CONSTRAINT_PRIMARYKEY:
                    throw errors::ConstraintPrimaryKey( reqStr, errMsg, extRes );
                case SQLITE_CONSTRAINT_UNIQUE:
                    throw errors::ConstraintUnique( reqStr, errMsg, extRes );
                default:
                    throw errors::ConstraintViolation( reqStr, errMsg, extRes );
            }
        }
        case SQLITE_BUSY:
            throw errors::DatabaseBusy( reqStr, errMsg, extRes );
        case SQLITE_LOCKED:
            throw errors::DatabaseLocked( reqStr, errMsg, extRes );
        case SQLITE_READONLY:
            throw errors::DatabaseReadOnly( reqStr, errMsg, extRes );
        case SQLITE_IOERR:
            throw errors::DatabaseIOErr( reqStr, errMsg, extRes );
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            throw errors::DatabaseCorrupt( reqStr, errMsg, extRes );
        case SQLITE_FULL:
            throw errors::DatabaseFull( reqStr, errMsg, extRes );
        case SQLITE_CANTOPEN:
            throw errors::CantOpen( reqStr, errMsg, extRes );
        case SQLITE_MISMATCH:
            throw errors::TypeMismatch( reqStr, errMsg, extRes );
        case SQLITE_MISUSE:
            throw errors::LibMisuse( reqStr, errMsg, extRes );
        case SQLITE_RANGE:
            throw errors::ColumnOutOfRange( reqStr, errMsg, extRes );
        case SQLITE_ERROR:
            throw errors::GenericError( reqStr, errMsg, extRes );
        default:
            throw errors::Exception( reqStr, errMsg, extRes );
    }
}

} // namespace errors
} // namespace sqlite
} // namespace feedmailer
