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

#ifndef DATABASESETTINGS_H
#define DATABASESETTINGS_H

#include "feedmailer/Types.h"
#include <cstdint>

namespace feedmailer
{

namespace sqlite
{
class Connection;
}

/**
 * @brief DatabaseSettings The single row table describing the database itself
 */
class DatabaseSettings
{
public:
    explicit DatabaseSettings( FeedMailer* fm );
    bool load();
    /**
     * @brief dbModelVersion returns the current database model version.
     *
     * This can be different from the \ref DbModelVersion when the database was
     * created by another version, and is 0 when the database was just created.
     */
    uint32_t dbModelVersion() const;

    static void createTable( sqlite::Connection* dbConn );

    static const uint32_t DbModelVersion;

private:
    FeedMailer* m_fm;

    uint32_t m_dbModelVersion;
};

}

#endif // DATABASESETTINGS_H
