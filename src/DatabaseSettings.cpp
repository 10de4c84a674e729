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

#include "DatabaseSettings.h"

#include "database/SqliteTools.h"
#include "FeedMailer.h"

namespace feedmailer
{

const uint32_t DatabaseSettings::DbModelVersion = 1u;

DatabaseSettings::DatabaseSettings( FeedMailer* fm )
    : m_fm( fm )
    , m_dbModelVersion( 0 )
{
}

bool DatabaseSettings::load()
{
    auto dbConn = m_fm->getConn();
    OPEN_WRITE_CONTEXT( ctx, dbConn );
    sqlite::Statement s( "SELECT db_model_version FROM settings" );
    s.execute();
    auto row = s.row();
    // First launch: no settings
    if ( row == nullptr )
    {
        if ( sqlite::Tools::executeUpdate( dbConn,
                "INSERT INTO settings(db_model_version) VALUES(?)",
                DbModelVersion ) == false )
        {
            return false;
        }
        m_dbModelVersion = 0;
        return true;
    }
    row >> m_dbModelVersion;
    while ( s.row() != nullptr )
        ;
    return true;
}

uint32_t DatabaseSettings::dbModelVersion() const
{
    return m_dbModelVersion;
}

void DatabaseSettings::createTable( sqlite::Connection* dbConn )
{
    const std::string req = "CREATE TABLE IF NOT EXISTS settings("
                "db_model_version UNSIGNED INTEGER NOT NULL"
            ")";
    sqlite::Tools::executeRequest( dbConn, req );
}

}
