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

#include "Pruner.h"

#include "Failure.h"
#include "FeedGroup.h"
#include "FeedMailer.h"
#include "config/ConfigStore.h"
#include "logging/Logger.h"
#include "utils/Date.h"

namespace feedmailer
{

Pruner::Result Pruner::sweep( FeedMailerPtr fm, const ConfigSnapshot& snapshot,
                              int64_t now, std::chrono::seconds groupRetention )
{
    Result res;
    std::vector<GroupKey> keys;
    keys.reserve( snapshot.groups.size() );
    for ( const auto& g : snapshot.groups )
        keys.push_back( g->key );

    auto t = fm->getConn()->newTransaction();
    FeedGroup::touch( fm, keys, now );
    auto stale = FeedGroup::listUnseenSince( fm, utils::date::cutoff( now, groupRetention ) );
    for ( const auto& g : stale )
    {
        if ( snapshot.contains( g->key() ) == true )
            continue;
        LOG_INFO( "Pruning group ", g->key().toString(), ", last seen at ",
                  utils::date::toIso8601( g->lastSeen() ) );
        if ( FeedGroup::destroy( fm, g->key() ) == true )
            ++res.nbGroups;
    }
    res.nbFailures = Failure::deleteOrphans( fm );
    t->commit();
    return res;
}

}
