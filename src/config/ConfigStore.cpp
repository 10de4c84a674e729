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

#include "ConfigStore.h"

#include "feedmailer/Errors.h"
#include "feedmailer/IFeedMailer.h"
#include "logging/Logger.h"
#include "utils/Date.h"
#include "utils/Url.h"
#include "utils/XxHasher.h"

#include <algorithm>

namespace feedmailer
{

GroupKey groupKey( const std::vector<std::string>& urls )
{
    std::vector<std::string> normalized;
    normalized.reserve( urls.size() );
    for ( const auto& u : urls )
        normalized.push_back( utils::url::normalize( u ) );
    std::sort( begin( normalized ), end( normalized ) );
    normalized.erase( std::unique( begin( normalized ), end( normalized ) ),
                      end( normalized ) );
    utils::hash::Hasher hasher;
    for ( const auto& u : normalized )
        hasher.update( u );
    return hasher.digest();
}

std::shared_ptr<const GroupSnapshot> ConfigSnapshot::group( const GroupKey& key ) const
{
    auto it = m_index.find( key );
    if ( it == end( m_index ) )
        return nullptr;
    return groups[it->second];
}

bool ConfigSnapshot::contains( const GroupKey& key ) const
{
    return m_index.find( key ) != end( m_index );
}

ConfigStore::ConfigStore( std::shared_ptr<IEvaluator> evaluator )
    : m_evaluator( std::move( evaluator ) )
    , m_lastGeneration( 0 )
{
}

std::shared_ptr<const ConfigSnapshot> ConfigStore::snapshot() const
{
    return std::atomic_load( &m_snapshot );
}

std::shared_ptr<const ConfigSnapshot> ConfigStore::install( const Config& config )
{
    std::lock_guard<std::mutex> lock( m_installMutex );
    auto generation = m_lastGeneration + 1;

    auto snapshot = std::make_shared<ConfigSnapshot>();
    snapshot->generation = generation;
    snapshot->errorReportTo = config.errorReportTo;
    snapshot->groups.reserve( config.feeds.size() );
    for ( const auto& feed : config.feeds )
    {
        if ( feed.urls.empty() == true )
            throw errors::ConfigError( "a feed group requires at least one URL" );
        for ( const auto& u : feed.urls )
        {
            if ( utils::url::normalize( u ).empty() == true )
                throw errors::ConfigError( "empty feed URL" );
        }
        if ( feed.settings.updateKeys.empty() == true )
            throw errors::ConfigError( "no update key for feed group " + feed.urls[0] );
        if ( feed.settings.interval.count() <= 0 )
            throw errors::ConfigError( "the poll interval of feed group " +
                                       feed.urls[0] + " must be positive" );
        if ( feed.settings.interval.count() > utils::date::MaxDuration ||
             feed.settings.keepOld.count() > utils::date::MaxDuration ||
             feed.settings.timeout.count() > utils::date::MaxDuration )
            throw errors::ConfigError( "a duration of feed group " + feed.urls[0] +
                                       " exceeds the longest supported duration" );
        auto group = std::make_shared<GroupSnapshot>();
        group->key = groupKey( feed.urls );
        if ( snapshot->m_index.find( group->key ) != end( snapshot->m_index ) )
            throw errors::ConfigError( "duplicate feed group " + feed.urls[0] );
        group->urls = feed.urls;
        group->settings = feed.settings;
        if ( feed.filter != nullptr )
            group->filter = Filter::compile( *feed.filter, generation,
                                             m_regexCache, *m_evaluator );
        snapshot->m_index.emplace( group->key, snapshot->groups.size() );
        snapshot->groups.push_back( std::move( group ) );
    }
    /* Only consume the generation once the configuration is known to be valid */
    m_lastGeneration = generation;
    std::shared_ptr<const ConfigSnapshot> res = std::move( snapshot );
    std::atomic_store( &m_snapshot, res );
    LOG_INFO( "Installed configuration generation ", generation, " with ",
              res->groups.size(), " feed groups" );
    return res;
}

uint64_t ConfigStore::generation() const
{
    auto s = snapshot();
    if ( s == nullptr )
        return 0;
    return s->generation;
}

RegexCache& ConfigStore::regexCache()
{
    return m_regexCache;
}

}
