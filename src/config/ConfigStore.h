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

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "feedmailer/Config.h"
#include "feedmailer/Hash.h"
#include "filter/Filter.h"
#include "filter/RegexCache.h"

namespace feedmailer
{

/**
 * @brief GroupSnapshot A feed group as resolved by a configuration load
 */
struct GroupSnapshot
{
    GroupKey key;
    std::vector<std::string> urls;
    Settings settings;
    /// nullptr means every entry passes
    std::shared_ptr<const Filter> filter;
};

/**
 * @brief ConfigSnapshot An immutable, fully validated configuration
 */
struct ConfigSnapshot
{
    uint64_t generation = 0;
    std::vector<std::string> errorReportTo;
    /// In configuration order
    std::vector<std::shared_ptr<const GroupSnapshot>> groups;

    std::shared_ptr<const GroupSnapshot> group( const GroupKey& key ) const;
    bool contains( const GroupKey& key ) const;

private:
    friend class ConfigStore;
    std::unordered_map<GroupKey, size_t> m_index;
};

/**
 * @brief ConfigStore Holds the active configuration snapshot
 *
 * Installing a configuration compiles it into a new snapshot, which then
 * replaces the active one atomically. Readers keep whichever snapshot they
 * loaded for as long as they need it.
 */
class ConfigStore
{
public:
    explicit ConfigStore( std::shared_ptr<IEvaluator> evaluator );

    /**
     * @brief snapshot Returns the active snapshot, nullptr if none was installed
     */
    std::shared_ptr<const ConfigSnapshot> snapshot() const;

    /**
     * @brief install Validates, compiles and activates a configuration
     *
     * Throws errors::ConfigError, in which case the active snapshot is left
     * untouched.
     */
    std::shared_ptr<const ConfigSnapshot> install( const Config& config );

    uint64_t generation() const;

    RegexCache& regexCache();

private:
    std::shared_ptr<IEvaluator> m_evaluator;
    /* Serializes installs, readers never take it */
    std::mutex m_installMutex;
    uint64_t m_lastGeneration;
    std::shared_ptr<const ConfigSnapshot> m_snapshot;
    RegexCache m_regexCache;
};

}
