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

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "feedmailer/Config.h"
#include "feedmailer/Hash.h"
#include "feedmailer/IBackoffPolicy.h"
#include "feedmailer/IEvaluator.h"
#include "feedmailer/IFetcher.h"
#include "feedmailer/ILogger.h"
#include "feedmailer/IMailer.h"

namespace feedmailer
{

enum class InitializeResult
{
    //< Everything worked out fine
    Success,
    //< Should be considered the same as Success, but is an indication of
    // unrequired subsequent calls to initialize.
    AlreadyInitialized,
    //< A fatal error occured, the IFeedMailer instance should be destroyed
    Failed,
};

struct SetupConfig
{
    std::shared_ptr<IFetcher> fetcher;
    std::shared_ptr<IEvaluator> evaluator;
    std::shared_ptr<IMailer> mailer;
    /**
     * @brief logger An ILogger instance if the application wishes to use a
     * custom one.
     * If nullptr is provided, the default IOstream logger will be used.
     */
    std::shared_ptr<ILogger> logger;
    LogLevel logLevel = LogLevel::Error;
    /// Optional policy stretching the interval of failing groups
    std::shared_ptr<IBackoffPolicy> backoffPolicy;
    /// Sender address used for every outgoing mail, empty for the transport default
    std::string mailFrom;
    /// Maximum number of groups being polled simultaneously
    uint32_t nbWorkers = 4;
    /// Upper bound of the random delay applied when a group gets scheduled
    std::chrono::seconds maxJitter{ 0 };
    /// Period of the maintenance sweep (pruning, failure report, config reload)
    std::chrono::seconds maintenanceInterval{ 60 };
    /// How long a group removed from the configuration is kept before being pruned
    std::chrono::seconds groupRetention{ 7 * 24 * 3600 };
    uint32_t mailRetries = 3;
    std::chrono::milliseconds mailRetryDelay{ 1000 };
    /// A JSON configuration file to load on start, and to watch for changes
    std::string configPath;
};

struct PollResult
{
    enum class Status : uint8_t
    {
        Success,
        /// The fetch or the notification failed, a failure was recorded
        Failed,
        /// The group is already being polled
        Skipped,
        /// The group isn't part of the current configuration
        Unknown,
        /// The poll got interrupted by stop(), nothing was recorded
        Cancelled,
    };

    Status status = Status::Unknown;
    /// Entries with a never seen fingerprint
    uint32_t nbNew = 0;
    /// New entries that passed the filter
    uint32_t nbNotified = 0;
    uint32_t nbMails = 0;
    /// Entries excluded because an update key or a filter expression failed
    uint32_t nbSkipped = 0;
    std::string error;
};

struct FeedGroupState
{
    GroupKey key;
    int64_t lastCheck = 0;
    /// 0 if the group never produced a notification
    int64_t lastUpdate = 0;
    int64_t lastSeen = 0;
};

struct FailureState
{
    GroupKey key;
    uint32_t failCount = 0;
    std::string error;
};

class IFeedMailer
{
public:
    virtual ~IFeedMailer() = default;
    virtual InitializeResult initialize() = 0;
    /**
     * @brief setConfig Validates and atomically installs a new configuration
     * @return false if the configuration was rejected, in which case the
     *         previous one stays active.
     */
    virtual bool setConfig( Config config ) = 0;
    /**
     * @brief loadConfigFile Parses a JSON configuration file and installs it
     * @return false if the file can't be read or the configuration is invalid
     */
    virtual bool loadConfigFile( const std::string& path ) = 0;
    /**
     * @brief configGeneration Returns the generation of the active
     * configuration, 0 if none was installed yet
     */
    virtual uint64_t configGeneration() const = 0;
    /**
     * @brief groupKeys Returns the keys of the configured groups, in
     * configuration order
     */
    virtual std::vector<GroupKey> groupKeys() const = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    /**
     * @brief pollNow Synchronously polls a group using the active configuration
     */
    virtual PollResult pollNow( const GroupKey& key ) = 0;
    /**
     * @brief runMaintenance Synchronously runs a maintenance sweep
     */
    virtual void runMaintenance() = 0;
    virtual void setVerbosity( LogLevel v ) = 0;
    /**
     * @brief feedGroup Returns the persisted state for a group
     * @return false if the group has never been polled
     */
    virtual bool feedGroup( const GroupKey& key, FeedGroupState& state ) const = 0;
    virtual std::vector<FailureState> failures() const = 0;
    virtual uint32_t nbItems( const GroupKey& key ) const = 0;
};

/**
 * @brief groupKey Computes the identity of a feed group from its URL set
 *
 * URLs are normalized, deduplicated and sorted first, so the order in which
 * they are configured doesn't matter.
 */
GroupKey groupKey( const std::vector<std::string>& urls );

}

extern "C"
{
feedmailer::IFeedMailer* NewFeedMailer( const char* dbPath,
                                        const feedmailer::SetupConfig* cfg );
}
