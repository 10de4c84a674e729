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

#ifndef FEEDMAILER_H
#define FEEDMAILER_H

#include "feedmailer/IFeedMailer.h"
#include "feedmailer/Types.h"
#include "DatabaseSettings.h"
#include "config/ConfigStore.h"
#include "scheduler/Scheduler.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace feedmailer
{

class FailureReporter;

namespace sqlite
{
class Connection;
}

namespace poll
{
class GroupPoller;
class MailDispatcher;
}

class FeedMailer : public IFeedMailer, private Scheduler::IHandler
{
public:
    FeedMailer( const std::string& dbPath, const SetupConfig& cfg );
    virtual ~FeedMailer();
    virtual InitializeResult initialize() override;
    virtual bool setConfig( Config config ) override;
    virtual bool loadConfigFile( const std::string& path ) override;
    virtual uint64_t configGeneration() const override;
    virtual std::vector<GroupKey> groupKeys() const override;
    virtual bool start() override;
    virtual void stop() override;
    virtual PollResult pollNow( const GroupKey& key ) override;
    virtual void runMaintenance() override;
    virtual void setVerbosity( LogLevel v ) override;

    virtual bool feedGroup( const GroupKey& key, FeedGroupState& state ) const override;
    virtual std::vector<FailureState> failures() const override;
    virtual uint32_t nbItems( const GroupKey& key ) const override;

    sqlite::Connection* getConn() const;
    const SetupConfig& setupConfig() const;

private:
    virtual void onPoll( const GroupKey& key ) override;
    virtual void onMaintenance() override;
    virtual std::chrono::seconds nextDelay( const GroupKey& key,
                                            std::chrono::seconds interval ) override;
    virtual int64_t lastCheck( const GroupKey& key ) override;

    void createAllTables();
    bool checkDbModel();
    /* Must be called with m_configMutex held */
    bool install( const Config& config );
    bool loadConfigFileLocked( const std::string& path );
    void reloadConfigFileIfChanged();

protected:
    SetupConfig m_setup;
    std::string m_dbPath;
    std::shared_ptr<sqlite::Connection> m_dbConnection;
    DatabaseSettings m_settings;
    ConfigStore m_configStore;

    std::mutex m_mutex;
    std::atomic_bool m_initialized;

    /* Serializes configuration installs along with the timers reconciliation */
    std::mutex m_configMutex;
    std::string m_configPath;
    int64_t m_configMtime;

    std::mutex m_maintenanceMutex;

    std::unique_ptr<poll::MailDispatcher> m_dispatcher;
    std::unique_ptr<poll::GroupPoller> m_poller;
    std::unique_ptr<FailureReporter> m_failureReporter;
    /* Declared last so it gets stopped before anything its tasks refer to */
    std::unique_ptr<Scheduler> m_scheduler;
};

}

#endif // FEEDMAILER_H
