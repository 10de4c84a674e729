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

#include <cstdint>
#include <string>
#include <vector>

#include "feedmailer/Hash.h"
#include "feedmailer/Types.h"

namespace feedmailer
{

struct ConfigSnapshot;

namespace poll
{
class MailDispatcher;
}

/**
 * @brief FailureReporter Mails a summary of the failing groups to the
 * configured operators.
 *
 * The set of failing groups has to stay identical for DebounceSweeps
 * maintenance sweeps before a report is sent, so a group flapping for a
 * couple of polls doesn't trigger a report. Once the set goes back to empty
 * and stays so, a last report announces the recovery.
 */
class FailureReporter
{
public:
    static const uint8_t DebounceSweeps;
    /// A group is reported once it failed at least this many times in a row
    static const uint32_t MinFailCount;

    FailureReporter( FeedMailerPtr fm, poll::MailDispatcher& dispatcher,
                     std::string mailFrom );

    /**
     * @brief sweep Updates the failing set, and sends a report if it is due
     * @return true if a report was sent
     */
    bool sweep( const ConfigSnapshot& snapshot );

    uint8_t debounceCount() const;

private:
    struct FailingGroup
    {
        std::vector<std::string> urls;
        std::string error;
    };

    void sendReport( const ConfigSnapshot& snapshot,
                     const std::vector<FailingGroup>& failing );

private:
    FeedMailerPtr m_fm;
    poll::MailDispatcher& m_dispatcher;
    std::string m_mailFrom;
    Hash m_failingHash;
    uint8_t m_debounce;
};

}
