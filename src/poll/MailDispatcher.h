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
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "feedmailer/IMailer.h"

namespace feedmailer
{

namespace poll
{

/**
 * @brief MailDispatcher Sends mails through the host's IMailer, retrying
 * failed attempts with an exponential delay.
 */
class MailDispatcher
{
public:
    /**
     * @param nbAttempts The maximum number of attempts per mail
     * @param retryDelay The base delay, attempt N waits retryDelay << N, with
     *                   N capped to MaxBackoffShift
     */
    MailDispatcher( std::shared_ptr<IMailer> mailer, uint32_t nbAttempts,
                    std::chrono::milliseconds retryDelay );

    /**
     * @brief send Sends a single mail
     *
     * Throws errors::SendError once every attempt failed, or if the
     * dispatcher got interrupted while waiting to retry.
     */
    void send( const Mail& mail );

    /**
     * @brief interrupt Wakes up any pending retry, and fails it
     */
    void interrupt();
    void resume();

    /**
     * @brief retryDelay Returns the time to wait after a failed attempt
     */
    std::chrono::milliseconds retryDelay( uint32_t attempt ) const;

    static constexpr uint32_t MaxBackoffShift = 16;

private:
    /* Returns false if interrupted */
    bool wait( std::chrono::milliseconds delay );

private:
    std::shared_ptr<IMailer> m_mailer;
    uint32_t m_nbAttempts;
    std::chrono::milliseconds m_retryDelay;
    std::mutex m_mutex;
    std::condition_variable m_cond;
    bool m_interrupted;
};

}

}
