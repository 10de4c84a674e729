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

#include <memory>

namespace feedmailer
{

class IFeedMailer;
class IFetcher;
class IEvaluator;
class IMailer;
class ILogger;
class IBackoffPolicy;
class FeedMailer;
class FeedGroup;
class FeedItem;
class Failure;

using FeedGroupPtr = std::shared_ptr<FeedGroup>;
using FeedItemPtr = std::shared_ptr<FeedItem>;
using FailurePtr = std::shared_ptr<Failure>;

using FeedMailerPtr = const FeedMailer*;

}
