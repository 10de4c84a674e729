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

#include "feedmailer/IEvaluator.h"
#include "feedmailer/IFetcher.h"

namespace feedmailer
{

/**
 * @brief FilterNode A node of the boolean filter tree gating notifications
 *
 * Leaves carry their pattern or expression in value, combinators carry their
 * operands in children. A Not node has exactly one child.
 */
struct FilterNode
{
    enum class Type : uint8_t
    {
        And,
        Or,
        Not,
        TitleRegex,
        BodyRegex,
        Expression,
    };

    Type type;
    std::string value;
    std::vector<FilterNode> children;

    static FilterNode all( std::vector<FilterNode> children );
    static FilterNode any( std::vector<FilterNode> children );
    static FilterNode negate( FilterNode child );
    static FilterNode titleRegex( std::string pattern );
    static FilterNode bodyRegex( std::string pattern );
    static FilterNode expression( std::string expr );
};

/**
 * @brief Settings The resolved settings of a feed group
 *
 * A default constructed instance holds the built-in defaults.
 */
struct Settings
{
    Settings();

    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    bool digest;
    std::string itemSubject;
    std::string itemBody;
    std::string digestSubject;
    std::string digestBody;
    TemplateArgs templateArgs;
    std::vector<std::string> updateKeys;
    std::chrono::seconds interval;
    /// Retention window of item fingerprints
    std::chrono::seconds keepOld;
    std::chrono::seconds timeout;
    uint32_t maxMailsPerCheck;
    bool sanitize;
    bool sortByLastModified;
    HttpHeaders httpHeaders;

    static const std::string DefaultUpdateKey;
    static const std::chrono::seconds DefaultInterval;
    static const std::chrono::seconds DefaultKeepOld;
    static const std::chrono::seconds DefaultTimeout;
    static const uint32_t DefaultMaxMailsPerCheck;
    static const std::string DefaultItemSubject;
    static const std::string DefaultItemBody;
    static const std::string DefaultDigestSubject;
    static const std::string DefaultDigestBody;
};

struct FeedGroupConfig
{
    std::vector<std::string> urls;
    Settings settings;
    /// nullptr means every entry passes
    std::shared_ptr<const FilterNode> filter;
};

struct Config
{
    /// Recipients of the failing feeds report. Empty disables reporting
    std::vector<std::string> errorReportTo;
    Settings globals;
    std::vector<FeedGroupConfig> feeds;
};

}
