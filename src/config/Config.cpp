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

#include "feedmailer/Config.h"

namespace feedmailer
{

const std::string Settings::DefaultUpdateKey = "item.id";
const std::chrono::seconds Settings::DefaultInterval{ 3600 };
const std::chrono::seconds Settings::DefaultKeepOld{ 7 * 24 * 3600 };
const std::chrono::seconds Settings::DefaultTimeout{ 30 };
const uint32_t Settings::DefaultMaxMailsPerCheck = 5;

const std::string Settings::DefaultItemSubject =
        "[{{ feed.title }}] {{ item.title }}";

const std::string Settings::DefaultItemBody =
        "<h1><a href=\"{{ item.link }}\">{{ item.title }}</a></h1>\n"
        "{% if item.published %}<p><small>{{ item.published }}</small></p>{% endif %}\n"
        "<div>{{ item.content or item.summary }}</div>\n"
        "<hr>\n"
        "<p><small>From <a href=\"{{ feed.link }}\">{{ feed.title }}</a></small></p>\n";

const std::string Settings::DefaultDigestSubject =
        "{{ items | length }} new items from {{ feeds | map(attribute='title') | join(', ') }}";

const std::string Settings::DefaultDigestBody =
        "<h1>{{ items | length }} new items</h1>\n"
        "<ul>\n"
        "{% for entry in items %}"
        "<li><a href=\"{{ entry.item.link }}\">{{ entry.item.title }}</a>"
        " <small>({{ entry.feed.title }})</small></li>\n"
        "{% endfor %}"
        "</ul>\n";

Settings::Settings()
    : digest( false )
    , itemSubject( DefaultItemSubject )
    , itemBody( DefaultItemBody )
    , digestSubject( DefaultDigestSubject )
    , digestBody( DefaultDigestBody )
    , updateKeys{ DefaultUpdateKey }
    , interval( DefaultInterval )
    , keepOld( DefaultKeepOld )
    , timeout( DefaultTimeout )
    , maxMailsPerCheck( DefaultMaxMailsPerCheck )
    , sanitize( true )
    , sortByLastModified( false )
{
}

FilterNode FilterNode::all( std::vector<FilterNode> children )
{
    return FilterNode{ Type::And, {}, std::move( children ) };
}

FilterNode FilterNode::any( std::vector<FilterNode> children )
{
    return FilterNode{ Type::Or, {}, std::move( children ) };
}

FilterNode FilterNode::negate( FilterNode child )
{
    std::vector<FilterNode> children;
    children.push_back( std::move( child ) );
    return FilterNode{ Type::Not, {}, std::move( children ) };
}

FilterNode FilterNode::titleRegex( std::string pattern )
{
    return FilterNode{ Type::TitleRegex, std::move( pattern ), {} };
}

FilterNode FilterNode::bodyRegex( std::string pattern )
{
    return FilterNode{ Type::BodyRegex, std::move( pattern ), {} };
}

FilterNode FilterNode::expression( std::string expr )
{
    return FilterNode{ Type::Expression, std::move( expr ), {} };
}

}
