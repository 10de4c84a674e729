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

#include <map>
#include <string>
#include <vector>

#include "feedmailer/Feed.h"
#include "feedmailer/Value.h"

namespace feedmailer
{

/**
 * @brief ItemContext The {feed, item} pair exposed to update keys, filter
 * expressions and item templates
 */
struct ItemContext
{
    const Feed* feed;
    const Entry* item;
};

/**
 * @brief DigestContext Context exposed to digest templates: every feed of the
 * group, and the list of updated items
 */
struct DigestContext
{
    std::vector<const Feed*> feeds;
    std::vector<ItemContext> items;
};

using TemplateArgs = std::map<std::string, Value>;

class IEvaluator
{
public:
    virtual ~IEvaluator() = default;
    /**
     * @brief evaluate Evaluates an expression against an item context
     * @return The resulting value
     *
     * Throws errors::EvalError if the expression is invalid or refers to a
     * missing field.
     * Implementations are expected to provide a regex matching test to their
     * expression language.
     */
    virtual Value evaluate( const std::string& expression, const ItemContext& ctx ) = 0;
    /**
     * @brief checkPredicate Validates that an expression compiles and yields
     * a boolean.
     *
     * This is invoked once per configuration load, for each filter expression.
     * Throws errors::EvalError when the expression can't be used as a predicate
     */
    virtual void checkPredicate( const std::string& expression ) = 0;
    /**
     * @brief render Renders an item subject or body template
     *
     * Throws errors::RenderError
     */
    virtual std::string render( const std::string& tmpl, const ItemContext& ctx,
                                const TemplateArgs& args ) = 0;
    /**
     * @brief renderDigest Renders a digest subject or body template
     *
     * Throws errors::RenderError
     */
    virtual std::string renderDigest( const std::string& tmpl,
                                      const DigestContext& ctx,
                                      const TemplateArgs& args ) = 0;
};

}
