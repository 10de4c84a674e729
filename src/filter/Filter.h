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
#include <memory>
#include <string>
#include <vector>

#include "feedmailer/Config.h"
#include "feedmailer/IEvaluator.h"

namespace re2
{
class RE2;
}

namespace feedmailer
{

class RegexCache;

/**
 * @brief Filter A compiled FilterNode tree
 *
 * Patterns are compiled once per configuration generation, and expression
 * leaves have been validated by the evaluator at compile time.
 */
class Filter
{
public:
    using Type = FilterNode::Type;

    /**
     * @brief compile Validates and compiles a filter tree
     *
     * Throws errors::ConfigError on an invalid pattern, an expression
     * rejected by the evaluator, or a Not node without exactly one child.
     */
    static std::shared_ptr<const Filter> compile( const FilterNode& node,
                                                  uint64_t generation,
                                                  RegexCache& cache,
                                                  IEvaluator& evaluator );

    /**
     * @brief matches Evaluates the filter against an entry
     *
     * And/Or short circuit over their children, in order. An empty And
     * matches, an empty Or doesn't.
     * Throws errors::EvalError if an expression leaf fails for this entry.
     */
    bool matches( const ItemContext& ctx, IEvaluator& evaluator ) const;

    Type type() const;
    const std::string& value() const;
    const std::vector<Filter>& children() const;

private:
    Filter( Type type, std::string value );
    static Filter compileNode( const FilterNode& node, uint64_t generation,
                               RegexCache& cache, IEvaluator& evaluator );

private:
    Type m_type;
    std::string m_value;
    std::shared_ptr<const re2::RE2> m_regex;
    std::vector<Filter> m_children;
};

}
