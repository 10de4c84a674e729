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

#include "Filter.h"
#include "RegexCache.h"

#include "feedmailer/Errors.h"
#include "utils/Strings.h"

#include <re2/re2.h>

namespace feedmailer
{

Filter::Filter( Type type, std::string value )
    : m_type( type )
    , m_value( std::move( value ) )
{
}

std::shared_ptr<const Filter> Filter::compile( const FilterNode& node,
                                               uint64_t generation,
                                               RegexCache& cache,
                                               IEvaluator& evaluator )
{
    return std::make_shared<const Filter>(
                compileNode( node, generation, cache, evaluator ) );
}

Filter Filter::compileNode( const FilterNode& node, uint64_t generation,
                            RegexCache& cache, IEvaluator& evaluator )
{
    Filter f{ node.type, node.value };
    switch ( node.type )
    {
        case Type::Not:
            if ( node.children.size() != 1 )
                throw errors::ConfigError( "a 'not' filter takes exactly one operand, " +
                                           std::to_string( node.children.size() ) +
                                           " provided" );
            /* fall through */
        case Type::And:
        case Type::Or:
            f.m_children.reserve( node.children.size() );
            for ( const auto& c : node.children )
                f.m_children.push_back( compileNode( c, generation, cache, evaluator ) );
            break;
        case Type::TitleRegex:
        case Type::BodyRegex:
            f.m_regex = cache.get( generation, node.value );
            break;
        case Type::Expression:
            try
            {
                evaluator.checkPredicate( node.value );
            }
            catch ( const errors::EvalError& ex )
            {
                throw errors::ConfigError( std::string{ "invalid filter expression: " } +
                                           ex.what() );
            }
            break;
    }
    return f;
}

bool Filter::matches( const ItemContext& ctx, IEvaluator& evaluator ) const
{
    switch ( m_type )
    {
        case Type::And:
            for ( const auto& c : m_children )
                if ( c.matches( ctx, evaluator ) == false )
                    return false;
            return true;
        case Type::Or:
            for ( const auto& c : m_children )
                if ( c.matches( ctx, evaluator ) == true )
                    return true;
            return false;
        case Type::Not:
            return m_children[0].matches( ctx, evaluator ) == false;
        case Type::TitleRegex:
            return re2::RE2::PartialMatch( utils::str::stripHtml( ctx.item->title ),
                                           *m_regex );
        case Type::BodyRegex:
            return re2::RE2::PartialMatch( utils::str::stripHtml( ctx.item->summary ),
                                           *m_regex ) ||
                   re2::RE2::PartialMatch( utils::str::stripHtml( ctx.item->content ),
                                           *m_regex );
        case Type::Expression:
            return evaluator.evaluate( m_value, ctx ).isTrue();
    }
    return false;
}

Filter::Type Filter::type() const
{
    return m_type;
}

const std::string& Filter::value() const
{
    return m_value;
}

const std::vector<Filter>& Filter::children() const
{
    return m_children;
}

}
