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

#include "Batcher.h"

namespace feedmailer
{

namespace poll
{

namespace
{

Mail newMail( const Settings& settings, const std::string& from )
{
    Mail m;
    m.from = from;
    m.to = settings.to;
    m.cc = settings.cc;
    m.bcc = settings.bcc;
    return m;
}

}

Batcher::Delivery Batcher::plan( size_t nbItems, bool digest, uint32_t maxMailsPerCheck )
{
    if ( nbItems == 0 )
        return Delivery::None;
    if ( digest == false && nbItems <= maxMailsPerCheck )
        return Delivery::PerItem;
    return Delivery::Digest;
}

std::vector<Mail> Batcher::render( Delivery delivery, const Settings& settings,
                                   const std::vector<Feed>& feeds,
                                   const std::vector<ItemContext>& items,
                                   IEvaluator& evaluator, const std::string& from )
{
    std::vector<Mail> mails;
    switch ( delivery )
    {
        case Delivery::None:
            break;
        case Delivery::PerItem:
        {
            mails.reserve( items.size() );
            for ( const auto& ctx : items )
            {
                auto m = newMail( settings, from );
                m.subject = evaluator.render( settings.itemSubject, ctx,
                                              settings.templateArgs );
                m.body = evaluator.render( settings.itemBody, ctx,
                                           settings.templateArgs );
                mails.push_back( std::move( m ) );
            }
            break;
        }
        case Delivery::Digest:
        {
            DigestContext ctx;
            ctx.feeds.reserve( feeds.size() );
            for ( const auto& f : feeds )
                ctx.feeds.push_back( &f );
            ctx.items = items;
            auto m = newMail( settings, from );
            m.subject = evaluator.renderDigest( settings.digestSubject, ctx,
                                                settings.templateArgs );
            m.body = evaluator.renderDigest( settings.digestBody, ctx,
                                             settings.templateArgs );
            mails.push_back( std::move( m ) );
            break;
        }
    }
    return mails;
}

}

}
