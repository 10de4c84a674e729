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

#include <string>
#include <vector>

#include "feedmailer/Hash.h"
#include "feedmailer/IEvaluator.h"

namespace feedmailer
{

namespace poll
{

/**
 * @brief fingerprint Computes the dedup fingerprint of an entry
 *
 * Every update key is evaluated against the {feed, item} context, in the
 * configured order, and the textual results are hashed together.
 * Throws errors::EvalError if any of the keys fails for this entry.
 */
Hash fingerprint( const std::vector<std::string>& updateKeys,
                  const ItemContext& ctx, IEvaluator& evaluator );

}

}
