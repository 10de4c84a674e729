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

#include "feedmailer/Value.h"

#include <cstdio>

namespace feedmailer
{

bool Value::isTrue() const
{
    switch ( m_type )
    {
        case Type::Null:
            return false;
        case Type::Boolean:
        case Type::Integer:
            return m_int != 0;
        case Type::Double:
            return m_double != 0.0;
        case Type::String:
            return m_str.empty() == false;
    }
    return false;
}

std::string Value::toString() const
{
    switch ( m_type )
    {
        case Type::Null:
            return {};
        case Type::Boolean:
            return m_int != 0 ? "true" : "false";
        case Type::Integer:
            return std::to_string( m_int );
        case Type::Double:
        {
            char buff[32];
            snprintf( buff, sizeof( buff ), "%.17g", m_double );
            return buff;
        }
        case Type::String:
            return m_str;
    }
    return {};
}

bool Value::operator==( const Value& v ) const
{
    if ( m_type != v.m_type )
        return false;
    switch ( m_type )
    {
        case Type::Null:
            return true;
        case Type::Boolean:
        case Type::Integer:
            return m_int == v.m_int;
        case Type::Double:
            return m_double == v.m_double;
        case Type::String:
            return m_str == v.m_str;
    }
    return false;
}

}
