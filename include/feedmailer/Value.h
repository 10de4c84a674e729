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
#include <string>

namespace feedmailer
{

/**
 * @brief Value The result of an expression evaluation
 */
class Value
{
public:
    enum class Type : uint8_t
    {
        Null,
        Boolean,
        Integer,
        Double,
        String,
    };

    Value() : m_type( Type::Null ), m_int( 0 ), m_double( 0 ) {}
    Value( bool b ) : m_type( Type::Boolean ), m_int( b ? 1 : 0 ), m_double( 0 ) {}
    Value( int64_t i ) : m_type( Type::Integer ), m_int( i ), m_double( 0 ) {}
    Value( int i ) : Value( static_cast<int64_t>( i ) ) {}
    Value( double d ) : m_type( Type::Double ), m_int( 0 ), m_double( d ) {}
    Value( std::string s )
        : m_type( Type::String ), m_int( 0 ), m_double( 0 ), m_str( std::move( s ) ) {}
    Value( const char* s ) : Value( std::string{ s } ) {}

    Type type() const { return m_type; }
    bool isNull() const { return m_type == Type::Null; }

    bool asBool() const { return m_int != 0; }
    int64_t asInteger() const { return m_int; }
    double asDouble() const { return m_double; }
    const std::string& asString() const { return m_str; }

    /**
     * @brief isTrue Returns the truthiness of this value
     *
     * null, false, 0 and the empty string are false, everything else is true
     */
    bool isTrue() const;

    /**
     * @brief toString Returns the textual form of this value, as used when
     * hashing update keys
     */
    std::string toString() const;

    bool operator==( const Value& v ) const;
    bool operator!=( const Value& v ) const { return !( *this == v ); }

private:
    Type m_type;
    int64_t m_int;
    double m_double;
    std::string m_str;
};

}
