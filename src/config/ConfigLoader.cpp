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

#include "ConfigLoader.h"

#include "feedmailer/Errors.h"
#include "logging/Logger.h"
#include "utils/Date.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace feedmailer
{

namespace
{

std::string readFile( const std::string& path )
{
    std::ifstream f{ path, std::ios::in | std::ios::binary };
    if ( f.is_open() == false )
        throw errors::ConfigError( "can't open " + path );
    std::ostringstream ss;
    ss << f.rdbuf();
    if ( f.bad() == true )
        throw errors::ConfigError( "can't read " + path );
    return ss.str();
}

std::string dirName( const std::string& path )
{
    auto pos = path.find_last_of( '/' );
    if ( pos == std::string::npos )
        return ".";
    if ( pos == 0 )
        return "/";
    return path.substr( 0, pos );
}

std::string getString( const rapidjson::Value& v, const char* key )
{
    if ( v.IsString() == false )
        throw errors::ConfigError( std::string{ "'" } + key + "' must be a string" );
    return std::string{ v.GetString(), v.GetStringLength() };
}

bool getBool( const rapidjson::Value& v, const char* key )
{
    if ( v.IsBool() == false )
        throw errors::ConfigError( std::string{ "'" } + key + "' must be a boolean" );
    return v.GetBool();
}

/* Accepts either a single string or a list of strings */
std::vector<std::string> getStringList( const rapidjson::Value& v, const char* key )
{
    std::vector<std::string> res;
    if ( v.IsString() == true )
    {
        res.emplace_back( v.GetString(), v.GetStringLength() );
        return res;
    }
    if ( v.IsArray() == false )
        throw errors::ConfigError( std::string{ "'" } + key +
                                   "' must be a string or a list of strings" );
    for ( const auto& e : v.GetArray() )
        res.push_back( getString( e, key ) );
    return res;
}

std::chrono::seconds getDuration( const rapidjson::Value& v, const char* key )
{
    if ( v.IsUint() == true )
    {
        if ( v.GetUint() > utils::date::MaxDuration )
            throw errors::ConfigError( std::string{ "'" } + key + "': " +
                                       std::to_string( v.GetUint() ) +
                                       "s exceeds the longest supported duration" );
        return std::chrono::seconds{ v.GetUint() };
    }
    auto str = getString( v, key );
    std::chrono::seconds res;
    if ( utils::date::parseDuration( str, res ) == false )
        throw errors::ConfigError( std::string{ "'" } + key + "': invalid duration '" +
                                   str + "'" );
    return res;
}

std::string getTemplate( const rapidjson::Value& v, const char* key,
                         const std::string& baseDir )
{
    if ( v.IsString() == true )
        return std::string{ v.GetString(), v.GetStringLength() };
    if ( v.IsObject() == false || v.MemberCount() != 1 || v.HasMember( "file" ) == false )
        throw errors::ConfigError( std::string{ "'" } + key +
                                   "' must be a template string or {\"file\": path}" );
    auto path = getString( v["file"], "file" );
    if ( path.empty() == true )
        throw errors::ConfigError( std::string{ "'" } + key + "': empty template path" );
    if ( path[0] != '/' )
        path = baseDir + '/' + path;
    LOG_DEBUG( "Loading template ", path );
    return readFile( path );
}

Value toValue( const rapidjson::Value& v, const std::string& key )
{
    if ( v.IsNull() == true )
        return Value{};
    if ( v.IsBool() == true )
        return Value{ v.GetBool() };
    if ( v.IsInt64() == true )
        return Value{ static_cast<int64_t>( v.GetInt64() ) };
    if ( v.IsNumber() == true )
        return Value{ v.GetDouble() };
    if ( v.IsString() == true )
        return Value{ std::string{ v.GetString(), v.GetStringLength() } };
    throw errors::ConfigError( "template argument '" + key +
                               "' must be a scalar value" );
}

/*
 * Applies a single settings key. Returns false if the key isn't a settings
 * key, letting the caller decide whether it's valid in its context
 */
bool applySetting( const std::string& name, const rapidjson::Value& v,
                   Settings& s, const std::string& baseDir )
{
    const auto key = name.c_str();
    if ( name == "to" )
        s.to = getStringList( v, key );
    else if ( name == "cc" )
        s.cc = getStringList( v, key );
    else if ( name == "bcc" )
        s.bcc = getStringList( v, key );
    else if ( name == "digest" )
        s.digest = getBool( v, key );
    else if ( name == "item-subject" )
        s.itemSubject = getTemplate( v, key, baseDir );
    else if ( name == "item-body" )
        s.itemBody = getTemplate( v, key, baseDir );
    else if ( name == "digest-subject" )
        s.digestSubject = getTemplate( v, key, baseDir );
    else if ( name == "digest-body" )
        s.digestBody = getTemplate( v, key, baseDir );
    else if ( name == "template-args" )
    {
        if ( v.IsObject() == false )
            throw errors::ConfigError( "'template-args' must be an object" );
        for ( const auto& m : v.GetObject() )
        {
            std::string argName{ m.name.GetString(), m.name.GetStringLength() };
            s.templateArgs[argName] = toValue( m.value, argName );
        }
    }
    else if ( name == "update-keys" || name == "update-key" )
    {
        s.updateKeys = getStringList( v, key );
        if ( s.updateKeys.empty() == true )
            throw errors::ConfigError( "'update-keys' can't be empty" );
    }
    else if ( name == "interval" )
        s.interval = getDuration( v, key );
    else if ( name == "keep-old" )
        s.keepOld = getDuration( v, key );
    else if ( name == "timeout" )
        s.timeout = getDuration( v, key );
    else if ( name == "max-mails-per-check" )
    {
        if ( v.IsUint() == false )
            throw errors::ConfigError( "'max-mails-per-check' must be a positive integer" );
        s.maxMailsPerCheck = v.GetUint();
    }
    else if ( name == "sanitize" )
        s.sanitize = getBool( v, key );
    else if ( name == "sort-by-last-modified" )
        s.sortByLastModified = getBool( v, key );
    else if ( name == "http-headers" )
    {
        if ( v.IsObject() == false )
            throw errors::ConfigError( "'http-headers' must be an object" );
        s.httpHeaders.clear();
        for ( const auto& m : v.GetObject() )
        {
            std::string headerName{ m.name.GetString(), m.name.GetStringLength() };
            s.httpHeaders.emplace_back( headerName,
                                        getString( m.value, headerName.c_str() ) );
        }
    }
    else
        return false;
    return true;
}

FilterNode parseFilter( const rapidjson::Value& v )
{
    if ( v.IsObject() == false || v.MemberCount() != 1 )
        throw errors::ConfigError( "a filter must be an object with a single key" );
    const auto& m = *v.MemberBegin();
    std::string name{ m.name.GetString(), m.name.GetStringLength() };
    if ( name == "and" || name == "all" || name == "or" || name == "any" )
    {
        if ( m.value.IsArray() == false )
            throw errors::ConfigError( "'" + name + "' filter expects a list" );
        std::vector<FilterNode> children;
        for ( const auto& c : m.value.GetArray() )
            children.push_back( parseFilter( c ) );
        if ( name == "and" || name == "all" )
            return FilterNode::all( std::move( children ) );
        return FilterNode::any( std::move( children ) );
    }
    if ( name == "not" )
    {
        if ( m.value.IsArray() == true )
        {
            if ( m.value.Size() != 1 )
                throw errors::ConfigError( "a 'not' filter takes exactly one operand, " +
                                           std::to_string( m.value.Size() ) + " provided" );
            return FilterNode::negate( parseFilter( m.value[0] ) );
        }
        return FilterNode::negate( parseFilter( m.value ) );
    }
    if ( name == "title-regex" )
        return FilterNode::titleRegex( getString( m.value, "title-regex" ) );
    if ( name == "body-regex" )
        return FilterNode::bodyRegex( getString( m.value, "body-regex" ) );
    if ( name == "expr" )
        return FilterNode::expression( getString( m.value, "expr" ) );
    throw errors::ConfigError( "unknown filter kind '" + name + "'" );
}

FeedGroupConfig parseFeed( const rapidjson::Value& v, const Settings& globals,
                           const std::string& baseDir )
{
    if ( v.IsObject() == false )
        throw errors::ConfigError( "a feed entry must be an object" );
    FeedGroupConfig feed;
    feed.settings = globals;
    for ( const auto& m : v.GetObject() )
    {
        std::string name{ m.name.GetString(), m.name.GetStringLength() };
        if ( name == "url" || name == "urls" )
        {
            auto urls = getStringList( m.value, name.c_str() );
            feed.urls.insert( end( feed.urls ), begin( urls ), end( urls ) );
        }
        else if ( name == "filter" )
            feed.filter = std::make_shared<const FilterNode>( parseFilter( m.value ) );
        else if ( applySetting( name, m.value, feed.settings, baseDir ) == false )
            throw errors::ConfigError( "unknown feed key '" + name + "'" );
    }
    if ( feed.urls.empty() == true )
        throw errors::ConfigError( "a feed entry requires at least one URL" );
    return feed;
}

}

Config ConfigLoader::fromFile( const std::string& path )
{
    auto json = readFile( path );
    return fromString( json, dirName( path ) );
}

Config ConfigLoader::fromString( const std::string& json, const std::string& baseDir )
{
    rapidjson::Document doc;
    doc.Parse( json.c_str(), json.size() );
    if ( doc.HasParseError() == true )
        throw errors::ConfigError( std::string{ "JSON parse error at offset " } +
                                   std::to_string( doc.GetErrorOffset() ) + ": " +
                                   rapidjson::GetParseError_En( doc.GetParseError() ) );
    if ( doc.IsObject() == false )
        throw errors::ConfigError( "the configuration must be a JSON object" );

    Config config;
    /* Global settings first, since feeds are resolved against them */
    if ( doc.HasMember( "settings" ) == true )
    {
        const auto& settings = doc["settings"];
        if ( settings.IsObject() == false )
            throw errors::ConfigError( "'settings' must be an object" );
        for ( const auto& m : settings.GetObject() )
        {
            std::string name{ m.name.GetString(), m.name.GetStringLength() };
            if ( applySetting( name, m.value, config.globals, baseDir ) == false )
                throw errors::ConfigError( "unknown settings key '" + name + "'" );
        }
    }
    for ( const auto& m : doc.GetObject() )
    {
        std::string name{ m.name.GetString(), m.name.GetStringLength() };
        if ( name == "settings" )
            continue;
        if ( name == "error-report-to" )
            config.errorReportTo = getStringList( m.value, "error-report-to" );
        else if ( name == "feeds" )
        {
            if ( m.value.IsArray() == false )
                throw errors::ConfigError( "'feeds' must be a list" );
            for ( const auto& f : m.value.GetArray() )
                config.feeds.push_back( parseFeed( f, config.globals, baseDir ) );
        }
        else
            throw errors::ConfigError( "unknown top level key '" + name + "'" );
    }
    return config;
}

int64_t ConfigLoader::modificationTime( const std::string& path )
{
    struct stat s;
    if ( stat( path.c_str(), &s ) != 0 )
        return 0;
    return static_cast<int64_t>( s.st_mtim.tv_sec ) * 1000000000 + s.st_mtim.tv_nsec;
}

}
