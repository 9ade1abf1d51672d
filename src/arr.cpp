////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#include <fluent/arr.hpp>
#include <fluent/collection.hpp>
#include <fluent/value/compare.hpp>

#include <algorithm>
#include <cmath>
//------------------------------------------------------------------------------
namespace fluent::arr
{
//------------------------------------------------------------------------------

std::vector<std::string> explode_path( std::string_view dot_path )
{
    std::vector<std::string> segments;
    for ( ;; )
    {
        auto const dot{ dot_path.find( '.' ) };
        segments.emplace_back( dot_path.substr( 0, dot ) );
        if ( dot == dot_path.npos )
            break;
        dot_path.remove_prefix( dot + 1 );
    }
    return segments;
}

std::optional<map_type> arrayable( value const & v )
{
    if ( auto const items{ v.entries() } )
        return *items;
    if ( v.is_object() )
    {
        if ( auto entries{ v.as_object().entries() } )
            return entries;
        return v.as_object().to_array();
    }
    return std::nullopt;
}

value data_get( value const & target, std::string_view const dot_path, value const & fallback )
{
    auto const segments{ explode_path( dot_path ) };
    return data_get( target, segments, fallback );
}

value data_get( value const & target, std::span<std::string const> const segments, value const & fallback )
{
    value current( target );
    for ( std::size_t i{ 0 }; i != segments.size(); ++i )
    {
        auto const & segment{ segments[ i ] };
        if ( segment == wildcard )
        {
            auto const items{ current.entries() };
            if ( !items )
                return fallback;

            auto const remaining{ segments.subspan( i + 1 ) };
            map_type results;
            results.reserve( items->size() );
            for ( auto const & [ k, item ] : *items )
                results.push_back( data_get( item, remaining, fallback ) );

            auto const nested_wildcard{ std::find( remaining.begin(), remaining.end(), wildcard ) != remaining.end() };
            return value( nested_wildcard ? collapse( results ) : std::move( results ) );
        }

        auto field{ current.find_field( segment ) };
        if ( !field )
            return fallback;
        current = std::move( *field );
    }
    return current;
}

map_type pluck( map_type const & items, std::string_view const value_path, std::optional<std::string_view> const key_path )
{
    auto const value_segments{ explode_path( value_path ) };
    std::vector<std::string> key_segments;
    if ( key_path )
        key_segments = explode_path( *key_path );

    map_type results;
    for ( auto const & [ k, item ] : items )
    {
        auto item_value{ data_get( item, value_segments ) };
        if ( !key_path )
            results.push_back( std::move( item_value ) );
        else
            results.insert_or_assign( to_key( data_get( item, key_segments ) ), std::move( item_value ) );
    }
    return results;
}

map_type only( map_type const & items, std::span<key const> const keys )
{
    map_type result;
    for ( auto const & [ k, v ] : items )
    {
        if ( std::find( keys.begin(), keys.end(), k ) != keys.end() )
            result.insert_or_assign( k, v );
    }
    return result;
}

map_type except( map_type const & items, std::span<key const> const keys )
{
    map_type result( items );
    for ( auto const & k : keys )
        result.erase( k );
    return result;
}

map_type flatten( map_type const & items, std::size_t const depth )
{
    map_type result;
    for ( auto const & [ k, item ] : items )
    {
        auto const nested{ item.entries() };
        if ( !nested )
        {
            result.push_back( item );
            continue;
        }
        if ( depth == 1 )
        {
            for ( auto const & [ nested_key, nested_value ] : *nested )
                result.push_back( nested_value );
        }
        else
        {
            auto const next_depth{ depth == unbounded_depth ? depth : depth - 1 };
            for ( auto && [ nested_key, nested_value ] : flatten( *nested, next_depth ) )
                result.push_back( std::move( nested_value ) );
        }
    }
    return result;
}

map_type collapse( map_type const & items )
{
    map_type result;
    for ( auto const & [ k, item ] : items )
    {
        if ( auto const nested{ item.entries() } )
            merge_into( result, *nested );
    }
    return result;
}

void merge_into( map_type & target, map_type const & source )
{
    for ( auto const & [ k, v ] : source )
    {
        if ( k.is_integer() )
            target.push_back( v );
        else
            target.insert_or_assign( k, v );
    }
}

std::pair<std::size_t, std::size_t> slice_bounds( std::size_t const size, std::int64_t const offset, std::optional<std::int64_t> const length ) noexcept
{
    auto const count{ static_cast<std::int64_t>( size ) };
    auto const start{ offset < 0 ? std::max<std::int64_t>( count + offset, 0 ) : std::min( offset, count ) };
    auto       stop { count };
    if ( length )
        stop = *length < 0 ? count + *length : start + std::min( *length, count - start );
    stop = std::max( start, stop );
    return { static_cast<std::size_t>( start ), static_cast<std::size_t>( stop ) };
}

key to_key( value const & v )
{
    switch ( v.kind() )
    {
        case value_kind::null    : return key{ std::string{} };
        case value_kind::boolean : return key{ v.as_bool() ? 1 : 0 };
        case value_kind::integer : return key{ v.as_integer() };
        case value_kind::floating: return key{ static_cast<std::int64_t>( std::trunc( v.as_floating() ) ) };
        case value_kind::string  : return key{ v.as_string() };
        default                  : return key{ to_string( v ) };
    }
}

//------------------------------------------------------------------------------
} // namespace fluent::arr
//------------------------------------------------------------------------------
