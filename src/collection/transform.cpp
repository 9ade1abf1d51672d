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
#include <fluent/collection.hpp>
#include <fluent/arr.hpp>
#include <fluent/error/error.hpp>
#include <fluent/value/compare.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <random>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] std::mt19937_64 make_engine( std::optional<std::uint64_t> const seed )
    {
        if ( seed )
            return std::mt19937_64{ *seed };
        std::random_device entropy;
        return std::mt19937_64{ ( std::uint64_t{ entropy() } << 32 ) | entropy() };
    }

    [[ nodiscard ]] bool matches_any( std::vector<value> const & candidates, value const & item, bool const strict )
    {
        return std::ranges::any_of( candidates, [ & ]( value const & candidate ) { return strict ? strict_equal( candidate, item ) : loose_equal( candidate, item ); } );
    }

    [[ nodiscard ]] bool loosely_contained( map_type const & items, value const & item )
    {
        return std::ranges::any_of( items.values(), [ & ]( value const & candidate ) { return loose_equal( candidate, item ); } );
    }

    [[ nodiscard ]] bool apply_operator( value const & retrieved, std::string_view const op, value const & operand )
    {
        if ( op == "===" ) return  strict_equal( retrieved, operand );
        if ( op == "!==" ) return !strict_equal( retrieved, operand );
        if ( op == "!=" || op == "<>" ) return !loose_equal( retrieved, operand );
        if ( op == "<"  ) return loose_compare( retrieved, operand ) <  0;
        if ( op == ">"  ) return loose_compare( retrieved, operand ) >  0;
        if ( op == "<=" ) return loose_compare( retrieved, operand ) <= 0;
        if ( op == ">=" ) return loose_compare( retrieved, operand ) >= 0;
        // "=", "==" and unrecognized operators
        return loose_equal( retrieved, operand );
    }

    [[ nodiscard ]] std::vector<value> values_of( source const & items )
    {
        auto const normalized{ items.normalize() };
        return std::vector<value>( normalized.values().begin(), normalized.values().end() );
    }
} // anonymous namespace

collection collection::permuted( std::vector<size_type> const & order, bool const renumber ) const
{
    BOOST_ASSERT( order.size() <= items_.size() );
    collection result;
    result.items_.reserve( order.size() );
    for ( auto const pos : order )
    {
        if ( renumber )
            result.items_.push_back( items_.value_at( pos ) );
        else
            result.items_.insert_or_assign( items_.key_at( pos ), items_.value_at( pos ) );
    }
    return result;
}

collection collection::filtered( entry_predicate const & predicate ) const
{
    collection result;
    for ( auto const & [ k, v ] : items_ )
    {
        if ( predicate( k, v ) )
            result.items_.insert_or_assign( k, v );
    }
    return result;
}

//------------------------------------------------------------------------------
// Mapping
//------------------------------------------------------------------------------

collection collection::map( item_function const & fn ) const
{
    collection result;
    result.items_.reserve( items_.size() );
    for ( auto const & [ k, v ] : items_ )
        result.items_.insert_or_assign( k, fn( v, k ) );
    return result;
}

collection collection::flat_map( item_function const & fn ) const
{
    return map( fn ).collapse();
}

collection collection::map_with_keys( item_function const & fn ) const
{
    collection result;
    for ( auto const & [ k, v ] : items_ )
    {
        auto const mapped{ fn( v, k ) };
        if ( auto const entries{ mapped.entries() } )
        {
            for ( auto const & [ mapped_key, mapped_value ] : *entries )
                result.items_.insert_or_assign( mapped_key, mapped_value );
        }
    }
    return result;
}

//------------------------------------------------------------------------------
// Filtering
//------------------------------------------------------------------------------

collection collection::filter( entry_predicate const & predicate ) const
{
    if ( predicate )
        return filtered( predicate );
    return filtered( []( key const &, value const & v ) { return truthy( v ); } );
}

collection collection::reject( item_predicate const & predicate ) const
{
    return filtered( [ & ]( key const & k, value const & v ) { return !predicate( v, k ); } );
}

collection collection::reject( value const & item ) const
{
    return filtered( [ & ]( key const &, value const & v ) { return !loose_equal( v, item ); } );
}

collection collection::where( std::string_view const path, value const & operand ) const
{
    return where( path, "=", operand );
}

collection collection::where( std::string_view const path, std::string_view const op, value const & operand ) const
{
    auto const segments{ arr::explode_path( path ) };
    return filtered( [ & ]( key const &, value const & v ) { return apply_operator( arr::data_get( v, segments ), op, operand ); } );
}

collection collection::where_strict( std::string_view const path, value const & operand ) const
{
    return where( path, "===", operand );
}

collection collection::where_in( std::string_view const path, source const & values, bool const strict ) const
{
    auto const segments  { arr::explode_path( path ) };
    auto const candidates{ values_of( values ) };
    return filtered( [ & ]( key const &, value const & v ) { return matches_any( candidates, arr::data_get( v, segments ), strict ); } );
}

collection collection::unique( selector const & by, bool const strict ) const
{
    std::vector<value> seen;
    collection result;
    for ( auto const & [ k, v ] : items_ )
    {
        auto id{ by( v, k ) };
        if ( matches_any( seen, id, strict ) )
            continue;
        seen.push_back( std::move( id ) );
        result.items_.insert_or_assign( k, v );
    }
    return result;
}

//------------------------------------------------------------------------------
// Keys and values
//------------------------------------------------------------------------------

collection collection::values() const
{
    collection result;
    result.items_.reserve( items_.size() );
    for ( auto const & v : items_.values() )
        result.items_.push_back( v );
    return result;
}

collection collection::keys() const
{
    collection result;
    result.items_.reserve( items_.size() );
    for ( auto const & k : items_.keys() )
        result.items_.push_back( value( k ) );
    return result;
}

collection collection::flip() const
{
    collection result;
    for ( auto const & [ k, v ] : items_ )
    {
        if ( !v.is_integer() && !v.is_string() )
            detail::throw_invalid_argument( std::string{ "Can only flip string and integer values, got " } + fluent::to_string( v.kind() ) + '.' );
        result.items_.insert_or_assign( arr::to_key( v ), value( k ) );
    }
    return result;
}

collection collection::flatten ( std::size_t const depth ) const { return collection( arr::flatten( items_, depth ) ); }
collection collection::collapse(                         ) const { return collection( arr::collapse( items_ ) ); }

//------------------------------------------------------------------------------
// Set like operations
//------------------------------------------------------------------------------

collection collection::combine( source const & values ) const
{
    auto const others{ values.normalize() };
    if ( others.size() != items_.size() )
        detail::throw_invalid_argument( "Both parameters should have an equal number of elements." );
    collection result;
    for ( size_type pos{ 0 }; pos != items_.size(); ++pos )
        result.items_.insert_or_assign( arr::to_key( items_.value_at( pos ) ), others.value_at( pos ) );
    return result;
}

collection collection::merge( source const & other ) const
{
    collection result( *this );
    arr::merge_into( result.items_, other.normalize() );
    return result;
}

collection collection::union_with( source const & other ) const
{
    collection result( *this );
    for ( auto const & [ k, v ] : other.normalize() )
        result.items_.try_emplace( k, v );
    return result;
}

collection collection::diff( source const & other ) const
{
    auto const others{ other.normalize() };
    return filtered( [ & ]( key const &, value const & v ) { return !loosely_contained( others, v ); } );
}

collection collection::diff_keys( source const & other ) const
{
    auto const others{ other.normalize() };
    return filtered( [ & ]( key const & k, value const & ) { return !others.contains( k ); } );
}

collection collection::intersect( source const & other ) const
{
    auto const others{ other.normalize() };
    return filtered( [ & ]( key const &, value const & v ) { return loosely_contained( others, v ); } );
}

collection collection::only  ( std::vector<key> const & keys ) const { return collection( arr::only  ( items_, keys ) ); }
collection collection::except( std::vector<key> const & keys ) const { return collection( arr::except( items_, keys ) ); }

collection collection::pluck( std::string_view const value_path, std::optional<std::string_view> const key_path ) const
{
    return collection( arr::pluck( items_, value_path, key_path ) );
}

//------------------------------------------------------------------------------
// Grouping
//------------------------------------------------------------------------------

collection collection::group_by( selector const & group_key, bool const preserve_keys ) const
{
    map_type groups;
    for ( auto const & [ k, v ] : items_ )
    {
        auto const resolved_key{ group_key( v, k ) };

        std::vector<value> group_keys;
        if ( auto const entries{ resolved_key.entries() } )
            group_keys.assign( entries->values().begin(), entries->values().end() );
        else
            group_keys.push_back( resolved_key );

        for ( auto const & gk : group_keys )
        {
            auto & group{ groups[ arr::to_key( gk ) ] };
            if ( group.is_null() )
                group = value( map_type{} );
            if ( preserve_keys )
                group.as_map().insert_or_assign( k, v );
            else
                group.as_map().push_back( v );
        }
    }

    collection result;
    result.items_.reserve( groups.size() );
    for ( auto && [ gk, group ] : groups )
        result.items_.insert_or_assign( gk, value( collection( std::move( group.as_map() ) ) ) );
    return result;
}

collection collection::key_by( selector const & key_selector ) const
{
    collection result;
    for ( auto const & [ k, v ] : items_ )
        result.items_.insert_or_assign( arr::to_key( key_selector( v, k ) ), v );
    return result;
}

//------------------------------------------------------------------------------
// Ordering
//------------------------------------------------------------------------------

collection collection::reverse() const
{
    std::vector<size_type> order( items_.size() );
    std::iota( order.rbegin(), order.rend(), size_type{ 0 } );
    return permuted( order );
}

collection collection::shuffle( std::optional<std::uint64_t> const seed ) const
{
    std::vector<size_type> order( items_.size() );
    std::iota( order.begin(), order.end(), size_type{ 0 } );
    auto engine{ make_engine( seed ) };
    std::shuffle( order.begin(), order.end(), engine );
    return permuted( order, true );
}

//------------------------------------------------------------------------------
// Partitioning
//------------------------------------------------------------------------------

collection collection::chunk( std::int64_t const size ) const
{
    collection chunks;
    if ( size <= 0 )
        return chunks;
    map_type current;
    for ( auto const & [ k, v ] : items_ )
    {
        current.insert_or_assign( k, v );
        if ( static_cast<std::int64_t>( current.size() ) == size )
        {
            chunks.items_.push_back( value( collection( std::move( current ) ) ) );
            current = map_type{};
        }
    }
    if ( !current.empty() )
        chunks.items_.push_back( value( collection( std::move( current ) ) ) );
    return chunks;
}

collection collection::split( std::size_t const groups ) const
{
    if ( groups == 0 )
        detail::throw_invalid_argument( "The number of groups must be greater than zero." );
    if ( items_.empty() )
        return {};
    auto const group_size{ items_.size() / groups + ( items_.size() % groups != 0 ) };
    return chunk( static_cast<std::int64_t>( group_size ) );
}

collection collection::every( std::int64_t const step, std::int64_t const offset ) const
{
    if ( step <= 0 )
        detail::throw_invalid_argument( "The step must be a positive integer." );
    collection result;
    std::int64_t position{ 0 };
    for ( auto const & v : items_.values() )
    {
        if ( position++ % step == offset )
            result.items_.push_back( v );
    }
    return result;
}

collection collection::slice( std::int64_t const offset, std::optional<std::int64_t> const length ) const
{
    auto const [ start, stop ]{ arr::slice_bounds( items_.size(), offset, length ) };
    std::vector<size_type> order( stop - start );
    std::iota( order.begin(), order.end(), start );
    return permuted( order );
}

collection collection::for_page( std::int64_t const page, std::int64_t const per_page ) const
{
    // pages before the first start at offset 0, pages past the end are empty
    std::int64_t offset{ 0 };
    if ( page > 1 && per_page > 0 )
    {
        auto const size{ static_cast<std::int64_t>( items_.size() ) };
        offset = ( page - 1 > size / per_page ) ? size : ( page - 1 ) * per_page;
    }
    return slice( offset, per_page );
}

collection collection::take( std::int64_t const limit ) const
{
    if ( limit >= 0 )
        return slice( 0, limit );
    auto const size{ static_cast<std::int64_t>( items_.size() ) };
    auto const wanted{ limit < -size ? size : -limit };
    return slice( -wanted, wanted );
}

collection collection::zip( std::vector<source> const & others ) const
{
    std::vector<map_type> columns;
    columns.reserve( others.size() );
    auto rows{ items_.size() };
    for ( auto const & other : others )
    {
        columns.push_back( other.normalize() );
        rows = std::max( rows, columns.back().size() );
    }

    collection result;
    result.items_.reserve( rows );
    for ( size_type row{ 0 }; row != rows; ++row )
    {
        map_type tuple;
        tuple.reserve( columns.size() + 1 );
        tuple.push_back( row < items_.size() ? items_.value_at( row ) : value{} );
        for ( auto const & column : columns )
            tuple.push_back( row < column.size() ? column.value_at( row ) : value{} );
        result.items_.push_back( value( collection( std::move( tuple ) ) ) );
    }
    return result;
}

//------------------------------------------------------------------------------
// Element production
//------------------------------------------------------------------------------

collection collection::append( value item, std::optional<key> const & k ) const
{
    collection result( *this );
    result.set( k, std::move( item ) );
    return result;
}

value collection::random() const
{
    if ( items_.empty() )
        detail::throw_not_enough_items( 1, 0 );
    auto engine{ make_engine( std::nullopt ) };
    std::uniform_int_distribution<size_type> pick( 0, items_.size() - 1 );
    return items_.value_at( pick( engine ) );
}

collection collection::random( std::size_t const amount, std::optional<std::uint64_t> const seed ) const
{
    if ( amount > items_.size() )
        detail::throw_not_enough_items( amount, items_.size() );
    std::vector<size_type> all_positions( items_.size() );
    std::iota( all_positions.begin(), all_positions.end(), size_type{ 0 } );
    std::vector<size_type> order;
    order.reserve( amount );
    auto engine{ make_engine( seed ) };
    std::sample( all_positions.begin(), all_positions.end(), std::back_inserter( order ), amount, engine );
    return permuted( order, true );
}

std::string collection::implode( std::string_view const value_or_glue, std::optional<std::string_view> const glue ) const
{
    std::string joined;
    auto const append_joined{ [ & ]( auto const & pieces, std::string_view const separator )
    {
        bool first_piece{ true };
        for ( auto const & piece : pieces )
        {
            if ( !std::exchange( first_piece, false ) )
                joined += separator;
            joined += fluent::to_string( piece );
        }
    } };

    auto const head{ first() };
    if ( head.is_composite() || head.is_object() )
        append_joined( arr::pluck( items_, value_or_glue ).values(), glue.value_or( std::string_view{} ) );
    else
        append_joined( items_.values(), value_or_glue );
    return joined;
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
