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

//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    // integer keys get the next free index of the target, string keys are kept
    void append_entry( map_type & target, key const & k, value && v )
    {
        if ( k.is_integer() )
            target.push_back( std::move( v ) );
        else
            target.insert_or_assign( k, std::move( v ) );
    }
} // anonymous namespace

collection::collection( std::initializer_list<value> const items )
{
    items_.reserve( items.size() );
    for ( auto const & item : items )
        items_.push_back( item );
}

collection::collection( std::initializer_list<map_type::value_type> const items ) : items_( items ) {}

collection::collection( source items ) : items_{ items.normalize() } {}

//------------------------------------------------------------------------------
// Element access
//------------------------------------------------------------------------------

value collection::get( key const & k, value fallback ) const
{
    if ( auto const found{ items_.find_value( k ) } )
        return *found;
    return fallback;
}

value const & collection::operator[]( key const & k ) const { return at( k ); }

value const & collection::at( key const & k ) const
{
    auto const found{ items_.find_value( k ) };
    if ( !found ) [[ unlikely ]]
        detail::throw_missing_key( k.to_string() );
    return *found;
}

value & collection::at( key const & k )
{
    auto const found{ items_.find_value( k ) };
    if ( !found ) [[ unlikely ]]
        detail::throw_missing_key( k.to_string() );
    return *found;
}

collection & collection::set( std::optional<key> const & k, value v )
{
    if ( k )
        items_.insert_or_assign( *k, std::move( v ) );
    else
        items_.push_back( std::move( v ) );
    return *this;
}

collection & collection::unset( key const & k )
{
    items_.erase( k );
    return *this;
}

collection & collection::forget( key const & k ) { return unset( k ); }

collection & collection::forget( std::vector<key> const & keys )
{
    for ( auto const & k : keys )
        items_.erase( k );
    return *this;
}

//------------------------------------------------------------------------------
// First / last
//------------------------------------------------------------------------------

value collection::first( entry_predicate const & predicate, value fallback ) const
{
    if ( !predicate )
        return items_.empty() ? fallback : items_.value_at( 0 );
    for ( auto const & [ k, v ] : items_ )
    {
        if ( predicate( k, v ) )
            return v;
    }
    return fallback;
}

value collection::last( entry_predicate const & predicate, value fallback ) const
{
    if ( !predicate )
        return items_.empty() ? fallback : items_.value_at( items_.size() - 1 );
    for ( auto pos{ items_.size() }; pos-- > 0; )
    {
        if ( predicate( items_.key_at( pos ), items_.value_at( pos ) ) )
            return items_.value_at( pos );
    }
    return fallback;
}

//------------------------------------------------------------------------------
// In place modifiers
//------------------------------------------------------------------------------

collection & collection::push( value item )
{
    items_.push_back( std::move( item ) );
    return *this;
}

collection & collection::prepend( value item, std::optional<key> const & k )
{
    if ( k )
    {
        items_.insert_at( 0, *k, std::move( item ) );
        return *this;
    }
    map_type items;
    items.reserve( items_.size() + 1 );
    items.push_back( std::move( item ) );
    for ( size_type pos{ 0 }; pos != items_.size(); ++pos )
        append_entry( items, items_.key_at( pos ), std::move( items_.value_at( pos ) ) );
    items_ = std::move( items );
    return *this;
}

value collection::pop()
{
    if ( items_.empty() )
        return {};
    return items_.pop_back().second;
}

value collection::shift()
{
    if ( items_.empty() )
        return {};
    value front{ std::move( items_.value_at( 0 ) ) };
    items_.erase_at( 0 );
    items_.renumber_integer_keys();
    return front;
}

value collection::pull( key const & k, value fallback )
{
    auto const pos{ items_.position_of( k ) };
    if ( !pos )
        return fallback;
    value pulled{ std::move( items_.value_at( *pos ) ) };
    items_.erase_at( *pos );
    return pulled;
}

collection & collection::transform( item_function const & fn )
{
    for ( size_type pos{ 0 }; pos != items_.size(); ++pos )
        items_.value_at( pos ) = fn( items_.value_at( pos ), items_.key_at( pos ) );
    return *this;
}

collection collection::splice( std::int64_t const offset, std::optional<std::int64_t> const length, source const & replacement )
{
    auto const [ start, stop ]{ arr::slice_bounds( items_.size(), offset, length ) };
    auto const inserted{ replacement.normalize() };

    collection removed;
    map_type   kept;
    kept.reserve( items_.size() - ( stop - start ) + inserted.size() );
    for ( size_type pos{ 0 }; pos != start; ++pos )
        append_entry( kept, items_.key_at( pos ), std::move( items_.value_at( pos ) ) );
    for ( auto pos{ start }; pos != stop; ++pos )
        append_entry( removed.items_, items_.key_at( pos ), std::move( items_.value_at( pos ) ) );
    for ( auto const & item : inserted.values() )
        kept.push_back( item );
    for ( auto pos{ stop }; pos != items_.size(); ++pos )
        append_entry( kept, items_.key_at( pos ), std::move( items_.value_at( pos ) ) );
    items_ = std::move( kept );
    return removed;
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
