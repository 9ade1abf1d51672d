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
#include <fluent/value/compare.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <cstdint>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] bool less( value const & left, value const & right ) { return loose_compare( left, right ) < 0; }

    // numbers are summed as integers until a floating point operand (or an
    // integer overflow) is encountered
    class accumulator
    {
    public:
        void add( value const & v )
        {
            auto const number{ to_number( v ) };
            if ( !number )
                return;
            if ( floating_ || number->is_floating() )
            {
                switch_to_floating();
                floating_sum_ += to_double( *number );
                return;
            }
            if ( __builtin_add_overflow( integer_sum_, number->as_integer(), &integer_sum_ ) )
            {
                switch_to_floating();
                floating_sum_ += to_double( *number );
            }
        }

        [[ nodiscard ]] value  result   () const { return floating_ ? value( floating_sum_ ) : value( integer_sum_ ); }
        [[ nodiscard ]] double as_double() const noexcept { return floating_ ? floating_sum_ : static_cast<double>( integer_sum_ ); }

    private:
        void switch_to_floating() noexcept
        {
            if ( floating_ )
                return;
            floating_     = true;
            floating_sum_ = static_cast<double>( integer_sum_ );
        }

        std::int64_t integer_sum_ { 0     };
        double       floating_sum_{ 0     };
        bool         floating_    { false };
    }; // class accumulator
} // anonymous namespace

std::vector<value> collection::resolved( selector const & by ) const
{
    std::vector<value> results;
    results.reserve( items_.size() );
    for ( auto const & [ k, v ] : items_ )
        results.push_back( by( v, k ) );
    return results;
}

bool collection::any( entry_predicate const & predicate ) const
{
    for ( auto const & [ k, v ] : items_ )
    {
        if ( predicate( k, v ) )
            return true;
    }
    return false;
}

//------------------------------------------------------------------------------
// Membership
//------------------------------------------------------------------------------

bool collection::contains( value const & item ) const
{
    return std::ranges::any_of( items_.values(), [ & ]( value const & v ) { return loose_equal( v, item ); } );
}

bool collection::contains( std::string_view const path, value const & item ) const
{
    auto const segments{ arr::explode_path( path ) };
    return std::ranges::any_of( items_.values(), [ & ]( value const & v ) { return loose_equal( arr::data_get( v, segments ), item ); } );
}

bool collection::contains_strict( value const & item ) const
{
    return std::ranges::any_of( items_.values(), [ & ]( value const & v ) { return strict_equal( v, item ); } );
}

bool collection::contains_strict( std::string_view const path, value const & item ) const
{
    auto const segments{ arr::explode_path( path ) };
    return std::ranges::any_of( items_.values(), [ & ]( value const & v ) { return strict_equal( arr::data_get( v, segments ), item ); } );
}

std::optional<key> collection::search( value const & item, bool const strict ) const
{
    for ( auto const & [ k, v ] : items_ )
    {
        if ( strict ? strict_equal( v, item ) : loose_equal( v, item ) )
            return k;
    }
    return std::nullopt;
}

std::optional<key> collection::search( item_predicate const & predicate ) const
{
    for ( auto const & [ k, v ] : items_ )
    {
        if ( predicate( v, k ) )
            return k;
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------
// Statistics
//------------------------------------------------------------------------------

value collection::sum( selector const & by ) const
{
    accumulator total;
    for ( auto const & v : resolved( by ) )
        total.add( v );
    return total.result();
}

std::optional<double> collection::average( selector const & by ) const
{
    if ( items_.empty() )
        return std::nullopt;
    accumulator total;
    for ( auto const & v : resolved( by ) )
        total.add( v );
    return total.as_double() / static_cast<double>( items_.size() );
}

std::optional<value> collection::max( selector const & by ) const
{
    std::optional<value> result;
    for ( auto & v : resolved( by ) )
    {
        if ( !v.is_null() && ( !result || less( *result, v ) ) )
            result = std::move( v );
    }
    return result;
}

std::optional<value> collection::min( selector const & by ) const
{
    std::optional<value> result;
    for ( auto & v : resolved( by ) )
    {
        if ( !v.is_null() && ( !result || less( v, *result ) ) )
            result = std::move( v );
    }
    return result;
}

std::optional<double> collection::median( selector const & by ) const
{
    auto values{ resolved( by ) };
    std::erase_if( values, []( value const & v ) { return v.is_null(); } );
    if ( values.empty() )
        return std::nullopt;
    std::ranges::stable_sort( values, less );

    auto const middle{ values.size() / 2 };
    if ( values.size() % 2 )
        return to_double( values[ middle ] );
    return ( to_double( values[ middle - 1 ] ) + to_double( values[ middle ] ) ) / 2;
}

std::optional<collection> collection::mode( selector const & by ) const
{
    struct tally { value item; std::size_t count; };
    std::vector<tally> counts;
    for ( auto & v : resolved( by ) )
    {
        if ( v.is_null() )
            continue;
        auto const existing{ std::ranges::find_if( counts, [ & ]( tally const & t ) { return loose_equal( t.item, v ); } ) };
        if ( existing != counts.end() )
            ++existing->count;
        else
            counts.push_back( { std::move( v ), 1 } );
    }
    if ( counts.empty() )
        return std::nullopt;

    auto const highest{ std::ranges::max( counts, {}, &tally::count ).count };
    std::vector<value> modes;
    for ( auto & t : counts )
    {
        if ( t.count == highest )
            modes.push_back( std::move( t.item ) );
    }
    std::ranges::stable_sort( modes, less );
    return collection( source( std::move( modes ) ) );
}

value collection::reduce( reducer const & fn, value initial ) const
{
    for ( auto const & [ k, v ] : items_ )
        initial = fn( initial, v, k );
    return initial;
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
