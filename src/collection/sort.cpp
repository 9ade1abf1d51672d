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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>

#include <compare>
#include <numeric>
#include <string>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] int sign( std::weak_ordering const ordering ) noexcept
    {
        if ( ordering < 0 ) return -1;
        if ( ordering > 0 ) return +1;
        return 0;
    }

    [[ nodiscard ]] std::string string_operand( value const & v, bool const ignore_case )
    {
        auto str{ fluent::to_string( v ) };
        if ( ignore_case )
            boost::algorithm::to_lower( str );
        return str;
    }

    [[ nodiscard ]] int compare_values( value const & left, value const & right, sort_options const options )
    {
        switch ( options.mode )
        {
            case sort_mode::numeric:
            {
                auto const l{ to_double( left ) }, r{ to_double( right ) };
                return ( l > r ) - ( l < r );
            }
            case sort_mode::string:
                return string_operand( left, options.ignore_case ).compare( string_operand( right, options.ignore_case ) );
            case sort_mode::natural:
                return natural_compare( fluent::to_string( left ), fluent::to_string( right ), options.ignore_case );
            case sort_mode::regular:
            default:
                return sign( loose_compare( left, right ) );
        }
    }
} // anonymous namespace

// ties keep their original relative order in both directions
template <typename Compare>
collection collection::stable_sorted( Compare const & compare, bool const descending, bool const renumber ) const
{
    std::vector<size_type> order( items_.size() );
    std::iota( order.begin(), order.end(), size_type{ 0 } );
    boost::sort::pdqsort
    (
        order.begin(), order.end(),
        [ & ]( size_type const left, size_type const right )
        {
            auto const result{ compare( left, right ) };
            if ( result != 0 )
                return descending ? result > 0 : result < 0;
            return left < right;
        }
    );
    return permuted( order, renumber );
}

//------------------------------------------------------------------------------
// Value sorts
//------------------------------------------------------------------------------

collection collection::sort() const { return asort(); }

collection collection::sort( comparator const & cmp ) const { return uasort( cmp ); }

collection collection::asort( sort_options const options ) const
{
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return compare_values( items_.value_at( l ), items_.value_at( r ), options ); }, false );
}

collection collection::arsort( sort_options const options ) const
{
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return compare_values( items_.value_at( l ), items_.value_at( r ), options ); }, true );
}

collection collection::natsort    () const { return asort( { .mode = sort_mode::natural, .ignore_case = false } ); }
collection collection::natcasesort() const { return asort( { .mode = sort_mode::natural, .ignore_case = true  } ); }

collection collection::uasort( comparator const & cmp ) const
{
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return cmp( items_.value_at( l ), items_.value_at( r ) ); }, false );
}

collection collection::uksort( key_comparator const & cmp ) const
{
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return cmp( items_.key_at( l ), items_.key_at( r ) ); }, false );
}

collection collection::usort( comparator const & cmp ) const
{
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return cmp( items_.value_at( l ), items_.value_at( r ) ); }, false, true );
}

//------------------------------------------------------------------------------
// Derived key sorts
//------------------------------------------------------------------------------

collection collection::sort_by( selector const & by, bool const descending ) const
{
    auto const sort_keys{ resolved( by ) };
    return stable_sorted( [ & ]( size_type const l, size_type const r ) { return sign( loose_compare( sort_keys[ l ], sort_keys[ r ] ) ); }, descending );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
