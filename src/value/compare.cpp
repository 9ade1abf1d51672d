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
#include <fluent/value/compare.hpp>
#include <fluent/collection.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <limits>
#include <system_error>
#include <typeinfo>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    constexpr std::string_view whitespace{ " \t\n\r\v\f" };

    [[ nodiscard ]] std::weak_ordering compare_doubles( double const left, double const right ) noexcept
    {
        if ( left < right ) return std::weak_ordering::less;
        if ( left > right ) return std::weak_ordering::greater;
        return std::weak_ordering::equivalent;
    }

    [[ nodiscard ]] std::weak_ordering compare_numbers( value const & left, value const & right ) noexcept
    {
        BOOST_ASSERT( left.is_number() && right.is_number() );
        if ( left.is_integer() && right.is_integer() )
            return left.as_integer() <=> right.as_integer();
        return compare_doubles( to_double( left ), to_double( right ) );
    }

    [[ nodiscard ]] std::weak_ordering compare_strings( std::string_view const left, std::string_view const right ) noexcept
    {
        return left.compare( right ) <=> 0;
    }

    // number vs string: numeric strings compare numerically, anything else
    // compares the string form of the number
    [[ nodiscard ]] std::weak_ordering compare_number_string( value const & number, std::string const & str )
    {
        if ( auto const numeric{ detail::parse_numeric( str ) } )
            return compare_numbers( number, *numeric );
        return compare_strings( to_string( number ), str );
    }

    [[ nodiscard ]] bool is_boolean_context( value const & left, value const & right ) noexcept
    {
        return left.is_bool() || right.is_bool() || ( left.is_null() && !right.is_string() ) || ( right.is_null() && !left.is_string() );
    }

    [[ nodiscard ]] map_type const * comparable_entries( value const & v, map_type & storage )
    {
        if ( auto const items{ v.entries() } )
            return items;
        if ( v.is_object() )
        {
            storage = v.as_object().properties();
            return &storage;
        }
        return nullptr;
    }

    [[ nodiscard ]] bool loose_equal_entries( map_type const & left, map_type const & right )
    {
        if ( left.size() != right.size() )
            return false;
        for ( auto const & [ k, v ] : left )
        {
            auto const other{ right.find_value( k ) };
            if ( !other || !loose_equal( v, *other ) )
                return false;
        }
        return true;
    }

    [[ nodiscard ]] std::weak_ordering loose_compare_entries( map_type const & left, map_type const & right )
    {
        if ( left.size() != right.size() )
            return left.size() <=> right.size();
        for ( auto const & [ k, v ] : left )
        {
            auto const other{ right.find_value( k ) };
            if ( !other )
                return std::weak_ordering::greater; // uncomparable
            if ( auto const result{ loose_compare( v, *other ) }; result != 0 )
                return result;
        }
        return std::weak_ordering::equivalent;
    }
} // anonymous namespace

namespace detail
{
    std::optional<value> parse_numeric( std::string_view str ) noexcept
    {
        auto const first{ str.find_first_not_of( whitespace ) };
        if ( first == str.npos )
            return std::nullopt;
        str = str.substr( first, str.find_last_not_of( whitespace ) - first + 1 );

        auto const negative{ str.front() == '-' };
        if ( str.front() == '+' || negative )
            str.remove_prefix( 1 );
        if ( str.empty() || !( std::isdigit( static_cast<unsigned char>( str.front() ) ) || str.front() == '.' ) )
            return std::nullopt;

        auto const begin{ str.data() };
        auto const end  { str.data() + str.size() };

        std::uint64_t integer;
        if ( auto const [ p, ec ]{ std::from_chars( begin, end, integer ) }; ec == std::errc{} && p == end )
        {
            if ( !negative && integer <= static_cast<std::uint64_t>( std::numeric_limits<std::int64_t>::max() ) )
                return value( static_cast<std::int64_t>( integer ) );
            if ( negative && integer <= static_cast<std::uint64_t>( std::numeric_limits<std::int64_t>::max() ) + 1 )
                return value( static_cast<std::int64_t>( 0 - integer ) );
        }

        double floating;
        if ( auto const [ p, ec ]{ std::from_chars( begin, end, floating ) }; ec == std::errc{} && p == end )
            return value( negative ? -floating : floating );
        return std::nullopt;
    }
} // namespace detail

bool truthy( value const & v ) noexcept
{
    switch ( v.kind() )
    {
        case value_kind::null      : return false;
        case value_kind::boolean   : return v.as_bool();
        case value_kind::integer   : return v.as_integer () != 0;
        case value_kind::floating  : return v.as_floating() != 0;
        case value_kind::string    : return !v.as_string().empty() && v.as_string() != "0";
        case value_kind::map       :
        case value_kind::collection: return v.size() != 0;
        case value_kind::object    : return true;
    }
    BOOST_UNREACHABLE_RETURN( false );
}

std::optional<value> to_number( value const & v ) noexcept
{
    switch ( v.kind() )
    {
        case value_kind::null    : return value( 0 );
        case value_kind::boolean : return value( v.as_bool() ? 1 : 0 );
        case value_kind::integer :
        case value_kind::floating: return v;
        case value_kind::string  : return detail::parse_numeric( v.as_string() );
        default                  : return std::nullopt;
    }
}

double to_double( value const & v ) noexcept
{
    if ( v.is_floating() ) return v.as_floating();
    if ( v.is_integer () ) return static_cast<double>( v.as_integer() );
    if ( auto const number{ to_number( v ) } )
        return to_double( *number );
    return 0;
}

std::string to_string( value const & v )
{
    switch ( v.kind() )
    {
        case value_kind::null    : return {};
        case value_kind::boolean : return v.as_bool() ? "1" : "";
        case value_kind::integer : return std::to_string( v.as_integer() );
        case value_kind::floating:
        {
            char buffer[ 32 ];
            auto const [ end, ec ]{ std::to_chars( std::begin( buffer ), std::end( buffer ), v.as_floating() ) };
            BOOST_ASSERT( ec == std::errc{} );
            return { buffer, end };
        }
        case value_kind::string    : return v.as_string();
        case value_kind::map       : return "Array";
        case value_kind::collection: return v.as_collection().to_json();
        case value_kind::object    : return v.as_object().to_json().value_or( "Object" );
    }
    BOOST_UNREACHABLE_RETURN( {} );
}

bool loose_equal( value const & left, value const & right )
{
    if ( is_boolean_context( left, right ) )
        return truthy( left ) == truthy( right );
    if ( left.is_null() )
        return right.as_string().empty();
    if ( right.is_null() )
        return left.as_string().empty();

    if ( left.is_number() && right.is_number() )
        return compare_numbers( left, right ) == 0;
    if ( left.is_number() && right.is_string() )
        return compare_number_string( left, right.as_string() ) == 0;
    if ( left.is_string() && right.is_number() )
        return compare_number_string( right, left.as_string() ) == 0;
    if ( left.is_string() && right.is_string() )
    {
        auto const l{ detail::parse_numeric( left .as_string() ) };
        auto const r{ detail::parse_numeric( right.as_string() ) };
        if ( l && r )
            return compare_numbers( *l, *r ) == 0;
        return left.as_string() == right.as_string();
    }

    if ( left.is_object() && right.is_object() )
    {
        if ( left.object_handle() == right.object_handle() )
            return true;
        if ( typeid( left.as_object() ) != typeid( right.as_object() ) )
            return false;
        return loose_equal_entries( left.as_object().properties(), right.as_object().properties() );
    }
    if ( left.is_composite() && right.is_composite() )
        return loose_equal_entries( *left.entries(), *right.entries() );
    return false;
}

std::weak_ordering loose_compare( value const & left, value const & right )
{
    if ( is_boolean_context( left, right ) )
        return truthy( left ) <=> truthy( right );
    if ( left .is_null() ) return compare_strings( {}, right.as_string() );
    if ( right.is_null() ) return compare_strings( left.as_string(), {} );

    if ( left.is_number() && right.is_number() )
        return compare_numbers( left, right );
    if ( left.is_number() && right.is_string() )
        return compare_number_string( left, right.as_string() );
    if ( left.is_string() && right.is_number() )
        return 0 <=> compare_number_string( right, left.as_string() );
    if ( left.is_string() && right.is_string() )
    {
        auto const l{ detail::parse_numeric( left .as_string() ) };
        auto const r{ detail::parse_numeric( right.as_string() ) };
        if ( l && r )
            return compare_numbers( *l, *r );
        return compare_strings( left.as_string(), right.as_string() );
    }

    // composites order after scalars and before objects
    auto const rank{ []( value const & v ) noexcept { return v.is_scalar() ? 0 : v.is_composite() ? 1 : 2; } };
    if ( auto const result{ rank( left ) <=> rank( right ) }; result != 0 )
        return result;

    map_type left_storage;
    map_type right_storage;
    return loose_compare_entries( *comparable_entries( left, left_storage ), *comparable_entries( right, right_storage ) );
}

int natural_compare( std::string_view const left, std::string_view const right, bool const ignore_case ) noexcept
{
    auto const is_digit{ []( char const c ) noexcept { return std::isdigit( static_cast<unsigned char>( c ) ) != 0; } };
    auto const is_space{ []( char const c ) noexcept { return std::isspace( static_cast<unsigned char>( c ) ) != 0; } };
    auto const fold    { [ = ]( char const c ) noexcept {
        auto const uc{ static_cast<unsigned char>( c ) };
        return ignore_case ? static_cast<unsigned char>( std::toupper( uc ) ) : uc;
    } };

    std::size_t l{ 0 };
    std::size_t r{ 0 };
    for ( ;; )
    {
        while ( l < left .size() && is_space( left [ l ] ) ) ++l;
        while ( r < right.size() && is_space( right[ r ] ) ) ++r;
        if ( l == left.size() || r == right.size() )
            break;

        if ( is_digit( left[ l ] ) && is_digit( right[ r ] ) )
        {
            auto const run{ [ & ]( std::string_view const str, std::size_t & pos ) noexcept {
                auto const start{ pos };
                while ( pos < str.size() && is_digit( str[ pos ] ) ) ++pos;
                auto digits{ str.substr( start, pos - start ) };
                while ( digits.size() > 1 && digits.front() == '0' ) digits.remove_prefix( 1 );
                return digits;
            } };
            auto const left_digits { run( left , l ) };
            auto const right_digits{ run( right, r ) };
            if ( left_digits.size() != right_digits.size() )
                return left_digits.size() < right_digits.size() ? -1 : 1;
            if ( auto const result{ left_digits.compare( right_digits ) }; result != 0 )
                return result < 0 ? -1 : 1;
            continue;
        }

        auto const lc{ fold( left [ l ] ) };
        auto const rc{ fold( right[ r ] ) };
        if ( lc != rc )
            return lc < rc ? -1 : 1;
        ++l;
        ++r;
    }

    auto const left_rest { left .size() - l };
    auto const right_rest{ right.size() - r };
    if ( left_rest == right_rest ) return  0;
    return left_rest < right_rest ? -1 : 1;
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
