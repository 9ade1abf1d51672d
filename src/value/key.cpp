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
#include <fluent/value/key.hpp>

#include <charconv>
#include <ostream>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace detail
{
    std::optional<std::int64_t> canonical_integer( std::string_view const str ) noexcept
    {
        if ( str.empty() || str.size() > 20 )
            return std::nullopt;
        auto const negative{ str.front() == '-' };
        auto const digits  { str.substr( negative ? 1 : 0 ) };
        if ( digits.empty() )
            return std::nullopt;
        // no leading zeros (except "0" itself) and no "-0"
        if ( digits.front() == '0' && ( digits.size() > 1 || negative ) )
            return std::nullopt;

        std::int64_t result;
        auto const [ end, ec ]{ std::from_chars( str.data(), str.data() + str.size(), result ) };
        if ( ec != std::errc{} || end != str.data() + str.size() )
            return std::nullopt;
        return result;
    }
} // namespace detail

std::string key::to_string() const
{
    if ( is_integer() )
        return std::to_string( integer() );
    return string();
}

std::size_t key::hash() const noexcept
{
    if ( is_integer() )
        return std::hash<std::int64_t>{}( integer() );
    return std::hash<std::string_view>{}( string() );
}

std::ostream & operator<<( std::ostream & os, key const & k )
{
    if ( k.is_integer() )
        return os << k.integer();
    return os << k.string();
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
