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
#include <fluent/error/error.hpp>

#include <string>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

unknown_operation::unknown_operation( std::string_view const name )
    :
    std::logic_error{ "Method " + std::string{ name } + " does not exist." },
    name_{ name }
{}

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * const msg ) { throw std::out_of_range( msg ); }

    [[ noreturn, gnu::cold ]] void throw_missing_key( std::string_view const key )
    {
        throw std::out_of_range( "Undefined offset: " + std::string{ key } );
    }

    [[ noreturn, gnu::cold ]] void throw_invalid_argument ( std::string const & msg ) { throw invalid_argument( msg ); }
    [[ noreturn, gnu::cold ]] void throw_unknown_operation( std::string_view const name ) { throw unknown_operation( name ); }

    [[ noreturn, gnu::cold ]] void throw_not_enough_items( std::size_t const requested, std::size_t const available )
    {
        throw invalid_argument
        (
            "You requested " + std::to_string( requested ) + " items, but there are only " +
            std::to_string( available ) + " items in the collection."
        );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
