////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Exception types thrown by fluent::collection and friends.
///
///   - invalid_argument  : a caller supplied argument outside of the accepted
///                         domain (e.g. random() amount > count())
///   - unknown_operation : an extension name that was never registered
///   - std::out_of_range : direct indexed access to a missing key
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
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

class invalid_argument : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
}; // class invalid_argument

class unknown_operation : public std::logic_error
{
public:
    explicit unknown_operation( std::string_view name );

    [[ nodiscard ]] std::string const & name() const noexcept { return name_; }

private:
    std::string name_;
}; // class unknown_operation

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range     ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_missing_key      ( std::string_view key );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument ( std::string const & msg );
    [[ noreturn, gnu::cold ]] void throw_unknown_operation( std::string_view name );
    [[ noreturn, gnu::cold ]] void throw_not_enough_items ( std::size_t requested, std::size_t available );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
