////////////////////////////////////////////////////////////////////////////////
///
/// \file compare.hpp
/// -----------------
///
/// Value coercions and comparisons.
///
///   truthy()         : boolean interpretation (false, 0, 0.0, "", "0", null
///                      and empty maps/collections are falsy)
///   strict_equal()   : same kind and same content (== operator==)
///   loose_equal()    : type juggling equality; numeric strings compare
///                      numerically, bool/null operands compare as booleans
///                      (null == "" but null != "0"), maps compare entry by
///                      entry regardless of order
///   loose_compare()  : the matching three way ordering used by where(),
///                      sort(), max()/min() and friends
///   natural_compare(): "natural order" string ordering (img2 < img10)
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

#include <fluent/value/value.hpp>

#include <compare>
#include <optional>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

[[ nodiscard ]] bool truthy( value const & ) noexcept;

[[ nodiscard ]] inline bool strict_equal( value const & left, value const & right ) { return left == right; }
[[ nodiscard ]]        bool loose_equal ( value const & left, value const & right );

[[ nodiscard ]] std::weak_ordering loose_compare( value const & left, value const & right );

[[ nodiscard ]] int natural_compare( std::string_view left, std::string_view right, bool ignore_case = false ) noexcept;

// numeric interpretation of a number, bool, null or numeric string
[[ nodiscard ]] std::optional<value> to_number( value const & ) noexcept;
[[ nodiscard ]] double               to_double( value const & ) noexcept;

// string interpretation: null -> "", true -> "1", false -> "", shortest round
// trip representation for floating point numbers
[[ nodiscard ]] std::string to_string( value const & );

namespace detail
{
    // integer or floating point value of a (possibly white space padded)
    // numeric string
    [[ nodiscard ]] std::optional<value> parse_numeric( std::string_view ) noexcept;
} // namespace detail

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
