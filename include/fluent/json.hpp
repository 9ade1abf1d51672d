////////////////////////////////////////////////////////////////////////////////
///
/// \file json.hpp
/// --------------
///
/// JSON conversion of fluent::value trees (nlohmann::ordered_json keeps the
/// insertion order of object members).
///
/// Encoding rules:
///   - a map (or collection) whose keys are exactly 0..n-1 in iteration order
///     (including the empty map) encodes as a JSON array, anything else as a
///     JSON object with stringified keys
///   - objects encode through json_serialize(), to_json(), to_array() and
///     finally properties() (always a JSON object), in that order
///
/// Decoding maps JSON objects to maps (canonical integer member names become
/// integer keys), arrays to sequences and numbers to integer or floating
/// point values.
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

#include <fluent/detail/config.hpp>
#include <fluent/value/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

struct json_options
{
    bool pretty_print{ false };
    int  indent      { FLUENT_DEFAULT_JSON_INDENT };
    bool ensure_ascii{ false };
}; // struct json_options

namespace json
{
    using document = nlohmann::ordered_json;

    [[ nodiscard ]] document    to_document  ( value const & );
    [[ nodiscard ]] value       from_document( document const & );

    [[ nodiscard ]] std::string dump ( value const &, json_options const & = {} );
    // throws nlohmann::json::parse_error on malformed input
    [[ nodiscard ]] value       parse( std::string_view text );

    // sequence test: keys are exactly 0..n-1 in iteration order
    [[ nodiscard ]] bool is_list( map_type const & ) noexcept;
} // namespace json

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
