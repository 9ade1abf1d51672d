////////////////////////////////////////////////////////////////////////////////
///
/// \file arr.hpp
/// -------------
///
/// Stateless array helper primitives operating on fluent::map_type.
///
/// Dot-paths ("user.address.city") are walked segment by segment over maps,
/// nested collections and objects (through object::field()). The wildcard
/// segment "*" applies the remaining path to every element at that level and
/// collects the results into a sequence (collapsed once per additional
/// wildcard further down the path).
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

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent::arr
{
//------------------------------------------------------------------------------

inline constexpr std::size_t unbounded_depth{ std::numeric_limits<std::size_t>::max() };

inline constexpr std::string_view wildcard{ "*" };

[[ nodiscard ]] std::vector<std::string> explode_path( std::string_view dot_path );

// map or nested collection
[[ nodiscard ]] inline bool accessible( value const & v ) noexcept { return v.is_composite(); }

// entries of a map, a nested collection or an object (entries() then
// to_array()); std::nullopt for scalars
[[ nodiscard ]] std::optional<map_type> arrayable( value const & );

[[ nodiscard ]] value data_get( value const & target, std::string_view                  dot_path, value const & fallback = {} );
[[ nodiscard ]] value data_get( value const & target, std::span<std::string const>      segments, value const & fallback = {} );

// value_path of every item, keyed by key_path (when given) or sequentially
[[ nodiscard ]] map_type pluck( map_type const & items, std::string_view value_path, std::optional<std::string_view> key_path = std::nullopt );

[[ nodiscard ]] map_type only  ( map_type const & items, std::span<key const> keys );
[[ nodiscard ]] map_type except( map_type const & items, std::span<key const> keys );

// discards keys at every level; depth counts the nesting levels consumed
[[ nodiscard ]] map_type flatten ( map_type const & items, std::size_t depth = unbounded_depth );
// merges one level of nested maps/collections, skips anything else
[[ nodiscard ]] map_type collapse( map_type const & items );

// array merge: string keys of source overwrite, integer keys are appended
void merge_into( map_type & target, map_type const & source );

// [ start, stop ) positions of an array slice: a negative offset counts from
// the end, a negative length stops that many entries before the end
[[ nodiscard ]] std::pair<std::size_t, std::size_t> slice_bounds( std::size_t size, std::int64_t offset, std::optional<std::int64_t> length ) noexcept;

// the key a value converts to when used as an array index (bool -> 0/1,
// null -> "", floating point -> truncated integer)
[[ nodiscard ]] key to_key( value const & );

//------------------------------------------------------------------------------
} // namespace fluent::arr
//------------------------------------------------------------------------------
