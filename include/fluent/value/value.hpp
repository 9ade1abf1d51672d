////////////////////////////////////////////////////////////////////////////////
///
/// \file value.hpp
/// ---------------
///
/// fluent::value: the dynamically typed element of a collection.
///
/// A value is exactly one of
///   null | boolean | integer (int64) | floating (double) | string |
///   map (a nested insertion ordered key -> value map) |
///   collection (a nested fluent::collection) |
///   object (a shared handle to a user type implementing fluent::object)
///
/// Maps and nested collections are owned (deep copied), objects are shared
/// reference handles. Equality (operator==) is strict: same kind and same
/// content; loose (type juggling) comparisons live in compare.hpp.
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

#include <fluent/containers/ordered_map.hpp>
#include <fluent/detail/boxed.hpp>
#include <fluent/value/key.hpp>

#include <boost/assert.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

class collection;
class object;
class value;

using map_type = ordered_map<key, value, key_hash>;

enum class value_kind : std::uint8_t
{
    null,
    boolean,
    integer,
    floating,
    string,
    map,
    collection,
    object
};

[[ nodiscard ]] char const * to_string( value_kind ) noexcept;

class value
{
private:
    using storage_type = std::variant
    <
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        detail::boxed<map_type>,
        detail::boxed<collection>,
        std::shared_ptr<object const>
    >;

    template <std::size_t index>
    [[ nodiscard ]] std::variant_alternative_t<index, storage_type> const & get() const noexcept
    {
        BOOST_ASSERT( storage_.index() == index );
        return *std::get_if<index>( &storage_ );
    }
    template <std::size_t index>
    [[ nodiscard ]] std::variant_alternative_t<index, storage_type> & get() noexcept
    {
        BOOST_ASSERT( storage_.index() == index );
        return *std::get_if<index>( &storage_ );
    }

public:
    value() noexcept;
    value( std::nullptr_t ) noexcept;

    template <std::same_as<bool> B>
    value( B const boolean ) noexcept : storage_{ std::in_place_index<1>, boolean } {}

    template <std::integral I> requires( !std::same_as<I, bool> && !std::same_as<I, char> )
    value( I const integer ) noexcept : storage_{ std::in_place_index<2>, static_cast<std::int64_t>( integer ) } {}

    template <std::floating_point F>
    value( F const floating ) noexcept : storage_{ std::in_place_index<3>, static_cast<double>( floating ) } {}

    value( char const * str );
    value( std::string_view str );
    value( std::string str ) noexcept;
    value( key const & );

    // explicit so that collection{ c } copies c instead of nesting it
    explicit value( map_type   );
    explicit value( collection );

    value( std::shared_ptr<object const> );
    template <std::derived_from<object> O>
    value( std::shared_ptr<O> obj ) : value( std::shared_ptr<object const>( std::move( obj ) ) ) {}

    value( value const & );
    value( value &&      ) noexcept;
    value & operator=( value const & );
    value & operator=( value &&      ) noexcept;
   ~value();

    [[ nodiscard ]] value_kind kind() const noexcept { return static_cast<value_kind>( storage_.index() ); }

    [[ nodiscard ]] bool is_null      () const noexcept { return kind() == value_kind::null      ; }
    [[ nodiscard ]] bool is_bool      () const noexcept { return kind() == value_kind::boolean   ; }
    [[ nodiscard ]] bool is_integer   () const noexcept { return kind() == value_kind::integer   ; }
    [[ nodiscard ]] bool is_floating  () const noexcept { return kind() == value_kind::floating  ; }
    [[ nodiscard ]] bool is_string    () const noexcept { return kind() == value_kind::string    ; }
    [[ nodiscard ]] bool is_map       () const noexcept { return kind() == value_kind::map       ; }
    [[ nodiscard ]] bool is_collection() const noexcept { return kind() == value_kind::collection; }
    [[ nodiscard ]] bool is_object    () const noexcept { return kind() == value_kind::object    ; }

    [[ nodiscard ]] bool is_number   () const noexcept { return is_integer() || is_floating(); }
    [[ nodiscard ]] bool is_scalar   () const noexcept { return kind() >= value_kind::boolean && kind() <= value_kind::string; }
    // maps and collections: containers of keyed entries
    [[ nodiscard ]] bool is_composite() const noexcept { return is_map() || is_collection(); }

    [[ nodiscard ]] bool                 as_bool    () const noexcept { return get<1>(); }
    [[ nodiscard ]] std::int64_t         as_integer () const noexcept { return get<2>(); }
    [[ nodiscard ]] double               as_floating() const noexcept { return get<3>(); }
    [[ nodiscard ]] std::string  const & as_string  () const noexcept { return get<4>(); }
    [[ nodiscard ]] map_type     const & as_map     () const noexcept;
    [[ nodiscard ]] map_type           & as_map     ()       noexcept;
    [[ nodiscard ]] collection   const & as_collection() const noexcept;
    [[ nodiscard ]] collection         & as_collection()       noexcept;
    [[ nodiscard ]] object       const & as_object  () const noexcept { return *get<7>(); }

    [[ nodiscard ]] std::shared_ptr<object const> const & object_handle() const noexcept { return get<7>(); }

    // the keyed entries of a map or of a nested collection (nullptr otherwise)
    [[ nodiscard ]] map_type const * entries() const noexcept;

    // single dot-path segment lookup: map/collection entries by key, objects
    // through object::field()
    [[ nodiscard ]] std::optional<value> find_field( std::string_view segment ) const;

    // number of entries of a composite value
    [[ nodiscard ]] std::size_t size() const noexcept;

    friend bool operator==( value const &, value const & );

    friend std::ostream & operator<<( std::ostream &, value const & );

private:
    storage_type storage_;
}; // class value


////////////////////////////////////////////////////////////////////////////////
// object
// Capability interface for user types stored in a collection. Every
// capability is optional: the default implementations report "not
// supported" (std::nullopt or an empty property map).
////////////////////////////////////////////////////////////////////////////////

class object
{
public:
    virtual ~object();

    // dot-path segment lookup
    virtual std::optional<value>       field( std::string_view name ) const;
    // iteration with explicit keys
    virtual std::optional<map_type>    entries() const;
    // JSON serialization (takes precedence over to_json() and to_array())
    virtual std::optional<value>       json_serialize() const;
    // JSON text
    virtual std::optional<std::string> to_json() const;
    // array conversion
    virtual std::optional<map_type>    to_array() const;
    // public properties (used when no other capability is present)
    virtual map_type                   properties() const;
}; // class object

// plain property bag
class record : public object
{
public:
    record() = default;
    explicit record( map_type properties ) noexcept : properties_{ std::move( properties ) } {}

    void set( key const & name, value v ) { properties_.insert_or_assign( name, std::move( v ) ); }

    std::optional<value> field     ( std::string_view name ) const override;
    map_type             properties() const override { return properties_; }

private:
    map_type properties_;
}; // class record


//------------------------------------------------------------------------------
// construction helpers
//------------------------------------------------------------------------------

// keyed map literal: dict( { { "a", 1 }, { "b", 2 } } )
[[ nodiscard ]] inline value dict( std::initializer_list<map_type::value_type> const entries )
{
    return value( map_type( entries ) );
}

// sequence literal (keys 0..n-1): list( 1, "two", 3.0 )
template <typename... Values>
[[ nodiscard ]] value list( Values &&... values )
{
    map_type items;
    items.reserve( sizeof...( Values ) );
    ( items.push_back( value( std::forward<Values>( values ) ) ), ... );
    return value( std::move( items ) );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
