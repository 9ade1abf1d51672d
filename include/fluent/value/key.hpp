////////////////////////////////////////////////////////////////////////////////
/// fluent::key: the integer-or-string key of an ordered collection entry.
///
/// A string holding the canonical decimal representation of a 64 bit signed
/// integer ("0", "42", "-7" but not "007", "+1", "1.0" or " 1") is normalized
/// to the corresponding integer key, i.e. key{ "1" } == key{ 1 }.
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

#include <boost/assert.hpp>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace detail
{
    // canonical decimal integer test used for key normalization
    [[ nodiscard, gnu::pure ]] std::optional<std::int64_t> canonical_integer( std::string_view str ) noexcept;
} // namespace detail

class key
{
public:
    constexpr key() noexcept : storage_{ std::int64_t{ 0 } } {}

    template <std::integral I> requires( !std::same_as<I, bool> )
    constexpr key( I const index ) noexcept : storage_{ static_cast<std::int64_t>( index ) } {}

    key( std::string_view const str ) { assign( str ); }
    key( char const *     const str ) { assign( str ); }
    key( std::string            str )
    {
        if ( auto const integer{ detail::canonical_integer( str ) } )
            storage_.emplace<std::int64_t>( *integer );
        else
            storage_.emplace<std::string>( std::move( str ) );
    }

    [[ nodiscard ]] bool is_integer() const noexcept { return storage_.index() == 0; }
    [[ nodiscard ]] bool is_string () const noexcept { return storage_.index() == 1; }

    [[ nodiscard ]] std::int64_t integer() const noexcept
    {
        BOOST_ASSERT( is_integer() );
        return *std::get_if<std::int64_t>( &storage_ );
    }
    [[ nodiscard ]] std::string const & string() const noexcept
    {
        BOOST_ASSERT( is_string() );
        return *std::get_if<std::string>( &storage_ );
    }

    [[ nodiscard ]] std::string to_string() const;

    [[ nodiscard ]] std::size_t hash() const noexcept;

    friend bool operator==( key const &, key const & ) noexcept = default;

    // integers order before strings (used only for deterministic key sorts)
    friend std::strong_ordering operator<=>( key const & left, key const & right ) noexcept
    {
        if ( left.storage_.index() != right.storage_.index() )
            return left.storage_.index() <=> right.storage_.index();
        if ( left.is_integer() )
            return left.integer() <=> right.integer();
        return left.string().compare( right.string() ) <=> 0;
    }

    friend std::ostream & operator<<( std::ostream &, key const & );

private:
    void assign( std::string_view const str )
    {
        if ( auto const integer{ detail::canonical_integer( str ) } )
            storage_.emplace<std::int64_t>( *integer );
        else
            storage_.emplace<std::string>( str );
    }

private:
    std::variant<std::int64_t, std::string> storage_;
}; // class key

struct key_hash
{
    std::size_t operator()( key const & k ) const noexcept { return k.hash(); }
};

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------

template <>
struct std::hash<fluent::key> : fluent::key_hash {};
//------------------------------------------------------------------------------
