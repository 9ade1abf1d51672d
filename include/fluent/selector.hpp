////////////////////////////////////////////////////////////////////////////////
///
/// \file selector.hpp
/// ------------------
///
/// Type erased callable arguments of collection operations.
///
///   entry_predicate : bool( key, value ), one argument callables receive the
///                     key (filter, first, last, contains)
///   item_predicate  : bool( value, key ), one argument callables receive the
///                     value (reject, search)
///   item_function   : value( value, key ), one argument callables receive
///                     the value (map, transform, key_by, ...)
///   selector        : absent (the item itself) | dot-path | item_function
///
/// Results that are fluent::value are interpreted through truthy() where a
/// boolean is expected.
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

#include <fluent/arr.hpp>
#include <fluent/value/compare.hpp>
#include <fluent/value/value.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Result>
    [[ nodiscard ]] bool to_bool( Result && result )
    {
        if constexpr ( std::same_as<std::remove_cvref_t<Result>, value> )
            return truthy( result );
        else
            return static_cast<bool>( result );
    }

    template <typename F, typename... Args>
    concept predicate_of = std::invocable<F const &, Args...> &&
        ( std::convertible_to<std::invoke_result_t<F const &, Args...>, bool> || std::same_as<std::remove_cvref_t<std::invoke_result_t<F const &, Args...>>, value> );

    template <typename F, typename... Args>
    concept function_of = std::invocable<F const &, Args...> && std::constructible_from<value, std::invoke_result_t<F const &, Args...>>;
} // namespace detail


class entry_predicate
{
public:
    using signature = bool( key const &, value const & );

    // no predicate: operations fall back to their unfiltered (or truthiness) form
    entry_predicate( std::nullptr_t = nullptr ) noexcept {}

    template <typename F> requires detail::predicate_of<F, key const &, value const &>
    entry_predicate( F f ) : fn_{ [ f = std::move( f ) ]( key const & k, value const & v ) { return detail::to_bool( std::invoke( f, k, v ) ); } } {}

    template <typename F> requires( detail::predicate_of<F, key const &> && !std::invocable<F const &, key const &, value const &> )
    entry_predicate( F f ) : fn_{ [ f = std::move( f ) ]( key const & k, value const & ) { return detail::to_bool( std::invoke( f, k ) ); } } {}

    bool operator()( key const & k, value const & v ) const { return fn_( k, v ); }

    explicit operator bool() const noexcept { return static_cast<bool>( fn_ ); }

private:
    std::function<signature> fn_;
}; // class entry_predicate


class item_predicate
{
public:
    using signature = bool( value const &, key const & );

    template <typename F> requires detail::predicate_of<F, value const &, key const &>
    item_predicate( F f ) : fn_{ [ f = std::move( f ) ]( value const & v, key const & k ) { return detail::to_bool( std::invoke( f, v, k ) ); } } {}

    template <typename F> requires( detail::predicate_of<F, value const &> && !std::invocable<F const &, value const &, key const &> )
    item_predicate( F f ) : fn_{ [ f = std::move( f ) ]( value const & v, key const & ) { return detail::to_bool( std::invoke( f, v ) ); } } {}

    bool operator()( value const & v, key const & k ) const { return fn_( v, k ); }

private:
    std::function<signature> fn_;
}; // class item_predicate


class item_function
{
public:
    using signature = value( value const &, key const & );

    template <typename F> requires detail::function_of<F, value const &, key const &>
    item_function( F f ) : fn_{ [ f = std::move( f ) ]( value const & v, key const & k ) { return value( std::invoke( f, v, k ) ); } } {}

    template <typename F> requires( detail::function_of<F, value const &> && !std::invocable<F const &, value const &, key const &> )
    item_function( F f ) : fn_{ [ f = std::move( f ) ]( value const & v, key const & ) { return value( std::invoke( f, v ) ); } } {}

    value operator()( value const & v, key const & k ) const { return fn_( v, k ); }

private:
    std::function<signature> fn_;
}; // class item_function


////////////////////////////////////////////////////////////////////////////////
// selector
// Resolves the value an operation works on for a given entry: the entry
// itself, a dot-path lookup into it or the result of a callable.
////////////////////////////////////////////////////////////////////////////////

class selector
{
public:
    selector() noexcept = default;

    selector( char const *     const path ) : selector( std::string_view{ path } ) {}
    selector( std::string_view const path ) : retriever_{ arr::explode_path( path ) } {}
    selector( std::string const &    path ) : selector( std::string_view{ path } ) {}

    selector( item_function fn ) noexcept : retriever_{ std::move( fn ) } {}

    template <typename F> requires std::constructible_from<item_function, F>
    selector( F f ) : retriever_{ item_function( std::move( f ) ) } {}

    [[ nodiscard ]] bool is_identity() const noexcept { return retriever_.index() == 0; }
    [[ nodiscard ]] bool is_path    () const noexcept { return retriever_.index() == 1; }

    [[ nodiscard ]] value operator()( value const & item, key const & k ) const
    {
        switch ( retriever_.index() )
        {
            case 0 : return item;
            case 1 : return arr::data_get( item, *std::get_if<1>( &retriever_ ) );
            default: return ( *std::get_if<2>( &retriever_ ) )( item, k );
        }
    }

private:
    std::variant<std::monostate, std::vector<std::string>, item_function> retriever_;
}; // class selector

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
