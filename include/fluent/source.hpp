////////////////////////////////////////////////////////////////////////////////
///
/// \file source.hpp
/// ----------------
///
/// The closed set of inputs a collection can be built from and their
/// normalization into a concrete map_type:
///
///   empty     : nothing or null                         -> {}
///   map       : a map_type (or a range of key/value pairs)-> as is
///   container : another collection                      -> its entries
///   sequence  : a list/range of values                  -> keys 0..n-1
///   thunk     : a callable with no arguments            -> its result,
///                                                          re-normalized
///   object    : an object handle, queried for entries(), json_serialize(),
///               to_json(), to_array() and finally properties()
///   scalar    : anything else                           -> [ scalar ]
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

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <ranges>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Element>
    concept keyed_element = requires( Element && e )
    {
        e.first;
        e.second;
    } &&
    std::constructible_from<key  , decltype( std::declval<Element>().first  )> &&
    std::constructible_from<value, decltype( std::declval<Element>().second )>;

    template <typename R>
    concept source_range =
        std::ranges::input_range<R> &&
        !std::convertible_to<R, value> &&
        !std::same_as<std::remove_cvref_t<R>, map_type  > &&
        !std::same_as<std::remove_cvref_t<R>, collection> &&
        (
            keyed_element<std::ranges::range_reference_t<R>> ||
            std::constructible_from<value, std::ranges::range_reference_t<R>>
        );

    template <typename V>
    concept scalar_source =
        !std::same_as<std::remove_cvref_t<V>, std::nullptr_t> &&
        ( std::is_arithmetic_v<std::remove_cvref_t<V>> || std::convertible_to<V, std::string_view> ) &&
        std::constructible_from<value, V>;
} // namespace detail


class source
{
public:
    enum class tag : std::uint8_t { empty, map, container, sequence, thunk, object, scalar };

    using thunk_type = std::function<value()>;

    source() noexcept = default;
    source( std::nullptr_t ) noexcept {}

    source( map_type           items );
    source( collection const & items );

    source( std::initializer_list<value> items );
    source( std::vector<value>           items );

    template <detail::source_range R>
    source( R && range )
    {
        map_type items;
        bool keyed{ false };
        for ( auto && element : range )
        {
            using element_t = decltype( element );
            if constexpr ( detail::keyed_element<element_t> )
            {
                keyed = true;
                items.insert_or_assign( key( element.first ), value( element.second ) );
            }
            else
                items.push_back( value( std::forward<element_t>( element ) ) );
        }
        tag_     = keyed ? tag::map : tag::sequence;
        payload_ = value( std::move( items ) );
    }

    template <typename F> requires( std::invocable<F &> && std::convertible_to<std::invoke_result_t<F &>, value> )
    source( F thunk ) : tag_{ tag::thunk }, thunk_{ std::move( thunk ) } {}

    source( std::shared_ptr<object const> );
    template <std::derived_from<object> O>
    source( std::shared_ptr<O> obj ) : source( std::shared_ptr<object const>( std::move( obj ) ) ) {}

    // composite and object values are classified by their content
    source( value );

    template <detail::scalar_source V>
    source( V && scalar ) : source( value( std::forward<V>( scalar ) ) ) {}

    [[ nodiscard ]] tag kind() const noexcept { return tag_; }

    [[ nodiscard ]] map_type normalize() const;

private:
    tag        tag_{ tag::empty };
    value      payload_;
    thunk_type thunk_;
}; // class source

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
