////////////////////////////////////////////////////////////////////////////////
///
/// \file collection.hpp
/// --------------------
///
/// fluent::collection: an insertion ordered key/value container with a
/// chainable operation set.
///
/// Operations marked const return a new collection (or a scalar result), the
/// others mutate the receiver and return it by reference. Keys are preserved
/// unless an operation states that it renumbers (assigns 0..n-1).
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
#include <fluent/error/error.hpp>
#include <fluent/extensions.hpp>
#include <fluent/json.hpp>
#include <fluent/selector.hpp>
#include <fluent/source.hpp>
#include <fluent/value/compare.hpp>
#include <fluent/value/value.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

enum class sort_mode : std::uint8_t
{
    regular, // loose comparison
    numeric, // numeric coercion of both operands
    string,  // string conversion of both operands
    natural  // natural order string comparison
};

struct sort_options
{
    sort_mode mode       { sort_mode::regular };
    bool      ignore_case{ false };
}; // struct sort_options

class caching_iterator;

class collection
{
public:
    using key_type        = key;
    using mapped_type     = value;
    using size_type       = map_type::size_type;
    using iterator        = map_type::iterator;
    using const_iterator  = map_type::const_iterator;

    // three-way result, negative / zero / positive
    using comparator     = std::function<int( value const &, value const & )>;
    using key_comparator = std::function<int( key   const &, key   const & )>;
    using reducer        = std::function<value( value const & carry, value const & item, key const & )>;

public:
    collection() noexcept = default;
    collection( std::initializer_list<value>                items );
    collection( std::initializer_list<map_type::value_type> items );
    explicit collection( map_type items ) noexcept : items_{ std::move( items ) } {}
    explicit collection( source   items );

    collection( collection const & ) = default;
    collection( collection &&      ) noexcept = default;
    collection & operator=( collection const & ) = default;
    collection & operator=( collection &&      ) noexcept = default;
   ~collection() = default;

    [[ nodiscard ]] static collection from( source items ) { return collection( std::move( items ) ); }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] map_type const & all() const noexcept { return items_; }

    [[ nodiscard ]] size_type count   () const noexcept { return items_.size(); }
    [[ nodiscard ]] bool      is_empty() const noexcept { return items_.empty(); }
    [[ nodiscard ]] bool      empty   () const noexcept { return items_.empty(); }
    [[ nodiscard ]] bool      is_not_empty() const noexcept { return !items_.empty(); }

    iterator       begin()       noexcept { return items_.begin(); }
    const_iterator begin() const noexcept { return items_.begin(); }
    iterator       end  ()       noexcept { return items_.end  (); }
    const_iterator end  () const noexcept { return items_.end  (); }

    [[ nodiscard ]] bool has   ( key const & k ) const { return items_.contains( k ); }
    [[ nodiscard ]] bool exists( key const & k ) const { return items_.contains( k ); }

    [[ nodiscard ]] value get( key const & k, value fallback = {} ) const;

    // the fallback thunk is invoked only on a miss
    template <typename F> requires( std::invocable<F const &> && !std::convertible_to<F, value> )
    [[ nodiscard ]] value get( key const & k, F const & fallback ) const
    {
        if ( auto const found{ items_.find_value( k ) } )
            return *found;
        return value( std::invoke( fallback ) );
    }

    // throw std::out_of_range for a missing key
    [[ nodiscard ]] value const & operator[]( key const & k ) const;
    [[ nodiscard ]] value       & at        ( key const & k );
    [[ nodiscard ]] value const & at        ( key const & k ) const;

    // upsert, or append with the next integer key for std::nullopt (see push())
    collection & set  ( std::optional<key> const & k, value v );
    collection & put  ( key const & k, value v ) { return set( k, std::move( v ) ); }
    collection & unset( key const & k );

    collection & forget( key const & k );
    collection & forget( std::vector<key> const & keys );

    [[ nodiscard ]] bool          offset_exists( key const & k ) const { return has( k ); }
    [[ nodiscard ]] value const & offset_get   ( key const & k ) const { return ( *this )[ k ]; }
                    collection &  offset_set   ( std::optional<key> const & k, value v ) { return set( k, std::move( v ) ); }
                    collection &  offset_unset ( key const & k ) { return unset( k ); }

    //--------------------------------------------------------------------------
    // Queries & reductions
    //--------------------------------------------------------------------------
    [[ nodiscard ]] value first( entry_predicate const & predicate = nullptr, value fallback = {} ) const;
    [[ nodiscard ]] value last ( entry_predicate const & predicate = nullptr, value fallback = {} ) const;

    [[ nodiscard ]] bool contains( value const & item ) const;
    [[ nodiscard ]] bool contains( std::string_view path, value const & item ) const;
    template <typename F> requires( std::constructible_from<entry_predicate, F> && !std::convertible_to<F, value> )
    [[ nodiscard ]] bool contains( F && predicate ) const { return any( entry_predicate( std::forward<F>( predicate ) ) ); }

    [[ nodiscard ]] bool contains_strict( value const & item ) const;
    [[ nodiscard ]] bool contains_strict( std::string_view path, value const & item ) const;
    template <typename F> requires( std::constructible_from<entry_predicate, F> && !std::convertible_to<F, value> )
    [[ nodiscard ]] bool contains_strict( F && predicate ) const { return any( entry_predicate( std::forward<F>( predicate ) ) ); }

    // std::nullopt when nothing matches
    [[ nodiscard ]] std::optional<key> search( value const & item, bool strict = false ) const;
    [[ nodiscard ]] std::optional<key> search( item_predicate const & predicate ) const;

    [[ nodiscard ]] value                     sum    ( selector const & = {} ) const;
    [[ nodiscard ]] std::optional<value>      max    ( selector const & = {} ) const;
    [[ nodiscard ]] std::optional<value>      min    ( selector const & = {} ) const;
    [[ nodiscard ]] std::optional<double>     average( selector const & = {} ) const;
    [[ nodiscard ]] std::optional<double>     avg    ( selector const & s = {} ) const { return average( s ); }
    [[ nodiscard ]] std::optional<double>     median ( selector const & = {} ) const;
    [[ nodiscard ]] std::optional<collection> mode   ( selector const & = {} ) const;

    [[ nodiscard ]] value reduce( reducer const & fn, value initial = {} ) const;
    template <typename F> requires( std::invocable<F const &, value const &, value const &> && !std::invocable<F const &, value const &, value const &, key const &> )
    [[ nodiscard ]] value reduce( F const & fn, value initial = {} ) const
    {
        return reduce( reducer{ [ &fn ]( value const & carry, value const & item, key const & ) { return value( std::invoke( fn, carry, item ) ); } }, std::move( initial ) );
    }

    template <typename F>
    decltype( auto ) pipe( F && fn ) const { return std::invoke( std::forward<F>( fn ), *this ); }

    // visits ( value, key ) in order, stops when fn returns false
    template <typename F>
    collection const & each( F && fn ) const
    {
        for ( auto const & [ k, v ] : items_ )
        {
            if constexpr ( std::invocable<F &, value const &, key const &> )
            {
                if constexpr ( std::is_void_v<std::invoke_result_t<F &, value const &, key const &>> )
                    std::invoke( fn, v, k );
                else if ( !detail::to_bool( std::invoke( fn, v, k ) ) )
                    break;
            }
            else
            {
                if constexpr ( std::is_void_v<std::invoke_result_t<F &, value const &>> )
                    std::invoke( fn, v );
                else if ( !detail::to_bool( std::invoke( fn, v ) ) )
                    break;
            }
        }
        return *this;
    }

    //--------------------------------------------------------------------------
    // Transformations
    //--------------------------------------------------------------------------
    [[ nodiscard ]] collection map          ( item_function const & fn ) const;
    [[ nodiscard ]] collection flat_map     ( item_function const & fn ) const;
    // fn returns a single entry map (or collection), merged preserving keys
    [[ nodiscard ]] collection map_with_keys( item_function const & fn ) const;

    // no predicate: keeps truthy values
    [[ nodiscard ]] collection filter( entry_predicate const & predicate = nullptr ) const;
    [[ nodiscard ]] collection reject( item_predicate  const & predicate ) const;
    [[ nodiscard ]] collection reject( value           const & item      ) const;

    [[ nodiscard ]] collection where       ( std::string_view path, value const & operand ) const;
    [[ nodiscard ]] collection where       ( std::string_view path, std::string_view op, value const & operand ) const;
    [[ nodiscard ]] collection where_strict( std::string_view path, value const & operand ) const;
    [[ nodiscard ]] collection where_in       ( std::string_view path, source const & values, bool strict = false ) const;
    [[ nodiscard ]] collection where_in_strict( std::string_view path, source const & values ) const { return where_in( path, values, true ); }

    [[ nodiscard ]] collection unique       ( selector const & = {}, bool strict = false ) const;
    [[ nodiscard ]] collection unique_strict( selector const & s = {} ) const { return unique( s, true ); }

    [[ nodiscard ]] collection values  () const;
    [[ nodiscard ]] collection keys    () const;
    [[ nodiscard ]] collection flip    () const;
    [[ nodiscard ]] collection flatten ( std::size_t depth = arr::unbounded_depth ) const;
    [[ nodiscard ]] collection collapse() const;

    // own values become the keys of the other's values
    [[ nodiscard ]] collection combine   ( source const & values ) const;
    [[ nodiscard ]] collection merge     ( source const & other  ) const;
    // existing entries win on key collisions
    [[ nodiscard ]] collection union_with( source const & other  ) const;
    [[ nodiscard ]] collection diff      ( source const & other  ) const;
    [[ nodiscard ]] collection diff_keys ( source const & other  ) const;
    [[ nodiscard ]] collection intersect ( source const & other  ) const;

    [[ nodiscard ]] collection only  ( std::vector<key> const & keys ) const;
    [[ nodiscard ]] collection except( std::vector<key> const & keys ) const;
    template <typename... Keys> requires( sizeof...( Keys ) > 0 && ( std::constructible_from<key, Keys const &> && ... ) )
    [[ nodiscard ]] collection only  ( Keys const &... keys ) const { return only  ( std::vector<key>{ key( keys )... } ); }
    template <typename... Keys> requires( sizeof...( Keys ) > 0 && ( std::constructible_from<key, Keys const &> && ... ) )
    [[ nodiscard ]] collection except( Keys const &... keys ) const { return except( std::vector<key>{ key( keys )... } ); }

    [[ nodiscard ]] collection pluck( std::string_view value_path, std::optional<std::string_view> key_path = std::nullopt ) const;

    [[ nodiscard ]] collection group_by( selector const & group_key, bool preserve_keys = false ) const;
    // last entry wins on key collisions
    [[ nodiscard ]] collection key_by  ( selector const & key_selector ) const;

    [[ nodiscard ]] collection sort_by     ( selector const & by, bool descending = false ) const;
    [[ nodiscard ]] collection sort_by_desc( selector const & by ) const { return sort_by( by, true ); }
    [[ nodiscard ]] collection sort        () const;
    [[ nodiscard ]] collection sort        ( comparator const & cmp ) const;

    // key preserving value sorts
    [[ nodiscard ]] collection asort      ( sort_options options = {} ) const;
    [[ nodiscard ]] collection arsort     ( sort_options options = {} ) const;
    [[ nodiscard ]] collection natsort    () const;
    [[ nodiscard ]] collection natcasesort() const;
    [[ nodiscard ]] collection uasort     ( comparator     const & cmp ) const;
    [[ nodiscard ]] collection uksort     ( key_comparator const & cmp ) const;
    // renumbers
    [[ nodiscard ]] collection usort      ( comparator     const & cmp ) const;

    [[ nodiscard ]] collection reverse() const;
    [[ nodiscard ]] collection shuffle( std::optional<std::uint64_t> seed = std::nullopt ) const;

    [[ nodiscard ]] collection chunk   ( std::int64_t size ) const;
    [[ nodiscard ]] collection split   ( std::size_t groups ) const;
    [[ nodiscard ]] collection every   ( std::int64_t step, std::int64_t offset = 0 ) const;
    [[ nodiscard ]] collection slice   ( std::int64_t offset, std::optional<std::int64_t> length = std::nullopt ) const;
    [[ nodiscard ]] collection for_page( std::int64_t page, std::int64_t per_page ) const;
    // negative limit takes from the end
    [[ nodiscard ]] collection take    ( std::int64_t limit ) const;

    // removes ( and returns ) a portion, replacement is inserted in its place;
    // both sides keep their string keys and renumber their integer keys
    collection splice( std::int64_t offset, std::optional<std::int64_t> length = std::nullopt, source const & replacement = {} );

    // missing positions are padded with null
    [[ nodiscard ]] collection zip( std::vector<source> const & others ) const;
    template <typename... Sources> requires( sizeof...( Sources ) > 0 && ( std::constructible_from<source, Sources> && ... ) )
    [[ nodiscard ]] collection zip( Sources &&... others ) const { return zip( std::vector<source>{ source( std::forward<Sources>( others ) )... } ); }

    [[ nodiscard ]] collection append( value item, std::optional<key> const & k = std::nullopt ) const;
    collection & prepend( value item, std::optional<key> const & k = std::nullopt );
    // throws std::out_of_range when the next integer index is already taken
    collection & push   ( value item );
    // null when empty
    value pop  ();
    value shift();
    value pull ( key const & k, value fallback = {} );

    // a single item; throws fluent::invalid_argument when empty
    [[ nodiscard ]] value      random() const;
    // always a collection, random( 1 ) included (use random() for a single
    // item); throws fluent::invalid_argument when amount exceeds count()
    [[ nodiscard ]] collection random( std::size_t amount, std::optional<std::uint64_t> seed = std::nullopt ) const;

    collection & transform( item_function const & fn );

    // join of the items with the first argument or, for composite or object
    // items, of their values at the path with the glue
    [[ nodiscard ]] std::string implode( std::string_view value_or_glue, std::optional<std::string_view> glue = std::nullopt ) const;

    //--------------------------------------------------------------------------
    // Serialization
    //--------------------------------------------------------------------------
    [[ nodiscard ]] map_type    to_array      () const;
    [[ nodiscard ]] value       json_serialize() const;
    [[ nodiscard ]] std::string to_json       ( json_options const & = {} ) const;
    [[ nodiscard ]] std::string to_string     () const { return to_json(); }

    [[ nodiscard ]] std::string       serialize  () const;
    [[ nodiscard ]] static collection deserialize( std::string const & blob );

    [[ nodiscard ]] caching_iterator get_caching_iterator() const;

    friend bool operator==( collection const & left, collection const & right ) { return left.items_ == right.items_; }

    friend std::ostream & operator<<( std::ostream &, collection const & );

    //--------------------------------------------------------------------------
    // Extensions
    //--------------------------------------------------------------------------
    static void extend( std::string name, extension fn );
    static void macro ( std::string name, extension fn ) { extend( std::move( name ), std::move( fn ) ); }

    [[ nodiscard ]] static bool has_extension( std::string_view name );
    [[ nodiscard ]] static bool has_extension( std::string_view name, extension_registry const & );
    [[ nodiscard ]] static bool has_macro    ( std::string_view name ) { return has_extension( name ); }

    value call( std::string_view name, std::vector<value> const & arguments = {} );
    value call( std::string_view name, std::vector<value> const & arguments, extension_registry const & );

    static value call_static( std::string_view name, std::vector<value> const & arguments = {} );
    static value call_static( std::string_view name, std::vector<value> const & arguments, extension_registry const & );

private:
    [[ nodiscard ]] bool any( entry_predicate const & ) const;

    [[ nodiscard ]] collection filtered( entry_predicate const & ) const;

    [[ nodiscard ]] std::vector<value> resolved( selector const & ) const;

    [[ nodiscard ]] collection permuted( std::vector<size_type> const & order, bool renumber = false ) const;

    // compare( position, position ) -> negative / zero / positive
    template <typename Compare>
    [[ nodiscard ]] collection stable_sorted( Compare const & compare, bool descending, bool renumber = false ) const;

private:
    map_type items_;
}; // class collection


////////////////////////////////////////////////////////////////////////////////
// caching_iterator
// Forward cursor over a collection snapshot with one element look-ahead.
////////////////////////////////////////////////////////////////////////////////

class caching_iterator
{
public:
    explicit caching_iterator( map_type items ) noexcept : items_{ std::move( items ) } {}

    [[ nodiscard ]] bool valid   () const noexcept { return position_ < items_.size(); }
    [[ nodiscard ]] bool has_next() const noexcept { return position_ + 1 < items_.size(); }

    // require valid()
    [[ nodiscard ]] value       const & current() const noexcept { return items_.value_at( position_ ); }
    [[ nodiscard ]] fluent::key const & key() const noexcept { return items_.key_at( position_ ); }

    void next  () noexcept { if ( valid() ) ++position_; }
    void rewind() noexcept { position_ = 0; }

    [[ nodiscard ]] std::size_t size() const noexcept { return items_.size(); }

private:
    map_type    items_;
    std::size_t position_{ 0 };
}; // class caching_iterator

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
