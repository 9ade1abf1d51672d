////////////////////////////////////////////////////////////////////////////////
/// Insertion ordered associative container with separate key and value
/// storage.
///
/// Architecture:
///   ordered_map privately inherits detail::paired_storage<KC, MC>, which
///   synchronises the dual-container operations (insert, erase, truncate,
///   permute, ...). A hash index (key -> position) provides O(1) lookup while
///   iteration follows insertion order, not key order.
///
/// Integer keys:
///   for key types that can hold an integer (integral types or types exposing
///   is_integer()/integer()) the map tracks the next free integer index, i.e.
///   one past the largest integer key ever inserted, so that push_back()
///   behaves like appending to an array.
///
/// Complexity:
///   lookup, append, pop_back  - O(1) amortized
///   positional insert/erase   - O(n) (positions of the tail are reindexed)
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

#include <fluent/error/error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace detail {

//==============================================================================
// integer key detection (drives the array-like auto increment)
//==============================================================================

template <typename Key>
[[ nodiscard ]] constexpr std::optional<std::int64_t> integer_key( Key const & k ) noexcept
{
    if constexpr ( std::integral<Key> )
        return static_cast<std::int64_t>( k );
    else if constexpr ( requires { { k.is_integer() } -> std::convertible_to<bool>; { k.integer() } -> std::convertible_to<std::int64_t>; } )
    {
        if ( k.is_integer() )
            return k.integer();
        return std::nullopt;
    }
    else
        return std::nullopt;
}

template <typename Key>
concept integer_capable_key = std::constructible_from<Key, std::int64_t> &&
    requires( Key const & k ) { integer_key( k ); };


//==============================================================================
// detail::paired_storage: synchronized dual-container ops
//==============================================================================

template <typename KeyContainer, typename MappedContainer>
struct paired_storage
{
    using size_type       = typename KeyContainer::size_type;
    using difference_type = std::ptrdiff_t;

    KeyContainer    keys;
    MappedContainer values;

    //--------------------------------------------------------------------------
    // Truncate both containers to newSize (shrink-only)
    //--------------------------------------------------------------------------
    void truncate_to( size_type const newSize ) noexcept
    {
        BOOST_ASSERT( newSize <= keys.size() );
        keys  .erase( keys  .begin() + static_cast<difference_type>( newSize ), keys  .end() );
        values.erase( values.begin() + static_cast<difference_type>( newSize ), values.end() );
    }

    //--------------------------------------------------------------------------
    // Synchronized single-element insert at position (exception-safe)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void insert_element_at( size_type const pos, K && key, V && val ) {
        auto const p{ static_cast<difference_type>( pos ) };
        keys.emplace( keys.begin() + p, std::forward<K>( key ) );
        try {
            values.emplace( values.begin() + p, std::forward<V>( val ) );
        } catch ( ... ) {
            keys.erase( keys.begin() + p );
            throw;
        }
    }

    template <typename K, typename V>
    void append_element( K && key, V && val ) {
        keys.emplace_back( std::forward<K>( key ) );
        try {
            values.emplace_back( std::forward<V>( val ) );
        } catch ( ... ) {
            keys.pop_back();
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Synchronized erase
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept {
        auto const p{ static_cast<difference_type>( pos ) };
        keys  .erase( keys  .begin() + p );
        values.erase( values.begin() + p );
    }

    void erase_elements( size_type const first, size_type const last ) noexcept {
        auto const f{ static_cast<difference_type>( first ) };
        auto const l{ static_cast<difference_type>( last  ) };
        keys  .erase( keys  .begin() + f, keys  .begin() + l );
        values.erase( values.begin() + f, values.begin() + l );
    }

    //--------------------------------------------------------------------------
    // Reorder both containers: new position i receives old position order[i]
    //--------------------------------------------------------------------------
    void permute( std::span<size_type const> const order )
    {
        BOOST_ASSERT( order.size() == keys.size() );
        KeyContainer    newKeys;
        MappedContainer newValues;
        newKeys  .reserve( order.size() );
        newValues.reserve( order.size() );
        for ( auto const pos : order )
        {
            newKeys  .emplace_back( std::move( keys  [ pos ] ) );
            newValues.emplace_back( std::move( values[ pos ] ) );
        }
        keys   = std::move( newKeys   );
        values = std::move( newValues );
    }

    void reserve( size_type const n ) {
        keys  .reserve( n );
        values.reserve( n );
    }

    void clear() noexcept {
        keys  .clear();
        values.clear();
    }
}; // struct paired_storage

} // namespace detail


//==============================================================================
// ordered_map: insertion ordered associative container
//==============================================================================

template
<
    typename Key,
    typename T,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>
>
class ordered_map
    : private detail::paired_storage<std::vector<Key>, std::vector<T>>
{
    using base = detail::paired_storage<std::vector<Key>, std::vector<T>>;

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type              = Key;
    using mapped_type           = T;
    using value_type            = std::pair<key_type, mapped_type>;
    using hasher                = Hash;
    using key_equal             = KeyEqual;
    using reference             = std::pair<key_type const &, mapped_type       &>;
    using const_reference       = std::pair<key_type const &, mapped_type const &>;
    using size_type             = typename base::size_type;
    using difference_type       = typename base::difference_type;
    using key_container_type    = std::vector<Key>;
    using mapped_container_type = std::vector<T>;

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
private:
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = ordered_map::value_type;
        using difference_type   = ordered_map::difference_type;
        using reference         = std::conditional_t<IsConst, ordered_map::const_reference, ordered_map::reference>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend ordered_map;
        friend iterator_impl<!IsConst>;

        using map_ptr = std::conditional_t<IsConst, ordered_map const *, ordered_map *>;

        map_ptr         map_{ nullptr };
        difference_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, difference_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        constexpr reference operator*() const noexcept {
            return { map_->base::keys[ static_cast<size_type>( idx_ ) ], map_->base::values[ static_cast<size_type>( idx_ ) ] };
        }

        constexpr arrow_proxy operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept {
            return *( *this + n );
        }

        [[ nodiscard ]] constexpr size_type position() const noexcept { return static_cast<size_type>( idx_ ); }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return { it.map_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return { it.map_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ == b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    ordered_map() = default;

    template <std::input_iterator InputIt>
    ordered_map( InputIt first, InputIt const last )
    {
        for ( ; first != last; ++first )
            insert_or_assign( first->first, first->second );
    }

    // later duplicates overwrite the value but keep the first position
    ordered_map( std::initializer_list<value_type> const il )
        : ordered_map( il.begin(), il.end() ) {}

    ordered_map( ordered_map const & ) = default;
    ordered_map( ordered_map && ) noexcept = default;

    ordered_map & operator=( ordered_map const & ) = default;
    ordered_map & operator=( ordered_map && ) noexcept = default;

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( base::keys.size() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( base::keys.size() ) }; }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty() const noexcept { return base::keys.empty(); }
    [[ nodiscard ]] size_type size () const noexcept { return static_cast<size_type>( base::keys.size() ); }

    using base::reserve;

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------
    mapped_type & operator[]( key_type const & key ) {
        return try_emplace( key ).first->second;
    }

    mapped_type       & at( key_type const & key )       { auto const it{ find( key ) }; if ( it == end() ) detail::throw_out_of_range( "fluent::ordered_map::at" ); return it->second; }
    mapped_type const & at( key_type const & key ) const { auto const it{ find( key ) }; if ( it == end() ) detail::throw_out_of_range( "fluent::ordered_map::at" ); return it->second; }

    // positional access (insertion order)
    [[ nodiscard ]] key_type    const & key_at  ( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return base::keys  [ pos ]; }
    [[ nodiscard ]] mapped_type const & value_at( size_type const pos ) const noexcept { BOOST_ASSERT( pos < size() ); return base::values[ pos ]; }
    [[ nodiscard ]] mapped_type       & value_at( size_type const pos )       noexcept { BOOST_ASSERT( pos < size() ); return base::values[ pos ]; }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] std::optional<size_type> position_of( key_type const & key ) const
    {
        auto const it{ index_.find( key ) };
        if ( it == index_.end() )
            return std::nullopt;
        return it->second;
    }

    iterator       find( key_type const & key )       { auto const pos{ position_of( key ) }; return pos ? iterator      { this, static_cast<difference_type>( *pos ) } : end(); }
    const_iterator find( key_type const & key ) const { auto const pos{ position_of( key ) }; return pos ? const_iterator{ this, static_cast<difference_type>( *pos ) } : end(); }

    [[ nodiscard ]] mapped_type const * find_value( key_type const & key ) const { auto const pos{ position_of( key ) }; return pos ? &base::values[ *pos ] : nullptr; }
    [[ nodiscard ]] mapped_type       * find_value( key_type const & key )       { auto const pos{ position_of( key ) }; return pos ? &base::values[ *pos ] : nullptr; }

    [[ nodiscard ]] size_type count   ( key_type const & key ) const { return index_.count( key ); }
    [[ nodiscard ]] bool      contains( key_type const & key ) const { return index_.contains( key ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // appends when the key is missing, otherwise leaves the existing entry
    template <typename... Args>
    std::pair<iterator, bool> try_emplace( key_type const & key, Args &&... args ) {
        if ( auto const pos{ position_of( key ) } )
            return { iterator{ this, static_cast<difference_type>( *pos ) }, false };
        append_new( key, mapped_type( std::forward<Args>( args )... ) );
        return { iterator{ this, static_cast<difference_type>( size() - 1 ) }, true };
    }

    // overwrites in place (position kept) or appends
    template <typename M>
    std::pair<iterator, bool> insert_or_assign( key_type const & key, M && value ) {
        if ( auto const pos{ position_of( key ) } ) {
            base::values[ *pos ] = std::forward<M>( value );
            return { iterator{ this, static_cast<difference_type>( *pos ) }, false };
        }
        append_new( key, std::forward<M>( value ) );
        return { iterator{ this, static_cast<difference_type>( size() - 1 ) }, true };
    }

    // array-style append under the next free integer index; throws
    // std::out_of_range once that index is taken (the largest integer key is
    // already in use)
    template <typename M>
    iterator push_back( M && value ) requires detail::integer_capable_key<Key>
    {
        key_type const next( next_index_ );
        if ( contains( next ) ) [[ unlikely ]]
            detail::throw_out_of_range( "fluent::ordered_map::push_back: the next element is already occupied" );
        append_new( next, std::forward<M>( value ) );
        return { this, static_cast<difference_type>( size() - 1 ) };
    }

    // positional insert of a new key (an existing entry with the same key is
    // removed first)
    template <typename M>
    iterator insert_at( size_type pos, key_type const & key, M && value )
    {
        if ( auto const existing{ position_of( key ) } )
        {
            erase_at( *existing );
            if ( *existing < pos )
                --pos;
        }
        BOOST_ASSERT( pos <= size() );
        base::insert_element_at( pos, key, std::forward<M>( value ) );
        reindex_from( pos );
        note_key( key );
        return { this, static_cast<difference_type>( pos ) };
    }

    void erase_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        index_.erase( base::keys[ pos ] );
        base::erase_element_at( pos );
        reindex_from( pos );
    }

    void erase_range( size_type const first, size_type const last ) noexcept
    {
        BOOST_ASSERT( first <= last && last <= size() );
        for ( auto pos{ first }; pos != last; ++pos )
            index_.erase( base::keys[ pos ] );
        base::erase_elements( first, last );
        reindex_from( first );
    }

    iterator erase( const_iterator const pos ) noexcept
    {
        auto const idx{ pos.position() };
        erase_at( idx );
        return { this, static_cast<difference_type>( idx ) };
    }

    size_type erase( key_type const & key ) noexcept
    {
        auto const pos{ position_of( key ) };
        if ( !pos )
            return 0;
        erase_at( *pos );
        return 1;
    }

    // removes the last entry; an integer key equal to next_index() - 1 gives
    // its index back
    value_type pop_back()
    {
        BOOST_ASSERT( !empty() );
        auto const pos{ size() - 1 };
        value_type popped{ std::move( base::keys[ pos ] ), std::move( base::values[ pos ] ) };
        index_.erase( popped.first );
        base::truncate_to( pos );
        if ( auto const integer{ detail::integer_key( popped.first ) }; integer && *integer == next_index_ - 1 )
            --next_index_;
        return popped;
    }

    void clear() noexcept
    {
        base::clear();
        index_.clear();
        next_index_ = 0;
    }

    //--------------------------------------------------------------------------
    // Bulk reordering
    //--------------------------------------------------------------------------

    // new position i receives the entry at old position order[ i ]; order must
    // be a permutation of [ 0, size() )
    void permute( std::span<size_type const> const order )
    {
        base::permute( order );
        rebuild_index();
    }

    // renumbers integer keys 0, 1, 2, ... in iteration order, string keys are
    // left untouched
    void renumber_integer_keys() requires detail::integer_capable_key<Key>
    {
        std::int64_t next{ 0 };
        for ( auto & k : base::keys )
        {
            if ( detail::integer_key( k ) )
                k = key_type( next++ );
        }
        rebuild_index();
        next_index_ = next;
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] key_container_type    const & keys  () const noexcept { return base::keys;   }
    [[ nodiscard ]] mapped_container_type const & values() const noexcept { return base::values; }

    [[ nodiscard ]] std::int64_t next_index() const noexcept { return next_index_; }

    //--------------------------------------------------------------------------
    // Comparison (order sensitive)
    //--------------------------------------------------------------------------
    friend bool operator==( ordered_map const & a, ordered_map const & b ) {
        return a.keys() == b.keys() && a.values() == b.values();
    }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    template <typename M>
    void append_new( key_type const & key, M && value )
    {
        BOOST_ASSERT( !contains( key ) );
        base::append_element( key, std::forward<M>( value ) );
        try {
            index_.emplace( key, size() - 1 );
        } catch ( ... ) {
            base::truncate_to( size() - 1 );
            throw;
        }
        note_key( key );
    }

    void note_key( key_type const & key ) noexcept
    {
        if ( auto const integer{ detail::integer_key( key ) }; integer && *integer >= next_index_ )
            next_index_ = ( *integer == std::numeric_limits<std::int64_t>::max() ) ? *integer : *integer + 1;
    }

    void reindex_from( size_type const first )
    {
        for ( auto pos{ first }; pos < size(); ++pos )
            index_.insert_or_assign( base::keys[ pos ], pos );
        BOOST_ASSERT( index_.size() == size() );
    }

    void rebuild_index()
    {
        index_.clear();
        index_.reserve( size() );
        for ( size_type pos{ 0 }; pos < size(); ++pos )
            index_.emplace( base::keys[ pos ], pos );
        BOOST_ASSERT_MSG( index_.size() == size(), "Duplicate keys" );
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    std::unordered_map<key_type, size_type, hasher, key_equal> index_;
    std::int64_t                                                next_index_{ 0 };
}; // class ordered_map

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
