////////////////////////////////////////////////////////////////////////////////
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
#include <fluent/value/value.hpp>
#include <fluent/collection.hpp>

#include <boost/config.hpp>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

char const * to_string( value_kind const k ) noexcept
{
    switch ( k )
    {
        case value_kind::null      : return "null";
        case value_kind::boolean   : return "boolean";
        case value_kind::integer   : return "integer";
        case value_kind::floating  : return "floating";
        case value_kind::string    : return "string";
        case value_kind::map       : return "map";
        case value_kind::collection: return "collection";
        case value_kind::object    : return "object";
    }
    BOOST_UNREACHABLE_RETURN( "" );
}

value::value(                ) noexcept = default;
value::value( std::nullptr_t ) noexcept {}

value::value( char const *     const str )          : storage_{ std::in_place_index<4>, str } { BOOST_ASSERT( str ); }
value::value( std::string_view const str )          : storage_{ std::in_place_index<4>, str } {}
value::value( std::string            str ) noexcept : storage_{ std::in_place_index<4>, std::move( str ) } {}

value::value( key const & k )
{
    if ( k.is_integer() )
        storage_.emplace<2>( k.integer() );
    else
        storage_.emplace<4>( k.string() );
}

value::value( map_type   items ) : storage_{ std::in_place_index<5>, std::move( items ) } {}
value::value( collection items ) : storage_{ std::in_place_index<6>, std::move( items ) } {}

value::value( std::shared_ptr<object const> obj )
{
    if ( obj )
        storage_.emplace<7>( std::move( obj ) );
}

value::value( value const &  ) = default;
value::value( value       && ) noexcept = default;
value & value::operator=( value const &  ) = default;
value & value::operator=( value       && ) noexcept = default;
value::~value() = default;

map_type const & value::as_map() const noexcept { return *get<5>(); }
map_type       & value::as_map()       noexcept { return *get<5>(); }

collection const & value::as_collection() const noexcept { return *get<6>(); }
collection       & value::as_collection()       noexcept { return *get<6>(); }

map_type const * value::entries() const noexcept
{
    switch ( kind() )
    {
        case value_kind::map       : return &as_map();
        case value_kind::collection: return &as_collection().all();
        default                    : return nullptr;
    }
}

std::optional<value> value::find_field( std::string_view const segment ) const
{
    if ( auto const items{ entries() } )
    {
        if ( auto const found{ items->find_value( key{ segment } ) } )
            return *found;
        return std::nullopt;
    }
    if ( is_object() )
        return as_object().field( segment );
    return std::nullopt;
}

std::size_t value::size() const noexcept
{
    auto const items{ entries() };
    return items ? items->size() : 0;
}

bool operator==( value const & left, value const & right )
{
    if ( left.kind() != right.kind() )
        return false;
    switch ( left.kind() )
    {
        case value_kind::null      : return true;
        case value_kind::boolean   : return left.as_bool    () == right.as_bool    ();
        case value_kind::integer   : return left.as_integer () == right.as_integer ();
        case value_kind::floating  : return left.as_floating() == right.as_floating();
        case value_kind::string    : return left.as_string  () == right.as_string  ();
        case value_kind::map       : return left.as_map     () == right.as_map     ();
        case value_kind::collection: return left.as_collection().all() == right.as_collection().all();
        case value_kind::object    : return left.object_handle() == right.object_handle();
    }
    BOOST_UNREACHABLE_RETURN( false );
}


//------------------------------------------------------------------------------
// object
//------------------------------------------------------------------------------

object::~object() = default;

std::optional<value>       object::field( std::string_view ) const { return std::nullopt; }
std::optional<map_type>    object::entries       () const { return std::nullopt; }
std::optional<value>       object::json_serialize() const { return std::nullopt; }
std::optional<std::string> object::to_json       () const { return std::nullopt; }
std::optional<map_type>    object::to_array      () const { return std::nullopt; }
map_type                   object::properties    () const { return {}; }

std::optional<value> record::field( std::string_view const name ) const
{
    if ( auto const found{ properties_.find_value( key{ name } ) } )
        return *found;
    return std::nullopt;
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
