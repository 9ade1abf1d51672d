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
#include <fluent/source.hpp>
#include <fluent/collection.hpp>
#include <fluent/json.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    // a value produced by a capability or a thunk: composites contribute their
    // entries, null nothing, anything else becomes a single element
    [[ nodiscard ]] map_type entries_of( value const & v )
    {
        return source( v ).normalize();
    }

    [[ nodiscard ]] map_type entries_of( object const & obj )
    {
        if ( auto entries{ obj.entries() } )
            return std::move( *entries );
        if ( auto const serialized{ obj.json_serialize() } )
            return entries_of( *serialized );
        if ( auto const text{ obj.to_json() } )
            return entries_of( json::parse( *text ) );
        if ( auto array{ obj.to_array() } )
            return std::move( *array );
        return obj.properties();
    }
} // anonymous namespace

source::source( map_type           items ) : tag_{ tag::map       }, payload_( std::move( items ) ) {}
source::source( collection const & items ) : tag_{ tag::container }, payload_( items ) {}

source::source( std::initializer_list<value> const items )
    : tag_{ tag::sequence }
{
    map_type sequence;
    sequence.reserve( items.size() );
    for ( auto const & item : items )
        sequence.push_back( item );
    payload_ = value( std::move( sequence ) );
}

source::source( std::vector<value> items )
    : tag_{ tag::sequence }
{
    map_type sequence;
    sequence.reserve( items.size() );
    for ( auto & item : items )
        sequence.push_back( std::move( item ) );
    payload_ = value( std::move( sequence ) );
}

source::source( std::shared_ptr<object const> obj )
{
    if ( obj )
    {
        tag_     = tag::object;
        payload_ = value( std::move( obj ) );
    }
}

source::source( value v )
{
    switch ( v.kind() )
    {
        case value_kind::null      : return;
        case value_kind::map       : tag_ = tag::map      ; break;
        case value_kind::collection: tag_ = tag::container; break;
        case value_kind::object    : tag_ = tag::object   ; break;
        default                    : tag_ = tag::scalar   ; break;
    }
    payload_ = std::move( v );
}

map_type source::normalize() const
{
    switch ( tag_ )
    {
        case tag::empty    : return {};
        case tag::map      :
        case tag::sequence : return payload_.as_map();
        case tag::container: return payload_.as_collection().all();
        case tag::thunk    : return entries_of( thunk_() );
        case tag::object   : return entries_of( payload_.as_object() );
        case tag::scalar   :
        {
            map_type single;
            single.push_back( payload_ );
            return single;
        }
    }
    BOOST_UNREACHABLE_RETURN( {} );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
