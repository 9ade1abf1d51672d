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
#include <fluent/json.hpp>
#include <fluent/collection.hpp>

#include <boost/config.hpp>

#include <cstdint>
#include <limits>
#include <ostream>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace json
{
    namespace
    {
        [[ nodiscard ]] document encode_members( map_type const & items )
        {
            auto members = document::object();
            for ( auto const & [ k, v ] : items )
                members[ k.to_string() ] = to_document( v );
            return members;
        }

        [[ nodiscard ]] document encode_entries( map_type const & items )
        {
            if ( !is_list( items ) )
                return encode_members( items );
            auto elements = document::array();
            for ( auto const & v : items.values() )
                elements.push_back( to_document( v ) );
            return elements;
        }

        [[ nodiscard ]] document encode_object( object const & obj )
        {
            if ( auto const serialized{ obj.json_serialize() } )
                return to_document( *serialized );
            if ( auto const text{ obj.to_json() } )
                return document::parse( *text );
            if ( auto const array{ obj.to_array() } )
                return encode_entries( *array );
            return encode_members( obj.properties() );
        }
    } // anonymous namespace

    bool is_list( map_type const & items ) noexcept
    {
        std::int64_t expected{ 0 };
        for ( auto const & k : items.keys() )
        {
            if ( !k.is_integer() || k.integer() != expected++ )
                return false;
        }
        return true;
    }

    document to_document( value const & v )
    {
        switch ( v.kind() )
        {
            case value_kind::null      : return nullptr;
            case value_kind::boolean   : return v.as_bool    ();
            case value_kind::integer   : return v.as_integer ();
            case value_kind::floating  : return v.as_floating();
            case value_kind::string    : return v.as_string  ();
            case value_kind::map       : return encode_entries( v.as_map() );
            case value_kind::collection: return encode_entries( v.as_collection().all() );
            case value_kind::object    : return encode_object ( v.as_object() );
        }
        BOOST_UNREACHABLE_RETURN( nullptr );
    }

    value from_document( document const & doc )
    {
        switch ( doc.type() )
        {
            case document::value_t::boolean        : return value( doc.get<bool>() );
            case document::value_t::number_integer : return value( doc.get<std::int64_t>() );
            case document::value_t::number_unsigned:
            {
                auto const number{ doc.get<std::uint64_t>() };
                if ( number > static_cast<std::uint64_t>( std::numeric_limits<std::int64_t>::max() ) )
                    return value( static_cast<double>( number ) );
                return value( static_cast<std::int64_t>( number ) );
            }
            case document::value_t::number_float   : return value( doc.get<double>() );
            case document::value_t::string         : return value( doc.get_ref<std::string const &>() );
            case document::value_t::array:
            {
                map_type items;
                items.reserve( doc.size() );
                for ( auto const & element : doc )
                    items.push_back( from_document( element ) );
                return value( std::move( items ) );
            }
            case document::value_t::object:
            {
                map_type items;
                items.reserve( doc.size() );
                for ( auto member{ doc.begin() }; member != doc.end(); ++member )
                    items.insert_or_assign( key( member.key() ), from_document( member.value() ) );
                return value( std::move( items ) );
            }
            default:
                return {};
        }
    }

    std::string dump( value const & v, json_options const & options )
    {
        return to_document( v ).dump( options.pretty_print ? options.indent : -1, ' ', options.ensure_ascii );
    }

    value parse( std::string_view const text )
    {
        return from_document( document::parse( text ) );
    }
} // namespace json

std::ostream & operator<<( std::ostream & os, value const & v )
{
    return os << json::dump( v );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
