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
#include <fluent/collection.hpp>
#include <fluent/detail/config.hpp>
#include <fluent/error/error.hpp>
#include <fluent/json.hpp>

#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/serialization/string.hpp>

#include <ostream>
#include <sstream>
#include <string>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

namespace
{
    value arrayed( value const & v );

    [[ nodiscard ]] map_type arrayed_entries( map_type const & items )
    {
        map_type result;
        result.reserve( items.size() );
        for ( auto const & [ k, v ] : items )
            result.insert_or_assign( k, arrayed( v ) );
        return result;
    }

    value arrayed( value const & v )
    {
        switch ( v.kind() )
        {
            case value_kind::map       : return value( arrayed_entries( v.as_map() ) );
            case value_kind::collection: return value( v.as_collection().to_array() );
            case value_kind::object    :
                if ( auto const array{ v.as_object().to_array() } )
                    return value( arrayed_entries( *array ) );
                return v;
            default:
                return v;
        }
    }

    value json_ready( value const & v );

    [[ nodiscard ]] map_type json_ready_entries( map_type const & items )
    {
        map_type result;
        result.reserve( items.size() );
        for ( auto const & [ k, v ] : items )
            result.insert_or_assign( k, json_ready( v ) );
        return result;
    }

    value json_ready( value const & v )
    {
        switch ( v.kind() )
        {
            case value_kind::map       : return value( json_ready_entries( v.as_map() ) );
            case value_kind::collection: return v.as_collection().json_serialize();
            case value_kind::object    :
            {
                auto const & obj{ v.as_object() };
                if ( auto const serialized{ obj.json_serialize() } )
                    return json_ready( *serialized );
                if ( auto const text{ obj.to_json() } )
                    return json::parse( *text );
                if ( auto const array{ obj.to_array() } )
                    return value( json_ready_entries( *array ) );
                return v;
            }
            default:
                return v;
        }
    }
} // anonymous namespace

//------------------------------------------------------------------------------
// Conversions
//------------------------------------------------------------------------------

map_type collection::to_array() const
{
    return arrayed_entries( items_ );
}

value collection::json_serialize() const
{
    return value( json_ready_entries( items_ ) );
}

std::string collection::to_json( json_options const & options ) const
{
    return json::dump( json_serialize(), options );
}

std::ostream & operator<<( std::ostream & os, collection const & c )
{
    return os << c.to_json();
}

//------------------------------------------------------------------------------
// Archive envelope
//------------------------------------------------------------------------------

std::string collection::serialize() const
{
    std::ostringstream stream;
    {
        boost::archive::text_oarchive archive( stream );
        unsigned    const version{ FLUENT_SERIALIZATION_VERSION };
        std::string const payload{ to_json() };
        archive << version << payload;
    }
    return stream.str();
}

collection collection::deserialize( std::string const & blob )
{
    std::istringstream stream( blob );
    boost::archive::text_iarchive archive( stream );
    unsigned    version{ 0 };
    std::string payload;
    archive >> version >> payload;
    if ( version > FLUENT_SERIALIZATION_VERSION )
        detail::throw_invalid_argument( "Unsupported collection archive version " + std::to_string( version ) + '.' );
    return collection( source( json::parse( payload ) ) );
}

//------------------------------------------------------------------------------
// Iteration
//------------------------------------------------------------------------------

caching_iterator collection::get_caching_iterator() const
{
    return caching_iterator( items_ );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
