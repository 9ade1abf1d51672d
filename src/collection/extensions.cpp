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
#include <fluent/extensions.hpp>
#include <fluent/collection.hpp>
#include <fluent/error/error.hpp>

#include <boost/assert.hpp>
//------------------------------------------------------------------------------
namespace fluent
{
//------------------------------------------------------------------------------

void extension_registry::add( std::string name, extension fn )
{
    BOOST_ASSERT_MSG( fn, "Empty extension closure" );
    extensions_.insert_or_assign( std::move( name ), std::move( fn ) );
}

bool extension_registry::contains( std::string_view const name ) const
{
    return extensions_.find( name ) != extensions_.end();
}

extension const & extension_registry::get( std::string_view const name ) const
{
    auto const found{ extensions_.find( name ) };
    if ( found == extensions_.end() )
        detail::throw_unknown_operation( name );
    return found->second;
}

extension_registry & extension_registry::global() noexcept
{
    static extension_registry registry;
    return registry;
}

//------------------------------------------------------------------------------
// collection extension entry points
//------------------------------------------------------------------------------

void collection::extend( std::string name, extension fn )
{
    extension_registry::global().add( std::move( name ), std::move( fn ) );
}

bool collection::has_extension( std::string_view const name ) { return has_extension( name, extension_registry::global() ); }
bool collection::has_extension( std::string_view const name, extension_registry const & registry ) { return registry.contains( name ); }

value collection::call( std::string_view const name, std::vector<value> const & arguments ) { return call( name, arguments, extension_registry::global() ); }
value collection::call( std::string_view const name, std::vector<value> const & arguments, extension_registry const & registry )
{
    return registry.get( name )( this, arguments );
}

value collection::call_static( std::string_view const name, std::vector<value> const & arguments ) { return call_static( name, arguments, extension_registry::global() ); }
value collection::call_static( std::string_view const name, std::vector<value> const & arguments, extension_registry const & registry )
{
    return registry.get( name )( nullptr, arguments );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
