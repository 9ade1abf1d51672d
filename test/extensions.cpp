////////////////////////////////////////////////////////////////////////////////
/// fluent::collection extension (macro) unit tests
////////////////////////////////////////////////////////////////////////////////

#include <fluent/collection.hpp>
#include <fluent/extensions.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent {
//------------------------------------------------------------------------------

TEST( extensions, extend_and_call )
{
    collection::extend
    (
        "exclaim_all",
        []( collection * const self, std::vector<value> const & ) -> value
        {
            self->transform( []( value const & v ) { return value( to_string( v ) + "!" ); } );
            return value( self->count() );
        }
    );
    EXPECT_TRUE ( collection::has_extension( "exclaim_all" ) );
    EXPECT_TRUE ( collection::has_macro    ( "exclaim_all" ) );
    EXPECT_FALSE( collection::has_extension( "not_registered" ) );

    collection c{ "a", "b" };
    EXPECT_EQ( c.call( "exclaim_all" ), value( 2 ) );
    EXPECT_EQ( c.to_json(), R"(["a!","b!"])" );
}

TEST( extensions, arguments_are_forwarded )
{
    collection::macro
    (
        "nth_or",
        []( collection * const self, std::vector<value> const & arguments ) -> value
        {
            return self->get( arr::to_key( arguments.at( 0 ) ), arguments.at( 1 ) );
        }
    );
    collection c{ "x", "y" };
    EXPECT_EQ( c.call( "nth_or", { 1, "none" } ), value( "y" ) );
    EXPECT_EQ( c.call( "nth_or", { 5, "none" } ), value( "none" ) );
}

TEST( extensions, static_call_has_no_receiver )
{
    collection::extend
    (
        "make_range",
        []( collection * const self, std::vector<value> const & arguments ) -> value
        {
            EXPECT_EQ( self, nullptr );
            collection range;
            for ( auto i{ arguments.at( 0 ).as_integer() }; i <= arguments.at( 1 ).as_integer(); ++i )
                range.push( i );
            return value( std::move( range ) );
        }
    );
    auto const range{ collection::call_static( "make_range", { 1, 3 } ) };
    ASSERT_TRUE( range.is_collection() );
    EXPECT_EQ  ( range.as_collection().to_json(), "[1,2,3]" );
}

TEST( extensions, re_registration_replaces )
{
    collection::extend( "answer", []( collection *, std::vector<value> const & ) { return value( 1 ); } );
    collection::extend( "answer", []( collection *, std::vector<value> const & ) { return value( 42 ); } );
    EXPECT_EQ( collection::call_static( "answer" ), value( 42 ) );
}

TEST( extensions, unknown_name_throws )
{
    collection c;
    EXPECT_THROW( (void)c.call( "missing_method" ), unknown_operation );
    EXPECT_THROW( (void)collection::call_static( "missing_method" ), std::logic_error );
    try
    {
        (void)c.call( "missing_method" );
        FAIL() << "expected unknown_operation";
    }
    catch ( unknown_operation const & error )
    {
        EXPECT_EQ( std::string( error.what() ), "Method missing_method does not exist." );
        EXPECT_EQ( error.name(), "missing_method" );
    }
}

TEST( extensions, explicit_registry )
{
    extension_registry registry;
    EXPECT_EQ( registry.size(), 0 );
    registry.add( "double_all", []( collection * const self, std::vector<value> const & )
    {
        self->transform( []( value const & v ) { return value( v.as_integer() * 2 ); } );
        return value();
    } );

    EXPECT_TRUE ( collection::has_extension( "double_all", registry ) );
    EXPECT_FALSE( collection::has_extension( "double_all" ) );

    collection c{ 1, 2 };
    (void)c.call( "double_all", {}, registry );
    EXPECT_EQ( c.to_json(), "[2,4]" );
    EXPECT_THROW( (void)c.call( "double_all" ), unknown_operation );
    EXPECT_THROW( (void)collection::call_static( "missing", {}, registry ), unknown_operation );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
