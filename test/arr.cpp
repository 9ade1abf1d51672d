////////////////////////////////////////////////////////////////////////////////
/// fluent::arr (array helper) unit tests
////////////////////////////////////////////////////////////////////////////////

#include <fluent/arr.hpp>
#include <fluent/collection.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent {
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] map_type entries( value const & v ) { return v.as_map(); }

    [[ nodiscard ]] value const & people()
    {
        static value const data{ list(
            dict( { { "name", "Taylor" }, { "role", dict( { { "title", "dev"  } } ) }, { "tags", list( "a", "b" ) } } ),
            dict( { { "name", "Abigail" }, { "role", dict( { { "title", "lead" } } ) }, { "tags", list( "c" ) } } )
        ) };
        return data;
    }
} // anonymous namespace

TEST( arr, explode_path )
{
    EXPECT_EQ( arr::explode_path( "a.b.c" ), ( std::vector<std::string>{ "a", "b", "c" } ) );
    EXPECT_EQ( arr::explode_path( "a"     ), ( std::vector<std::string>{ "a" } ) );
    EXPECT_EQ( arr::explode_path( ""      ), ( std::vector<std::string>{ "" } ) );
}

TEST( arr, data_get_walks_maps_and_objects )
{
    auto const account{ std::make_shared<record>() };
    account->set( "owner", dict( { { "email", "taylor@example.com" } } ) );
    auto const target{ dict( { { "account", account } } ) };

    EXPECT_EQ( arr::data_get( target, "account.owner.email" ), value( "taylor@example.com" ) );
    EXPECT_EQ( arr::data_get( target, "account.missing", "none" ), value( "none" ) );
    EXPECT_EQ( arr::data_get( people(), "1.role.title" ), value( "lead" ) );
    EXPECT_EQ( arr::data_get( value( 5 ), "a" ), value() );
}

TEST( arr, data_get_wildcards )
{
    EXPECT_EQ( arr::data_get( people(), "*.name" ), list( "Taylor", "Abigail" ) );
    EXPECT_EQ( arr::data_get( people(), "*.role.title" ), list( "dev", "lead" ) );
    // a nested wildcard collapses one level
    EXPECT_EQ( arr::data_get( people(), "*.tags.*" ), list( "a", "b", "c" ) );
    EXPECT_EQ( arr::data_get( value( "scalar" ), "*", "fallback" ), value( "fallback" ) );
}

TEST( arr, pluck )
{
    auto const items{ entries( people() ) };
    EXPECT_EQ( value( arr::pluck( items, "name" ) ), list( "Taylor", "Abigail" ) );
    EXPECT_EQ
    (
        value( arr::pluck( items, "role.title", "name" ) ),
        dict( { { "Taylor", "dev" }, { "Abigail", "lead" } } )
    );
}

TEST( arr, only_and_except )
{
    auto const items{ entries( dict( { { "a", 1 }, { "b", 2 }, { "c", 3 } } ) ) };
    std::vector<key> const keys{ "c", "a", "z" };
    // source order is kept
    EXPECT_EQ( value( arr::only  ( items, keys ) ), dict( { { "a", 1 }, { "c", 3 } } ) );
    EXPECT_EQ( value( arr::except( items, keys ) ), dict( { { "b", 2 } } ) );
}

TEST( arr, flatten_depth )
{
    auto const items{ entries( list( "#foo", list( "#bar", list( "#baz" ) ), "#zap" ) ) };
    EXPECT_EQ( value( arr::flatten( items ) ), list( "#foo", "#bar", "#baz", "#zap" ) );
    EXPECT_EQ( value( arr::flatten( items, 1 ) ), list( "#foo", "#bar", list( "#baz" ), "#zap" ) );
    EXPECT_EQ( value( arr::flatten( items, 2 ) ), list( "#foo", "#bar", "#baz", "#zap" ) );
}

TEST( arr, collapse_skips_scalars )
{
    auto const items{ entries( list( list( 1, 2 ), 3, dict( { { "k", 4 } } ), value( collection{ 5 } ) ) ) };
    EXPECT_EQ( value( arr::collapse( items ) ), dict( { { 0, 1 }, { 1, 2 }, { "k", 4 }, { 2, 5 } } ) );
}

TEST( arr, merge_into )
{
    auto target{ entries( dict( { { "name", "Hello" }, { 0, "x" } } ) ) };
    arr::merge_into( target, entries( dict( { { "name", "World" }, { 0, "y" } } ) ) );
    EXPECT_EQ( value( target ), dict( { { "name", "World" }, { 0, "x" }, { 1, "y" } } ) );
}

TEST( arr, to_key )
{
    EXPECT_EQ( arr::to_key( value( true  ) ), key( 1 ) );
    EXPECT_EQ( arr::to_key( value( false ) ), key( 0 ) );
    EXPECT_EQ( arr::to_key( value() ), key( "" ) );
    EXPECT_EQ( arr::to_key( value( 2.7 ) ), key( 2 ) );
    EXPECT_EQ( arr::to_key( value( "5" ) ), key( 5 ) );
    EXPECT_EQ( arr::to_key( value( "id" ) ), key( "id" ) );
}

TEST( arr, slice_bounds )
{
    using bounds = std::pair<std::size_t, std::size_t>;
    auto constexpr max{ std::numeric_limits<std::int64_t>::max() };
    auto constexpr min{ std::numeric_limits<std::int64_t>::min() };

    EXPECT_EQ( arr::slice_bounds( 10,  7, std::nullopt ), bounds(  7, 10 ) );
    EXPECT_EQ( arr::slice_bounds( 10, -3, std::nullopt ), bounds(  7, 10 ) );
    EXPECT_EQ( arr::slice_bounds( 10,  6, -2           ), bounds(  6,  8 ) );
    EXPECT_EQ( arr::slice_bounds( 10,  5, -8           ), bounds(  5,  5 ) );
    EXPECT_EQ( arr::slice_bounds( 10, 20, std::nullopt ), bounds( 10, 10 ) );

    // extreme offsets and lengths clamp instead of wrapping around
    EXPECT_EQ( arr::slice_bounds( 3,   1, max ), bounds( 1, 3 ) );
    EXPECT_EQ( arr::slice_bounds( 3, max, max ), bounds( 3, 3 ) );
    EXPECT_EQ( arr::slice_bounds( 3, min,   2 ), bounds( 0, 2 ) );
    EXPECT_EQ( arr::slice_bounds( 3,   0, min ), bounds( 0, 0 ) );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
