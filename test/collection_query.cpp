////////////////////////////////////////////////////////////////////////////////
/// fluent::collection query and reduction unit tests
////////////////////////////////////////////////////////////////////////////////

#include <fluent/collection.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace fluent {
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] value array_of( collection const & c ) { return value( c.to_array() ); }

    [[ nodiscard ]] collection products()
    {
        return collection
        {
            dict( { { "name", "Desk"  }, { "price", 200 }, { "stock", 3    } } ),
            dict( { { "name", "Chair" }, { "price", 100 }, { "stock", 10   } } ),
            dict( { { "name", "Lamp"  }, { "price", 50  }, { "stock", nullptr } } )
        };
    }
} // anonymous namespace

//==============================================================================
// first / last
//==============================================================================

TEST( collection_query, first_and_last )
{
    collection const c{ 1, 2, 3 };
    EXPECT_EQ( c.first(), value( 1 ) );
    EXPECT_EQ( c.last (), value( 3 ) );

    EXPECT_EQ( collection{}.first(), value() );
    EXPECT_EQ( collection{}.first( nullptr, "default" ), value( "default" ) );
    EXPECT_EQ( collection{}.last ( nullptr, "default" ), value( "default" ) );
}

TEST( collection_query, first_and_last_with_predicate )
{
    collection const c{ 1, 5, 2, 7, 3 };
    auto const above_four{ []( key const &, value const & v ) { return v.as_integer() > 4; } };
    EXPECT_EQ( c.first( above_four ), value( 5 ) );
    EXPECT_EQ( c.last ( above_four ), value( 7 ) );

    auto const above_ten{ []( key const &, value const & v ) { return v.as_integer() > 10; } };
    EXPECT_EQ( c.first( above_ten ), value() );
    EXPECT_EQ( c.last ( above_ten, "none" ), value( "none" ) );
}

TEST( collection_query, single_argument_predicate_receives_the_key )
{
    collection const c{ { 0, "zero" }, { "name", "taylor" }, { 1, "one" } };
    EXPECT_EQ( c.first( []( key const & k ) { return k.is_string(); } ), value( "taylor" ) );
    EXPECT_EQ( c.last ( []( key const & k ) { return k.is_integer(); } ), value( "one" ) );
}

//==============================================================================
// contains / search
//==============================================================================

TEST( collection_query, contains_is_loose )
{
    collection const c{ 1, 2, "three" };
    EXPECT_TRUE ( c.contains( 1 ) );
    EXPECT_TRUE ( c.contains( "2" ) );
    EXPECT_TRUE ( c.contains( "three" ) );
    EXPECT_FALSE( c.contains( 4 ) );

    EXPECT_TRUE ( c.contains_strict( 2 ) );
    EXPECT_FALSE( c.contains_strict( "2" ) );
}

TEST( collection_query, contains_by_path_and_predicate )
{
    auto const c{ products() };
    EXPECT_TRUE ( c.contains( "name", "Desk" ) );
    EXPECT_FALSE( c.contains( "name", "Bookcase" ) );
    EXPECT_TRUE ( c.contains( "price", "100" ) );
    EXPECT_FALSE( c.contains_strict( "price", "100" ) );
    EXPECT_TRUE ( c.contains_strict( "price", 100 ) );

    EXPECT_TRUE ( c.contains( []( key const &, value const & v ) { return v.as_map().at( "price" ).as_integer() < 60; } ) );
    EXPECT_FALSE( c.contains( []( key const &, value const & v ) { return v.as_map().at( "price" ).as_integer() > 500; } ) );
    EXPECT_FALSE( collection{}.contains( 1 ) );
}

TEST( collection_query, search )
{
    collection const c{ 2, 4, 6, 8 };
    EXPECT_EQ   ( *c.search( 4 ), key( 1 ) );
    EXPECT_EQ   ( *c.search( "4" ), key( 1 ) );
    EXPECT_FALSE( c.search( "4", true ).has_value() );
    EXPECT_FALSE( c.search( 5 ).has_value() );

    EXPECT_EQ   ( *c.search( []( value const & v ) { return v.as_integer() > 5; } ), key( 2 ) );
    EXPECT_FALSE( c.search( []( value const & v ) { return v.as_integer() > 9; } ).has_value() );

    collection const keyed{ { "a", 1 }, { "b", 2 } };
    EXPECT_EQ( *keyed.search( 2 ), key( "b" ) );
}

//==============================================================================
// Statistics
//==============================================================================

TEST( collection_query, sum )
{
    EXPECT_EQ( ( collection{ 1, 2, 3 } ).sum(), value( 6 ) );
    EXPECT_EQ( ( collection{ 1, 2.5 } ).sum(), value( 3.5 ) );
    EXPECT_EQ( ( collection{ 1, "2", "x" } ).sum(), value( 3 ) );
    EXPECT_EQ( collection{}.sum(), value( 0 ) );

    EXPECT_EQ( products().sum( "price" ), value( 350 ) );
    EXPECT_EQ( products().sum( []( value const & v ) { return value( v.as_map().at( "price" ).as_integer() * 2 ); } ), value( 700 ) );
}

TEST( collection_query, sum_promotes_on_integer_overflow )
{
    collection const c{ std::numeric_limits<std::int64_t>::max(), 1 };
    auto const total{ c.sum() };
    EXPECT_TRUE( total.is_floating() );
}

TEST( collection_query, average )
{
    EXPECT_EQ   ( ( collection{ 1, 2, 3, 4 } ).average(), 2.5 );
    EXPECT_EQ   ( products().avg( "price" ), 350.0 / 3 );
    EXPECT_FALSE( collection{}.average().has_value() );
}

TEST( collection_query, max_and_min )
{
    collection const c{ nullptr, 3, 1, 7, 2 };
    EXPECT_EQ( c.max(), value( 7 ) );
    EXPECT_EQ( c.min(), value( 1 ) );

    EXPECT_EQ( products().max( "price" ), value( 200 ) );
    EXPECT_EQ( products().min( "stock" ), value( 3 ) );

    EXPECT_EQ( ( collection{ "a", "c", "b" } ).max(), value( "c" ) );

    EXPECT_FALSE( collection{}.max().has_value() );
    EXPECT_FALSE( ( collection{ nullptr } ).min().has_value() );
}

TEST( collection_query, median )
{
    EXPECT_EQ( ( collection{ 1, 2, 2, 4 } ).median(), 2.0 );
    EXPECT_EQ( ( collection{ 0, 3 } ).median(), 1.5 );
    EXPECT_EQ( ( collection{ 4, 1, 3 } ).median(), 3.0 );
    EXPECT_EQ( ( collection{ nullptr, 1, 3 } ).median(), 2.0 );
    EXPECT_EQ( products().median( "stock" ), 6.5 );

    EXPECT_FALSE( collection{}.median().has_value() );
    EXPECT_FALSE( ( collection{ nullptr } ).median().has_value() );
}

TEST( collection_query, mode )
{
    auto const single{ ( collection{ 1, 1, 2, 4 } ).mode() };
    ASSERT_TRUE( single.has_value() );
    EXPECT_EQ  ( array_of( *single ), list( 1 ) );

    // ties are all reported, in ascending order
    auto const tied{ ( collection{ 4, 2, 4, 2, 3 } ).mode() };
    ASSERT_TRUE( tied.has_value() );
    EXPECT_EQ  ( array_of( *tied ), list( 2, 4 ) );

    auto const by_path{ collection{ dict( { { "v", 1 } } ), dict( { { "v", 1 } } ), dict( { { "v", 2 } } ) }.mode( "v" ) };
    ASSERT_TRUE( by_path.has_value() );
    EXPECT_EQ  ( array_of( *by_path ), list( 1 ) );

    EXPECT_FALSE( collection{}.mode().has_value() );
}

//==============================================================================
// reduce / pipe / each
//==============================================================================

TEST( collection_query, reduce )
{
    collection const c{ 1, 2, 3 };
    auto const total
    {
        c.reduce( []( value const & carry, value const & item ) { return value( carry.as_integer() + item.as_integer() ); }, 0 )
    };
    EXPECT_EQ( total, value( 6 ) );

    collection const keyed{ { "a", 1 }, { "b", 2 } };
    auto const joined
    {
        keyed.reduce
        (
            []( value const & carry, value const & item, key const & k ) { return value( carry.as_string() + k.to_string() + to_string( item ) ); },
            ""
        )
    };
    EXPECT_EQ( joined, value( "a1b2" ) );

    // an empty collection yields the initial value
    EXPECT_EQ( collection{}.reduce( []( value const & carry, value const & ) { return carry; }, "init" ), value( "init" ) );
}

TEST( collection_query, pipe )
{
    collection const c{ 1, 2, 3 };
    EXPECT_EQ( c.pipe( []( collection const & self ) { return self.sum(); } ), value( 6 ) );
    EXPECT_EQ( c.pipe( []( collection const & self ) { return self.count(); } ), 3 );
}

TEST( collection_query, each_visits_in_order )
{
    collection const c{ { "a", 1 }, { "b", 2 }, { "c", 3 } };
    std::vector<std::string> visited;
    c.each( [ & ]( value const & v, key const & k ) { visited.push_back( k.to_string() + to_string( v ) ); } );
    EXPECT_EQ( visited, ( std::vector<std::string>{ "a1", "b2", "c3" } ) );
}

TEST( collection_query, each_stops_on_false )
{
    collection const c{ 1, 2, 3, 4 };
    std::vector<std::int64_t> visited;
    c.each
    (
        [ & ]( value const & v )
        {
            visited.push_back( v.as_integer() );
            return v.as_integer() < 2;
        }
    );
    EXPECT_EQ( visited, ( std::vector<std::int64_t>{ 1, 2 } ) );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
