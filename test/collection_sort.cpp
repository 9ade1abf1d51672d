////////////////////////////////////////////////////////////////////////////////
/// fluent::collection sorting unit tests
////////////////////////////////////////////////////////////////////////////////

#include <fluent/collection.hpp>

#include <gtest/gtest.h>

#include <string>
//------------------------------------------------------------------------------
namespace fluent {
//------------------------------------------------------------------------------

namespace
{
    [[ nodiscard ]] value array_of( collection const & c ) { return value( c.to_array() ); }

    [[ nodiscard ]] collection fruits()
    {
        return collection{ { "d", "lemon" }, { "a", "orange" }, { "b", "banana" }, { "c", "apple" } };
    }

    [[ nodiscard ]] collection staff()
    {
        return collection
        {
            dict( { { "name", "Ann"  }, { "team", "b" }, { "age", 31 } } ),
            dict( { { "name", "Bob"  }, { "team", "a" }, { "age", 25 } } ),
            dict( { { "name", "Cid"  }, { "team", "b" }, { "age", 25 } } ),
            dict( { { "name", "Dee"  }, { "team", "a" }, { "age", 40 } } )
        };
    }
} // anonymous namespace

//==============================================================================
// Value sorts
//==============================================================================

TEST( collection_sort, sort_keeps_keys )
{
    collection const c{ 5, 3, 1, 2, 4 };
    auto const sorted{ c.sort() };
    EXPECT_EQ( array_of( sorted ), dict( { { 2, 1 }, { 3, 2 }, { 1, 3 }, { 4, 4 }, { 0, 5 } } ) );
    EXPECT_EQ( array_of( sorted.values() ), list( 1, 2, 3, 4, 5 ) );
}

TEST( collection_sort, asort_and_arsort )
{
    EXPECT_EQ
    (
        array_of( fruits().asort() ),
        dict( { { "c", "apple" }, { "b", "banana" }, { "d", "lemon" }, { "a", "orange" } } )
    );
    EXPECT_EQ
    (
        array_of( fruits().arsort() ),
        dict( { { "a", "orange" }, { "d", "lemon" }, { "b", "banana" }, { "c", "apple" } } )
    );
}

TEST( collection_sort, sort_modes )
{
    collection const c{ "10", "9", "2" };
    EXPECT_EQ( array_of( c.asort().values() ), list( "2", "9", "10" ) );
    EXPECT_EQ( array_of( c.asort( { .mode = sort_mode::numeric } ).values() ), list( "2", "9", "10" ) );
    EXPECT_EQ( array_of( c.asort( { .mode = sort_mode::string  } ).values() ), list( "10", "2", "9" ) );

    collection const mixed_case{ "b", "A", "a", "B" };
    EXPECT_EQ( array_of( mixed_case.asort( { .mode = sort_mode::string } ).values() ), list( "A", "B", "a", "b" ) );
    EXPECT_EQ( array_of( mixed_case.asort( { .mode = sort_mode::string, .ignore_case = true } ).values() ), list( "A", "a", "b", "B" ) );
}

TEST( collection_sort, natsort )
{
    collection const c{ "img12.png", "img10.png", "img2.png", "img1.png" };
    EXPECT_EQ
    (
        array_of( c.natsort() ),
        dict( { { 3, "img1.png" }, { 2, "img2.png" }, { 1, "img10.png" }, { 0, "img12.png" } } )
    );
}

TEST( collection_sort, natcasesort )
{
    collection const c{ "IMG0.png", "img12.png", "img10.png", "img2.png", "img1.png", "IMG3.png" };
    EXPECT_EQ
    (
        array_of( c.natcasesort().keys() ),
        list( 0, 4, 3, 5, 2, 1 )
    );
    // case sensitive: upper case sorts first
    EXPECT_EQ( array_of( c.natsort().values() ), list( "IMG0.png", "IMG3.png", "img1.png", "img2.png", "img10.png", "img12.png" ) );
}

//==============================================================================
// User comparators
//==============================================================================

TEST( collection_sort, uasort_and_usort )
{
    collection const c{ { "x", 1 }, { "y", 3 }, { "z", 2 } };
    auto const descending{ []( value const & l, value const & r ) { return static_cast<int>( r.as_integer() - l.as_integer() ); } };

    EXPECT_EQ( array_of( c.uasort( descending ) ), dict( { { "y", 3 }, { "z", 2 }, { "x", 1 } } ) );
    EXPECT_EQ( array_of( c.sort  ( descending ) ), array_of( c.uasort( descending ) ) );
    // usort renumbers
    EXPECT_EQ( array_of( c.usort ( descending ) ), list( 3, 2, 1 ) );
}

TEST( collection_sort, uksort )
{
    collection const c{ { "b", 1 }, { "c", 2 }, { "a", 3 } };
    auto const by_key{ []( key const & l, key const & r ) { return l.to_string().compare( r.to_string() ); } };
    EXPECT_EQ( array_of( c.uksort( by_key ) ), dict( { { "a", 3 }, { "b", 1 }, { "c", 2 } } ) );
}

//==============================================================================
// Derived key sorts
//==============================================================================

TEST( collection_sort, sort_by_path )
{
    auto const by_age{ staff().sort_by( "age" ) };
    EXPECT_EQ( array_of( by_age.pluck( "name" ) ), list( "Bob", "Cid", "Ann", "Dee" ) );
    EXPECT_EQ( array_of( by_age.keys() ), list( 1, 2, 0, 3 ) );

    auto const oldest_first{ staff().sort_by_desc( "age" ) };
    EXPECT_EQ( array_of( oldest_first.pluck( "name" ) ), list( "Dee", "Ann", "Bob", "Cid" ) );
}

TEST( collection_sort, sort_by_callable )
{
    collection const c{ "ccc", "a", "bb" };
    auto const sorted{ c.sort_by( []( value const & v ) { return value( v.as_string().size() ); } ) };
    EXPECT_EQ( array_of( sorted.values() ), list( "a", "bb", "ccc" ) );
}

TEST( collection_sort, ties_keep_their_order )
{
    EXPECT_EQ( array_of( staff().sort_by     ( "team" ).pluck( "name" ) ), list( "Bob", "Dee", "Ann", "Cid" ) );
    EXPECT_EQ( array_of( staff().sort_by_desc( "team" ).pluck( "name" ) ), list( "Ann", "Cid", "Bob", "Dee" ) );

    collection const equal{ { "first", 1 }, { "second", "1" }, { "third", 1.0 } };
    EXPECT_EQ( array_of( equal.sort  ().keys() ), list( "first", "second", "third" ) );
    EXPECT_EQ( array_of( equal.arsort().keys() ), list( "first", "second", "third" ) );
}

TEST( collection_sort, sort_by_tuple_element_is_stable )
{
    collection const c
    {
        { "a", list( "red"   , 3 ) },
        { "b", list( "green" , 2 ) },
        { "c", list( "blue"  , 2 ) },
        { "d", list( "yellow", 1 ) }
    };
    EXPECT_EQ( array_of( c.sort_by( "1" ).keys() ), list( "d", "b", "c", "a" ) );
    EXPECT_EQ( array_of( c.sort_by( []( value const & v ) { return v.as_map().value_at( 1 ); } ).keys() ), list( "d", "b", "c", "a" ) );
}

TEST( collection_sort, sorting_is_idempotent )
{
    auto const once{ staff().sort_by( "age" ) };
    EXPECT_TRUE( once.sort_by( "age" ) == once );
    EXPECT_TRUE( fruits().asort().asort() == fruits().asort() );
    EXPECT_TRUE( fruits().values().values() == fruits().values() );
    EXPECT_TRUE( fruits().sort().sort() == fruits().sort() );
}

TEST( collection_sort, reverse_of_sorted )
{
    collection const c{ 3, 1, 2 };
    EXPECT_EQ( array_of( c.sort().reverse() ), dict( { { 0, 3 }, { 2, 2 }, { 1, 1 } } ) );
    EXPECT_TRUE( collection{}.sort().is_empty() );
}

//------------------------------------------------------------------------------
} // namespace fluent
//------------------------------------------------------------------------------
