////////////////////////////////////////////////////////////////////////////////
/// psi::mock::matched_invocation_index unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/mock/matched_invocation_index.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

using namespace test;

TEST( versioned_key, recorded_at_or_before_is_directional )
{
    constexpr versioned_key stored{ .id = 3, .version = 5 };

    static_assert(  recorded_at_or_before( stored, { 3, 5 } ) );
    static_assert(  recorded_at_or_before( stored, { 3, 9 } ) );
    static_assert( !recorded_at_or_before( stored, { 3, 4 } ) );
    static_assert( !recorded_at_or_before( stored, { 2, 9 } ) );
    // not symmetric
    static_assert( !recorded_at_or_before( { 3, 9 }, stored ) );
}

TEST( matched_invocation_index, empty )
{
    matched_invocation_index const index;
    EXPECT_TRUE( index.empty() );
    EXPECT_EQ  ( index.size(), 0 );
    EXPECT_EQ  ( index.find( { 0, 100 } ), nullptr );
}

TEST( matched_invocation_index, finds_latest_match_at_or_before_the_query_version )
{
    matched_invocation_index index;
    auto const first { make_call( calculator_add, { 1 } ) };
    auto const second{ make_call( calculator_add, { 2 } ) };
    auto const other { make_call( worker_run ) };
    index.record( { 0, 2 }, first  );
    index.record( { 1, 3 }, other  );
    index.record( { 0, 5 }, second );
    EXPECT_EQ( index.size(), 3 );

    EXPECT_EQ( index.find( { 0, 1 } ), nullptr );
    EXPECT_EQ( index.find( { 0, 2 } ), first   );
    EXPECT_EQ( index.find( { 0, 4 } ), first   );
    EXPECT_EQ( index.find( { 0, 5 } ), second  );
    EXPECT_EQ( index.find( { 0, 9 } ), second  );

    EXPECT_EQ( index.find( { 1, 2 } ), nullptr );
    EXPECT_EQ( index.find( { 1, 3 } ), other   );
    EXPECT_EQ( index.find( { 2, 9 } ), nullptr );
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
