////////////////////////////////////////////////////////////////////////////////
/// psi::mock::verification_context unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/mock/invocation_log.hpp>
#include <psi/mock/setup_registry.hpp>
#include <psi/mock/verification_context.hpp>

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

using namespace test;

namespace
{
    auto const never_skip { []( registered_setup const & ) { return false; } };
    auto const always_skip{ []( registered_setup const & ) { return true;  } };

    struct verification_fixture : ::testing::Test
    {
        setup_registry   registry;
        invocation_log   log;
        registered_setup add     { registry.add( make_setup( calculator_add    ) ) };
        registered_setup negate  { registry.add( make_setup( calculator_negate ) ) };

        invocation_ptr call_and_record( registered_setup const & setup, method const m )
        {
            auto call{ make_call( m ) };
            log.add( call );
            log.record_matched_invocation( setup.id(), call );
            return call;
        }
    }; // struct verification_fixture
} // anonymous namespace

TEST_F( verification_fixture, unmatched_setup_is_not_satisfied )
{
    auto const context{ log.as_invocation_context() };
    EXPECT_FALSE( context.is_matched_by_invocation( add, never_skip ) );
    EXPECT_FALSE( context.is_matched_by_invocation( add ) );
}

TEST_F( verification_fixture, match_recorded_before_the_context_satisfies )
{
    auto const call{ call_and_record( add, calculator_add ) };
    auto const context{ log.as_invocation_context() };
    EXPECT_EQ( context.version(), 1 );

    // recorded after the context was opened
    call_and_record( negate, calculator_negate );

    EXPECT_FALSE( call->verified() );
    EXPECT_TRUE ( context.is_matched_by_invocation( add, never_skip ) );
    EXPECT_TRUE ( call->verified() );
    EXPECT_FALSE( context.is_matched_by_invocation( negate, never_skip ) );
}

TEST_F( verification_fixture, context_opened_before_the_match_is_not_satisfied )
{
    auto const early{ log.as_invocation_context() };
    auto const call{ call_and_record( add, calculator_add ) };
    auto const late{ log.as_invocation_context() };

    EXPECT_FALSE( early.is_matched_by_invocation( add, never_skip ) );
    EXPECT_FALSE( call->verified() );
    EXPECT_TRUE ( late .is_matched_by_invocation( add, never_skip ) );
    EXPECT_TRUE ( call->verified() );
}

TEST_F( verification_fixture, marking_as_verified_is_idempotent )
{
    auto const call{ call_and_record( add, calculator_add ) };
    auto const context{ log.as_invocation_context() };
    EXPECT_TRUE( context.is_matched_by_invocation( add ) );
    EXPECT_TRUE( context.is_matched_by_invocation( add ) );
    EXPECT_TRUE( call->verified() );
}

TEST_F( verification_fixture, latest_match_within_the_context_gets_verified )
{
    auto const first { call_and_record( add, calculator_add ) };
    auto const second{ call_and_record( add, calculator_add ) };
    auto const context{ log.as_invocation_context() };
    auto const third { call_and_record( add, calculator_add ) };

    EXPECT_TRUE ( context.is_matched_by_invocation( add ) );
    EXPECT_FALSE( first ->verified() );
    EXPECT_TRUE ( second->verified() );
    EXPECT_FALSE( third ->verified() );
}

TEST_F( verification_fixture, skip_predicate_short_circuits )
{
    auto const context{ log.as_invocation_context() };
    EXPECT_TRUE( context.is_matched_by_invocation( add, always_skip ) );

    auto const skip_can_verify{ []( registered_setup const & setup ) { return setup.can_verify(); } };
    EXPECT_FALSE( context.is_matched_by_invocation( add, skip_can_verify ) );
}

TEST_F( verification_fixture, skipped_setups_are_not_marked )
{
    auto const call{ call_and_record( add, calculator_add ) };
    auto const context{ log.as_invocation_context() };
    EXPECT_TRUE ( context.is_matched_by_invocation( add, always_skip ) );
    EXPECT_FALSE( call->verified() );
}

TEST_F( verification_fixture, released_context_matches_nothing )
{
    call_and_record( add, calculator_add );
    auto context{ log.as_invocation_context() };
    EXPECT_FALSE( context.released() );
    context.release();
    EXPECT_TRUE ( context.released() );
    EXPECT_FALSE( context.is_matched_by_invocation( add, never_skip ) );
    EXPECT_TRUE ( context.is_matched_by_invocation( add, always_skip ) );
}

TEST_F( verification_fixture, moved_from_context_is_released )
{
    call_and_record( add, calculator_add );
    auto source{ log.as_invocation_context() };
    auto const target{ std::move( source ) };
    EXPECT_TRUE( source.released() );
    EXPECT_TRUE( target.is_matched_by_invocation( add ) );
}

TEST_F( verification_fixture, context_keeps_observing_the_index_after_clear )
{
    auto const call{ call_and_record( add, calculator_add ) };
    auto const context{ log.as_invocation_context() };
    log.clear();

    EXPECT_TRUE( context.is_matched_by_invocation( add ) );
    EXPECT_TRUE( call->verified() );

    auto const fresh{ log.as_invocation_context() };
    EXPECT_FALSE( fresh.is_matched_by_invocation( add ) );
    EXPECT_EQ   ( fresh.version(), context.version() );
}

TEST_F( verification_fixture, concurrent_recording_does_not_leak_into_the_context )
{
    call_and_record( add, calculator_add );
    auto const context{ log.as_invocation_context() };
    {
        std::jthread recorder{ [ this ]
        {
            for ( auto i{ 0 }; i < 1000; ++i )
                call_and_record( negate, calculator_negate );
        } };
        for ( auto i{ 0 }; i < 1000; ++i )
        {
            EXPECT_TRUE ( context.is_matched_by_invocation( add   , never_skip ) );
            EXPECT_FALSE( context.is_matched_by_invocation( negate, never_skip ) );
        }
    }
    EXPECT_TRUE( log.as_invocation_context().is_matched_by_invocation( negate ) );
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
