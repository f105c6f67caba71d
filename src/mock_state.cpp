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
#include <psi/mock/mock_state.hpp>

#include <boost/assert.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

setup_match mock_state::dispatch( invocation_ptr p_invocation )
{
    BOOST_ASSERT( p_invocation );
    auto match{ setups_.find_match_for( *p_invocation ) };
    invocations_.add( p_invocation );
    if ( match )
        invocations_.record_matched_invocation( match->id(), std::move( p_invocation ) );
    return match;
}

void mock_state::reset()
{
    setups_     .clear();
    invocations_.clear();
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
