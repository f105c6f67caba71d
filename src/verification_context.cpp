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
#include <psi/mock/verification_context.hpp>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

bool verification_context::is_matched_by_invocation( registered_setup const & setup ) const
{
    if ( released() )
        return false;

    invocation_ptr p_match;
    {
        // the index is shared with (and still being appended to by) the log
        std::scoped_lock const lock{ *p_mutex_ };
        p_match = index_->find( { setup.id(), version_ } );
    }
    if ( !p_match )
        return false;

    p_match->mark_as_verified();
    return true;
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
