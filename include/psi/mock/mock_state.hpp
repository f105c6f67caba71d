////////////////////////////////////////////////////////////////////////////////
/// Per-mock dispatch & verification state: one setup_registry plus one
/// invocation_log wired together.
///
/// dispatch(): call -> governing setup lookup -> log append -> versioned match
///             record
/// unsatisfied_setups(): point-in-time "which setups were never matched"
///                       query (the input of failure reporting)
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
#pragma once

#include <psi/mock/invocation.hpp>
#include <psi/mock/invocation_log.hpp>
#include <psi/mock/registered_setup.hpp>
#include <psi/mock/setup.hpp>
#include <psi/mock/setup_registry.hpp>

#include <functional>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

inline constexpr auto skip_none   { []( registered_setup const & ) noexcept { return false; } };
inline constexpr auto select_every{ []( setup            const & ) noexcept { return true;  } };

class mock_state
{
public:
    explicit mock_state( invocation_log_options const log_options = {} ) : invocations_{ log_options } {}

    [[ nodiscard ]] setup_registry       & setups     ()       noexcept { return setups_;      }
    [[ nodiscard ]] setup_registry const & setups     () const noexcept { return setups_;      }
    [[ nodiscard ]] invocation_log       & invocations()       noexcept { return invocations_; }
    [[ nodiscard ]] invocation_log const & invocations() const noexcept { return invocations_; }

    registered_setup add_setup( setup_ptr p_setup ) { return setups_.add( std::move( p_setup ) ); }

    // Returns the setup which governs the call (not_registered if none does,
    // in which case the call is only logged).
    setup_match dispatch( invocation_ptr );

    // Newest-first list of the live setups chosen by select that no call
    // recorded so far has matched (unless dont_verify excuses them). Matching
    // invocations get marked as verified.
    template <typename Selector, typename SkipPredicate>
    [[ nodiscard ]] std::vector<registered_setup> unsatisfied_setups( Selector && select, SkipPredicate && dont_verify ) const
    {
        auto context   { invocations_.as_invocation_context() };
        auto candidates{ setups_.to_array_live( std::forward<Selector>( select ) ) };
        std::erase_if
        (
            candidates,
            [ & ]( registered_setup const & candidate ) { return context.is_matched_by_invocation( candidate, dont_verify ); }
        );
        context.release();
        return candidates;
    }

    // All live setups except those owning a nested mock (which get verified
    // through a traversal of the nested mock instead).
    [[ nodiscard ]] std::vector<registered_setup> unsatisfied_setups() const
    {
        return unsatisfied_setups( select_every, []( registered_setup const & candidate ) noexcept { return candidate.can_verify(); } );
    }

    // Logged calls which no verification has accounted for (yet).
    [[ nodiscard ]] std::vector<invocation_ptr> unverified_invocations() const
    {
        return invocations_.to_array( []( invocation const & call ) noexcept { return !call.verified(); } );
    }

    void reset();

private:
    setup_registry setups_;
    invocation_log invocations_;
}; // class mock_state

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
