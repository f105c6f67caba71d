////////////////////////////////////////////////////////////////////////////////
/// Ordered, append-only, thread-safe collection of setups.
///
/// Newer setups are more relevant than (i.e. override) older ones: dispatch
/// and 'live' enumeration both walk the registry from newest to oldest.
/// Setups found to be overridden (shadowed by a newer, unguarded setup with an
/// equal expectation) are flagged in a bit set so that subsequent scans skip
/// them cheaply.
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
#include <psi/mock/method.hpp>
#include <psi/mock/registered_setup.hpp>
#include <psi/mock/setup.hpp>

#include <boost/dynamic_bitset.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

class setup_registry
{
public:
    using size_type = std::uint32_t;

    setup_registry() = default;
    setup_registry( setup_registry const & ) = delete;
    setup_registry & operator=( setup_registry const & ) = delete;

    registered_setup add( setup_ptr );

    // The setup governing the given call (or not_registered): the newest
    // matching setup unless an older one matches with the exact call-site
    // signature of the call (while the newer one matched only e.g. through a
    // base/interface signature).
    [[ nodiscard ]] setup_match find_match_for( invocation const & ) const;

    // Considers all registered setups, overridden ones included.
    template <typename Predicate>
    [[ nodiscard ]] bool any( Predicate && predicate ) const
    {
        auto const setups{ to_array() };
        return std::ranges::any_of( setups, [ & ]( registered_setup const & registered ) { return std::invoke( predicate, registered.setup() ); } );
    }

    // Newest-first list of the non-overridden setups satisfying predicate.
    // Guarded setups (those with a condition) neither override nor get
    // overridden. Override detection does not depend on predicate.
    template <typename Predicate>
    [[ nodiscard ]] std::vector<registered_setup> to_array_live( Predicate && predicate ) const
    {
        auto live{ detect_overrides() };
        std::erase_if( live, [ & ]( registered_setup const & registered ) { return !std::invoke( predicate, registered.setup() ); } );
        return live;
    }

    // All registered setups (overridden ones included), oldest first.
    [[ nodiscard ]] std::vector<registered_setup> to_array() const;

    // Live setups which own a nested mock.
    [[ nodiscard ]] std::vector<registered_setup> get_inner_mock_setups() const;

    // Identifiers keep counting across clear()s (they are never reused).
    void clear();

    [[ nodiscard ]] size_type size () const noexcept { return size_.load( std::memory_order_relaxed ); }
    [[ nodiscard ]] bool      empty() const noexcept { return size() == 0; }

    // Whether the setup is already known to be overridden (only detected by
    // to_array_live()).
    [[ nodiscard ]] bool is_overridden( setup_id ) const;

private:
    // Flags the setups shadowed by a newer one with an equal expectation and
    // returns the remaining ones, newest first.
    std::vector<registered_setup> detect_overrides() const;

    // Setups not (yet) known to be overridden, newest first.
    std::vector<registered_setup> live_setups() const;

private:
    // Guards the containers only: matches(), guard conditions and caller
    // predicates are evaluated on copies, with the lock released, so they may
    // call back into the owning mock.
    mutable std::mutex               mutex_;
    std::vector<registered_setup>    setups_;
    mutable boost::dynamic_bitset<>  overridden_; // one bit per entry in setups_
    setup_id                         first_id_{ 0 }; // of setups_.front(): identifiers survive clear()s
    // mirrors setups_.size() for the lock free empty check in find_match_for()
    std::atomic<size_type>           size_{ 0 };
}; // class setup_registry

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
