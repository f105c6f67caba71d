////////////////////////////////////////////////////////////////////////////////
/// Point-in-time view over an invocation_log's matched-invocation index.
///
/// Captures the index handle and the version counter at creation (atomically
/// w.r.t. recording) so that matches recorded afterwards are invisible to it.
/// Short lived: create per verification pass, release() (or destroy) after
/// use. A context must not outlive the invocation_log it was obtained from.
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

#include <psi/mock/matched_invocation_index.hpp>
#include <psi/mock/registered_setup.hpp>

#include <boost/assert.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

class verification_context
{
public:
    verification_context( std::shared_ptr<matched_invocation_index const> index, version_t const version, std::mutex & index_mutex ) noexcept
        : index_{ std::move( index ) }, p_mutex_{ &index_mutex }, version_{ version } {}

    verification_context( verification_context && ) noexcept = default;
    verification_context & operator=( verification_context && ) noexcept = default;

    verification_context( verification_context const & ) = delete;
    verification_context & operator=( verification_context const & ) = delete;

    // Returns true if dont_verify( setup ) holds or if a match for setup was
    // recorded no later than the captured version - in the latter case the
    // (most recent such) matching invocation gets marked as verified.
    template <typename SkipPredicate>
    [[ nodiscard ]] bool is_matched_by_invocation( registered_setup const & setup, SkipPredicate && dont_verify ) const
    {
        if ( std::invoke( std::forward<SkipPredicate>( dont_verify ), setup ) )
            return true;
        return is_matched_by_invocation( setup );
    }

    [[ nodiscard ]] bool is_matched_by_invocation( registered_setup const & ) const;

    [[ nodiscard ]] version_t version () const noexcept { return version_; }
    [[ nodiscard ]] bool      released() const noexcept { return !index_;  }

    void release() noexcept { index_.reset(); }

private:
    std::shared_ptr<matched_invocation_index const> index_;
    std::mutex *                                    p_mutex_;
    version_t                                       version_;
}; // class verification_context

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
