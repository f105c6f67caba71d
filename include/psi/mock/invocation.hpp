////////////////////////////////////////////////////////////////////////////////
/// Record of one observed (intercepted) call.
///
/// Created by the interception layer and handed over (shared) to an
/// invocation_log which only ever reads it. The single mutable bit is the
/// 'verified' marker flipped by verification.
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

#include <psi/mock/method.hpp>

#include <any>
#include <atomic>
#include <exception>
#include <memory>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

class invocation
{
public:
    explicit invocation( mock::method const m, std::vector<std::any> arguments = {} ) noexcept
        : method_{ m }, arguments_( std::move( arguments ) ) {} // () not {}: {} selects the initializer_list<std::any> constructor

    invocation( invocation const & ) = delete;
    invocation & operator=( invocation const & ) = delete;

    [[ nodiscard ]] mock::method          const & method   () const noexcept { return method_;    }
    [[ nodiscard ]] std::vector<std::any> const & arguments() const noexcept { return arguments_; }

    // outcome (set by the interception layer once the call completed)
    void set_return_value( std::any value      ) noexcept { return_value_ = std::move( value     ); }
    void set_exception   ( std::exception_ptr e ) noexcept { exception_    = std::move( e         ); }

    [[ nodiscard ]] std::any           const & return_value() const noexcept { return return_value_; }
    [[ nodiscard ]] std::exception_ptr const & exception   () const noexcept { return exception_;    }

    void mark_as_verified() noexcept { verified_.store( true, std::memory_order_relaxed ); }
    [[ nodiscard ]] bool verified() const noexcept { return verified_.load( std::memory_order_relaxed ); }

private:
    mock::method          method_;
    std::vector<std::any> arguments_;
    std::any              return_value_;
    std::exception_ptr    exception_;
    std::atomic<bool>     verified_{ false };
}; // class invocation

using invocation_ptr = std::shared_ptr<invocation>;

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
