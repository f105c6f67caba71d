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

#include <psi/mock/setup.hpp>

#include <cstdint>
#include <optional>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

using setup_id = std::uint32_t;

// A setup together with the (dense, zero based, never reused) identifier it
// was assigned by the setup_registry it was added to.
class registered_setup
{
public:
    // setup must be non null (asserted by setup_registry::add())
    registered_setup( setup_id const id, mock::setup_ptr setup ) noexcept
        : setup_{ std::move( setup ) }, id_{ id }, can_verify_{ owns_inner_mock( setup_->kind() ) } {}

    [[ nodiscard ]] setup_id            id        () const noexcept { return id_;         }
    [[ nodiscard ]] mock::setup const & setup     () const noexcept { return *setup_;     }
    [[ nodiscard ]] mock::setup_ptr const & shared_setup() const noexcept { return setup_; }
    [[ nodiscard ]] bool                can_verify() const noexcept { return can_verify_; }

    friend bool operator==( registered_setup const & left, registered_setup const & right ) noexcept { return left.id_ == right.id_ && left.setup_ == right.setup_; }

private:
    mock::setup_ptr setup_;
    setup_id        id_;
    bool            can_verify_;
}; // class registered_setup


// Result of a dispatch lookup: empty <=> no setup governs the call.
using setup_match = std::optional<registered_setup>;

inline constexpr std::nullopt_t not_registered{ std::nullopt };

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
