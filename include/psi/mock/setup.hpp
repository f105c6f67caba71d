////////////////////////////////////////////////////////////////////////////////
/// Behaviour specification ("setup") interface.
///
/// Setups are produced by the setup-compiling layer (outside this library):
/// this library only consumes them - it asks whether a setup matches a call,
/// compares call-site signatures and specification identities and queries
/// guard conditions and nested mocks.
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

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

// Opaque base of nested (recursive) mocks.
class mock_object
{
public:
    virtual ~mock_object() = default;
}; // class mock_object


// Extra guard attached to a setup (a la 'When( ... )'): a guarded setup only
// applies while its condition holds.
class condition
{
public:
    explicit condition( std::function<bool()> predicate ) noexcept : predicate_{ std::move( predicate ) } {}

    [[ nodiscard ]] bool is_true() const { return predicate_(); }

private:
    std::function<bool()> predicate_;
}; // class condition


enum class setup_kind : std::uint8_t
{
    plain,
    inner_mock,           // returns a (recursive) nested mock
    auto_property_getter, // auto-implemented property getter (owns a nested mock)
    auto_property_setter  // auto-implemented property setter (owns a nested mock)
}; // enum class setup_kind

[[ nodiscard ]] constexpr bool owns_inner_mock( setup_kind const kind ) noexcept { return kind != setup_kind::plain; }


class setup
{
public:
    virtual ~setup() = default;

    [[ nodiscard ]] virtual bool matches( invocation const & ) const = 0;

    [[ nodiscard ]] virtual mock::method      const & method     () const noexcept = 0;
    [[ nodiscard ]] virtual mock::expectation const & expectation() const noexcept = 0;
    // nullptr if unguarded
    [[ nodiscard ]] virtual mock::condition   const * condition  () const noexcept { return nullptr; }

    [[ nodiscard ]] virtual setup_kind kind() const noexcept { return setup_kind::plain; }

    [[ nodiscard ]] virtual std::shared_ptr<mock_object> inner_mock() const { return {}; }

    [[ nodiscard ]] bool returns_inner_mock() const { return inner_mock() != nullptr; }
    [[ nodiscard ]] bool returns_inner_mock( std::shared_ptr<mock_object> & mock ) const
    {
        mock = inner_mock();
        return mock != nullptr;
    }
}; // class setup

using setup_ptr = std::shared_ptr<setup const>;

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
