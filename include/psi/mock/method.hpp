////////////////////////////////////////////////////////////////////////////////
/// Call-site signatures and specification identities.
///
/// method      - identifies an interceptable call site (what a proxy forwards)
/// expectation - identifies a registered specification; two setups with equal
///               expectations describe the same thing, the newer one
///               shadowing (overriding) the older one
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

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

// The strings are expected to have static storage duration (the interception
// layer hands out literals/type-info names).
struct method
{
    std::string_view declaring_type;
    std::string_view name;
    std::string_view signature; // parameter list, e.g. "(int, char const *)"

    friend constexpr bool operator==( method const &, method const & ) noexcept = default;

    friend std::size_t hash_value( method const & m ) noexcept
    {
        std::size_t seed{ 0 };
        boost::hash_combine( seed, m.declaring_type );
        boost::hash_combine( seed, m.name           );
        boost::hash_combine( seed, m.signature      );
        return seed;
    }
}; // struct method


class expectation
{
public:
    expectation() = default;
    explicit expectation( mock::method const m, std::vector<std::string> argument_matchers = {} )
        : method_{ m }, argument_matchers_{ std::move( argument_matchers ) } {}

    [[ nodiscard ]] mock::method             const & method           () const noexcept { return method_;            }
    [[ nodiscard ]] std::vector<std::string> const & argument_matchers() const noexcept { return argument_matchers_; }

    friend bool operator==( expectation const &, expectation const & ) = default;

    friend std::size_t hash_value( expectation const & e ) noexcept
    {
        auto seed{ hash_value( e.method_ ) };
        boost::hash_range( seed, e.argument_matchers_.begin(), e.argument_matchers_.end() );
        return seed;
    }

private:
    mock::method             method_;
    std::vector<std::string> argument_matchers_; // rendered matchers, e.g. "It.IsAny<int>()" or "42"
}; // class expectation

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
