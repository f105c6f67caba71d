////////////////////////////////////////////////////////////////////////////////
/// Human readable (debugging) dumps of setup registries and invocation logs.
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

#include <psi/mock/invocation_log.hpp>
#include <psi/mock/method.hpp>
#include <psi/mock/setup_registry.hpp>

#include <fmt/format.h>

#include <string>
//------------------------------------------------------------------------------
template <>
struct fmt::formatter<psi::mock::method> : fmt::formatter<fmt::string_view>
{
    template <typename FormatContext>
    auto format( psi::mock::method const & m, FormatContext & ctx ) const -> decltype( ctx.out() )
    {
        return fmt::format_to( ctx.out(), "{}::{}{}", m.declaring_type, m.name, m.signature );
    }
}; // fmt::formatter<psi::mock::method>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

[[ nodiscard ]] std::string format( setup_registry const & );
[[ nodiscard ]] std::string format( invocation_log const & );

// to stdout
void print( setup_registry const & );
void print( invocation_log const & );

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
