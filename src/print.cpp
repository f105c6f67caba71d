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
#include <psi/mock/print.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iterator>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

std::string format( setup_registry const & registry )
{
    auto const setups{ registry.to_array() };
    if ( setups.empty() )
        return "The setup registry is empty.\n";

    fmt::memory_buffer out;
    auto const inserter{ std::back_inserter( out ) };
    // newest (most relevant) first, matching the dispatch order
    for ( auto p_registered{ setups.rbegin() }; p_registered != setups.rend(); ++p_registered )
    {
        auto const & setup{ p_registered->setup() };
        fmt::format_to( inserter, "#{}\t{}", p_registered->id(), setup.method() );
        if ( auto const & matchers{ setup.expectation().argument_matchers() }; !matchers.empty() )
            fmt::format_to( inserter, " <{}>", fmt::join( matchers, ", " ) );
        if ( setup.condition() )
            fmt::format_to( inserter, " [guarded]" );
        if ( p_registered->can_verify() )
            fmt::format_to( inserter, " [inner mock]" );
        if ( registry.is_overridden( p_registered->id() ) )
            fmt::format_to( inserter, " [overridden]" );
        out.push_back( '\n' );
    }
    fmt::format_to( inserter, "[{} setups]\n", setups.size() );
    return fmt::to_string( out );
}

std::string format( invocation_log const & log )
{
    auto const [ invocations, capacity, version ]{ log.view() };
    if ( invocations.empty() )
        return "The invocation log is empty.\n";

    fmt::memory_buffer out;
    auto const inserter{ std::back_inserter( out ) };
    auto index{ 0U };
    for ( auto const & p_invocation : invocations )
    {
        fmt::format_to
        (
            inserter, "#{}\t{}{}\n",
            index++, p_invocation->method(), p_invocation->verified() ? " [verified]" : ""
        );
    }
    fmt::format_to( inserter, "[{} invocations, capacity {}, version {}]\n", invocations.size(), capacity, version );
    return fmt::to_string( out );
}

void print( setup_registry const & registry ) { fmt::print( "{}", format( registry ) ); }
void print( invocation_log const & log      ) { fmt::print( "{}", format( log      ) ); }

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
