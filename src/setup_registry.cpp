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
#include <psi/mock/setup_registry.hpp>

#include <boost/assert.hpp>
#include <boost/unordered_set.hpp>

#include <cstddef>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

namespace
{
    struct expectation_ptr_hash
    {
        std::size_t operator()( expectation const * const p_expectation ) const noexcept { return hash_value( *p_expectation ); }
    };
    struct expectation_ptr_equal
    {
        bool operator()( expectation const * const left, expectation const * const right ) const noexcept { return *left == *right; }
    };
} // anonymous namespace

registered_setup setup_registry::add( setup_ptr p_setup )
{
    BOOST_ASSERT( p_setup );
    std::scoped_lock const lock{ mutex_ };
    auto const id{ static_cast<setup_id>( first_id_ + setups_.size() ) };
    auto const & registered{ setups_.emplace_back( id, std::move( p_setup ) ) };
    overridden_.push_back( false );
    BOOST_ASSERT( overridden_.size() == setups_.size() );
    size_.store( static_cast<size_type>( setups_.size() ), std::memory_order_relaxed );
    return registered;
}

setup_match setup_registry::find_match_for( invocation const & call ) const
{
    // unsynchronized: a stale 'empty' can only yield a miss, never a false match
    if ( empty() )
        return not_registered;

    setup_match match;

    for ( auto const & candidate : live_setups() )
    {
        auto const & setup{ candidate.setup() };

        // matches() is the expensive part: after a first (inexact) hit only
        // older setups declared for the call's exact method are tried.
        if ( !match )
        {
            if ( setup.matches( call ) )
            {
                match = candidate;
                if ( setup.method() == call.method() )
                    break;
            }
        }
        else
        if ( ( setup.method() == call.method() ) && setup.matches( call ) )
        {
            match = candidate;
            break;
        }
    }

    return match;
}

std::vector<registered_setup> setup_registry::to_array() const
{
    std::scoped_lock const lock{ mutex_ };
    return setups_;
}

std::vector<registered_setup> setup_registry::live_setups() const
{
    std::vector<registered_setup> live;
    std::scoped_lock const lock{ mutex_ };
    live.reserve( setups_.size() );
    for ( auto i{ setups_.size() }; i-- > 0; )
    {
        if ( !overridden_.test( i ) )
            live.push_back( setups_[ i ] );
    }
    return live;
}

std::vector<registered_setup> setup_registry::detect_overrides() const
{
    std::vector<registered_setup> live;
    boost::unordered_set<expectation const *, expectation_ptr_hash, expectation_ptr_equal> visited;

    std::scoped_lock const lock{ mutex_ };
    for ( auto i{ setups_.size() }; i-- > 0; )
    {
        if ( overridden_.test( i ) )
            continue;

        auto const & registered{ setups_[ i ] };
        auto const & setup     { registered.setup() };
        if ( !setup.condition() )
        {
            if ( !visited.insert( &setup.expectation() ).second )
            {
                // a newer setup with the same expectation was already
                // visited: this older one is overridden
                overridden_.set( i );
                continue;
            }
        }
        live.push_back( registered );
    }
    return live;
}

std::vector<registered_setup> setup_registry::get_inner_mock_setups() const
{
    return to_array_live( []( setup const & candidate ) { return candidate.returns_inner_mock(); } );
}

void setup_registry::clear()
{
    decltype( setups_ ) old_setups;
    {
        std::scoped_lock const lock{ mutex_ };
        first_id_ += static_cast<setup_id>( setups_.size() );
        old_setups.swap( setups_ );
        overridden_.clear();
        size_.store( 0, std::memory_order_relaxed );
    }
}

bool setup_registry::is_overridden( setup_id const id ) const
{
    std::scoped_lock const lock{ mutex_ };
    return ( id >= first_id_ ) && ( id - first_id_ < overridden_.size() ) && overridden_.test( id - first_id_ );
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
