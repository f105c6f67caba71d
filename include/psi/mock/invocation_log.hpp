////////////////////////////////////////////////////////////////////////////////
/// Thread-safe, append-only log of observed invocations.
///
/// Backed by a geometrically growing array which is, like the matched
/// invocation index, never mutated in place once handed out: growth and
/// clear() replace the backing handle so that in-flight snapshots (and
/// verification_contexts) keep observing the state they captured.
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
#include <psi/mock/matched_invocation_index.hpp>
#include <psi/mock/registered_setup.hpp>
#include <psi/mock/verification_context.hpp>

#include <boost/assert.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range();
} // namespace detail

struct geometric_growth
{
    std::uint8_t num{ 2 };
    std::uint8_t den{ 1 };
}; // struct geometric_growth

struct invocation_log_options
{
    std::uint32_t    initial_capacity{ 4 };
    geometric_growth growth          { .num = 2, .den = 1 }; // doubling: 0 -> 4 -> 8 -> 16...
}; // struct invocation_log_options


class invocation_log
{
public:
    using value_type = invocation_ptr;
    using size_type  = std::size_t;

    // Frozen (buffer, count) pair: iterating it requires no locking and is
    // unaffected by concurrent add()s or clear()s on the originating log.
    class snapshot
    {
    public:
        using value_type     = invocation_ptr;
        using const_iterator = invocation_ptr const *;
        using iterator       = const_iterator;

        snapshot() = default;
        snapshot( std::shared_ptr<invocation_ptr const[]> buffer, size_type const size ) noexcept : buffer_{ std::move( buffer ) }, size_{ size } {}

        [[ nodiscard ]] const_iterator begin() const noexcept { return buffer_.get();         }
        [[ nodiscard ]] const_iterator end  () const noexcept { return buffer_.get() + size_; }

        [[ nodiscard ]] size_type size () const noexcept { return size_;      }
        [[ nodiscard ]] bool      empty() const noexcept { return size_ == 0; }

        [[ nodiscard ]] invocation_ptr const & operator[]( size_type const index ) const noexcept { BOOST_ASSERT( index < size_ ); return buffer_[ index ]; }

    private:
        std::shared_ptr<invocation_ptr const[]> buffer_;
        size_type                               size_{ 0 };
    }; // class snapshot

    explicit invocation_log( invocation_log_options const options = {} );

    invocation_log( invocation_log const & ) = delete;
    invocation_log & operator=( invocation_log const & ) = delete;

    void add( invocation_ptr );

    // Stamps (setup, invocation) with a fresh version and stores it in the
    // matched-invocation index.
    void record_matched_invocation( setup_id, invocation_ptr );

    void clear();

    [[ nodiscard ]] size_type size    () const;
    [[ nodiscard ]] bool      empty   () const { return size() == 0; }
    [[ nodiscard ]] size_type capacity() const;
    [[ nodiscard ]] version_t version () const;

    // bounds checked (throws std::out_of_range)
    [[ nodiscard ]] invocation_ptr operator[]( std::ptrdiff_t index ) const;
    [[ nodiscard ]] invocation_ptr at        ( std::ptrdiff_t const index ) const { return (*this)[ index ]; }

    [[ nodiscard ]] snapshot enumerate() const;

    // contents and counters captured together (for diagnostic dumps)
    struct state_view
    {
        snapshot  invocations;
        size_type capacity;
        version_t version;
    }; // struct state_view
    [[ nodiscard ]] state_view view() const;

    [[ nodiscard ]] std::vector<invocation_ptr> to_array() const;

    // predicate is evaluated over a snapshot, with the log unlocked
    template <typename Predicate>
    [[ nodiscard ]] std::vector<invocation_ptr> to_array( Predicate && predicate ) const
    {
        auto const invocations{ enumerate() };
        std::vector<invocation_ptr> result;
        result.reserve( invocations.size() );
        for ( auto const & p_invocation : invocations )
        {
            if ( std::invoke( predicate, static_cast<invocation const &>( *p_invocation ) ) )
                result.push_back( p_invocation );
        }
        return result;
    }

    [[ nodiscard ]] verification_context as_invocation_context() const;

private:
    void ensure_capacity();

private:
    mutable std::mutex mutex_;

    std::shared_ptr<invocation_ptr[]>         invocations_;
    std::shared_ptr<matched_invocation_index> matched_invocations_;

    size_type capacity_{ 0 };
    size_type count_   { 0 };
    version_t version_ { 0 };

    invocation_log_options options_;
}; // class invocation_log

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
