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
#include <psi/mock/invocation_log.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range() { throw std::out_of_range( "mock::invocation_log access out of bounds" ); }
} // namespace detail

invocation_log::invocation_log( invocation_log_options const options )
    :
    matched_invocations_{ std::make_shared<matched_invocation_index>() },
    options_            { options }
{
    // a zero initial capacity would leave the first add() without storage
    options_.initial_capacity = std::max<std::uint32_t>( options_.initial_capacity, 1 );
    BOOST_ASSERT_MSG( options_.growth.num > options_.growth.den, "Growth factor must be larger than one" );
}

void invocation_log::add( invocation_ptr p_invocation )
{
    BOOST_ASSERT( p_invocation );
    std::scoped_lock const lock{ mutex_ };
    ensure_capacity();
    invocations_[ count_ ] = std::move( p_invocation );
    ++count_;
}

void invocation_log::record_matched_invocation( setup_id const id, invocation_ptr p_invocation )
{
    std::scoped_lock const lock{ mutex_ };
    matched_invocations_->record( { id, ++version_ }, std::move( p_invocation ) );
}

void invocation_log::clear()
{
    // Replace (rather than truncate) the storage so that readers holding the
    // old handles are not disturbed. The version counter is not reset.
    auto fresh_index{ std::make_shared<matched_invocation_index>() };
    decltype( invocations_ ) old_invocations;
    decltype( matched_invocations_ ) old_index;
    {
        std::scoped_lock const lock{ mutex_ };
        old_invocations = std::exchange( invocations_, nullptr );
        old_index       = std::exchange( matched_invocations_, std::move( fresh_index ) );
        count_    = 0;
        capacity_ = 0;
    }
    // the last references (if any) get dropped outside the lock
}

invocation_log::size_type invocation_log::size() const
{
    std::scoped_lock const lock{ mutex_ };
    return count_;
}

invocation_log::size_type invocation_log::capacity() const
{
    std::scoped_lock const lock{ mutex_ };
    return capacity_;
}

version_t invocation_log::version() const
{
    std::scoped_lock const lock{ mutex_ };
    return version_;
}

invocation_ptr invocation_log::operator[]( std::ptrdiff_t const index ) const
{
    std::scoped_lock const lock{ mutex_ };
    if ( ( index < 0 ) || ( static_cast<size_type>( index ) >= count_ ) ) [[ unlikely ]]
        detail::throw_out_of_range();
    return invocations_[ static_cast<size_type>( index ) ];
}

invocation_log::snapshot invocation_log::enumerate() const
{
    std::scoped_lock const lock{ mutex_ };
    return { invocations_, count_ };
}

invocation_log::state_view invocation_log::view() const
{
    std::scoped_lock const lock{ mutex_ };
    return { { invocations_, count_ }, capacity_, version_ };
}

std::vector<invocation_ptr> invocation_log::to_array() const
{
    std::scoped_lock const lock{ mutex_ };
    if ( count_ == 0 )
        return {};
    return std::vector<invocation_ptr>( invocations_.get(), invocations_.get() + count_ );
}

verification_context invocation_log::as_invocation_context() const
{
    std::scoped_lock const lock{ mutex_ };
    return { matched_invocations_, version_, mutex_ };
}

void invocation_log::ensure_capacity()
{
    BOOST_ASSERT( count_ <= capacity_ );
    if ( count_ != capacity_ ) [[ likely ]]
        return;

    auto const target_capacity
    {
        capacity_ == 0
            ? size_type{ options_.initial_capacity }
            : std::max( capacity_ + 1, capacity_ * options_.growth.num / options_.growth.den )
    };
    BOOST_ASSERT( target_capacity > capacity_ );
    // A new buffer (instead of an in place realloc) as older ones may still
    // be referenced by snapshots.
    auto grown{ std::make_shared<invocation_ptr[]>( target_capacity ) };
    std::copy_n( invocations_.get(), count_, grown.get() );
    invocations_ = std::move( grown );
    capacity_    = target_capacity;
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
