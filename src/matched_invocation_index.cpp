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
#include <psi/mock/matched_invocation_index.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <iterator>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

void matched_invocation_index::record( versioned_key const key, invocation_ptr matched )
{
    BOOST_ASSERT( matched );
    auto & records{ records_[ key.id ] };
    BOOST_ASSERT_MSG( records.empty() || records.back().version < key.version, "Versions must be recorded in increasing order" );
    records.push_back( { key.version, std::move( matched ) } );
    ++size_;
}

invocation_ptr matched_invocation_index::find( versioned_key const query ) const noexcept
{
    auto const p_bucket{ records_.find( query.id ) };
    if ( p_bucket == records_.end() )
        return {};
    auto const & records{ p_bucket->second };
    auto const p_after
    {
        std::upper_bound
        (
            records.begin(), records.end(), query.version,
            []( version_t const version, record_t const & record ) noexcept { return version < record.version; }
        )
    };
    if ( p_after == records.begin() )
        return {};
    auto const & match{ *std::prev( p_after ) };
    BOOST_ASSERT( recorded_at_or_before( { query.id, match.version }, query ) );
    return match.invocation;
}

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
