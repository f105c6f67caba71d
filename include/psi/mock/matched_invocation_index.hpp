////////////////////////////////////////////////////////////////////////////////
/// Versioned (setup -> matching invocations) index.
///
/// Every recorded match is stamped with a version drawn from a strictly
/// increasing counter. A probe with a query key (id, V) asks "was setup id
/// matched at or before version V?". The relation is deliberately asymmetric
/// (a stored key 'satisfies' a query key, never the reverse) so it is exposed
/// as the dedicated recorded_at_or_before() predicate instead of an equality
/// operator.
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
#include <psi/mock/registered_setup.hpp>

#include <boost/container/small_vector.hpp>
#include <boost/unordered_map.hpp>

#include <cstdint>
//------------------------------------------------------------------------------
namespace psi::mock
{
//------------------------------------------------------------------------------

using version_t = std::uint64_t;

struct versioned_key
{
    setup_id  id;
    version_t version;
}; // struct versioned_key

[[ nodiscard ]] constexpr bool recorded_at_or_before( versioned_key const stored, versioned_key const query ) noexcept
{
    return ( stored.id == query.id ) && ( stored.version <= query.version );
}


class matched_invocation_index
{
public:
    void record( versioned_key key, invocation_ptr matched );

    // Returns the most recent invocation recorded for query.id no later than
    // query.version (nullptr if there is none).
    [[ nodiscard ]] invocation_ptr find( versioned_key query ) const noexcept;

    [[ nodiscard ]] bool         empty() const noexcept { return records_.empty(); }
    [[ nodiscard ]] std::size_t  size () const noexcept { return size_; } // total number of records

private:
    struct record_t
    {
        version_t      version;
        invocation_ptr invocation;
    };
    // one bucket per setup, versions ascending (records arrive in version order)
    using bucket = boost::container::small_vector<record_t, 2>;

    boost::unordered_map<setup_id, bucket> records_;
    std::size_t                            size_{ 0 };
}; // class matched_invocation_index

//------------------------------------------------------------------------------
} // namespace psi::mock
//------------------------------------------------------------------------------
