#pragma once

#include <cstdint>
#include <vector>

#include <sdbsplit/defs.hpp>
#include <sdbsplit/options.hpp>
#include <sdbsplit/split.hpp>
#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{

// Partitions a domain into an ordered sequence of splits covering
// [0, totalItems).  The store can only be navigated by continuation tokens,
// so the token at each split boundary is found by walking COUNT(*) queries
// with LIMIT splitSize from the start of the domain.
//
// Any failed store call aborts planning with a StoreError: a partial split
// list would silently skip data.
class SplitPlanner
{
public:
    SplitPlanner(StoreClient& client, const Options& options);

    std::vector<Split> plan();

    // Number of items to split: a full count of the where clause if one is
    // configured, otherwise the domain's metadata item count.
    std::uint64_t totalItems();

    // Token marking the first row of split number "page" of size "limit",
    // walking from the start of the domain.  Page zero needs no walk and has
    // no token.
    Token boundaryToken(std::uint64_t page, std::uint64_t limit);

    std::uint64_t splitSize() const { return m_splitSize; }

    // COUNT(*) queries issued while walking to split boundaries.
    std::size_t walkQueries() const { return m_walkQueries; }

private:
    struct Walk
    {
        std::uint64_t total = 0;
        Token token;
        bool started = false;
    };

    Token advance(Walk& walk, std::uint64_t target, std::uint64_t limit);

    StoreClient& m_client;
    const WhereClause m_where;
    const std::uint64_t m_splitSize;
    const BoundaryWalk m_walk;
    const RemainderPolicy m_remainder;

    std::size_t m_walkQueries;
};

} // namespace sdbsplit
