#include <sdbsplit/split-planner.hpp>

#include <algorithm>
#include <iostream>

namespace sdbsplit
{

SplitPlanner::SplitPlanner(StoreClient& client, const Options& options)
    : m_client(client)
    , m_where(options.where())
    , m_splitSize(options.splitSize())
    , m_walk(options.walk())
    , m_remainder(options.remainder())
    , m_walkQueries(0)
{ }

std::uint64_t SplitPlanner::totalItems()
{
    if (m_where) return m_client.countAll(m_where).value();
    return m_client.totalItemCount(m_client.domain()).value();
}

std::vector<Split> SplitPlanner::plan()
{
    const auto start(getNow());
    const std::uint64_t total(totalItems());

    std::uint64_t numSplits(total / m_splitSize);
    if (m_remainder == RemainderPolicy::Split && total % m_splitSize)
    {
        ++numSplits;
    }
    numSplits = std::max<std::uint64_t>(numSplits, 1);

    std::cerr << "Planning " << numSplits << " split" <<
        (numSplits == 1 ? "" : "s") << " over " << total << " items of " <<
        m_client.domain() << std::endl;
    if (m_where) std::cerr << "\tWhere: " << *m_where << std::endl;
    std::cerr << "\tSplit size: " << m_splitSize << std::endl;

    std::vector<Split> splits;
    splits.reserve(numSplits);

    Walk walk;

    for (std::uint64_t i(0); i < numSplits; ++i)
    {
        const std::uint64_t startRow(i * m_splitSize);
        std::uint64_t endRow(std::min(startRow + m_splitSize, total));

        if (i + 1 == numSplits && m_remainder == RemainderPolicy::Absorb)
        {
            endRow = total;
        }

        const Token token(
                m_walk == BoundaryWalk::Incremental ?
                    advance(walk, startRow, m_splitSize) :
                    boundaryToken(i, m_splitSize));

        splits.emplace_back(startRow, endRow, token);
    }

    std::cerr << "\tPlanned in " << secondsSince(start) << "s with " <<
        m_walkQueries << " boundary queries" << std::endl;

    return splits;
}

Token SplitPlanner::boundaryToken(
        const std::uint64_t page,
        const std::uint64_t limit)
{
    Walk walk;
    return advance(walk, page * limit, limit);
}

Token SplitPlanner::advance(
        Walk& walk,
        const std::uint64_t target,
        const std::uint64_t limit)
{
    while (walk.total < target)
    {
        if (walk.started && !walk.token)
        {
            throw StoreError(Failure(
                    FailureKind::Inconsistent,
                    "Token chain ended at row " + std::to_string(walk.total) +
                    " before the split boundary at row " +
                    std::to_string(target)));
        }

        // A store may count less than the limit per page, so never ask for
        // more rows than remain before the boundary.
        const std::uint64_t want(std::min(limit, target - walk.total));

        ++m_walkQueries;
        const QueryResult result(
                m_client.count(m_where, want, walk.token).value());

        const auto n(countValue(result));
        if (!n)
        {
            throw StoreError(Failure(
                    FailureKind::Inconsistent,
                    "Count response without a " + countAttribute + " value"));
        }

        if (*n > want)
        {
            throw StoreError(Failure(
                    FailureKind::Inconsistent,
                    "Counted " + std::to_string(*n) + " rows past a limit of " +
                    std::to_string(want)));
        }

        walk.total += *n;
        walk.token = result.nextToken;
        walk.started = true;
    }

    return walk.token;
}

} // namespace sdbsplit
