#pragma once

#include <string>

#include <sdbsplit/defs.hpp>

namespace sdbsplit
{

struct QueryPlan
{
    QueryPlan(bool isCount, Limit limit = Limit())
        : isCount(isCount)
        , limit(limit)
    { }

    static QueryPlan count(Limit limit = Limit())
    {
        return QueryPlan(true, limit);
    }

    static QueryPlan select(Limit limit = Limit())
    {
        return QueryPlan(false, limit);
    }

    bool isCount;
    Limit limit;
};

// SELECT [COUNT(*)|*] FROM <domain> [WHERE <where>] [LIMIT <n>]
//
// A limit of zero is treated as absent.  The where clause is appended
// verbatim.
std::string buildQuery(
        const std::string& domain,
        const WhereClause& where,
        const QueryPlan& plan);

// Domain names outside [A-Za-z0-9_$] must be backtick-quoted in a select
// expression, with embedded backticks doubled.
std::string quoteDomain(const std::string& domain);

} // namespace sdbsplit
