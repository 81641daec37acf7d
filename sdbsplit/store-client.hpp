#pragma once

#include <cstdint>
#include <string>

#include <sdbsplit/defs.hpp>
#include <sdbsplit/outcome.hpp>

namespace sdbsplit
{

// Name of the synthetic attribute carrying the result of a COUNT(*) query.
extern const std::string countAttribute;

// The largest LIMIT the store accepts for a SELECT * query.
const std::uint64_t maxSelectLimit(2500);

class StoreClient
{
public:
    virtual ~StoreClient() { }

    virtual const std::string& domain() const = 0;

    // SELECT COUNT(*), resumed from the token if one is supplied.  The count
    // arrives as the countAttribute of a single synthetic item.
    virtual Outcome<QueryResult> count(
            const WhereClause& where,
            Limit limit,
            const Token& token) = 0;

    // SELECT *, resumed from the token if one is supplied.
    virtual Outcome<QueryResult> select(
            const WhereClause& where,
            Limit limit,
            const Token& token) = 0;

    // Exact item count of an entire domain, from its metadata.
    virtual Outcome<std::uint64_t> totalItemCount(
            const std::string& domain) = 0;

    // Sum of every page of an unlimited COUNT(*) query.
    Outcome<std::uint64_t> countAll(const WhereClause& where);
};

boost::optional<std::uint64_t> countValue(const QueryResult& result);

} // namespace sdbsplit
