#include "memory-store.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace sdbsplit
{
namespace test
{

namespace
{
    const std::string tokenPrefix("mem:");

    // SimpleDB returns 100 items per select page unless told otherwise.
    const std::uint64_t defaultSelectLimit(100);

    std::uint64_t capped(Limit limit, std::uint64_t page)
    {
        std::uint64_t n(std::numeric_limits<std::uint64_t>::max());
        if (limit && *limit) n = *limit;
        if (page) n = std::min(n, page);
        return n;
    }
}

MemoryStore::MemoryStore(std::string domain, Records items)
    : m_domain(domain)
    , m_items(items)
    , m_countPageSize(0)
    , m_selectPageSize(0)
    , m_dropCount(false)
    , m_calls(0)
    , m_countCalls(0)
    , m_selectCalls(0)
    , m_metadataCalls(0)
{ }

Records MemoryStore::makeItems(const std::size_t n)
{
    Records items;
    for (std::size_t i(0); i < n; ++i)
    {
        char key[32];
        std::snprintf(key, sizeof(key), "item-%05zu", i);

        Attributes attributes;
        attributes["index"] = std::to_string(i);
        attributes["parity"] = i % 2 ? "odd" : "even";
        items.emplace_back(key, attributes);
    }
    return items;
}

void MemoryStore::where(const std::string& clause, Predicate predicate)
{
    m_filters[clause] = predicate;
}

void MemoryStore::failAt(const std::size_t call, Failure failure)
{
    m_failures[call] = failure;
}

bool MemoryStore::injected(Failure& f)
{
    ++m_calls;
    const auto it(m_failures.find(m_calls));
    if (it == m_failures.end()) return false;
    f = it->second;
    return true;
}

bool MemoryStore::matching(
        const WhereClause& where,
        Records& out,
        Failure& f) const
{
    if (!where)
    {
        out = m_items;
        return true;
    }

    const auto it(m_filters.find(*where));
    if (it == m_filters.end())
    {
        f = Failure(FailureKind::RemoteRejected, "Invalid where clause");
        f.httpStatus = 400;
        f.errorCode = "InvalidQueryExpression";
        return false;
    }

    out.clear();
    for (const Record& r : m_items)
    {
        if (it->second(r)) out.push_back(r);
    }
    return true;
}

Token MemoryStore::tokenFor(const WhereClause& where, std::size_t offset) const
{
    return tokenPrefix + (where ? *where : "") + "@" + std::to_string(offset);
}

bool MemoryStore::offset(
        const Token& token,
        const WhereClause& where,
        std::size_t& out,
        Failure& f) const
{
    out = 0;
    if (!token) return true;

    const std::string expected(tokenPrefix + (where ? *where : "") + "@");
    if (token->compare(0, expected.size(), expected) != 0)
    {
        f = Failure(FailureKind::RemoteRejected, "Invalid NextToken");
        f.httpStatus = 400;
        f.errorCode = "InvalidNextToken";
        return false;
    }

    out = std::stoull(token->substr(expected.size()));
    return true;
}

Outcome<QueryResult> MemoryStore::count(
        const WhereClause& where,
        const Limit limit,
        const Token& token)
{
    ++m_countCalls;
    m_countLimits.push_back(limit);

    Failure f;
    if (injected(f)) return f;

    QueryResult result;
    Attributes attributes;

    if (m_fixedCount)
    {
        if (!m_dropCount) attributes[countAttribute] = std::to_string(*m_fixedCount);
        result.items.emplace_back("Domain", attributes);
        return result;
    }

    Records rows;
    std::size_t start(0);
    if (!matching(where, rows, f)) return f;
    if (!offset(token, where, start, f)) return f;

    const std::uint64_t remaining(start < rows.size() ? rows.size() - start : 0);
    const std::uint64_t counted(
            std::min(remaining, capped(limit, m_countPageSize)));
    const std::size_t end(start + counted);

    if (!m_dropCount) attributes[countAttribute] = std::to_string(counted);
    result.items.emplace_back("Domain", attributes);

    if (end < rows.size()) result.nextToken = tokenFor(where, end);
    return result;
}

Outcome<QueryResult> MemoryStore::select(
        const WhereClause& where,
        const Limit limit,
        const Token& token)
{
    ++m_selectCalls;
    m_selectTokens.push_back(token);

    Failure f;
    if (injected(f)) return f;

    Records rows;
    std::size_t start(0);
    if (!matching(where, rows, f)) return f;
    if (!offset(token, where, start, f)) return f;

    const std::uint64_t remaining(start < rows.size() ? rows.size() - start : 0);
    const std::uint64_t page(
            capped(limit ? limit : Limit(defaultSelectLimit), m_selectPageSize));
    const std::size_t end(start + std::min(remaining, page));

    QueryResult result;
    for (std::size_t i(start); i < end; ++i) result.items.push_back(rows[i]);

    if (end < rows.size()) result.nextToken = tokenFor(where, end);
    return result;
}

Outcome<std::uint64_t> MemoryStore::totalItemCount(const std::string& domain)
{
    ++m_metadataCalls;

    if (domain != m_domain)
    {
        Failure f(FailureKind::RemoteRejected, "The specified domain does not exist.");
        f.httpStatus = 400;
        f.errorCode = "NoSuchDomain";
        return f;
    }

    return static_cast<std::uint64_t>(m_items.size());
}

} // namespace test
} // namespace sdbsplit
