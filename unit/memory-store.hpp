#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{
namespace test
{

// In-memory store with SimpleDB paging semantics.  Tokens are opaque
// strings handed out by the store itself and only valid for the filter they
// were issued under.
class MemoryStore : public StoreClient
{
public:
    using Predicate = std::function<bool(const Record&)>;

    MemoryStore(std::string domain, Records items);

    // Items "item-00000" onward with attributes "index" and "parity".
    static Records makeItems(std::size_t n);

    const std::string& domain() const override { return m_domain; }

    Outcome<QueryResult> count(
            const WhereClause& where,
            Limit limit,
            const Token& token) override;

    Outcome<QueryResult> select(
            const WhereClause& where,
            Limit limit,
            const Token& token) override;

    Outcome<std::uint64_t> totalItemCount(const std::string& domain) override;

    // Register the rows matched by a where clause.  Unknown clauses are
    // rejected like an invalid query expression.
    void where(const std::string& clause, Predicate predicate);

    // Rows counted per count page at most, regardless of LIMIT.
    void countPageSize(std::uint64_t n) { m_countPageSize = n; }

    // Items returned per select page at most, regardless of LIMIT.
    void selectPageSize(std::uint64_t n) { m_selectPageSize = n; }

    // The n-th count or select call (1-based, both kinds together) fails.
    void failAt(std::size_t call, Failure failure);

    // Count responses omit the Count attribute.
    void dropCountAttribute(bool drop) { m_dropCount = drop; }

    // Every count call returns this count and no token.
    void fixedCount(std::uint64_t n) { m_fixedCount = n; }

    std::size_t calls() const { return m_calls; }
    std::size_t countCalls() const { return m_countCalls; }
    std::size_t selectCalls() const { return m_selectCalls; }
    std::size_t metadataCalls() const { return m_metadataCalls; }

    const std::vector<Limit>& countLimits() const { return m_countLimits; }
    const std::vector<Token>& selectTokens() const { return m_selectTokens; }

private:
    bool matching(const WhereClause& where, Records& out, Failure& f) const;
    bool offset(const Token& token, const WhereClause& where,
            std::size_t& out, Failure& f) const;
    Token tokenFor(const WhereClause& where, std::size_t offset) const;
    bool injected(Failure& f);

    std::string m_domain;
    Records m_items;
    std::map<std::string, Predicate> m_filters;

    std::uint64_t m_countPageSize;
    std::uint64_t m_selectPageSize;
    std::map<std::size_t, Failure> m_failures;
    bool m_dropCount;
    boost::optional<std::uint64_t> m_fixedCount;

    std::size_t m_calls;
    std::size_t m_countCalls;
    std::size_t m_selectCalls;
    std::size_t m_metadataCalls;

    std::vector<Limit> m_countLimits;
    std::vector<Token> m_selectTokens;
};

} // namespace test
} // namespace sdbsplit
