#pragma once

#include <memory>
#include <string>

#include <boost/property_tree/ptree_fwd.hpp>

#include <sdbsplit/http/curl.hpp>
#include <sdbsplit/http/signer.hpp>
#include <sdbsplit/options.hpp>
#include <sdbsplit/store-client.hpp>

namespace sdbsplit
{

// StoreClient speaking the SimpleDB query API (version 2009-04-15) over
// HTTP POST.  Each instance owns its own transport, so it must not be shared
// across threads.
class SimpleDbClient : public StoreClient
{
public:
    explicit SimpleDbClient(const Options& options);
    SimpleDbClient(const Options& options, std::unique_ptr<Transport> transport);

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

    static const std::string apiVersion;

private:
    using Tree = boost::property_tree::ptree;

    Outcome<QueryResult> doQuery(const std::string& query, const Token& token);
    Outcome<Tree> call(QueryParams params, const std::string& description);

    Failure rejected(
            const HttpResponse& res,
            const std::string& description) const;

    const Endpoint m_endpoint;
    const std::string m_domain;
    const bool m_consistentRead;
    const bool m_verbose;

    const Signer m_signer;
    std::unique_ptr<Transport> m_transport;
};

// Parse a SelectResponse body.  Attribute names and values flagged with
// encoding="base64" are decoded; repeated attribute names keep the last
// value seen.
QueryResult parseSelectResult(const boost::property_tree::ptree& response);

} // namespace sdbsplit
