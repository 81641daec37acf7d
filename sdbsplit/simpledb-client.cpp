#include <sdbsplit/simpledb-client.hpp>

#include <iostream>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sdbsplit/query.hpp>
#include <sdbsplit/util/base64.hpp>
#include <sdbsplit/util/color.hpp>

namespace sdbsplit
{

const std::string SimpleDbClient::apiVersion("2009-04-15");

namespace
{

using Tree = boost::property_tree::ptree;

const HttpHeaders headers {
    "Content-Type: application/x-www-form-urlencoded; charset=utf-8"
};

std::unique_ptr<Transport> makeCurl(const Options& options)
{
    std::unique_ptr<Curl> curl(
            new Curl(options.connectTimeout(), options.timeout()));
    curl->verbose(options.verbose());
    return std::unique_ptr<Transport>(std::move(curl));
}

Tree parseXml(const std::string& body)
{
    std::istringstream ss(body);
    Tree tree;
    boost::property_tree::read_xml(ss, tree);
    return tree;
}

// Element text, decoded if the store flagged it as base64.  SimpleDB does
// this for names and values holding characters that are invalid in XML.
std::string text(const Tree& node)
{
    const std::string value(node.get_value<std::string>());
    const auto encoding(node.get_optional<std::string>("<xmlattr>.encoding"));

    if (encoding && *encoding == "base64") return decodeBase64(value);
    return value;
}

void log(const Failure& f)
{
    if (f.kind == FailureKind::RemoteRejected)
    {
        std::cerr << color(
                "SimpleDB received the request but rejected it",
                Color::Red) << std::endl;
        std::cerr << "\tQuery:            " << f.query << std::endl;
        std::cerr << "\tError message:    " << f.message << std::endl;
        std::cerr << "\tHTTP status code: " << f.httpStatus << std::endl;
        std::cerr << "\tAWS error code:   " << f.errorCode << std::endl;
        std::cerr << "\tRequest ID:       " << f.requestId << std::endl;
    }
    else if (f.kind == FailureKind::TransportFailure)
    {
        std::cerr << color(
                "Could not communicate with SimpleDB",
                Color::Red) << std::endl;
        std::cerr << "\tQuery:         " << f.query << std::endl;
        std::cerr << "\tError message: " << f.message << std::endl;
    }
    else
    {
        std::cerr << color("Unusable SimpleDB response", Color::Red) <<
            std::endl;
        std::cerr << "\tQuery:         " << f.query << std::endl;
        std::cerr << "\tError message: " << f.message << std::endl;
    }
}

} // unnamed namespace

QueryResult parseSelectResult(const Tree& response)
{
    QueryResult result;

    for (const auto& child : response.get_child("SelectResponse.SelectResult"))
    {
        if (child.first == "Item")
        {
            Record record;

            for (const auto& field : child.second)
            {
                if (field.first == "Name")
                {
                    record.key = text(field.second);
                }
                else if (field.first == "Attribute")
                {
                    const std::string name(text(field.second.get_child("Name")));
                    record.attributes[name] =
                        text(field.second.get_child("Value"));
                }
            }

            result.items.push_back(record);
        }
        else if (child.first == "NextToken")
        {
            const std::string token(child.second.get_value<std::string>());
            if (!token.empty()) result.nextToken = token;
        }
    }

    return result;
}

SimpleDbClient::SimpleDbClient(const Options& options)
    : SimpleDbClient(options, makeCurl(options))
{ }

SimpleDbClient::SimpleDbClient(
        const Options& options,
        std::unique_ptr<Transport> transport)
    : m_endpoint(options.endpoint())
    , m_domain(options.domain())
    , m_consistentRead(options.consistentRead())
    , m_verbose(options.verbose())
    , m_signer(options.accessKey(), options.secretKey())
    , m_transport(std::move(transport))
{
    if (!m_transport) throw std::invalid_argument("No transport supplied");
}

Outcome<QueryResult> SimpleDbClient::count(
        const WhereClause& where,
        const Limit limit,
        const Token& token)
{
    const std::string query(
            buildQuery(m_domain, where, QueryPlan::count(limit)));

    Outcome<QueryResult> outcome(doQuery(query, token));
    if (outcome && !countValue(outcome.value()))
    {
        Failure f(
                FailureKind::Inconsistent,
                "Count response without a " + countAttribute + " value");
        f.query = query;
        log(f);
        return f;
    }

    return outcome;
}

Outcome<QueryResult> SimpleDbClient::select(
        const WhereClause& where,
        const Limit limit,
        const Token& token)
{
    return doQuery(
            buildQuery(m_domain, where, QueryPlan::select(limit)),
            token);
}

Outcome<std::uint64_t> SimpleDbClient::totalItemCount(const std::string& domain)
{
    const std::string description("DomainMetadata " + domain);

    QueryParams params;
    params["Action"] = "DomainMetadata";
    params["DomainName"] = domain;

    Outcome<Tree> response(call(params, description));
    if (!response) return response.failure();

    try
    {
        return response.value().get<std::uint64_t>(
                "DomainMetadataResponse.DomainMetadataResult.ItemCount");
    }
    catch (const boost::property_tree::ptree_error& e)
    {
        Failure f(
                FailureKind::Inconsistent,
                std::string("Malformed DomainMetadata response: ") + e.what());
        f.query = description;
        log(f);
        return f;
    }
}

Outcome<QueryResult> SimpleDbClient::doQuery(
        const std::string& query,
        const Token& token)
{
    QueryParams params;
    params["Action"] = "Select";
    params["SelectExpression"] = query;
    if (token) params["NextToken"] = *token;
    if (m_consistentRead) params["ConsistentRead"] = "true";

    Outcome<Tree> response(call(params, query));
    if (!response) return response.failure();

    try
    {
        return parseSelectResult(response.value());
    }
    catch (const std::runtime_error& e)
    {
        Failure f(
                FailureKind::Inconsistent,
                std::string("Malformed Select response: ") + e.what());
        f.query = query;
        log(f);
        return f;
    }
}

Outcome<SimpleDbClient::Tree> SimpleDbClient::call(
        QueryParams params,
        const std::string& description)
{
    params["Version"] = apiVersion;

    const std::string body(
            m_signer.sign(
                "POST",
                m_endpoint.host,
                "/",
                params,
                Signer::timestamp()));

    if (m_verbose) std::cerr << "Running: " << description << std::endl;

    const HttpResponse res(m_transport->post(m_endpoint.url(), body, headers));

    if (!res.reached())
    {
        Failure f(FailureKind::TransportFailure, res.error());
        f.query = description;
        log(f);
        return f;
    }

    if (!res.ok())
    {
        Failure f(rejected(res, description));
        log(f);
        return f;
    }

    try
    {
        return parseXml(res.str());
    }
    catch (const boost::property_tree::xml_parser_error& e)
    {
        Failure f(
                FailureKind::Inconsistent,
                std::string("Unparseable response: ") + e.what());
        f.httpStatus = res.code();
        f.query = description;
        log(f);
        return f;
    }
}

Failure SimpleDbClient::rejected(
        const HttpResponse& res,
        const std::string& description) const
{
    Failure f(FailureKind::RemoteRejected, "");
    f.httpStatus = res.code();
    f.query = description;

    try
    {
        const Tree tree(parseXml(res.str()));
        const Tree& error(tree.get_child("Response.Errors.Error"));

        f.errorCode = error.get<std::string>("Code", "");
        f.message = error.get<std::string>("Message", "");
        f.requestId = tree.get<std::string>("Response.RequestID", "");
    }
    catch (const boost::property_tree::ptree_error&)
    {
        // Not an error document: keep whatever the body says.
        f.message = res.str().substr(0, 512);
    }

    if (f.message.empty())
    {
        f.message = "HTTP status " + std::to_string(res.code());
    }

    return f;
}

} // namespace sdbsplit
