#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <cstdlib>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <sdbsplit/simpledb-client.hpp>

using namespace sdbsplit;

namespace
{
    struct Request
    {
        std::string url;
        std::string body;
        HttpHeaders headers;
    };

    // Replays canned responses and remembers what was sent.
    class FakeTransport : public Transport
    {
    public:
        HttpResponse post(
                const std::string& url,
                const std::string& body,
                const HttpHeaders& headers) override
        {
            requests.push_back(Request { url, body, headers });

            if (responses.empty()) return HttpResponse::failed("No response");

            HttpResponse res(responses.front());
            responses.pop_front();
            return res;
        }

        void reply(int code, const std::string& body)
        {
            responses.push_back(
                    HttpResponse(code, std::vector<char>(body.begin(), body.end())));
        }

        std::vector<Request> requests;
        std::deque<HttpResponse> responses;
    };

    std::map<std::string, std::string> parseForm(const std::string& body)
    {
        std::map<std::string, std::string> form;

        auto decode([](const std::string& s) -> std::string
        {
            std::string out;
            for (std::size_t i(0); i < s.size(); ++i)
            {
                if (s[i] == '%' && i + 2 < s.size())
                {
                    out.push_back(static_cast<char>(
                            std::strtol(s.substr(i + 1, 2).c_str(), nullptr, 16)));
                    i += 2;
                }
                else out.push_back(s[i]);
            }
            return out;
        });

        std::size_t start(0);
        while (start <= body.size())
        {
            std::size_t end(body.find('&', start));
            if (end == std::string::npos) end = body.size();

            const std::string pair(body.substr(start, end - start));
            const std::size_t eq(pair.find('='));
            form[decode(pair.substr(0, eq))] = decode(pair.substr(eq + 1));

            start = end + 1;
        }

        return form;
    }

    ConfigMap config()
    {
        ConfigMap c;
        c["simpledb.aws.accessKey"] = "AKIDEXAMPLE";
        c["simpledb.aws.secretKey"] = "secret";
        c["simpledb.aws.region"] = "http://localhost:8080";
        c["simpledb.domain"] = "events";
        return c;
    }

    struct Fixture
    {
        Fixture(ConfigMap c = config())
            : transport(new FakeTransport())
            , client(Options(c), std::unique_ptr<Transport>(transport))
        { }

        FakeTransport* transport;
        SimpleDbClient client;
    };

    const std::string selectBody(R"(<?xml version="1.0"?>
<SelectResponse xmlns="http://sdb.amazonaws.com/doc/2009-04-15/">
  <SelectResult>
    <Item>
      <Name>item-1</Name>
      <Attribute><Name>color</Name><Value>red</Value></Attribute>
      <Attribute><Name>color</Name><Value>blue</Value></Attribute>
      <Attribute><Name encoding="base64">c2l6ZQ==</Name><Value encoding="base64">MTI=</Value></Attribute>
    </Item>
    <Item>
      <Name>item-2</Name>
    </Item>
    <NextToken>rO0ABXNy+/=</NextToken>
  </SelectResult>
  <ResponseMetadata>
    <RequestId>b1e8f1f7-42e9-494c-ad09-2674e557526d</RequestId>
    <BoxUsage>0.0000219907</BoxUsage>
  </ResponseMetadata>
</SelectResponse>)");

    std::string countBody(const std::string& count, const std::string& token)
    {
        return
            "<SelectResponse><SelectResult><Item><Name>Domain</Name>"
            "<Attribute><Name>Count</Name><Value>" + count + "</Value>"
            "</Attribute></Item>" +
            (token.empty() ? "" : "<NextToken>" + token + "</NextToken>") +
            "</SelectResult></SelectResponse>";
    }

    const std::string errorBody(R"(<?xml version="1.0"?>
<Response><Errors><Error><Code>InvalidQueryExpression</Code><Message>The specified query expression syntax is not valid.</Message><BoxUsage>0.0000137200</BoxUsage></Error></Errors><RequestID>c2ea9ef1-bd25-4f2d-9c16-6ba2a93b8da8</RequestID></Response>)");
}

TEST_CASE("Select requests", "[simpledb]")
{
    Fixture f;
    f.transport->reply(200, selectBody);

    const Outcome<QueryResult> outcome(
            f.client.select(
                WhereClause(std::string("color = 'red'")),
                Limit(2500),
                Token(std::string("abc+/="))));

    REQUIRE(f.transport->requests.size() == 1);
    const Request& req(f.transport->requests.front());

    CHECK(req.url == "http://localhost:8080/");
    REQUIRE(req.headers.size() == 1);
    CHECK(req.headers[0] ==
            "Content-Type: application/x-www-form-urlencoded; charset=utf-8");

    const auto form(parseForm(req.body));
    CHECK(form.at("Action") == "Select");
    CHECK(form.at("Version") == "2009-04-15");
    CHECK(form.at("SelectExpression") ==
            "SELECT * FROM events WHERE color = 'red' LIMIT 2500");
    CHECK(form.at("NextToken") == "abc+/=");
    CHECK(form.at("AWSAccessKeyId") == "AKIDEXAMPLE");
    CHECK(form.at("SignatureVersion") == "2");
    CHECK(form.at("SignatureMethod") == "HmacSHA256");
    CHECK(form.count("Timestamp") == 1);
    CHECK(form.count("Signature") == 1);
    CHECK(form.count("ConsistentRead") == 0);

    REQUIRE(outcome.ok());
    const QueryResult& result(outcome.value());

    REQUIRE(result.items.size() == 2);
    CHECK(result.items[0].key == "item-1");
    CHECK(result.items[0].attributes.size() == 2);
    CHECK(result.items[0].attributes.at("color") == "blue");
    CHECK(result.items[0].attributes.at("size") == "12");
    CHECK(result.items[1].key == "item-2");
    CHECK(result.items[1].attributes.empty());

    REQUIRE(result.nextToken);
    CHECK(*result.nextToken == "rO0ABXNy+/=");
}

TEST_CASE("First pages carry no token", "[simpledb]")
{
    ConfigMap c(config());
    c["simpledb.consistentRead"] = "true";

    Fixture f(c);
    f.transport->reply(200, "<SelectResponse><SelectResult/></SelectResponse>");

    const Outcome<QueryResult> outcome(
            f.client.select(WhereClause(), Limit(), Token()));

    const auto form(parseForm(f.transport->requests.front().body));
    CHECK(form.count("NextToken") == 0);
    CHECK(form.at("ConsistentRead") == "true");
    CHECK(form.at("SelectExpression") == "SELECT * FROM events");

    REQUIRE(outcome.ok());
    CHECK(outcome.value().items.empty());
    CHECK_FALSE(outcome.value().nextToken);
}

TEST_CASE("Count requests", "[simpledb]")
{
    Fixture f;
    f.transport->reply(200, countBody("2500", "next-page"));

    const Outcome<QueryResult> outcome(
            f.client.count(WhereClause(), Limit(2500), Token()));

    CHECK(parseForm(f.transport->requests.front().body).at("SelectExpression") ==
            "SELECT COUNT(*) FROM events LIMIT 2500");

    REQUIRE(outcome.ok());
    REQUIRE(countValue(outcome.value()));
    CHECK(*countValue(outcome.value()) == 2500);
    REQUIRE(outcome.value().nextToken);
    CHECK(*outcome.value().nextToken == "next-page");
}

TEST_CASE("Counts are summed across pages", "[simpledb]")
{
    Fixture f;
    f.transport->reply(200, countBody("1200", "t1"));
    f.transport->reply(200, countBody("800", "t2"));
    f.transport->reply(200, countBody("5", ""));

    const Outcome<std::uint64_t> total(
            f.client.countAll(WhereClause(std::string("year > '2010'"))));

    REQUIRE(total.ok());
    CHECK(total.value() == 2005);

    REQUIRE(f.transport->requests.size() == 3);
    CHECK(parseForm(f.transport->requests[0].body).count("NextToken") == 0);
    CHECK(parseForm(f.transport->requests[1].body).at("NextToken") == "t1");
    CHECK(parseForm(f.transport->requests[2].body).at("NextToken") == "t2");
    CHECK(parseForm(f.transport->requests[2].body).at("SelectExpression") ==
            "SELECT COUNT(*) FROM events WHERE year > '2010'");
}

TEST_CASE("A count without a Count attribute is inconsistent", "[simpledb]")
{
    Fixture f;
    f.transport->reply(
            200,
            "<SelectResponse><SelectResult><Item><Name>Domain</Name>"
            "</Item></SelectResult></SelectResponse>");

    const Outcome<QueryResult> outcome(
            f.client.count(WhereClause(), Limit(), Token()));

    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.failure().kind == FailureKind::Inconsistent);
    CHECK(outcome.failure().query == "SELECT COUNT(*) FROM events");
    CHECK_THROWS_AS(outcome.value(), StoreError);
}

TEST_CASE("Domain metadata", "[simpledb]")
{
    Fixture f;
    f.transport->reply(
            200,
            "<DomainMetadataResponse xmlns=\"http://sdb.amazonaws.com/doc/2009-04-15/\">"
            "<DomainMetadataResult>"
            "<ItemCount>195</ItemCount>"
            "<ItemNamesSizeBytes>2523</ItemNamesSizeBytes>"
            "<AttributeNameCount>12</AttributeNameCount>"
            "<Timestamp>1225486466</Timestamp>"
            "</DomainMetadataResult>"
            "</DomainMetadataResponse>");

    const Outcome<std::uint64_t> count(f.client.totalItemCount("events"));

    const auto form(parseForm(f.transport->requests.front().body));
    CHECK(form.at("Action") == "DomainMetadata");
    CHECK(form.at("DomainName") == "events");
    CHECK(form.count("SelectExpression") == 0);

    REQUIRE(count.ok());
    CHECK(count.value() == 195);
}

TEST_CASE("Rejected requests", "[simpledb]")
{
    Fixture f;
    f.transport->reply(400, errorBody);

    const Outcome<QueryResult> outcome(
            f.client.select(WhereClause(std::string("bad query")), Limit(), Token()));

    REQUIRE_FALSE(outcome.ok());
    const Failure& failure(outcome.failure());

    CHECK(failure.kind == FailureKind::RemoteRejected);
    CHECK(failure.httpStatus == 400);
    CHECK(failure.errorCode == "InvalidQueryExpression");
    CHECK(failure.message ==
            "The specified query expression syntax is not valid.");
    CHECK(failure.requestId == "c2ea9ef1-bd25-4f2d-9c16-6ba2a93b8da8");
    CHECK(failure.query == "SELECT * FROM events WHERE bad query");

    try
    {
        outcome.value();
        FAIL("Expected a StoreError");
    }
    catch (const StoreError& e)
    {
        CHECK(e.kind() == FailureKind::RemoteRejected);
        CHECK(std::string(e.what()).find("InvalidQueryExpression") !=
                std::string::npos);
    }
}

TEST_CASE("Rejections without an error document", "[simpledb]")
{
    Fixture f;
    f.transport->reply(503, "Service Unavailable");

    const Outcome<std::uint64_t> count(f.client.totalItemCount("events"));

    REQUIRE_FALSE(count.ok());
    CHECK(count.failure().kind == FailureKind::RemoteRejected);
    CHECK(count.failure().httpStatus == 503);
    CHECK(count.failure().message == "Service Unavailable");
    CHECK(count.failure().errorCode.empty());
}

TEST_CASE("Transport failures", "[simpledb]")
{
    Fixture f;
    f.transport->responses.push_back(
            HttpResponse::failed("Couldn't connect to server"));

    const Outcome<QueryResult> outcome(
            f.client.select(WhereClause(), Limit(), Token()));

    REQUIRE_FALSE(outcome.ok());
    CHECK(outcome.failure().kind == FailureKind::TransportFailure);
    CHECK(outcome.failure().message == "Couldn't connect to server");
    CHECK(outcome.failure().httpStatus == 0);
}

TEST_CASE("Unusable responses", "[simpledb]")
{
    Fixture f;
    f.transport->reply(200, "<SelectResponse><SelectResult>");
    f.transport->reply(200, "<Unexpected/>");
    f.transport->reply(
            200,
            "<SelectResponse><SelectResult><Item><Name encoding=\"base64\">"
            "!!!</Name></Item></SelectResult></SelectResponse>");

    for (int i(0); i < 3; ++i)
    {
        const Outcome<QueryResult> outcome(
                f.client.select(WhereClause(), Limit(), Token()));

        REQUIRE_FALSE(outcome.ok());
        CHECK(outcome.failure().kind == FailureKind::Inconsistent);
    }
}

TEST_CASE("Clients need a transport", "[simpledb]")
{
    CHECK_THROWS_AS(
            SimpleDbClient(Options(config()), std::unique_ptr<Transport>()),
            std::invalid_argument);
}
