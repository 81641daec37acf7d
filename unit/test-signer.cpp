#include <catch2/catch.hpp>

#include <sdbsplit/http/signer.hpp>
#include <sdbsplit/util/base64.hpp>

using namespace sdbsplit;

namespace
{
    const std::string accessKey("AKIDEXAMPLE");
    const std::string secretKey("wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY");
    const std::string timestamp("2013-01-31T17:45:02.000Z");

    QueryParams selectParams()
    {
        QueryParams params;
        params["Action"] = "Select";
        params["SelectExpression"] = "SELECT * FROM `my-domain` LIMIT 10";
        params["Version"] = "2009-04-15";
        return params;
    }
}

TEST_CASE("Base64", "[base64]")
{
    CHECK(encodeBase64(std::string()) == "");
    CHECK(encodeBase64(std::string("f")) == "Zg==");
    CHECK(encodeBase64(std::string("fo")) == "Zm8=");
    CHECK(encodeBase64(std::string("foo")) == "Zm9v");
    CHECK(encodeBase64(std::string("foob")) == "Zm9vYg==");
    CHECK(encodeBase64(std::string("fooba")) == "Zm9vYmE=");
    CHECK(encodeBase64(std::string("foobar")) == "Zm9vYmFy");

    CHECK(decodeBase64("Zg==") == "f");
    CHECK(decodeBase64("Zm9vYmE=") == "fooba");
    CHECK(decodeBase64("Zm9v\r\nYmFy") == "foobar");

    const std::vector<uint8_t> binary { 0x00, 0xff, 0x10, 0x80 };
    CHECK(encodeBase64(binary) == "AP8QgA==");
    CHECK(decodeBase64("AP8QgA==") == std::string("\x00\xff\x10\x80", 4));

    CHECK_THROWS_AS(decodeBase64("Zm9v!"), std::runtime_error);
}

TEST_CASE("RFC 3986 encoding", "[signer]")
{
    CHECK(Signer::encode("AZaz09-_.~") == "AZaz09-_.~");
    CHECK(Signer::encode("a b") == "a%20b");
    CHECK(Signer::encode("*") == "%2A");
    CHECK(Signer::encode("a+b=c/d") == "a%2Bb%3Dc%2Fd");
    CHECK(Signer::encode("`'") == "%60%27");
    CHECK(Signer::encode("\xc3\xa9") == "%C3%A9");
}

TEST_CASE("Canonical query strings are sorted by name", "[signer]")
{
    QueryParams params;
    params["b"] = "2";
    params["a"] = "x y";
    params["A"] = "1";

    CHECK(Signer::canonicalize(params) == "A=1&a=x%20y&b=2");
}

TEST_CASE("String to sign", "[signer]")
{
    const Signer signer(accessKey, secretKey);

    QueryParams params;
    params["Action"] = "DomainMetadata";
    params["DomainName"] = "events";

    CHECK(signer.getStringToSign("POST", "SDB.Amazonaws.com", "/", params) ==
            "POST\nsdb.amazonaws.com\n/\nAction=DomainMetadata&DomainName=events");
    CHECK(signer.getStringToSign("POST", "host", "", QueryParams()) ==
            "POST\nhost\n/\n");
}

TEST_CASE("Signed request body", "[signer]")
{
    const Signer signer(accessKey, secretKey);

    QueryParams params(selectParams());
    params["Signature"] = "stale";

    const std::string body(
            signer.sign("POST", "sdb.amazonaws.com", "/", params, timestamp));

    CHECK(body ==
            "AWSAccessKeyId=AKIDEXAMPLE"
            "&Action=Select"
            "&SelectExpression=SELECT%20%2A%20FROM%20%60my-domain%60%20LIMIT%2010"
            "&SignatureMethod=HmacSHA256"
            "&SignatureVersion=2"
            "&Timestamp=2013-01-31T17%3A45%3A02.000Z"
            "&Version=2009-04-15"
            "&Signature=vQussv25uvJWuNKNe2EJQitzjZWFblG%2B9HLuYscyQmU%3D");
}

TEST_CASE("Timestamps are UTC ISO-8601", "[signer]")
{
    const std::string now(Signer::timestamp());

    REQUIRE(now.size() == 24);
    CHECK(now[4] == '-');
    CHECK(now[10] == 'T');
    CHECK(now.substr(19) == ".000Z");
}
