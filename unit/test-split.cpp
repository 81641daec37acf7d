#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <string>

#include <sdbsplit/split.hpp>

using namespace sdbsplit;

namespace
{
    Data bytes(std::initializer_list<int> values)
    {
        Data data;
        for (const int v : values) data.push_back(static_cast<char>(v));
        return data;
    }

    Data append(Data data, const std::string& s)
    {
        data.insert(data.end(), s.begin(), s.end());
        return data;
    }
}

TEST_CASE("Split accessors", "[split]")
{
    const Split split(100, 250, Token(std::string("tok")));

    CHECK(split.startRow() == 100);
    CHECK(split.endRow() == 250);
    CHECK(split.length() == 150);
    REQUIRE(split.token());
    CHECK(*split.token() == "tok");

    CHECK(Split(7, 7).length() == 0);
    CHECK_FALSE(Split(0, 10).token());

    CHECK_THROWS_AS(Split(10, 9), std::invalid_argument);
}

TEST_CASE("Serialized layout", "[split]")
{
    SECTION("Without a token")
    {
        const Data expected(
                append(
                    bytes({
                        0, 0, 0, 0, 0, 0, 0, 0,
                        0, 0, 0, 0, 0, 0, 0x01, 0x2c,
                        0, 4 }),
                    "NULL"));

        CHECK(Split(0, 300).serialize() == expected);
    }

    SECTION("With a token")
    {
        const Data expected(
                append(
                    bytes({
                        0, 0, 0, 0, 0, 0x01, 0x86, 0xa0,
                        0, 0, 0, 0, 0, 0x03, 0x0d, 0x40,
                        0, 6 }),
                    "abc123"));

        CHECK(Split(100000, 200000, Token(std::string("abc123"))).serialize() ==
                expected);
    }

    SECTION("Large row numbers")
    {
        const Data data(Split(0x0102030405060708ull, 0xff00000000000001ull)
                .serialize());

        REQUIRE(data.size() == 22);
        CHECK(data[0] == 0x01);
        CHECK(data[7] == 0x08);
        CHECK(static_cast<unsigned char>(data[8]) == 0xff);
        CHECK(data[15] == 0x01);
    }
}

TEST_CASE("The empty token survives serialization", "[split]")
{
    const Split split(0, 0);
    const Split copy(Split::deserialize(split.serialize()));

    CHECK_FALSE(copy.token());
    CHECK(copy == split);
}

TEST_CASE("Tokens survive serialization", "[split]")
{
    const Split split(5000, 7500, Token(std::string("abc123")));
    const Split copy(Split::deserialize(split.serialize()));

    REQUIRE(copy.token());
    CHECK(*copy.token() == "abc123");
    CHECK(copy.startRow() == 5000);
    CHECK(copy.endRow() == 7500);

    // Real SimpleDB tokens are long base64 blobs.
    const std::string longToken(
            "rO0ABXNyACdjb20uYW1hem9uLnNkcy5RdWVyeVByb2Nlc3Nvci5Nb3JlVG9rZW4" +
            std::string(900, 'x') + "==");
    const Split big(0, 1, Token(longToken));
    CHECK(Split::deserialize(big.serialize()) == big);
}

TEST_CASE("Malformed splits are rejected", "[split]")
{
    const Data good(Split(1, 2, Token(std::string("abc"))).serialize());

    SECTION("Truncated row numbers")
    {
        const Data truncated(good.begin(), good.begin() + 12);
        CHECK_THROWS_AS(Split::deserialize(truncated), SplitFormatError);
    }

    SECTION("Truncated token")
    {
        const Data truncated(good.begin(), good.end() - 1);
        CHECK_THROWS_AS(Split::deserialize(truncated), SplitFormatError);
    }

    SECTION("Empty input")
    {
        CHECK_THROWS_AS(Split::deserialize(Data()), SplitFormatError);
    }

    SECTION("Trailing bytes")
    {
        Data extra(good);
        extra.push_back('!');
        CHECK_THROWS_AS(Split::deserialize(extra), SplitFormatError);
    }

    SECTION("Inverted range")
    {
        const Data inverted(
                append(
                    bytes({
                        0, 0, 0, 0, 0, 0, 0, 9,
                        0, 0, 0, 0, 0, 0, 0, 3,
                        0, 4 }),
                    "NULL"));
        CHECK_THROWS_AS(Split::deserialize(inverted), SplitFormatError);
    }
}

TEST_CASE("Oversized tokens cannot be serialized", "[split]")
{
    const Split split(0, 1, Token(std::string(65536, 'a')));
    CHECK_THROWS_AS(split.serialize(), SplitFormatError);

    const Split largest(0, 1, Token(std::string(65535, 'a')));
    CHECK(largest.serialize().size() == 18 + 65535);
}

TEST_CASE("Split description", "[split]")
{
    CHECK(Split(0, 10).toString() == "startRow=0, endRow=10, splitToken=NULL");
    CHECK(Split(10, 20, Token(std::string("t"))).toString() ==
            "startRow=10, endRow=20, splitToken=t");
}
