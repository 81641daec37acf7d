#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <memory>
#include <string>

#include <sdbsplit/split-planner.hpp>
#include <sdbsplit/split-reader.hpp>

#include "memory-store.hpp"

using namespace sdbsplit;
using sdbsplit::test::MemoryStore;

namespace
{
    MemoryStore store(std::size_t items)
    {
        return MemoryStore("events", MemoryStore::makeItems(items));
    }

    std::unique_ptr<StoreClient> own(const MemoryStore& s)
    {
        return std::unique_ptr<StoreClient>(new MemoryStore(s));
    }

    Options options(std::uint64_t splitSize)
    {
        ConfigMap c;
        c[keys::accessKey] = "AKIDEXAMPLE";
        c[keys::secretKey] = "secret";
        c[keys::domain] = "events";
        c[keys::splitSize] = std::to_string(splitSize);
        return Options(c);
    }
}

TEST_CASE("A reader yields exactly its split's records", "[reader]")
{
    MemoryStore s(store(50));
    Token token(s.count(WhereClause(), Limit(20), Token()).value().nextToken);

    SplitReader reader(Split(20, 35, token), own(s));
    CHECK(reader.state() == SplitReader::State::Iterating);
    CHECK(reader.materialized() == 15);

    std::string key;
    Attributes attributes;

    for (int i(20); i < 35; ++i)
    {
        REQUIRE(reader.next(key, attributes));
        CHECK(attributes.at("index") == std::to_string(i));
    }
    CHECK(key == "item-00034");

    CHECK_FALSE(reader.next(key, attributes));
    CHECK(reader.state() == SplitReader::State::Exhausted);

    // Exhaustion is permanent and leaves the output slots alone.
    key = "untouched";
    for (int i(0); i < 3; ++i) CHECK_FALSE(reader.next(key, attributes));
    CHECK(key == "untouched");
}

TEST_CASE("Every planned split reads back its rows", "[reader]")
{
    MemoryStore s(store(237));
    SplitPlanner planner(s, options(40));

    std::uint64_t expected(0);
    for (const Split& split : planner.plan())
    {
        SplitReader reader(split, own(s), WhereClause(), 15);

        std::string key;
        Attributes attributes;
        while (reader.next(key, attributes))
        {
            CHECK(attributes.at("index") == std::to_string(expected));
            ++expected;
        }

        CHECK(reader.position() == split.length());
    }

    CHECK(expected == 237);
}

TEST_CASE("Materialization pages from the split's token", "[reader]")
{
    MemoryStore s(store(100));
    const Token start(s.count(WhereClause(), Limit(10), Token()).value().nextToken);

    MemoryStore* client(new MemoryStore(s));
    SplitReader reader(
            Split(10, 37, start),
            std::unique_ptr<StoreClient>(client),
            WhereClause(),
            10);

    // Pages of 10, 10 and the remaining 7.
    REQUIRE(client->selectCalls() == 3);
    REQUIRE(client->selectTokens().front());
    CHECK(*client->selectTokens().front() == *start);
    CHECK(reader.materialized() == 27);
}

TEST_CASE("Page sizes are capped at the store maximum", "[reader]")
{
    MemoryStore s(store(3000));

    MemoryStore* client(new MemoryStore(s));
    SplitReader reader(
            Split(0, 3000),
            std::unique_ptr<StoreClient>(client),
            WhereClause(),
            100000);

    CHECK(client->selectCalls() == 2);
    CHECK(reader.materialized() == 3000);
}

TEST_CASE("Short store pages are followed to the end of the split", "[reader]")
{
    MemoryStore s(store(60));
    s.selectPageSize(7);

    SplitReader reader(Split(0, 60), own(s));
    CHECK(reader.materialized() == 60);
}

TEST_CASE("A split longer than the store ends early", "[reader]")
{
    MemoryStore s(store(12));
    SplitReader reader(Split(0, 20), own(s));

    CHECK(reader.materialized() == 12);

    std::string key;
    Attributes attributes;
    std::size_t n(0);
    while (reader.next(key, attributes)) ++n;

    CHECK(n == 12);
    CHECK(reader.state() == SplitReader::State::Exhausted);
    CHECK_FALSE(reader.next(key, attributes));
}

TEST_CASE("An empty split reads nothing", "[reader]")
{
    MemoryStore s(store(10));
    MemoryStore* client(new MemoryStore(s));
    SplitReader reader(Split(0, 0), std::unique_ptr<StoreClient>(client));

    CHECK(client->selectCalls() == 0);

    std::string key;
    Attributes attributes;
    CHECK_FALSE(reader.next(key, attributes));
    CHECK(reader.progress() == 0.0f);
}

TEST_CASE("Progress", "[reader]")
{
    MemoryStore s(store(4));
    SplitReader reader(Split(0, 4), own(s));

    std::string key;
    Attributes attributes;

    CHECK(reader.progress() == 0.0f);

    REQUIRE(reader.next(key, attributes));
    CHECK(reader.progress() == Approx(0.25));
    REQUIRE(reader.next(key, attributes));
    CHECK(reader.progress() == Approx(0.5));
    REQUIRE(reader.next(key, attributes));
    CHECK(reader.progress() == Approx(0.75));

    // A fully consumed split reports zero.
    REQUIRE(reader.next(key, attributes));
    CHECK(reader.progress() == 0.0f);

    CHECK_FALSE(reader.next(key, attributes));
    CHECK(reader.progress() == 0.0f);
}

TEST_CASE("Closing", "[reader]")
{
    MemoryStore s(store(10));
    SplitReader reader(Split(0, 10), own(s));

    std::string key;
    Attributes attributes;
    REQUIRE(reader.next(key, attributes));

    reader.close();
    CHECK(reader.state() == SplitReader::State::Closed);
    CHECK_FALSE(reader.next(key, attributes));

    reader.close();
    CHECK(reader.state() == SplitReader::State::Closed);
}

TEST_CASE("Materialization failures fail construction", "[reader]")
{
    MemoryStore s(store(100));
    s.failAt(2, Failure(FailureKind::TransportFailure, "Connection reset"));

    try
    {
        SplitReader reader(Split(0, 100), own(s), WhereClause(), 50);
        FAIL("Expected construction to fail");
    }
    catch (const StoreError& e)
    {
        CHECK(e.kind() == FailureKind::TransportFailure);
        CHECK(e.failure().message == "Connection reset");
    }
}

TEST_CASE("Readers apply the where clause", "[reader]")
{
    MemoryStore s(store(30));
    s.where("parity = 'odd'", [](const Record& r)
    {
        return r.attributes.at("parity") == "odd";
    });

    SplitReader reader(
            Split(0, 15),
            own(s),
            WhereClause(std::string("parity = 'odd'")));

    std::string key;
    Attributes attributes;
    std::size_t n(0);
    while (reader.next(key, attributes))
    {
        CHECK(attributes.at("parity") == "odd");
        ++n;
    }
    CHECK(n == 15);
}

TEST_CASE("Readers need a client and a page size", "[reader]")
{
    MemoryStore s(store(1));

    CHECK_THROWS_AS(
            SplitReader(Split(0, 1), std::unique_ptr<StoreClient>()),
            std::invalid_argument);
    CHECK_THROWS_AS(
            SplitReader(Split(0, 1), own(s), WhereClause(), 0),
            std::invalid_argument);
}
