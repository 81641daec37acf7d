#include <catch2/catch.hpp>

#include <sdbsplit/unique.hpp>

#include "memory-store.hpp"

using namespace sdbsplit;
using sdbsplit::test::MemoryStore;

TEST_CASE("Values are counted across pages", "[unique]")
{
    MemoryStore s("events", MemoryStore::makeItems(5001));

    const ValueCounts counts(uniqueValueCounts(s, WhereClause(), "parity"));

    REQUIRE(counts.size() == 2);
    CHECK(counts.at("even") == 2501);
    CHECK(counts.at("odd") == 2500);
    CHECK(s.selectCalls() == 3);
}

TEST_CASE("Items without the attribute are skipped", "[unique]")
{
    Records items(MemoryStore::makeItems(4));
    items[1].attributes.erase("parity");
    items[2].attributes["parity"] = "even";

    MemoryStore s("events", items);
    const ValueCounts counts(uniqueValueCounts(s, WhereClause(), "parity"));

    REQUIRE(counts.size() == 2);
    CHECK(counts.at("even") == 2);
    CHECK(counts.at("odd") == 1);

    CHECK(uniqueValueCounts(s, WhereClause(), "missing").empty());
}

TEST_CASE("Unique counts honor the where clause", "[unique]")
{
    MemoryStore s("events", MemoryStore::makeItems(20));
    s.where("index < '5'", [](const Record& r)
    {
        return std::stoi(r.attributes.at("index")) < 5;
    });

    const ValueCounts counts(
            uniqueValueCounts(
                s,
                WhereClause(std::string("index < '5'")),
                "parity"));

    CHECK(counts.at("even") == 3);
    CHECK(counts.at("odd") == 2);
}

TEST_CASE("Unique counts fail loudly", "[unique]")
{
    MemoryStore s("events", MemoryStore::makeItems(6000));
    s.failAt(2, Failure(FailureKind::RemoteRejected, "Throttled"));

    CHECK_THROWS_AS(
            uniqueValueCounts(s, WhereClause(), "parity"),
            StoreError);
}
