#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <string>
#include <vector>

#include <sdbsplit/split-planner.hpp>

#include "memory-store.hpp"

using namespace sdbsplit;
using sdbsplit::test::MemoryStore;

namespace
{
    Options options(
            std::uint64_t splitSize,
            const std::string& walk = "incremental",
            const std::string& remainder = "split",
            const std::string& where = "")
    {
        ConfigMap c;
        c[keys::accessKey] = "AKIDEXAMPLE";
        c[keys::secretKey] = "secret";
        c[keys::domain] = "events";
        c[keys::splitSize] = std::to_string(splitSize);
        c[keys::splitWalk] = walk;
        c[keys::splitRemainder] = remainder;
        c[keys::where] = where;
        return Options(c);
    }

    MemoryStore store(std::size_t items)
    {
        return MemoryStore("events", MemoryStore::makeItems(items));
    }

    // Index of the first row a split's token resumes at.
    std::uint64_t firstRow(MemoryStore& s, const Split& split)
    {
        const QueryResult page(s.select(WhereClause(), Limit(1), split.token()).value());
        REQUIRE(page.items.size() == 1);
        return std::stoull(page.items.front().attributes.at("index"));
    }

    void checkCoverage(
            const std::vector<Split>& splits,
            std::uint64_t total,
            std::uint64_t splitSize)
    {
        REQUIRE_FALSE(splits.empty());
        CHECK(splits.front().startRow() == 0);
        CHECK(splits.back().endRow() == total);

        for (std::size_t i(0); i + 1 < splits.size(); ++i)
        {
            CHECK(splits[i].endRow() == splits[i + 1].startRow());
        }

        for (const Split& s : splits) CHECK(s.length() <= splitSize);
    }
}

TEST_CASE("Splits cover the domain without gaps or overlaps", "[planner]")
{
    const std::uint64_t sizes[] = { 1, 3, 10, 25, 100 };
    const std::size_t totals[] = { 0, 1, 9, 10, 11, 99, 100, 101, 250 };

    for (const std::uint64_t size : sizes)
    {
        for (const std::size_t total : totals)
        {
            MemoryStore s(store(total));
            SplitPlanner planner(s, options(size));

            const std::vector<Split> splits(planner.plan());
            checkCoverage(splits, total, size);

            const std::uint64_t expected(
                    total ? (total + size - 1) / size : 1);
            CHECK(splits.size() == expected);
        }
    }
}

TEST_CASE("An empty domain plans one empty split", "[planner]")
{
    MemoryStore s(store(0));
    SplitPlanner planner(s, options(100));

    const std::vector<Split> splits(planner.plan());

    REQUIRE(splits.size() == 1);
    CHECK(splits[0].startRow() == 0);
    CHECK(splits[0].endRow() == 0);
    CHECK_FALSE(splits[0].token());
    CHECK(s.countCalls() == 0);
}

TEST_CASE("A domain of exactly one split size", "[planner]")
{
    MemoryStore s(store(100));
    SplitPlanner planner(s, options(100));

    const std::vector<Split> splits(planner.plan());

    REQUIRE(splits.size() == 1);
    CHECK(splits[0] == Split(0, 100));
    CHECK(s.countCalls() == 0);
    CHECK(s.metadataCalls() == 1);
}

TEST_CASE("One row past the split size adds a short split", "[planner]")
{
    MemoryStore s(store(101));
    SplitPlanner planner(s, options(100));

    const std::vector<Split> splits(planner.plan());

    REQUIRE(splits.size() == 2);
    CHECK(splits[0] == Split(0, 100));
    CHECK(splits[1].startRow() == 100);
    CHECK(splits[1].endRow() == 101);
    CHECK(splits[1].length() < 100);
    REQUIRE(splits[1].token());
    CHECK(firstRow(s, splits[1]) == 100);
}

TEST_CASE("Absorbing the remainder", "[planner]")
{
    SECTION("The last split grows")
    {
        MemoryStore s(store(250));
        SplitPlanner planner(s, options(100, "incremental", "absorb"));

        const std::vector<Split> splits(planner.plan());

        REQUIRE(splits.size() == 2);
        CHECK(splits[0] == Split(0, 100));
        CHECK(splits[1].startRow() == 100);
        CHECK(splits[1].endRow() == 250);
    }

    SECTION("Small domains still get one split")
    {
        MemoryStore s(store(40));
        SplitPlanner planner(s, options(100, "incremental", "absorb"));

        const std::vector<Split> splits(planner.plan());

        REQUIRE(splits.size() == 1);
        CHECK(splits[0] == Split(0, 40));
    }

    SECTION("Even division is unaffected")
    {
        MemoryStore s(store(300));
        SplitPlanner planner(s, options(100, "incremental", "absorb"));

        const std::vector<Split> splits(planner.plan());

        REQUIRE(splits.size() == 3);
        CHECK(splits[2] == Split(200, 300, splits[2].token()));
    }
}

TEST_CASE("Tokens resume at each split's first row", "[planner]")
{
    MemoryStore s(store(95));
    SplitPlanner planner(s, options(20));

    const std::vector<Split> splits(planner.plan());
    REQUIRE(splits.size() == 5);

    CHECK_FALSE(splits[0].token());
    for (std::size_t i(1); i < splits.size(); ++i)
    {
        REQUIRE(splits[i].token());
        CHECK(firstRow(s, splits[i]) == splits[i].startRow());
    }
}

TEST_CASE("Walk modes plan identical splits", "[planner]")
{
    for (const std::size_t total : { 0, 7, 60, 61, 333 })
    {
        MemoryStore a(store(total));
        MemoryStore b(store(total));

        SplitPlanner incremental(a, options(30, "incremental"));
        SplitPlanner restart(b, options(30, "restart"));

        CHECK(incremental.plan() == restart.plan());
    }
}

TEST_CASE("The incremental walk counts each boundary once", "[planner]")
{
    MemoryStore a(store(1000));
    SplitPlanner incremental(a, options(100, "incremental"));
    CHECK(incremental.plan().size() == 10);
    CHECK(incremental.walkQueries() == 9);
    CHECK(a.countCalls() == 9);

    // Restarting walks 1 + 2 + ... + 9 pages.
    MemoryStore b(store(1000));
    SplitPlanner restart(b, options(100, "restart"));
    CHECK(restart.plan().size() == 10);
    CHECK(restart.walkQueries() == 45);
    CHECK(b.countCalls() == 45);

    for (const Limit& limit : a.countLimits())
    {
        REQUIRE(limit);
        CHECK(*limit == 100);
    }
}

TEST_CASE("Short count pages do not overshoot a boundary", "[planner]")
{
    MemoryStore s(store(230));
    s.countPageSize(30);

    SplitPlanner planner(s, options(100));
    const std::vector<Split> splits(planner.plan());

    REQUIRE(splits.size() == 3);
    CHECK(firstRow(s, splits[1]) == 100);
    CHECK(firstRow(s, splits[2]) == 200);

    // 30 + 30 + 30 + 10 rows to reach row 100, the same again for row 200.
    CHECK(planner.walkQueries() == 8);
    REQUIRE(s.countLimits().size() == 8);
    CHECK(*s.countLimits()[3] == 10);
}

TEST_CASE("Boundary tokens from the start of the domain", "[planner]")
{
    MemoryStore s(store(50));
    SplitPlanner planner(s, options(10));

    CHECK_FALSE(planner.boundaryToken(0, 10));
    CHECK(s.countCalls() == 0);

    const Token token(planner.boundaryToken(3, 10));
    REQUIRE(token);
    CHECK(s.countCalls() == 3);
    CHECK(firstRow(s, Split(30, 40, token)) == 30);
}

TEST_CASE("Where clauses are counted rather than read from metadata", "[planner]")
{
    MemoryStore s(store(100));
    s.where("parity = 'even'", [](const Record& r)
    {
        return r.attributes.at("parity") == "even";
    });
    s.countPageSize(7);

    SplitPlanner planner(
            s,
            options(20, "incremental", "split", "parity = 'even'"));

    CHECK(planner.totalItems() == 50);
    CHECK(s.metadataCalls() == 0);

    const std::vector<Split> splits(planner.plan());
    checkCoverage(splits, 50, 20);
    REQUIRE(splits.size() == 3);

    const QueryResult page(
            s.select(
                WhereClause(std::string("parity = 'even'")),
                Limit(1),
                splits[2].token()).value());
    REQUIRE(page.items.size() == 1);
    CHECK(page.items[0].attributes.at("index") == "80");
}

TEST_CASE("A failed count aborts planning", "[planner]")
{
    Failure failure(FailureKind::RemoteRejected, "Request throttled");
    failure.httpStatus = 503;
    failure.errorCode = "ServiceUnavailable";

    SECTION("Mid-walk")
    {
        MemoryStore s(store(500));
        s.failAt(3, failure);
        SplitPlanner planner(s, options(100));

        std::vector<Split> splits;
        try
        {
            splits = planner.plan();
            FAIL("Expected planning to fail");
        }
        catch (const StoreError& e)
        {
            CHECK(e.kind() == FailureKind::RemoteRejected);
            CHECK(e.failure().errorCode == "ServiceUnavailable");
        }
        CHECK(splits.empty());
    }

    SECTION("While counting the total")
    {
        MemoryStore s(store(500));
        s.where("x", [](const Record&) { return true; });
        s.failAt(1, Failure(FailureKind::TransportFailure, "Timeout"));
        SplitPlanner planner(s, options(100, "incremental", "split", "x"));

        CHECK_THROWS_AS(planner.plan(), StoreError);
    }

    SECTION("Nothing is planned after a failure")
    {
        MemoryStore s(store(500));
        s.failAt(1, failure);
        SplitPlanner planner(s, options(100, "restart"));

        CHECK_THROWS_AS(planner.plan(), StoreError);
        CHECK(s.countCalls() == 1);
    }
}

TEST_CASE("Inconsistent counts abort planning", "[planner]")
{
    SECTION("Missing Count attribute")
    {
        MemoryStore s(store(300));
        s.dropCountAttribute(true);
        SplitPlanner planner(s, options(100));

        try
        {
            planner.plan();
            FAIL("Expected planning to fail");
        }
        catch (const StoreError& e)
        {
            CHECK(e.kind() == FailureKind::Inconsistent);
        }
    }

    SECTION("Token chain ends before the boundary")
    {
        MemoryStore s(store(300));
        s.fixedCount(40);
        SplitPlanner planner(s, options(100));

        try
        {
            planner.plan();
            FAIL("Expected planning to fail");
        }
        catch (const StoreError& e)
        {
            CHECK(e.kind() == FailureKind::Inconsistent);
        }
    }
}
