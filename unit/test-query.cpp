#include <catch2/catch.hpp>

#include <sdbsplit/query.hpp>

using namespace sdbsplit;

TEST_CASE("Select queries", "[query]")
{
    CHECK(buildQuery("logs", WhereClause(), QueryPlan::select()) ==
            "SELECT * FROM logs");

    CHECK(buildQuery("logs", WhereClause(), QueryPlan::select(Limit(2500))) ==
            "SELECT * FROM logs LIMIT 2500");

    CHECK(buildQuery(
                "logs",
                WhereClause(std::string("level = 'error'")),
                QueryPlan::select(Limit(10))) ==
            "SELECT * FROM logs WHERE level = 'error' LIMIT 10");
}

TEST_CASE("Count queries", "[query]")
{
    CHECK(buildQuery("logs", WhereClause(), QueryPlan::count()) ==
            "SELECT COUNT(*) FROM logs");

    CHECK(buildQuery(
                "logs",
                WhereClause(std::string("year > '2010'")),
                QueryPlan::count(Limit(100000))) ==
            "SELECT COUNT(*) FROM logs WHERE year > '2010' LIMIT 100000");
}

TEST_CASE("Empty where clauses and zero limits are omitted", "[query]")
{
    CHECK(buildQuery("logs", WhereClause(std::string()), QueryPlan::count()) ==
            "SELECT COUNT(*) FROM logs");

    CHECK(buildQuery("logs", WhereClause(), QueryPlan::select(Limit(0))) ==
            "SELECT * FROM logs");
}

TEST_CASE("Domain quoting", "[query]")
{
    CHECK(quoteDomain("events_2014$") == "events_2014$");
    CHECK(quoteDomain("my-domain") == "`my-domain`");
    CHECK(quoteDomain("odd`name") == "`odd``name`");
    CHECK(quoteDomain("") == "``");

    CHECK(buildQuery("web.logs", WhereClause(), QueryPlan::count()) ==
            "SELECT COUNT(*) FROM `web.logs`");
}
