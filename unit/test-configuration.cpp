#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sdbsplit/configuration.hpp>
#include <sdbsplit/options.hpp>

#include "command-line.hpp"

using namespace sdbsplit;
using sdbsplit::test::CommandLine;

namespace
{
    std::string tempPath(const std::string& name)
    {
        return "sdbsplit-test-" + name;
    }
}

TEST_CASE("Properties files", "[configuration]")
{
    std::istringstream in(
            "# SimpleDB credentials\n"
            "simpledb.aws.accessKey = AKIDEXAMPLE\n"
            "! alternative comment\n"
            "\n"
            "simpledb.aws.secretKey=a=b=c\n"
            "simpledb.domain: events\n"
            "simpledb.wherequery = status = 'active'\n"
            "   csv.header.fields   =   id,name   \n");

    const ConfigMap map(Configuration::fromProperties(in));

    CHECK(map.size() == 5);
    CHECK(map.at("simpledb.aws.accessKey") == "AKIDEXAMPLE");
    CHECK(map.at("simpledb.aws.secretKey") == "a=b=c");
    CHECK(map.at("simpledb.domain") == "events");
    CHECK(map.at("simpledb.wherequery") == "status = 'active'");
    CHECK(map.at("csv.header.fields") == "id,name");
}

TEST_CASE("Properties lines need a key", "[configuration]")
{
    std::istringstream in("= value\n");
    CHECK_THROWS_AS(Configuration::fromProperties(in), ConfigError);
}

TEST_CASE("JSON files are flattened", "[configuration]")
{
    const ConfigMap map(Configuration::fromJson(R"({
        "simpledb": {
            "aws": { "accessKey": "AKIDEXAMPLE", "secretKey": "secret" },
            "domain": "events",
            "split": { "size": 2500, "walk": "restart" },
            "consistentRead": true
        },
        "csv.header.fields": ["id", "name"],
        "ignored": null
    })"));

    CHECK(map.size() == 7);
    CHECK(map.at("simpledb.aws.accessKey") == "AKIDEXAMPLE");
    CHECK(map.at("simpledb.aws.secretKey") == "secret");
    CHECK(map.at("simpledb.domain") == "events");
    CHECK(map.at("simpledb.split.size") == "2500");
    CHECK(map.at("simpledb.split.walk") == "restart");
    CHECK(map.at("simpledb.consistentRead") == "true");
    CHECK(map.at("csv.header.fields") == "id,name");

    const Options options(map);
    CHECK(options.splitSize() == 2500);
    CHECK(options.walk() == BoundaryWalk::Restart);
    CHECK(options.consistentRead());
}

TEST_CASE("Invalid JSON", "[configuration]")
{
    CHECK_THROWS_AS(Configuration::fromJson("{ \"a\": "), ConfigError);
    CHECK_THROWS_AS(Configuration::fromJson("[1, 2]"), ConfigError);
}

TEST_CASE("Command and positional arguments", "[configuration]")
{
    CommandLine line({
            "read", "split-3.bin", "out.csv",
            "-D", "simpledb.domain=events",
            "-Dsimpledb.split.size=10",
            "-v" });

    const Configuration config(line.parse());

    CHECK(config.command() == "read");
    CHECK(config.positional() ==
            std::vector<std::string>({ "split-3.bin", "out.csv" }));

    CHECK(config.map().at("simpledb.domain") == "events");
    CHECK(config.map().at("simpledb.split.size") == "10");
    CHECK(config.map().at("simpledb.verbose") == "true");
}

TEST_CASE("Overrides win over the config file", "[configuration]")
{
    const std::string path(tempPath("config.properties"));
    {
        std::ofstream file(path);
        file << "simpledb.domain=events\nsimpledb.split.size=500\n";
    }

    CommandLine line({ "plan", "out", "-c", path, "-D", "simpledb.split.size=20" });
    const Configuration config(line.parse());

    CHECK(config.command() == "plan");
    CHECK(config.map().at("simpledb.domain") == "events");
    CHECK(config.map().at("simpledb.split.size") == "20");

    std::remove(path.c_str());
}

TEST_CASE("JSON config files are detected by content", "[configuration]")
{
    const std::string path(tempPath("config.conf"));
    {
        std::ofstream file(path);
        file << "\n  { \"simpledb\": { \"domain\": \"events\" } }\n";
    }

    CommandLine line({ "count", "-c", path });
    CHECK(line.parse().map().at("simpledb.domain") == "events");

    std::remove(path.c_str());
}

TEST_CASE("Configuration errors", "[configuration]")
{
    CommandLine missingFile({ "count", "-c", tempPath("does-not-exist") });
    CHECK_THROWS_AS(missingFile.parse(), ConfigError);

    CommandLine missingValue({ "count", "-c" });
    CHECK_THROWS_AS(missingValue.parse(), ConfigError);

    CommandLine badOverride({ "count", "-D", "=x" });
    CHECK_THROWS_AS(badOverride.parse(), ConfigError);
}
