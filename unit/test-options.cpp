#include <catch2/catch.hpp>

#include <boost/optional/optional_io.hpp>

#include <sdbsplit/options.hpp>

using namespace sdbsplit;

namespace
{
    ConfigMap minimal()
    {
        ConfigMap config;
        config[keys::accessKey] = "AKIDEXAMPLE";
        config[keys::secretKey] = "secret";
        config[keys::domain] = "events";
        return config;
    }
}

TEST_CASE("Defaults", "[options]")
{
    const Options options(minimal());

    CHECK(options.accessKey() == "AKIDEXAMPLE");
    CHECK(options.secretKey() == "secret");
    CHECK(options.domain() == "events");
    CHECK_FALSE(options.where());

    CHECK(options.endpoint().scheme == "https");
    CHECK(options.endpoint().host == "sdb.amazonaws.com");
    CHECK(options.endpoint().url() == "https://sdb.amazonaws.com/");

    CHECK(options.splitSize() == 100000);
    CHECK(options.walk() == BoundaryWalk::Incremental);
    CHECK(options.remainder() == RemainderPolicy::Split);

    CHECK_FALSE(options.consistentRead());
    CHECK(options.connectTimeout() == 10);
    CHECK(options.timeout() == 60);
    CHECK_FALSE(options.verbose());
    CHECK(options.csvHeaders().empty());
}

TEST_CASE("Required keys", "[options]")
{
    for (const std::string key : { keys::accessKey, keys::secretKey, keys::domain })
    {
        ConfigMap config(minimal());

        config.erase(key);
        CHECK_THROWS_AS(Options(config), ConfigError);

        config[key] = "   ";
        CHECK_THROWS_AS(Options(config), ConfigError);
    }
}

TEST_CASE("Split size", "[options]")
{
    ConfigMap config(minimal());

    config[keys::splitSize] = "2500";
    CHECK(Options(config).splitSize() == 2500);

    config[keys::splitSize] = " 40 ";
    CHECK(Options(config).splitSize() == 40);

    config[keys::splitSize] = "100001";
    CHECK(Options(config).splitSize() == 100000);

    config[keys::splitSize] = "5000000000";
    CHECK(Options(config).splitSize() == 100000);

    config[keys::splitSize] = "0";
    CHECK_THROWS_AS(Options(config), ConfigError);

    config[keys::splitSize] = "-5";
    CHECK_THROWS_AS(Options(config), ConfigError);

    config[keys::splitSize] = "lots";
    CHECK_THROWS_AS(Options(config), ConfigError);
}

TEST_CASE("Where clause", "[options]")
{
    ConfigMap config(minimal());

    config[keys::where] = "  ";
    CHECK_FALSE(Options(config).where());

    config[keys::where] = "status = 'active'";
    REQUIRE(Options(config).where());
    CHECK(*Options(config).where() == "status = 'active'");
}

TEST_CASE("Planning modes", "[options]")
{
    ConfigMap config(minimal());

    config[keys::splitWalk] = "Restart";
    config[keys::splitRemainder] = "absorb";
    const Options options(config);
    CHECK(options.walk() == BoundaryWalk::Restart);
    CHECK(options.remainder() == RemainderPolicy::Absorb);

    config[keys::splitWalk] = "sideways";
    CHECK_THROWS_AS(Options(config), ConfigError);

    config[keys::splitWalk] = "incremental";
    config[keys::splitRemainder] = "drop";
    CHECK_THROWS_AS(Options(config), ConfigError);
}

TEST_CASE("Flags and timeouts", "[options]")
{
    ConfigMap config(minimal());
    config[keys::consistentRead] = "TRUE";
    config[keys::verbose] = "yes";
    config[keys::connectTimeout] = "3";
    config[keys::timeout] = "30";
    config[keys::csvHeaders] = "id, name ,size";

    const Options options(config);
    CHECK(options.consistentRead());
    CHECK(options.verbose());
    CHECK(options.connectTimeout() == 3);
    CHECK(options.timeout() == 30);
    CHECK(options.csvHeaders() ==
            std::vector<std::string>({ "id", "name", "size" }));

    config[keys::consistentRead] = "maybe";
    CHECK_THROWS_AS(Options(config), ConfigError);
    config[keys::consistentRead] = "false";

    SECTION("A zero timeout would disable it")
    {
        config[keys::timeout] = "0";
        CHECK_THROWS_AS(Options(config), ConfigError);

        config[keys::timeout] = "30";
        config[keys::connectTimeout] = "0";
        CHECK_THROWS_AS(Options(config), ConfigError);
    }

    SECTION("Timeouts must fit in a long")
    {
        config[keys::connectTimeout] = "9999999999999999999";
        CHECK_THROWS_AS(Options(config), ConfigError);

        config[keys::connectTimeout] = "3";
        config[keys::timeout] = "9999999999999999999";
        CHECK_THROWS_AS(Options(config), ConfigError);
    }
}

TEST_CASE("Endpoints", "[options]")
{
    CHECK(parseEndpoint("").host == "sdb.amazonaws.com");
    CHECK(parseEndpoint("us-east-1").host == "sdb.amazonaws.com");
    CHECK(parseEndpoint("eu-west-1").host == "sdb.eu-west-1.amazonaws.com");
    CHECK(parseEndpoint("sdb.ap-southeast-2.amazonaws.com").host ==
            "sdb.ap-southeast-2.amazonaws.com");

    const Endpoint local(parseEndpoint("http://localhost:8080/"));
    CHECK(local.scheme == "http");
    CHECK(local.host == "localhost:8080");
    CHECK(local.url() == "http://localhost:8080/");

    CHECK_THROWS_AS(parseEndpoint("ftp://sdb.amazonaws.com"), ConfigError);
    CHECK_THROWS_AS(parseEndpoint("https://"), ConfigError);

    ConfigMap config(minimal());
    config[keys::region] = "us-west-2";
    CHECK(Options(config).endpoint().url() ==
            "https://sdb.us-west-2.amazonaws.com/");
}
