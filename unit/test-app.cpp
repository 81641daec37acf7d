#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <sdbsplit/app.hpp>
#include <sdbsplit/files.hpp>
#include <sdbsplit/split.hpp>

#include "command-line.hpp"
#include "memory-store.hpp"
#include "temp-dir.hpp"

using namespace sdbsplit;

using sdbsplit::test::CommandLine;
using sdbsplit::test::MemoryStore;
using sdbsplit::test::TempDir;
using sdbsplit::test::readText;
using sdbsplit::test::writeText;

namespace
{
    std::vector<std::string> args(std::vector<std::string> command)
    {
        const std::vector<std::string> credentials {
            "-D", "simpledb.aws.accessKey=AKIDEXAMPLE",
            "-D", "simpledb.aws.secretKey=secret",
            "-D", "simpledb.domain=events"
        };

        command.insert(command.end(), credentials.begin(), credentials.end());
        return command;
    }

    App::ClientFactory factory(const MemoryStore& store)
    {
        return [store](const Options&)
        {
            return std::unique_ptr<StoreClient>(new MemoryStore(store));
        };
    }

    MemoryStore parityStore(std::size_t items)
    {
        MemoryStore store("events", MemoryStore::makeItems(items));
        store.where("parity = 'odd'", [](const Record& r)
        {
            return r.attributes.at("parity") == "odd";
        });
        return store;
    }

    // Points a standard stream at a buffer for the life of this object.
    class Redirect
    {
    public:
        Redirect(std::ostream& stream, std::ostream& to)
            : m_stream(stream)
            , m_original(stream.rdbuf(to.rdbuf()))
        { }

        ~Redirect() { m_stream.rdbuf(m_original); }

    private:
        std::ostream& m_stream;
        std::streambuf* m_original;
    };

    std::vector<std::string> splitFiles(const std::string& dir)
    {
        std::vector<std::string> names;
        for (boost::filesystem::directory_iterator it(dir), end; it != end; ++it)
        {
            const std::string name(it->path().filename().string());
            if (name.find("split-") == 0) names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    Split readSplit(const std::string& path)
    {
        const std::string text(readText(path));
        return Split::deserialize(Data(text.begin(), text.end()));
    }

    std::string run(const std::vector<std::string>& a, const MemoryStore& store)
    {
        CommandLine line(a);
        App app(line.parse(), factory(store));

        std::ostringstream out;
        app.run(out);
        return out.str();
    }
}

TEST_CASE("Counting", "[app]")
{
    const MemoryStore store(parityStore(25));

    CHECK(run(args({ "count" }), store) == "25\n");

    std::vector<std::string> filtered(args({ "count" }));
    filtered.push_back("-D");
    filtered.push_back("simpledb.wherequery=parity = 'odd'");
    CHECK(run(filtered, store) == "12\n");
}

TEST_CASE("Unique values", "[app]")
{
    const MemoryStore store(parityStore(5));
    CHECK(run(args({ "unique", "parity" }), store) == "even,3\nodd,2\n");
}

TEST_CASE("Plan, read and merge a domain", "[app]")
{
    const MemoryStore store(parityStore(100));
    TempDir dir;

    std::vector<std::string> plan(args({ "plan", dir.path("splits") }));
    plan.push_back("-D");
    plan.push_back("simpledb.split.size=40");
    run(plan, store);

    std::vector<std::string> files;
    for (int i(0); i < 3; ++i)
    {
        const std::string path(
                dir.path("splits/split-0000" + std::to_string(i) + ".bin"));
        REQUIRE(boost::filesystem::exists(path));
        files.push_back(path);
    }
    CHECK_FALSE(boost::filesystem::exists(dir.path("splits/split-00003.bin")));

    boost::filesystem::create_directories(dir.path("csv"));
    for (std::size_t i(0); i < files.size(); ++i)
    {
        run(args({
                "read",
                files[i],
                dir.path("csv/part-" + std::to_string(i) + ".csv") }),
            store);
    }

    CHECK(readText(dir.path("csv/part-0.csv")).find("item-00000,0,even\n") == 0);

    run(args({ "merge", dir.path("csv"), dir.path("all.csv") }), store);

    std::istringstream merged(readText(dir.path("all.csv")));
    std::string line;
    std::size_t n(0);
    while (std::getline(merged, line))
    {
        CHECK(line.find("item-") == 0);
        CHECK(line.find("," + std::to_string(n) + ",") != std::string::npos);
        ++n;
    }
    CHECK(n == 100);
}

TEST_CASE("Re-planning replaces the earlier split files", "[app]")
{
    const MemoryStore store(parityStore(100));
    TempDir dir;
    writeText(dir.path("notes.txt"), "kept\n");

    std::vector<std::string> first(args({ "plan", dir.str() }));
    first.push_back("-Dsimpledb.split.size=40");
    run(first, store);
    REQUIRE(splitFiles(dir.str()).size() == 3);

    std::vector<std::string> second(args({ "plan", dir.str() }));
    second.push_back("-Dsimpledb.split.size=60");
    run(second, store);

    CHECK(splitFiles(dir.str()) ==
            std::vector<std::string>({ "split-00000.bin", "split-00001.bin" }));
    CHECK_FALSE(boost::filesystem::exists(dir.path("split-00002.bin")));
    CHECK(readText(dir.path("notes.txt")) == "kept\n");

    CHECK(readSplit(dir.path("split-00001.bin")).startRow() == 60);
    CHECK(readSplit(dir.path("split-00001.bin")).endRow() == 100);
}

TEST_CASE("Split file names sort in split order", "[app]")
{
    const MemoryStore store(parityStore(100));
    TempDir dir;

    std::vector<std::string> plan(args({ "plan", dir.str() }));
    plan.push_back("-Dsimpledb.split.size=8");
    run(plan, store);

    const std::vector<std::string> names(splitFiles(dir.str()));
    REQUIRE(names.size() == 13);
    CHECK(names[10] == "split-00010.bin");

    for (std::size_t i(0); i < names.size(); ++i)
    {
        CHECK(readSplit(dir.path(names[i])).startRow() == i * 8);
    }
}

TEST_CASE("Only results are written to stdout", "[app]")
{
    const MemoryStore store(parityStore(25));
    TempDir dir;
    writeText(dir.path("sdbsplit.properties"), "simpledb.wherequery=parity = 'odd'\n");

    std::vector<std::string> a(args({ "count", "-c", dir.path("sdbsplit.properties") }));
    a.push_back("-v");

    std::ostringstream out;
    std::ostringstream log;
    {
        Redirect stdoutToBuffer(std::cout, out);
        Redirect stderrToBuffer(std::cerr, log);

        CommandLine line(a);
        App app(line.parse(), factory(store));
        app.run(std::cout);
    }

    CHECK(out.str() == "12\n");
    CHECK(log.str().find("Using configuration at") != std::string::npos);
}

TEST_CASE("CSV headers choose the read columns", "[app]")
{
    const MemoryStore store(parityStore(3));
    TempDir dir;

    const std::string split(dir.path("split.bin"));
    {
        const Data data(Split(1, 3).serialize());
        std::ofstream file(split, std::ofstream::binary);
        file.write(data.data(), data.size());
    }

    std::vector<std::string> read(args({ "read", split, dir.path("out.csv") }));
    read.push_back("-D");
    read.push_back("csv.header.fields=name,parity");
    run(read, store);

    // The split starts at row 1, but its empty token resumes at the start.
    CHECK(readText(dir.path("out.csv")) ==
            "name,parity\nitem-00000,even\nitem-00001,odd\n");
}

TEST_CASE("Command errors", "[app]")
{
    const MemoryStore store(parityStore(1));

    CHECK_THROWS_AS(run(args({}), store), ConfigError);
    CHECK_THROWS_AS(run(args({ "explode" }), store), ConfigError);
    CHECK_THROWS_AS(run(args({ "plan" }), store), ConfigError);
    CHECK_THROWS_AS(run(args({ "read", "split-0.bin" }), store), ConfigError);
    CHECK_THROWS_AS(run(args({ "unique" }), store), ConfigError);

    CHECK_THROWS_AS(
            run(args({ "read", "no-such-split.bin", "out.csv" }), store),
            FileError);

    CommandLine noCredentials({ "count" });
    App app(noCredentials.parse(), factory(store));
    std::ostringstream out;
    CHECK_THROWS_AS(app.run(out), ConfigError);
}
