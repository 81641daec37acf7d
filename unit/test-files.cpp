#include <catch2/catch.hpp>

#include <string>

#include <boost/filesystem.hpp>

#include <sdbsplit/files.hpp>

#include "temp-dir.hpp"

using namespace sdbsplit;

using sdbsplit::test::TempDir;
using sdbsplit::test::readText;
using sdbsplit::test::writeText;

namespace fs = boost::filesystem;

TEST_CASE("Files are merged in name order", "[files]")
{
    TempDir dir;
    writeText(dir.path("part-2.csv"), "c\n");
    writeText(dir.path("part-0.csv"), "a\n");
    writeText(dir.path("part-1.csv"), "b1\nb2\n");
    writeText(dir.path("empty.csv"), "");
    fs::create_directories(dir.path("nested"));
    writeText(dir.path("nested/skipped.csv"), "nested\n");

    TempDir out;
    const std::string output(out.path("merged.csv"));

    CHECK(mergeFiles(dir.str(), output) == 4);
    CHECK(readText(output) == "a\nb1\nb2\nc\n");
}

TEST_CASE("The output file is not merged into itself", "[files]")
{
    TempDir dir;
    writeText(dir.path("a.csv"), "a\n");
    writeText(dir.path("merged.csv"), "stale\n");

    CHECK(mergeFiles(dir.str(), dir.path("merged.csv")) == 1);
    CHECK(readText(dir.path("merged.csv")) == "a\n");
}

TEST_CASE("Merge input must be a directory", "[files]")
{
    TempDir dir;
    writeText(dir.path("file.csv"), "a\n");

    try
    {
        mergeFiles(dir.path("missing"), dir.path("out.csv"));
        FAIL("Expected a missing directory to throw");
    }
    catch (const FileError& e)
    {
        CHECK(e.kind() == FileError::Kind::NotFound);
    }

    try
    {
        mergeFiles(dir.path("file.csv"), dir.path("out.csv"));
        FAIL("Expected a regular file to throw");
    }
    catch (const FileError& e)
    {
        CHECK(e.kind() == FileError::Kind::NotADirectory);
    }
}
