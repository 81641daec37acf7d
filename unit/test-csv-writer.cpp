#include <catch2/catch.hpp>

#include <sstream>

#include <sdbsplit/csv-writer.hpp>

using namespace sdbsplit;

TEST_CASE("Values follow the key in attribute name order", "[csv]")
{
    std::ostringstream out;
    CsvWriter writer(out);

    Attributes attributes;
    attributes["size"] = "12";
    attributes["color"] = "red";
    writer.write("item-1", attributes);
    writer.write(Record("item-2", Attributes()));

    CHECK(out.str() == "item-1,red,12\nitem-2\n");
    CHECK(writer.rows() == 2);
}

TEST_CASE("Headers select the columns", "[csv]")
{
    std::ostringstream out;
    CsvWriter writer(out, { "id", "size", "color" });

    Attributes attributes;
    attributes["color"] = "blue";
    attributes["weight"] = "3";
    writer.write("item-7", attributes);

    CHECK(out.str() == "id,size,color\nitem-7,,blue\n");
    CHECK(writer.rows() == 1);
}

TEST_CASE("Escaping", "[csv]")
{
    CHECK(CsvWriter::escape("plain") == "plain");
    CHECK(CsvWriter::escape("") == "");
    CHECK(CsvWriter::escape("a,b") == "\"a,b\"");
    CHECK(CsvWriter::escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(CsvWriter::escape("two\nlines") == "\"two\nlines\"");
    CHECK(CsvWriter::escape("cr\r") == "\"cr\r\"");

    std::ostringstream out;
    CsvWriter writer(out);

    Attributes attributes;
    attributes["note"] = "x, y";
    writer.write("key", attributes);
    CHECK(out.str() == "key,\"x, y\"\n");
}
