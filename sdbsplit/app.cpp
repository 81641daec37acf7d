#include <sdbsplit/app.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <boost/filesystem.hpp>

#include <sdbsplit/csv-writer.hpp>
#include <sdbsplit/files.hpp>
#include <sdbsplit/simpledb-client.hpp>
#include <sdbsplit/split-planner.hpp>
#include <sdbsplit/split-reader.hpp>
#include <sdbsplit/unique.hpp>
#include <sdbsplit/util/color.hpp>

namespace sdbsplit
{

namespace
{

std::unique_ptr<StoreClient> makeSimpleDb(const Options& options)
{
    return std::unique_ptr<StoreClient>(new SimpleDbClient(options));
}

Data readFile(const std::string& path)
{
    std::ifstream file(path, std::ifstream::in | std::ifstream::binary);
    if (!file.good())
    {
        throw FileError(FileError::Kind::NotFound, "Could not read " + path);
    }

    return Data(
            (std::istreambuf_iterator<char>(file)),
            std::istreambuf_iterator<char>());
}

void writeFile(const std::string& path, const Data& data)
{
    std::ofstream file(path, std::ofstream::binary | std::ofstream::trunc);
    file.write(data.data(), data.size());
    if (!file)
    {
        throw FileError(FileError::Kind::Io, "Could not write " + path);
    }
}

const std::size_t progressInterval(10000);

// Zero padded so that name order is split order.
std::string splitFileName(const std::size_t i)
{
    char name[32];
    std::snprintf(name, sizeof(name), "split-%05zu.bin", i);
    return name;
}

bool isSplitFile(const boost::filesystem::path& path)
{
    const std::string name(path.filename().string());
    return
        name.compare(0, 6, "split-") == 0 &&
        path.extension().string() == ".bin";
}

// Split files from an earlier plan would describe stale row ranges.
std::size_t removeSplitFiles(const std::string& dir)
{
    namespace fs = boost::filesystem;

    std::vector<fs::path> stale;
    for (fs::directory_iterator it(dir), end; it != end; ++it)
    {
        if (fs::is_regular_file(it->status()) && isSplitFile(it->path()))
        {
            stale.push_back(it->path());
        }
    }

    for (const fs::path& p : stale) fs::remove(p);
    return stale.size();
}

} // unnamed namespace

App::App(const Configuration& config, ClientFactory factory)
    : m_config(config)
    , m_factory(factory ? factory : ClientFactory(makeSimpleDb))
    , m_options()
{ }

std::string App::usage()
{
    return
        "Usage: sdbsplit <command> [args] [-c config] [-D key=value]... [-v]\n"
        "Commands:\n"
        "\tplan <dir>                 Replace the split-<n>.bin files in <dir>\n"
        "\tread <split-file> <output> Write the records of a split as CSV\n"
        "\tcount                      Print the number of matching items\n"
        "\tunique <attribute>         Print value,count for one attribute\n"
        "\tmerge <dir> <output>       Concatenate the files of a directory\n";
}

void App::run(std::ostream& out)
{
    const std::string& command(m_config.command());

    if (command == "plan") plan();
    else if (command == "read") read();
    else if (command == "count") count(out);
    else if (command == "unique") unique(out);
    else if (command == "merge") merge();
    else if (command.empty()) throw ConfigError("No command given");
    else throw ConfigError("Unknown command: " + command);
}

const Options& App::options()
{
    if (!m_options) m_options.reset(new Options(m_config.map()));
    return *m_options;
}

const std::string& App::arg(const std::size_t i, const std::string& name) const
{
    const Configuration::Args& args(m_config.positional());
    if (i >= args.size())
    {
        throw ConfigError(
                "Missing argument <" + name + "> for " + m_config.command());
    }
    return args[i];
}

void App::plan()
{
    const std::string& dir(arg(0, "dir"));

    auto client(m_factory(options()));
    SplitPlanner planner(*client, options());
    const std::vector<Split> splits(planner.plan());

    boost::filesystem::create_directories(dir);

    if (const std::size_t removed = removeSplitFiles(dir))
    {
        std::cerr << "Removed " << removed << " split files of an earlier " <<
            "plan from " << dir << std::endl;
    }

    for (std::size_t i(0); i < splits.size(); ++i)
    {
        const std::string path(
                (boost::filesystem::path(dir) / splitFileName(i)).string());

        writeFile(path, splits[i].serialize());
        std::cerr << "\t" << path << ": " << splits[i].toString() << std::endl;
    }

    std::cerr << color(
            "Wrote " + std::to_string(splits.size()) + " splits to " + dir,
            Color::Green) << std::endl;
}

void App::read()
{
    const std::string& input(arg(0, "split-file"));
    const std::string& output(arg(1, "output"));

    const Split split(Split::deserialize(readFile(input)));
    std::cerr << "Reading " << split.toString() << std::endl;

    const auto start(getNow());
    SplitReader reader(split, m_factory(options()), options().where());

    std::ofstream file(output, std::ofstream::binary | std::ofstream::trunc);
    if (!file)
    {
        throw FileError(FileError::Kind::Io, "Could not open " + output);
    }

    CsvWriter writer(file, options().csvHeaders());

    std::string key;
    Attributes attributes;

    while (reader.next(key, attributes))
    {
        writer.write(key, attributes);

        if (writer.rows() % progressInterval == 0)
        {
            std::cerr << "\t" << writer.rows() << " records (" <<
                static_cast<int>(reader.progress() * 100) << "%)" << std::endl;
        }
    }

    reader.close();

    file.flush();
    if (!file)
    {
        throw FileError(FileError::Kind::Io, "Failed writing " + output);
    }

    std::cerr << color(
            "Wrote " + std::to_string(writer.rows()) + " records to " + output,
            Color::Green) << std::endl;
    std::cerr << "\tElapsed: " << secondsSince(start) << "s" << std::endl;
}

void App::count(std::ostream& out)
{
    auto client(m_factory(options()));
    SplitPlanner planner(*client, options());
    out << planner.totalItems() << std::endl;
}

void App::unique(std::ostream& out)
{
    const std::string& attribute(arg(0, "attribute"));

    auto client(m_factory(options()));
    const ValueCounts counts(
            uniqueValueCounts(*client, options().where(), attribute));

    for (const auto& c : counts)
    {
        out << CsvWriter::escape(c.first) << "," << c.second << std::endl;
    }
}

void App::merge()
{
    const std::string& dir(arg(0, "dir"));
    const std::string& output(arg(1, "output"));

    const std::size_t merged(mergeFiles(dir, output));
    std::cerr << "Merged " << merged << " files into " << output << std::endl;
}

} // namespace sdbsplit
