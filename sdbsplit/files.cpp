#include <sdbsplit/files.hpp>

#include <algorithm>
#include <fstream>
#include <vector>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace sdbsplit
{

namespace
{
    bool sameFile(const fs::path& a, const fs::path& b)
    {
        boost::system::error_code ec;
        const bool same(fs::equivalent(a, b, ec));
        return !ec && same;
    }
}

std::size_t mergeFiles(const std::string& inputDir, const std::string& output)
{
    const fs::path dir(inputDir);

    if (!fs::exists(dir))
    {
        throw FileError(
                FileError::Kind::NotFound,
                "Input directory does not exist: " + inputDir);
    }

    if (!fs::is_directory(dir))
    {
        throw FileError(
                FileError::Kind::NotADirectory,
                "Input path is not a directory: " + inputDir);
    }

    std::ofstream out(output, std::ofstream::binary | std::ofstream::trunc);
    if (!out)
    {
        throw FileError(
                FileError::Kind::Io,
                "Could not open output file: " + output);
    }

    const fs::path outPath(output);

    std::vector<fs::path> inputs;
    for (fs::directory_iterator it(dir), end; it != end; ++it)
    {
        if (!fs::is_regular_file(it->status())) continue;
        if (sameFile(it->path(), outPath)) continue;
        inputs.push_back(it->path());
    }

    std::sort(inputs.begin(), inputs.end());

    for (const fs::path& p : inputs)
    {
        std::ifstream in(p.string(), std::ifstream::binary);
        if (!in)
        {
            throw FileError(
                    FileError::Kind::Io,
                    "Could not read input file: " + p.string());
        }

        if (in.peek() != std::ifstream::traits_type::eof()) out << in.rdbuf();
    }

    out.flush();
    if (!out)
    {
        throw FileError(
                FileError::Kind::Io,
                "Failed writing output file: " + output);
    }

    return inputs.size();
}

} // namespace sdbsplit
