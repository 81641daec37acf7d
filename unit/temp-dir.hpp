#pragma once

#include <fstream>
#include <sstream>
#include <string>

#include <boost/filesystem.hpp>

namespace sdbsplit
{
namespace test
{

// A uniquely named directory under the system temp path, removed with its
// contents on destruction.
class TempDir
{
public:
    TempDir()
        : m_path(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("sdbsplit-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(m_path);
    }

    ~TempDir()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(m_path, ec);
    }

    std::string path(const std::string& name) const
    {
        return (m_path / name).string();
    }

    std::string str() const { return m_path.string(); }

private:
    boost::filesystem::path m_path;
};

inline void writeText(const std::string& path, const std::string& text)
{
    std::ofstream file(path, std::ofstream::binary);
    file << text;
}

inline std::string readText(const std::string& path)
{
    std::ifstream file(path, std::ifstream::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace test
} // namespace sdbsplit
