#pragma once

#include <string>
#include <vector>

#include <sdbsplit/configuration.hpp>

namespace sdbsplit
{
namespace test
{

// Owns the argv storage for one parsed command line.
class CommandLine
{
public:
    CommandLine(std::vector<std::string> args)
        : m_args(args)
    {
        m_argv.push_back(const_cast<char*>("sdbsplit"));
        for (auto& a : m_args) m_argv.push_back(&a[0]);
    }

    Configuration parse()
    {
        return Configuration(static_cast<int>(m_argv.size()), m_argv.data());
    }

private:
    std::vector<std::string> m_args;
    std::vector<char*> m_argv;
};

} // namespace test
} // namespace sdbsplit
