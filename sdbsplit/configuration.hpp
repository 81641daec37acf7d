#pragma once

#include <istream>
#include <string>
#include <vector>

#include <json/json.h>

#include <sdbsplit/defs.hpp>

namespace sdbsplit
{

// Command line of the form:
//      sdbsplit <command> [args...] [-c <config-file>] [-D key=value]... [-v]
//
// The config file is either JSON, whose nested objects are flattened into
// dotted keys, or a properties file of "key=value" lines.  Each -D overrides
// one key after the file is read.
class Configuration
{
public:
    Configuration(int argc, char** argv);

    using Args = std::vector<std::string>;

    const std::string& command() const { return m_command; }
    const Args& positional() const { return m_positional; }
    const ConfigMap& map() const { return m_map; }

    static ConfigMap fromProperties(std::istream& in);
    static ConfigMap fromJson(const std::string& text);

    // Flattens nested objects into "outer.inner" keys.  Arrays become
    // comma-separated values.
    static void flatten(
            const Json::Value& json,
            const std::string& prefix,
            ConfigMap& out);

private:
    void parse(const Args& args);
    ConfigMap fromFile(const std::string& path) const;

    std::string m_command;
    Args m_positional;
    ConfigMap m_map;
};

} // namespace sdbsplit
