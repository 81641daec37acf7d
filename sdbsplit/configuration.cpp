#include <sdbsplit/configuration.hpp>

#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>

#include <boost/algorithm/string.hpp>

#include <sdbsplit/options.hpp>

namespace sdbsplit
{

namespace
{

Configuration::Args normalize(int argc, char** argv)
{
    Configuration::Args args;
    for (int i(1); i < argc; ++i)
    {
        std::string arg(argv[i]);

        if (arg.size() > 2 && arg.front() == '-' && std::isalpha(arg[1]))
        {
            // Expand args of the format "-xvalue" to "-x value".
            args.push_back(arg.substr(0, 2));
            args.push_back(arg.substr(2));
        }
        else
        {
            args.push_back(arg);
        }
    }
    return args;
}

bool isFlag(const std::string& arg)
{
    return arg.size() > 1 && arg.front() == '-';
}

std::string valueOf(
        const Configuration::Args& args,
        std::size_t& i,
        const std::string& flag)
{
    if (i + 1 >= args.size() || isFlag(args[i + 1]))
    {
        throw ConfigError("Missing value for " + flag);
    }
    return args[++i];
}

std::pair<std::string, std::string> splitPair(
        const std::string& line,
        const std::string& separators)
{
    const auto pos(line.find_first_of(separators));
    if (pos == std::string::npos)
    {
        return std::make_pair(boost::trim_copy(line), std::string());
    }

    return std::make_pair(
            boost::trim_copy(line.substr(0, pos)),
            boost::trim_copy(line.substr(pos + 1)));
}

} // unnamed namespace

Configuration::Configuration(const int argc, char** argv)
{
    parse(normalize(argc, argv));
}

void Configuration::parse(const Args& args)
{
    std::string configPath;
    ConfigMap overrides;

    for (std::size_t i(0); i < args.size(); ++i)
    {
        const std::string& a(args[i]);

        if (a == "-c") configPath = valueOf(args, i, a);
        else if (a == "-D")
        {
            const auto kv(splitPair(valueOf(args, i, a), "="));
            if (kv.first.empty())
            {
                throw ConfigError("Invalid override: -D " + args[i]);
            }
            overrides[kv.first] = kv.second;
        }
        else if (a == "-v") overrides[keys::verbose] = "true";
        else if (isFlag(a))
        {
            std::cerr << "Ignored argument: " << a << std::endl;
        }
        else if (m_command.empty()) m_command = a;
        else m_positional.push_back(a);
    }

    if (configPath.size())
    {
        std::cerr << "Using configuration at " << configPath << std::endl;
        m_map = fromFile(configPath);
    }

    for (const auto& o : overrides) m_map[o.first] = o.second;
}

ConfigMap Configuration::fromFile(const std::string& path) const
{
    std::ifstream file(path, std::ifstream::in | std::ifstream::binary);
    if (!file.good())
    {
        throw ConfigError("Could not read configuration at " + path);
    }

    std::stringstream ss;
    ss << file.rdbuf();
    const std::string text(ss.str());

    const auto first(text.find_first_not_of(" \t\r\n"));
    if (first != std::string::npos && text[first] == '{')
    {
        return fromJson(text);
    }

    std::istringstream in(text);
    return fromProperties(in);
}

ConfigMap Configuration::fromProperties(std::istream& in)
{
    ConfigMap map;
    std::string line;

    while (std::getline(in, line))
    {
        boost::trim(line);
        if (line.empty() || line.front() == '#' || line.front() == '!')
        {
            continue;
        }

        const auto kv(splitPair(line, "=:"));
        if (kv.first.empty())
        {
            throw ConfigError("Invalid configuration line: " + line);
        }

        map[kv.first] = kv.second;
    }

    return map;
}

ConfigMap Configuration::fromJson(const std::string& text)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value json;
    std::string errors;

    if (!reader->parse(text.data(), text.data() + text.size(), &json, &errors))
    {
        throw ConfigError("Invalid JSON configuration: " + errors);
    }

    if (!json.isObject())
    {
        throw ConfigError("JSON configuration must be an object");
    }

    ConfigMap map;
    flatten(json, "", map);
    return map;
}

void Configuration::flatten(
        const Json::Value& json,
        const std::string& prefix,
        ConfigMap& out)
{
    if (json.isObject())
    {
        for (const std::string& key : json.getMemberNames())
        {
            flatten(
                    json[key],
                    prefix.empty() ? key : prefix + "." + key,
                    out);
        }
    }
    else if (json.isArray())
    {
        std::string joined;
        for (Json::ArrayIndex i(0); i < json.size(); ++i)
        {
            if (i) joined += ",";
            joined += json[i].asString();
        }
        out[prefix] = joined;
    }
    else if (!json.isNull())
    {
        out[prefix] = json.asString();
    }
}

} // namespace sdbsplit
