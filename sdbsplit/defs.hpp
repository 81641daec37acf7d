#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace sdbsplit
{

// Opaque continuation token handed out by the store.  An empty optional
// means "start of the domain" on input and "no further pages" on output.
using Token = boost::optional<std::string>;

using WhereClause = boost::optional<std::string>;
using Limit = boost::optional<std::uint64_t>;

using Attributes = std::map<std::string, std::string>;
using ConfigMap = std::map<std::string, std::string>;

using Data = std::vector<char>;
using Paths = std::vector<std::string>;

struct Record
{
    Record() { }

    Record(std::string key, Attributes attributes)
        : key(key)
        , attributes(attributes)
    { }

    std::string key;
    Attributes attributes;
};

using Records = std::vector<Record>;

struct QueryResult
{
    Records items;
    Token nextToken;
};

class ConfigError : public std::runtime_error
{
public:
    ConfigError(std::string message)
        : std::runtime_error(message)
    { }
};

using TimePoint = std::chrono::high_resolution_clock::time_point;

inline TimePoint getNow()
{
    return std::chrono::high_resolution_clock::now();
}

inline double secondsSince(TimePoint start)
{
    std::chrono::duration<double> d(getNow() - start);
    return d.count();
}

} // namespace sdbsplit
