#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <sdbsplit/defs.hpp>

namespace sdbsplit
{

namespace keys
{
    extern const std::string accessKey;
    extern const std::string secretKey;
    extern const std::string region;
    extern const std::string domain;
    extern const std::string where;
    extern const std::string splitSize;
    extern const std::string splitWalk;
    extern const std::string splitRemainder;
    extern const std::string consistentRead;
    extern const std::string connectTimeout;
    extern const std::string timeout;
    extern const std::string verbose;
    extern const std::string csvHeaders;
}

// How the planner finds the continuation token at each split boundary.
enum class BoundaryWalk
{
    // Carry the running count and token from one boundary to the next.
    Incremental,

    // Walk from the start of the domain for every boundary.
    Restart
};

// What happens to the rows past the last full split.
enum class RemainderPolicy
{
    // They form one extra, shorter split.
    Split,

    // The last full split grows to cover them.
    Absorb
};

struct Endpoint
{
    std::string scheme;
    std::string host;

    std::string url() const { return scheme + "://" + host + "/"; }
};

class Options
{
public:
    explicit Options(const ConfigMap& config);

    static const std::uint64_t maxSplitSize;
    static const std::string defaultRegion;

    const std::string& accessKey() const { return m_accessKey; }
    const std::string& secretKey() const { return m_secretKey; }
    const Endpoint& endpoint() const { return m_endpoint; }
    const std::string& domain() const { return m_domain; }
    const WhereClause& where() const { return m_where; }

    std::uint64_t splitSize() const { return m_splitSize; }
    BoundaryWalk walk() const { return m_walk; }
    RemainderPolicy remainder() const { return m_remainder; }

    bool consistentRead() const { return m_consistentRead; }
    long connectTimeout() const { return m_connectTimeout; }
    long timeout() const { return m_timeout; }
    bool verbose() const { return m_verbose; }

    const std::vector<std::string>& csvHeaders() const { return m_csvHeaders; }

    const ConfigMap& map() const { return m_map; }

private:
    ConfigMap m_map;

    std::string m_accessKey;
    std::string m_secretKey;
    Endpoint m_endpoint;
    std::string m_domain;
    WhereClause m_where;

    std::uint64_t m_splitSize;
    BoundaryWalk m_walk;
    RemainderPolicy m_remainder;

    bool m_consistentRead;
    long m_connectTimeout;
    long m_timeout;
    bool m_verbose;

    std::vector<std::string> m_csvHeaders;
};

// Accepts a bare host ("sdb.eu-west-1.amazonaws.com"), a URL with scheme
// ("http://localhost:8080"), or a region name ("eu-west-1").
Endpoint parseEndpoint(const std::string& region);

} // namespace sdbsplit
