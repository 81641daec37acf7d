#include <sdbsplit/options.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

#include <boost/algorithm/string.hpp>

namespace sdbsplit
{

namespace keys
{
    const std::string accessKey("simpledb.aws.accessKey");
    const std::string secretKey("simpledb.aws.secretKey");
    const std::string region("simpledb.aws.region");
    const std::string domain("simpledb.domain");
    const std::string where("simpledb.wherequery");
    const std::string splitSize("simpledb.split.size");
    const std::string splitWalk("simpledb.split.walk");
    const std::string splitRemainder("simpledb.split.remainder");
    const std::string consistentRead("simpledb.consistentRead");
    const std::string connectTimeout("simpledb.http.connectTimeout");
    const std::string timeout("simpledb.http.timeout");
    const std::string verbose("simpledb.verbose");
    const std::string csvHeaders("csv.header.fields");
}

const std::uint64_t Options::maxSplitSize(100000);
const std::string Options::defaultRegion("sdb.amazonaws.com");

namespace
{

boost::optional<std::string> find(const ConfigMap& config, const std::string& key)
{
    const auto it(config.find(key));
    if (it == config.end()) return boost::none;
    return boost::trim_copy(it->second);
}

std::string required(const ConfigMap& config, const std::string& key)
{
    const auto value(find(config, key));
    if (!value || value->empty())
    {
        throw ConfigError("Missing required configuration: " + key);
    }
    return *value;
}

std::uint64_t parseUnsigned(const std::string& key, const std::string& value)
{
    if (
            value.empty() ||
            value.size() > 19 ||
            !std::all_of(value.begin(), value.end(), [](char c)
            {
                return std::isdigit(static_cast<unsigned char>(c));
            }))
    {
        throw ConfigError("Invalid number for " + key + ": " + value);
    }

    return std::stoull(value);
}

std::uint64_t unsignedOr(
        const ConfigMap& config,
        const std::string& key,
        const std::uint64_t fallback)
{
    const auto value(find(config, key));
    if (!value || value->empty()) return fallback;
    return parseUnsigned(key, *value);
}

bool boolOr(const ConfigMap& config, const std::string& key, const bool fallback)
{
    const auto value(find(config, key));
    if (!value || value->empty()) return fallback;

    const std::string v(boost::to_lower_copy(*value));
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;

    throw ConfigError("Invalid boolean for " + key + ": " + *value);
}

std::uint64_t parseSplitSize(const ConfigMap& config)
{
    const std::uint64_t size(
            unsignedOr(config, keys::splitSize, Options::maxSplitSize));

    if (!size) throw ConfigError(keys::splitSize + " must be positive");
    return std::min(size, Options::maxSplitSize);
}

// Curl reads a zero timeout as no timeout at all, and takes a long.
long parseSeconds(
        const ConfigMap& config,
        const std::string& key,
        const long fallback)
{
    const std::uint64_t seconds(unsignedOr(config, key, fallback));

    if (!seconds) throw ConfigError(key + " must be positive");
    if (seconds > static_cast<std::uint64_t>(std::numeric_limits<long>::max()))
    {
        throw ConfigError(key + " is out of range: " + std::to_string(seconds));
    }

    return static_cast<long>(seconds);
}

BoundaryWalk parseWalk(const ConfigMap& config)
{
    const auto value(find(config, keys::splitWalk));
    if (!value || value->empty()) return BoundaryWalk::Incremental;

    const std::string v(boost::to_lower_copy(*value));
    if (v == "incremental") return BoundaryWalk::Incremental;
    if (v == "restart") return BoundaryWalk::Restart;

    throw ConfigError("Invalid " + keys::splitWalk + ": " + *value);
}

RemainderPolicy parseRemainder(const ConfigMap& config)
{
    const auto value(find(config, keys::splitRemainder));
    if (!value || value->empty()) return RemainderPolicy::Split;

    const std::string v(boost::to_lower_copy(*value));
    if (v == "split") return RemainderPolicy::Split;
    if (v == "absorb") return RemainderPolicy::Absorb;

    throw ConfigError("Invalid " + keys::splitRemainder + ": " + *value);
}

std::vector<std::string> parseHeaders(const ConfigMap& config)
{
    std::vector<std::string> headers;

    const auto value(find(config, keys::csvHeaders));
    if (!value || value->empty()) return headers;

    boost::split(headers, *value, boost::is_any_of(","));
    for (auto& h : headers) boost::trim(h);
    return headers;
}

} // unnamed namespace

Endpoint parseEndpoint(const std::string& region)
{
    Endpoint endpoint;
    endpoint.scheme = "https";

    std::string host(boost::trim_copy(region));
    if (host.empty()) host = Options::defaultRegion;

    const std::size_t schemeEnd(host.find("://"));
    if (schemeEnd != std::string::npos)
    {
        endpoint.scheme = boost::to_lower_copy(host.substr(0, schemeEnd));
        host = host.substr(schemeEnd + 3);

        if (endpoint.scheme != "http" && endpoint.scheme != "https")
        {
            throw ConfigError("Unsupported endpoint scheme: " + region);
        }
    }

    while (!host.empty() && host.back() == '/') host.pop_back();

    if (host.empty()) throw ConfigError("Invalid endpoint: " + region);

    // A bare region name like "eu-west-1".  US-East lives at the legacy
    // host without a region component.
    if (host.find('.') == std::string::npos && host.find(':') == std::string::npos)
    {
        if (host == "us-east-1") host = Options::defaultRegion;
        else host = "sdb." + host + ".amazonaws.com";
    }

    endpoint.host = host;
    return endpoint;
}

Options::Options(const ConfigMap& config)
    : m_map(config)
    , m_accessKey(required(config, keys::accessKey))
    , m_secretKey(required(config, keys::secretKey))
    , m_endpoint(parseEndpoint(find(config, keys::region).value_or("")))
    , m_domain(required(config, keys::domain))
    , m_where()
    , m_splitSize(parseSplitSize(config))
    , m_walk(parseWalk(config))
    , m_remainder(parseRemainder(config))
    , m_consistentRead(boolOr(config, keys::consistentRead, false))
    , m_connectTimeout(parseSeconds(config, keys::connectTimeout, 10))
    , m_timeout(parseSeconds(config, keys::timeout, 60))
    , m_verbose(boolOr(config, keys::verbose, false))
    , m_csvHeaders(parseHeaders(config))
{
    const auto where(find(config, keys::where));
    if (where && !where->empty()) m_where = *where;
}

} // namespace sdbsplit
