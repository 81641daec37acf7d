#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sdbsplit
{

using QueryParams = std::map<std::string, std::string>;

// AWS Signature Version 2 for query-style APIs, signed with HmacSHA256.
class Signer
{
public:
    Signer(std::string awsAccessKeyId, std::string awsSecretAccessKey);

    // Adds the authentication parameters to the request parameters and
    // returns the canonical, signed query string suitable for a request
    // body or URL.
    std::string sign(
            const std::string& method,
            const std::string& host,
            const std::string& path,
            QueryParams params,
            const std::string& timestamp) const;

    std::string getStringToSign(
            const std::string& method,
            const std::string& host,
            const std::string& path,
            const QueryParams& params) const;

    static std::string canonicalize(const QueryParams& params);

    // Percent-encoding per RFC 3986: everything except A-Z, a-z, 0-9 and
    // "-_.~" is escaped, with uppercase hex digits.
    static std::string encode(const std::string& s);

    // Current UTC time as ISO-8601, e.g. 2013-01-31T17:45:02.000Z.
    static std::string timestamp();

private:
    std::vector<uint8_t> signString(const std::string& input) const;

    const std::string m_awsAccessKeyId;
    const std::string m_awsSecretAccessKey;
};

} // namespace sdbsplit
