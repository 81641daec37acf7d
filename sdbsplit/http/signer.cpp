#include <sdbsplit/http/signer.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <sdbsplit/util/base64.hpp>

namespace sdbsplit
{

namespace
{
    const std::string hex("0123456789ABCDEF");

    bool unreserved(const unsigned char c)
    {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
    }

    std::string toLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](char c)
        {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        });
        return s;
    }
}

Signer::Signer(std::string awsAccessKeyId, std::string awsSecretAccessKey)
    : m_awsAccessKeyId(awsAccessKeyId)
    , m_awsSecretAccessKey(awsSecretAccessKey)
{ }

std::string Signer::sign(
        const std::string& method,
        const std::string& host,
        const std::string& path,
        QueryParams params,
        const std::string& timestamp) const
{
    params["AWSAccessKeyId"] = m_awsAccessKeyId;
    params["SignatureVersion"] = "2";
    params["SignatureMethod"] = "HmacSHA256";
    params["Timestamp"] = timestamp;
    params.erase("Signature");

    const std::string toSign(getStringToSign(method, host, path, params));
    const std::string signature(encodeBase64(signString(toSign)));

    return canonicalize(params) + "&Signature=" + encode(signature);
}

std::string Signer::getStringToSign(
        const std::string& method,
        const std::string& host,
        const std::string& path,
        const QueryParams& params) const
{
    return
        method + "\n" +
        toLower(host) + "\n" +
        (path.empty() ? "/" : path) + "\n" +
        canonicalize(params);
}

std::string Signer::canonicalize(const QueryParams& params)
{
    // The map keeps parameters in byte order of their names, which is the
    // order the signature requires.
    std::string out;
    for (const auto& p : params)
    {
        if (!out.empty()) out += "&";
        out += encode(p.first) + "=" + encode(p.second);
    }
    return out;
}

std::string Signer::encode(const std::string& s)
{
    std::string out;
    out.reserve(s.size());

    for (const char c : s)
    {
        const unsigned char u(static_cast<unsigned char>(c));
        if (unreserved(u))
        {
            out.push_back(c);
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[u >> 4]);
            out.push_back(hex[u & 0x0F]);
        }
    }

    return out;
}

std::string Signer::timestamp()
{
    std::time_t rawTime;
    std::time(&rawTime);

    std::tm timeInfo;
    gmtime_r(&rawTime, &timeInfo);

    char charBuf[80];
    std::strftime(charBuf, 80, "%Y-%m-%dT%H:%M:%S.000Z", &timeInfo);

    return std::string(charBuf);
}

std::vector<uint8_t> Signer::signString(const std::string& input) const
{
    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE, 0);
    unsigned int outLength(0);

    const unsigned char* result(
            HMAC(
                EVP_sha256(),
                m_awsSecretAccessKey.data(),
                static_cast<int>(m_awsSecretAccessKey.size()),
                reinterpret_cast<const unsigned char*>(input.data()),
                input.size(),
                hash.data(),
                &outLength));

    if (!result) throw std::runtime_error("Could not sign request");

    hash.resize(outLength);
    return hash;
}

} // namespace sdbsplit
