#include <sdbsplit/http/curl.hpp>

#include <cstring>
#include <stdexcept>

namespace sdbsplit
{

namespace
{
    std::size_t writeBody(
            char* in,
            std::size_t size,
            std::size_t count,
            void* userData)
    {
        const std::size_t bytes(size * count);
        std::vector<char>& body(*static_cast<std::vector<char>*>(userData));
        body.insert(body.end(), in, in + bytes);
        return bytes;
    }

    const bool followRedirect(true);
}

Curl::Curl(const long connectTimeoutSeconds, const long timeoutSeconds)
    : m_curl(0)
    , m_headers(0)
    , m_connectTimeout(connectTimeoutSeconds)
    , m_timeout(timeoutSeconds)
    , m_verbose(false)
{
    m_curl = curl_easy_init();
    if (!m_curl) throw std::runtime_error("Could not initialize curl");

    m_errorBuffer[0] = '\0';
}

Curl::~Curl()
{
    curl_slist_free_all(m_headers);
    curl_easy_cleanup(m_curl);
}

void Curl::init(const std::string& url, const HttpHeaders& headers)
{
    // Each request starts from a clean handle.
    curl_easy_reset(m_curl);
    curl_slist_free_all(m_headers);
    m_headers = 0;
    m_errorBuffer[0] = '\0';

    curl_easy_setopt(m_curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(m_curl, CURLOPT_ERRORBUFFER, m_errorBuffer);

    // Signals are unsafe once workers run in threads.
    curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);

    // SimpleDB endpoints resolve over IPv4.
    curl_easy_setopt(m_curl, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);

    // A hung store call must not hang its worker forever.
    curl_easy_setopt(m_curl, CURLOPT_CONNECTTIMEOUT, m_connectTimeout);
    curl_easy_setopt(m_curl, CURLOPT_TIMEOUT, m_timeout);

    if (m_verbose)      curl_easy_setopt(m_curl, CURLOPT_VERBOSE, 1L);
    if (followRedirect) curl_easy_setopt(m_curl, CURLOPT_FOLLOWLOCATION, 1L);

    for (std::size_t i(0); i < headers.size(); ++i)
    {
        m_headers = curl_slist_append(m_headers, headers[i].c_str());
    }
}

HttpResponse Curl::perform()
{
    std::vector<char> data;

    curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &data);

    curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, m_headers);

    const CURLcode result(curl_easy_perform(m_curl));
    if (result != CURLE_OK)
    {
        const std::string detail(
                std::strlen(m_errorBuffer) ?
                    m_errorBuffer : curl_easy_strerror(result));
        return HttpResponse::failed(detail);
    }

    long httpCode(0);
    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &httpCode);

    return HttpResponse(static_cast<int>(httpCode), data);
}

HttpResponse Curl::post(
        const std::string& url,
        const std::string& body,
        const HttpHeaders& headers)
{
    init(url, headers);

    // Must give the size for the body, otherwise curl will use strlen() on
    // it.  The body must outlive the request, which it does here.
    curl_easy_setopt(m_curl, CURLOPT_POST, 1L);
    curl_easy_setopt(m_curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(
            m_curl,
            CURLOPT_POSTFIELDSIZE_LARGE,
            static_cast<curl_off_t>(body.size()));

    return perform();
}

} // namespace sdbsplit
