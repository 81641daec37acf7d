#pragma once

#include <string>
#include <vector>

#include <curl/curl.h>

namespace sdbsplit
{

class HttpResponse
{
public:
    HttpResponse(int code)
        : m_code(code)
        , m_data()
    { }

    HttpResponse(int code, std::vector<char> data)
        : m_code(code)
        , m_data(data)
    { }

    // A request that produced no HTTP status at all.
    static HttpResponse failed(std::string error)
    {
        HttpResponse res(0);
        res.m_error = error;
        return res;
    }

    int code() const { return m_code; }
    bool ok() const { return m_code / 100 == 2; }
    bool reached() const { return m_code != 0; }

    const std::vector<char>& data() const { return m_data; }
    std::string str() const { return std::string(m_data.begin(), m_data.end()); }

    const std::string& error() const { return m_error; }

private:
    int m_code;
    std::vector<char> m_data;
    std::string m_error;
};

using HttpHeaders = std::vector<std::string>;

class Transport
{
public:
    virtual ~Transport() { }

    virtual HttpResponse post(
            const std::string& url,
            const std::string& body,
            const HttpHeaders& headers = HttpHeaders()) = 0;
};

class Curl : public Transport
{
public:
    Curl(long connectTimeoutSeconds = 10, long timeoutSeconds = 60);
    ~Curl();

    Curl(const Curl&) = delete;
    Curl& operator=(const Curl&) = delete;

    HttpResponse post(
            const std::string& url,
            const std::string& body,
            const HttpHeaders& headers = HttpHeaders()) override;

    void verbose(bool v) { m_verbose = v; }

private:
    void init(const std::string& url, const HttpHeaders& headers);
    HttpResponse perform();

    CURL* m_curl;
    curl_slist* m_headers;

    const long m_connectTimeout;
    const long m_timeout;
    bool m_verbose;

    char m_errorBuffer[CURL_ERROR_SIZE];
};

} // namespace sdbsplit
