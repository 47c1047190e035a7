#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "url_codec.hpp"

namespace tokenward
{

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

// ----------------------------------------------------------------------

class HttpUrl {
public:
    HttpUrl(const std::string& url);
    void ParseUrl(const std::string& url);
    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;
    std::string ToString() const;
    bool Equals(const HttpUrl& other) const;

    std::string Scheme() const;
    std::string Host() const;
    std::string Port() const;
    std::string Path() const;
    std::string Query() const;
    std::string Fragment() const;

private:
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

// ----------------------------------------------------------------------

struct HttpParams {

    static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
    static constexpr uint64_t DEFAULT_RETRIES = 3;
    static constexpr uint64_t DEFAULT_RETRY_WAIT_MS = 100;
    static constexpr float DEFAULT_RETRY_BACKOFF = 4;
    static constexpr bool DEFAULT_KEEP_ALIVE = false;

    HttpParams();

    uint64_t timeout;
    uint64_t retries;
    uint64_t retry_wait_ms;
    float retry_backoff;
    bool keep_alive;
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

class HttpRequest
{
public:
    HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const std::string &url);

    // POST with an application/x-www-form-urlencoded body and Accept: application/json.
    // Never retried: token grants are not idempotent.
    static HttpRequest FormPost(const std::string &url, const FormFields &fields);

    // Form field lookup on the encoded body, mainly for transports that inspect requests
    std::string FormValue(const std::string &name) const;

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;

    // Resend on connection errors and 408/429/503/504; defaults to true for GET only
    bool retry_on_failure;
};

// ----------------------------------------------------------------------

class HttpResponse
{
public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);

    int Code() const { return code; }
    bool IsSuccess() const { return code >= 200 && code < 300; }
    const std::string &ContentType() const { return content_type; }
    const std::string &Content() const { return content; }

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    HeaderMap headers;
    std::string content_type;
    std::string content;
};

// ----------------------------------------------------------------------

// Outbound HTTP capability used for device authorization, code exchange and refresh.
// Non-2xx statuses are returned as responses, body included; only failures to
// obtain a response throw.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;
    virtual std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request) = 0;
};

class HttpClient : public HttpTransport
{
public:
    HttpClient();
    HttpClient(const HttpParams &http_params);

    std::unique_ptr<HttpResponse> SendRequest(HttpRequest &request) override;

    const HttpParams &Params() const { return http_params; }

private:
    uint64_t CalculateSleepTime(uint64_t n_tries) const;

    HttpParams http_params;
};

} // namespace tokenward
