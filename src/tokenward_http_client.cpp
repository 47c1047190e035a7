#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <regex>
#include <sstream>
#include <thread>

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include "oauth2_error.hpp"
#include "tokenward_http_client.hpp"
#include "tokenward_tracing.hpp"

namespace tokenward
{

namespace {

std::string ToLower(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return lower;
}

httplib::Headers HttplibHeaders(const HeaderMap &headers)
{
    httplib::Headers ret;
    for (const auto &header : headers)
    {
        ret.emplace(header.first, header.second);
    }
    return ret;
}

std::unique_ptr<httplib::Client> CreateHttplibClient(const HttpParams &http_params,
                                                     const std::string &scheme_host_and_port)
{
    auto c = std::make_unique<httplib::Client>(scheme_host_and_port);
    c->set_follow_location(true);
    c->set_keep_alive(http_params.keep_alive);
    c->set_write_timeout(std::chrono::milliseconds(http_params.timeout));
    c->set_read_timeout(std::chrono::milliseconds(http_params.timeout));
    c->set_connection_timeout(std::chrono::milliseconds(http_params.timeout));
    return c;
}

httplib::Result Execute(HttpRequest &request, httplib::Client &client)
{
    auto path_str = request.url.ToPathQuery();
    auto headers = HttplibHeaders(request.headers);

    TOKENWARD_TRACE_INFO("HTTP_REQUEST", "Executing " + request.method.ToString() + " request to: " +
                         request.url.ToSchemeHostAndPort() + path_str);
    if (!request.content.empty()) {
        // Form bodies carry codes and refresh tokens; only the size is traced
        TOKENWARD_TRACE_DEBUG("HTTP_REQUEST", "Request content (" + std::to_string(request.content.length()) +
                              " bytes), Content-Type: " + request.content_type);
    }

    if (request.method == HttpMethod::GET)
    {
        return client.Get(path_str, headers);
    }
    else if (request.method == HttpMethod::POST)
    {
        return client.Post(path_str, headers, request.content, request.content_type);
    }
    throw OAuthError(OAuthErrorKind::CONFIGURATION, "Invalid HTTP method: " + request.method.ToString());
}

} // namespace

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

// ----------------------------------------------------------------------

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://(?:[^@/?#]*@)?([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw OAuthError(OAuthErrorKind::CONFIGURATION, "Invalid URL, cannot be parsed: " + url);
    }

    scheme = m[1].str();
    host = m[2].str();
    port = m[3].str();
    path = m[4].str();
    query = m[5].str();
    fragment = m[6].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    std::ostringstream ss;
    ss << (path.empty() ? "/" : path) << query;
    return ss.str();
}

std::string HttpUrl::ToString() const {
    return ToSchemeHostAndPort() + ToPathQuery() + fragment;
}

bool HttpUrl::Equals(const HttpUrl& other) const {
    return ToLower(scheme) == ToLower(other.scheme) &&
           ToLower(host) == ToLower(other.host) &&
           port == other.port &&
           path == other.path &&
           query == other.query &&
           fragment == other.fragment;
}

std::string HttpUrl::Scheme() const { return scheme; }
std::string HttpUrl::Host() const { return host; }
std::string HttpUrl::Port() const { return port; }
std::string HttpUrl::Path() const { return path; }
std::string HttpUrl::Query() const { return query; }
std::string HttpUrl::Fragment() const { return fragment; }

// ----------------------------------------------------------------------

HttpParams::HttpParams()
    : timeout(DEFAULT_TIMEOUT),
      retries(DEFAULT_RETRIES),
      retry_wait_ms(DEFAULT_RETRY_WAIT_MS),
      retry_backoff(DEFAULT_RETRY_BACKOFF),
      keep_alive(DEFAULT_KEEP_ALIVE)
{
}

// ----------------------------------------------------------------------

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const std::string &url, std::string content_type, std::string content)
    : method(method), url(HttpUrl(url)), content_type(std::move(content_type)), content(std::move(content)),
      retry_on_failure(method == HttpMethod::GET)
{ }

HttpRequest::HttpRequest(HttpMethod method, const std::string &url)
    : HttpRequest(method, url, std::string("application/json"), std::string())
{ }

HttpRequest HttpRequest::FormPost(const std::string &url, const FormFields &fields)
{
    HttpRequest request(HttpMethod::POST, url, "application/x-www-form-urlencoded", UrlCodec::BuildFormBody(fields));
    request.headers.emplace("Accept", "application/json");
    request.retry_on_failure = false;
    return request;
}

std::string HttpRequest::FormValue(const std::string &name) const
{
    auto fields = UrlCodec::ParseQueryString(content);
    auto it = fields.find(name);
    return it == fields.end() ? std::string() : it->second;
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), content_type(std::move(content_type)), content(std::move(content))
{ }

// ----------------------------------------------------------------------

HttpClient::HttpClient(const HttpParams &http_params)
    : http_params(http_params)
{ }

HttpClient::HttpClient()
    : HttpClient(HttpParams())
{ }

namespace {

bool IsRetryableStatus(int status)
{
    switch (status) {
        case 408: // Request Timeout
        case 429: // Rate limiter hit
        case 503: // Server has error
        case 504: // Server has error
            return true;
        default:
            return false;
    }
}

} // namespace

std::unique_ptr<HttpResponse> HttpClient::SendRequest(HttpRequest &request)
{
    const uint64_t max_tries = request.retry_on_failure ? std::max<uint64_t>(http_params.retries, 1) : 1;

    uint64_t n_tries = 0;
    while (true)
    {
        auto client = CreateHttplibClient(http_params, request.url.ToSchemeHostAndPort());
        auto res = Execute(request, *client);
        auto err = res.error();
        n_tries += 1;

        if (err == httplib::Error::Success)
        {
            TOKENWARD_TRACE_INFO("HTTP_RESPONSE", "Response status: " + std::to_string(res->status));
            if (!IsRetryableStatus(res->status) || n_tries >= max_tries)
            {
                auto ret = std::make_unique<HttpResponse>(request.method, request.url, res->status,
                                                          res->get_header_value("Content-Type"), res->body);
                for (const auto &header : res->headers) {
                    ret->headers.emplace(header.first, header.second);
                }
                return ret;
            }
        }
        else
        {
            TOKENWARD_TRACE_ERROR("HTTP_RESPONSE", "Request failed: " + httplib::to_string(err));
            if (n_tries >= max_tries)
            {
                ErrorContext ctx;
                ctx.Set("method", request.method.ToString()).Set("url", request.url.ToString());
                throw ctx.Error(OAuthErrorKind::TRANSPORT, httplib::to_string(err) + " error");
            }
        }

        if (n_tries > 1) {
            auto sleep_amount = CalculateSleepTime(n_tries);
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_amount));
        }
    }
}

uint64_t HttpClient::CalculateSleepTime(uint64_t n_tries) const
{
    auto ret = (static_cast<float>(http_params.retry_wait_ms) * std::pow(http_params.retry_backoff, n_tries - 2));
    return static_cast<uint64_t>(ret);
}

} // namespace tokenward
