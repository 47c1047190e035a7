#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "oauth2_error.hpp"
#include "oauth2_types.hpp"
#include "tokenward_http_client.hpp"

namespace tokenward {
namespace testing {

// Scripted HttpTransport: queued responses are served first, then the handler
class MockTransport : public HttpTransport {
public:
    using Handler = std::function<std::unique_ptr<HttpResponse>(HttpRequest&)>;

    void Enqueue(int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex);
        queue.emplace_back(status, body);
    }

    void SetHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex);
        this->handler = std::move(handler);
    }

    void SetDelay(std::chrono::milliseconds delay) {
        this->delay = delay;
    }

    std::unique_ptr<HttpResponse> SendRequest(HttpRequest& request) override {
        calls++;
        std::optional<std::pair<int, std::string>> scripted;
        Handler current_handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            requests.push_back(request);
            if (!queue.empty()) {
                scripted = queue.front();
                queue.pop_front();
            }
            current_handler = handler;
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        if (scripted.has_value()) {
            return Respond(request, scripted->first, scripted->second);
        }
        if (current_handler) {
            return current_handler(request);
        }
        throw OAuthError(OAuthErrorKind::TRANSPORT, "No scripted response for " + request.url.ToString());
    }

    static std::unique_ptr<HttpResponse> Respond(const HttpRequest& request, int status, const std::string& body) {
        return std::make_unique<HttpResponse>(request.method, request.url, status, "application/json", body);
    }

    size_t CallCount() const { return calls.load(); }

    std::vector<HttpRequest> Requests() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

private:
    std::mutex mutex;
    std::deque<std::pair<int, std::string>> queue;
    Handler handler;
    std::chrono::milliseconds delay{0};
    std::atomic<size_t> calls{0};
    std::vector<HttpRequest> requests;
};

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path = std::filesystem::temp_directory_path() / ("tokenward-test-" + std::to_string(gen()));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path; }

private:
    std::filesystem::path path;
};

inline std::string TokenJson(const std::string& access_token,
                             const std::optional<std::string>& refresh_token = std::nullopt,
                             const std::optional<int64_t>& expires_in = 3600) {
    std::string json = "{\"access_token\":\"" + access_token + "\",\"token_type\":\"Bearer\"";
    if (refresh_token.has_value()) {
        json += ",\"refresh_token\":\"" + *refresh_token + "\"";
    }
    if (expires_in.has_value()) {
        json += ",\"expires_in\":" + std::to_string(*expires_in);
    }
    return json + "}";
}

inline std::string ErrorJson(const std::string& error, const std::string& description = "") {
    std::string json = "{\"error\":\"" + error + "\"";
    if (!description.empty()) {
        json += ",\"error_description\":\"" + description + "\"";
    }
    return json + "}";
}

// Token whose expiry is relative to now
inline Token MakeToken(const std::string& access_token,
                       const std::optional<std::string>& refresh_token,
                       std::optional<int64_t> expires_in,
                       std::optional<int64_t> seconds_until_expiry) {
    Token token;
    token.access_token = access_token;
    token.refresh_token = refresh_token;
    token.expires_in = expires_in;
    if (seconds_until_expiry.has_value()) {
        token.expires_at = NowEpochSeconds() + *seconds_until_expiry;
    }
    return token;
}

inline OAuthConfig TestConfig() {
    OAuthConfig config;
    config.client_id = "test-client";
    config.authorization_endpoint = "https://auth.example.com/authorize";
    config.token_endpoint = "https://auth.example.com/token";
    config.redirect_uri = "http://127.0.0.1:8080/callback";
    config.device_authorization_endpoint = "https://auth.example.com/device/code";
    return config;
}

} // namespace testing
} // namespace tokenward
