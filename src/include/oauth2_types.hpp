#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tokenward {

// Seconds since the Unix epoch according to the system clock
int64_t NowEpochSeconds();

// OAuth2 configuration for one client registration
struct OAuthConfig {
    std::string client_id;
    std::string authorization_endpoint;
    std::string token_endpoint;
    std::string redirect_uri;
    std::optional<std::string> scope;
    // Only needed for the device authorization flow (RFC 8628)
    std::optional<std::string> device_authorization_endpoint;

    static constexpr const char* DEFAULT_REDIRECT_URI = "http://127.0.0.1:8080/callback";

    static OAuthConfig GitHub(const std::string& client_id,
                              const std::optional<std::string>& scopes = std::nullopt);
    static OAuthConfig Google(const std::string& client_id,
                              const std::optional<std::string>& scopes = std::nullopt);
    // tenant is a tenant id or "common"
    static OAuthConfig Microsoft(const std::string& client_id, const std::string& tenant,
                                 const std::optional<std::string>& scopes = std::nullopt);
    // GitLab has no device authorization endpoint
    static OAuthConfig GitLab(const std::string& client_id,
                              const std::optional<std::string>& scopes = std::nullopt,
                              const std::optional<std::string>& base_url = std::nullopt);
    static OAuthConfig Tuist(const std::string& client_id,
                             const std::optional<std::string>& scopes = std::nullopt,
                             const std::optional<std::string>& base_url = std::nullopt);
};

// Bearer credential; keyed in storage by an application-chosen key such as "<domain>:<principal>"
struct Token {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::string token_type = "Bearer";
    std::optional<int64_t> expires_in;   // lifetime in seconds as issued
    std::optional<int64_t> expires_at;   // absolute epoch seconds, sole basis for expiry
    std::optional<std::string> scope;

    // A token without expires_at never expires
    bool IsExpired() const;
    bool IsExpired(int64_t now_epoch_seconds) const;

    // Sets expires_at = now + expires_in when expires_in is present, clears it otherwise
    void CalculateExpiresAt(int64_t now_epoch_seconds);

    bool operator==(const Token& other) const;
    bool operator!=(const Token& other) const { return !(*this == other); }
};

// Pending authorization attempt, keyed by its state parameter
struct Session {
    std::string state;
    std::string code_verifier;
    int64_t created_at = 0;
    std::optional<std::string> domain;

    Session() = default;
    Session(std::string state, std::string code_verifier);
    Session(std::string state, std::string code_verifier, std::string domain);
};

// Device authorization response (RFC 8628 section 3.2)
struct DeviceAuthorization {
    std::string device_code;
    std::string user_code;
    std::string verification_uri;
    std::optional<std::string> verification_uri_complete;
    int64_t expires_in = 0;
    int64_t interval = DEFAULT_INTERVAL;

    static constexpr int64_t DEFAULT_INTERVAL = 5;
    // Upper bound applied to expires_in and interval from the server, one day
    static constexpr int64_t MAX_LIFETIME = 86400;
};

// Result of starting a manual authorization code flow
struct AuthFlowResult {
    std::string url;
    std::string state;
};

// Parameters captured from the redirect
struct CallbackResult {
    std::string code;
    std::string state;
};

} // namespace tokenward
