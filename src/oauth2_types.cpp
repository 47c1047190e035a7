#include "oauth2_types.hpp"

#include <limits>

namespace tokenward {

int64_t NowEpochSeconds() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

OAuthConfig OAuthConfig::GitHub(const std::string& client_id, const std::optional<std::string>& scopes) {
    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = "https://github.com/login/oauth/authorize";
    config.token_endpoint = "https://github.com/login/oauth/access_token";
    config.redirect_uri = DEFAULT_REDIRECT_URI;
    config.scope = scopes;
    config.device_authorization_endpoint = "https://github.com/login/device/code";
    return config;
}

OAuthConfig OAuthConfig::Google(const std::string& client_id, const std::optional<std::string>& scopes) {
    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = "https://accounts.google.com/o/oauth2/v2/auth";
    config.token_endpoint = "https://oauth2.googleapis.com/token";
    config.redirect_uri = DEFAULT_REDIRECT_URI;
    config.scope = scopes;
    config.device_authorization_endpoint = "https://oauth2.googleapis.com/device/code";
    return config;
}

OAuthConfig OAuthConfig::Microsoft(const std::string& client_id, const std::string& tenant,
                                   const std::optional<std::string>& scopes) {
    const std::string base_url = "https://login.microsoftonline.com/" + tenant + "/oauth2/v2.0";

    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = base_url + "/authorize";
    config.token_endpoint = base_url + "/token";
    config.redirect_uri = DEFAULT_REDIRECT_URI;
    config.scope = scopes;
    config.device_authorization_endpoint = base_url + "/devicecode";
    return config;
}

OAuthConfig OAuthConfig::GitLab(const std::string& client_id, const std::optional<std::string>& scopes,
                                const std::optional<std::string>& base_url) {
    const std::string base = base_url.value_or("https://gitlab.com");

    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = base + "/oauth/authorize";
    config.token_endpoint = base + "/oauth/token";
    config.redirect_uri = DEFAULT_REDIRECT_URI;
    config.scope = scopes;
    return config;
}

OAuthConfig OAuthConfig::Tuist(const std::string& client_id, const std::optional<std::string>& scopes,
                               const std::optional<std::string>& base_url) {
    const std::string base = base_url.value_or("https://cloud.tuist.io");

    OAuthConfig config;
    config.client_id = client_id;
    config.authorization_endpoint = base + "/oauth/authorize";
    config.token_endpoint = base + "/oauth/token";
    config.redirect_uri = DEFAULT_REDIRECT_URI;
    config.scope = scopes;
    config.device_authorization_endpoint = base + "/oauth/device/code";
    return config;
}

bool Token::IsExpired() const {
    return IsExpired(NowEpochSeconds());
}

bool Token::IsExpired(int64_t now_epoch_seconds) const {
    if (!expires_at.has_value()) {
        return false;
    }
    return now_epoch_seconds >= *expires_at;
}

void Token::CalculateExpiresAt(int64_t now_epoch_seconds) {
    if (!expires_in.has_value()) {
        expires_at.reset();
        return;
    }

    // Saturates at the int64 limits instead of wrapping
    const auto max = std::numeric_limits<int64_t>::max();
    const auto min = std::numeric_limits<int64_t>::min();
    if (*expires_in > 0 && now_epoch_seconds > max - *expires_in) {
        expires_at = max;
    } else if (*expires_in < 0 && now_epoch_seconds < min - *expires_in) {
        expires_at = min;
    } else {
        expires_at = now_epoch_seconds + *expires_in;
    }
}

bool Token::operator==(const Token& other) const {
    return access_token == other.access_token &&
           refresh_token == other.refresh_token &&
           token_type == other.token_type &&
           expires_in == other.expires_in &&
           expires_at == other.expires_at &&
           scope == other.scope;
}

Session::Session(std::string state, std::string code_verifier)
    : state(std::move(state)), code_verifier(std::move(code_verifier)), created_at(NowEpochSeconds()) {
}

Session::Session(std::string state, std::string code_verifier, std::string domain)
    : state(std::move(state)),
      code_verifier(std::move(code_verifier)),
      created_at(NowEpochSeconds()),
      domain(std::move(domain)) {
}

} // namespace tokenward
