#include "oauth2_client.hpp"
#include "browser_launcher.hpp"
#include "callback_listener.hpp"
#include "oauth2_error.hpp"
#include "oauth2_responses.hpp"
#include "pkce.hpp"
#include "tokenward_tracing.hpp"

#include <iostream>
#include <stdexcept>

namespace tokenward {

OAuthClient::OAuthClient(OAuthConfig config, std::shared_ptr<CredentialStore> store)
    : OAuthClient(std::move(config), std::move(store), std::make_shared<HttpClient>()) {
}

OAuthClient::OAuthClient(OAuthConfig config, std::shared_ptr<CredentialStore> store,
                         std::shared_ptr<HttpTransport> transport)
    : config(std::move(config)),
      store(std::move(store)),
      transport(std::move(transport)),
      presenter(DefaultPresenter) {
    if (!this->store) {
        throw std::invalid_argument("OAuthClient requires a credential store");
    }
    if (!this->transport) {
        throw std::invalid_argument("OAuthClient requires an HTTP transport");
    }
}

void OAuthClient::SetPresenter(Presenter presenter) {
    this->presenter = presenter ? std::move(presenter) : Presenter(DefaultPresenter);
}

void OAuthClient::SetDeviceFlowTiming(DeviceFlowPoller::Sleeper sleeper, DeviceFlowPoller::Clock clock) {
    device_sleeper = std::move(sleeper);
    device_clock = std::move(clock);
}

void OAuthClient::DefaultPresenter(const UserPrompt& prompt) {
    if (prompt.kind == UserPrompt::Kind::AUTHORIZATION_URL) {
        std::cout << "\n=== Authorization Required ===" << std::endl;
        std::cout << "Opening browser for authorization..." << std::endl;
        std::cout << "If the browser doesn't open, visit: " << prompt.url << std::endl;
        std::cout << "Waiting for authorization..." << std::endl;
        BrowserLauncher::OpenUrl(prompt.url);
        return;
    }

    std::cout << "\n=== Device Authorization ===" << std::endl;
    std::cout << "Please visit: " << prompt.url << std::endl;
    if (prompt.user_code.has_value()) {
        std::cout << "And enter code: " << *prompt.user_code << std::endl;
    }
    if (prompt.complete_url.has_value()) {
        std::cout << "\nOr visit this URL directly:\n" << *prompt.complete_url << std::endl;
    }
    std::cout << "\nWaiting for authorization..." << std::endl;
    BrowserLauncher::OpenUrl(prompt.complete_url.value_or(prompt.url));
}

std::string OAuthClient::BuildAuthorizationUrl(const std::string& state, const std::string& code_challenge,
                                               const std::string& redirect_uri) const {
    FormFields fields = {
        {"client_id", config.client_id},
        {"redirect_uri", redirect_uri},
        {"response_type", "code"},
        {"state", state},
        {"code_challenge", code_challenge},
        {"code_challenge_method", PkceChallenge::METHOD},
    };
    if (config.scope.has_value()) {
        fields.emplace_back("scope", *config.scope);
    }
    return UrlCodec::AppendQuery(config.authorization_endpoint, fields);
}

AuthFlowResult OAuthClient::BeginCodeFlow(const std::string& redirect_uri) {
    auto pkce = PkceChallenge::Generate();
    auto state = GenerateState();

    store->SaveSession(state, Session(state, pkce.Verifier()));

    AuthFlowResult result;
    result.url = BuildAuthorizationUrl(state, pkce.Challenge(), redirect_uri);
    result.state = state;
    TOKENWARD_TRACE_DEBUG("OAUTH2_CLIENT", "Started authorization code flow with state: " + state);
    return result;
}

AuthFlowResult OAuthClient::StartAuthFlow() {
    return BeginCodeFlow(config.redirect_uri);
}

Token OAuthClient::Authorize() {
    return Authorize(DEFAULT_CALLBACK_TIMEOUT);
}

Token OAuthClient::Authorize(std::chrono::milliseconds callback_timeout) {
    CallbackListener listener;
    auto redirect_uri = listener.RedirectUri();
    auto flow = BeginCodeFlow(redirect_uri);

    UserPrompt prompt;
    prompt.kind = UserPrompt::Kind::AUTHORIZATION_URL;
    prompt.url = flow.url;
    presenter(prompt);

    auto callback = listener.WaitForCallback(callback_timeout);
    return ExchangeCode(callback.code, callback.state, redirect_uri);
}

Token OAuthClient::ExchangeCode(const std::string& code, const std::string& state) {
    return ExchangeCode(code, state, config.redirect_uri);
}

Token OAuthClient::ExchangeCode(const std::string& code, const std::string& state, const std::string& redirect_uri) {
    if (code.empty()) {
        throw std::invalid_argument("Authorization code cannot be empty");
    }

    auto session = store->GetSession(state);
    if (!session.has_value()) {
        TOKENWARD_TRACE_WARN("OAUTH2_CLIENT", "No session for returned state: " + state);
        throw OAuthError(OAuthErrorKind::INVALID_STATE, "Invalid state parameter: no matching session");
    }
    if (session->code_verifier.empty()) {
        throw std::invalid_argument("Code verifier cannot be empty");
    }

    TOKENWARD_TRACE_INFO("OAUTH2_CLIENT", "Exchanging authorization code " + TruncateSecret(code) + " for tokens");
    auto token = PostTokenRequest({
        {"client_id", config.client_id},
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", redirect_uri},
        {"code_verifier", session->code_verifier},
    });

    store->DeleteSession(state);
    return token;
}

Token OAuthClient::AuthorizeDevice() {
    std::unique_ptr<DeviceFlowPoller> poller;
    if (device_sleeper && device_clock) {
        poller = std::make_unique<DeviceFlowPoller>(transport, config, device_sleeper, device_clock);
    } else {
        poller = std::make_unique<DeviceFlowPoller>(transport, config);
    }

    auto authorization = poller->RequestAuthorization();

    UserPrompt prompt;
    prompt.kind = UserPrompt::Kind::DEVICE_CODE;
    prompt.url = authorization.verification_uri;
    prompt.user_code = authorization.user_code;
    prompt.complete_url = authorization.verification_uri_complete;
    presenter(prompt);

    return poller->PollForToken(authorization);
}

Token OAuthClient::RefreshToken(const std::string& refresh_token) {
    if (refresh_token.empty()) {
        throw OAuthError(OAuthErrorKind::NO_REFRESH_TOKEN, "Refresh token cannot be empty");
    }
    TOKENWARD_TRACE_INFO("OAUTH2_CLIENT", "Refreshing access token with refresh token " + TruncateSecret(refresh_token));
    return PostTokenRequest({
        {"client_id", config.client_id},
        {"grant_type", "refresh_token"},
        {"refresh_token", refresh_token},
    });
}

Token OAuthClient::PostTokenRequest(const FormFields& fields) {
    auto request = HttpRequest::FormPost(config.token_endpoint, fields);
    auto response = transport->SendRequest(request);
    return TokenFromResponse(*response);
}

std::optional<Token> OAuthClient::GetToken(const std::string& key) {
    return store->GetToken(key);
}

void OAuthClient::SaveToken(const std::string& key, const Token& token) {
    store->SaveToken(key, token);
}

void OAuthClient::DeleteToken(const std::string& key) {
    store->DeleteToken(key);
}

} // namespace tokenward
