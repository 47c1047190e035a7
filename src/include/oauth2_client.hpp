#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "credential_store.hpp"
#include "device_flow.hpp"
#include "oauth2_types.hpp"
#include "tokenward_http_client.hpp"

namespace tokenward {

// What a flow needs the user to see before it can continue
struct UserPrompt {
    enum class Kind {
        AUTHORIZATION_URL,
        DEVICE_CODE
    };

    Kind kind = Kind::AUTHORIZATION_URL;
    std::string url;
    std::optional<std::string> user_code;
    std::optional<std::string> complete_url;
};

using Presenter = std::function<void(const UserPrompt&)>;

/**
 * Authorization orchestrator.
 *
 * Code flow: Authorize() binds a CallbackListener, stores a Session keyed by a
 * random state, presents the authorization URL and exchanges the returned code
 * with the stored PKCE verifier. The Session is removed after a successful
 * exchange, and an unknown state fails with INVALID_STATE.
 *
 * Device flow: AuthorizeDevice() runs a DeviceFlowPoller. Tokens from either
 * flow are returned, not stored; call SaveToken() with the key of your choice.
 */
class OAuthClient {
public:
    static constexpr std::chrono::seconds DEFAULT_CALLBACK_TIMEOUT{30};

    OAuthClient(OAuthConfig config, std::shared_ptr<CredentialStore> store);
    OAuthClient(OAuthConfig config, std::shared_ptr<CredentialStore> store, std::shared_ptr<HttpTransport> transport);

    Token Authorize();
    Token Authorize(std::chrono::milliseconds callback_timeout);

    // Manual code flow against the configured redirect_uri; finish with ExchangeCode()
    AuthFlowResult StartAuthFlow();
    Token ExchangeCode(const std::string& code, const std::string& state);

    Token AuthorizeDevice();

    // POSTs the refresh_token grant; does not touch the store
    Token RefreshToken(const std::string& refresh_token);

    std::string BuildAuthorizationUrl(const std::string& state, const std::string& code_challenge,
                                      const std::string& redirect_uri) const;

    std::optional<Token> GetToken(const std::string& key);
    void SaveToken(const std::string& key, const Token& token);
    void DeleteToken(const std::string& key);

    void SetPresenter(Presenter presenter);
    // Prints the instructions to stdout and tries to open the browser
    static void DefaultPresenter(const UserPrompt& prompt);

    // Sleep and clock used by the device flow poller
    void SetDeviceFlowTiming(DeviceFlowPoller::Sleeper sleeper, DeviceFlowPoller::Clock clock);

    const OAuthConfig& Config() const { return config; }
    const std::shared_ptr<CredentialStore>& Store() const { return store; }

private:
    // Starts a code flow: stores the session and returns the URL to present
    AuthFlowResult BeginCodeFlow(const std::string& redirect_uri);
    Token ExchangeCode(const std::string& code, const std::string& state, const std::string& redirect_uri);
    Token PostTokenRequest(const FormFields& fields);

    OAuthConfig config;
    std::shared_ptr<CredentialStore> store;
    std::shared_ptr<HttpTransport> transport;
    Presenter presenter;
    DeviceFlowPoller::Sleeper device_sleeper;
    DeviceFlowPoller::Clock device_clock;
};

} // namespace tokenward
