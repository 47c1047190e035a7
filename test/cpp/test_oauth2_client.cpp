#include "catch2/catch.hpp"
#include "oauth2_client.hpp"
#include "oauth2_error.hpp"
#include "pkce.hpp"
#include "test_helpers.hpp"

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

using namespace tokenward;
using namespace tokenward::testing;

namespace {

QueryParams QueryOf(const std::string& url) {
    return UrlCodec::ParseQueryString(HttpUrl(url).Query());
}

struct ClientFixture {
    std::shared_ptr<MockTransport> transport = std::make_shared<MockTransport>();
    std::shared_ptr<MemoryCredentialStore> store = std::make_shared<MemoryCredentialStore>();
    OAuthClient client{TestConfig(), store, transport};
    std::vector<UserPrompt> prompts;

    ClientFixture() {
        client.SetPresenter([this](const UserPrompt& prompt) { prompts.push_back(prompt); });
    }
};

} // namespace

TEST_CASE("OAuth client requires its collaborators", "[oauth2_client]") {
    auto store = std::make_shared<MemoryCredentialStore>();
    REQUIRE_THROWS_AS(OAuthClient(TestConfig(), nullptr, std::make_shared<MockTransport>()), std::invalid_argument);
    REQUIRE_THROWS_AS(OAuthClient(TestConfig(), store, nullptr), std::invalid_argument);
}

TEST_CASE("Authorization URL parameters", "[oauth2_client]") {
    ClientFixture fixture;

    SECTION("Without scope") {
        auto url = fixture.client.BuildAuthorizationUrl("st", "ch", "http://127.0.0.1:8080/callback");
        REQUIRE(url == "https://auth.example.com/authorize?client_id=test-client"
                       "&redirect_uri=http%3A%2F%2F127.0.0.1%3A8080%2Fcallback"
                       "&response_type=code&state=st&code_challenge=ch&code_challenge_method=S256");
    }

    SECTION("With scope") {
        auto config = TestConfig();
        config.scope = "read write";
        OAuthClient client(config, fixture.store, fixture.transport);
        auto params = QueryOf(client.BuildAuthorizationUrl("st", "ch", "http://127.0.0.1:9/callback"));
        REQUIRE(params["scope"] == "read write");
        REQUIRE(params["redirect_uri"] == "http://127.0.0.1:9/callback");
    }
}

TEST_CASE("Manual authorization code flow", "[oauth2_client]") {
    ClientFixture fixture;
    auto flow = fixture.client.StartAuthFlow();
    auto params = QueryOf(flow.url);

    REQUIRE(flow.state.size() == 32);
    REQUIRE(params["state"] == flow.state);
    REQUIRE(params["client_id"] == "test-client");
    REQUIRE(params["redirect_uri"] == "http://127.0.0.1:8080/callback");
    REQUIRE(params["response_type"] == "code");
    REQUIRE(params["code_challenge_method"] == "S256");

    auto session = fixture.store->GetSession(flow.state);
    REQUIRE(session.has_value());
    REQUIRE(PkceChallenge::ComputeChallenge(session->code_verifier) == params["code_challenge"]);

    SECTION("Exchanging the code") {
        fixture.transport->Enqueue(200, TokenJson("access", std::string("refresh")));
        auto token = fixture.client.ExchangeCode("the-code", flow.state);

        REQUIRE(token.access_token == "access");
        REQUIRE(token.refresh_token == std::optional<std::string>("refresh"));
        REQUIRE_FALSE(fixture.store->GetSession(flow.state).has_value());

        auto request = fixture.transport->Requests().at(0);
        REQUIRE(request.url.ToString() == "https://auth.example.com/token");
        REQUIRE(request.FormValue("grant_type") == "authorization_code");
        REQUIRE(request.FormValue("code") == "the-code");
        REQUIRE(request.FormValue("client_id") == "test-client");
        REQUIRE(request.FormValue("redirect_uri") == "http://127.0.0.1:8080/callback");
        REQUIRE(request.FormValue("code_verifier") == session->code_verifier);
    }

    SECTION("Unknown state is rejected without a request") {
        try {
            fixture.client.ExchangeCode("the-code", "forged-state");
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_STATE);
        }
        REQUIRE(fixture.transport->CallCount() == 0);
    }

    SECTION("Empty code") {
        REQUIRE_THROWS_AS(fixture.client.ExchangeCode("", flow.state), std::invalid_argument);
    }

    SECTION("Failed exchange keeps the session") {
        fixture.transport->Enqueue(400, ErrorJson("invalid_grant", "Code already used"));
        try {
            fixture.client.ExchangeCode("the-code", flow.state);
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_GRANT);
        }
        REQUIRE(fixture.store->GetSession(flow.state).has_value());
    }
}

TEST_CASE("Interactive authorization through the loopback listener", "[oauth2_client]") {
    ClientFixture fixture;
    fixture.transport->Enqueue(200, TokenJson("browser-access", std::string("browser-refresh"), 3600));

    std::string redirect_uri;
    int callback_status = 0;
    fixture.client.SetPresenter([&](const UserPrompt& prompt) {
        REQUIRE(prompt.kind == UserPrompt::Kind::AUTHORIZATION_URL);
        auto params = QueryOf(prompt.url);
        redirect_uri = params["redirect_uri"];

        // Plays the browser returning from the provider
        HttpUrl redirect(redirect_uri);
        httplib::Client browser(redirect.Host(), std::stoi(redirect.Port()));
        auto res = browser.Get((redirect.Path() + "?code=browser-code&state=" + params["state"]).c_str());
        callback_status = res ? res->status : -1;
    });

    auto token = fixture.client.Authorize(std::chrono::seconds(10));

    REQUIRE(callback_status == 200);
    REQUIRE(token.access_token == "browser-access");
    REQUIRE(redirect_uri.rfind("http://127.0.0.1:", 0) == 0);

    auto request = fixture.transport->Requests().at(0);
    REQUIRE(request.FormValue("code") == "browser-code");
    REQUIRE(request.FormValue("redirect_uri") == redirect_uri);
}

TEST_CASE("Interactive authorization times out", "[oauth2_client]") {
    ClientFixture fixture;
    try {
        fixture.client.Authorize(std::chrono::milliseconds(100));
        FAIL("Expected an OAuthError");
    } catch (const OAuthError& e) {
        REQUIRE(e.Kind() == OAuthErrorKind::TIMEOUT);
    }
    REQUIRE(fixture.prompts.size() == 1);
    REQUIRE(fixture.transport->CallCount() == 0);
}

TEST_CASE("Device authorization through the client", "[oauth2_client]") {
    ClientFixture fixture;
    auto now = std::chrono::steady_clock::now();
    fixture.client.SetDeviceFlowTiming([&now](std::chrono::milliseconds d) { now += d; }, [&now]() { return now; });

    fixture.transport->Enqueue(200, R"({"device_code":"dc","user_code":"WDJB-MJHT",)"
                                    R"("verification_uri":"https://auth.example.com/device","expires_in":600})");
    fixture.transport->Enqueue(400, ErrorJson("authorization_pending"));
    fixture.transport->Enqueue(200, TokenJson("device-access"));

    auto token = fixture.client.AuthorizeDevice();
    REQUIRE(token.access_token == "device-access");

    REQUIRE(fixture.prompts.size() == 1);
    REQUIRE(fixture.prompts[0].kind == UserPrompt::Kind::DEVICE_CODE);
    REQUIRE(fixture.prompts[0].url == "https://auth.example.com/device");
    REQUIRE(fixture.prompts[0].user_code == std::optional<std::string>("WDJB-MJHT"));
    REQUIRE_FALSE(fixture.prompts[0].complete_url.has_value());
    REQUIRE(fixture.transport->CallCount() == 3);
}

TEST_CASE("Refresh grant", "[oauth2_client]") {
    ClientFixture fixture;

    SECTION("Posts the refresh token") {
        fixture.transport->Enqueue(200, TokenJson("new-access", std::string("new-refresh")));
        auto token = fixture.client.RefreshToken("old-refresh");
        REQUIRE(token.access_token == "new-access");

        auto request = fixture.transport->Requests().at(0);
        REQUIRE(request.FormValue("grant_type") == "refresh_token");
        REQUIRE(request.FormValue("refresh_token") == "old-refresh");
        REQUIRE(request.FormValue("client_id") == "test-client");
    }

    SECTION("Empty refresh token") {
        try {
            fixture.client.RefreshToken("");
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::NO_REFRESH_TOKEN);
        }
    }

    SECTION("Rejected refresh token") {
        fixture.transport->Enqueue(400, ErrorJson("invalid_grant"));
        try {
            fixture.client.RefreshToken("revoked");
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_GRANT);
        }
    }
}

TEST_CASE("Token storage through the client", "[oauth2_client]") {
    ClientFixture fixture;
    REQUIRE_FALSE(fixture.client.GetToken("github.com:me").has_value());

    fixture.client.SaveToken("github.com:me", MakeToken("at", std::nullopt, std::nullopt, std::nullopt));
    REQUIRE(fixture.client.GetToken("github.com:me")->access_token == "at");
    REQUIRE(fixture.store->GetToken("github.com:me").has_value());

    fixture.client.DeleteToken("github.com:me");
    REQUIRE_FALSE(fixture.client.GetToken("github.com:me").has_value());
}
