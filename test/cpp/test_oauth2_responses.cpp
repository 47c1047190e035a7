#include "catch2/catch.hpp"
#include "oauth2_error.hpp"
#include "oauth2_responses.hpp"
#include "test_helpers.hpp"

#include <limits>

using namespace tokenward;
using namespace tokenward::testing;

namespace {

HttpResponse MakeResponse(int status, const std::string& body) {
    return HttpResponse(HttpMethod::POST, HttpUrl("https://auth.example.com/token"), status, "application/json", body);
}

} // namespace

TEST_CASE("Token response parsing", "[oauth2_responses]") {
    SECTION("Complete response") {
        auto token = ParseTokenResponse(
            R"({"access_token":"at","refresh_token":"rt","token_type":"bearer","expires_in":3600,"scope":"repo"})", 1000);
        REQUIRE(token.access_token == "at");
        REQUIRE(token.refresh_token == std::optional<std::string>("rt"));
        REQUIRE(token.token_type == "bearer");
        REQUIRE(token.expires_in == std::optional<int64_t>(3600));
        REQUIRE(token.expires_at == std::optional<int64_t>(4600));
        REQUIRE(token.scope == std::optional<std::string>("repo"));
    }

    SECTION("Minimal response defaults to Bearer and never expires") {
        auto token = ParseTokenResponse(R"({"access_token":"at"})", 1000);
        REQUIRE(token.token_type == "Bearer");
        REQUIRE_FALSE(token.refresh_token.has_value());
        REQUIRE_FALSE(token.expires_at.has_value());
        REQUIRE_FALSE(token.IsExpired());
    }

    SECTION("expires_in as string") {
        auto token = ParseTokenResponse(R"({"access_token":"at","expires_in":"3599"})", 0);
        REQUIRE(token.expires_in == std::optional<int64_t>(3599));
    }

    SECTION("Huge expires_in saturates instead of expiring the token") {
        auto now = NowEpochSeconds();
        auto token = ParseTokenResponse(R"({"access_token":"at","expires_in":9223372036854775807})", now);
        REQUIRE(token.expires_at == std::optional<int64_t>(std::numeric_limits<int64_t>::max()));
        REQUIRE_FALSE(token.IsExpired());

        auto as_string = ParseTokenResponse(R"({"access_token":"at","expires_in":"9223372036854775807"})", now);
        REQUIRE_FALSE(as_string.IsExpired());
    }

    SECTION("Unrepresentable or negative expires_in is rejected") {
        for (const auto& body : {
                 R"({"access_token":"at","expires_in":"99999999999999999999"})",
                 R"({"access_token":"at","expires_in":99999999999999999999})",
                 R"({"access_token":"at","expires_in":1e30})",
                 R"({"access_token":"at","expires_in":-5})",
                 R"({"access_token":"at","expires_in":"soon"})",
             }) {
            try {
                ParseTokenResponse(body, 1000);
                FAIL("Expected an OAuthError for " << body);
            } catch (const OAuthError& e) {
                REQUIRE(e.Kind() == OAuthErrorKind::INVALID_RESPONSE);
            }
        }
    }

    SECTION("Null expires_in means no expiry") {
        auto token = ParseTokenResponse(R"({"access_token":"at","expires_in":null})", 1000);
        REQUIRE_FALSE(token.expires_in.has_value());
        REQUIRE_FALSE(token.expires_at.has_value());
    }

    SECTION("Missing access_token") {
        try {
            ParseTokenResponse(R"({"token_type":"Bearer"})", 0);
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_RESPONSE);
        }
    }

    SECTION("Body that is not JSON") {
        REQUIRE_THROWS_AS(ParseTokenResponse("<html>oops</html>", 0), OAuthError);
        REQUIRE_THROWS_AS(ParseTokenResponse("", 0), OAuthError);
        REQUIRE_THROWS_AS(ParseTokenResponse("[1,2]", 0), OAuthError);
    }
}

TEST_CASE("Error response parsing", "[oauth2_responses]") {
    auto error = ParseErrorResponse(ErrorJson("authorization_pending", "Waiting"));
    REQUIRE(error.has_value());
    REQUIRE(error->error == "authorization_pending");
    REQUIRE(error->error_description == std::optional<std::string>("Waiting"));

    REQUIRE_FALSE(ParseErrorResponse(TokenJson("at")).has_value());
    REQUIRE_FALSE(ParseErrorResponse("not json").has_value());
    REQUIRE_FALSE(ParseErrorResponse(R"({"error":42})").has_value());
}

TEST_CASE("Device authorization response parsing", "[oauth2_responses]") {
    SECTION("Complete response") {
        auto auth = ParseDeviceAuthorizationResponse(R"({
            "device_code": "dc",
            "user_code": "ABCD-1234",
            "verification_uri": "https://example.com/device",
            "verification_uri_complete": "https://example.com/device?user_code=ABCD-1234",
            "expires_in": 900,
            "interval": 10
        })");
        REQUIRE(auth.device_code == "dc");
        REQUIRE(auth.user_code == "ABCD-1234");
        REQUIRE(auth.verification_uri == "https://example.com/device");
        REQUIRE(auth.verification_uri_complete == std::optional<std::string>("https://example.com/device?user_code=ABCD-1234"));
        REQUIRE(auth.expires_in == 900);
        REQUIRE(auth.interval == 10);
    }

    SECTION("Interval defaults to five seconds") {
        auto auth = ParseDeviceAuthorizationResponse(
            R"({"device_code":"dc","user_code":"uc","verification_url":"https://example.com/d","expires_in":600})");
        REQUIRE(auth.interval == 5);
        REQUIRE(auth.verification_uri == "https://example.com/d");

        auto zero = ParseDeviceAuthorizationResponse(
            R"({"device_code":"dc","user_code":"uc","verification_uri":"https://example.com/d","expires_in":600,"interval":0})");
        REQUIRE(zero.interval == 5);
    }

    SECTION("Server lifetimes are capped at one day") {
        auto auth = ParseDeviceAuthorizationResponse(
            R"({"device_code":"dc","user_code":"uc","verification_uri":"u","expires_in":9223372036854775807,"interval":9223372036854775807})");
        REQUIRE(auth.expires_in == DeviceAuthorization::MAX_LIFETIME);
        REQUIRE(auth.interval == DeviceAuthorization::MAX_LIFETIME);

        REQUIRE_THROWS_AS(ParseDeviceAuthorizationResponse(
                              R"({"device_code":"dc","user_code":"uc","verification_uri":"u","expires_in":-1})"),
                          OAuthError);
    }

    SECTION("Missing required member") {
        try {
            ParseDeviceAuthorizationResponse(R"({"device_code":"dc","verification_uri":"u","expires_in":600})");
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_RESPONSE);
            REQUIRE(std::string(e.what()).find("user_code") != std::string::npos);
        }
    }
}

TEST_CASE("Token endpoint response handling", "[oauth2_responses]") {
    SECTION("Success") {
        auto token = TokenFromResponse(MakeResponse(200, TokenJson("at", std::string("rt"), 60)));
        REQUIRE(token.access_token == "at");
        REQUIRE(token.expires_at.has_value());
    }

    SECTION("Server error with 400 status") {
        try {
            TokenFromResponse(MakeResponse(400, ErrorJson("invalid_grant", "revoked")));
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::INVALID_GRANT);
            REQUIRE(e.ErrorDescription() == std::optional<std::string>("revoked"));
        }
    }

    SECTION("Server error with 200 status") {
        try {
            TokenFromResponse(MakeResponse(200, ErrorJson("access_denied")));
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::AUTHORIZATION_DENIED);
        }
    }

    SECTION("Non-2xx without error body") {
        try {
            TokenFromResponse(MakeResponse(502, "Bad Gateway"));
            FAIL("Expected an OAuthError");
        } catch (const OAuthError& e) {
            REQUIRE(e.Kind() == OAuthErrorKind::TRANSPORT);
            REQUIRE(std::string(e.what()).find("status: 502") != std::string::npos);
        }
    }
}
