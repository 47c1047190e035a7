#include "catch2/catch.hpp"
#include "pkce.hpp"

#include <set>

using namespace tokenward;

namespace {

bool IsBase64UrlAlphabet(const std::string& value) {
    for (char c : value) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("PKCE challenge generation", "[pkce]") {
    auto pkce = PkceChallenge::Generate();

    SECTION("Verifier is 43 base64url characters") {
        REQUIRE(pkce.Verifier().size() == 43);
        REQUIRE(IsBase64UrlAlphabet(pkce.Verifier()));
    }

    SECTION("Challenge is the base64url SHA-256 of the verifier") {
        REQUIRE(pkce.Challenge().size() == 43);
        REQUIRE(IsBase64UrlAlphabet(pkce.Challenge()));
        REQUIRE(pkce.Challenge() == Base64UrlEncode(Sha256(pkce.Verifier())));
        REQUIRE(pkce.Challenge() == PkceChallenge::ComputeChallenge(pkce.Verifier()));
        REQUIRE(pkce.Challenge() != pkce.Verifier());
    }

    SECTION("Method is S256") {
        REQUIRE(pkce.Method() == "S256");
    }
}

TEST_CASE("PKCE verifiers are unique", "[pkce]") {
    std::set<std::string> verifiers;
    for (int i = 0; i < 100; i++) {
        verifiers.insert(PkceChallenge::Generate().Verifier());
    }
    REQUIRE(verifiers.size() == 100);
}

TEST_CASE("PKCE matches the RFC 7636 appendix B example", "[pkce]") {
    std::vector<unsigned char> bytes = {
        116, 24, 223, 180, 151, 153, 224, 37, 79, 250, 96, 125, 216, 173,
        187, 186, 22, 212, 37, 77, 105, 214, 191, 240, 91, 88, 5, 88, 83,
        132, 141, 121};

    auto pkce = PkceChallenge::FromRandomBytes(bytes);
    REQUIRE(pkce.Verifier() == "dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk");
    REQUIRE(pkce.Challenge() == "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST_CASE("PKCE rejects empty input", "[pkce]") {
    REQUIRE_THROWS_AS(PkceChallenge::FromRandomBytes({}), std::invalid_argument);
    REQUIRE_THROWS_AS(PkceChallenge::ComputeChallenge(""), std::invalid_argument);
}

TEST_CASE("Base64url encoding drops padding", "[pkce]") {
    REQUIRE(Base64UrlEncode("f") == "Zg");
    REQUIRE(Base64UrlEncode("fo") == "Zm8");
    REQUIRE(Base64UrlEncode("foo") == "Zm9v");

    std::string bytes = {static_cast<char>(0xfb), static_cast<char>(0xff)};
    REQUIRE(Base64UrlEncode(bytes) == "-_8");
}

TEST_CASE("State parameter generation", "[pkce]") {
    auto state1 = GenerateState();
    auto state2 = GenerateState();

    REQUIRE(state1.size() == 32);
    REQUIRE(state1.find_first_not_of("0123456789abcdef") == std::string::npos);
    REQUIRE(state1 != state2);
}
