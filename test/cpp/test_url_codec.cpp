#include "catch2/catch.hpp"
#include "url_codec.hpp"

using namespace tokenward;

TEST_CASE("UrlCodec encoding", "[url_codec]") {
    REQUIRE(UrlCodec::Encode("abc-_.~XYZ019") == "abc-_.~XYZ019");
    REQUIRE(UrlCodec::Encode("read write") == "read+write");
    REQUIRE(UrlCodec::Encode("http://127.0.0.1:8080/callback") == "http%3A%2F%2F127.0.0.1%3A8080%2Fcallback");
    REQUIRE(UrlCodec::Encode("a&b=c") == "a%26b%3Dc");
    REQUIRE(UrlCodec::Encode("\xc3\xa4") == "%C3%A4");
}

TEST_CASE("UrlCodec decoding", "[url_codec]") {
    REQUIRE(UrlCodec::Decode("abc%20123") == "abc 123");
    REQUIRE(UrlCodec::Decode("xyz%2F789") == "xyz/789");
    REQUIRE(UrlCodec::Decode("read+write") == "read write");
    REQUIRE(UrlCodec::Decode("%c3%A4") == "\xc3\xa4");

    SECTION("Malformed escapes stay literal") {
        REQUIRE(UrlCodec::Decode("100%") == "100%");
        REQUIRE(UrlCodec::Decode("%zz") == "%zz");
        REQUIRE(UrlCodec::Decode("%4") == "%4");
    }
}

TEST_CASE("UrlCodec query string parsing", "[url_codec]") {
    SECTION("With and without leading question mark") {
        auto params = UrlCodec::ParseQueryString("?code=abc%20123&state=xyz%2F789");
        REQUIRE(params.size() == 2);
        REQUIRE(params["code"] == "abc 123");
        REQUIRE(params["state"] == "xyz/789");

        REQUIRE(UrlCodec::ParseQueryString("code=abc&state=xyz") == QueryParams{{"code", "abc"}, {"state", "xyz"}});
    }

    SECTION("Keys without value and empty pairs") {
        auto params = UrlCodec::ParseQueryString("flag&&x=1&");
        REQUIRE(params.size() == 2);
        REQUIRE(params["flag"].empty());
        REQUIRE(params["x"] == "1");
    }

    SECTION("First occurrence wins") {
        auto params = UrlCodec::ParseQueryString("a=1&a=2");
        REQUIRE(params["a"] == "1");
    }

    SECTION("Empty query") {
        REQUIRE(UrlCodec::ParseQueryString("").empty());
        REQUIRE(UrlCodec::ParseQueryString("?").empty());
    }
}

TEST_CASE("UrlCodec form bodies and query appending", "[url_codec]") {
    FormFields fields = {{"grant_type", "refresh_token"}, {"refresh_token", "a b/c"}};
    REQUIRE(UrlCodec::BuildFormBody(fields) == "grant_type=refresh_token&refresh_token=a+b%2Fc");
    REQUIRE(UrlCodec::BuildFormBody({}).empty());

    REQUIRE(UrlCodec::AppendQuery("https://example.com/authorize", {{"a", "1"}}) == "https://example.com/authorize?a=1");
    REQUIRE(UrlCodec::AppendQuery("https://example.com/authorize?tenant=x", {{"a", "1"}}) ==
            "https://example.com/authorize?tenant=x&a=1");
    REQUIRE(UrlCodec::AppendQuery("https://example.com/authorize", {}) == "https://example.com/authorize");
}
