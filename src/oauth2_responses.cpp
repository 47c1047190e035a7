#include "oauth2_responses.hpp"
#include "oauth2_error.hpp"
#include "tokenward_tracing.hpp"

#include <yyjson.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>

namespace tokenward {

namespace {

using JsonDoc = std::shared_ptr<yyjson_doc>;

JsonDoc ReadJson(const std::string& body) {
    if (body.empty()) {
        return nullptr;
    }
    return JsonDoc(yyjson_read(body.c_str(), body.size(), 0), yyjson_doc_free);
}

yyjson_val* RootObject(const JsonDoc& doc) {
    if (!doc) {
        return nullptr;
    }
    auto root = yyjson_doc_get_root(doc.get());
    if (!root || !yyjson_is_obj(root)) {
        return nullptr;
    }
    return root;
}

std::optional<std::string> GetString(yyjson_val* obj, const char* name) {
    auto val = yyjson_obj_get(obj, name);
    if (val && yyjson_is_str(val)) {
        return std::string(yyjson_get_str(val));
    }
    return std::nullopt;
}

// Accepts numbers and numeric strings, some providers send "3599".
// Values outside the int64 range read as absent.
std::optional<int64_t> GetInteger(yyjson_val* obj, const char* name) {
    auto val = yyjson_obj_get(obj, name);
    if (!val) {
        return std::nullopt;
    }
    if (yyjson_is_uint(val)) {
        auto value = yyjson_get_uint(val);
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (yyjson_is_sint(val)) {
        return static_cast<int64_t>(yyjson_get_sint(val));
    }
    if (yyjson_is_real(val)) {
        auto value = yyjson_get_real(val);
        // 2^63 itself is not representable, hence the strict upper bound
        if (!std::isfinite(value) || value < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
            value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (yyjson_is_str(val)) {
        const char* str = yyjson_get_str(val);
        char* end = nullptr;
        errno = 0;
        auto parsed = std::strtoll(str, &end, 10);
        if (errno == ERANGE || end == str || *end != '\0') {
            return std::nullopt;
        }
        return static_cast<int64_t>(parsed);
    }
    return std::nullopt;
}

// A member that is present but not a usable non-negative integer is a malformed response
std::optional<int64_t> GetLifetime(yyjson_val* obj, const char* name, const ErrorContext& ctx) {
    auto val = yyjson_obj_get(obj, name);
    if (!val || yyjson_is_null(val)) {
        return std::nullopt;
    }
    auto value = GetInteger(obj, name);
    if (!value.has_value() || *value < 0) {
        throw ctx.Error(OAuthErrorKind::INVALID_RESPONSE, std::string("Invalid ") + name);
    }
    return value;
}

} // namespace

std::optional<ServerError> ParseErrorResponse(const std::string& body) {
    auto doc = ReadJson(body);
    auto root = RootObject(doc);
    if (!root) {
        return std::nullopt;
    }

    auto error = GetString(root, "error");
    if (!error.has_value()) {
        return std::nullopt;
    }

    ServerError result;
    result.error = *error;
    result.error_description = GetString(root, "error_description");
    return result;
}

Token ParseTokenResponse(const std::string& body, int64_t now_epoch_seconds) {
    auto doc = ReadJson(body);
    auto root = RootObject(doc);
    if (!root) {
        throw OAuthError(OAuthErrorKind::INVALID_RESPONSE, "Token response is not a JSON object");
    }

    Token token;
    auto access_token = GetString(root, "access_token");
    if (!access_token.has_value()) {
        throw OAuthError(OAuthErrorKind::INVALID_RESPONSE, "Missing or invalid access_token in token response");
    }
    token.access_token = *access_token;
    token.refresh_token = GetString(root, "refresh_token");
    token.token_type = GetString(root, "token_type").value_or("Bearer");
    ErrorContext ctx;
    ctx.Set("response", "token");
    token.expires_in = GetLifetime(root, "expires_in", ctx);
    token.scope = GetString(root, "scope");
    token.CalculateExpiresAt(now_epoch_seconds);

    TOKENWARD_TRACE_DEBUG("OAUTH2_RESPONSE", "Parsed token " + TruncateSecret(token.access_token) +
                          (token.refresh_token ? " with refresh token" : " without refresh token"));
    return token;
}

DeviceAuthorization ParseDeviceAuthorizationResponse(const std::string& body) {
    auto doc = ReadJson(body);
    auto root = RootObject(doc);
    if (!root) {
        throw OAuthError(OAuthErrorKind::INVALID_RESPONSE, "Device authorization response is not a JSON object");
    }

    ErrorContext ctx;
    ctx.Set("response", "device_authorization");

    DeviceAuthorization auth;
    auto device_code = GetString(root, "device_code");
    auto user_code = GetString(root, "user_code");
    // Microsoft's older endpoints use verification_url
    auto verification_uri = GetString(root, "verification_uri");
    if (!verification_uri.has_value()) {
        verification_uri = GetString(root, "verification_url");
    }
    auto expires_in = GetLifetime(root, "expires_in", ctx);

    if (!device_code.has_value()) {
        throw ctx.Error(OAuthErrorKind::INVALID_RESPONSE, "Missing device_code");
    }
    if (!user_code.has_value()) {
        throw ctx.Error(OAuthErrorKind::INVALID_RESPONSE, "Missing user_code");
    }
    if (!verification_uri.has_value()) {
        throw ctx.Error(OAuthErrorKind::INVALID_RESPONSE, "Missing verification_uri");
    }
    if (!expires_in.has_value()) {
        throw ctx.Error(OAuthErrorKind::INVALID_RESPONSE, "Missing expires_in");
    }

    auth.device_code = *device_code;
    auth.user_code = *user_code;
    auth.verification_uri = *verification_uri;
    auth.verification_uri_complete = GetString(root, "verification_uri_complete");
    auth.expires_in = std::min(*expires_in, DeviceAuthorization::MAX_LIFETIME);
    auth.interval = GetInteger(root, "interval").value_or(DeviceAuthorization::DEFAULT_INTERVAL);
    if (auth.interval <= 0) {
        auth.interval = DeviceAuthorization::DEFAULT_INTERVAL;
    }
    auth.interval = std::min(auth.interval, DeviceAuthorization::MAX_LIFETIME);
    return auth;
}

void ThrowForErrorResponse(const HttpResponse& response) {
    auto server_error = ParseErrorResponse(response.Content());
    if (server_error.has_value()) {
        TOKENWARD_TRACE_WARN("OAUTH2_RESPONSE", "Server returned error: " + server_error->error);
        throw OAuthError::FromServerError(server_error->error, server_error->error_description);
    }
    if (!response.IsSuccess()) {
        ErrorContext ctx;
        ctx.Set("url", response.url.ToString()).Set("status", std::to_string(response.Code()));
        throw ctx.Error(OAuthErrorKind::TRANSPORT, "HTTP request failed");
    }
}

Token TokenFromResponse(const HttpResponse& response) {
    ThrowForErrorResponse(response);
    return ParseTokenResponse(response.Content(), NowEpochSeconds());
}

} // namespace tokenward
