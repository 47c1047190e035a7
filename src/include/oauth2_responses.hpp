#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "oauth2_types.hpp"
#include "tokenward_http_client.hpp"

namespace tokenward {

// `error` / `error_description` members of an RFC 6749 section 5.2 body
struct ServerError {
    std::string error;
    std::optional<std::string> error_description;
};

// Returns the server error when the body is a JSON object with a string `error` member.
// Providers such as GitHub report device-flow poll errors with HTTP 200, so the status is not consulted.
std::optional<ServerError> ParseErrorResponse(const std::string& body);

// Builds a Token with expires_at = now + expires_in. Throws OAuthError(INVALID_RESPONSE)
// when the body is not JSON or lacks access_token.
Token ParseTokenResponse(const std::string& body, int64_t now_epoch_seconds);

// Throws OAuthError(INVALID_RESPONSE) when a required member is missing
DeviceAuthorization ParseDeviceAuthorizationResponse(const std::string& body);

// Throws OAuthError::FromServerError for error bodies and OAuthError(TRANSPORT)
// for other non-2xx responses; returns normally otherwise.
void ThrowForErrorResponse(const HttpResponse& response);

// Token endpoint response handling shared by code exchange and refresh
Token TokenFromResponse(const HttpResponse& response);

} // namespace tokenward
