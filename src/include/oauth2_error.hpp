#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace tokenward {

enum class OAuthErrorKind {
    TRANSPORT,            // network / HTTP layer failure
    INVALID_RESPONSE,     // body could not be decoded or lacks a required member
    PROTOCOL,             // server-reported error code not covered below
    INVALID_STATE,        // no session for the returned state (CSRF defense)
    AUTHORIZATION_DENIED, // access_denied
    DEVICE_CODE_EXPIRED,  // expired_token or device code lifetime exceeded
    INVALID_GRANT,
    INVALID_CLIENT,
    TOKEN_EXPIRED,
    NO_REFRESH_TOKEN,
    TOKEN_NOT_FOUND,
    MISSING_FIELD,
    STORAGE,
    TIMEOUT,
    CONFIGURATION
};

std::string OAuthErrorKindToString(OAuthErrorKind kind);

class OAuthError : public std::runtime_error {
public:
    OAuthError(OAuthErrorKind kind, const std::string& message);
    OAuthError(OAuthErrorKind kind, const std::string& message,
               std::string error_code, std::optional<std::string> error_description);

    OAuthErrorKind Kind() const { return kind_; }

    // Server-provided `error` member, empty for local failures
    const std::string& ErrorCode() const { return error_code_; }
    const std::optional<std::string>& ErrorDescription() const { return error_description_; }

    // Maps an RFC 6749 / RFC 8628 error code to the matching kind and
    // builds the exception with code and description preserved.
    static OAuthError FromServerError(const std::string& error_code,
                                      const std::optional<std::string>& error_description);

private:
    OAuthErrorKind kind_;
    std::string error_code_;
    std::optional<std::string> error_description_;
};

/**
 * Error Context Helper
 *
 * Collects key/value details about the operation in flight so that the
 * message of a thrown OAuthError names what was being attempted.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("operation", "refresh").Set("key", key);
 *   throw ctx.Error(OAuthErrorKind::TOKEN_NOT_FOUND, "Token not found");
 */
class ErrorContext {
public:
    ErrorContext() = default;

    ErrorContext& Set(const std::string& key, const std::string& value);

    std::string Get(const std::string& key) const;

    /**
     * Build a formatted message with context
     *
     * Example:
     *   ctx.Set("operation", "refresh").Set("key", "github.com:me");
     *   ctx.Format("Token not found");
     *   // "Token not found [key: github.com:me, operation: refresh]"
     */
    std::string Format(const std::string& base_message) const;

    OAuthError Error(OAuthErrorKind kind, const std::string& base_message) const;

    void Clear();

    bool IsEmpty() const;

private:
    std::map<std::string, std::string> context_;
};

} // namespace tokenward
