#include "oauth2_error.hpp"
#include <sstream>

namespace tokenward {

std::string OAuthErrorKindToString(OAuthErrorKind kind) {
    switch (kind) {
        case OAuthErrorKind::TRANSPORT: return "transport";
        case OAuthErrorKind::INVALID_RESPONSE: return "invalid_response";
        case OAuthErrorKind::PROTOCOL: return "protocol";
        case OAuthErrorKind::INVALID_STATE: return "invalid_state";
        case OAuthErrorKind::AUTHORIZATION_DENIED: return "authorization_denied";
        case OAuthErrorKind::DEVICE_CODE_EXPIRED: return "device_code_expired";
        case OAuthErrorKind::INVALID_GRANT: return "invalid_grant";
        case OAuthErrorKind::INVALID_CLIENT: return "invalid_client";
        case OAuthErrorKind::TOKEN_EXPIRED: return "token_expired";
        case OAuthErrorKind::NO_REFRESH_TOKEN: return "no_refresh_token";
        case OAuthErrorKind::TOKEN_NOT_FOUND: return "token_not_found";
        case OAuthErrorKind::MISSING_FIELD: return "missing_field";
        case OAuthErrorKind::STORAGE: return "storage";
        case OAuthErrorKind::TIMEOUT: return "timeout";
        case OAuthErrorKind::CONFIGURATION: return "configuration";
        default: return "unknown";
    }
}

OAuthError::OAuthError(OAuthErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {
}

OAuthError::OAuthError(OAuthErrorKind kind, const std::string& message,
                       std::string error_code, std::optional<std::string> error_description)
    : std::runtime_error(message),
      kind_(kind),
      error_code_(std::move(error_code)),
      error_description_(std::move(error_description)) {
}

OAuthError OAuthError::FromServerError(const std::string& error_code,
                                       const std::optional<std::string>& error_description) {
    OAuthErrorKind kind = OAuthErrorKind::PROTOCOL;
    std::string message;

    if (error_code == "access_denied") {
        kind = OAuthErrorKind::AUTHORIZATION_DENIED;
        message = "Authorization denied by user";
    } else if (error_code == "expired_token") {
        kind = OAuthErrorKind::DEVICE_CODE_EXPIRED;
        message = "Device code expired";
    } else if (error_code == "invalid_grant") {
        kind = OAuthErrorKind::INVALID_GRANT;
        message = "Invalid grant";
    } else if (error_code == "invalid_client") {
        kind = OAuthErrorKind::INVALID_CLIENT;
        message = "Invalid client";
    } else {
        message = "OAuth error: " + error_code;
    }

    if (error_description.has_value() && !error_description->empty()) {
        message += " - " + *error_description;
    }
    return OAuthError(kind, message, error_code, error_description);
}

// ===== ErrorContext =====

ErrorContext& ErrorContext::Set(const std::string& key, const std::string& value) {
    context_[key] = value;
    return *this;
}

std::string ErrorContext::Get(const std::string& key) const {
    auto it = context_.find(key);
    if (it != context_.end()) {
        return it->second;
    }
    return "";
}

std::string ErrorContext::Format(const std::string& base_message) const {
    if (context_.empty()) {
        return base_message;
    }

    std::ostringstream result;
    result << base_message << " [";

    bool first = true;
    for (const auto& [key, value] : context_) {
        if (!first) {
            result << ", ";
        }
        result << key << ": " << value;
        first = false;
    }

    result << "]";
    return result.str();
}

OAuthError ErrorContext::Error(OAuthErrorKind kind, const std::string& base_message) const {
    return OAuthError(kind, Format(base_message));
}

void ErrorContext::Clear() {
    context_.clear();
}

bool ErrorContext::IsEmpty() const {
    return context_.empty();
}

} // namespace tokenward
