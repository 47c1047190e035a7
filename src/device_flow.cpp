#include "device_flow.hpp"
#include "oauth2_responses.hpp"
#include "tokenward_tracing.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

namespace tokenward {

namespace {

// Failures of a custom transport surface as TRANSPORT errors
OAuthError TransportFailure(const std::exception& e) {
    return OAuthError(OAuthErrorKind::TRANSPORT, std::string("HTTP transport failed: ") + e.what());
}

} // namespace

std::string DeviceFlowStateToString(DeviceFlowState state) {
    switch (state) {
        case DeviceFlowState::REQUESTING: return "REQUESTING";
        case DeviceFlowState::PENDING: return "PENDING";
        case DeviceFlowState::SUCCESS: return "SUCCESS";
        case DeviceFlowState::DENIED: return "DENIED";
        case DeviceFlowState::EXPIRED: return "EXPIRED";
        case DeviceFlowState::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

DeviceFlowPoller::DeviceFlowPoller(std::shared_ptr<HttpTransport> transport, OAuthConfig config)
    : DeviceFlowPoller(std::move(transport), std::move(config),
                       [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); },
                       []() { return std::chrono::steady_clock::now(); }) {
}

DeviceFlowPoller::DeviceFlowPoller(std::shared_ptr<HttpTransport> transport, OAuthConfig config,
                                   Sleeper sleeper, Clock clock)
    : transport(std::move(transport)),
      config(std::move(config)),
      sleeper(std::move(sleeper)),
      clock(std::move(clock)) {
    if (!this->transport) {
        throw std::invalid_argument("Device flow requires an HTTP transport");
    }
}

void DeviceFlowPoller::Fail(DeviceFlowState terminal_state, const OAuthError& error) {
    state = terminal_state;
    TOKENWARD_TRACE_ERROR("DEVICE_FLOW", "Device flow ended in " + DeviceFlowStateToString(state) + ": " + error.what());
    throw error;
}

DeviceAuthorization DeviceFlowPoller::RequestAuthorization() {
    state = DeviceFlowState::REQUESTING;

    if (!config.device_authorization_endpoint.has_value()) {
        Fail(DeviceFlowState::FATAL, OAuthError(OAuthErrorKind::CONFIGURATION,
                                                "Device authorization endpoint not configured"));
    }

    FormFields fields = {{"client_id", config.client_id}};
    if (config.scope.has_value()) {
        fields.emplace_back("scope", *config.scope);
    }

    TOKENWARD_TRACE_INFO("DEVICE_FLOW", "Requesting device authorization from " + *config.device_authorization_endpoint);

    DeviceAuthorization authorization;
    try {
        auto request = HttpRequest::FormPost(*config.device_authorization_endpoint, fields);
        auto response = transport->SendRequest(request);
        if (!response) {
            throw OAuthError(OAuthErrorKind::TRANSPORT, "HTTP transport returned no response");
        }
        ThrowForErrorResponse(*response);
        authorization = ParseDeviceAuthorizationResponse(response->Content());
    } catch (const OAuthError& e) {
        Fail(DeviceFlowState::FATAL, e);
    } catch (const std::exception& e) {
        Fail(DeviceFlowState::FATAL, TransportFailure(e));
    }

    state = DeviceFlowState::PENDING;
    interval = authorization.interval > 0 ? authorization.interval : DeviceAuthorization::DEFAULT_INTERVAL;
    TOKENWARD_TRACE_DEBUG("DEVICE_FLOW", "User code " + authorization.user_code + ", expires in " +
                          std::to_string(authorization.expires_in) + "s, interval " + std::to_string(interval) + "s");
    return authorization;
}

Token DeviceFlowPoller::PollForToken(const DeviceAuthorization& authorization) {
    state = DeviceFlowState::PENDING;
    interval = authorization.interval > 0 ? authorization.interval : DeviceAuthorization::DEFAULT_INTERVAL;
    poll_count = 0;

    const auto deadline = clock() + std::chrono::seconds(authorization.expires_in);
    const OAuthError expired(OAuthErrorKind::DEVICE_CODE_EXPIRED, "Device code expired");

    const FormFields fields = {
        {"client_id", config.client_id},
        {"device_code", authorization.device_code},
        {"grant_type", DEVICE_CODE_GRANT_TYPE},
    };

    while (true) {
        auto now = clock();
        if (now >= deadline) {
            Fail(DeviceFlowState::EXPIRED, expired);
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        sleeper(std::min<std::chrono::milliseconds>(std::chrono::seconds(interval), remaining));

        if (clock() >= deadline) {
            Fail(DeviceFlowState::EXPIRED, expired);
        }

        poll_count++;
        std::unique_ptr<HttpResponse> response;
        try {
            auto request = HttpRequest::FormPost(config.token_endpoint, fields);
            response = transport->SendRequest(request);
            if (!response) {
                throw OAuthError(OAuthErrorKind::TRANSPORT, "HTTP transport returned no response");
            }
        } catch (const OAuthError& e) {
            Fail(DeviceFlowState::FATAL, e);
        } catch (const std::exception& e) {
            Fail(DeviceFlowState::FATAL, TransportFailure(e));
        }

        auto server_error = ParseErrorResponse(response->Content());
        if (!server_error.has_value()) {
            try {
                auto token = TokenFromResponse(*response);
                state = DeviceFlowState::SUCCESS;
                TOKENWARD_TRACE_INFO("DEVICE_FLOW", "Device authorization granted after " + std::to_string(poll_count) + " polls");
                return token;
            } catch (const OAuthError& e) {
                Fail(DeviceFlowState::FATAL, e);
            }
        }

        const auto& code = server_error->error;
        if (code == "authorization_pending") {
            TOKENWARD_TRACE_TRACE("DEVICE_FLOW", "Authorization pending");
            continue;
        }
        if (code == "slow_down") {
            interval += SLOW_DOWN_INCREMENT;
            TOKENWARD_TRACE_DEBUG("DEVICE_FLOW", "Server asked to slow down, interval now " + std::to_string(interval) + "s");
            continue;
        }

        auto error = OAuthError::FromServerError(code, server_error->error_description);
        if (code == "access_denied") {
            Fail(DeviceFlowState::DENIED, error);
        }
        if (code == "expired_token") {
            Fail(DeviceFlowState::EXPIRED, error);
        }
        Fail(DeviceFlowState::FATAL, error);
    }
}

} // namespace tokenward
