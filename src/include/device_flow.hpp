#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "oauth2_error.hpp"
#include "oauth2_types.hpp"
#include "tokenward_http_client.hpp"

namespace tokenward {

enum class DeviceFlowState {
    REQUESTING,
    PENDING,
    SUCCESS,
    DENIED,
    EXPIRED,
    FATAL
};

std::string DeviceFlowStateToString(DeviceFlowState state);

/**
 * RFC 8628 device authorization state machine.
 *
 * REQUESTING: RequestAuthorization() posts client_id (+scope) to the device
 * authorization endpoint. PENDING: PollForToken() sleeps `interval` and posts
 * the device code until the token endpoint yields a token or a terminal error.
 * authorization_pending keeps polling, slow_down adds 5 seconds to the interval.
 * The device code deadline is checked before each sleep and each request, and
 * every sleep is clipped to the remaining lifetime.
 */
class DeviceFlowPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr const char* DEVICE_CODE_GRANT_TYPE = "urn:ietf:params:oauth:grant-type:device_code";
    static constexpr int64_t SLOW_DOWN_INCREMENT = 5;

    DeviceFlowPoller(std::shared_ptr<HttpTransport> transport, OAuthConfig config);
    DeviceFlowPoller(std::shared_ptr<HttpTransport> transport, OAuthConfig config, Sleeper sleeper, Clock clock);

    DeviceAuthorization RequestAuthorization();
    Token PollForToken(const DeviceAuthorization& authorization);

    DeviceFlowState State() const { return state; }
    // Poll interval in seconds as currently in effect
    int64_t CurrentInterval() const { return interval; }
    size_t PollCount() const { return poll_count; }

private:
    [[noreturn]] void Fail(DeviceFlowState terminal_state, const OAuthError& error);

    std::shared_ptr<HttpTransport> transport;
    OAuthConfig config;
    Sleeper sleeper;
    Clock clock;

    DeviceFlowState state = DeviceFlowState::REQUESTING;
    int64_t interval = DeviceAuthorization::DEFAULT_INTERVAL;
    size_t poll_count = 0;
};

} // namespace tokenward
