#include "token_refresher.hpp"
#include "oauth2_error.hpp"
#include "tokenward_tracing.hpp"

#include <algorithm>
#include <stdexcept>

namespace tokenward {

namespace {

bool IsExpired(const Token& token) {
    return token.IsExpired();
}

bool Always(const Token&) {
    return true;
}

} // namespace

TokenRefresher::TokenRefresher(std::shared_ptr<OAuthClient> client)
    : client(std::move(client)) {
    if (!this->client) {
        throw std::invalid_argument("TokenRefresher requires an OAuthClient");
    }
}

TokenRefresher::TokenRefresher(std::shared_ptr<OAuthClient> client, RefreshLockManager lock_manager)
    : TokenRefresher(std::move(client)) {
    this->lock_manager.emplace(std::move(lock_manager));
}

std::unique_ptr<TokenRefresher> TokenRefresher::WithFileLocking(std::shared_ptr<OAuthClient> client,
                                                                const std::string& app_name) {
    return std::make_unique<TokenRefresher>(std::move(client), RefreshLockManager::ForApp(app_name));
}

Token TokenRefresher::GetValidToken(const std::string& key) {
    auto token = LoadToken(key);
    if (!token.IsExpired()) {
        return token;
    }
    TOKENWARD_TRACE_INFO("TOKEN_REFRESH", "Token expired, refreshing: " + key);
    return Coordinate(key, IsExpired);
}

Token TokenRefresher::GetValidTokenWithThreshold(const std::string& key, double threshold) {
    threshold = std::clamp(threshold, 0.0, 1.0);

    auto token = LoadToken(key);
    if (!ShouldRefresh(token, threshold)) {
        return token;
    }
    TOKENWARD_TRACE_INFO("TOKEN_REFRESH", "Token past refresh threshold " + std::to_string(threshold) + ": " + key);
    return Coordinate(key, [threshold](const Token& current) { return ShouldRefresh(current, threshold); });
}

Token TokenRefresher::RefreshTokenForKey(const std::string& key) {
    if (lock_manager.has_value()) {
        return Coordinate(key, IsExpired);
    }
    return Coordinate(key, Always);
}

Token TokenRefresher::ForceRefresh(const std::string& key) {
    return Coordinate(key, Always);
}

void TokenRefresher::WaitForRefresh(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex);
    refresh_cv.wait(lock, [this, &key] { return in_flight.find(key) == in_flight.end(); });
}

bool TokenRefresher::IsRefreshInProgress(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    return in_flight.find(key) != in_flight.end();
}

bool TokenRefresher::ShouldRefresh(const Token& token, double threshold) {
    return ShouldRefresh(token, threshold, NowEpochSeconds());
}

bool TokenRefresher::ShouldRefresh(const Token& token, double threshold, int64_t now_epoch_seconds) {
    threshold = std::clamp(threshold, 0.0, 1.0);

    if (token.IsExpired(now_epoch_seconds)) {
        return true;
    }
    // Without a complete lifetime there is nothing to measure against
    if (!token.expires_at.has_value() || !token.expires_in.has_value() || *token.expires_in <= 0) {
        return false;
    }

    auto lifetime = static_cast<double>(*token.expires_in);
    auto remaining = static_cast<double>(std::max<int64_t>(0, *token.expires_at - now_epoch_seconds));
    auto fraction_elapsed = (lifetime - remaining) / lifetime;
    return fraction_elapsed >= threshold;
}

Token TokenRefresher::Coordinate(const std::string& key, const RefreshPredicate& needs_refresh) {
    std::shared_ptr<InFlightRefresh> flight;
    {
        std::unique_lock<std::mutex> lock(mutex);
        auto it = in_flight.find(key);
        if (it != in_flight.end()) {
            auto leader = it->second;
            TOKENWARD_TRACE_DEBUG("TOKEN_REFRESH", "Waiting for in-flight refresh: " + key);
            refresh_cv.wait(lock, [&leader] { return leader->done; });
            if (leader->error) {
                std::rethrow_exception(leader->error);
            }
            return *leader->token;
        }
        flight = std::make_shared<InFlightRefresh>();
        in_flight.emplace(key, flight);
    }

    std::optional<Token> token;
    std::exception_ptr error;
    try {
        token = RefreshAsLeader(key, needs_refresh);
    } catch (...) {
        // Captured for the waiters and rethrown below
        error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        flight->done = true;
        flight->token = token;
        flight->error = error;
        in_flight.erase(key);
    }
    refresh_cv.notify_all();

    if (error) {
        std::rethrow_exception(error);
    }
    return *token;
}

Token TokenRefresher::RefreshAsLeader(const std::string& key, const RefreshPredicate& needs_refresh) {
    if (!lock_manager.has_value()) {
        auto current = LoadToken(key);
        if (!needs_refresh(current)) {
            TOKENWARD_TRACE_DEBUG("TOKEN_REFRESH", "Token already refreshed: " + key);
            return current;
        }
        return DoRefresh(key, current);
    }

    auto lock = lock_manager->AcquireLock(key);

    // Another process may have refreshed while we waited for the lock
    auto current = LoadToken(key);
    if (!needs_refresh(current)) {
        TOKENWARD_TRACE_INFO("TOKEN_REFRESH", "Token refreshed by another process: " + key);
        return current;
    }
    return DoRefresh(key, current);
}

Token TokenRefresher::LoadToken(const std::string& key) {
    auto token = client->GetToken(key);
    if (!token.has_value()) {
        ErrorContext ctx;
        ctx.Set("key", key);
        throw ctx.Error(OAuthErrorKind::TOKEN_NOT_FOUND, "Token not found");
    }
    return *token;
}

Token TokenRefresher::DoRefresh(const std::string& key, const Token& current) {
    if (!current.refresh_token.has_value() || current.refresh_token->empty()) {
        ErrorContext ctx;
        ctx.Set("key", key);
        throw ctx.Error(OAuthErrorKind::NO_REFRESH_TOKEN, "No refresh token available");
    }

    auto refreshed = client->RefreshToken(*current.refresh_token);
    // Servers may omit the refresh token when it is not rotated
    if (!refreshed.refresh_token.has_value()) {
        refreshed.refresh_token = current.refresh_token;
    }
    client->SaveToken(key, refreshed);

    TOKENWARD_TRACE_INFO("TOKEN_REFRESH", "Refreshed token for key: " + key);
    return refreshed;
}

} // namespace tokenward
