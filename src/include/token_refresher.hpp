#pragma once

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "oauth2_client.hpp"
#include "oauth2_types.hpp"
#include "refresh_lock.hpp"

namespace tokenward {

/**
 * Keeps stored tokens fresh with at most one network refresh per key.
 *
 * In-process: the first caller for a key becomes the leader and performs the
 * refresh; concurrent callers for the same key block on a condition variable
 * and receive the leader's outcome, the same token or the same exception.
 *
 * Cross-process (file locking enabled): the leader takes the key's
 * RefreshLock before reading the store, re-reads the token and returns it
 * without a network call when the condition that triggered the refresh no
 * longer holds, which is the case when another process refreshed meanwhile.
 */
class TokenRefresher {
public:
    explicit TokenRefresher(std::shared_ptr<OAuthClient> client);
    TokenRefresher(std::shared_ptr<OAuthClient> client, RefreshLockManager lock_manager);

    // File locking in the per-application default lock directory
    static std::unique_ptr<TokenRefresher> WithFileLocking(std::shared_ptr<OAuthClient> client,
                                                           const std::string& app_name);

    TokenRefresher(const TokenRefresher&) = delete;
    TokenRefresher& operator=(const TokenRefresher&) = delete;

    // Returns the stored token, refreshing it first when it is expired
    Token GetValidToken(const std::string& key);

    // Refreshes once threshold (clamped to [0, 1]) of the lifetime has elapsed
    Token GetValidTokenWithThreshold(const std::string& key, double threshold);

    // With file locking: refresh unless the re-read token is still valid.
    // Without: always refresh, single-flight per key.
    Token RefreshTokenForKey(const std::string& key);

    // Refreshes even when the stored token is still valid
    Token ForceRefresh(const std::string& key);

    // Blocks until no in-process refresh for key is running
    void WaitForRefresh(const std::string& key);

    bool IsRefreshInProgress(const std::string& key);
    bool UsesFileLocking() const { return lock_manager.has_value(); }

    static bool ShouldRefresh(const Token& token, double threshold);
    static bool ShouldRefresh(const Token& token, double threshold, int64_t now_epoch_seconds);

private:
    using RefreshPredicate = std::function<bool(const Token&)>;

    struct InFlightRefresh {
        bool done = false;
        std::optional<Token> token;
        std::exception_ptr error;
    };

    Token Coordinate(const std::string& key, const RefreshPredicate& needs_refresh);
    Token RefreshAsLeader(const std::string& key, const RefreshPredicate& needs_refresh);
    Token LoadToken(const std::string& key);
    Token DoRefresh(const std::string& key, const Token& current);

    std::shared_ptr<OAuthClient> client;
    std::optional<RefreshLockManager> lock_manager;

    std::mutex mutex;
    std::condition_variable refresh_cv;
    std::map<std::string, std::shared_ptr<InFlightRefresh>> in_flight;
};

} // namespace tokenward
