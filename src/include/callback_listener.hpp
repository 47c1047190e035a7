#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "oauth2_types.hpp"
#include "url_codec.hpp"

namespace httplib {
class Server;
}

namespace tokenward {

// Single-use loopback endpoint receiving the authorization redirect.
// Construct one per authorization attempt; it stops serving once a callback is
// accepted or the wait times out.
class CallbackListener {
public:
    static constexpr const char* CALLBACK_PATH = "/callback";
    static constexpr const char* LOOPBACK_HOST = "127.0.0.1";

    // port 0 picks an ephemeral port
    explicit CallbackListener(int port = 0);
    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;
    CallbackListener(CallbackListener&&) = delete;
    CallbackListener& operator=(CallbackListener&&) = delete;

    int Port() const { return port_; }
    std::string RedirectUri() const;

    // Blocks until a callback is accepted or timeout elapses.
    // Throws OAuthError: TIMEOUT, MISSING_FIELD, or the server-reported error.
    CallbackResult WaitForCallback(std::chrono::milliseconds timeout);

    void Stop();

    // Decodes "code=...&state=..." and applies the callback rules
    static CallbackResult ParseCallbackQuery(const std::string& query);
    static CallbackResult CallbackFromParams(const QueryParams& params);

private:
    void Complete(std::optional<CallbackResult> result, std::exception_ptr error);

    int port_ = 0;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> listen_returned_{false};

    std::mutex mutex_;
    std::condition_variable callback_cv_;
    bool completed_ = false;
    bool consumed_ = false;
    std::optional<CallbackResult> result_;
    std::exception_ptr error_;
};

} // namespace tokenward
