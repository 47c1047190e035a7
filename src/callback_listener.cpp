#include "callback_listener.hpp"
#include "oauth2_error.hpp"
#include "tokenward_tracing.hpp"

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

namespace tokenward {

namespace {

std::string HtmlEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped.push_back(c);
        }
    }
    return escaped;
}

std::string RenderPage(const std::string& title, const std::string& message, bool success) {
    return
        "<!DOCTYPE html>"
        "<html>"
        "<head>"
        "<meta charset='utf-8'>"
        "<title>" + HtmlEscape(title) + "</title>"
        "<style>"
        "body { font-family: -apple-system, BlinkMacSystemFont, 'Segoe UI', Roboto, sans-serif; display: flex; "
        "justify-content: center; align-items: center; height: 100vh; margin: 0; background: " +
        std::string(success ? "#667eea" : "#f5576c") + "; }"
        ".container { background: white; padding: 3rem; border-radius: 1rem; text-align: center; max-width: 400px; }"
        "h1 { color: #2d3748; }"
        "p { color: #4a5568; line-height: 1.6; }"
        "</style>"
        "</head>"
        "<body>"
        "<div class='container'>"
        "<h1>" + HtmlEscape(title) + "</h1>"
        "<p>" + HtmlEscape(message) + "</p>"
        "</div>"
        "</body>"
        "</html>";
}

void SetErrorPage(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(RenderPage("Authorization Failed", message, false), "text/html; charset=utf-8");
}

std::optional<std::string> Lookup(const QueryParams& params, const char* name) {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

CallbackListener::CallbackListener(int port) {
    server_ = std::make_unique<httplib::Server>();
    server_->set_keep_alive_max_count(1);

    server_->Get(CALLBACK_PATH, [this](const httplib::Request& req, httplib::Response& res) {
        TOKENWARD_TRACE_DEBUG("CALLBACK_LISTENER", "Received request: " + req.path);

        if (req.params.empty()) {
            SetErrorPage(res, 400, "Missing query parameters");
            return;
        }

        // httplib already percent-decoded the query; the first value of a repeated key wins
        QueryParams params;
        for (const auto& param : req.params) {
            params.emplace(param.first, param.second);
        }

        try {
            auto result = CallbackFromParams(params);
            res.status = 200;
            res.set_content(RenderPage("Authorization Successful",
                                       "You can close this window and return to your terminal.", true),
                            "text/html; charset=utf-8");
            Complete(result, nullptr);
        } catch (const OAuthError& e) {
            SetErrorPage(res, 400, e.what());
            Complete(std::nullopt, std::current_exception());
        }
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content(RenderPage("Not Found", "Unknown path", false), "text/html; charset=utf-8");
        }
    });

    if (port == 0) {
        port_ = server_->bind_to_any_port(LOOPBACK_HOST);
        if (port_ < 0) {
            throw OAuthError(OAuthErrorKind::TRANSPORT, "Failed to bind callback listener on loopback interface");
        }
    } else {
        if (!server_->bind_to_port(LOOPBACK_HOST, port)) {
            throw OAuthError(OAuthErrorKind::TRANSPORT,
                             "Failed to bind callback listener on port " + std::to_string(port));
        }
        port_ = port;
    }

    // The socket is already listening, connections queue until the accept loop runs
    server_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            TOKENWARD_TRACE_DEBUG("CALLBACK_LISTENER", "Listener loop ended with error");
        }
        listen_returned_.store(true);
    });

    TOKENWARD_TRACE_INFO("CALLBACK_LISTENER", "Listening on " + RedirectUri());
}

CallbackListener::~CallbackListener() {
    Stop();
}

std::string CallbackListener::RedirectUri() const {
    return std::string("http://") + LOOPBACK_HOST + ":" + std::to_string(port_) + CALLBACK_PATH;
}

void CallbackListener::Stop() {
    if (!server_) {
        return;
    }
    // stop() is a no-op until the accept loop is running
    while (!listen_returned_.load() && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    server_.reset();
    TOKENWARD_TRACE_DEBUG("CALLBACK_LISTENER", "Listener stopped");
}

void CallbackListener::Complete(std::optional<CallbackResult> result, std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) {
            return;
        }
        completed_ = true;
        result_ = std::move(result);
        error_ = error;
    }
    callback_cv_.notify_all();
}

CallbackResult CallbackListener::WaitForCallback(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (consumed_) {
            throw OAuthError(OAuthErrorKind::CONFIGURATION, "Callback listener has already been used");
        }
        consumed_ = true;

        auto deadline = std::chrono::steady_clock::now() + timeout;
        if (!callback_cv_.wait_until(lock, deadline, [this] { return completed_; })) {
            // Late callbacks are ignored from here on
            completed_ = true;
        }
    }

    // Joining the server thread lets the final page reach the browser first
    Stop();

    std::lock_guard<std::mutex> lock(mutex_);
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (!result_.has_value()) {
        TOKENWARD_TRACE_WARN("CALLBACK_LISTENER", "Timeout waiting for callback");
        throw OAuthError(OAuthErrorKind::TIMEOUT, "Timeout waiting for callback");
    }
    TOKENWARD_TRACE_INFO("CALLBACK_LISTENER", "Callback received with state: " + result_->state);
    return *result_;
}

CallbackResult CallbackListener::ParseCallbackQuery(const std::string& query) {
    return CallbackFromParams(UrlCodec::ParseQueryString(query));
}

CallbackResult CallbackListener::CallbackFromParams(const QueryParams& params) {
    auto error = Lookup(params, "error");
    if (error.has_value()) {
        throw OAuthError::FromServerError(*error, Lookup(params, "error_description"));
    }

    auto code = Lookup(params, "code");
    if (!code.has_value()) {
        throw OAuthError(OAuthErrorKind::MISSING_FIELD, "Missing field: code");
    }
    auto state = Lookup(params, "state");
    if (!state.has_value()) {
        throw OAuthError(OAuthErrorKind::MISSING_FIELD, "Missing field: state");
    }

    CallbackResult result;
    result.code = *code;
    result.state = *state;
    return result;
}

} // namespace tokenward
