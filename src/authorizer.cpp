#include "authorizer.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sys/socket.h>

#include "errors.hpp"
#include "signals.hpp"
#include "utils.hpp"

namespace cen {

namespace {

const char kSuccessPage[] =
    "<html><body><h1>Authorization successful!</h1>"
    "<p>You can close this window and return to the terminal.</p></body></html>";

std::string failure_page(const std::string& reason) {
    return "<html><body><h1>Authorization failed!</h1><p>" + reason + "</p></body></html>";
}

}  // namespace

CallbackListener::CallbackListener(std::string expected_state)
    : server_(std::make_unique<httplib::Server>()), expected_state_(std::move(expected_state)) {
    // SO_REUSEADDR only: a port held by another listener must fail to bind.
    server_->set_socket_options([](int sock) {
        int yes = 1;
        ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const void*>(&yes), sizeof(yes));
    });
    server_->Get(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); });
}

CallbackListener::~CallbackListener() {
    shutdown();
}

bool CallbackListener::bind(const std::string& host, int port) {
    if (!server_->bind_to_port(host, port)) return false;
    port_ = port;
    return true;
}

int CallbackListener::bind_any(const std::string& host) {
    int port = server_->bind_to_any_port(host);
    if (port <= 0) return -1;
    port_ = port;
    return port_;
}

void CallbackListener::start() {
    if (thread_.joinable() || port_ < 0) return;
    thread_ = std::thread([this] { server_->listen_after_bind(); });
    server_->wait_until_ready();
}

void CallbackListener::shutdown() {
    if (!thread_.joinable()) return;
    server_->stop();
    thread_.join();
}

void CallbackListener::handle(const httplib::Request& req, httplib::Response& res) {
    if (req.has_param("error")) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!code_ && !denied_) denied_ = req.get_param_value("error");
        }
        cv_.notify_all();
        res.status = 400;
        res.set_content(failure_page("The request was denied."), "text/html");
        return;
    }
    if (!req.has_param("code")) {
        res.status = 400;
        res.set_content(failure_page("No code received."), "text/html");
        return;
    }
    if (!expected_state_.empty() && req.get_param_value("state") != expected_state_) {
        res.status = 400;
        res.set_content(failure_page("State mismatch."), "text/html");
        return;
    }

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!code_ && !denied_) {
            code_ = req.get_param_value("code");
            accepted = true;
        }
    }
    if (!accepted) {
        res.status = 400;
        res.set_content(failure_page("An authorization code was already received."), "text/html");
        return;
    }
    cv_.notify_all();
    res.set_content(kSuccessPage, "text/html");
}

CallbackListener::WaitResult CallbackListener::wait(std::chrono::milliseconds timeout,
                                                    const std::function<bool()>& cancelled,
                                                    std::string& out) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto slice = std::chrono::milliseconds(200);

    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        if (code_) {
            out = *code_;
            return WaitResult::kCode;
        }
        if (denied_) {
            out = *denied_;
            return WaitResult::kDenied;
        }
        if (cancelled && cancelled()) return WaitResult::kCancelled;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return WaitResult::kTimeout;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        cv_.wait_for(lock, std::min(slice, remaining), [this] { return code_ || denied_; });
    }
}

std::unique_ptr<CallbackListener> bind_first_available(const std::vector<int>& ports,
                                                       const std::string& host,
                                                       const std::string& state) {
    for (int port : ports) {
        auto listener = std::make_unique<CallbackListener>(state);
        if (listener->bind(host, port)) return listener;
    }
    throw NoPortAvailableError(
        "Could not start OAuth callback server on any candidate port. Use --console flag instead.");
}

Authorizer::Authorizer(OAuthProvider& oauth, std::function<bool()> cancelled)
    : oauth_(oauth), cancelled_(cancelled ? std::move(cancelled) : std::function<bool()>(shutdown_requested)) {}

void Authorizer::open_in_browser(const std::string& url) {
    std::string cmd = "xdg-open '" + url + "' >/dev/null 2>&1 &";
    if (std::system(cmd.c_str()) != 0) {
        std::cerr << "[WARN] Could not launch a browser, open the URL manually" << std::endl;
    }
}

Credential Authorizer::authorize(const AuthOptions& opts) {
    const std::string state = random_hex(16);

    std::unique_ptr<CallbackListener> listener;
    if (opts.mode == AuthMode::kLocalServer) {
        listener = bind_first_available(opts.candidate_ports, opts.bind_host, state);
    } else {
        listener = std::make_unique<CallbackListener>(state);
        if (listener->bind_any(opts.bind_host) < 0) {
            throw ConfigError("Could not bind a local port for the OAuth callback");
        }
    }
    listener->start();

    const std::string redirect_uri = "http://localhost:" + std::to_string(listener->port()) + "/";
    const std::string url = oauth_.authorization_url(redirect_uri, state, opts.login_hint);

    if (opts.mode == AuthMode::kLocalServer && opts.open_browser) {
        open_in_browser(url);
    }
    std::cout << "\nPlease visit this URL to authorize the application:\n" << url << "\n";
    std::cout << "\nWaiting for authorization... (Press Ctrl+C to cancel)" << std::endl;

    std::string value;
    switch (listener->wait(opts.timeout, cancelled_, value)) {
        case CallbackListener::WaitResult::kCode:
            break;
        case CallbackListener::WaitResult::kDenied:
            throw AuthError("authorization denied: " + value);
        case CallbackListener::WaitResult::kTimeout:
            throw AuthTimeoutError("timed out waiting for the OAuth callback after " +
                                   std::to_string(opts.timeout.count()) + "s");
        case CallbackListener::WaitResult::kCancelled:
            throw AuthError("authorization cancelled");
    }

    Credential cred = oauth_.exchange_code(value, redirect_uri);
    std::cout << "[INFO] Authorization successful" << std::endl;
    return cred;
}

}  // namespace cen
