#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "credential.hpp"
#include "oauth_client.hpp"

namespace cen {

enum class AuthMode { kLocalServer, kConsole };

// Kept clear of common dev-server ports (3000, 5432, 6379, 8000).
inline const std::vector<int> kDefaultCallbackPorts = {8080, 8081, 8082, 8090, 9000, 9001, 9090, 9091};

struct AuthOptions {
    AuthMode mode{AuthMode::kLocalServer};
    bool open_browser{true};
    std::optional<std::string> login_hint;
    std::vector<int> candidate_ports{kDefaultCallbackPorts};
    std::chrono::seconds timeout{std::chrono::minutes(5)};
    std::string bind_host{"127.0.0.1"};
};

// Short-lived HTTP listener catching the OAuth redirect. Accepts exactly one
// authorization code whose state matches; the destructor stops the server.
class CallbackListener {
public:
    enum class WaitResult { kCode, kDenied, kTimeout, kCancelled };

    explicit CallbackListener(std::string expected_state);
    ~CallbackListener();

    CallbackListener(const CallbackListener&) = delete;
    CallbackListener& operator=(const CallbackListener&) = delete;

    bool bind(const std::string& host, int port);
    // Returns the OS-assigned port, or -1.
    int bind_any(const std::string& host);
    void start();
    void shutdown();

    int port() const { return port_; }

    // On kCode `out` holds the code, on kDenied the provider's error string.
    WaitResult wait(std::chrono::milliseconds timeout, const std::function<bool()>& cancelled, std::string& out);

private:
    void handle(const httplib::Request& req, httplib::Response& res);

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::string expected_state_;
    int port_{-1};

    std::mutex mu_;
    std::condition_variable cv_;
    std::optional<std::string> code_;
    std::optional<std::string> denied_;
};

// Tries `ports` in order and returns a listener bound to the first free one.
// Throws NoPortAvailableError when every port is taken.
std::unique_ptr<CallbackListener> bind_first_available(const std::vector<int>& ports,
                                                       const std::string& host,
                                                       const std::string& state);

// Drives the consent flow. Never persists the result.
class Authorizer {
public:
    explicit Authorizer(OAuthProvider& oauth, std::function<bool()> cancelled = {});

    Credential authorize(const AuthOptions& opts);

private:
    static void open_in_browser(const std::string& url);

    OAuthProvider& oauth_;
    std::function<bool()> cancelled_;
};

}  // namespace cen
